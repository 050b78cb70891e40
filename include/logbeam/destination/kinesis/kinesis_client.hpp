#ifndef LOGBEAM_KINESIS_CLIENT_HPP
#define LOGBEAM_KINESIS_CLIENT_HPP

#include "../../core/log_message.hpp"
#include <string>
#include <vector>
#include <cstddef>

namespace logbeam {

    enum class KinesisStreamStatus {
        Missing,
        Creating,
        Updating,
        Active,
        Deleting
    };

    inline const char* getKinesisStreamStatusString(KinesisStreamStatus status) {
        switch (status) {
            case KinesisStreamStatus::Missing: return "MISSING";
            case KinesisStreamStatus::Creating: return "CREATING";
            case KinesisStreamStatus::Updating: return "UPDATING";
            case KinesisStreamStatus::Active: return "ACTIVE";
            case KinesisStreamStatus::Deleting: return "DELETING";
            default: return "UNKNOWN";
        }
    }

    /// One entry of a PutRecords request.
    struct KinesisRecord {
        std::string partitionKey;
        const LogMessage* message;

        KinesisRecord(std::string key, const LogMessage* msg)
            : partitionKey(std::move(key))
            , message(msg) {}
    };

    /// Calls a Kinesis adapter must provide. Errors are reported as for
    /// CloudWatchClient; a missing stream is MISSING_DESTINATION.
    class KinesisClient {
    public:
        virtual ~KinesisClient() = default;

        virtual KinesisStreamStatus describeStreamStatus(const std::string& streamName) = 0;

        /// Returns false if the stream already existed.
        virtual bool createStream(const std::string& streamName, int shardCount) = 0;

        virtual void setRetentionPeriod(const std::string& streamName, int hours) = 0;

        /// Writes the records. Returns the indexes of the records the service
        /// rejected, in ascending order; empty if all were accepted.
        virtual std::vector<size_t> putRecords(const std::string& streamName,
                                               const std::vector<KinesisRecord>& records) = 0;

        virtual void shutdown() = 0;
    };

} // namespace logbeam

#endif // LOGBEAM_KINESIS_CLIENT_HPP
