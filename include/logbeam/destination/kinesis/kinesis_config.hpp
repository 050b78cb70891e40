#ifndef LOGBEAM_KINESIS_CONFIG_HPP
#define LOGBEAM_KINESIS_CONFIG_HPP

#include "../../writer/writer_config.hpp"
#include <string>
#include <cstddef>

namespace logbeam {

    /// Partition key value that gives every record its own random key.
    constexpr const char* kRandomPartitionKey = "{random}";

    /// Configuration for a writer that sends to a Kinesis data stream.
    struct KinesisWriterConfig : WriterConfigBuilder<KinesisWriterConfig> {
        std::string streamName_;
        std::string partitionKey_;   ///< Empty or "{random}" for random keys
        bool autoCreate_;            ///< Create the stream if it is missing
        int shardCount_;             ///< Shards for an auto-created stream
        int retentionPeriodHours_;   ///< 0 keeps the service default (24)

        KinesisWriterConfig()
            : autoCreate_(false)
            , shardCount_(1)
            , retentionPeriodHours_(0) {}

        KinesisWriterConfig& setStreamName(std::string v) { streamName_ = std::move(v); return *this; }
        KinesisWriterConfig& setPartitionKey(std::string v) { partitionKey_ = std::move(v); return *this; }
        KinesisWriterConfig& setAutoCreate(bool v) { autoCreate_ = v; return *this; }
        KinesisWriterConfig& setShardCount(int n) { shardCount_ = n; return *this; }
        KinesisWriterConfig& setRetentionPeriod(int hours) { retentionPeriodHours_ = hours; return *this; }

        bool usesRandomPartitionKey() const {
            return partitionKey_.empty() || partitionKey_ == kRandomPartitionKey;
        }
    };

    // PutRecords limits
    constexpr size_t kKinesisMaxRecordsPerBatch = 500;
    constexpr size_t kKinesisMaxBatchBytes = 5242880;
    constexpr size_t kKinesisMaxRecordBytes = 1048576;
    constexpr size_t kKinesisMaxPartitionKeyBytes = 256;
    constexpr size_t kKinesisRandomPartitionKeyBytes = 8;
    constexpr int kKinesisMinRetentionHours = 24;
    constexpr int kKinesisMaxRetentionHours = 8760;

} // namespace logbeam

#endif // LOGBEAM_KINESIS_CONFIG_HPP
