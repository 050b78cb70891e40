#ifndef LOGBEAM_CLOUDWATCH_CLIENT_HPP
#define LOGBEAM_CLOUDWATCH_CLIENT_HPP

#include "../../core/log_message.hpp"
#include <string>
#include <vector>

namespace logbeam {

    /// Calls a CloudWatch Logs adapter must provide.
    ///
    /// Adapters report service errors as FacadeException with the matching
    /// ReasonCode (THROTTLING, ABORTED, INVALID_SEQUENCE_TOKEN,
    /// ALREADY_PROCESSED, MISSING_LOG_GROUP, MISSING_DESTINATION). Anything
    /// else they throw is wrapped as UNEXPECTED_EXCEPTION by the destination.
    class CloudWatchClient {
    public:
        virtual ~CloudWatchClient() = default;

        /// Returns the group's ARN, or an empty string if it does not exist.
        virtual std::string findLogGroup(const std::string& logGroupName) = 0;

        /// Returns false if the group already existed.
        virtual bool createLogGroup(const std::string& logGroupName) = 0;

        virtual void setLogGroupRetention(const std::string& logGroupName, int days) = 0;

        /// Returns false if the stream already existed.
        virtual bool createLogStream(const std::string& logGroupName,
                                     const std::string& logStreamName) = 0;

        /// Looks up the stream's upload sequence token. Returns false if the
        /// stream does not exist. A new stream has an empty token.
        virtual bool retrieveSequenceToken(const std::string& logGroupName,
                                           const std::string& logStreamName,
                                           std::string& sequenceToken) = 0;

        /// Appends the events; returns the next sequence token.
        virtual std::string putLogEvents(const std::string& logGroupName,
                                         const std::string& logStreamName,
                                         const std::string& sequenceToken,
                                         const std::vector<LogMessage>& events) = 0;

        virtual void shutdown() = 0;
    };

} // namespace logbeam

#endif // LOGBEAM_CLOUDWATCH_CLIENT_HPP
