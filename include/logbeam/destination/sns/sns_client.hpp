#ifndef LOGBEAM_SNS_CLIENT_HPP
#define LOGBEAM_SNS_CLIENT_HPP

#include <string>

namespace logbeam {

    /// Calls an SNS adapter must provide. Errors are reported as for
    /// CloudWatchClient; a missing topic is MISSING_DESTINATION.
    class SnsClient {
    public:
        virtual ~SnsClient() = default;

        /// Returns the ARN of the topic with this name, or an empty string.
        virtual std::string findTopicByName(const std::string& topicName) = 0;

        virtual bool topicExists(const std::string& topicArn) = 0;

        /// Creates the topic (a no-op if it exists) and returns its ARN.
        virtual std::string createTopic(const std::string& topicName) = 0;

        /// @param subject may be empty
        virtual void publish(const std::string& topicArn, const std::string& subject,
                             const std::string& message) = 0;

        virtual void shutdown() = 0;
    };

} // namespace logbeam

#endif // LOGBEAM_SNS_CLIENT_HPP
