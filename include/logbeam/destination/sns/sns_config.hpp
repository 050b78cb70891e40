#ifndef LOGBEAM_SNS_CONFIG_HPP
#define LOGBEAM_SNS_CONFIG_HPP

#include "../../writer/writer_config.hpp"
#include <string>
#include <cstddef>

namespace logbeam {

    /// Configuration for a writer that publishes to an SNS topic. Exactly
    /// one of topicName_ and topicArn_ should be set; the ARN wins if both
    /// are.
    struct SnsWriterConfig : WriterConfigBuilder<SnsWriterConfig> {
        std::string topicName_;
        std::string topicArn_;
        std::string subject_;   ///< Optional, sent with every message
        bool autoCreate_;       ///< Create the topic if it is missing (name only)

        SnsWriterConfig()
            : autoCreate_(false) {}

        SnsWriterConfig& setTopicName(std::string v) { topicName_ = std::move(v); return *this; }
        SnsWriterConfig& setTopicArn(std::string v) { topicArn_ = std::move(v); return *this; }
        SnsWriterConfig& setSubject(std::string v) { subject_ = std::move(v); return *this; }
        SnsWriterConfig& setAutoCreate(bool v) { autoCreate_ = v; return *this; }
    };

    constexpr size_t kSnsMaxMessageBytes = 262144;
    constexpr size_t kSnsMaxSubjectLength = 100;

} // namespace logbeam

#endif // LOGBEAM_SNS_CONFIG_HPP
