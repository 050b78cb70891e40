#ifndef LOGBEAM_CLOUDWATCH_CONFIG_HPP
#define LOGBEAM_CLOUDWATCH_CONFIG_HPP

#include "../../writer/writer_config.hpp"
#include <string>
#include <cstddef>

namespace logbeam {

    /// Configuration for a writer that sends to a CloudWatch Logs log stream.
    ///
    /// Names are validated when the writer initializes, not here, so an
    /// invalid configuration is reported through the writer's logger and
    /// leaves the writer FAILED.
    struct CloudWatchWriterConfig : WriterConfigBuilder<CloudWatchWriterConfig> {
        std::string logGroupName_;
        std::string logStreamName_;
        int retentionPeriodDays_;   ///< 0 leaves the group's retention unchanged
        bool dedicatedWriter_;      ///< Only this writer appends to the stream

        CloudWatchWriterConfig()
            : retentionPeriodDays_(0)
            , dedicatedWriter_(false) {}

        CloudWatchWriterConfig& setLogGroupName(std::string v) { logGroupName_ = std::move(v); return *this; }
        CloudWatchWriterConfig& setLogStreamName(std::string v) { logStreamName_ = std::move(v); return *this; }
        CloudWatchWriterConfig& setRetentionPeriod(int days) { retentionPeriodDays_ = days; return *this; }
        CloudWatchWriterConfig& setDedicatedWriter(bool v) { dedicatedWriter_ = v; return *this; }
    };

    // PutLogEvents limits
    constexpr size_t kCloudWatchMaxEventsPerBatch = 10000;
    constexpr size_t kCloudWatchMaxBatchBytes = 1048576;
    constexpr size_t kCloudWatchEventOverhead = 26;
    constexpr size_t kCloudWatchMaxEventBytes = 262144 - kCloudWatchEventOverhead;

    /// Retention values CloudWatch accepts, in days.
    inline bool isValidRetentionPeriod(int days) {
        static const int kAllowed[] = {
            1, 3, 5, 7, 14, 30, 60, 90, 120, 150, 180, 365, 400, 545,
            731, 1096, 1827, 2192, 2557, 2922, 3288, 3653
        };
        for (size_t i = 0; i < sizeof(kAllowed) / sizeof(kAllowed[0]); ++i) {
            if (kAllowed[i] == days) return true;
        }
        return false;
    }

} // namespace logbeam

#endif // LOGBEAM_CLOUDWATCH_CONFIG_HPP
