#ifndef LOGBEAM_WRITER_FACTORY_HPP
#define LOGBEAM_WRITER_FACTORY_HPP

#include "log_writer.hpp"
#include "../destination/cloudwatch/cloudwatch_destination.hpp"
#include "../destination/kinesis/kinesis_destination.hpp"
#include "../destination/sns/sns_destination.hpp"
#include <memory>

namespace logbeam {

    /// Builds a writer for a CloudWatch Logs stream. The writer is not
    /// started.
    inline std::unique_ptr<LogWriter> makeCloudWatchWriter(
            const CloudWatchWriterConfig& config,
            std::unique_ptr<CloudWatchClient> client,
            std::shared_ptr<InternalLogger> logger = std::shared_ptr<InternalLogger>()) {
        std::unique_ptr<DestinationFacade> destination(
            new CloudWatchDestination(config, std::move(client)));
        return detail::make_unique<LogWriter>(config, std::move(destination), std::move(logger));
    }

    inline std::unique_ptr<LogWriter> makeKinesisWriter(
            const KinesisWriterConfig& config,
            std::unique_ptr<KinesisClient> client,
            std::shared_ptr<InternalLogger> logger = std::shared_ptr<InternalLogger>()) {
        std::unique_ptr<DestinationFacade> destination(
            new KinesisDestination(config, std::move(client)));
        return detail::make_unique<LogWriter>(config, std::move(destination), std::move(logger));
    }

    inline std::unique_ptr<LogWriter> makeSnsWriter(
            const SnsWriterConfig& config,
            std::unique_ptr<SnsClient> client,
            std::shared_ptr<InternalLogger> logger = std::shared_ptr<InternalLogger>()) {
        std::unique_ptr<DestinationFacade> destination(
            new SnsDestination(config, std::move(client)));
        return detail::make_unique<LogWriter>(config, std::move(destination), std::move(logger));
    }

} // namespace logbeam

#endif // LOGBEAM_WRITER_FACTORY_HPP
