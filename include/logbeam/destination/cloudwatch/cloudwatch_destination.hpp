#ifndef LOGBEAM_CLOUDWATCH_DESTINATION_HPP
#define LOGBEAM_CLOUDWATCH_DESTINATION_HPP

#include "cloudwatch_config.hpp"
#include "cloudwatch_client.hpp"
#include "../destination_facade.hpp"
#include "../name_validation.hpp"
#include <memory>
#include <string>
#include <vector>
#include <stdexcept>

namespace logbeam {

    /// Sends batches to one CloudWatch Logs stream.
    ///
    /// On initialization it creates the log group (and sets its retention)
    /// and the log stream if they are missing. Each PutLogEvents call needs
    /// the stream's current sequence token. A dedicated writer keeps the
    /// token returned by the previous call; a shared stream fetches it before
    /// every send, since other writers move it forward.
    class CloudWatchDestination : public DestinationFacade {
    public:
        CloudWatchDestination(const CloudWatchWriterConfig& config,
                              std::unique_ptr<CloudWatchClient> client)
            : m_config(config)
            , m_client(std::move(client))
            , m_retry(config.makeRetryManager(true))
            , m_tokenValid(false)
            , m_shutdown(false) {
            if (!m_client) {
                throw std::invalid_argument("CloudWatchDestination requires a client");
            }
        }

        DestinationKind kind() const override { return DestinationKind::SequencedStream; }

        const CloudWatchWriterConfig& config() const { return m_config; }

        bool ensureDestinationAvailable() override {
            if (!validateConfig()) return false;

            stats().setDestinationName("logGroupName", m_config.logGroupName_);
            stats().setDestinationName("logStreamName", m_config.logStreamName_);

            try {
                ensureLogGroup();
                ensureLogStream();
                return true;
            } catch (const std::exception& ex) {
                reportError(std::string("unable to configure log group/stream: ") + detail::safeWhat(ex),
                            std::current_exception());
                return false;
            }
        }

        size_t effectiveSize(const LogMessage& message) const override {
            return message.size() + kCloudWatchEventOverhead;
        }

        size_t maxMessageSize() const override { return kCloudWatchMaxEventBytes; }

        bool withinServiceLimits(size_t batchBytes, size_t messageCount) const override {
            return batchBytes <= kCloudWatchMaxBatchBytes && messageCount <= kCloudWatchMaxEventsPerBatch;
        }

        std::vector<LogMessage> send(const std::vector<LogMessage>& batch) override {
            if (batch.empty()) return std::vector<LogMessage>();

            if (!m_config.dedicatedWriter_ || !m_tokenValid) {
                fetchSequenceToken();
            }

            std::string nextToken;
            try {
                nextToken = m_client->putLogEvents(m_config.logGroupName_, m_config.logStreamName_,
                                                   m_sequenceToken, batch);
            } catch (...) {
                m_tokenValid = false;
                detail::translateCurrentException("putLogEvents");
            }

            m_sequenceToken = nextToken;
            m_tokenValid = true;
            return std::vector<LogMessage>();
        }

        void refreshOrderingToken() override {
            m_tokenValid = false;
            fetchSequenceToken();
        }

        void shutdown() override {
            if (m_shutdown) return;
            m_shutdown = true;
            callClient("shutdown", [this] { m_client->shutdown(); });
        }

        /// Token that will accompany the next send from a dedicated writer.
        const std::string& sequenceToken() const { return m_sequenceToken; }

    private:
        bool validateConfig() {
            bool ok = true;

            if (!detail::isValidResourceName(m_config.logGroupName_, "._/#-", 1, 512)) {
                reportError("invalid log group name: " + m_config.logGroupName_, nullptr);
                ok = false;
            }

            const std::string& stream = m_config.logStreamName_;
            if (detail::isBlank(stream)) {
                reportError("blank log stream name", nullptr);
                ok = false;
            } else if (stream.size() > 512 || stream.find_first_of(":*") != std::string::npos) {
                reportError("invalid log stream name: " + stream, nullptr);
                ok = false;
            }

            if (m_config.retentionPeriodDays_ != 0 && !isValidRetentionPeriod(m_config.retentionPeriodDays_)) {
                reportError("invalid retention period: " + std::to_string(m_config.retentionPeriodDays_), nullptr);
                ok = false;
            }

            return ok;
        }

        void ensureLogGroup() {
            const std::string& group = m_config.logGroupName_;
            const std::int64_t timeout = m_config.initializationTimeoutMs_;

            std::string arn;
            retryClientCall(m_retry, timeout, "findLogGroup", [&] {
                arn = m_client->findLogGroup(group);
            });
            if (!arn.empty()) {
                logger().debug("using existing CloudWatch log group: " + group);
                return;
            }

            logger().debug("creating CloudWatch log group: " + group);
            retryClientCall(m_retry, timeout, "createLogGroup", [&] {
                m_client->createLogGroup(group);
            });
            waitFor(m_retry, timeout, "findLogGroup", "log group creation", [&] {
                return !m_client->findLogGroup(group).empty();
            });

            if (m_config.retentionPeriodDays_ != 0) {
                try {
                    callClient("setLogGroupRetention", [&] {
                        m_client->setLogGroupRetention(group, m_config.retentionPeriodDays_);
                    });
                } catch (const std::exception&) {
                    reportError("exception setting retention policy", std::current_exception());
                }
            }
        }

        void ensureLogStream() {
            const std::string& group = m_config.logGroupName_;
            const std::string& stream = m_config.logStreamName_;
            const std::int64_t timeout = m_config.initializationTimeoutMs_;

            bool exists = false;
            std::string token;
            retryClientCall(m_retry, timeout, "retrieveSequenceToken", [&] {
                exists = m_client->retrieveSequenceToken(group, stream, token);
            });

            if (exists) {
                logger().debug("using existing CloudWatch log stream: " + stream);
            } else {
                logger().debug("creating CloudWatch log stream: " + stream);
                retryClientCall(m_retry, timeout, "createLogStream", [&] {
                    m_client->createLogStream(group, stream);
                });
                waitFor(m_retry, timeout, "retrieveSequenceToken", "log stream creation", [&] {
                    return m_client->retrieveSequenceToken(group, stream, token);
                });
            }

            m_sequenceToken = token;
            m_tokenValid = true;
        }

        void fetchSequenceToken() {
            bool exists = false;
            std::string token;
            callClient("retrieveSequenceToken", [&] {
                exists = m_client->retrieveSequenceToken(m_config.logGroupName_, m_config.logStreamName_, token);
            });
            if (!exists) {
                m_tokenValid = false;
                throw FacadeException(ReasonCode::MISSING_DESTINATION, "retrieveSequenceToken",
                                      "log stream does not exist: " + m_config.logStreamName_);
            }
            m_sequenceToken = token;
            m_tokenValid = true;
        }

        CloudWatchWriterConfig m_config;
        std::unique_ptr<CloudWatchClient> m_client;
        RetryManager m_retry;
        std::string m_sequenceToken;
        bool m_tokenValid;
        bool m_shutdown;
    };

} // namespace logbeam

#endif // LOGBEAM_CLOUDWATCH_DESTINATION_HPP
