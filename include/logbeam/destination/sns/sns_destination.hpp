#ifndef LOGBEAM_SNS_DESTINATION_HPP
#define LOGBEAM_SNS_DESTINATION_HPP

#include "sns_config.hpp"
#include "sns_client.hpp"
#include "../destination_facade.hpp"
#include "../name_validation.hpp"
#include <memory>
#include <string>
#include <vector>
#include <stdexcept>
#include <cstddef>

namespace logbeam {

    /// Publishes each message to an SNS topic. The service takes one message
    /// per call, so every batch holds exactly one message.
    class SnsDestination : public DestinationFacade {
    public:
        SnsDestination(const SnsWriterConfig& config, std::unique_ptr<SnsClient> client)
            : m_config(config)
            , m_client(std::move(client))
            , m_retry(config.makeRetryManager(true))
            , m_shutdown(false) {
            if (!m_client) {
                throw std::invalid_argument("SnsDestination requires a client");
            }
        }

        DestinationKind kind() const override { return DestinationKind::Topic; }

        const SnsWriterConfig& config() const { return m_config; }

        /// ARN resolved during initialization.
        const std::string& topicArn() const { return m_topicArn; }

        bool ensureDestinationAvailable() override {
            if (!validateConfig()) return false;

            try {
                return m_config.topicArn_.empty() ? ensureTopicByName() : ensureTopicByArn();
            } catch (const std::exception& ex) {
                reportError(std::string("unable to configure topic: ") + detail::safeWhat(ex),
                            std::current_exception());
                return false;
            }
        }

        size_t effectiveSize(const LogMessage& message) const override { return message.size(); }

        size_t maxMessageSize() const override { return kSnsMaxMessageBytes; }

        bool withinServiceLimits(size_t batchBytes, size_t messageCount) const override {
            return batchBytes <= kSnsMaxMessageBytes && messageCount <= 1;
        }

        std::vector<LogMessage> send(const std::vector<LogMessage>& batch) override {
            std::vector<LogMessage> failed;
            for (size_t i = 0; i < batch.size(); ++i) {
                // a batch should hold one message; keep going if it doesn't
                try {
                    callClient("publish", [&] {
                        m_client->publish(m_topicArn, m_config.subject_, batch[i].body());
                    });
                } catch (const FacadeException&) {
                    if (i == 0) throw;
                    failed.insert(failed.end(), batch.begin() + static_cast<std::ptrdiff_t>(i), batch.end());
                    break;
                }
            }
            return failed;
        }

        void shutdown() override {
            if (m_shutdown) return;
            m_shutdown = true;
            callClient("shutdown", [this] { m_client->shutdown(); });
        }

    private:
        bool validateConfig() {
            bool ok = true;

            if (m_config.topicArn_.empty()) {
                if (!detail::isValidResourceName(m_config.topicName_, "_-", 1, 256)) {
                    reportError("invalid topic name: " + m_config.topicName_, nullptr);
                    ok = false;
                }
            } else if (m_config.topicArn_.compare(0, 4, "arn:") != 0) {
                reportError("invalid topic ARN: " + m_config.topicArn_, nullptr);
                ok = false;
            }

            if (m_config.subject_.size() > kSnsMaxSubjectLength) {
                reportError("invalid subject (longer than " + std::to_string(kSnsMaxSubjectLength)
                            + " characters)", nullptr);
                ok = false;
            }

            return ok;
        }

        bool ensureTopicByName() {
            const std::string& name = m_config.topicName_;
            const std::int64_t timeout = m_config.initializationTimeoutMs_;

            stats().setDestinationName("topicName", name);

            std::string arn;
            retryClientCall(m_retry, timeout, "findTopic", [&] {
                arn = m_client->findTopicByName(name);
            });

            if (arn.empty()) {
                if (!m_config.autoCreate_) {
                    reportError("topic \"" + name + "\" does not exist and auto-create is not enabled", nullptr);
                    return false;
                }
                logger().debug("creating SNS topic: " + name);
                retryClientCall(m_retry, timeout, "createTopic", [&] {
                    arn = m_client->createTopic(name);
                });
            } else {
                logger().debug("using existing SNS topic: " + name);
            }

            m_topicArn = arn;
            stats().setDestinationName("topicArn", arn);
            return true;
        }

        bool ensureTopicByArn() {
            const std::string& arn = m_config.topicArn_;

            stats().setDestinationName("topicArn", arn);

            bool exists = false;
            retryClientCall(m_retry, m_config.initializationTimeoutMs_, "findTopic", [&] {
                exists = m_client->topicExists(arn);
            });

            if (!exists) {
                reportError("topic does not exist: " + arn, nullptr);
                return false;
            }

            logger().debug("using existing SNS topic: " + arn);
            m_topicArn = arn;
            return true;
        }

        SnsWriterConfig m_config;
        std::unique_ptr<SnsClient> m_client;
        RetryManager m_retry;
        std::string m_topicArn;
        bool m_shutdown;
    };

} // namespace logbeam

#endif // LOGBEAM_SNS_DESTINATION_HPP
