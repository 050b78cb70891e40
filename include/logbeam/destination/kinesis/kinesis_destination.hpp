#ifndef LOGBEAM_KINESIS_DESTINATION_HPP
#define LOGBEAM_KINESIS_DESTINATION_HPP

#include "kinesis_config.hpp"
#include "kinesis_client.hpp"
#include "../destination_facade.hpp"
#include "../name_validation.hpp"
#include <memory>
#include <string>
#include <vector>
#include <random>
#include <stdexcept>

namespace logbeam {

    /// Sends batches to a Kinesis data stream with PutRecords.
    ///
    /// Every record carries the configured partition key, or a random
    /// 8-digit key when none is configured. The key counts toward the
    /// record's size. Records the service rejects individually are handed
    /// back to the writer for requeue.
    class KinesisDestination : public DestinationFacade {
    public:
        KinesisDestination(const KinesisWriterConfig& config, std::unique_ptr<KinesisClient> client)
            : m_config(config)
            , m_client(std::move(client))
            , m_retry(config.makeRetryManager(true))
            , m_random(std::random_device()())
            , m_shutdown(false) {
            if (!m_client) {
                throw std::invalid_argument("KinesisDestination requires a client");
            }
        }

        DestinationKind kind() const override { return DestinationKind::PartitionedStream; }

        const KinesisWriterConfig& config() const { return m_config; }

        bool ensureDestinationAvailable() override {
            if (!validateConfig()) return false;

            stats().setDestinationName("streamName", m_config.streamName_);

            try {
                return ensureStream();
            } catch (const std::exception& ex) {
                reportError(std::string("unable to configure stream: ") + detail::safeWhat(ex),
                            std::current_exception());
                return false;
            }
        }

        size_t effectiveSize(const LogMessage& message) const override {
            return message.size() + partitionKeyLength();
        }

        size_t maxMessageSize() const override {
            return kKinesisMaxRecordBytes - partitionKeyLength();
        }

        bool withinServiceLimits(size_t batchBytes, size_t messageCount) const override {
            return batchBytes <= kKinesisMaxBatchBytes && messageCount <= kKinesisMaxRecordsPerBatch;
        }

        std::vector<LogMessage> send(const std::vector<LogMessage>& batch) override {
            std::vector<LogMessage> failed;
            if (batch.empty()) return failed;

            std::vector<KinesisRecord> records;
            records.reserve(batch.size());
            for (size_t i = 0; i < batch.size(); ++i) {
                records.push_back(KinesisRecord(nextPartitionKey(), &batch[i]));
            }

            std::vector<size_t> rejected;
            callClient("putRecords", [&] {
                rejected = m_client->putRecords(m_config.streamName_, records);
            });

            for (size_t i = 0; i < rejected.size(); ++i) {
                if (rejected[i] < batch.size()) {
                    failed.push_back(batch[rejected[i]]);
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
        size_t partitionKeyLength() const {
            return m_config.usesRandomPartitionKey()
                ? kKinesisRandomPartitionKeyBytes
                : m_config.partitionKey_.size();
        }

        std::string nextPartitionKey() {
            if (!m_config.usesRandomPartitionKey()) return m_config.partitionKey_;

            std::uniform_int_distribution<int> digit(0, 9);
            std::string key(kKinesisRandomPartitionKeyBytes, '0');
            for (size_t i = 0; i < key.size(); ++i) {
                key[i] = static_cast<char>('0' + digit(m_random));
            }
            return key;
        }

        bool validateConfig() {
            bool ok = true;

            if (!detail::isValidResourceName(m_config.streamName_, "_.-", 1, 128)) {
                reportError("invalid stream name: " + m_config.streamName_, nullptr);
                ok = false;
            }

            if (m_config.partitionKey_.size() > kKinesisMaxPartitionKeyBytes) {
                reportError("partition key longer than " + std::to_string(kKinesisMaxPartitionKeyBytes)
                            + " bytes: " + m_config.partitionKey_, nullptr);
                ok = false;
            }

            const int hours = m_config.retentionPeriodHours_;
            if (hours != 0 && (hours < kKinesisMinRetentionHours || hours > kKinesisMaxRetentionHours)) {
                reportError("invalid retention period: " + std::to_string(hours), nullptr);
                ok = false;
            }

            if (m_config.autoCreate_ && m_config.shardCount_ < 1) {
                reportError("invalid shard count: " + std::to_string(m_config.shardCount_), nullptr);
                ok = false;
            }

            return ok;
        }

        bool ensureStream() {
            const std::string& name = m_config.streamName_;
            const std::int64_t timeout = m_config.initializationTimeoutMs_;

            KinesisStreamStatus status = KinesisStreamStatus::Missing;
            retryClientCall(m_retry, timeout, "describeStream", [&] {
                status = m_client->describeStreamStatus(name);
            });

            if (status == KinesisStreamStatus::Missing) {
                if (!m_config.autoCreate_) {
                    reportError("stream \"" + name + "\" does not exist and auto-create is not enabled", nullptr);
                    return false;
                }

                logger().debug("creating Kinesis stream: " + name);
                retryClientCall(m_retry, timeout, "createStream", [&] {
                    m_client->createStream(name, m_config.shardCount_);
                });
                waitForActive();

                if (m_config.retentionPeriodHours_ != 0) {
                    try {
                        callClient("setRetentionPeriod", [&] {
                            m_client->setRetentionPeriod(name, m_config.retentionPeriodHours_);
                        });
                        // stream goes to UPDATING while the change applies
                        waitForActive();
                    } catch (const std::exception&) {
                        reportError("exception setting retention policy", std::current_exception());
                    }
                }
            } else {
                logger().debug("using existing Kinesis stream: " + name);
                if (status != KinesisStreamStatus::Active) {
                    waitForActive();
                }
            }

            return true;
        }

        void waitForActive() {
            const std::string& name = m_config.streamName_;
            waitFor(m_retry, m_config.initializationTimeoutMs_, "describeStream",
                    "stream to become active", [&] {
                KinesisStreamStatus status = m_client->describeStreamStatus(name);
                if (status == KinesisStreamStatus::Deleting) {
                    throw FacadeException(ReasonCode::MISSING_DESTINATION, "describeStream",
                                          "stream is being deleted: " + name);
                }
                return status == KinesisStreamStatus::Active;
            });
        }

        KinesisWriterConfig m_config;
        std::unique_ptr<KinesisClient> m_client;
        RetryManager m_retry;
        std::mt19937 m_random;
        bool m_shutdown;
    };

} // namespace logbeam

#endif // LOGBEAM_KINESIS_DESTINATION_HPP
