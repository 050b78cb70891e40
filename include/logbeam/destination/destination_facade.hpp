#ifndef LOGBEAM_DESTINATION_FACADE_HPP
#define LOGBEAM_DESTINATION_FACADE_HPP

#include "facade_exception.hpp"
#include "../core/log_message.hpp"
#include "../core/internal_logger.hpp"
#include "../writer/writer_statistics.hpp"
#include "../retry/retry_manager.hpp"
#include <string>
#include <vector>
#include <stdexcept>
#include <exception>

namespace logbeam {

    /// The backends a writer can talk to. The set is fixed at build time;
    /// writer_factory.hpp maps each kind to its destination class.
    enum class DestinationKind {
        SequencedStream,   ///< Grouped stream with an ordering token (CloudWatch Logs)
        PartitionedStream, ///< Partition-keyed stream (Kinesis)
        Topic              ///< Pub/sub topic (SNS)
    };

    inline const char* getDestinationKindString(DestinationKind kind) {
        switch (kind) {
            case DestinationKind::SequencedStream: return "sequenced-stream";
            case DestinationKind::PartitionedStream: return "partitioned-stream";
            case DestinationKind::Topic: return "topic";
            default: return "unknown";
        }
    }

    /// Contract between LogWriter and one backend.
    ///
    /// A destination owns its backend client and hides every difference
    /// between services: resource model, provisioning, size accounting,
    /// ordering tokens and error types. Everything it throws is a
    /// FacadeException.
    ///
    /// All methods are called with the writer's batch lock held (or during
    /// initialization, before any batch), so implementations need no locking
    /// of their own.
    class DestinationFacade {
    public:
        DestinationFacade()
            : m_stats(nullptr)
            , m_logger(nullptr) {}

        virtual ~DestinationFacade() = default;

        DestinationFacade(const DestinationFacade&) = delete;
        DestinationFacade& operator=(const DestinationFacade&) = delete;

        virtual DestinationKind kind() const = 0;

        /// Verifies the destination exists, creating it (and any
        /// sub-resource) if so configured. Safe to call again after the
        /// destination disappears. Returns false on a configuration or
        /// provisioning failure, after reporting each problem.
        virtual bool ensureDestinationAvailable() = 0;

        /// Bytes the message counts for in a batch, including any fixed
        /// per-message overhead the backend charges.
        virtual size_t effectiveSize(const LogMessage& message) const = 0;

        /// Largest message body, in bytes, the backend accepts.
        virtual size_t maxMessageSize() const = 0;

        /// Whether a batch of this aggregate size and count can be sent in
        /// one request.
        virtual bool withinServiceLimits(size_t batchBytes, size_t messageCount) const = 0;

        /// Sends the batch. Returns the messages that must be retried, in
        /// their original order; empty on full success.
        /// @throws FacadeException for errors that affect the whole batch
        virtual std::vector<LogMessage> send(const std::vector<LogMessage>& batch) = 0;

        /// Discards any cached ordering token and fetches a fresh one.
        /// Destinations without ordering tokens do nothing.
        virtual void refreshOrderingToken() {}

        /// Releases the backend client. Idempotent.
        virtual void shutdown() = 0;

        /// Connects the destination to the statistics and logger of the
        /// writer that owns it. Called once by LogWriter's constructor.
        void bind(WriterStatistics& stats, InternalLogger& logger) {
            m_stats = &stats;
            m_logger = &logger;
        }

        bool isBound() const { return m_stats != nullptr && m_logger != nullptr; }

    protected:
        WriterStatistics& stats() {
            if (!m_stats) throw std::logic_error("destination is not bound to a writer");
            return *m_stats;
        }

        InternalLogger& logger() {
            if (!m_logger) throw std::logic_error("destination is not bound to a writer");
            return *m_logger;
        }

        /// Logs an error and records it as the writer's last error.
        void reportError(const std::string& message, std::exception_ptr error) {
            logger().error(message, error);
            stats().setLastError(message, error);
        }

        /// Runs one client call, translating anything that is not a
        /// FacadeException into UNEXPECTED_EXCEPTION.
        template<typename Call>
        static void callClient(const std::string& operation, Call&& call) {
            try {
                call();
            } catch (...) {
                detail::translateCurrentException(operation);
            }
        }

        /// Runs a client call, retrying retryable failures until it
        /// completes or the timeout passes.
        template<typename Call>
        static void retryClientCall(const RetryManager& retry, std::int64_t timeoutMs,
                                    const std::string& operation, Call&& call) {
            RetryResult result = retry.invoke([&]() -> bool {
                callClient(operation, call);
                return true;
            }, &detail::isRetryableFacadeException, timeoutMs);
            if (!result.succeeded) {
                throwRetriesExhausted(operation, "retries exhausted", result);
            }
        }

        /// Polls `ready` until it returns true, for resources that take a
        /// while to become visible after creation.
        template<typename Predicate>
        static void waitFor(const RetryManager& retry, std::int64_t timeoutMs,
                            const std::string& operation, const std::string& description,
                            Predicate&& ready) {
            RetryResult result = retry.invoke([&]() -> bool {
                bool done = false;
                callClient(operation, [&] { done = ready(); });
                return done;
            }, &detail::isRetryableFacadeException, timeoutMs);
            if (!result.succeeded) {
                throwRetriesExhausted(operation, "timeout waiting for " + description, result);
            }
        }

    private:
        [[noreturn]] static void throwRetriesExhausted(const std::string& operation,
                                                       const std::string& message,
                                                       const RetryResult& result) {
            if (!result.lastError) {
                throw FacadeException(ReasonCode::UNEXPECTED_EXCEPTION, operation, message, false);
            }
            try {
                std::rethrow_exception(result.lastError);
            } catch (...) {
                std::throw_with_nested(FacadeException(
                    ReasonCode::UNEXPECTED_EXCEPTION, operation, message, false));
            }
        }

        WriterStatistics* m_stats;
        InternalLogger* m_logger;
    };

} // namespace logbeam

#endif // LOGBEAM_DESTINATION_FACADE_HPP
