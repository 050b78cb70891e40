#ifndef LOGBEAM_LOG_WRITER_HPP
#define LOGBEAM_LOG_WRITER_HPP

#include "writer_config.hpp"
#include "writer_statistics.hpp"
#include "shutdown_hooks.hpp"
#include "../core/log_common.hpp"
#include "../core/log_message.hpp"
#include "../core/internal_logger.hpp"
#include "../core/exception_info.hpp"
#include "../queue/message_queue.hpp"
#include "../retry/retry_manager.hpp"
#include "../destination/destination_facade.hpp"
#include "../destination/facade_exception.hpp"
#include <thread>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <memory>
#include <vector>
#include <string>
#include <sstream>
#include <chrono>
#include <stdexcept>
#include <cstdint>
#include <cstddef>
#include <cstdio>

namespace logbeam {

    enum class WriterState {
        UNINITIALIZED,
        READY,
        RUNNING,
        STOPPING,
        STOPPED,
        FAILED
    };

    inline const char* getWriterStateString(WriterState state) {
        switch (state) {
            case WriterState::UNINITIALIZED: return "UNINITIALIZED";
            case WriterState::READY: return "READY";
            case WriterState::RUNNING: return "RUNNING";
            case WriterState::STOPPING: return "STOPPING";
            case WriterState::STOPPED: return "STOPPED";
            case WriterState::FAILED: return "FAILED";
            default: return "UNKNOWN";
        }
    }

namespace detail {

    inline std::string currentThreadName() {
        std::ostringstream oss;
        oss << std::this_thread::get_id();
        return oss.str();
    }

} // namespace detail

    /// Moves messages from producer threads to a destination in batches.
    ///
    /// Producers call addMessage(), which never blocks (except in
    /// synchronous mode). A dedicated thread started by start() initializes
    /// the destination, then repeatedly builds a batch from the queue and
    /// sends it, requeueing whatever the destination could not accept.
    ///
    /// A batch closes when no message arrives within the batch delay of
    /// the first one, or when the next message would exceed the
    /// destination's per-request limits.
    ///
    /// stop() sets a shutdown deadline one batch delay in the future. The
    /// thread keeps sending until the deadline, and after it for as long as
    /// messages remain and the last batch made progress; then it shuts down
    /// the destination and exits.
    ///
    /// @code
    ///   CloudWatchWriterConfig cfg;
    ///   cfg.setLogGroupName("app").setLogStreamName("web-1");
    ///   LogWriter writer(cfg, detail::make_unique<CloudWatchDestination>(cfg, makeClient()));
    ///   writer.start();
    ///   writer.addMessage(LogMessage(detail::currentTimeMillis(), "hello"));
    ///   writer.stop();
    ///   writer.waitUntilStopped(5000);
    /// @endcode
    ///
    /// @warning Subclasses that override processBatch() MUST call
    ///          stopAndJoin() from their destructor. Otherwise the writer
    ///          thread may call processBatch() after the subclass part of
    ///          the object is gone.
    class LogWriter {
    public:
        LogWriter(const WriterConfig& config, std::unique_ptr<DestinationFacade> destination,
                  std::shared_ptr<InternalLogger> logger = std::shared_ptr<InternalLogger>())
            : m_config(config)
            , m_logger(logger ? logger : std::shared_ptr<InternalLogger>(std::make_shared<StderrInternalLogger>()))
            , m_queue(config.discardThreshold_, config.discardAction_)
            , m_destination(std::move(destination))
            , m_sendRetry(config.makeRetryManager(true))
            , m_batchDelay(config.batchDelayMs_)
            , m_shutdownTime(kWaitForever)
            , m_batchCount(0)
            , m_lastBatchMadeProgress(true)
            , m_state(WriterState::UNINITIALIZED)
            , m_started(false)
            , m_initializing(false)
            , m_initialized(false)
            , m_finished(false)
            , m_hookId(0) {
            if (!m_destination) {
                throw std::invalid_argument("LogWriter requires a destination");
            }
            m_stats.setMessageQueue(&m_queue);
            m_destination->bind(m_stats, *m_logger);
        }

        virtual ~LogWriter() noexcept {
            stopAndJoin();
        }

        LogWriter(const LogWriter&) = delete;
        LogWriter& operator=(const LogWriter&) = delete;

        /// Starts the writer thread, or in synchronous mode initializes the
        /// destination on the calling thread.
        /// @throws std::logic_error if called twice
        void start() {
            {
                std::lock_guard<std::mutex> lock(m_stateMutex);
                if (m_started) throw std::logic_error("log writer already started");
                m_started = true;
            }

            if (m_config.useShutdownHook_) {
                m_hookId = ShutdownHooks::instance().add([this] {
                    m_logger->debug("shutdown hook invoked");
                    stop();
                    waitUntilStopped(m_batchDelay.load() + m_config.sendTimeoutMs_);
                });
            }

            if (!m_config.synchronousMode_) {
                m_thread = std::thread(&LogWriter::run, this);
                return;
            }

            m_logger->debug("log writer starting in synchronous mode (" + describeDestination()
                            + ", thread: " + detail::currentThreadName() + ")");
            if (!initialize()) {
                finish();
                return;
            }
            m_logger->debug("log writer initialization complete (thread: "
                            + detail::currentThreadName() + ")");
            enterRunningState();
            drainQueue();
        }

        /// Queues a message for delivery.
        ///
        /// Empty messages are dropped. Messages larger than the destination
        /// accepts are truncated or dropped, per truncateOversizeMessages_.
        /// In synchronous mode the message is sent before this returns.
        void addMessage(LogMessage message) {
            if (message.empty()) {
                m_logger->warn("discarded empty message");
                return;
            }

            const size_t limit = m_destination->maxMessageSize();
            if (message.size() > limit) {
                m_stats.incrementOversizeMessages();
                if (!m_config.truncateOversizeMessages_) {
                    m_logger->warn("discarded oversize message: " + std::to_string(message.size())
                                   + " bytes, limit " + std::to_string(limit));
                    return;
                }
                m_logger->warn("truncated oversize message: " + std::to_string(message.size())
                               + " bytes, limit " + std::to_string(limit));
                message = message.truncatedTo(limit);
            }

            m_queue.enqueue(std::move(message));

            if (m_config.synchronousMode_ && state() == WriterState::RUNNING) {
                processBatch(detail::monotonicMillis());
            }
        }

        /// Verifies (and if configured, creates) the destination. Runs once;
        /// a concurrent caller waits for the first one, and later calls
        /// return its result. On failure the queue is switched to discard
        /// everything and the writer becomes FAILED.
        bool initialize() {
            {
                std::unique_lock<std::mutex> lock(m_stateMutex);
                if (m_initializing) {
                    m_stateChanged.wait(lock, [this] { return m_initialized; });
                    return m_state != WriterState::FAILED;
                }
                m_initializing = true;
            }

            bool success = false;
            try {
                success = m_destination->ensureDestinationAvailable();
            } catch (...) {
                std::exception_ptr error = std::current_exception();
                reportError("exception in initializer: " + detail::rootCauseMessage(error), error);
            }

            if (!success) {
                m_logger->error("log writer failed to initialize (thread: "
                                + detail::currentThreadName() + ")", nullptr);
                m_queue.setDiscardAction(DiscardAction::Oldest);
                m_queue.setDiscardThreshold(0);
            }

            std::lock_guard<std::mutex> lock(m_stateMutex);
            m_state = success ? WriterState::READY : WriterState::FAILED;
            m_initialized = true;
            m_stateChanged.notify_all();
            return success;
        }

        /// Blocks until initialization has finished, successfully or not.
        /// Returns false on timeout.
        bool waitUntilInitialized(std::int64_t millis) {
            std::unique_lock<std::mutex> lock(m_stateMutex);
            return m_stateChanged.wait_for(lock, std::chrono::milliseconds(millis),
                                           [this] { return m_initialized; });
        }

        /// Asks the writer to finish. Queued messages are still sent, up to
        /// the shutdown deadline. Does not wait; see waitUntilStopped().
        void stop() {
            std::int64_t expected = kWaitForever;
            m_shutdownTime.compare_exchange_strong(expected, detail::monotonicMillis() + m_batchDelay.load());

            bool finishHere = false;
            {
                std::lock_guard<std::mutex> lock(m_stateMutex);
                if (m_state == WriterState::READY || m_state == WriterState::RUNNING) {
                    m_state = WriterState::STOPPING;
                    m_stateChanged.notify_all();
                }
                finishHere = m_config.synchronousMode_ && m_started && !m_finished
                             && m_state == WriterState::STOPPING;
            }
            m_queue.interrupt();

            if (finishHere) {
                drainQueue();
                finish();
            }
        }

        /// Blocks until the writer has shut down. Returns false on timeout.
        bool waitUntilStopped(std::int64_t millis) {
            std::unique_lock<std::mutex> lock(m_stateMutex);
            return m_stateChanged.wait_for(lock, std::chrono::milliseconds(millis),
                                           [this] { return m_finished; });
        }

        /// Stops the writer and joins its thread. Idempotent.
        void stopAndJoin() noexcept {
            std::lock_guard<std::mutex> lock(m_joinMutex);
            try {
                if (m_thread.joinable()) {
                    stop();
                    m_thread.join();
                } else if (m_config.synchronousMode_) {
                    stop();
                }
            } catch (const std::exception& ex) {
                std::fprintf(stderr, "[logbeam][LogWriter] exception while stopping: %s\n",
                             detail::safeWhat(ex));
            }
            if (m_hookId != 0) {
                ShutdownHooks::instance().remove(m_hookId);
            }
        }

        void setBatchDelay(std::int64_t millis) { m_batchDelay.store(millis); }

        /// Ignored once the writer has FAILED; it keeps discarding.
        void setDiscardThreshold(size_t value) {
            if (state() == WriterState::FAILED) return;
            m_queue.setDiscardThreshold(value);
        }

        /// Ignored once the writer has FAILED; it keeps discarding.
        void setDiscardAction(DiscardAction value) {
            if (state() == WriterState::FAILED) return;
            m_queue.setDiscardAction(value);
        }

        std::int64_t batchDelay() const { return m_batchDelay.load(); }
        size_t batchCount() const { return m_batchCount.load(); }

        WriterState state() const {
            std::lock_guard<std::mutex> lock(m_stateMutex);
            return m_state;
        }

        bool isRunning() const {
            WriterState s = state();
            return s == WriterState::READY || s == WriterState::RUNNING || s == WriterState::STOPPING;
        }

        const WriterConfig& config() const { return m_config; }
        const WriterStatistics& statistics() const { return m_stats; }
        const MessageQueue& messageQueue() const { return m_queue; }
        DestinationFacade& destination() { return *m_destination; }

        /// Id of the registered shutdown hook, 0 if none.
        size_t shutdownHookId() const { return m_hookId; }

    protected:
        /// Builds one batch and sends it. The first message is awaited until
        /// `waitUntil` (monotonic millis, or kWaitForever).
        ///
        /// Serialized by a mutex shared with synchronous-mode producers.
        /// Never throws: a batch that fails for any reason goes back to the
        /// head of the queue.
        virtual void processBatch(std::int64_t waitUntil) {
            std::lock_guard<std::mutex> lock(m_processMutex);

            std::vector<LogMessage> batch;
            try {
                buildBatch(batch, waitUntil);
                if (batch.empty()) {
                    m_lastBatchMadeProgress.store(true);
                    return;
                }

                m_batchCount.fetch_add(1);
                SendOutcome outcome = sendBatch(batch);
                requeueMessages(outcome.unsent);

                const size_t sent = outcome.delivered ? batch.size() - outcome.unsent.size() : 0;
                m_stats.recordBatch(sent, outcome.unsent.size());
                m_lastBatchMadeProgress.store(outcome.unsent.size() < batch.size());
            } catch (...) {
                std::exception_ptr error = std::current_exception();
                reportError("unexpected exception processing batch: " + detail::rootCauseMessage(error), error);
                requeueMessages(batch);
                m_stats.recordBatch(0, batch.size());
                m_lastBatchMadeProgress.store(false);
            }
        }

        void reportError(const std::string& message, std::exception_ptr error) {
            m_logger->error(message, error);
            m_stats.setLastError(message, error);
        }

        InternalLogger& logger() { return *m_logger; }

    private:
        struct SendOutcome {
            std::vector<LogMessage> unsent;
            bool delivered;

            SendOutcome()
                : delivered(false) {}
        };

        void run() noexcept {
            try {
                m_logger->debug("log writer starting (" + describeDestination()
                                + ", thread: " + detail::currentThreadName() + ")");
                if (initialize()) {
                    m_logger->debug("log writer initialization complete (thread: "
                                    + detail::currentThreadName() + ")");
                    enterRunningState();
                    do {
                        processBatch(m_shutdownTime.load());
                    } while (keepRunning());
                }
            } catch (...) {
                reportError("unexpected exception in writer thread", std::current_exception());
            }
            finish();
        }

        std::string describeDestination() const {
            return std::string("destination: ") + getDestinationKindString(m_destination->kind());
        }

        void enterRunningState() {
            std::lock_guard<std::mutex> lock(m_stateMutex);
            if (m_state == WriterState::READY) {
                m_state = (m_shutdownTime.load() == kWaitForever)
                    ? WriterState::RUNNING
                    : WriterState::STOPPING;
                m_stateChanged.notify_all();
            }
        }

        bool keepRunning() const {
            if (detail::monotonicMillis() < m_shutdownTime.load()) return true;
            return !m_queue.isEmpty() && m_lastBatchMadeProgress.load();
        }

        /// Sends whatever is queued on the calling thread (synchronous mode).
        void drainQueue() {
            do {
                processBatch(detail::monotonicMillis());
            } while (!m_queue.isEmpty() && m_lastBatchMadeProgress.load());
        }

        bool waitForMessage(LogMessage& out, std::int64_t waitUntil) {
            if (waitUntil == kWaitForever) {
                return m_queue.dequeue(out, kWaitForever);
            }
            return m_queue.dequeue(out, waitUntil - detail::monotonicMillis());
        }

        /// Each dequeued message is appended before the destination measures
        /// it, so a throwing facade leaves it in `batch` for the caller to
        /// requeue.
        void buildBatch(std::vector<LogMessage>& batch, std::int64_t waitUntil) {
            LogMessage message;
            if (!waitForMessage(message, waitUntil)) return;

            const std::int64_t delay = m_config.synchronousMode_ ? 0 : m_batchDelay.load();
            const std::int64_t batchTimeout = detail::monotonicMillis() + delay;
            size_t batchBytes = 0;

            for (;;) {
                batch.push_back(std::move(message));
                batchBytes += m_destination->effectiveSize(batch.back());
                if (batch.size() > 1 && !m_destination->withinServiceLimits(batchBytes, batch.size())) {
                    m_queue.requeue(std::move(batch.back()));
                    batch.pop_back();
                    break;
                }
                if (!waitForMessage(message, batchTimeout)) break;
            }
        }

        SendOutcome sendBatch(const std::vector<LogMessage>& batch) {
            SendOutcome outcome;
            ReasonCode lastReason = ReasonCode::THROTTLING;
            bool tokenRefreshed = false;

            try {
                // A sequence token conflict is retried once, right away and
                // outside the attempt budget, with a freshly fetched token.
                RetryResult result = m_sendRetry.invoke([&]() -> bool {
                    for (;;) {
                        try {
                            outcome.unsent = m_destination->send(batch);
                            return true;
                        } catch (const FacadeException& ex) {
                            lastReason = ex.reason();
                            switch (ex.reason()) {
                                case ReasonCode::THROTTLING:
                                    m_stats.incrementThrottledWrites();
                                    return false;
                                case ReasonCode::ABORTED:
                                    return false;
                                case ReasonCode::INVALID_SEQUENCE_TOKEN:
                                    m_stats.incrementWriterRaceRetries();
                                    if (tokenRefreshed) throw;
                                    tokenRefreshed = true;
                                    m_destination->refreshOrderingToken();
                                    break;
                                default:
                                    throw;
                            }
                        }
                    }
                }, RetryablePredicate(), m_config.sendTimeoutMs_, m_config.retryBudget_);

                if (result.succeeded) {
                    outcome.delivered = true;
                    return outcome;
                }

                switch (lastReason) {
                    case ReasonCode::ABORTED:
                        m_logger->warn("batch failed: repeated aborted writes");
                        break;
                    default:
                        m_logger->warn("batch failed: repeated throttling");
                        break;
                }
            } catch (const FacadeException& ex) {
                switch (ex.reason()) {
                    case ReasonCode::INVALID_SEQUENCE_TOKEN:
                        m_stats.incrementUnrecoveredWriterRaceRetries();
                        m_logger->warn("batch failed: unrecovered sequence token race");
                        break;
                    case ReasonCode::ALREADY_PROCESSED:
                        m_logger->warn("batch already processed by destination; discarded "
                                       + std::to_string(batch.size()) + " messages");
                        outcome.unsent.clear();
                        return outcome;
                    case ReasonCode::MISSING_LOG_GROUP:
                    case ReasonCode::MISSING_DESTINATION:
                        reportError(ex.what(), std::current_exception());
                        recreateDestination();
                        break;
                    default:
                        reportError(std::string("failed to send batch: ") + ex.what(),
                                    std::current_exception());
                        break;
                }
            } catch (const std::exception& ex) {
                reportError(std::string("failed to send batch: ") + detail::safeWhat(ex),
                            std::current_exception());
            } catch (...) {
                std::exception_ptr error = std::current_exception();
                reportError("failed to send batch: " + detail::rootCauseMessage(error), error);
            }

            outcome.unsent = batch;
            return outcome;
        }

        void recreateDestination() {
            try {
                if (!m_destination->ensureDestinationAvailable()) {
                    m_logger->warn("unable to recreate destination; batch will be retried");
                }
            } catch (...) {
                reportError("exception recreating destination", std::current_exception());
            }
        }

        /// Last message first, so the queue head keeps the original order.
        void requeueMessages(const std::vector<LogMessage>& messages) {
            for (size_t i = messages.size(); i > 0; --i) {
                m_queue.requeue(messages[i - 1]);
            }
        }

        void finish() {
            try {
                m_destination->shutdown();
            } catch (...) {
                reportError("exception shutting down destination", std::current_exception());
            }

            if (m_hookId != 0) {
                ShutdownHooks::instance().remove(m_hookId);
            }

            m_logger->debug("log-writer shut down (thread: " + detail::currentThreadName() + ")");

            std::lock_guard<std::mutex> lock(m_stateMutex);
            if (m_state != WriterState::FAILED) {
                m_state = WriterState::STOPPED;
            }
            m_finished = true;
            m_stateChanged.notify_all();
        }

        WriterConfig m_config;
        std::shared_ptr<InternalLogger> m_logger;
        MessageQueue m_queue;
        WriterStatistics m_stats;
        std::unique_ptr<DestinationFacade> m_destination;
        RetryManager m_sendRetry;

        std::atomic<std::int64_t> m_batchDelay;
        std::atomic<std::int64_t> m_shutdownTime;
        std::atomic<size_t> m_batchCount;
        std::atomic<bool> m_lastBatchMadeProgress;

        mutable std::mutex m_stateMutex;
        std::condition_variable m_stateChanged;
        WriterState m_state;
        bool m_started;
        bool m_initializing;
        bool m_initialized;
        bool m_finished;

        std::mutex m_processMutex;
        std::mutex m_joinMutex;
        std::thread m_thread;
        size_t m_hookId;
    };

} // namespace logbeam

#endif // LOGBEAM_LOG_WRITER_HPP
