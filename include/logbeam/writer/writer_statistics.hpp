#ifndef LOGBEAM_WRITER_STATISTICS_HPP
#define LOGBEAM_WRITER_STATISTICS_HPP

#include "../core/log_common.hpp"
#include "../core/exception_info.hpp"
#include "../queue/message_queue.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <mutex>
#include <string>
#include <vector>
#include <map>
#include <exception>
#include <cstdint>

namespace logbeam {

    /// The most recent error reported by a writer.
    struct LastError {
        bool present;
        std::string message;
        std::int64_t timestamp;               ///< Wall-clock millis
        std::vector<std::string> stacktrace;  ///< Exception chain, outermost first

        LastError()
            : present(false)
            , timestamp(0) {}
    };

    /// Counters and error state for one writer.
    ///
    /// Written by the writer (the loop thread, plus producer threads for the
    /// oversize counter); read at any time by monitoring code. Counters are
    /// independent atomics, so a reader may see one batch's sent count
    /// before its last-batch count.
    class WriterStatistics {
    public:
        WriterStatistics()
            : m_queue(nullptr)
            , m_messagesSent(0)
            , m_messagesSentLastBatch(0)
            , m_messagesRequeued(0)
            , m_messagesRequeuedLastBatch(0)
            , m_batchesSent(0)
            , m_oversizeMessages(0)
            , m_throttledWrites(0)
            , m_writerRaceRetries(0)
            , m_unrecoveredWriterRaceRetries(0) {}

        WriterStatistics(const WriterStatistics&) = delete;
        WriterStatistics& operator=(const WriterStatistics&) = delete;

        /// The discard count is owned by the queue; statistics read it there.
        void setMessageQueue(const MessageQueue* queue) {
            m_queue.store(queue, std::memory_order_release);
        }

        // ------------------------------------------------------------------
        //  Updates
        // ------------------------------------------------------------------

        /// Records the outcome of one send: `sent` messages accepted by the
        /// destination and `requeued` returned to the queue.
        void recordBatch(size_t sent, size_t requeued) {
            if (sent > 0) {
                m_messagesSent.fetch_add(sent, std::memory_order_relaxed);
                m_messagesSentLastBatch.store(sent, std::memory_order_relaxed);
                m_batchesSent.fetch_add(1, std::memory_order_relaxed);
            }
            m_messagesRequeued.fetch_add(requeued, std::memory_order_relaxed);
            m_messagesRequeuedLastBatch.store(requeued, std::memory_order_relaxed);
        }

        void incrementOversizeMessages() { m_oversizeMessages.fetch_add(1, std::memory_order_relaxed); }
        void incrementThrottledWrites() { m_throttledWrites.fetch_add(1, std::memory_order_relaxed); }
        void incrementWriterRaceRetries() { m_writerRaceRetries.fetch_add(1, std::memory_order_relaxed); }
        void incrementUnrecoveredWriterRaceRetries() { m_unrecoveredWriterRaceRetries.fetch_add(1, std::memory_order_relaxed); }

        void setLastError(const std::string& message, std::exception_ptr error) {
            LastError updated;
            updated.present = true;
            updated.message = message;
            updated.timestamp = detail::currentTimeMillis();
            updated.stacktrace = detail::exceptionChain(error);

            std::lock_guard<std::mutex> lock(m_mutex);
            m_lastError = std::move(updated);
        }

        /// Records a resolved destination name, e.g. "logGroupName".
        void setDestinationName(const std::string& key, const std::string& value) {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_destinationNames[key] = value;
        }

        // ------------------------------------------------------------------
        //  Accessors
        // ------------------------------------------------------------------

        size_t messagesSent() const { return m_messagesSent.load(std::memory_order_relaxed); }
        size_t messagesSentLastBatch() const { return m_messagesSentLastBatch.load(std::memory_order_relaxed); }
        size_t messagesRequeued() const { return m_messagesRequeued.load(std::memory_order_relaxed); }
        size_t messagesRequeuedLastBatch() const { return m_messagesRequeuedLastBatch.load(std::memory_order_relaxed); }
        size_t batchesSent() const { return m_batchesSent.load(std::memory_order_relaxed); }
        size_t oversizeMessages() const { return m_oversizeMessages.load(std::memory_order_relaxed); }
        size_t throttledWrites() const { return m_throttledWrites.load(std::memory_order_relaxed); }
        size_t writerRaceRetries() const { return m_writerRaceRetries.load(std::memory_order_relaxed); }
        size_t unrecoveredWriterRaceRetries() const { return m_unrecoveredWriterRaceRetries.load(std::memory_order_relaxed); }

        size_t messagesDiscarded() const {
            const MessageQueue* queue = m_queue.load(std::memory_order_acquire);
            return queue ? queue->discardCount() : 0;
        }

        LastError lastError() const {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_lastError;
        }

        /// Empty string if the destination never reported the name.
        std::string destinationName(const std::string& key) const {
            std::lock_guard<std::mutex> lock(m_mutex);
            std::map<std::string, std::string>::const_iterator it = m_destinationNames.find(key);
            return (it == m_destinationNames.end()) ? std::string() : it->second;
        }

        /// Snapshot for monitoring endpoints. Field names are stable.
        nlohmann::ordered_json toJson() const {
            nlohmann::ordered_json j;
            j["messagesSent"] = messagesSent();
            j["messagesSentLastBatch"] = messagesSentLastBatch();
            j["messagesRequeued"] = messagesRequeued();
            j["messagesRequeuedLastBatch"] = messagesRequeuedLastBatch();
            j["messagesDiscarded"] = messagesDiscarded();
            j["batchesSent"] = batchesSent();
            j["oversizeMessages"] = oversizeMessages();
            j["throttledWrites"] = throttledWrites();
            j["writerRaceRetries"] = writerRaceRetries();
            j["unrecoveredWriterRaceRetries"] = unrecoveredWriterRaceRetries();

            std::lock_guard<std::mutex> lock(m_mutex);
            nlohmann::ordered_json names = nlohmann::ordered_json::object();
            for (const auto& kv : m_destinationNames) {
                names[kv.first] = kv.second;
            }
            j["destination"] = names;

            if (m_lastError.present) {
                nlohmann::ordered_json err;
                err["message"] = m_lastError.message;
                err["timestamp"] = detail::formatTimestamp(m_lastError.timestamp);
                err["stacktrace"] = m_lastError.stacktrace;
                j["lastError"] = err;
            } else {
                j["lastError"] = nullptr;
            }
            return j;
        }

    private:
        mutable std::mutex m_mutex;
        std::atomic<const MessageQueue*> m_queue;
        std::atomic<size_t> m_messagesSent;
        std::atomic<size_t> m_messagesSentLastBatch;
        std::atomic<size_t> m_messagesRequeued;
        std::atomic<size_t> m_messagesRequeuedLastBatch;
        std::atomic<size_t> m_batchesSent;
        std::atomic<size_t> m_oversizeMessages;
        std::atomic<size_t> m_throttledWrites;
        std::atomic<size_t> m_writerRaceRetries;
        std::atomic<size_t> m_unrecoveredWriterRaceRetries;
        LastError m_lastError;
        std::map<std::string, std::string> m_destinationNames;
    };

} // namespace logbeam

#endif // LOGBEAM_WRITER_STATISTICS_HPP
