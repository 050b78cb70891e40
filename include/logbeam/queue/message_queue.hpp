#ifndef LOGBEAM_MESSAGE_QUEUE_HPP
#define LOGBEAM_MESSAGE_QUEUE_HPP

#include "../core/log_message.hpp"
#include "../core/discard_action.hpp"
#include <mutex>
#include <condition_variable>
#include <deque>
#include <chrono>
#include <limits>
#include <cstdint>
#include <cstddef>

namespace logbeam {

    /// Wait value for MessageQueue::dequeue() that blocks until a message
    /// arrives or the queue is interrupted.
    constexpr std::int64_t kWaitForever = std::numeric_limits<std::int64_t>::max();

    /// Thread-safe bounded FIFO between producer threads and the writer
    /// thread.
    ///
    /// Producers never block: when the queue is at its discard threshold the
    /// discard action decides which message is lost. The writer thread is the
    /// only consumer; it may block in dequeue() and may push messages back to
    /// the head with requeue().
    ///
    /// Uses mutex + condition_variable + deque for C++11 compatibility.
    class MessageQueue {
    public:
        MessageQueue(size_t discardThreshold, DiscardAction discardAction)
            : m_discardThreshold(discardThreshold)
            , m_discardAction(discardAction)
            , m_discardCount(0)
            , m_interrupted(false) {}

        MessageQueue(const MessageQueue&) = delete;
        MessageQueue& operator=(const MessageQueue&) = delete;

        /// Adds a message at the tail, applying the discard policy if the
        /// queue is full. Returns false if the incoming message was dropped.
        bool enqueue(LogMessage message) {
            std::lock_guard<std::mutex> lock(m_mutex);

            if (m_queue.size() >= m_discardThreshold) {
                switch (m_discardAction) {
                    case DiscardAction::Oldest:
                        while (!m_queue.empty() && m_queue.size() >= m_discardThreshold) {
                            m_queue.pop_front();
                            ++m_discardCount;
                        }
                        // a zero threshold leaves no room even when empty
                        if (m_queue.size() >= m_discardThreshold) {
                            ++m_discardCount;
                            return false;
                        }
                        break;
                    case DiscardAction::Newest:
                    case DiscardAction::None:
                        ++m_discardCount;
                        return false;
                }
            }

            m_queue.push_back(std::move(message));
            m_notEmpty.notify_one();
            return true;
        }

        /// Pushes a message back onto the head of the queue. To restore a
        /// list of messages in their original order, requeue the last one
        /// first.
        ///
        /// The threshold still holds: if producers filled the queue while the
        /// message was out, "oldest" and "none" drop the requeued message
        /// (it is the oldest, and the incoming one), "newest" drops the tail.
        bool requeue(LogMessage message) {
            std::lock_guard<std::mutex> lock(m_mutex);

            if (m_queue.size() >= m_discardThreshold) {
                if (m_discardAction != DiscardAction::Newest || m_queue.empty()) {
                    ++m_discardCount;
                    return false;
                }
                m_queue.pop_back();
                ++m_discardCount;
            }

            m_queue.push_front(std::move(message));
            m_notEmpty.notify_one();
            return true;
        }

        /// Removes the oldest message into `out`.
        ///
        /// Waits up to waitMillis for one to arrive: zero or negative polls,
        /// kWaitForever waits until a message arrives or interrupt() is
        /// called. Returns false on timeout or interruption.
        bool dequeue(LogMessage& out, std::int64_t waitMillis) {
            std::unique_lock<std::mutex> lock(m_mutex);

            if (m_queue.empty() && !m_interrupted && waitMillis > 0) {
                if (waitMillis == kWaitForever) {
                    m_notEmpty.wait(lock, [this] {
                        return !m_queue.empty() || m_interrupted;
                    });
                } else {
                    m_notEmpty.wait_for(lock, std::chrono::milliseconds(waitMillis), [this] {
                        return !m_queue.empty() || m_interrupted;
                    });
                }
            }

            if (!m_queue.empty()) {
                out = std::move(m_queue.front());
                m_queue.pop_front();
                return true;
            }

            m_interrupted = false;
            return false;
        }

        /// Releases a thread blocked in dequeue(). If no thread is waiting,
        /// the next dequeue() that finds the queue empty returns at once.
        void interrupt() {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_interrupted = true;
            m_notEmpty.notify_all();
        }

        size_t size() const {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_queue.size();
        }

        bool isEmpty() const {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_queue.empty();
        }

        /// Total number of messages dropped by the discard policy.
        size_t discardCount() const {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_discardCount;
        }

        size_t discardThreshold() const {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_discardThreshold;
        }

        DiscardAction discardAction() const {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_discardAction;
        }

        /// Lowering the threshold below the current size drops the excess
        /// immediately, from the end selected by the discard action.
        void setDiscardThreshold(size_t value) {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_discardThreshold = value;
            while (m_queue.size() > m_discardThreshold) {
                if (m_discardAction == DiscardAction::Oldest) {
                    m_queue.pop_front();
                } else {
                    m_queue.pop_back();
                }
                ++m_discardCount;
            }
        }

        void setDiscardAction(DiscardAction value) {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_discardAction = value;
        }

    private:
        mutable std::mutex m_mutex;
        std::condition_variable m_notEmpty;
        std::deque<LogMessage> m_queue;
        size_t m_discardThreshold;
        DiscardAction m_discardAction;
        size_t m_discardCount;
        bool m_interrupted;
    };

} // namespace logbeam

#endif // LOGBEAM_MESSAGE_QUEUE_HPP
