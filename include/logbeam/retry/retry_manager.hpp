#ifndef LOGBEAM_RETRY_MANAGER_HPP
#define LOGBEAM_RETRY_MANAGER_HPP

#include "../core/log_common.hpp"
#include <functional>
#include <exception>
#include <algorithm>
#include <thread>
#include <chrono>
#include <cstdint>
#include <cstddef>

namespace logbeam {

    /// Outcome of RetryManager::invoke().
    struct RetryResult {
        bool succeeded;               ///< The operation reported completion
        size_t attempts;              ///< Number of times the operation ran
        std::exception_ptr lastError; ///< Last retryable exception, if any

        RetryResult()
            : succeeded(false)
            , attempts(0) {}
    };

    using RetryablePredicate = std::function<bool(const std::exception&)>;

    /// Bounded-time retry with backoff.
    ///
    /// The operation is any callable returning bool: true means done, false
    /// means "not yet" (for example a resource that was just created and is
    /// not visible). An exception for which the predicate returns true is
    /// treated like false; any other exception propagates to the caller.
    ///
    /// Delays start at initialDelayMs and either stay fixed or double up to
    /// maxDelayMs, so they never decrease. No attempt is started once the
    /// next delay would carry it past the timeout.
    ///
    /// A RetryManager holds only its policy, so one instance can be shared by
    /// unrelated operations.
    ///
    /// @code
    ///   RetryManager retry(100, 2000, true);
    ///   RetryResult r = retry.invoke([&] { return client.findGroup() != ""; },
    ///                                isThrottling, 30000);
    /// @endcode
    class RetryManager {
    public:
        using Sleeper = std::function<void(std::int64_t)>;

        RetryManager(std::int64_t initialDelayMs, std::int64_t maxDelayMs, bool exponential,
                     Sleeper sleeper = Sleeper())
            : m_initialDelayMs(initialDelayMs > 0 ? initialDelayMs : 0)
            , m_maxDelayMs(std::max(maxDelayMs, initialDelayMs))
            , m_exponential(exponential)
            , m_sleeper(std::move(sleeper)) {}

        /// @param maxAttempts upper bound on attempts, 0 for no bound
        template<typename Operation>
        RetryResult invoke(Operation&& operation, const RetryablePredicate& isRetryable,
                           std::int64_t timeoutMs, size_t maxAttempts = 0) const {
            RetryResult result;
            const std::int64_t start = detail::monotonicMillis();
            std::int64_t delay = m_initialDelayMs;

            for (;;) {
                ++result.attempts;
                try {
                    if (operation()) {
                        result.succeeded = true;
                        result.lastError = nullptr;
                        return result;
                    }
                } catch (const std::exception& ex) {
                    if (!isRetryable || !isRetryable(ex)) throw;
                    result.lastError = std::current_exception();
                }

                if (maxAttempts > 0 && result.attempts >= maxAttempts) return result;
                if (detail::monotonicMillis() - start + delay > timeoutMs) return result;

                sleep(delay);
                if (m_exponential) {
                    delay = std::min(delay * 2, m_maxDelayMs);
                }
            }
        }

        std::int64_t initialDelayMs() const { return m_initialDelayMs; }
        std::int64_t maxDelayMs() const { return m_maxDelayMs; }
        bool exponential() const { return m_exponential; }

    private:
        void sleep(std::int64_t millis) const {
            if (m_sleeper) {
                m_sleeper(millis);
            } else if (millis > 0) {
                std::this_thread::sleep_for(std::chrono::milliseconds(millis));
            }
        }

        std::int64_t m_initialDelayMs;
        std::int64_t m_maxDelayMs;
        bool m_exponential;
        Sleeper m_sleeper;
    };

} // namespace logbeam

#endif // LOGBEAM_RETRY_MANAGER_HPP
