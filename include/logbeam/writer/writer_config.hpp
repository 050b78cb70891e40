#ifndef LOGBEAM_WRITER_CONFIG_HPP
#define LOGBEAM_WRITER_CONFIG_HPP

#include "../core/discard_action.hpp"
#include "../retry/retry_manager.hpp"
#include <cstdint>
#include <cstddef>

namespace logbeam {

    /// Destination-independent writer settings.
    ///
    /// Backend configurations derive from this through WriterConfigBuilder,
    /// so the fluent setters below chain with the backend-specific ones:
    /// @code
    ///   CloudWatchWriterConfig cfg;
    ///   cfg.setLogGroupName("app").setLogStreamName("web-1")
    ///      .setBatchDelay(2000).setDiscardThreshold(10000);
    /// @endcode
    ///
    /// The writer copies the configuration at construction. Afterwards only
    /// the batch delay and the discard settings can change, through the
    /// writer's own setters.
    struct WriterConfig {
        std::int64_t batchDelayMs_;           ///< Max time to accumulate a batch
        size_t discardThreshold_;             ///< Queue capacity
        DiscardAction discardAction_;         ///< What to drop at capacity
        bool synchronousMode_;                ///< Send on the caller's thread
        bool useShutdownHook_;                ///< Stop the writer at process exit
        bool truncateOversizeMessages_;       ///< Truncate instead of discard
        size_t retryBudget_;                  ///< Max send attempts per batch
        std::int64_t sendTimeoutMs_;          ///< Time budget for one batch's retries
        std::int64_t initializationTimeoutMs_; ///< Time budget for each create/wait step
        std::int64_t retryInitialDelayMs_;    ///< First backoff delay
        std::int64_t retryMaxDelayMs_;        ///< Backoff ceiling
        RetryManager::Sleeper retrySleeper_;  ///< Replaces real sleeping (tests)

        WriterConfig()
            : batchDelayMs_(2000)
            , discardThreshold_(10000)
            , discardAction_(DiscardAction::Oldest)
            , synchronousMode_(false)
            , useShutdownHook_(false)
            , truncateOversizeMessages_(false)
            , retryBudget_(4)
            , sendTimeoutMs_(10000)
            , initializationTimeoutMs_(60000)
            , retryInitialDelayMs_(100)
            , retryMaxDelayMs_(2000) {}

        virtual ~WriterConfig() = default;

        /// Backoff policy shared by the writer and its destination.
        RetryManager makeRetryManager(bool exponential) const {
            return RetryManager(retryInitialDelayMs_, retryMaxDelayMs_, exponential, retrySleeper_);
        }
    };

    /// CRTP layer that gives every backend configuration fluent setters for
    /// the common fields returning the derived type.
    template<typename Derived>
    struct WriterConfigBuilder : WriterConfig {
        Derived& setBatchDelay(std::int64_t ms) { batchDelayMs_ = ms; return self(); }
        Derived& setDiscardThreshold(size_t n) { discardThreshold_ = n; return self(); }
        Derived& setDiscardAction(DiscardAction a) { discardAction_ = a; return self(); }
        Derived& setSynchronousMode(bool v) { synchronousMode_ = v; return self(); }
        Derived& setUseShutdownHook(bool v) { useShutdownHook_ = v; return self(); }
        Derived& setTruncateOversizeMessages(bool v) { truncateOversizeMessages_ = v; return self(); }
        /// @note A value of 0 is clamped to 1; every batch gets one attempt.
        Derived& setRetryBudget(size_t n) { retryBudget_ = (n > 0 ? n : 1); return self(); }
        Derived& setSendTimeoutMs(std::int64_t ms) { sendTimeoutMs_ = ms; return self(); }
        Derived& setInitializationTimeoutMs(std::int64_t ms) { initializationTimeoutMs_ = ms; return self(); }
        Derived& setRetryDelays(std::int64_t initialMs, std::int64_t maxMs) {
            retryInitialDelayMs_ = initialMs;
            retryMaxDelayMs_ = maxMs;
            return self();
        }
        Derived& setRetrySleeper(RetryManager::Sleeper sleeper) {
            retrySleeper_ = std::move(sleeper);
            return self();
        }

    private:
        Derived& self() { return static_cast<Derived&>(*this); }
    };

} // namespace logbeam

#endif // LOGBEAM_WRITER_CONFIG_HPP
