#ifndef LOGBEAM_FACADE_EXCEPTION_HPP
#define LOGBEAM_FACADE_EXCEPTION_HPP

#include "../core/exception_info.hpp"
#include <stdexcept>
#include <string>
#include <exception>

namespace logbeam {

    /// Normalized backend error kinds. Every error that reaches the writer is
    /// one of these; backend-specific exception types stop at the destination.
    enum class ReasonCode {
        THROTTLING,
        ABORTED,
        INVALID_SEQUENCE_TOKEN,
        ALREADY_PROCESSED,
        MISSING_LOG_GROUP,
        MISSING_DESTINATION,
        INVALID_CONFIGURATION,
        UNEXPECTED_EXCEPTION
    };

    inline const char* getReasonCodeString(ReasonCode reason) {
        switch (reason) {
            case ReasonCode::THROTTLING: return "THROTTLING";
            case ReasonCode::ABORTED: return "ABORTED";
            case ReasonCode::INVALID_SEQUENCE_TOKEN: return "INVALID_SEQUENCE_TOKEN";
            case ReasonCode::ALREADY_PROCESSED: return "ALREADY_PROCESSED";
            case ReasonCode::MISSING_LOG_GROUP: return "MISSING_LOG_GROUP";
            case ReasonCode::MISSING_DESTINATION: return "MISSING_DESTINATION";
            case ReasonCode::INVALID_CONFIGURATION: return "INVALID_CONFIGURATION";
            case ReasonCode::UNEXPECTED_EXCEPTION: return "UNEXPECTED_EXCEPTION";
            default: return "UNKNOWN";
        }
    }

    /// Whether the writer retries an operation that failed for this reason.
    inline bool isRetryableReason(ReasonCode reason) {
        return reason == ReasonCode::THROTTLING
            || reason == ReasonCode::ABORTED
            || reason == ReasonCode::INVALID_SEQUENCE_TOKEN;
    }

    /// Error raised by a destination or one of its backend clients.
    ///
    /// what() is "<operation>: <message>". When the error wraps another
    /// exception, throw it with std::throw_with_nested (see
    /// translateCurrentException) so the original cause stays reachable.
    class FacadeException : public std::runtime_error {
    public:
        FacadeException(ReasonCode reason, const std::string& operation,
                        const std::string& message)
            : std::runtime_error(operation + ": " + message)
            , m_reason(reason)
            , m_operation(operation)
            , m_retryable(isRetryableReason(reason)) {}

        FacadeException(ReasonCode reason, const std::string& operation,
                        const std::string& message, bool retryable)
            : std::runtime_error(operation + ": " + message)
            , m_reason(reason)
            , m_operation(operation)
            , m_retryable(retryable) {}

        ReasonCode reason() const { return m_reason; }
        const std::string& operation() const { return m_operation; }
        bool isRetryable() const { return m_retryable; }

    private:
        ReasonCode m_reason;
        std::string m_operation;
        bool m_retryable;
    };

namespace detail {

    /// Must be called from inside a catch block. Rethrows a FacadeException
    /// unchanged; anything else becomes UNEXPECTED_EXCEPTION with the
    /// original exception nested inside it.
    [[noreturn]] inline void translateCurrentException(const std::string& operation) {
        try {
            throw;
        } catch (const FacadeException&) {
            throw;
        } catch (const std::exception& ex) {
            std::throw_with_nested(FacadeException(
                ReasonCode::UNEXPECTED_EXCEPTION, operation,
                std::string("unexpected exception: ") + safeWhat(ex), false));
        } catch (...) {
            std::throw_with_nested(FacadeException(
                ReasonCode::UNEXPECTED_EXCEPTION, operation,
                "unexpected exception: unknown", false));
        }
    }

    /// Predicate for RetryManager: retry FacadeExceptions marked retryable.
    inline bool isRetryableFacadeException(const std::exception& ex) {
        const FacadeException* fex = dynamic_cast<const FacadeException*>(&ex);
        return fex != nullptr && fex->isRetryable();
    }

} // namespace detail
} // namespace logbeam

#endif // LOGBEAM_FACADE_EXCEPTION_HPP
