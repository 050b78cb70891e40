#ifndef LOGBEAM_INTERNAL_LOGGER_HPP
#define LOGBEAM_INTERNAL_LOGGER_HPP

#include "exception_info.hpp"
#include <string>
#include <vector>
#include <functional>
#include <exception>
#include <mutex>
#include <cstdio>

namespace logbeam {

    enum class InternalLogLevel {
        DEBUG,
        WARN,
        ERROR
    };

    inline const char* getInternalLogLevelString(InternalLogLevel level) {
        switch (level) {
            case InternalLogLevel::DEBUG: return "DEBUG";
            case InternalLogLevel::WARN: return "WARN";
            case InternalLogLevel::ERROR: return "ERROR";
            default: return "UNKNOWN";
        }
    }

    /// Destination for the writer's own diagnostics.
    ///
    /// A writer is usually embedded in a logging framework, so it must not
    /// log through that framework (it would end up feeding itself). The
    /// framework integration supplies an implementation of this interface
    /// instead; StderrInternalLogger is the fallback.
    ///
    /// Implementations are called from the writer thread and from producer
    /// threads and must be thread-safe.
    class InternalLogger {
    public:
        virtual ~InternalLogger() = default;

        virtual void debug(const std::string& message) = 0;
        virtual void warn(const std::string& message) = 0;

        /// @param error the exception being reported, or null
        virtual void error(const std::string& message, std::exception_ptr error) = 0;
    };

    /// Writes "[logbeam][name] LEVEL message" lines to stderr. Debug output
    /// is off unless enabled, matching the quiet-by-default behavior expected
    /// of a library running inside someone else's process.
    class StderrInternalLogger : public InternalLogger {
    public:
        explicit StderrInternalLogger(std::string name = "LogWriter", bool enableDebug = false)
            : m_name(std::move(name))
            , m_enableDebug(enableDebug) {}

        void debug(const std::string& message) override {
            if (m_enableDebug) {
                emit(InternalLogLevel::DEBUG, message);
            }
        }

        void warn(const std::string& message) override {
            emit(InternalLogLevel::WARN, message);
        }

        void error(const std::string& message, std::exception_ptr error) override {
            emit(InternalLogLevel::ERROR, message);
            std::vector<std::string> chain = detail::exceptionChain(error);
            std::lock_guard<std::mutex> lock(m_mutex);
            for (size_t i = 0; i < chain.size(); ++i) {
                std::fprintf(stderr, "    %s\n", chain[i].c_str());
            }
        }

    private:
        void emit(InternalLogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(m_mutex);
            std::fprintf(stderr, "[logbeam][%s] %s %s\n",
                         m_name.c_str(), getInternalLogLevelString(level), message.c_str());
        }

        std::string m_name;
        bool m_enableDebug;
        std::mutex m_mutex;
    };

    /// Forwards every diagnostic to a user callback.
    ///
    /// @note The callback is invoked without a lock; it must handle its own
    ///       synchronization, and it should not throw.
    class CallbackInternalLogger : public InternalLogger {
    public:
        using Callback = std::function<void(InternalLogLevel, const std::string&, std::exception_ptr)>;

        explicit CallbackInternalLogger(Callback cb)
            : m_callback(std::move(cb)) {}

        void debug(const std::string& message) override {
            if (m_callback) m_callback(InternalLogLevel::DEBUG, message, nullptr);
        }

        void warn(const std::string& message) override {
            if (m_callback) m_callback(InternalLogLevel::WARN, message, nullptr);
        }

        void error(const std::string& message, std::exception_ptr error) override {
            if (m_callback) m_callback(InternalLogLevel::ERROR, message, error);
        }

    private:
        Callback m_callback;
    };

} // namespace logbeam

#endif // LOGBEAM_INTERNAL_LOGGER_HPP
