#ifndef LOGBEAM_EXCEPTION_INFO_HPP
#define LOGBEAM_EXCEPTION_INFO_HPP

#include <string>
#include <vector>
#include <exception>
#include <typeinfo>
#include <cstdlib>

#if defined(__GNUC__) || defined(__clang__)
#include <cxxabi.h>
#endif

namespace logbeam {
namespace detail {

    // abi::__cxa_demangle allocates, but this only runs when an error is
    // being reported, never per message.
    inline std::string demangleTypeName(const char* mangledName) {
        if (!mangledName) return "unknown";
#if defined(__GNUC__) || defined(__clang__)
        int status = 0;
        char* demangled = abi::__cxa_demangle(mangledName, nullptr, nullptr, &status);
        if (status == 0 && demangled) {
            std::string result(demangled);
            std::free(demangled);
            return result;
        }
        std::free(demangled);
        return std::string(mangledName);
#else
        return std::string(mangledName);
#endif
    }

    inline const char* safeWhat(const std::exception& ex) {
        const char* msg = ex.what();
        return msg ? msg : "(no message)";
    }

    // Cap nested exception unwinding so a pathological chain cannot blow
    // the stack of the writer thread.
    static constexpr int kMaxNestedExceptionDepth = 20;

    inline std::string describeException(const std::exception& ex) {
        return demangleTypeName(typeid(ex).name()) + ": " + safeWhat(ex);
    }

    inline void unwindNestedExceptions(const std::exception& ex,
                                       std::vector<std::string>& lines, int depth) {
        if (depth >= kMaxNestedExceptionDepth) return;

        try {
            std::rethrow_if_nested(ex);
        } catch (const std::exception& nested) {
            lines.push_back("caused by " + describeException(nested));
            unwindNestedExceptions(nested, lines, depth + 1);
        } catch (...) {
            lines.push_back("caused by unknown exception");
        }
    }

    /// Flattens an exception and its nested causes into one line per level,
    /// outermost first. This is what the statistics report as the "stack
    /// trace" of the last error. Empty for a null pointer.
    inline std::vector<std::string> exceptionChain(std::exception_ptr ep) {
        std::vector<std::string> lines;
        if (!ep) return lines;

        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& ex) {
            lines.push_back(describeException(ex));
            unwindNestedExceptions(ex, lines, 0);
        } catch (...) {
            lines.push_back("unknown exception");
        }
        return lines;
    }

    /// Returns the innermost std::exception message in the chain. Used when a
    /// log line wants the original cause rather than the wrapper.
    inline std::string rootCauseMessage(std::exception_ptr ep) {
        std::vector<std::string> chain = exceptionChain(ep);
        if (chain.empty()) return std::string();
        const std::string& last = chain.back();
        std::size_t sep = last.find(": ");
        return (sep == std::string::npos) ? last : last.substr(sep + 2);
    }

} // namespace detail
} // namespace logbeam

#endif // LOGBEAM_EXCEPTION_INFO_HPP
