#ifndef LOGBEAM_LOG_COMMON_HPP
#define LOGBEAM_LOG_COMMON_HPP

#include <string>
#include <chrono>
#include <sstream>
#include <iomanip>
#include <memory>
#include <utility>
#include <ctime>
#include <cstdint>

namespace logbeam {
namespace detail {

#if __cplusplus < 201402L
    template<typename T, typename... Args>
    std::unique_ptr<T> make_unique(Args&&... args) {
        return std::unique_ptr<T>(new T(std::forward<Args>(args)...));
    }
#else
    using std::make_unique;
#endif

    /// Wall-clock time in milliseconds since the epoch. Message timestamps
    /// and error timestamps use this clock.
    inline std::int64_t currentTimeMillis() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }

    /// Monotonic milliseconds, used for deadlines and elapsed-time checks so
    /// that wall-clock adjustments cannot stretch or cut a wait.
    inline std::int64_t monotonicMillis() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now().time_since_epoch()).count();
    }

    inline std::string formatTimestamp(std::int64_t millis) {
        std::time_t seconds = static_cast<std::time_t>(millis / 1000);
        std::tm tmBuf;
#ifdef _WIN32
        gmtime_s(&tmBuf, &seconds);
#else
        gmtime_r(&seconds, &tmBuf);
#endif
        std::ostringstream oss;
        oss << std::put_time(&tmBuf, "%Y-%m-%dT%H:%M:%S");
        oss << '.' << std::setfill('0') << std::setw(3) << (millis % 1000) << 'Z';
        return oss.str();
    }

} // namespace detail
} // namespace logbeam

#endif // LOGBEAM_LOG_COMMON_HPP
