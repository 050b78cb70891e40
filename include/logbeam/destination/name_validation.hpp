#ifndef LOGBEAM_NAME_VALIDATION_HPP
#define LOGBEAM_NAME_VALIDATION_HPP

#include <string>
#include <cstring>
#include <cstddef>

namespace logbeam {
namespace detail {

    inline bool isAsciiAlnum(char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
    }

    /// True if `name` is minLength..maxLength bytes long and made only of
    /// ASCII letters, digits and the characters in `extraChars`.
    inline bool isValidResourceName(const std::string& name, const char* extraChars,
                                    size_t minLength, size_t maxLength) {
        if (name.size() < minLength || name.size() > maxLength) return false;
        for (size_t i = 0; i < name.size(); ++i) {
            char c = name[i];
            if (isAsciiAlnum(c)) continue;
            if (c != '\0' && std::strchr(extraChars, c) != nullptr) continue;
            return false;
        }
        return true;
    }

    inline bool isBlank(const std::string& value) {
        return value.find_first_not_of(" \t\r\n") == std::string::npos;
    }

} // namespace detail
} // namespace logbeam

#endif // LOGBEAM_NAME_VALIDATION_HPP
