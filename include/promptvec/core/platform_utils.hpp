#pragma once

#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>

namespace promptvec::core {

// Cross-platform safe getenv wrapper.
// - Windows: uses _dupenv_s and frees the allocated buffer
// - POSIX/others: uses std::getenv (read-only)
// Returns std::nullopt if the variable is not set. If set but empty, returns an
// engaged optional with an empty string.
inline std::optional<std::string> safe_getenv(const char* name) noexcept {
    if (name == nullptr || *name == '\0') return std::nullopt;
#if defined(_WIN32)
    char* buf = nullptr;
    size_t len = 0;
    const errno_t err = _dupenv_s(&buf, &len, name);
    if (err != 0 || buf == nullptr) {
        if (buf) std::free(buf);
        return std::nullopt;
    }
    std::string value(buf);
    std::free(buf);
    return value;
#else
    const char* v = std::getenv(name);
    if (!v) return std::nullopt;
    return std::string(v);
#endif
}

inline std::optional<std::string> getenv_nonempty(const char* key) noexcept {
    auto v = safe_getenv(key);
    if (v && !v->empty()) return v;
    return std::nullopt;
}

// Accepts 1/0 and case-insensitive true/false; anything else reads as false.
inline bool parse_bool_ci(std::string_view s) noexcept {
    auto eq_ci = [](char a, char b){
        if (a >= 'A' && a <= 'Z') a = static_cast<char>(a - 'A' + 'a');
        if (b >= 'A' && b <= 'Z') b = static_cast<char>(b - 'A' + 'a');
        return a == b;
    };
    if (s.size() == 1 && (s[0] == '1' || s[0] == '0')) return s[0] == '1';
    if (s.size() == 4 && eq_ci(s[0],'t') && eq_ci(s[1],'r') && eq_ci(s[2],'u') && eq_ci(s[3],'e')) return true;
    return false;
}

} // namespace promptvec::core
