#pragma once

#include <charconv>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace kestrel::core {

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

// True when the variable is set, non-empty and does not start with '0'.
inline bool env_flag(const char* name) noexcept {
    auto v = safe_getenv(name);
    return v && !v->empty() && (*v)[0] != '0';
}

// Parses the whole of `text` as a number. Returns std::nullopt on trailing
// garbage, overflow or an empty string.
template <typename T>
inline std::optional<T> parse_number(std::string_view text) noexcept {
    T out{};
    const char* first = text.data();
    const char* last = text.data() + text.size();
    if (first == last) return std::nullopt;
    auto [ptr, ec] = std::from_chars(first, last, out);
    if (ec != std::errc{} || ptr != last) return std::nullopt;
    return out;
}

} // namespace kestrel::core
