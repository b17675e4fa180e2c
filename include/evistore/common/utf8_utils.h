#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace evistore::common {

namespace detail {

// Length of the well-formed UTF-8 sequence starting at data[i], or 0 if it is ill-formed.
// Follows the RFC 3629 table, so overlong forms and surrogates are rejected.
inline size_t utf8SequenceLength(const unsigned char* data, size_t i, size_t n) {
    const unsigned char c = data[i];
    if (c < 0x80)
        return 1;

    auto cont = [&](size_t off, unsigned char lo = 0x80, unsigned char hi = 0xBF) {
        return i + off < n && data[i + off] >= lo && data[i + off] <= hi;
    };

    if (c >= 0xC2 && c <= 0xDF)
        return cont(1) ? 2 : 0;
    if (c == 0xE0)
        return cont(1, 0xA0) && cont(2) ? 3 : 0;
    if ((c >= 0xE1 && c <= 0xEC) || c == 0xEE || c == 0xEF)
        return cont(1) && cont(2) ? 3 : 0;
    if (c == 0xED)
        return cont(1, 0x80, 0x9F) && cont(2) ? 3 : 0;
    if (c == 0xF0)
        return cont(1, 0x90) && cont(2) && cont(3) ? 4 : 0;
    if (c >= 0xF1 && c <= 0xF3)
        return cont(1) && cont(2) && cont(3) ? 4 : 0;
    if (c == 0xF4)
        return cont(1, 0x80, 0x8F) && cont(2) && cont(3) ? 4 : 0;
    return 0;
}

} // namespace detail

inline bool isValidUtf8(std::string_view input) {
    const auto* data = reinterpret_cast<const unsigned char*>(input.data());
    const size_t n = input.size();
    size_t i = 0;
    while (i < n) {
        size_t len = detail::utf8SequenceLength(data, i, n);
        if (len == 0)
            return false;
        i += len;
    }
    return true;
}

// Replace invalid UTF-8 byte sequences with '?' so the text survives JSON serialization.
inline std::string sanitizeUtf8(std::string_view input) {
    std::string out;
    out.reserve(input.size());

    const auto* data = reinterpret_cast<const unsigned char*>(input.data());
    const size_t n = input.size();
    size_t i = 0;
    while (i < n) {
        size_t len = detail::utf8SequenceLength(data, i, n);
        if (len == 0) {
            out.push_back('?');
            ++i;
            continue;
        }
        out.append(input.substr(i, len));
        i += len;
    }

    return out;
}

} // namespace evistore::common
