#ifndef PIIGUARD_UTIL_UTF8_HPP
#define PIIGUARD_UTIL_UTF8_HPP

#include <string>
#include <vector>
#include <cstddef>
#include <stdexcept>
#include <algorithm>

/**
 * @file utf8.hpp
 * @brief Code-point indexing over UTF-8 std::string.
 *
 * All span offsets in piiguard are Unicode code-point offsets. Text is stored as
 * UTF-8 bytes, so every place that slices text goes through these helpers.
 *
 * Malformed sequences are not rejected: a byte that does not start a well-formed
 * sequence counts as one code point on its own, which keeps offsets total and
 * the splice lossless for arbitrary input.
 */

namespace piiguard {
namespace util {
namespace utf8 {

inline bool isContinuation(unsigned char c)
{
    return (c & 0xC0) == 0x80;
}

/**
 * @brief Length in bytes of the code point starting at @p pos.
 */
inline size_t sequenceLength(const std::string &s, size_t pos)
{
    const unsigned char lead = static_cast<unsigned char>(s[pos]);
    size_t len = 1;
    if (lead >= 0xF0 && lead <= 0xF4) {
        len = 4;
    } else if (lead >= 0xE0) {
        len = (lead <= 0xEF) ? 3 : 1;
    } else if (lead >= 0xC2) {
        len = 2;
    }
    if (pos + len > s.size()) {
        return 1;
    }
    for (size_t i = 1; i < len; ++i) {
        if (!isContinuation(static_cast<unsigned char>(s[pos + i]))) {
            return 1;
        }
    }
    return len;
}

/**
 * @brief Byte offset of every code point start, followed by s.size().
 *
 * boundaries[k] is the byte where code point k begins; boundaries.back() == s.size(),
 * so boundaries.size() - 1 is the code-point length.
 */
inline std::vector<size_t> boundaries(const std::string &s)
{
    std::vector<size_t> result;
    result.reserve(s.size() + 1);
    size_t pos = 0;
    while (pos < s.size()) {
        result.push_back(pos);
        pos += sequenceLength(s, pos);
    }
    result.push_back(s.size());
    return result;
}

inline size_t length(const std::string &s)
{
    size_t count = 0;
    size_t pos = 0;
    while (pos < s.size()) {
        pos += sequenceLength(s, pos);
        ++count;
    }
    return count;
}

/**
 * @brief Code points [cpStart, cpEnd) of @p s.
 * @throw std::out_of_range if the range does not fit.
 */
inline std::string substr(const std::string &s, size_t cpStart, size_t cpEnd)
{
    std::vector<size_t> b = boundaries(s);
    if (cpStart > cpEnd || cpEnd >= b.size()) {
        throw std::out_of_range("utf8::substr: range [" + std::to_string(cpStart) + ","
                                + std::to_string(cpEnd) + ") exceeds length "
                                + std::to_string(b.size() - 1));
    }
    return s.substr(b[cpStart], b[cpEnd] - b[cpStart]);
}

/**
 * @brief First code points of @p s, at most @p maxCodePoints of them.
 */
inline std::string prefix(const std::string &s, size_t maxCodePoints)
{
    size_t pos = 0;
    size_t count = 0;
    while (pos < s.size() && count < maxCodePoints) {
        pos += sequenceLength(s, pos);
        ++count;
    }
    return s.substr(0, pos);
}

/**
 * @brief Convert a byte offset into a code-point offset.
 *
 * A byte offset that falls inside a multi-byte sequence maps to the code point
 * containing it.
 */
inline size_t codePointIndex(const std::vector<size_t> &bounds, size_t byteOffset)
{
    auto it = std::upper_bound(bounds.begin(), bounds.end(), byteOffset);
    if (it == bounds.begin()) {
        return 0;
    }
    return static_cast<size_t>(std::distance(bounds.begin(), it)) - 1;
}

/**
 * @brief Split @p s into one string per code point.
 */
inline std::vector<std::string> codePoints(const std::string &s)
{
    std::vector<std::string> out;
    size_t pos = 0;
    while (pos < s.size()) {
        size_t len = sequenceLength(s, pos);
        out.push_back(s.substr(pos, len));
        pos += len;
    }
    return out;
}

} // namespace utf8
} // namespace util
} // namespace piiguard

#endif // PIIGUARD_UTIL_UTF8_HPP
