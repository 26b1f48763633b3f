#ifndef PIIGUARD_CORE_DETECTED_SPAN_HPP
#define PIIGUARD_CORE_DETECTED_SPAN_HPP

#include <string>
#include <vector>
#include <cstdint>
#include "../util/utf8.hpp"

/**
 * @file detected_span.hpp
 * @brief The canonical detected-entity record shared by recognizers, resolver,
 *        transformer and statistics.
 *
 * Offsets are Unicode code-point offsets into the UTF-8 text, half-open [start, end).
 * Recognizers, the resolver and the transformer all use this one type; there is no
 * second "result" shape to translate between.
 */

namespace piiguard {
namespace core {

/**
 * @struct DetectedSpan
 * @brief One entity detection: type, code-point range, confidence and covered text.
 *
 * start/end are signed so that malformed detections (negative offsets) can be
 * represented and then rejected by the resolver instead of wrapping around.
 */
struct DetectedSpan
{
    std::string entityType;
    int64_t start = 0;
    int64_t end = 0;
    double score = 0.0;
    std::string sourceText;   ///< Code points [start, end) of the analyzed text, when known.

    int64_t length() const { return end - start; }

    bool overlaps(const DetectedSpan &other) const
    {
        return start < other.end && other.start < end;
    }

    bool operator==(const DetectedSpan &other) const
    {
        return entityType == other.entityType && start == other.start
            && end == other.end && score == other.score
            && sourceText == other.sourceText;
    }

    bool operator!=(const DetectedSpan &other) const { return !(*this == other); }
};

/**
 * @brief Ordered, non-overlapping spans: spans[i].end <= spans[i+1].start.
 *
 * Only SpanResolver::resolve builds one from raw detections.
 */
using ResolvedSpanSet = std::vector<DetectedSpan>;

/**
 * @brief Build a span without source text (as a recognizer reports it).
 */
inline DetectedSpan makeSpan(const std::string &entityType, int64_t start, int64_t end, double score)
{
    DetectedSpan span;
    span.entityType = entityType;
    span.start = start;
    span.end = end;
    span.score = score;
    return span;
}

/**
 * @brief Fill sourceText of every span from @p text.
 *
 * Spans must already be in range; the resolver guarantees that.
 */
inline void attachSourceText(const std::string &text, ResolvedSpanSet &spans)
{
    if (spans.empty()) {
        return;
    }
    std::vector<size_t> bounds = util::utf8::boundaries(text);
    for (auto &span : spans) {
        size_t from = bounds[static_cast<size_t>(span.start)];
        size_t to = bounds[static_cast<size_t>(span.end)];
        span.sourceText = text.substr(from, to - from);
    }
}

} // namespace core
} // namespace piiguard

#endif // PIIGUARD_CORE_DETECTED_SPAN_HPP
