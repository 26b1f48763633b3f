#ifndef PIIGUARD_CORE_SPAN_RESOLVER_HPP
#define PIIGUARD_CORE_SPAN_RESOLVER_HPP

#include <string>
#include <vector>
#include <map>
#include <iterator>
#include <unordered_set>
#include <algorithm>
#include <cmath>
#include "detected_span.hpp"
#include "../util/logger.hpp"

/**
 * @file span_resolver.hpp
 * @brief Turns raw, possibly overlapping recognizer output into a ResolvedSpanSet.
 *
 * DESIGN:
 *   1. Filter. A span is dropped (never an error) when
 *        - its score is below the threshold, or is not a number within [0,1],
 *        - a type restriction is given and its entityType is not in it,
 *        - start < 0, end > textLength or start >= end.
 *   2. Rank. Surviving spans are ranked for overlap resolution:
 *        longer (end - start) first, then higher score, then smaller start,
 *        then entityType in lexicographic order.
 *   3. Select. Walk the ranking and accept a span only if it overlaps nothing
 *      accepted so far. Losers are dropped, never merged.
 *   4. Order. Accepted spans are returned sorted by start.
 *
 * The ranking is a strict total order on distinct spans, so identical inputs give
 * identical output, and feeding the output back in returns it unchanged.
 *
 * USAGE:
 *   @code
 *   SpanResolver resolver;
 *   ResolvedSpanSet clean = resolver.resolve(utf8::length(text), raw, 0.5, {"PERSON"});
 *   @endcode
 */

namespace piiguard {
namespace core {

/**
 * @brief Overlap-resolution priority: true when @p a beats @p b.
 */
inline bool spanPriorityLess(const DetectedSpan &a, const DetectedSpan &b)
{
    if (a.length() != b.length()) {
        return a.length() > b.length();
    }
    if (a.score != b.score) {
        return a.score > b.score;
    }
    if (a.start != b.start) {
        return a.start < b.start;
    }
    return a.entityType < b.entityType;
}

/**
 * @brief Output order of a ResolvedSpanSet.
 */
inline bool spanStartLess(const DetectedSpan &a, const DetectedSpan &b)
{
    if (a.start != b.start) {
        return a.start < b.start;
    }
    return spanPriorityLess(a, b);
}

/**
 * @brief True when @p spans is sorted by start and free of overlaps.
 */
inline bool isResolved(const ResolvedSpanSet &spans)
{
    for (size_t i = 1; i < spans.size(); ++i) {
        if (spans[i - 1].end > spans[i].start) {
            return false;
        }
    }
    return true;
}

class SpanResolver
{
public:
    SpanResolver() = default;

    /**
     * @brief Validate, deduplicate and order raw detections.
     * @param textLength Length of the analyzed text in code points.
     * @param rawSpans Recognizer output, any order.
     * @param scoreThreshold Minimum accepted score.
     * @param allowedEntityTypes Type restriction; empty means every type is allowed.
     */
    ResolvedSpanSet resolve(size_t textLength,
                            const std::vector<DetectedSpan> &rawSpans,
                            double scoreThreshold,
                            const std::vector<std::string> &allowedEntityTypes = {}) const
    {
        const std::unordered_set<std::string> allowed(allowedEntityTypes.begin(),
                                                      allowedEntityTypes.end());

        std::vector<DetectedSpan> candidates;
        candidates.reserve(rawSpans.size());
        size_t malformed = 0;
        size_t belowThreshold = 0;
        size_t filteredType = 0;

        for (const auto &span : rawSpans) {
            if (span.start < 0 || span.end <= span.start
                || span.end > static_cast<int64_t>(textLength)
                || std::isnan(span.score) || span.score < 0.0 || span.score > 1.0) {
                ++malformed;
                util::logger::debug("SpanResolver: dropping malformed span " + span.entityType
                                    + " [" + std::to_string(span.start) + ","
                                    + std::to_string(span.end) + ")");
                continue;
            }
            if (span.score < scoreThreshold) {
                ++belowThreshold;
                continue;
            }
            if (!allowed.empty() && allowed.find(span.entityType) == allowed.end()) {
                ++filteredType;
                continue;
            }
            candidates.push_back(span);
        }

        std::sort(candidates.begin(), candidates.end(), spanPriorityLess);

        // accepted intervals keyed by start
        std::map<int64_t, int64_t> occupied;
        ResolvedSpanSet accepted;
        accepted.reserve(candidates.size());

        for (const auto &span : candidates) {
            if (collides(occupied, span)) {
                continue;
            }
            occupied.emplace(span.start, span.end);
            accepted.push_back(span);
        }

        std::sort(accepted.begin(), accepted.end(), spanStartLess);

        util::logger::debug("SpanResolver: kept " + std::to_string(accepted.size()) + " of "
                            + std::to_string(rawSpans.size()) + " spans (malformed="
                            + std::to_string(malformed) + ", below threshold="
                            + std::to_string(belowThreshold) + ", type filtered="
                            + std::to_string(filteredType) + ", overlapping="
                            + std::to_string(candidates.size() - accepted.size()) + ")");
        return accepted;
    }

private:
    static bool collides(const std::map<int64_t, int64_t> &occupied, const DetectedSpan &span)
    {
        auto next = occupied.lower_bound(span.start);
        if (next != occupied.end() && next->first < span.end) {
            return true;
        }
        if (next != occupied.begin()) {
            auto prev = std::prev(next);
            if (prev->second > span.start) {
                return true;
            }
        }
        return false;
    }
};

} // namespace core
} // namespace piiguard

#endif // PIIGUARD_CORE_SPAN_RESOLVER_HPP
