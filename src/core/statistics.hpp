#ifndef PIIGUARD_CORE_STATISTICS_HPP
#define PIIGUARD_CORE_STATISTICS_HPP

#include <string>
#include <map>
#include <cmath>
#include "detected_span.hpp"

namespace piiguard {
namespace core {

// Bucket edges are a reporting convention, not a detection parameter.
constexpr double kHighConfidence = 0.8;
constexpr double kMediumConfidence = 0.5;

struct ConfidenceBuckets
{
    size_t high = 0;    ///< score >= 0.8
    size_t medium = 0;  ///< 0.5 <= score < 0.8
    size_t low = 0;     ///< score < 0.5
};

struct AnalysisStatistics
{
    size_t totalEntities = 0;
    std::map<std::string, size_t> entityCounts;
    double averageConfidence = 0.0;  ///< rounded to 3 decimals, 0 when empty
    ConfidenceBuckets buckets;
};

inline double roundTo3(double value)
{
    return std::round(value * 1000.0) / 1000.0;
}

/**
 * @brief Count and score summary of a span set. Pure.
 */
inline AnalysisStatistics summarize(const ResolvedSpanSet &spans)
{
    AnalysisStatistics stats;
    if (spans.empty()) {
        return stats;
    }

    double sum = 0.0;
    for (const auto &span : spans) {
        ++stats.entityCounts[span.entityType];
        sum += span.score;
        if (span.score >= kHighConfidence) {
            ++stats.buckets.high;
        } else if (span.score >= kMediumConfidence) {
            ++stats.buckets.medium;
        } else {
            ++stats.buckets.low;
        }
    }
    stats.totalEntities = spans.size();
    stats.averageConfidence = roundTo3(sum / static_cast<double>(spans.size()));
    return stats;
}

} // namespace core
} // namespace piiguard

#endif // PIIGUARD_CORE_STATISTICS_HPP
