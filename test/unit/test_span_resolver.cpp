// test/unit/test_span_resolver.cpp
// -----------------------------------------------------------
// SpanResolver: filtering, overlap resolution and ordering.

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <string>
#include <vector>

#include "core/detected_span.hpp"
#include "core/span_resolver.hpp"

namespace {

using piiguard::core::DetectedSpan;
using piiguard::core::makeSpan;
using piiguard::core::ResolvedSpanSet;
using piiguard::core::SpanResolver;

void expectSortedAndDisjoint(const ResolvedSpanSet& spans) {
    for (size_t i = 1; i < spans.size(); ++i) {
        EXPECT_LE(spans[i - 1].end, spans[i].start) << "spans " << i - 1 << " and " << i << " overlap";
    }
}

TEST(SpanResolverTest, EqualLengthOverlapKeepsHigherScore) {
    SpanResolver resolver;
    std::vector<DetectedSpan> raw = {makeSpan("A", 0, 10, 0.6), makeSpan("B", 5, 15, 0.9)};

    ResolvedSpanSet out = resolver.resolve(20, raw, 0.5);

    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].entityType, "B");
    EXPECT_EQ(out[0].start, 5);
    EXPECT_EQ(out[0].end, 15);
}

TEST(SpanResolverTest, LongerSpanWinsOverlap) {
    SpanResolver resolver;
    std::vector<DetectedSpan> raw = {makeSpan("SHORT", 2, 6, 0.99), makeSpan("LONG", 0, 12, 0.6)};

    ResolvedSpanSet out = resolver.resolve(12, raw, 0.0);

    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].entityType, "LONG");
}

TEST(SpanResolverTest, FullTieBrokenByEntityType) {
    SpanResolver resolver;
    std::vector<DetectedSpan> raw = {makeSpan("ZIP", 0, 5, 0.7), makeSpan("AGE", 0, 5, 0.7)};

    ResolvedSpanSet out = resolver.resolve(5, raw, 0.0);

    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].entityType, "AGE");
}

TEST(SpanResolverTest, OutputSortedByStart) {
    SpanResolver resolver;
    std::vector<DetectedSpan> raw = {makeSpan("C", 30, 35, 0.8), makeSpan("A", 0, 4, 0.8),
                                     makeSpan("B", 10, 20, 0.8)};

    ResolvedSpanSet out = resolver.resolve(40, raw, 0.0);

    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out[0].entityType, "A");
    EXPECT_EQ(out[1].entityType, "B");
    EXPECT_EQ(out[2].entityType, "C");
}

TEST(SpanResolverTest, AdjacentSpansBothKept) {
    SpanResolver resolver;
    std::vector<DetectedSpan> raw = {makeSpan("A", 0, 5, 0.8), makeSpan("B", 5, 9, 0.8)};

    EXPECT_EQ(resolver.resolve(9, raw, 0.0).size(), 2u);
}

TEST(SpanResolverTest, DropsMalformedSpans) {
    SpanResolver resolver;
    const double nan = std::numeric_limits<double>::quiet_NaN();
    std::vector<DetectedSpan> raw = {
        makeSpan("NEG", -1, 3, 0.9),   makeSpan("PAST_END", 5, 11, 0.9), makeSpan("EMPTY", 4, 4, 0.9),
        makeSpan("INVERTED", 6, 2, 0.9), makeSpan("NAN", 0, 2, nan),     makeSpan("HIGH", 0, 2, 1.5),
        makeSpan("OK", 1, 3, 0.9),
    };

    ResolvedSpanSet out = resolver.resolve(10, raw, 0.0);

    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].entityType, "OK");
}

TEST(SpanResolverTest, ThresholdAndTypeFilter) {
    SpanResolver resolver;
    std::vector<DetectedSpan> raw = {makeSpan("PERSON", 0, 4, 0.4), makeSpan("PERSON", 5, 9, 0.5),
                                     makeSpan("URL", 10, 14, 0.9)};

    ResolvedSpanSet out = resolver.resolve(20, raw, 0.5, {"PERSON"});

    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].start, 5);
}

TEST(SpanResolverTest, EmptyInputYieldsEmptySet) {
    SpanResolver resolver;
    EXPECT_TRUE(resolver.resolve(0, {}, 0.5).empty());
    EXPECT_TRUE(resolver.resolve(0, {makeSpan("A", 0, 1, 0.9)}, 0.0).empty());
}

TEST(SpanResolverTest, NonOverlapAndIdempotenceOnDenseInput) {
    SpanResolver resolver;
    std::vector<DetectedSpan> raw;
    // Deterministic dense pattern of overlapping spans with varied lengths and scores.
    for (int i = 0; i < 60; ++i) {
        const int start = (i * 7) % 50;
        const int len = 1 + (i * 3) % 9;
        const double score = 0.3 + 0.01 * ((i * 13) % 70);
        raw.push_back(makeSpan(i % 2 ? "EVEN" : "ODD", start, start + len, score));
    }

    ResolvedSpanSet once = resolver.resolve(60, raw, 0.35);
    expectSortedAndDisjoint(once);
    EXPECT_FALSE(once.empty());
    EXPECT_TRUE(piiguard::core::isResolved(once));

    ResolvedSpanSet twice = resolver.resolve(60, once, 0.35);
    EXPECT_EQ(once, twice);

    // Same input in another order gives the same result.
    std::vector<DetectedSpan> reversed(raw.rbegin(), raw.rend());
    EXPECT_EQ(resolver.resolve(60, reversed, 0.35), once);
}

} // namespace
