#ifndef PIIGUARD_RECOGNIZERS_PATTERN_RECOGNIZER_HPP
#define PIIGUARD_RECOGNIZERS_PATTERN_RECOGNIZER_HPP

#include <string>
#include <vector>
#include <regex>
#include <functional>
#include <unordered_set>
#include <set>
#include <utility>
#include <cstddef>
#include <cctype>
#include "recognizer.hpp"
#include "../core/errors.hpp"
#include "../util/utf8.hpp"
#include "../util/logger.hpp"

/**
 * @file pattern_recognizer.hpp
 * @brief A regex-based recognizer for structured identifiers.
 *
 * DESIGN GOALS:
 *   - Serve as the built-in Recognizer when no remote analyzer is configured,
 *     and as a deterministic collaborator in tests.
 *   - Cover the entity types that have a reliable surface form: e-mail addresses,
 *     US phone numbers, US SSNs, payment card numbers (Luhn-checked), IPv4
 *     addresses and http(s) URLs. Names and locations need a statistical model
 *     and are left to a remote analyzer.
 *   - Report code-point offsets: std::regex matches on bytes, so match positions
 *     are converted through util::utf8 before leaving this class.
 *   - Never hand std::regex unbounded input: matching runs over whitespace-aligned
 *     windows, and a token longer than kMaxTokenBytes is not scanned.
 *
 * USAGE EXAMPLE:
 *   @code
 *   using namespace piiguard::recognizers;
 *   PatternRecognizer recognizer;
 *   auto spans = recognizer.detect("Mail jane@example.org", {}, "en", 0.0);
 *   // spans[0].entityType == "EMAIL_ADDRESS", start == 5, end == 21
 *   @endcode
 */

namespace piiguard {
namespace recognizers {

/**
 * @class PatternRecognizer
 * @brief Finds structured PII with regular expressions; thread-safe after construction.
 */
class PatternRecognizer : public Recognizer
{
public:
    PatternRecognizer()
    {
        // Scores reflect how specific each surface form is.
        patterns_.push_back({ "EMAIL_ADDRESS",
            std::regex(R"(\b[A-Za-z0-9._%+\-]+@[A-Za-z0-9\-]+(\.[A-Za-z0-9\-]+)*\.[A-Za-z]{2,}\b)"),
            1.0, nullptr });
        patterns_.push_back({ "US_SSN",
            std::regex(R"(\b\d{3}-\d{2}-\d{4}\b)"),
            0.85, nullptr });
        patterns_.push_back({ "PHONE_NUMBER",
            std::regex(R"((\(\d{3}\)\s?|\b\d{3}[-.\s])\d{3}[-.]\d{4}\b)"),
            0.75, nullptr });
        patterns_.push_back({ "CREDIT_CARD",
            std::regex(R"(\b\d(?:[ -]?\d){12,18}\b)"),
            1.0, &PatternRecognizer::passesLuhn });
        patterns_.push_back({ "IP_ADDRESS",
            std::regex(R"(\b\d{1,3}\.\d{1,3}\.\d{1,3}\.\d{1,3}\b)"),
            0.95, &PatternRecognizer::isIpv4 });
        patterns_.push_back({ "URL",
            std::regex(R"(\bhttps?://[^\s<>"']+)"),
            0.6, nullptr });
    }

    std::vector<core::DetectedSpan> detect(const std::string &text,
                                           const std::vector<std::string> &entityTypes,
                                           const std::string &language,
                                           double scoreThreshold) const override
    {
        if (language != kLanguage) {
            throw core::UpstreamError("PatternRecognizer: language '" + language + "' is not supported");
        }

        const std::unordered_set<std::string> wanted(entityTypes.begin(), entityTypes.end());
        const std::vector<size_t> bounds = util::utf8::boundaries(text);
        const std::vector<Window> windows = splitWindows(text);
        std::vector<core::DetectedSpan> spans;

        for (const auto &pattern : patterns_) {
            if (!wanted.empty() && wanted.find(pattern.entityType) == wanted.end()) {
                continue;
            }
            if (pattern.score < scoreThreshold) {
                continue;
            }
            // Overlapping windows report the same match twice.
            std::set<std::pair<size_t, size_t>> seen;
            for (const Window &window : windows) {
                auto first = text.begin() + static_cast<std::ptrdiff_t>(window.begin);
                auto last = text.begin() + static_cast<std::ptrdiff_t>(window.end);
                for (std::sregex_iterator it(first, last, pattern.regex), end; it != end; ++it) {
                    const std::smatch &m = *it;
                    const size_t byteStart = window.begin + static_cast<size_t>(m.position(0));
                    const size_t byteEnd = byteStart + static_cast<size_t>(m.length(0));
                    // May be cut short by the window edge; the next window sees all of it.
                    if (!window.lastInRun && byteEnd == window.end) {
                        continue;
                    }
                    if (!seen.insert(std::make_pair(byteStart, byteEnd)).second) {
                        continue;
                    }
                    const std::string matched = m.str();
                    if (pattern.check && !pattern.check(matched)) {
                        continue;
                    }
                    core::DetectedSpan span = core::makeSpan(
                        pattern.entityType,
                        static_cast<int64_t>(util::utf8::codePointIndex(bounds, byteStart)),
                        static_cast<int64_t>(util::utf8::codePointIndex(bounds, byteEnd)),
                        pattern.score);
                    span.sourceText = matched;
                    spans.push_back(std::move(span));
                }
            }
        }

        util::logger::debug("PatternRecognizer: " + std::to_string(spans.size()) + " raw detections");
        return spans;
    }

    std::vector<std::string> supportedEntityTypes(const std::string &language) const override
    {
        std::vector<std::string> types;
        if (language != kLanguage) {
            return types;
        }
        for (const auto &pattern : patterns_) {
            types.push_back(pattern.entityType);
        }
        return types;
    }

    std::string name() const override { return "pattern"; }

    /**
     * @brief Luhn checksum over the digits of @p candidate (separators ignored).
     */
    static bool passesLuhn(const std::string &candidate)
    {
        int sum = 0;
        int digits = 0;
        bool doubleIt = false;
        for (auto it = candidate.rbegin(); it != candidate.rend(); ++it) {
            if (!std::isdigit(static_cast<unsigned char>(*it))) {
                continue;
            }
            int d = *it - '0';
            if (doubleIt) {
                d *= 2;
                if (d > 9) d -= 9;
            }
            sum += d;
            doubleIt = !doubleIt;
            ++digits;
        }
        return digits >= 13 && digits <= 19 && sum % 10 == 0;
    }

    /**
     * @brief Dotted quad with every octet in 0..255.
     */
    static bool isIpv4(const std::string &candidate)
    {
        size_t pos = 0;
        for (int octet = 0; octet < 4; ++octet) {
            size_t dot = candidate.find('.', pos);
            std::string part = candidate.substr(pos, dot == std::string::npos ? std::string::npos : dot - pos);
            if (part.empty() || part.size() > 3 || std::stoi(part) > 255) {
                return false;
            }
            pos = (dot == std::string::npos) ? candidate.size() : dot + 1;
        }
        return true;
    }

    /// Longest whitespace-free token handed to std::regex; longer tokens are skipped.
    static constexpr size_t kMaxTokenBytes = 512;
    /// Upper bound on the bytes matched in one std::regex call.
    static constexpr size_t kWindowBytes = 4096;
    /// Consecutive windows share this tail, enough to hold any single match.
    static constexpr size_t kWindowOverlapBytes = kMaxTokenBytes + 64;

private:
    static constexpr const char *kLanguage = "en";

    /// Byte range [begin, end) starting and ending on token boundaries.
    struct Window
    {
        size_t begin;
        size_t end;
        bool lastInRun;
    };

    static bool isSpace(char c)
    {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    }

    /**
     * @brief Cut @p text into bounded windows for matching.
     *
     * libstdc++ std::regex recurses once per repeated character, so a single long
     * run of non-space bytes can exhaust the stack. Tokens over kMaxTokenBytes are
     * dropped and split the text into runs; each run is covered by windows of at
     * most kWindowBytes that overlap by kWindowOverlapBytes. Window edges always
     * fall on whitespace, so patterns that allow inner spaces still match.
     */
    static std::vector<Window> splitWindows(const std::string &text)
    {
        std::vector<Window> windows;
        std::vector<std::pair<size_t, size_t>> run;
        size_t skipped = 0;

        auto flush = [&windows, &run]() {
            size_t i = 0;
            while (i < run.size()) {
                size_t j = i;
                while (j + 1 < run.size() && run[j + 1].second - run[i].first <= kWindowBytes) {
                    ++j;
                }
                const bool last = (j + 1 == run.size());
                windows.push_back({ run[i].first, run[j].second, last });
                if (last) {
                    break;
                }
                const size_t end = run[j].second;
                const size_t resume = end > kWindowOverlapBytes ? end - kWindowOverlapBytes : 0;
                size_t next = i + 1;
                while (next < j && run[next].first < resume) {
                    ++next;
                }
                i = next;
            }
            run.clear();
        };

        size_t pos = 0;
        while (pos < text.size()) {
            while (pos < text.size() && isSpace(text[pos])) {
                ++pos;
            }
            if (pos == text.size()) {
                break;
            }
            const size_t start = pos;
            while (pos < text.size() && !isSpace(text[pos])) {
                ++pos;
            }
            if (pos - start > kMaxTokenBytes) {
                ++skipped;
                flush();
            } else {
                run.emplace_back(start, pos);
            }
        }
        flush();

        if (skipped > 0) {
            util::logger::debug("PatternRecognizer: skipped " + std::to_string(skipped)
                                + " token(s) longer than " + std::to_string(kMaxTokenBytes) + " bytes");
        }
        return windows;
    }

    struct Pattern
    {
        std::string entityType;
        std::regex regex;
        double score;
        std::function<bool(const std::string &)> check;
    };

    std::vector<Pattern> patterns_;
};

} // namespace recognizers
} // namespace piiguard

#endif // PIIGUARD_RECOGNIZERS_PATTERN_RECOGNIZER_HPP
