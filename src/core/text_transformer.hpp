#ifndef PIIGUARD_CORE_TEXT_TRANSFORMER_HPP
#define PIIGUARD_CORE_TEXT_TRANSFORMER_HPP

#include <string>
#include <vector>
#include <algorithm>
#include "detected_span.hpp"
#include "span_resolver.hpp"
#include "operator_registry.hpp"
#include "errors.hpp"
#include "../util/utf8.hpp"
#include "../util/cipher.hpp"
#include "../util/logger.hpp"

/**
 * @file text_transformer.hpp
 * @brief Rewrites text under a ResolvedSpanSet and records what was rewritten.
 *
 * The splice is a single left-to-right pass: copy the untouched gap before a span
 * verbatim, append the span's replacement, move on; finally copy the tail. Because the
 * output is built in input order, nothing is ever re-indexed and every byte outside the
 * spans survives unchanged.
 *
 * Each AnonymizationItem keeps the span's ORIGINAL offsets. It also records where the
 * replacement landed in the output (anonymizedStart/End), which deanonymize() uses to
 * find encrypted tokens again.
 */

namespace piiguard {
namespace core {

/**
 * @struct AnonymizationItem
 * @brief Audit record of one applied rewrite. Offsets are code points.
 */
struct AnonymizationItem
{
    std::string entityType;
    int64_t originalStart = 0;
    int64_t originalEnd = 0;
    std::string strategy;
    std::string originalText;
    std::string replacementText;
    int64_t anonymizedStart = 0;
    int64_t anonymizedEnd = 0;
};

struct TransformResult
{
    std::string text;
    std::vector<AnonymizationItem> items;
};

class TextTransformer
{
public:
    explicit TextTransformer(const OperatorRegistry &registry)
        : registry_(registry)
    {
    }

    /**
     * @brief Anonymize @p text under @p spans and @p policy.
     * @throw ValidationError if @p spans is not a resolved set within the text.
     * @throw ConfigError if a span has no usable operator.
     */
    TransformResult transform(const std::string &text,
                              const ResolvedSpanSet &spans,
                              const PolicyTable &policy) const
    {
        TransformResult result;
        if (text.empty()) {
            return result;
        }
        if (spans.empty()) {
            result.text = text;
            return result;
        }

        const std::vector<size_t> bounds = util::utf8::boundaries(text);
        const int64_t textLength = static_cast<int64_t>(bounds.size() - 1);
        if (!isResolved(spans) || spans.front().start < 0 || spans.back().end > textLength) {
            throw ValidationError("TextTransformer: spans must be sorted, non-overlapping and within the text");
        }

        result.text.reserve(text.size());
        result.items.reserve(spans.size());

        int64_t cursor = 0;     // code points of the input consumed
        int64_t outLength = 0;  // code points written

        for (const auto &span : spans) {
            if (span.start >= span.end) {
                throw ValidationError("TextTransformer: empty span for '" + span.entityType + "'");
            }
            const size_t gapFrom = bounds[static_cast<size_t>(cursor)];
            const size_t spanFrom = bounds[static_cast<size_t>(span.start)];
            const size_t spanTo = bounds[static_cast<size_t>(span.end)];

            result.text.append(text, gapFrom, spanFrom - gapFrom);
            outLength += span.start - cursor;

            const std::string original = text.substr(spanFrom, spanTo - spanFrom);
            const OperatorConfig &op = resolveOperator(span.entityType, policy);
            std::string replacement = registry_.apply(op, original, span);

            AnonymizationItem item;
            item.entityType = span.entityType;
            item.originalStart = span.start;
            item.originalEnd = span.end;
            item.strategy = strategyName(op.strategy);
            item.originalText = original;
            item.anonymizedStart = outLength;
            outLength += static_cast<int64_t>(util::utf8::length(replacement));
            item.anonymizedEnd = outLength;

            result.text += replacement;
            item.replacementText = std::move(replacement);
            result.items.push_back(std::move(item));

            cursor = span.end;
        }

        const size_t tailFrom = bounds[static_cast<size_t>(cursor)];
        result.text.append(text, tailFrom, std::string::npos);

        util::logger::debug("TextTransformer: applied " + std::to_string(result.items.size())
                            + " rewrites");
        return result;
    }

    /**
     * @brief Reverse the "encrypt" rewrites of a previous transform().
     *
     * Every encrypt item's token is read back from @p anonymizedText at
     * [anonymizedStart, anonymizedEnd), decrypted and spliced in. Items of other
     * strategies are one-way and stay as they are.
     *
     * @param key AES key; empty uses the registry's service key.
     * @throw ValidationError on out-of-range items or tokens that do not decrypt.
     * @throw ConfigError if no usable key is available.
     */
    std::string deanonymize(const std::string &anonymizedText,
                            const std::vector<AnonymizationItem> &items,
                            const std::string &key = std::string()) const
    {
        std::vector<const AnonymizationItem*> encrypted;
        for (const auto &item : items) {
            if (item.strategy == strategyName(Strategy::Encrypt)) {
                encrypted.push_back(&item);
            }
        }
        if (encrypted.empty()) {
            return anonymizedText;
        }
        std::sort(encrypted.begin(), encrypted.end(),
                  [](const AnonymizationItem *a, const AnonymizationItem *b) {
                      return a->anonymizedStart < b->anonymizedStart;
                  });

        DetectedSpan keyProbe;
        keyProbe.entityType = encrypted.front()->entityType;
        const std::string effectiveKey = registry_.encryptionKey(OperatorConfig::encrypt(key), keyProbe);

        const std::vector<size_t> bounds = util::utf8::boundaries(anonymizedText);
        const int64_t textLength = static_cast<int64_t>(bounds.size() - 1);

        std::string out;
        out.reserve(anonymizedText.size());
        int64_t cursor = 0;
        for (const AnonymizationItem *item : encrypted) {
            if (item->anonymizedStart < cursor || item->anonymizedEnd < item->anonymizedStart
                || item->anonymizedEnd > textLength) {
                throw ValidationError("TextTransformer: item for '" + item->entityType
                                      + "' does not fit the anonymized text");
            }
            const size_t gapFrom = bounds[static_cast<size_t>(cursor)];
            const size_t tokenFrom = bounds[static_cast<size_t>(item->anonymizedStart)];
            const size_t tokenTo = bounds[static_cast<size_t>(item->anonymizedEnd)];
            out.append(anonymizedText, gapFrom, tokenFrom - gapFrom);

            const std::string token = anonymizedText.substr(tokenFrom, tokenTo - tokenFrom);
            try {
                out += util::cipher::decrypt(token, effectiveKey);
            } catch (const std::exception &ex) {
                throw ValidationError("TextTransformer: cannot decrypt '" + item->entityType
                                      + "' at " + std::to_string(item->anonymizedStart) + ": " + ex.what());
            }
            cursor = item->anonymizedEnd;
        }
        out.append(anonymizedText, bounds[static_cast<size_t>(cursor)], std::string::npos);
        return out;
    }

private:
    const OperatorRegistry &registry_;
};

} // namespace core
} // namespace piiguard

#endif // PIIGUARD_CORE_TEXT_TRANSFORMER_HPP
