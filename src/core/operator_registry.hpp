#ifndef PIIGUARD_CORE_OPERATOR_REGISTRY_HPP
#define PIIGUARD_CORE_OPERATOR_REGISTRY_HPP

#include <string>
#include <vector>
#include <map>
#include <functional>
#include <stdexcept>
#include <utility>
#include "detected_span.hpp"
#include "errors.hpp"
#include "../util/hashing.hpp"
#include "../util/cipher.hpp"
#include "../util/utf8.hpp"
#include "../util/logger.hpp"
#include "../../config/entity_defaults.hpp"

/**
 * @file operator_registry.hpp
 * @brief Entity type -> anonymization operator mapping, and the operators themselves.
 *
 * DESIGN:
 *   - OperatorConfig names a Strategy plus string parameters:
 *       replace: new_value (required)
 *       redact:  -
 *       mask:    masking_char (default "*"), chars_to_mask (default / -1 / "all" = whole span),
 *                from_end (default false)
 *       hash:    hash_type ("sha256" default, or "sha512")
 *       encrypt: key (16/24/32 bytes, falls back to the registry's service key)
 *       custom:  a callback on the config itself, or operator=<name> of a registered one
 *   - PolicyTable maps entity types to configs. The entry under config::kWildcardEntity
 *     ("DEFAULT") applies to every type without its own entry.
 *   - Merge rule: caller entries overlay the defaults per entity type (the caller wins,
 *     the wildcard included). A caller may opt out of the defaults altogether.
 *   - Parameters are checked when an operator is applied, so a bad entry only fails
 *     requests that actually need it.
 *
 * All lengths are in code points: masking "José" masks 4 characters, not 5 bytes.
 */

namespace piiguard {
namespace core {

enum class Strategy
{
    Replace,
    Redact,
    Mask,
    Hash,
    Encrypt,
    Custom
};

inline const char *strategyName(Strategy s)
{
    switch (s) {
    case Strategy::Replace: return "replace";
    case Strategy::Redact:  return "redact";
    case Strategy::Mask:    return "mask";
    case Strategy::Hash:    return "hash";
    case Strategy::Encrypt: return "encrypt";
    case Strategy::Custom:  return "custom";
    }
    return "unknown";
}

/**
 * @throw ConfigError for an unknown strategy name.
 */
inline Strategy parseStrategy(const std::string &name)
{
    if (name == "replace") return Strategy::Replace;
    if (name == "redact")  return Strategy::Redact;
    if (name == "mask")    return Strategy::Mask;
    if (name == "hash")    return Strategy::Hash;
    if (name == "encrypt") return Strategy::Encrypt;
    if (name == "custom")  return Strategy::Custom;
    throw ConfigError("OperatorRegistry: unknown anonymization strategy '" + name + "'");
}

/// Externally supplied substitution: (original substring, span) -> replacement.
using CustomOperator = std::function<std::string(const std::string &, const DetectedSpan &)>;

/**
 * @struct OperatorConfig
 * @brief One anonymization rule: a strategy and its parameters.
 */
struct OperatorConfig
{
    Strategy strategy = Strategy::Replace;
    std::map<std::string, std::string> params;
    CustomOperator custom;

    bool hasParam(const std::string &key) const
    {
        return params.find(key) != params.end();
    }

    std::string param(const std::string &key, const std::string &fallback = std::string()) const
    {
        auto it = params.find(key);
        return it == params.end() ? fallback : it->second;
    }

    static OperatorConfig replace(const std::string &newValue)
    {
        OperatorConfig cfg;
        cfg.strategy = Strategy::Replace;
        cfg.params["new_value"] = newValue;
        return cfg;
    }

    static OperatorConfig redact()
    {
        OperatorConfig cfg;
        cfg.strategy = Strategy::Redact;
        return cfg;
    }

    static OperatorConfig mask(const std::string &maskingChar = "*", long charsToMask = -1,
                               bool fromEnd = false)
    {
        OperatorConfig cfg;
        cfg.strategy = Strategy::Mask;
        cfg.params["masking_char"] = maskingChar;
        cfg.params["chars_to_mask"] = std::to_string(charsToMask);
        cfg.params["from_end"] = fromEnd ? "true" : "false";
        return cfg;
    }

    static OperatorConfig hash(const std::string &hashType = "sha256")
    {
        OperatorConfig cfg;
        cfg.strategy = Strategy::Hash;
        cfg.params["hash_type"] = hashType;
        return cfg;
    }

    static OperatorConfig encrypt(const std::string &key = std::string())
    {
        OperatorConfig cfg;
        cfg.strategy = Strategy::Encrypt;
        if (!key.empty()) {
            cfg.params["key"] = key;
        }
        return cfg;
    }

    static OperatorConfig customFn(CustomOperator fn)
    {
        OperatorConfig cfg;
        cfg.strategy = Strategy::Custom;
        cfg.custom = std::move(fn);
        return cfg;
    }

    static OperatorConfig customNamed(const std::string &name)
    {
        OperatorConfig cfg;
        cfg.strategy = Strategy::Custom;
        cfg.params["operator"] = name;
        return cfg;
    }
};

/**
 * @class PolicyTable
 * @brief Entity type -> OperatorConfig, with an optional wildcard entry.
 */
class PolicyTable
{
public:
    PolicyTable() = default;

    void set(const std::string &entityType, const OperatorConfig &cfg)
    {
        entries_[entityType] = cfg;
    }

    void setWildcard(const OperatorConfig &cfg)
    {
        entries_[config::kWildcardEntity] = cfg;
    }

    /**
     * @brief Exact entry for @p entityType, or nullptr.
     */
    const OperatorConfig *find(const std::string &entityType) const
    {
        auto it = entries_.find(entityType);
        return it == entries_.end() ? nullptr : &it->second;
    }

    bool hasWildcard() const
    {
        return find(config::kWildcardEntity) != nullptr;
    }

    const std::map<std::string, OperatorConfig> &entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    /**
     * @brief The built-in table: a replace token per known entity type plus the wildcard.
     */
    static PolicyTable defaults()
    {
        PolicyTable table;
        for (const auto &entry : config::defaultReplacementTokens()) {
            table.set(entry.first, OperatorConfig::replace(entry.second));
        }
        table.setWildcard(OperatorConfig::replace(config::kWildcardReplacement));
        return table;
    }

private:
    std::map<std::string, OperatorConfig> entries_;
};

/**
 * @brief Overlay @p overrides onto @p base, entity type by entity type.
 */
inline PolicyTable mergePolicy(const PolicyTable &base, const PolicyTable &overrides)
{
    PolicyTable merged = base;
    for (const auto &entry : overrides.entries()) {
        merged.set(entry.first, entry.second);
    }
    return merged;
}

/**
 * @brief Operator for @p entityType: its own entry, else the wildcard.
 * @throw ConfigError if neither exists.
 */
inline const OperatorConfig &resolveOperator(const std::string &entityType, const PolicyTable &table)
{
    if (const OperatorConfig *cfg = table.find(entityType)) {
        return *cfg;
    }
    if (const OperatorConfig *wildcard = table.find(config::kWildcardEntity)) {
        return *wildcard;
    }
    throw ConfigError("OperatorRegistry: no operator configured for entity type '" + entityType
                      + "' and no " + config::kWildcardEntity + " entry");
}

/**
 * @class OperatorRegistry
 * @brief Owns the immutable default table, named custom operators and the service
 *        encryption key, and applies operators to span text.
 *
 * Named custom operators are registered during startup, before the registry is shared
 * between threads; everything else is read-only.
 */
class OperatorRegistry
{
public:
    explicit OperatorRegistry(const std::string &defaultEncryptionKey = std::string())
        : defaults_(PolicyTable::defaults())
        , defaultEncryptionKey_(defaultEncryptionKey)
    {
    }

    const PolicyTable &defaults() const { return defaults_; }

    /**
     * @brief Register a custom operator usable from policies as {type: custom, operator: name}.
     */
    void registerCustom(const std::string &name, CustomOperator fn)
    {
        if (name.empty() || !fn) {
            throw std::invalid_argument("OperatorRegistry: custom operator needs a name and a callable");
        }
        customOperators_[name] = std::move(fn);
        util::logger::debug("OperatorRegistry: registered custom operator '" + name + "'");
    }

    std::vector<std::string> customOperatorNames() const
    {
        std::vector<std::string> names;
        for (const auto &entry : customOperators_) {
            names.push_back(entry.first);
        }
        return names;
    }

    /**
     * @brief Policy in effect for a request.
     * @param overrides Caller entries, or nullptr for none.
     * @param useDefaults When false, only the caller's entries apply.
     */
    PolicyTable effectivePolicy(const PolicyTable *overrides, bool useDefaults = true) const
    {
        if (overrides == nullptr) {
            return useDefaults ? defaults_ : PolicyTable();
        }
        return useDefaults ? mergePolicy(defaults_, *overrides) : *overrides;
    }

    /**
     * @brief Compute the replacement for one span.
     * @param cfg Operator to apply.
     * @param original The span's text (code points [start, end) of the source).
     * @param span The span being rewritten.
     * @throw ConfigError when the operator's parameters are unusable.
     */
    std::string apply(const OperatorConfig &cfg, const std::string &original, const DetectedSpan &span) const
    {
        switch (cfg.strategy) {
        case Strategy::Replace:
            if (!cfg.hasParam("new_value")) {
                throw ConfigError("OperatorRegistry: replace operator for '" + span.entityType
                                  + "' is missing new_value");
            }
            return cfg.param("new_value");

        case Strategy::Redact:
            return std::string();

        case Strategy::Mask:
            return applyMask(cfg, original, span);

        case Strategy::Hash:
            try {
                return util::hashing::digestHex(original, cfg.param("hash_type", "sha256"));
            } catch (const std::invalid_argument &ex) {
                throw ConfigError(std::string("OperatorRegistry: ") + ex.what());
            }

        case Strategy::Encrypt:
            return util::cipher::encrypt(original, encryptionKey(cfg, span));

        case Strategy::Custom:
            return applyCustom(cfg, original, span);
        }
        throw ConfigError("OperatorRegistry: unhandled strategy");
    }

    /**
     * @brief Key an encrypt operator uses: its own "key" parameter, else the service key.
     * @throw ConfigError if there is none or its length is not an AES key length.
     */
    std::string encryptionKey(const OperatorConfig &cfg, const DetectedSpan &span) const
    {
        std::string key = cfg.param("key", defaultEncryptionKey_);
        if (key.empty()) {
            throw ConfigError("OperatorRegistry: encrypt operator for '" + span.entityType
                              + "' has no key and no service encryption key is configured");
        }
        if (!util::cipher::isValidKeyLength(key.size())) {
            throw ConfigError("OperatorRegistry: encryption key must be 16, 24 or 32 bytes, got "
                              + std::to_string(key.size()));
        }
        return key;
    }

private:
    static bool parseFlag(const std::string &value, const std::string &name)
    {
        if (value == "true" || value == "1") return true;
        if (value == "false" || value == "0" || value.empty()) return false;
        throw ConfigError("OperatorRegistry: " + name + " must be true or false, got '" + value + "'");
    }

    static std::string applyMask(const OperatorConfig &cfg, const std::string &original, const DetectedSpan &span)
    {
        const std::string maskingChar = cfg.param("masking_char", "*");
        if (util::utf8::length(maskingChar) != 1) {
            throw ConfigError("OperatorRegistry: masking_char for '" + span.entityType
                              + "' must be a single character, got '" + maskingChar + "'");
        }

        std::vector<std::string> chars = util::utf8::codePoints(original);
        size_t count = chars.size();
        const std::string raw = cfg.param("chars_to_mask", "-1");
        if (raw != "all") {
            long n = 0;
            try {
                size_t idx = 0;
                n = std::stol(raw, &idx);
                if (idx != raw.size()) {
                    throw std::invalid_argument("suffix");
                }
            } catch (const std::exception &) {
                throw ConfigError("OperatorRegistry: chars_to_mask must be an integer or \"all\", got '"
                                  + raw + "'");
            }
            if (n >= 0 && static_cast<size_t>(n) < count) {
                count = static_cast<size_t>(n);
            }
        }

        const bool fromEnd = parseFlag(cfg.param("from_end", "false"), "from_end");
        const size_t first = fromEnd ? chars.size() - count : 0;
        for (size_t i = first; i < first + count; ++i) {
            chars[i] = maskingChar;
        }

        std::string out;
        out.reserve(original.size());
        for (const auto &c : chars) {
            out += c;
        }
        return out;
    }

    std::string applyCustom(const OperatorConfig &cfg, const std::string &original, const DetectedSpan &span) const
    {
        const CustomOperator *fn = nullptr;
        if (cfg.custom) {
            fn = &cfg.custom;
        } else {
            const std::string name = cfg.param("operator");
            auto it = customOperators_.find(name);
            if (it == customOperators_.end()) {
                throw ConfigError("OperatorRegistry: no custom operator registered as '" + name
                                  + "' for entity type '" + span.entityType + "'");
            }
            fn = &it->second;
        }

        try {
            return (*fn)(original, span);
        } catch (const ConfigError &) {
            throw;
        } catch (const std::exception &ex) {
            throw ConfigError("OperatorRegistry: custom operator for '" + span.entityType
                              + "' failed: " + ex.what());
        }
    }

    PolicyTable defaults_;
    std::string defaultEncryptionKey_;
    std::map<std::string, CustomOperator> customOperators_;
};

} // namespace core
} // namespace piiguard

#endif // PIIGUARD_CORE_OPERATOR_REGISTRY_HPP
