#ifndef PIIGUARD_CONFIG_ENTITY_DEFAULTS_HPP
#define PIIGUARD_CONFIG_ENTITY_DEFAULTS_HPP

#include <string>
#include <vector>
#include <utility>

/**
 * @file entity_defaults.hpp
 * @brief Built-in entity catalogue and anonymization defaults for piiguard.
 *
 * Example usage:
 *  @code
 *    for (const auto &type : piiguard::config::defaultEntities()) {
 *        std::cout << type << "\n";
 *    }
 *  @endcode
 */

namespace piiguard {
namespace config {

/// Reported by GET /api/health.
constexpr const char *kServiceVersion = "1.0.0";

/// Key of the wildcard entry in a policy table.
constexpr const char *kWildcardEntity = "DEFAULT";

/// Replacement used by the wildcard entry.
constexpr const char *kWildcardReplacement = "[REDACTED]";

/// Default minimum recognizer score.
constexpr double kDefaultConfidenceThreshold = 0.5;

/// Length of the text preview echoed per batch item, in code points.
constexpr size_t kBatchPreviewLength = 100;

/**
 * @brief Entity types requested when the caller does not name any.
 */
inline std::vector<std::string> defaultEntities()
{
    return {
        "CREDIT_CARD",
        "CRYPTO",
        "DATE_TIME",
        "EMAIL_ADDRESS",
        "IBAN_CODE",
        "IP_ADDRESS",
        "NRP",
        "LOCATION",
        "PERSON",
        "PHONE_NUMBER",
        "MEDICAL_LICENSE",
        "URL",
        "US_BANK_NUMBER",
        "US_DRIVER_LICENSE",
        "US_ITIN",
        "US_PASSPORT",
        "US_SSN"
    };
}

/**
 * @brief Names of the anonymization strategies, as used on the wire.
 */
inline std::vector<std::string> strategyNames()
{
    return { "replace", "redact", "mask", "hash", "encrypt", "custom" };
}

/**
 * @brief Default "replace" token for each entity type.
 *
 * Entity types not listed here fall through to the wildcard entry.
 */
inline std::vector<std::pair<std::string, std::string>> defaultReplacementTokens()
{
    return {
        { "PERSON",            "[PERSON]" },
        { "EMAIL_ADDRESS",     "[EMAIL]" },
        { "PHONE_NUMBER",      "[PHONE]" },
        { "CREDIT_CARD",       "[CREDIT_CARD]" },
        { "US_SSN",            "[SSN]" },
        { "LOCATION",          "[LOCATION]" },
        { "DATE_TIME",         "[DATE]" },
        { "IP_ADDRESS",        "[IP_ADDRESS]" },
        { "URL",               "[URL]" },
        { "US_DRIVER_LICENSE", "[DRIVER_LICENSE]" },
        { "US_PASSPORT",       "[PASSPORT]" },
        { "MEDICAL_LICENSE",   "[MEDICAL_LICENSE]" },
        { "US_BANK_NUMBER",    "[BANK_NUMBER]" },
        { "CRYPTO",            "[CRYPTO_ADDRESS]" },
        { "IBAN_CODE",         "[IBAN]" },
        { "US_ITIN",           "[ITIN]" },
        { "NRP",               "[NRP]" }
    };
}

} // namespace config
} // namespace piiguard

#endif // PIIGUARD_CONFIG_ENTITY_DEFAULTS_HPP
