#ifndef PIIGUARD_CONFIG_SERVICE_CONFIG_HPP
#define PIIGUARD_CONFIG_SERVICE_CONFIG_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>
#include "entity_defaults.hpp"

/**
 * @file service_config.hpp
 * @brief Runtime settings of a piiguard service process.
 *
 * USAGE:
 *   - Populated with defaults by the constructor, then by util/config_parser.hpp
 *     from a key=value file and the PIIGUARD_* environment overrides.
 *   - Read-only once the engine has been constructed.
 */

namespace piiguard {
namespace config {

/**
 * @struct ServiceConfig
 * @brief Holds the settings shared by the HTTP front, the engine and the recognizer client.
 */
struct ServiceConfig
{
    ServiceConfig()
        : host("0.0.0.0"),
          port(5000),
          defaultLanguage("en"),
          confidenceThreshold(kDefaultConfidenceThreshold),
          defaultEntities(config::defaultEntities()),
          logLevel("INFO"),
          logFile(),
          maxContentLength(16 * 1024 * 1024),
          batchConcurrency(4),
          httpWorkers(8),
          recognizerEndpoint(),
          recognizerTimeoutSeconds(30),
          encryptionKey()
    {
    }

    /// Interface the API server binds to.
    std::string host;

    /// TCP port of the API server.
    uint16_t port;

    /// Language passed to the recognizer when a request names none.
    std::string defaultLanguage;

    /// Minimum score when a request names none.
    double confidenceThreshold;

    /// Entity types requested when a request names none, or none of its names are supported.
    std::vector<std::string> defaultEntities;

    /// DEBUG, INFO, WARN, ERROR or CRITICAL.
    std::string logLevel;

    /// Optional log file mirrored from the console. Empty disables it.
    std::string logFile;

    /// Largest accepted request body, in bytes.
    size_t maxContentLength;

    /// Worker threads used to fan out one batch request.
    size_t batchConcurrency;

    /// Worker threads serving HTTP connections.
    size_t httpWorkers;

    /// Base URL of a remote analyzer. Empty selects the built-in pattern recognizer.
    std::string recognizerEndpoint;

    /// Per-call timeout applied to the remote analyzer.
    long recognizerTimeoutSeconds;

    /// Key used by "encrypt" policy entries that do not carry their own.
    std::string encryptionKey;
};

} // namespace config
} // namespace piiguard

#endif // PIIGUARD_CONFIG_SERVICE_CONFIG_HPP
