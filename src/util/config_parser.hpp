#ifndef PIIGUARD_UTIL_CONFIG_PARSER_HPP
#define PIIGUARD_UTIL_CONFIG_PARSER_HPP

#include <string>
#include <vector>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <cstdint>
#include <cstdlib>
#include <mutex>
#include "../../config/service_config.hpp"
#include "logger.hpp"

/**
 * @file config_parser.hpp
 * @brief Parser for piiguard's key=value service configuration.
 *
 * DESIGN GOALS:
 *   - Read a simple "key=value" file; '#' starts a comment line, blank lines are skipped.
 *   - Populate piiguard::config::ServiceConfig fields, warning on unknown keys.
 *   - Malformed lines or values throw std::runtime_error naming the offending line.
 *   - A missing file is not an error: defaults stay in place and a warning is logged.
 *   - PIIGUARD_PORT, PIIGUARD_CONFIDENCE_THRESHOLD and PIIGUARD_LOG_LEVEL override the file.
 *
 * USAGE:
 *   @code
 *   piiguard::config::ServiceConfig cfg;
 *   piiguard::util::ConfigParser parser(cfg);
 *   parser.loadFromFile("piiguard.conf");
 *   parser.applyEnvironment();
 *   @endcode
 *
 * Example file:
 *   @code
 *   port=5000
 *   confidenceThreshold=0.6
 *   defaultEntities=PERSON,EMAIL_ADDRESS,PHONE_NUMBER
 *   recognizerEndpoint=http://localhost:5002
 *   @endcode
 */

namespace piiguard {
namespace util {

/**
 * @class ConfigParser
 * @brief Reads key=value text and updates a referenced ServiceConfig.
 */
class ConfigParser
{
public:
    explicit ConfigParser(piiguard::config::ServiceConfig &serviceConfig)
        : serviceConfig_(serviceConfig)
    {
    }

    /**
     * @brief Read the given file line by line, storing recognized keys.
     * @return false if the file does not exist (defaults kept).
     * @throw std::runtime_error if a line or a value is malformed.
     */
    inline bool loadFromFile(const std::string &filepath)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        std::ifstream inFile(filepath);
        if (!inFile.is_open()) {
            logger::warn("ConfigParser: File not found: " + filepath + ", using defaults");
            return false;
        }

        logger::info("ConfigParser: Loading config from " + filepath);
        parseStream(inFile, filepath);
        logger::info("ConfigParser: Config loaded.");
        return true;
    }

    /**
     * @brief Parse configuration text held in memory.
     */
    inline void loadFromString(const std::string &content)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::istringstream in(content);
        parseStream(in, "<string>");
    }

    /**
     * @brief Apply PIIGUARD_* environment overrides on top of whatever is loaded.
     */
    inline void applyEnvironment()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        static const char *const keys[][2] = {
            { "PIIGUARD_PORT", "port" },
            { "PIIGUARD_CONFIDENCE_THRESHOLD", "confidenceThreshold" },
            { "PIIGUARD_LOG_LEVEL", "logLevel" }
        };
        for (const auto &pair : keys) {
            const char *val = std::getenv(pair[0]);
            if (val != nullptr && *val != '\0') {
                logger::info(std::string("ConfigParser: override from ") + pair[0]);
                applyKeyValue(pair[1], val);
            }
        }
    }

private:
    piiguard::config::ServiceConfig &serviceConfig_;
    std::mutex mutex_;

    inline void parseStream(std::istream &in, const std::string &origin)
    {
        std::string line;
        size_t lineNo = 0;
        while (std::getline(in, line)) {
            ++lineNo;
            trim(line);

            if (line.empty() || line[0] == '#') {
                continue;
            }

            auto pos = line.find('=');
            if (pos == std::string::npos) {
                throw std::runtime_error("ConfigParser: invalid line " + std::to_string(lineNo)
                                         + " in " + origin + " (no '='): " + line);
            }
            std::string key = line.substr(0, pos);
            std::string val = line.substr(pos + 1);
            trim(key);
            trim(val);
            if (key.empty()) {
                throw std::runtime_error("ConfigParser: empty key on line " + std::to_string(lineNo)
                                         + " in " + origin);
            }

            applyKeyValue(key, val);
        }
    }

    inline void applyKeyValue(const std::string &key, const std::string &val)
    {
        auto &cfg = serviceConfig_;

        if (key == "host") {
            cfg.host = val;
        }
        else if (key == "port") {
            uint64_t port = parseUInt(key, val);
            if (port == 0 || port > 65535) {
                throw std::runtime_error("ConfigParser: port out of range: " + val);
            }
            cfg.port = static_cast<uint16_t>(port);
        }
        else if (key == "defaultLanguage") {
            cfg.defaultLanguage = val;
        }
        else if (key == "confidenceThreshold") {
            double threshold = parseDouble(key, val);
            if (threshold < 0.0 || threshold > 1.0) {
                throw std::runtime_error("ConfigParser: confidenceThreshold must be within [0,1]: " + val);
            }
            cfg.confidenceThreshold = threshold;
        }
        else if (key == "defaultEntities") {
            std::vector<std::string> entities = splitList(val);
            if (entities.empty()) {
                throw std::runtime_error("ConfigParser: defaultEntities must not be empty");
            }
            cfg.defaultEntities = entities;
        }
        else if (key == "logLevel") {
            logger::parseLogLevel(val); // validates
            cfg.logLevel = val;
        }
        else if (key == "logFile") {
            cfg.logFile = val;
        }
        else if (key == "maxContentLength") {
            cfg.maxContentLength = static_cast<size_t>(parseUInt(key, val));
        }
        else if (key == "batchConcurrency") {
            cfg.batchConcurrency = static_cast<size_t>(parsePositive(key, val));
        }
        else if (key == "httpWorkers") {
            cfg.httpWorkers = static_cast<size_t>(parsePositive(key, val));
        }
        else if (key == "recognizerEndpoint") {
            cfg.recognizerEndpoint = val;
        }
        else if (key == "recognizerTimeoutSeconds") {
            cfg.recognizerTimeoutSeconds = static_cast<long>(parsePositive(key, val));
        }
        else if (key == "encryptionKey") {
            cfg.encryptionKey = val;
        }
        else {
            logger::warn("ConfigParser: Unrecognized key '" + key + "'");
            return;
        }
        // encryptionKey is a secret, keep it out of the log
        logger::debug("ConfigParser: " + key + " set to "
                      + (key == "encryptionKey" ? std::string("<hidden>") : val));
    }

    inline void trim(std::string &s) const
    {
        static const std::string whitespace = " \t\r\n";
        auto pos = s.find_first_not_of(whitespace);
        if (pos == std::string::npos) {
            s.clear();
            return;
        }
        s.erase(0, pos);
        pos = s.find_last_not_of(whitespace);
        s.erase(pos + 1);
    }

    inline std::vector<std::string> splitList(const std::string &val) const
    {
        std::vector<std::string> out;
        std::istringstream in(val);
        std::string item;
        while (std::getline(in, item, ',')) {
            trim(item);
            if (!item.empty()) {
                out.push_back(item);
            }
        }
        return out;
    }

    inline uint64_t parseUInt(const std::string &key, const std::string &val) const
    {
        if (val.empty() || val[0] == '-') {
            throw std::runtime_error("ConfigParser: " + key + " expects an unsigned integer, got '" + val + "'");
        }
        try {
            size_t idx = 0;
            uint64_t n = std::stoull(val, &idx, 10);
            if (idx != val.size()) {
                throw std::runtime_error("Non-numeric suffix");
            }
            return n;
        }
        catch (const std::exception &ex) {
            throw std::runtime_error("ConfigParser: " + key + " expects an unsigned integer, got '"
                                     + val + "': " + ex.what());
        }
    }

    inline uint64_t parsePositive(const std::string &key, const std::string &val) const
    {
        uint64_t n = parseUInt(key, val);
        if (n == 0) {
            throw std::runtime_error("ConfigParser: " + key + " must be greater than zero");
        }
        return n;
    }

    inline double parseDouble(const std::string &key, const std::string &val) const
    {
        try {
            size_t idx = 0;
            double d = std::stod(val, &idx);
            if (idx != val.size()) {
                throw std::runtime_error("Non-numeric suffix");
            }
            return d;
        }
        catch (const std::exception &ex) {
            throw std::runtime_error("ConfigParser: " + key + " expects a number, got '"
                                     + val + "': " + ex.what());
        }
    }
};

} // namespace util
} // namespace piiguard

#endif // PIIGUARD_UTIL_CONFIG_PARSER_HPP
