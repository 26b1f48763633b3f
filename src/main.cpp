#include <atomic>
#include <cctype>
#include <chrono>
#include <csignal>
#include <exception>
#include <memory>
#include <string>
#include <thread>

#include "core/anonymization_engine.hpp"
#include "network/http_api_server.hpp"
#include "network/service_manager.hpp"
#include "recognizers/pattern_recognizer.hpp"
#include "recognizers/remote_recognizer.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"
#include "util/utf8.hpp"

namespace {

std::atomic_bool g_stopRequested(false);

void onSignal(int) { g_stopRequested = true; }

// Example custom operator: "John Smith" -> "J.S."
std::string initials(const std::string& original, const piiguard::core::DetectedSpan&) {
    std::string out;
    bool atWordStart = true;
    for (const auto& cp : piiguard::util::utf8::codePoints(original)) {
        const bool space = cp.size() == 1 && std::isspace(static_cast<unsigned char>(cp[0]));
        if (space) {
            atWordStart = true;
        } else if (atWordStart) {
            out += cp + ".";
            atWordStart = false;
        }
    }
    return out;
}

} // namespace

int main(int argc, char** argv) {
    using namespace piiguard;

    util::logger::setLogLevel(util::logger::LogLevel::INFO);
    util::logger::info("[main] piiguard service starting...");

    // 1. Configuration: file, then environment overrides
    config::ServiceConfig serviceConfig;
    util::ConfigParser configParser(serviceConfig);

    std::string configPath = "piiguard.conf";
    if (argc > 1) {
        configPath = argv[1];
    }
    try {
        configParser.loadFromFile(configPath);
        configParser.applyEnvironment();
        util::logger::setLogLevel(util::logger::parseLogLevel(serviceConfig.logLevel));
    } catch (const std::exception& ex) {
        util::logger::critical(std::string("[main] Invalid configuration: ") + ex.what());
        return 1;
    }
    if (!serviceConfig.logFile.empty() && !util::logger::enableFileOutput(serviceConfig.logFile, true)) {
        util::logger::warn("[main] Cannot open log file " + serviceConfig.logFile);
    }

    // 2. Recognizer: remote analyzer when configured, built-in patterns otherwise
    std::unique_ptr<recognizers::Recognizer> recognizer;
    try {
        if (serviceConfig.recognizerEndpoint.empty()) {
            recognizer = std::make_unique<recognizers::PatternRecognizer>();
        } else {
            recognizer = std::make_unique<recognizers::RemoteRecognizer>(serviceConfig.recognizerEndpoint,
                                                                         serviceConfig.recognizerTimeoutSeconds);
        }
    } catch (const std::exception& ex) {
        util::logger::critical(std::string("[main] Cannot create recognizer: ") + ex.what());
        return 1;
    }

    // 3. Engine and routes
    core::AnonymizationEngine engine(*recognizer, serviceConfig);
    engine.registry().registerCustom("initials", initials);
    network::ServiceManager serviceManager(engine);

    // 4. HTTP front
    network::HttpApiServer server(serviceManager, serviceConfig.host, serviceConfig.port,
                                  serviceConfig.maxContentLength, serviceConfig.httpWorkers);
    if (!server.Start()) {
        util::logger::critical("[main] Failed to start the API server on port " +
                               std::to_string(serviceConfig.port));
        return 1;
    }

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);
    while (!g_stopRequested.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    util::logger::info("[main] Shutdown requested.");
    server.Stop();
    util::logger::info("[main] piiguard service exiting.");
    return 0;
}
