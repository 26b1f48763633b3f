#ifndef PIIGUARD_NETWORK_SERVICE_MANAGER_HPP
#define PIIGUARD_NETWORK_SERVICE_MANAGER_HPP

#include <string>
#include <vector>
#include <functional>
#include "../core/anonymization_engine.hpp"
#include "../service/request.hpp"
#include "../service/response.hpp"
#include "../service/payload.hpp"
#include "../util/logger.hpp"
#include "../../config/entity_defaults.hpp"

namespace piiguard {
namespace network {

/*
  service_manager.hpp
  --------------------------------
  Receives inbound API requests (parsed by the HTTP server, or built directly in tests)
  and routes them to the AnonymizationEngine.

  Routes:
    GET  /api/health          -> status, version, supported entities
    GET  /api/entities        -> supported entities, count, default entities
    GET  /api/config          -> defaults, strategies, default anonymization table
    POST /api/analyze         -> detected spans + statistics
    POST /api/anonymize       -> anonymized text + audit items
    POST /api/deanonymize     -> text with encrypted spans restored
    POST /api/batch-analyze   -> per-item results + batch summary

  Error mapping:
    ValidationError -> 400, unknown route -> 404, known route with the wrong method -> 405,
    UpstreamError -> 502, ConfigError during anonymize -> 400 with the detected spans kept,
    anything else -> 500. The engine is thread-safe, so no locking happens here.
*/

class ServiceManager
{
public:
    explicit ServiceManager(const core::AnonymizationEngine &engine)
        : m_engine(engine)
    {
        m_routes = {
            { "/api/health",        "GET",  [this](const service::Request &r) { return HandleHealth(r); } },
            { "/api/entities",      "GET",  [this](const service::Request &r) { return HandleEntities(r); } },
            { "/api/config",        "GET",  [this](const service::Request &r) { return HandleConfig(r); } },
            { "/api/analyze",       "POST", [this](const service::Request &r) { return HandleAnalyze(r); } },
            { "/api/anonymize",     "POST", [this](const service::Request &r) { return HandleAnonymize(r); } },
            { "/api/deanonymize",   "POST", [this](const service::Request &r) { return HandleDeanonymize(r); } },
            { "/api/batch-analyze", "POST", [this](const service::Request &r) { return HandleBatchAnalyze(r); } },
        };
    }

    ServiceManager(const ServiceManager &) = delete;
    ServiceManager &operator=(const ServiceManager &) = delete;

    /*
      HandleRequest:
      - Dispatches on method + route.
      - Never throws; every failure becomes a JSON error response.
    */
    service::Response HandleRequest(const service::Request &req) const
    {
        std::string route = req.route;
        while (route.size() > 1 && route.back() == '/') {
            route.pop_back();
        }

        bool routeKnown = false;
        for (const auto &entry : m_routes) {
            if (entry.route != route) {
                continue;
            }
            routeKnown = true;
            if (entry.method != req.method) {
                continue;
            }
            try {
                return entry.handler(req);
            } catch (const core::ValidationError &ex) {
                return Fail(400, ex.what());
            } catch (const core::ConfigError &ex) {
                return Fail(400, ex.what());
            } catch (const core::UpstreamError &ex) {
                return Fail(502, ex.what());
            } catch (const std::exception &ex) {
                return Fail(500, std::string("Internal error: ") + ex.what());
            }
        }

        if (routeKnown) {
            return Fail(405, "Method " + req.method + " not allowed for " + route);
        }
        return Fail(404, "Endpoint not found: " + route);
    }

    service::Response HandleRequest(const std::string &method, const std::string &route,
                                    const std::string &body = std::string()) const
    {
        service::Request req;
        req.method = method;
        req.route = route;
        req.body = body;
        return HandleRequest(req);
    }

private:
    struct Route
    {
        std::string route;
        std::string method;
        std::function<service::Response(const service::Request &)> handler;
    };

    static service::Response Fail(int status, const std::string &message)
    {
        if (status >= 500) {
            util::logger::error("ServiceManager: " + message);
        } else {
            util::logger::warn("ServiceManager: " + message);
        }
        return service::Response::error(status, message);
    }

    static int StatusFor(core::ErrorKind kind)
    {
        switch (kind) {
            case core::ErrorKind::Validation: return 400;
            case core::ErrorKind::Config:     return 400;
            case core::ErrorKind::Upstream:   return 502;
            default:                          return 500;
        }
    }

    service::Response HandleHealth(const service::Request &req) const
    {
        service::Value body = service::Value::object();
        body.set("status", "healthy");
        body.set("version", config::kServiceVersion);
        body.set("supported_entities",
                 service::Value::fromStrings(m_engine.supportedEntities(req.param("language"))));
        return service::Response::ok(body);
    }

    service::Response HandleEntities(const service::Request &req) const
    {
        const std::vector<std::string> entities = m_engine.supportedEntities(req.param("language"));
        service::Value body = service::Value::object();
        body.set("entities", service::Value::fromStrings(entities));
        body.set("count", entities.size());
        body.set("default_entities", service::Value::fromStrings(m_engine.config().defaultEntities));
        return service::Response::ok(body);
    }

    service::Response HandleConfig(const service::Request &) const
    {
        const config::ServiceConfig &cfg = m_engine.config();
        service::Value settings = service::Value::object();
        settings.set("max_content_length", cfg.maxContentLength);
        settings.set("default_language", cfg.defaultLanguage);
        settings.set("default_confidence_threshold", cfg.confidenceThreshold);
        settings.set("default_entities", service::Value::fromStrings(cfg.defaultEntities));
        settings.set("anonymization_strategies", service::Value::fromStrings(config::strategyNames()));
        settings.set("custom_operators",
                     service::Value::fromStrings(m_engine.registry().customOperatorNames()));
        settings.set("default_anonymization_config", service::toJson(m_engine.registry().defaults()));

        service::Value body = service::Value::object();
        body.set("config", settings);
        return service::Response::ok(body);
    }

    service::Response HandleAnalyze(const service::Request &req) const
    {
        const service::Value doc = service::parseBody(req.body);
        const std::string text = service::readText(doc);
        const core::AnalysisOutcome outcome = m_engine.analyze(text, service::readAnalysisParams(doc));
        if (!outcome.success) {
            return Fail(StatusFor(outcome.errorKind), "Analysis failed: " + outcome.error);
        }

        service::Value metadata = service::Value::object();
        metadata.set("text_length", outcome.textLength);
        metadata.set("entities_requested", service::Value::fromStrings(outcome.entitiesRequested));
        metadata.set("language", outcome.language);
        metadata.set("score_threshold", outcome.scoreThreshold);

        service::Value body = service::Value::object();
        body.set("results", service::toJson(outcome.spans));
        body.set("statistics", service::toJson(outcome.statistics));
        body.set("metadata", metadata);
        return service::Response::ok(body);
    }

    service::Response HandleAnonymize(const service::Request &req) const
    {
        const service::Value doc = service::parseBody(req.body);

        core::AnonymizationRequest request;
        request.text = service::readText(doc);
        request.params = service::readAnalysisParams(doc);
        if (const service::Value *spans = doc.find("analyzer_results")) {
            if (!spans->isNull()) {
                request.spans = service::readSpans(*spans);
            }
        }
        if (const service::Value *policy = doc.find("anonymization_config")) {
            if (!policy->isNull()) {
                request.policy = service::readPolicy(*policy);
            }
        }
        if (const service::Value *useDefaults = doc.find("use_default_policy")) {
            if (!useDefaults->isBool()) {
                throw core::ValidationError("use_default_policy must be a boolean");
            }
            request.useDefaultPolicy = useDefaults->asBool();
        }

        const core::AnonymizationOutcome outcome = m_engine.anonymize(request);
        if (!outcome.analysisSucceeded) {
            return Fail(StatusFor(outcome.errorKind), "Anonymization failed: " + outcome.error);
        }

        service::Value body = service::Value::object();
        body.set("success", outcome.success);
        body.set("original_text", request.text);
        if (outcome.success) {
            service::Value items = service::Value::array();
            for (const auto &item : outcome.items) {
                items.push_back(service::toJson(item));
            }
            body.set("anonymized_text", outcome.anonymizedText);
            body.set("anonymized_items", items);
        } else {
            util::logger::warn("ServiceManager: anonymization step failed: " + outcome.error);
            body.set("error", "Anonymization failed: " + outcome.error);
        }
        body.set("detected_entities", service::toJson(outcome.detected));
        body.set("statistics", service::toJson(outcome.statistics));

        service::Response resp = service::Response::ok(body);
        if (!outcome.success) {
            resp.statusCode = StatusFor(outcome.errorKind);
        }
        return resp;
    }

    service::Response HandleDeanonymize(const service::Request &req) const
    {
        const service::Value doc = service::parseBody(req.body);
        const std::string text = service::readText(doc);
        const std::vector<core::AnonymizationItem> items = service::readItems(service::requireField(doc, "items"));
        std::string key;
        if (const service::Value *k = doc.find("key")) {
            if (!k->isNull()) {
                if (!k->isString()) {
                    throw core::ValidationError("key must be a string");
                }
                key = k->asString();
            }
        }

        const core::DeanonymizeOutcome outcome = m_engine.deanonymize(text, items, key);
        if (!outcome.success) {
            return Fail(StatusFor(outcome.errorKind), "Deanonymization failed: " + outcome.error);
        }
        service::Value body = service::Value::object();
        body.set("text", outcome.text);
        return service::Response::ok(body);
    }

    service::Response HandleBatchAnalyze(const service::Request &req) const
    {
        const service::Value doc = service::parseBody(req.body);
        const std::vector<core::BatchItem> items = service::readBatchItems(doc);
        const core::BatchResult result = m_engine.batchAnalyze(items, service::readAnalysisParams(doc));
        if (!result.success) {
            return Fail(StatusFor(result.errorKind), "Batch analysis failed: " + result.error);
        }

        service::Value results = service::Value::array();
        for (const auto &item : result.run.results) {
            results.push_back(service::toJson(item));
        }
        service::Value metadata = service::Value::object();
        metadata.set("entities_requested", service::Value::fromStrings(result.entitiesRequested));
        metadata.set("language", result.language);
        metadata.set("score_threshold", result.scoreThreshold);

        service::Value body = service::Value::object();
        body.set("batch_results", results);
        body.set("batch_statistics", service::toJson(result.run.summary));
        body.set("metadata", metadata);
        return service::Response::ok(body);
    }

    const core::AnonymizationEngine &m_engine;
    std::vector<Route> m_routes;
};

} // namespace network
} // namespace piiguard

#endif // PIIGUARD_NETWORK_SERVICE_MANAGER_HPP
