#include "recognizers/remote_recognizer.hpp"

#include <curl/curl.h>
#include <mutex>

#include "core/errors.hpp"
#include "util/logger.hpp"

namespace piiguard {
namespace recognizers {

RemoteRecognizer::RemoteRecognizer(const std::string &endpoint, long timeoutSeconds)
    : m_endpoint(endpoint), m_timeoutSeconds(timeoutSeconds) {
    while (!m_endpoint.empty() && m_endpoint.back() == '/')
        m_endpoint.pop_back();
    if (m_endpoint.empty())
        throw std::invalid_argument("RemoteRecognizer: endpoint must not be empty");
    initCurl();
}

std::vector<core::DetectedSpan> RemoteRecognizer::detect(const std::string &text,
                                                         const std::vector<std::string> &entityTypes,
                                                         const std::string &language,
                                                         double scoreThreshold) const {
    const std::string body = buildAnalyzeBody(text, entityTypes, language, scoreThreshold);
    const std::string response = httpRequest(m_endpoint + "/analyze", &body);
    return parseAnalyzeResponse(response);
}

std::vector<std::string> RemoteRecognizer::supportedEntityTypes(const std::string &language) const {
    CURL *curl = curl_easy_init();
    if (!curl)
        throw core::UpstreamError("RemoteRecognizer: curl_easy_init failed");
    char *escaped = curl_easy_escape(curl, language.c_str(), static_cast<int>(language.size()));
    std::string lang = escaped ? escaped : language;
    curl_free(escaped);
    curl_easy_cleanup(curl);

    const std::string response = httpRequest(m_endpoint + "/supportedentities?language=" + lang, nullptr);
    return parseSupportedResponse(response);
}

std::string RemoteRecognizer::buildAnalyzeBody(const std::string &text,
                                               const std::vector<std::string> &entityTypes,
                                               const std::string &language,
                                               double scoreThreshold) {
    util::json::Value body = util::json::Value::object();
    body.set("text", text);
    body.set("language", language);
    if (!entityTypes.empty())
        body.set("entities", util::json::Value::fromStrings(entityTypes));
    body.set("score_threshold", scoreThreshold);
    return body.dump();
}

std::vector<core::DetectedSpan> RemoteRecognizer::parseAnalyzeResponse(const std::string &body) {
    std::vector<core::DetectedSpan> spans;
    try {
        util::json::Value doc = util::json::Value::parse(body);
        if (!doc.isArray())
            throw core::UpstreamError("RemoteRecognizer: /analyze returned a " +
                                      std::string(doc.typeName()) + ", expected an array");
        for (const auto &item : doc.items()) {
            spans.push_back(core::makeSpan(item["entity_type"].asString(),
                                           item["start"].asInt(),
                                           item["end"].asInt(),
                                           item["score"].asNumber()));
        }
    } catch (const core::UpstreamError &) {
        throw;
    } catch (const std::exception &ex) {
        throw core::UpstreamError(std::string("RemoteRecognizer: malformed /analyze response: ") + ex.what());
    }
    return spans;
}

std::vector<std::string> RemoteRecognizer::parseSupportedResponse(const std::string &body) {
    std::vector<std::string> types;
    try {
        util::json::Value doc = util::json::Value::parse(body);
        for (const auto &item : doc.items()) {
            types.push_back(item.asString());
        }
    } catch (const std::exception &ex) {
        throw core::UpstreamError(std::string("RemoteRecognizer: malformed /supportedentities response: ") +
                                  ex.what());
    }
    return types;
}

void RemoteRecognizer::initCurl() {
    static std::once_flag flag;
    std::call_once(flag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

size_t RemoteRecognizer::writeCallback(char *ptr, size_t size, size_t nmemb, void *userdata) {
    if (!userdata)
        return 0;
    std::string *resp = reinterpret_cast<std::string *>(userdata);
    size_t total = size * nmemb;
    resp->append(ptr, total);
    return total;
}

std::string RemoteRecognizer::httpRequest(const std::string &url, const std::string *postBody) const {
    CURL *curl = curl_easy_init();
    if (!curl)
        throw core::UpstreamError("RemoteRecognizer: curl_easy_init failed");

    std::string response;
    struct curl_slist *headers = nullptr;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    if (postBody) {
        headers = curl_slist_append(headers, "Content-Type: application/json");
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, postBody->c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(postBody->size()));
    }
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, m_timeoutSeconds);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);

    CURLcode res = curl_easy_perform(curl);
    long status = 0;
    if (res == CURLE_OK)
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        util::logger::error("RemoteRecognizer: request to " + url + " failed: " + curl_easy_strerror(res));
        throw core::UpstreamError(std::string("RemoteRecognizer: ") + curl_easy_strerror(res));
    }
    if (status < 200 || status >= 300) {
        util::logger::error("RemoteRecognizer: " + url + " answered HTTP " + std::to_string(status));
        throw core::UpstreamError("RemoteRecognizer: analyzer answered HTTP " + std::to_string(status));
    }
    return response;
}

} // namespace recognizers
} // namespace piiguard
