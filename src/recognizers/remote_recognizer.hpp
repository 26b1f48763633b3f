#ifndef PIIGUARD_RECOGNIZERS_REMOTE_RECOGNIZER_HPP
#define PIIGUARD_RECOGNIZERS_REMOTE_RECOGNIZER_HPP

#include <string>
#include <vector>
#include "recognizer.hpp"
#include "../util/json.hpp"

namespace piiguard {
namespace recognizers {

/**
 * @brief Recognizer backed by an external analyzer service over HTTP (libcurl).
 *
 * Wire protocol:
 *   POST <endpoint>/analyze
 *        {"text":..., "language":..., "entities":[...], "score_threshold":...}
 *     -> [{"entity_type":..., "start":..., "end":..., "score":...}, ...]
 *   GET  <endpoint>/supportedentities?language=<lang>
 *     -> ["PERSON", "EMAIL_ADDRESS", ...]
 *
 * Offsets in the response are code points. Each call opens its own curl handle,
 * so one instance may serve concurrent batch items. Every transport failure,
 * non-2xx status or malformed body surfaces as core::UpstreamError.
 */
class RemoteRecognizer : public Recognizer
{
  public:
    RemoteRecognizer(const std::string &endpoint, long timeoutSeconds);

    std::vector<core::DetectedSpan> detect(const std::string &text,
                                           const std::vector<std::string> &entityTypes,
                                           const std::string &language,
                                           double scoreThreshold) const override;

    std::vector<std::string> supportedEntityTypes(const std::string &language) const override;

    std::string name() const override { return "remote(" + m_endpoint + ")"; }

    /// Build the /analyze request body.
    static std::string buildAnalyzeBody(const std::string &text,
                                        const std::vector<std::string> &entityTypes,
                                        const std::string &language,
                                        double scoreThreshold);

    /// Parse an /analyze response body. Throws core::UpstreamError when malformed.
    static std::vector<core::DetectedSpan> parseAnalyzeResponse(const std::string &body);

    /// Parse a /supportedentities response body. Throws core::UpstreamError when malformed.
    static std::vector<std::string> parseSupportedResponse(const std::string &body);

  private:
    static void initCurl();
    static size_t writeCallback(char *ptr, size_t size, size_t nmemb, void *userdata);

    // Performs the request and returns the body; throws UpstreamError.
    std::string httpRequest(const std::string &url, const std::string *postBody) const;

    std::string m_endpoint;
    long m_timeoutSeconds;
};

} // namespace recognizers
} // namespace piiguard

#endif // PIIGUARD_RECOGNIZERS_REMOTE_RECOGNIZER_HPP
