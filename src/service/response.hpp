#ifndef PIIGUARD_SERVICE_RESPONSE_HPP
#define PIIGUARD_SERVICE_RESPONSE_HPP

#include <string>
#include <sstream>
#include <iomanip>
#include <chrono>
#include <ctime>
#include "../util/json.hpp"

/**
 * @file response.hpp
 * @brief JSON response returned to the client by the API routes.
 *
 * DESIGN GOALS:
 *   - Provide a minimal "Response" struct: an HTTP status code plus a JSON body.
 *   - ok() and error() stamp every body with "success" and an ISO-8601 "timestamp".
 *   - toHttp() renders the full HTTP/1.1 message written to the socket.
 *
 * USAGE EXAMPLE:
 *   @code
 *   using namespace piiguard::service;
 *
 *   Response resp = Response::error(400, "Text must be a non-empty string");
 *   std::string wire = resp.toHttp();
 *   // => HTTP/1.1 400 Bad Request ... {"success":false,"error":"...","timestamp":"..."}
 *   @endcode
 */

namespace piiguard {
namespace service {

/**
 * @brief Local time as "YYYY-mm-ddTHH:MM:SS.ffffff".
 */
inline std::string currentTimestamp()
{
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count() % 1000000;
    std::tm tmBuf{};
    localtime_r(&t, &tmBuf);
    std::ostringstream oss;
    oss << std::put_time(&tmBuf, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(6) << std::setfill('0') << micros;
    return oss.str();
}

inline const char *statusReason(int code)
{
    switch (code) {
    case 200: return "OK";
    case 400: return "Bad Request";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 413: return "Payload Too Large";
    case 500: return "Internal Server Error";
    case 502: return "Bad Gateway";
    case 503: return "Service Unavailable";
    default:  return "Unknown";
    }
}

/**
 * @struct Response
 * @brief Status code and JSON body of one API answer.
 */
struct Response
{
    int statusCode;
    util::json::Value body;

    Response(int code = 200, const util::json::Value &payload = util::json::Value::object())
        : statusCode(code), body(payload)
    {
    }

    /**
     * @brief 200 answer; "success" and "timestamp" are added to @p payload
     *        unless already present.
     */
    static Response ok(util::json::Value payload)
    {
        if (!payload.contains("success")) {
            payload.set("success", true);
        }
        payload.set("timestamp", currentTimestamp());
        return Response(200, payload);
    }

    static Response error(int code, const std::string &message)
    {
        util::json::Value payload = util::json::Value::object();
        payload.set("success", false);
        payload.set("error", message);
        payload.set("timestamp", currentTimestamp());
        return Response(code, payload);
    }

    std::string toJson() const
    {
        return body.dump();
    }

    /**
     * @brief The complete HTTP/1.1 message, connection closed after it.
     */
    std::string toHttp() const
    {
        const std::string payload = toJson();
        std::ostringstream oss;
        oss << "HTTP/1.1 " << statusCode << " " << statusReason(statusCode) << "\r\n"
            << "Content-Type: application/json\r\n"
            << "Content-Length: " << payload.size() << "\r\n"
            << "Connection: close\r\n\r\n"
            << payload;
        return oss.str();
    }
};

} // namespace service
} // namespace piiguard

#endif // PIIGUARD_SERVICE_RESPONSE_HPP
