#ifndef PIIGUARD_SERVICE_REQUEST_HPP
#define PIIGUARD_SERVICE_REQUEST_HPP

#include <string>
#include <stdexcept>
#include <unordered_map>
#include <vector>
#include <cctype>
#include <cstdlib>
#include "../util/logger.hpp"

/**
 * @file request.hpp
 * @brief Parses the head of an HTTP/1.1 request into a Request object.
 *
 * DESIGN GOALS:
 *   - Provide a basic "Request" struct for one API call:
 *       method, route (path without query), query params, headers and body.
 *   - Provide "parseRequestHead", which reads the request line and header block
 *     (everything before the blank line) of a raw HTTP request.
 *   - Header names are stored lower-cased; query values are percent-decoded.
 *   - The body is attached by the caller once Content-Length bytes have arrived.
 *
 * USAGE EXAMPLE:
 *   @code
 *   using namespace piiguard::service;
 *
 *   Request req = parseRequestHead("POST /api/analyze?debug=1 HTTP/1.1\r\n"
 *                                  "Content-Length: 17\r\n");
 *   // req.method == "POST", req.route == "/api/analyze", req.params["debug"] == "1"
 *   // req.contentLength() == 17
 *   @endcode
 */

namespace piiguard {
namespace service {

/**
 * @struct Request
 * @brief A minimal HTTP request: method, route, query params, headers and body.
 */
struct Request
{
    std::string method;   ///< e.g. "GET", "POST"
    std::string route;    ///< e.g. "/api/analyze"
    std::unordered_map<std::string, std::string> params;  ///< query string
    std::unordered_map<std::string, std::string> headers; ///< lower-cased names
    std::string body;

    std::string header(const std::string &name) const
    {
        auto it = headers.find(name);
        return it == headers.end() ? std::string() : it->second;
    }

    std::string param(const std::string &name, const std::string &fallback = std::string()) const
    {
        auto it = params.find(name);
        return it == params.end() ? fallback : it->second;
    }

    /**
     * @brief Declared body length; 0 when the header is absent.
     * @throw std::runtime_error if the header is not a non-negative integer.
     */
    size_t contentLength() const
    {
        const std::string raw = header("content-length");
        if (raw.empty()) {
            return 0;
        }
        for (char c : raw) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                throw std::runtime_error("parseRequest: invalid Content-Length '" + raw + "'");
            }
        }
        return static_cast<size_t>(std::strtoull(raw.c_str(), nullptr, 10));
    }
};

/**
 * @brief Decode %XX escapes and '+' in a query component.
 */
inline std::string percentDecode(const std::string &raw)
{
    std::string out;
    out.reserve(raw.size());
    for (size_t i = 0; i < raw.size(); ++i) {
        if (raw[i] == '+') {
            out.push_back(' ');
        } else if (raw[i] == '%' && i + 2 < raw.size()
                   && std::isxdigit(static_cast<unsigned char>(raw[i + 1]))
                   && std::isxdigit(static_cast<unsigned char>(raw[i + 2]))) {
            out.push_back(static_cast<char>(std::strtol(raw.substr(i + 1, 2).c_str(), nullptr, 16)));
            i += 2;
        } else {
            out.push_back(raw[i]);
        }
    }
    return out;
}

/**
 * @brief Split "a=1&b=2" into a map. Keys without '=' map to "".
 */
inline std::unordered_map<std::string, std::string> parseQuery(const std::string &query)
{
    std::unordered_map<std::string, std::string> result;
    size_t start = 0;
    while (start <= query.size()) {
        size_t amp = query.find('&', start);
        std::string pair = query.substr(start, amp == std::string::npos ? std::string::npos : amp - start);
        if (!pair.empty()) {
            size_t eq = pair.find('=');
            if (eq == std::string::npos) {
                result[percentDecode(pair)] = "";
            } else {
                result[percentDecode(pair.substr(0, eq))] = percentDecode(pair.substr(eq + 1));
            }
        }
        if (amp == std::string::npos) {
            break;
        }
        start = amp + 1;
    }
    return result;
}

/**
 * @brief Parse the request line and headers of a raw HTTP request.
 *
 * @param head Bytes before the "\r\n\r\n" separator.
 * @throw std::runtime_error on a malformed request line or header.
 */
inline Request parseRequestHead(const std::string &head)
{
    std::vector<std::string> lines;
    size_t pos = 0;
    while (pos < head.size()) {
        size_t eol = head.find("\r\n", pos);
        if (eol == std::string::npos) {
            lines.push_back(head.substr(pos));
            break;
        }
        lines.push_back(head.substr(pos, eol - pos));
        pos = eol + 2;
    }
    if (lines.empty() || lines.front().empty()) {
        throw std::runtime_error("parseRequest: empty request line");
    }

    // request line: METHOD SP target SP version
    const std::string &requestLine = lines.front();
    size_t sp1 = requestLine.find(' ');
    size_t sp2 = (sp1 == std::string::npos) ? std::string::npos : requestLine.find(' ', sp1 + 1);
    if (sp1 == std::string::npos || sp2 == std::string::npos || sp1 == 0 || sp2 == sp1 + 1) {
        throw std::runtime_error("parseRequest: malformed request line '" + requestLine + "'");
    }
    const std::string version = requestLine.substr(sp2 + 1);
    if (version.rfind("HTTP/", 0) != 0) {
        throw std::runtime_error("parseRequest: unsupported protocol '" + version + "'");
    }

    Request req;
    req.method = requestLine.substr(0, sp1);
    const std::string target = requestLine.substr(sp1 + 1, sp2 - sp1 - 1);
    size_t q = target.find('?');
    req.route = target.substr(0, q);
    if (q != std::string::npos) {
        req.params = parseQuery(target.substr(q + 1));
    }
    if (req.route.empty() || req.route.front() != '/') {
        throw std::runtime_error("parseRequest: request target must start with '/'");
    }

    for (size_t i = 1; i < lines.size(); ++i) {
        const std::string &line = lines[i];
        if (line.empty()) {
            continue;
        }
        size_t colon = line.find(':');
        if (colon == std::string::npos || colon == 0) {
            throw std::runtime_error("parseRequest: malformed header '" + line + "'");
        }
        std::string name = line.substr(0, colon);
        for (auto &c : name) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        std::string value = line.substr(colon + 1);
        size_t first = value.find_first_not_of(" \t");
        size_t last = value.find_last_not_of(" \t");
        value = (first == std::string::npos) ? std::string() : value.substr(first, last - first + 1);
        req.headers[name] = value;
    }

    util::logger::debug("parseRequest: " + req.method + " " + req.route);
    return req;
}

} // namespace service
} // namespace piiguard

#endif // PIIGUARD_SERVICE_REQUEST_HPP
