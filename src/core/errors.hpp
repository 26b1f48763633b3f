#ifndef PIIGUARD_CORE_ERRORS_HPP
#define PIIGUARD_CORE_ERRORS_HPP

#include <stdexcept>
#include <string>

/**
 * @file errors.hpp
 * @brief Error taxonomy of the anonymization engine.
 *
 *   - ValidationError: the request itself is malformed (missing text, wrong types).
 *   - ConfigError:     no usable operator for an entity type, or bad operator parameters.
 *   - UpstreamError:   the recognizer collaborator failed.
 *
 * Components throw these; AnonymizationEngine catches them at the operation boundary
 * and turns them into outcome structs, so none of them reaches the process top level.
 * Malformed individual spans are not errors at all, the resolver drops them.
 */

namespace piiguard {
namespace core {

class ValidationError : public std::runtime_error
{
public:
    explicit ValidationError(const std::string &msg) : std::runtime_error(msg) {}
};

class ConfigError : public std::runtime_error
{
public:
    explicit ConfigError(const std::string &msg) : std::runtime_error(msg) {}
};

class UpstreamError : public std::runtime_error
{
public:
    explicit UpstreamError(const std::string &msg) : std::runtime_error(msg) {}
};

} // namespace core
} // namespace piiguard

#endif // PIIGUARD_CORE_ERRORS_HPP
