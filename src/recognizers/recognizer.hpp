#ifndef PIIGUARD_RECOGNIZERS_RECOGNIZER_HPP
#define PIIGUARD_RECOGNIZERS_RECOGNIZER_HPP

#include <string>
#include <vector>
#include "../core/detected_span.hpp"

namespace piiguard {
namespace recognizers {

/*
  Recognizer
  --------------------------------
  The entity-recognition collaborator consumed by the engine.

  Contract:
    detect(text, entityTypes, language, scoreThreshold)
      - returns spans in code-point offsets over the UTF-8 text, any order
      - may block; may be called from several threads at once
      - throws core::UpstreamError when recognition itself fails
    supportedEntityTypes(language)
      - the entity types this recognizer can report for a language
      - throws core::UpstreamError when the catalogue cannot be obtained

  The engine never trusts the output: spans are re-validated, filtered and
  de-overlapped by core::SpanResolver.
*/
class Recognizer
{
public:
    virtual ~Recognizer() = default;

    virtual std::vector<core::DetectedSpan> detect(const std::string &text,
                                                   const std::vector<std::string> &entityTypes,
                                                   const std::string &language,
                                                   double scoreThreshold) const = 0;

    virtual std::vector<std::string> supportedEntityTypes(const std::string &language) const = 0;

    /// Short label for logs.
    virtual std::string name() const = 0;
};

} // namespace recognizers
} // namespace piiguard

#endif // PIIGUARD_RECOGNIZERS_RECOGNIZER_HPP
