#ifndef PIIGUARD_TEST_FAKE_RECOGNIZER_HPP
#define PIIGUARD_TEST_FAKE_RECOGNIZER_HPP

#include <atomic>
#include <string>
#include <vector>

#include "core/errors.hpp"
#include "recognizers/recognizer.hpp"

namespace piiguard {
namespace test {

/*
  FakeRecognizer
  --------------------------------
  Returns a fixed list of spans for every text, or throws UpstreamError
  for texts containing failMarker. Counts detect() calls.
*/
class FakeRecognizer : public recognizers::Recognizer {
  public:
    explicit FakeRecognizer(std::vector<core::DetectedSpan> spans = {},
                            std::vector<std::string> supported = {"PERSON", "PHONE_NUMBER", "EMAIL_ADDRESS"})
        : m_spans(std::move(spans)), m_supported(std::move(supported)), m_calls(0) {}

    std::vector<core::DetectedSpan> detect(const std::string& text, const std::vector<std::string>&,
                                           const std::string&, double) const override {
        ++m_calls;
        if (!failMarker.empty() && text.find(failMarker) != std::string::npos)
            throw core::UpstreamError("FakeRecognizer: analyzer unavailable");
        return m_spans;
    }

    std::vector<std::string> supportedEntityTypes(const std::string&) const override {
        if (failCatalogue)
            throw core::UpstreamError("FakeRecognizer: catalogue unavailable");
        return m_supported;
    }

    std::string name() const override { return "fake"; }

    int calls() const { return m_calls.load(); }

    std::string failMarker;
    bool failCatalogue = false;

  private:
    std::vector<core::DetectedSpan> m_spans;
    std::vector<std::string> m_supported;
    mutable std::atomic<int> m_calls;
};

} // namespace test
} // namespace piiguard

#endif // PIIGUARD_TEST_FAKE_RECOGNIZER_HPP
