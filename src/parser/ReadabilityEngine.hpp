#pragma once
#include "../interfaces/IExtractionEngine.hpp"

namespace Unclutter {

struct ReadabilityOptions {
    // Below this many characters the best candidate is discarded in favour
    // of the whole body.
    size_t char_threshold = 500;
};

// Default extraction engine built on lexbor. Stateless apart from its
// options, so one instance may be reused across calls.
class ReadabilityEngine : public IExtractionEngine {
public:
    ReadabilityEngine();
    explicit ReadabilityEngine(const ReadabilityOptions& options);

    ParseResult Parse(IBodyStream& input, const Url& page_url) override;
    ParseResult ParseDocument(const HtmlDocument& document, const Url& page_url) override;
    bool Check(IBodyStream& input) override;
    bool CheckDocument(const HtmlDocument& document) override;

private:
    ParseResult Extract(HtmlDocument& working, const Url& page_url) const;

    ReadabilityOptions options_;
};

}
