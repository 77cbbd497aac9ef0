#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include "Errors.hpp"
#include "../interfaces/IExtractionEngine.hpp"
#include "../interfaces/IHttpTransport.hpp"
#include "../parser/ReadabilityEngine.hpp"
#include "../utils/CancellationToken.hpp"

namespace Unclutter {

struct AcquireResult {
    std::optional<Article> article;
    Error error;

    bool ok() const { return article.has_value(); }
};

// Called once per operation. Return a fresh engine, or the same shared one
// when engine reuse is wanted.
using EngineFactory = std::function<std::shared_ptr<IExtractionEngine>()>;

// URL validation -> transport -> encoding normalization -> media-type gate ->
// extraction. Each stage either hands over to the next or ends the call with
// a classified error. The pipeline keeps no per-call state.
class ReadabilityPipeline {
public:
    explicit ReadabilityPipeline(IHttpTransport& transport);
    ReadabilityPipeline(IHttpTransport& transport, EngineFactory engine_factory);

    AcquireResult AcquireFromUrl(const std::string& url,
                                 std::chrono::milliseconds timeout,
                                 const CancellationToken& cancel = CancellationToken());

    // The stream stays owned by the caller and is not closed.
    AcquireResult AcquireFromStream(IBodyStream& input, const Url& resolved_url);
    AcquireResult AcquireFromDocument(const HtmlDocument& document, const Url& resolved_url);

    bool CheckStream(IBodyStream& input);
    bool CheckDocument(const HtmlDocument& document);

    // Builds a new ReadabilityEngine for every call.
    static EngineFactory DefaultEngineFactory(const ReadabilityOptions& options = ReadabilityOptions());

private:
    std::shared_ptr<IExtractionEngine> MakeEngine();
    AcquireResult Extract(IBodyStream& input, const Url& page_url);

    IHttpTransport& transport_;
    EngineFactory engine_factory_;
};

}
