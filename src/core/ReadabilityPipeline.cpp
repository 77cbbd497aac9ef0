#include "ReadabilityPipeline.hpp"
#include "ResponseGates.hpp"
#include "../network/HttpRequest.hpp"
#include "../utils/Logger.hpp"

namespace Unclutter {

namespace {

AcquireResult Failure(Error error) {
    Logger::Log(LogLevel::Warn, "Acquisition failed: " + error.Describe());
    AcquireResult result;
    result.error = std::move(error);
    return result;
}

AcquireResult Failure(ErrorKind kind, const std::string& message) {
    return Failure(Error{kind, message, false});
}

AcquireResult FromParse(ParseResult parsed) {
    if (!parsed.article) {
        return Failure(ErrorKind::ParseError, parsed.error.empty() ? "extraction failed" : parsed.error);
    }
    AcquireResult result;
    result.article = std::move(parsed.article);
    return result;
}

// Closes whatever stream it holds when the scope ends, on every path.
class StreamCloser {
public:
    explicit StreamCloser(std::unique_ptr<IBodyStream> stream) : stream_(std::move(stream)) {}
    ~StreamCloser() {
        if (stream_) stream_->Close();
    }

    StreamCloser(const StreamCloser&) = delete;
    StreamCloser& operator=(const StreamCloser&) = delete;

    std::unique_ptr<IBodyStream> Release() { return std::move(stream_); }
    void Reset(std::unique_ptr<IBodyStream> stream) { stream_ = std::move(stream); }
    IBodyStream& operator*() const { return *stream_; }

private:
    std::unique_ptr<IBodyStream> stream_;
};

} // anonymous namespace

ReadabilityPipeline::ReadabilityPipeline(IHttpTransport& transport)
    : ReadabilityPipeline(transport, DefaultEngineFactory()) {}

ReadabilityPipeline::ReadabilityPipeline(IHttpTransport& transport, EngineFactory engine_factory)
    : transport_(transport), engine_factory_(std::move(engine_factory)) {}

EngineFactory ReadabilityPipeline::DefaultEngineFactory(const ReadabilityOptions& options) {
    return [options]() -> std::shared_ptr<IExtractionEngine> {
        return std::make_shared<ReadabilityEngine>(options);
    };
}

std::shared_ptr<IExtractionEngine> ReadabilityPipeline::MakeEngine() {
    return engine_factory_ ? engine_factory_() : nullptr;
}

AcquireResult ReadabilityPipeline::AcquireFromUrl(const std::string& url,
                                                  std::chrono::milliseconds timeout,
                                                  const CancellationToken& cancel) {
    // 1. Validate before any network activity
    auto parsed_url = UrlUtil::ParseRequestUrl(url);
    if (!parsed_url) {
        return Failure(ErrorKind::InvalidURL, "failed to parse URL: " + url);
    }

    // 2. Fetch
    std::optional<HttpRequest> request;
    try {
        request = BuildRequest(*parsed_url);
    } catch (const AcquireError& e) {
        return Failure(e.ToError());
    }

    Logger::Log(LogLevel::Debug, "Fetching URL: " + url);
    TransportResult fetched = transport_.Execute(*request, timeout, cancel);
    if (!fetched.response) {
        return Failure(fetched.error);
    }
    ResponseHandle& response = *fetched.response;
    StreamCloser body(std::move(response.body));

    // 3. Decode
    try {
        body.Reset(NormalizeEncoding(body.Release(), response.content_encoding));
    } catch (const AcquireError& e) {
        return Failure(e.ToError());
    }

    // 4. Gate on media type before anything is read
    if (!IsHtmlContentType(response.content_type)) {
        return Failure(ErrorKind::UnsupportedContentType,
                       "URL is not a HTML document (content type: " + response.content_type + ")");
    }

    // 5. Extract
    Logger::Log(LogLevel::Debug, "Extracting content from " + url + " (status " +
                                     std::to_string(response.status_code) + ")");
    return Extract(*body, *parsed_url);
}

AcquireResult ReadabilityPipeline::AcquireFromStream(IBodyStream& input, const Url& resolved_url) {
    return Extract(input, resolved_url);
}

AcquireResult ReadabilityPipeline::AcquireFromDocument(const HtmlDocument& document, const Url& resolved_url) {
    auto engine = MakeEngine();
    if (!engine) return Failure(ErrorKind::ParseError, "no extraction engine available");
    try {
        return FromParse(engine->ParseDocument(document, resolved_url));
    } catch (const std::exception& e) {
        return Failure(ErrorKind::ParseError, e.what());
    }
}

bool ReadabilityPipeline::CheckStream(IBodyStream& input) {
    auto engine = MakeEngine();
    if (!engine) return false;
    try {
        return engine->Check(input);
    } catch (const AcquireError& e) {
        Logger::Log(LogLevel::Warn, "Readability check aborted: " + e.ToError().Describe());
        return false;
    }
}

bool ReadabilityPipeline::CheckDocument(const HtmlDocument& document) {
    auto engine = MakeEngine();
    return engine && engine->CheckDocument(document);
}

AcquireResult ReadabilityPipeline::Extract(IBodyStream& input, const Url& page_url) {
    auto engine = MakeEngine();
    if (!engine) return Failure(ErrorKind::ParseError, "no extraction engine available");
    try {
        return FromParse(engine->Parse(input, page_url));
    } catch (const AcquireError& e) {
        // Decode, fetch or cancel failures raised by the stream during extraction
        return Failure(e.ToError());
    } catch (const std::exception& e) {
        return Failure(ErrorKind::ParseError, e.what());
    }
}

}
