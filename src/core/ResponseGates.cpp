#include "ResponseGates.hpp"
#include "../network/GzipBodyStream.hpp"
#include "../utils/Logger.hpp"

namespace Unclutter {

namespace {
const char kGzipToken[] = "gzip";
const char kHtmlMediaType[] = "text/html";
}

bool IsGzipEncoding(const std::string& content_encoding) {
    return content_encoding == kGzipToken;
}

std::unique_ptr<IBodyStream> NormalizeEncoding(std::unique_ptr<IBodyStream> body,
                                               const std::string& content_encoding) {
    if (!IsGzipEncoding(content_encoding)) {
        if (!content_encoding.empty() && content_encoding != "identity") {
            Logger::Log(LogLevel::Debug, "Passing through unrecognized content encoding: " + content_encoding);
        }
        return body;
    }
    return std::make_unique<GzipBodyStream>(std::move(body));
}

bool IsHtmlContentType(const std::string& content_type) {
    return content_type.find(kHtmlMediaType) != std::string::npos;
}

}
