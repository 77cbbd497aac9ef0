#pragma once
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include "IBodyStream.hpp"
#include "../core/Errors.hpp"
#include "../network/HttpRequest.hpp"
#include "../utils/CancellationToken.hpp"

namespace Unclutter {

struct ResponseHandle {
    long status_code = 0;
    std::string effective_url;
    std::string content_encoding; // as declared by the server, untouched
    std::string content_type;
    std::unique_ptr<IBodyStream> body;
};

struct TransportResult {
    std::optional<ResponseHandle> response;
    Error error; // set when response is empty
};

class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;
    // Sends exactly one request. Any HTTP status is a response; only
    // transport failures (DNS, TLS, connect, timeout, cancel) are errors.
    virtual TransportResult Execute(const HttpRequest& request,
                                    std::chrono::milliseconds timeout,
                                    const CancellationToken& cancel) = 0;
};

}
