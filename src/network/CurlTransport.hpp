#pragma once
#include "../interfaces/IHttpTransport.hpp"

namespace Unclutter {

// Blocking libcurl transport. Every Execute() gets its own easy and multi
// handle; the returned body keeps both alive and streams the rest of the
// transfer on demand. The instance itself holds only options, so it may be
// shared between threads.
class CurlTransport : public IHttpTransport {
public:
    struct Options {
        long max_redirects = 10;
        bool verify_tls = true;
    };

    CurlTransport();
    explicit CurlTransport(const Options& options);

    // Non-copyable
    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    TransportResult Execute(const HttpRequest& request,
                            std::chrono::milliseconds timeout,
                            const CancellationToken& cancel) override;

private:
    Options options_;
};

}
