#pragma once
#include <string>
#include <utility>
#include <vector>
#include "../utils/UrlUtil.hpp"

namespace Unclutter {

class HttpRequest {
public:
    using Header = std::pair<std::string, std::string>;

    HttpRequest(std::string method, Url url);

    // Throws AcquireError(RequestBuildError) for names or values that would
    // break the request line framing.
    void SetHeader(const std::string& name, const std::string& value);

    const std::string& method() const { return method_; }
    const Url& url() const { return url_; }
    const std::vector<Header>& headers() const { return headers_; }

private:
    std::string method_;
    Url url_;
    std::vector<Header> headers_;
};

// GET request advertising gzip support, nothing else.
HttpRequest BuildRequest(const Url& url);

}
