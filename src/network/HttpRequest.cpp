#include "HttpRequest.hpp"
#include "../core/Errors.hpp"
#include <algorithm>
#include <cctype>

namespace {

bool IsToken(const std::string& s) {
    if (s.empty()) return false;
    static const std::string separators = "()<>@,;:\\\"/[]?={} \t";
    for (unsigned char c : s) {
        if (c <= 0x20 || c >= 0x7f || separators.find(static_cast<char>(c)) != std::string::npos) return false;
    }
    return true;
}

bool IsFieldValue(const std::string& s) {
    return std::none_of(s.begin(), s.end(), [](unsigned char c) {
        return c == '\r' || c == '\n' || c == '\0';
    });
}

} // anonymous namespace

namespace Unclutter {

HttpRequest::HttpRequest(std::string method, Url url)
    : method_(std::move(method)), url_(std::move(url)) {
    if (!IsToken(method_)) {
        throw AcquireError(ErrorKind::RequestBuildError, "invalid method: " + method_);
    }
}

void HttpRequest::SetHeader(const std::string& name, const std::string& value) {
    if (!IsToken(name)) {
        throw AcquireError(ErrorKind::RequestBuildError, "invalid header name: " + name);
    }
    if (!IsFieldValue(value)) {
        throw AcquireError(ErrorKind::RequestBuildError, "invalid value for header " + name);
    }
    auto same_name = [&name](const Header& h) {
        return h.first.size() == name.size() &&
               std::equal(h.first.begin(), h.first.end(), name.begin(), [](unsigned char a, unsigned char b) {
                   return std::tolower(a) == std::tolower(b);
               });
    };
    auto it = std::find_if(headers_.begin(), headers_.end(), same_name);
    if (it != headers_.end()) {
        it->second = value;
    } else {
        headers_.emplace_back(name, value);
    }
}

HttpRequest BuildRequest(const Url& url) {
    HttpRequest request("GET", url);
    request.SetHeader("Accept-Encoding", "gzip");
    return request;
}

}
