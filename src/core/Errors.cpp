#include "Errors.hpp"

namespace Unclutter {

const char* ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:                   return "None";
        case ErrorKind::InvalidURL:             return "InvalidURL";
        case ErrorKind::RequestBuildError:      return "RequestBuildError";
        case ErrorKind::FetchError:             return "FetchError";
        case ErrorKind::DecodeError:            return "DecodeError";
        case ErrorKind::UnsupportedContentType: return "UnsupportedContentType";
        case ErrorKind::ParseError:             return "ParseError";
        case ErrorKind::Cancelled:              return "Cancelled";
    }
    return "Unknown";
}

std::string Error::Describe() const {
    std::string out = ToString(kind);
    if (!message.empty()) out += ": " + message;
    if (timed_out) out += " (timed out)";
    return out;
}

}
