#pragma once
#include <memory>
#include <string>
#include "../interfaces/IBodyStream.hpp"

namespace Unclutter {

// Exact match on the declared Content-Encoding. Anything else, including
// "x-gzip" or a list such as "gzip, identity", is treated as identity.
bool IsGzipEncoding(const std::string& content_encoding);

// Wraps body in a gzip decoder when the declared encoding is gzip, otherwise
// returns it unchanged. Reads nothing. Throws AcquireError(DecodeError) when
// the decoder cannot be set up; body is closed in that case.
std::unique_ptr<IBodyStream> NormalizeEncoding(std::unique_ptr<IBodyStream> body,
                                               const std::string& content_encoding);

// Substring containment of "text/html"; case-sensitive, parameters ignored.
bool IsHtmlContentType(const std::string& content_type);

}
