#include "BodyStreams.hpp"
#include <algorithm>
#include <cstring>
#include "../core/Errors.hpp"

namespace Unclutter {

size_t StringBodyStream::Read(char* buffer, size_t size) {
    if (closed_) throw AcquireError(ErrorKind::FetchError, "read from a closed stream");
    size_t n = std::min(size, data_.size() - offset_);
    if (n > 0) {
        std::memcpy(buffer, data_.data() + offset_, n);
        offset_ += n;
    }
    return n;
}

void StringBodyStream::Close() {
    if (closed_) return;
    closed_ = true;
    data_.clear();
    data_.shrink_to_fit();
}

size_t IstreamBodyStream::Read(char* buffer, size_t size) {
    if (closed_) throw AcquireError(ErrorKind::FetchError, "read from a closed stream");
    if (size == 0 || in_.eof()) return 0;
    in_.read(buffer, static_cast<std::streamsize>(size));
    if (in_.bad()) throw AcquireError(ErrorKind::FetchError, "input stream read failed");
    return static_cast<size_t>(in_.gcount());
}

}
