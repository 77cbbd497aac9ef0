#pragma once
#include <cstddef>

namespace Unclutter {

// Pull-based response body. Read() returns 0 at end of stream and throws
// AcquireError when the underlying source fails. Only the first Close()
// releases anything; later calls are no-ops.
class IBodyStream {
public:
    virtual ~IBodyStream() = default;
    virtual size_t Read(char* buffer, size_t size) = 0;
    virtual void Close() = 0;
};

}
