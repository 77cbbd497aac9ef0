#pragma once
#include <memory>
#include <vector>
#include "../interfaces/IBodyStream.hpp"

namespace Unclutter {

// Streaming gzip decoder on top of another body stream. Nothing is read
// from the inner stream until the first Read(). Concatenated gzip members
// are decoded as one stream. Close() ends the decoder first and then closes
// the wrapped stream.
class GzipBodyStream final : public IBodyStream {
public:
    // Takes ownership of inner. On decoder setup failure the inner stream is
    // closed and AcquireError(DecodeError) is thrown.
    explicit GzipBodyStream(std::unique_ptr<IBodyStream> inner);
    ~GzipBodyStream() override;

    // Non-copyable
    GzipBodyStream(const GzipBodyStream&) = delete;
    GzipBodyStream& operator=(const GzipBodyStream&) = delete;

    size_t Read(char* buffer, size_t size) override;
    void Close() override;

private:
    struct Inflater;

    bool FillInput();

    std::unique_ptr<IBodyStream> inner_;
    std::unique_ptr<Inflater> inflater_;
    std::vector<char> input_;
    bool member_done_ = false;
    bool finished_ = false;
    bool closed_ = false;
};

}
