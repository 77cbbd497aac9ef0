#include "GzipBodyStream.hpp"
#include <zlib.h>
#include <algorithm>
#include <climits>
#include <string>
#include "../core/Errors.hpp"

namespace {

constexpr size_t kInputChunkBytes = 16 * 1024;
// 16 + MAX_WBITS accepts only the gzip wrapper
constexpr int kGzipWindowBits = 16 + MAX_WBITS;

std::string ZlibMessage(const z_stream& zs, int code) {
    if (zs.msg) return zs.msg;
    switch (code) {
        case Z_NEED_DICT:    return "preset dictionary required";
        case Z_DATA_ERROR:   return "invalid gzip data";
        case Z_MEM_ERROR:    return "out of memory";
        case Z_STREAM_ERROR: return "inconsistent stream state";
        default:             return "zlib error " + std::to_string(code);
    }
}

} // anonymous namespace

namespace Unclutter {

struct GzipBodyStream::Inflater {
    z_stream zs{};
    bool initialized = false;
};

GzipBodyStream::GzipBodyStream(std::unique_ptr<IBodyStream> inner)
    : inner_(std::move(inner)), inflater_(std::make_unique<Inflater>()), input_(kInputChunkBytes) {
    int ret = inflateInit2(&inflater_->zs, kGzipWindowBits);
    if (ret != Z_OK) {
        std::string message = "failed to create gzip reader: " + ZlibMessage(inflater_->zs, ret);
        closed_ = true;
        if (inner_) inner_->Close();
        throw AcquireError(ErrorKind::DecodeError, message);
    }
    inflater_->initialized = true;
}

GzipBodyStream::~GzipBodyStream() {
    Close();
}

bool GzipBodyStream::FillInput() {
    size_t n = inner_->Read(input_.data(), input_.size());
    if (n == 0) return false;
    inflater_->zs.next_in = reinterpret_cast<Bytef*>(input_.data());
    inflater_->zs.avail_in = static_cast<uInt>(n);
    return true;
}

size_t GzipBodyStream::Read(char* buffer, size_t size) {
    if (closed_) {
        throw AcquireError(ErrorKind::DecodeError, "read from a closed gzip stream");
    }
    if (size == 0 || finished_) return 0;

    z_stream& zs = inflater_->zs;
    const uInt capacity = static_cast<uInt>(std::min<size_t>(size, UINT_MAX));
    size_t produced = 0;

    while (produced == 0) {
        if (member_done_) {
            // Anything after a complete member must be another member.
            if (zs.avail_in == 0 && !FillInput()) {
                finished_ = true;
                return 0;
            }
            inflateReset(&zs);
            member_done_ = false;
        }
        if (zs.avail_in == 0 && !FillInput()) {
            throw AcquireError(ErrorKind::DecodeError, "unexpected end of gzip stream");
        }

        zs.next_out = reinterpret_cast<Bytef*>(buffer);
        zs.avail_out = capacity;
        int ret = inflate(&zs, Z_NO_FLUSH);
        produced = capacity - zs.avail_out;

        switch (ret) {
            case Z_STREAM_END:
                member_done_ = true;
                break;
            case Z_OK:
            case Z_BUF_ERROR:
                break;
            default:
                throw AcquireError(ErrorKind::DecodeError, "invalid gzip stream: " + ZlibMessage(zs, ret));
        }
    }
    return produced;
}

void GzipBodyStream::Close() {
    if (closed_) return;
    closed_ = true;
    if (inflater_ && inflater_->initialized) {
        inflateEnd(&inflater_->zs);
        inflater_->initialized = false;
    }
    if (inner_) inner_->Close();
}

}
