#pragma once
#include <istream>
#include <string>
#include <utility>
#include "../interfaces/IBodyStream.hpp"

namespace Unclutter {

// Owns its bytes.
class StringBodyStream : public IBodyStream {
public:
    explicit StringBodyStream(std::string data) : data_(std::move(data)) {}

    size_t Read(char* buffer, size_t size) override;
    void Close() override;

private:
    std::string data_;
    size_t offset_ = 0;
    bool closed_ = false;
};

// Borrows a std::istream; Close() only stops further reads.
class IstreamBodyStream : public IBodyStream {
public:
    explicit IstreamBodyStream(std::istream& in) : in_(in) {}

    size_t Read(char* buffer, size_t size) override;
    void Close() override { closed_ = true; }

private:
    std::istream& in_;
    bool closed_ = false;
};

}
