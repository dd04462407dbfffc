#include "reader.hpp"

namespace Trawl::Binary {

namespace {
template <typename T>
T read_be(const std::vector<uint8_t>& data, size_t& offset) {
    T value = 0;
    for (size_t i = 0; i < sizeof(T); ++i) {
        value = static_cast<T>((value << 8) | data[offset + i]);
    }
    offset += sizeof(T);
    return value;
}
}  // namespace

void Reader::require(size_t length) const {
    if (length > data_.size() || offset_ > data_.size() - length) {
        throw std::out_of_range("Attempt to read past end of buffer.");
    }
}

uint8_t Reader::read_uint8() {
    require(1);
    return data_[offset_++];
}

uint16_t Reader::read_uint16_be() {
    require(sizeof(uint16_t));
    return read_be<uint16_t>(data_, offset_);
}

uint32_t Reader::read_uint32_be() {
    require(sizeof(uint32_t));
    return read_be<uint32_t>(data_, offset_);
}

uint64_t Reader::read_uint64_be() {
    require(sizeof(uint64_t));
    return read_be<uint64_t>(data_, offset_);
}

std::vector<uint8_t> Reader::read_bytes(size_t length) {
    require(length);
    std::vector<uint8_t> out(data_.begin() + static_cast<std::ptrdiff_t>(offset_),
                             data_.begin() + static_cast<std::ptrdiff_t>(offset_ + length));
    offset_ += length;
    return out;
}

}  // namespace Trawl::Binary
