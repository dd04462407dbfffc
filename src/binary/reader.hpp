#pragma once
#include <cstdint>
#include <stdexcept>
#include <vector>

namespace Trawl::Binary {

// Big-endian cursor over a borrowed buffer. Throws std::out_of_range on a short read.
class Reader {
public:
    explicit Reader(const std::vector<uint8_t>& data) : data_(data), offset_(0) {
    }

    uint8_t              read_uint8();
    uint16_t             read_uint16_be();
    uint32_t             read_uint32_be();
    uint64_t             read_uint64_be();
    std::vector<uint8_t> read_bytes(size_t length);

    bool eof() const {
        return offset_ >= data_.size();
    }
    size_t offset() const {
        return offset_;
    }

private:
    void require(size_t length) const;

    const std::vector<uint8_t>& data_;
    size_t                      offset_;
};

}  // namespace Trawl::Binary
