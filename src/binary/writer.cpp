#include "writer.hpp"

namespace Trawl::Binary {

namespace {
template <typename T>
void write_be(std::vector<uint8_t>& data, T value) {
    for (size_t i = 0; i < sizeof(T); ++i) {
        data.push_back(static_cast<uint8_t>((value >> ((sizeof(T) - 1 - i) * 8)) & 0xFF));
    }
}
}  // namespace

void Writer::write_uint8(uint8_t value) {
    data_.push_back(value);
}

void Writer::write_uint16_be(uint16_t value) {
    write_be(data_, value);
}

void Writer::write_uint32_be(uint32_t value) {
    write_be(data_, value);
}

void Writer::write_uint64_be(uint64_t value) {
    write_be(data_, value);
}

void Writer::write_raw(const std::string& value) {
    data_.insert(data_.end(), value.begin(), value.end());
}

}  // namespace Trawl::Binary
