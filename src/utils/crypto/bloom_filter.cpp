#include "bloom_filter.hpp"
#include <bit>
#include <cmath>
#include <stdexcept>
#include "../../binary/reader.hpp"
#include "../../binary/writer.hpp"
#include "sha256.hpp"

namespace Trawl {
namespace Utils {
namespace Crypto {

namespace {
constexpr uint32_t MAGIC   = 0x54424C4D;  // "TBLM"
constexpr uint8_t  VERSION = 1;

uint64_t load_u64(const Digest& digest, size_t offset) {
    uint64_t value = 0;
    for (size_t i = 0; i < 8; ++i)
        value = (value << 8) | digest[offset + i];
    return value;
}
}  // namespace

BloomFilter::BloomFilter(size_t bit_count, int hash_count)
    : bit_count_(bit_count), hash_count_(hash_count), words_((bit_count + 63) / 64, 0) {
    if (bit_count == 0 || hash_count < 1)
        throw std::invalid_argument("BloomFilter needs at least one bit and one hash");
}

size_t BloomFilter::optimal_bit_count(size_t expected_elements, double false_positive_rate) {
    if (expected_elements == 0)
        throw std::invalid_argument("expected_elements must be positive");
    if (!(false_positive_rate > 0.0 && false_positive_rate < 1.0))
        throw std::invalid_argument("false_positive_rate must be in (0, 1)");
    const double ln2 = std::log(2.0);
    double       m   = -static_cast<double>(expected_elements) * std::log(false_positive_rate)
               / (ln2 * ln2);
    return static_cast<size_t>(std::ceil(m));
}

int BloomFilter::optimal_hash_count(size_t bit_count, size_t expected_elements) {
    double k = std::round(static_cast<double>(bit_count) / static_cast<double>(expected_elements)
                          * std::log(2.0));
    return std::max(1, static_cast<int>(k));
}

std::unique_ptr<BloomFilter> BloomFilter::with_capacity(size_t expected_elements,
                                                        double false_positive_rate) {
    size_t m = optimal_bit_count(expected_elements, false_positive_rate);
    return std::make_unique<BloomFilter>(m, optimal_hash_count(m, expected_elements));
}

// Double hashing over two 64-bit lanes of the key's SHA-256 digest.
std::vector<size_t> BloomFilter::positions(const std::string& key) const {
    Digest   digest = sha256(key);
    uint64_t h1     = load_u64(digest, 0);
    uint64_t h2     = load_u64(digest, 8) | 1;

    std::vector<size_t> out;
    out.reserve(static_cast<size_t>(hash_count_));
    for (int i = 0; i < hash_count_; ++i) {
        out.push_back(static_cast<size_t>((h1 + static_cast<uint64_t>(i) * h2) % bit_count_));
    }
    return out;
}

void BloomFilter::add(const std::string& key) {
    auto                        bits = positions(key);
    std::lock_guard<std::mutex> lock(mutex_);
    for (size_t bit : bits) {
        words_[bit / 64] |= (uint64_t{1} << (bit % 64));
    }
    ++items_added_;
}

bool BloomFilter::contains(const std::string& key) const {
    auto                        bits = positions(key);
    std::lock_guard<std::mutex> lock(mutex_);
    for (size_t bit : bits) {
        if ((words_[bit / 64] & (uint64_t{1} << (bit % 64))) == 0)
            return false;
    }
    return true;
}

void BloomFilter::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::fill(words_.begin(), words_.end(), 0);
    items_added_ = 0;
}

size_t BloomFilter::items_added() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_added_;
}

size_t BloomFilter::set_bits() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t                      count = 0;
    for (uint64_t word : words_)
        count += static_cast<size_t>(std::popcount(word));
    return count;
}

double BloomFilter::estimated_false_positive_rate() const {
    std::lock_guard<std::mutex> lock(mutex_);
    double                      k        = static_cast<double>(hash_count_);
    double                      n        = static_cast<double>(items_added_);
    double                      m        = static_cast<double>(bit_count_);
    double                      exponent = -k * n / m;
    return std::pow(1.0 - std::exp(exponent), k);
}

std::vector<uint8_t> BloomFilter::serialize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<uint8_t>        out;
    out.reserve(32 + words_.size() * 8);

    Binary::Writer writer(out);
    writer.write_uint32_be(MAGIC);
    writer.write_uint8(VERSION);
    writer.write_uint64_be(bit_count_);
    writer.write_uint32_be(static_cast<uint32_t>(hash_count_));
    writer.write_uint64_be(items_added_);
    for (uint64_t word : words_)
        writer.write_uint64_be(word);
    return out;
}

std::unique_ptr<BloomFilter> BloomFilter::deserialize(const std::vector<uint8_t>& data) {
    Binary::Reader reader(data);
    if (reader.read_uint32_be() != MAGIC)
        throw std::invalid_argument("Not a serialized bloom filter");
    uint8_t version = reader.read_uint8();
    if (version != VERSION)
        throw std::invalid_argument("Unsupported bloom filter version " + std::to_string(version));

    size_t bit_count  = static_cast<size_t>(reader.read_uint64_be());
    int    hash_count = static_cast<int>(reader.read_uint32_be());
    size_t items      = static_cast<size_t>(reader.read_uint64_be());

    auto filter = std::make_unique<BloomFilter>(bit_count, hash_count);
    for (auto& word : filter->words_)
        word = reader.read_uint64_be();
    filter->items_added_ = items;
    return filter;
}

}  // namespace Crypto
}  // namespace Utils
}  // namespace Trawl
