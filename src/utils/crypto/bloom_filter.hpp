#pragma once
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace Trawl {
namespace Utils {
namespace Crypto {

// Probabilistic membership set. No false negatives for anything added since the last clear().
class BloomFilter {
public:
    BloomFilter(size_t bit_count, int hash_count);

    // m = ceil(-n ln p / (ln 2)^2), k = max(1, round(m/n ln 2))
    static std::unique_ptr<BloomFilter> with_capacity(size_t expected_elements,
                                                      double false_positive_rate);
    static size_t optimal_bit_count(size_t expected_elements, double false_positive_rate);
    static int    optimal_hash_count(size_t bit_count, size_t expected_elements);

    void add(const std::string& key);
    bool contains(const std::string& key) const;
    void clear();

    size_t bit_count() const {
        return bit_count_;
    }
    int hash_count() const {
        return hash_count_;
    }
    size_t items_added() const;
    size_t set_bits() const;

    // Formula: (1 - e^(-kn/m))^k where k=hashes, n=items, m=bits
    double estimated_false_positive_rate() const;

    std::vector<uint8_t>                serialize() const;
    static std::unique_ptr<BloomFilter> deserialize(const std::vector<uint8_t>& data);

private:
    std::vector<size_t> positions(const std::string& key) const;

    size_t                bit_count_;
    int                   hash_count_;
    std::vector<uint64_t> words_;
    size_t                items_added_ = 0;
    mutable std::mutex    mutex_;
};

}  // namespace Crypto
}  // namespace Utils
}  // namespace Trawl
