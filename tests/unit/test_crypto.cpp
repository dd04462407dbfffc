#include <gtest/gtest.h>
#include <stdexcept>
#include <thread>
#include "../../src/utils/crypto/bloom_filter.hpp"
#include "../../src/utils/crypto/sha256.hpp"

using namespace Trawl::Utils::Crypto;

TEST(CryptoTest, Sha256KnownVector) {
    EXPECT_EQ(sha256_hex("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(sha256_hex("").size(), 64u);
}

TEST(CryptoTest, BloomFilterProperties) {
    BloomFilter filter(100, 3);

    std::vector<std::string> inserted;
    for (int i = 0; i < 50; ++i) {
        std::string key = "key_" + std::to_string(i);
        filter.add(key);
        inserted.push_back(key);
    }

    for (const auto& key : inserted) {
        EXPECT_TRUE(filter.contains(key));
    }
    EXPECT_EQ(filter.items_added(), 50u);

    filter.clear();
    for (const auto& key : inserted) {
        EXPECT_FALSE(filter.contains(key));
    }
    EXPECT_EQ(filter.set_bits(), 0u);
}

TEST(CryptoTest, SizingIsPositiveForAnyCapacity) {
    for (size_t n : {size_t{1}, size_t{2}, size_t{1000}, size_t{1000000}}) {
        for (double p : {0.5, 0.01, 0.0001}) {
            size_t m = BloomFilter::optimal_bit_count(n, p);
            EXPECT_GT(m, 0u);
            EXPECT_GE(BloomFilter::optimal_hash_count(m, n), 1);
        }
    }
}

TEST(CryptoTest, SizingForOneMillionAtOnePercent) {
    auto filter = BloomFilter::with_capacity(1000000, 0.01);
    EXPECT_EQ(filter->bit_count(), 9585059u);
    EXPECT_EQ(filter->hash_count(), 7);
}

TEST(CryptoTest, SizingRejectsBadParameters) {
    EXPECT_THROW(BloomFilter::optimal_bit_count(0, 0.01), std::invalid_argument);
    EXPECT_THROW(BloomFilter::optimal_bit_count(10, 0.0), std::invalid_argument);
    EXPECT_THROW(BloomFilter::optimal_bit_count(10, 1.0), std::invalid_argument);
    EXPECT_THROW(BloomFilter(0, 1), std::invalid_argument);
}

TEST(CryptoTest, BloomFilterFalsePositives) {
    auto filter = BloomFilter::with_capacity(1000, 0.01);
    for (int i = 0; i < 1000; ++i) {
        filter->add("present_" + std::to_string(i));
    }

    int false_positives = 0;
    for (int i = 0; i < 10000; ++i) {
        if (filter->contains("absent_" + std::to_string(i)))
            false_positives++;
    }
    EXPECT_LT(false_positives, 300);
    EXPECT_NEAR(filter->estimated_false_positive_rate(), 0.01, 0.005);
}

TEST(CryptoTest, BloomFilterConcurrency) {
    BloomFilter              filter(10000, 5);
    std::vector<std::thread> threads;
    for (int i = 0; i < 10; ++i) {
        threads.emplace_back([&filter, i]() {
            for (int j = 0; j < 100; ++j) {
                filter.add("thread_" + std::to_string(i) + "_" + std::to_string(j));
            }
        });
    }
    for (auto& t : threads)
        t.join();

    for (int i = 0; i < 10; ++i) {
        for (int j = 0; j < 100; ++j) {
            EXPECT_TRUE(filter.contains("thread_" + std::to_string(i) + "_" + std::to_string(j)));
        }
    }
}

TEST(CryptoTest, SerializedFilterAnswersTheSame) {
    BloomFilter filter(4096, 4);
    filter.add("did:plc:alice");
    filter.add("did:plc:bob");

    auto restored = BloomFilter::deserialize(filter.serialize());
    EXPECT_EQ(restored->bit_count(), 4096u);
    EXPECT_EQ(restored->hash_count(), 4);
    EXPECT_EQ(restored->items_added(), 2u);
    EXPECT_TRUE(restored->contains("did:plc:alice"));
    EXPECT_TRUE(restored->contains("did:plc:bob"));
    EXPECT_EQ(restored->set_bits(), filter.set_bits());
}

TEST(CryptoTest, DeserializeRejectsForeignBytes) {
    std::vector<uint8_t> junk = {0x01, 0x02, 0x03, 0x04, 0x05};
    EXPECT_THROW(BloomFilter::deserialize(junk), std::invalid_argument);

    std::vector<uint8_t> truncated = BloomFilter(128, 2).serialize();
    truncated.resize(truncated.size() - 4);
    EXPECT_THROW(BloomFilter::deserialize(truncated), std::out_of_range);
}
