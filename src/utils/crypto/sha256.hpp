#pragma once
#include <array>
#include <string>

namespace Trawl {
namespace Utils {
namespace Crypto {

using Digest = std::array<unsigned char, 32>;

Digest      sha256(const std::string& input);
std::string sha256_hex(const std::string& input);

}  // namespace Crypto
}  // namespace Utils
}  // namespace Trawl
