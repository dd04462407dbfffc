#include "sha256.hpp"
#include <openssl/evp.h>
#include <stdexcept>
#include "../text/string_utils.hpp"

namespace Trawl {
namespace Utils {
namespace Crypto {

Digest sha256(const std::string& input) {
    Digest       digest{};
    unsigned int length = 0;
    if (EVP_Digest(input.data(), input.size(), digest.data(), &length, EVP_sha256(), nullptr)
            != 1
        || length != digest.size()) {
        throw std::runtime_error("EVP_Digest(sha256) failed");
    }
    return digest;
}

std::string sha256_hex(const std::string& input) {
    Digest digest = sha256(input);
    return Text::to_hex(digest.data(), digest.size());
}

}  // namespace Crypto
}  // namespace Utils
}  // namespace Trawl
