#pragma once

#include <string>
#include <vector>

namespace Trawl {
namespace Utils {
namespace Text {

std::string              trim(const std::string& str);
std::string              to_lower(const std::string& str);
bool                     starts_with(const std::string& str, const std::string& prefix);
bool                     ends_with(const std::string& str, const std::string& suffix);
std::vector<std::string> split(const std::string& str, char delimiter);
std::string              to_hex(const unsigned char* data, size_t length);

}  // namespace Text
}  // namespace Utils
}  // namespace Trawl
