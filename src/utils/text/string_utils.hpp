#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace Sightline {
namespace Utils {
namespace Text {

std::string trim(const std::string& str);
std::string rtrim(const std::string& str);
std::string to_lower(const std::string& str);
bool        starts_with(const std::string& str, const std::string& prefix);
bool        ends_with(const std::string& str, const std::string& suffix);
bool        iequals(std::string_view a, std::string_view b);
bool        is_blank(const std::string& str);

// Number of UTF-8 code points; continuation bytes are not counted.
size_t char_length(std::string_view str);

std::string              join(const std::vector<std::string>& parts, const std::string& sep);
std::vector<std::string> split_lines(const std::string& str);
std::vector<std::string> split_words(const std::string& str);

// Rounds to one decimal place, half away from zero.
double round1(double value);

// Shortest decimal form: 47.3, 25, 0.5.
std::string format_decimal(double value);

}  // namespace Text
}  // namespace Utils
}  // namespace Sightline
