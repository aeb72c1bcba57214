#include "string_utils.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>

namespace Sightline {
namespace Utils {
namespace Text {

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n\f\v");
    if (std::string::npos == first) {
        return "";
    }
    size_t last = str.find_last_not_of(" \t\r\n\f\v");
    return str.substr(first, (last - first + 1));
}

std::string rtrim(const std::string& str) {
    size_t last = str.find_last_not_of(" \t\r\n\f\v");
    return last == std::string::npos ? "" : str.substr(0, last + 1);
}

std::string to_lower(const std::string& str) {
    std::string lower = str;
    std::transform(
        lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
    return lower;
}

bool starts_with(const std::string& str, const std::string& prefix) {
    return str.rfind(prefix, 0) == 0;
}

bool ends_with(const std::string& str, const std::string& suffix) {
    if (suffix.size() > str.size())
        return false;
    return std::equal(suffix.rbegin(), suffix.rend(), str.rbegin());
}

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size()
           && std::equal(a.begin(), a.end(), b.begin(), [](char c1, char c2) {
                  return std::tolower(static_cast<unsigned char>(c1))
                         == std::tolower(static_cast<unsigned char>(c2));
              });
}

bool is_blank(const std::string& str) {
    return std::all_of(
        str.begin(), str.end(), [](unsigned char c) { return std::isspace(c); });
}

size_t char_length(std::string_view str) {
    return static_cast<size_t>(std::count_if(
        str.begin(), str.end(), [](unsigned char c) { return (c & 0xC0) != 0x80; }));
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0)
            out += sep;
        out += parts[i];
    }
    return out;
}

std::vector<std::string> split_lines(const std::string& str) {
    std::vector<std::string> lines;
    std::stringstream        ss(str);
    std::string              line;
    while (std::getline(ss, line)) {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        lines.push_back(line);
    }
    return lines;
}

std::vector<std::string> split_words(const std::string& str) {
    std::vector<std::string> words;
    std::istringstream       ss(str);
    std::string              word;
    while (ss >> word)
        words.push_back(word);
    return words;
}

double round1(double value) {
    return std::round(value * 10.0) / 10.0;
}

std::string format_decimal(double value) {
    std::ostringstream out;
    out << value;
    return out.str();
}

}  // namespace Text
}  // namespace Utils
}  // namespace Sightline
