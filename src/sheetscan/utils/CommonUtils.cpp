#include "sheetscan/utils/CommonUtils.hpp"
#include "sheetscan/core/Exception.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <system_error>
#include <fast_float/fast_float.h>
#include <fmt/format.h>

namespace sheetscan {
namespace utils {

namespace {

inline bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

} // namespace

std::string CommonUtils::columnToLetter(int col) {
    std::string result;
    while (col > 0) {
        int rem = (col - 1) % 26;
        result.insert(result.begin(), static_cast<char>('A' + rem));
        col = (col - 1) / 26;
    }
    return result;
}

int CommonUtils::letterToColumn(const std::string& letters) {
    if (letters.empty()) {
        return 0;
    }
    long col = 0;
    for (char ch : letters) {
        char c = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
        if (c < 'A' || c > 'Z') {
            return 0;
        }
        col = col * 26 + (c - 'A' + 1);
        if (col > 16384 * 26) {
            return 0;
        }
    }
    return static_cast<int>(col);
}

std::pair<int, int> CommonUtils::parseReference(const std::string& reference) {
    std::string ref = trim(reference);
    if (ref.empty()) {
        throw core::GridException("Empty cell reference");
    }

    size_t i = 0;
    if (i < ref.size() && ref[i] == '$') ++i;

    std::string letters;
    while (i < ref.size() && std::isalpha(static_cast<unsigned char>(ref[i]))) {
        letters.push_back(ref[i]);
        ++i;
    }
    int col = letterToColumn(letters);
    if (col == 0) {
        throw core::GridException("No column part in reference: " + reference);
    }

    if (i < ref.size() && ref[i] == '$') ++i;

    if (i >= ref.size() || !std::isdigit(static_cast<unsigned char>(ref[i]))) {
        throw core::GridException("No row part in reference: " + reference);
    }

    long row = 0;
    while (i < ref.size() && std::isdigit(static_cast<unsigned char>(ref[i]))) {
        row = row * 10 + (ref[i] - '0');
        if (row > 1048576) {
            throw core::GridException("Row number out of range in reference: " + reference);
        }
        ++i;
    }

    if (row == 0) {
        throw core::GridException("Invalid row number in reference: " + reference);
    }
    if (i < ref.size()) {
        throw core::GridException("Invalid characters at end of reference: " + reference);
    }

    return std::make_pair(static_cast<int>(row), col);
}

std::string CommonUtils::trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && isSpace(s[begin])) ++begin;
    while (end > begin && isSpace(s[end - 1])) --end;
    return s.substr(begin, end - begin);
}

std::string CommonUtils::toLower(const std::string& s) {
    std::string out(s);
    for (char& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

bool CommonUtils::containsIgnoreCase(const std::string& haystack, const std::string& needle) {
    return toLower(haystack).find(toLower(needle)) != std::string::npos;
}

std::vector<std::string> CommonUtils::tokenize(const std::string& s) {
    std::vector<std::string> tokens;
    std::string current;
    for (char c : s) {
        if (std::isalnum(static_cast<unsigned char>(c))) {
            current.push_back(c);
        } else if (!current.empty()) {
            tokens.push_back(current);
            current.clear();
        }
    }
    if (!current.empty()) {
        tokens.push_back(current);
    }
    return tokens;
}

bool CommonUtils::hasLetter(const std::string& s) {
    for (char c : s) {
        if (std::isalpha(static_cast<unsigned char>(c))) return true;
    }
    return false;
}

bool CommonUtils::isDigitsOrPunctuation(const std::string& s) {
    for (char c : s) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (!(std::isdigit(uc) || std::ispunct(uc) || std::isspace(uc))) {
            return false;
        }
    }
    return true;
}

std::optional<double> CommonUtils::parseDouble(const std::string& s) {
    std::string t = trim(s);
    if (!t.empty() && t[0] == '+') {
        t.erase(0, 1);
    }
    if (t.empty()) {
        return std::nullopt;
    }
    // fast_float 接受 "inf"/"nan"，这里只认十进制
    for (char c : t) {
        if (std::isalpha(static_cast<unsigned char>(c)) && c != 'e' && c != 'E') {
            return std::nullopt;
        }
    }
    double value = 0.0;
    auto result = fast_float::from_chars(t.data(), t.data() + t.size(), value);
    if (result.ec != std::errc{} || result.ptr != t.data() + t.size() || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

std::optional<long long> CommonUtils::parseInteger(const std::string& s) {
    std::string t = trim(s);
    if (t.empty()) {
        return std::nullopt;
    }
    size_t i = (t[0] == '-' || t[0] == '+') ? 1 : 0;
    if (i >= t.size()) {
        return std::nullopt;
    }
    for (size_t k = i; k < t.size(); ++k) {
        if (!std::isdigit(static_cast<unsigned char>(t[k]))) {
            return std::nullopt;
        }
    }
    errno = 0;
    char* end = nullptr;
    long long value = std::strtoll(t.c_str(), &end, 10);
    if (errno == ERANGE) {
        return std::nullopt;
    }
    return value;
}

std::string CommonUtils::formatNumber(double value) {
    if (std::isfinite(value) && value == std::floor(value) && std::fabs(value) < 1e15) {
        return fmt::format("{}", static_cast<long long>(value));
    }
    return fmt::format("{}", value);
}

}} // namespace sheetscan::utils
