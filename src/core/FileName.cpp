/**
 * @file FileName.cpp
 * @brief Turning peer-declared file names into safe local names
 */

#include "chunkwire/FileName.h"

#include <algorithm>
#include <cctype>
#include <string_view>

namespace ChunkWire {
namespace {

constexpr size_t kMaxFileNameBytes = 240;

bool isControlChar(unsigned char ch) {
    return ch < 32 || ch == 127;
}

// Characters rejected by at least one common filesystem
bool isReplacedChar(unsigned char ch) {
    switch (ch) {
    case '<':
    case '>':
    case ':':
    case '"':
    case '/':
    case '\\':
    case '|':
    case '?':
    case '*':
        return true;
    default:
        return false;
    }
}

std::string toUpperAscii(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char ch : s) {
        out.push_back(static_cast<char>(std::toupper(ch)));
    }
    return out;
}

bool isReservedDeviceName(std::string_view upperStem) {
    if (upperStem == "CON" || upperStem == "PRN" || upperStem == "AUX" || upperStem == "NUL") {
        return true;
    }
    if (upperStem.size() == 4) {
        const auto prefix = upperStem.substr(0, 3);
        const char digit = upperStem[3];
        if ((prefix == "COM" || prefix == "LPT") && digit >= '1' && digit <= '9') {
            return true;
        }
    }
    return false;
}

// "LPT1.tar.gz" is still the LPT1 device: match on everything before the first dot
std::string_view stemBeforeFirstDot(std::string_view name) {
    const auto dot = name.find('.');
    return dot == std::string_view::npos ? name : name.substr(0, dot);
}

void trimTrailingDotsAndSpaces(std::string& s) {
    while (!s.empty() && (s.back() == ' ' || s.back() == '.')) {
        s.pop_back();
    }
}

}  // namespace

bool sanitizeFileName(std::string& name) {
    const auto lastSeparator = name.find_last_of("/\\");
    if (lastSeparator != std::string::npos) {
        name.erase(0, lastSeparator + 1);
    }
    if (name.empty()) {
        return false;
    }

    for (char& ch : name) {
        const unsigned char uch = static_cast<unsigned char>(ch);
        if (isControlChar(uch)) {
            return false;
        }
        if (isReplacedChar(uch)) {
            ch = '_';
        }
    }

    size_t pos = 0;
    while ((pos = name.find("..", pos)) != std::string::npos) {
        name.replace(pos, 2, "__");
    }

    trimTrailingDotsAndSpaces(name);

    if (name.empty() || name.find_first_not_of("._ ") == std::string::npos) {
        return false;
    }
    if (name.size() > kMaxFileNameBytes) {
        return false;
    }
    return !isReservedDeviceName(toUpperAscii(stemBeforeFirstDot(name)));
}

bool isSafeFileName(const std::string& name) {
    std::string copy = name;
    return sanitizeFileName(copy) && copy == name;
}

std::string safeFileNameOr(const std::string& declared, const std::string& fallback) {
    std::string name = declared;
    if (sanitizeFileName(name)) {
        return name;
    }
    name = fallback;
    if (sanitizeFileName(name)) {
        return name;
    }
    return "received.bin";
}

}  // namespace ChunkWire
