// =================================================================
// src/Codefeed/FileReader.cpp
// =================================================================
// Implementation for file size lookup and text reads.

#include "Codefeed/FileReader.hpp"
#include "Codefeed/Errors.hpp"
#include <fstream>
#include <sstream>
#include <system_error>

namespace Codefeed {

std::uint64_t fileSize(const std::filesystem::path& path) {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        throw FileAccessError(ec.message());
    }
    return static_cast<std::uint64_t>(size);
}

std::string readTextFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw FileAccessError("Failed to open file: " + path.string());
    }

    std::ostringstream content;
    content << file.rdbuf();
    if (file.bad()) {
        throw FileAccessError("Failed to read file: " + path.string());
    }

    std::string text = content.str();
    if (!isValidUtf8(text)) {
        throw FileAccessError("stream did not contain valid UTF-8");
    }
    return text;
}

bool isValidUtf8(const std::string& text) {
    size_t i = 0;
    const size_t n = text.size();

    while (i < n) {
        auto lead = static_cast<unsigned char>(text[i]);
        if (lead < 0x80) {
            ++i;
            continue;
        }

        size_t length;
        unsigned char min_second = 0x80;
        unsigned char max_second = 0xbf;

        if (lead >= 0xc2 && lead <= 0xdf) {
            length = 2;
        } else if (lead >= 0xe0 && lead <= 0xef) {
            length = 3;
            if (lead == 0xe0) min_second = 0xa0;      // overlong
            else if (lead == 0xed) max_second = 0x9f; // surrogates
        } else if (lead >= 0xf0 && lead <= 0xf4) {
            length = 4;
            if (lead == 0xf0) min_second = 0x90;      // overlong
            else if (lead == 0xf4) max_second = 0x8f; // above U+10FFFF
        } else {
            return false;
        }

        if (n - i < length) {
            return false;
        }

        auto second = static_cast<unsigned char>(text[i + 1]);
        if (second < min_second || second > max_second) {
            return false;
        }
        for (size_t k = 2; k < length; ++k) {
            auto next = static_cast<unsigned char>(text[i + k]);
            if (next < 0x80 || next > 0xbf) {
                return false;
            }
        }
        i += length;
    }

    return true;
}

std::string trimTrailingWhitespace(const std::string& text) {
    size_t last = text.find_last_not_of(" \t\n\r\f\v");
    if (last == std::string::npos) {
        return "";
    }
    return text.substr(0, last + 1);
}

} // namespace Codefeed
