// =================================================================
// src/Codefeed/FileClassifier.cpp
// =================================================================
// Implementation for text/binary classification.

#include "Codefeed/FileClassifier.hpp"
#include "Codefeed/Errors.hpp"
#include <fstream>
#include <vector>

namespace Codefeed {

FileClassifier::FileClassifier(size_t sample_size)
    : m_sample_size(sample_size)
{
}

bool FileClassifier::isTextFile(const std::filesystem::path& path) const {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw FileAccessError("Failed to open file: " + path.string());
    }

    std::vector<char> buffer(m_sample_size);
    file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    if (file.bad()) {
        throw FileAccessError("Failed to read file: " + path.string());
    }

    return isTextSample(buffer.data(), static_cast<size_t>(file.gcount()));
}

bool FileClassifier::isTextSample(const char* data, size_t size) {
    for (size_t i = 0; i < size; ++i) {
        auto byte = static_cast<unsigned char>(data[i]);
        if (byte < 0x20 && byte != 0x09 && byte != 0x0a && byte != 0x0d) {
            return false;
        }
    }
    return true;
}

} // namespace Codefeed
