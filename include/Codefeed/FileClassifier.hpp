// =================================================================
// include/Codefeed/FileClassifier.hpp
// =================================================================
// Text/binary classification by sampling the leading bytes of a file.

#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

namespace Codefeed {

/**
 * @brief Decides whether a file looks like text
 *
 * A file is text when none of its first `sample_size` bytes is a control
 * character other than tab, line feed or carriage return. Bytes at or
 * above 0x80 are accepted, so UTF-8 passes; this is a heuristic, not an
 * encoding detector. An empty file is text.
 */
class FileClassifier {
public:
    static constexpr size_t kDefaultSampleSize = 1024;

    explicit FileClassifier(size_t sample_size = kDefaultSampleSize);
    virtual ~FileClassifier() = default;

    /**
     * @brief Classify a file on disk
     * @param path File to sample
     * @return true if the sampled bytes look like text
     * @throws FileAccessError if the file cannot be opened or read
     */
    virtual bool isTextFile(const std::filesystem::path& path) const;

    /**
     * @brief Classify an in-memory sample
     * @param data Sample bytes
     * @param size Number of bytes in the sample
     * @return true if no disallowed control byte is present
     */
    static bool isTextSample(const char* data, size_t size);

    size_t sampleSize() const { return m_sample_size; }

private:
    size_t m_sample_size;
};

} // namespace Codefeed
