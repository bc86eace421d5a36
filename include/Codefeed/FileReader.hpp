// =================================================================
// include/Codefeed/FileReader.hpp
// =================================================================
// Size lookup and validated UTF-8 reads for candidate files.

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace Codefeed {

/**
 * @brief On-disk size of a file, following symbolic links
 * @throws FileAccessError if the metadata cannot be read
 */
std::uint64_t fileSize(const std::filesystem::path& path);

/**
 * @brief Read a whole file as UTF-8 text
 * @param path File to read
 * @return The file's bytes, guaranteed to be well-formed UTF-8
 * @throws FileAccessError if the file cannot be read or is not valid UTF-8
 */
std::string readTextFile(const std::filesystem::path& path);

/**
 * @brief Check that a byte string is well-formed UTF-8
 *
 * Rejects overlong encodings, surrogate code points and values above
 * U+10FFFF.
 */
bool isValidUtf8(const std::string& text);

// Drops trailing ASCII whitespace (space, \t, \n, \r, \f, \v).
std::string trimTrailingWhitespace(const std::string& text);

} // namespace Codefeed
