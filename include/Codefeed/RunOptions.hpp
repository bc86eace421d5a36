// =================================================================
// include/Codefeed/RunOptions.hpp
// =================================================================
// Run configuration, filled in from the command line and environment.

#pragma once

#include "Codefeed/Limiter.hpp"
#include <cstdint>
#include <string>

namespace Codefeed {

// Everything a run is configured with.
struct RunOptions {
    bool report = false;

    std::uint64_t max_file_size = Limits::kDefaultMaxFileSize;
    std::uint64_t max_total_size = Limits::kDefaultMaxTotalSize;
    size_t max_files = Limits::kDefaultMaxFiles;

    std::string tokenizer_model;  // GGUF file; empty selects the estimator

    int verbosity = 0;            // 0 quiet, 1 info, 2+ debug
    std::string log_file;

    Limits limits() const {
        Limits limits;
        limits.max_files = max_files;
        limits.max_total_size = max_total_size;
        limits.max_file_size = max_file_size;
        return limits;
    }
};

} // namespace Codefeed
