#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "gatefile/core/error.hpp"
#include "gatefile/core/logging.hpp"
#include "gatefile/util/expected.hpp"

namespace gatefile {

// ============================================================================
// Library Options
// ============================================================================

struct Options {
    // Maximum payload of one outbound frame
    size_t chunk_size = 10 * 1024;

    // In-memory budget for file parts of a form upload; larger parts spill
    // to a temporary file under temp_dir
    int64_t form_memory_limit = 32LL << 20;

    // Total budget for text values of a form upload
    int64_t form_value_limit = 10LL << 20;

    // Cumulative inbound byte limit for uploads, 0 = unlimited
    int64_t upload_size_limit = 0;

    std::filesystem::path temp_dir;

    // Bytes inspected when sniffing a content type
    size_t sniff_length = 512;

    LogLevel log_level = LogLevel::Info;

    // Directory used for spilled form parts (temp_dir, or the system default)
    std::filesystem::path resolved_temp_dir() const;

    // Sets the level of default_logger()
    void apply_logging() const;

    // Defaults overridden by GATEFILE_* environment variables. Values that
    // don't parse are ignored with a warning.
    static Options from_env();

    // Defaults overridden by the snake_case keys of a JSON object
    static expected<Options, Error> from_json(const nlohmann::json& doc);

    static expected<Options, Error> load(const std::filesystem::path& path);
};

} // namespace gatefile
