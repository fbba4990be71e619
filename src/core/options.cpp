#include "gatefile/core/options.hpp"

#include <cstdlib>
#include <fstream>
#include <system_error>

#include <nlohmann/json.hpp>

#include "gatefile/util/from_string.hpp"

namespace gatefile {

namespace {

template<typename T>
void override_from_env(const char* name, T& target) {
    const char* raw = std::getenv(name);
    if (!raw || !*raw) {
        return;
    }
    auto parsed = from_string<T>(raw);
    if (!parsed) {
        default_logger().log(default_logger()
            .entry(LogLevel::Warn, "ignoring invalid environment value")
            .field("name", name)
            .field("error", parsed.error().to_string()));
        return;
    }
    target = *parsed;
}

template<typename T>
expected<void, Error> read_number(const nlohmann::json& doc, const char* key, T& target) {
    auto it = doc.find(key);
    if (it == doc.end()) {
        return {};
    }
    if (!it->is_number_integer() || it->get<int64_t>() < 0) {
        return unexpected(Error::io(IoError::InvalidArgument,
            std::string("option '") + key + "' must be a non-negative integer"));
    }
    target = static_cast<T>(it->get<int64_t>());
    return {};
}

expected<void, Error> read_string(const nlohmann::json& doc, const char* key, std::string& target) {
    auto it = doc.find(key);
    if (it == doc.end()) {
        return {};
    }
    if (!it->is_string()) {
        return unexpected(Error::io(IoError::InvalidArgument,
            std::string("option '") + key + "' must be a string"));
    }
    target = it->get<std::string>();
    return {};
}

} // anonymous namespace

std::filesystem::path Options::resolved_temp_dir() const {
    if (!temp_dir.empty()) {
        return temp_dir;
    }
    std::error_code ec;
    auto dir = std::filesystem::temp_directory_path(ec);
    if (ec) {
        return "/tmp";
    }
    return dir;
}

void Options::apply_logging() const {
    default_logger().set_level(log_level);
}

Options Options::from_env() {
    Options options;

    override_from_env("GATEFILE_CHUNK_SIZE", options.chunk_size);
    override_from_env("GATEFILE_FORM_MEMORY_LIMIT", options.form_memory_limit);
    override_from_env("GATEFILE_FORM_VALUE_LIMIT", options.form_value_limit);
    override_from_env("GATEFILE_UPLOAD_SIZE_LIMIT", options.upload_size_limit);

    if (const char* dir = std::getenv("GATEFILE_TEMP_DIR")) {
        options.temp_dir = dir;
    }
    if (const char* level = std::getenv("GATEFILE_LOG_LEVEL")) {
        options.log_level = parse_log_level(level);
    }

    if (options.chunk_size == 0) {
        options.chunk_size = Options{}.chunk_size;
    }
    return options;
}

expected<Options, Error> Options::from_json(const nlohmann::json& doc) {
    if (!doc.is_object()) {
        return unexpected(Error::io(IoError::InvalidArgument,
            "options document must be a JSON object"));
    }

    Options options;

    for (auto result : {
            read_number(doc, "chunk_size", options.chunk_size),
            read_number(doc, "form_memory_limit", options.form_memory_limit),
            read_number(doc, "form_value_limit", options.form_value_limit),
            read_number(doc, "upload_size_limit", options.upload_size_limit),
            read_number(doc, "sniff_length", options.sniff_length)}) {
        if (!result) {
            return unexpected(result.error());
        }
    }

    std::string temp_dir;
    if (auto r = read_string(doc, "temp_dir", temp_dir); !r) {
        return unexpected(r.error());
    }
    if (!temp_dir.empty()) {
        options.temp_dir = temp_dir;
    }

    std::string level;
    if (auto r = read_string(doc, "log_level", level); !r) {
        return unexpected(r.error());
    }
    if (!level.empty()) {
        options.log_level = parse_log_level(level);
    }

    if (options.chunk_size == 0) {
        return unexpected(Error::io(IoError::InvalidArgument,
            "option 'chunk_size' must be positive"));
    }
    return options;
}

expected<Options, Error> Options::load(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return unexpected(Error::io(IoError::InvalidArgument,
            "cannot open options file " + path.string()));
    }

    auto doc = nlohmann::json::parse(in, nullptr, false);
    if (doc.is_discarded()) {
        return unexpected(Error::io(IoError::InvalidArgument,
            "options file is not valid JSON: " + path.string()));
    }
    return from_json(doc);
}

} // namespace gatefile
