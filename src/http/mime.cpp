#include "gatefile/http/mime.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace gatefile::mime {

// ============================================================================
// Extension Table
// ============================================================================

namespace {

const std::unordered_map<std::string, std::string_view> builtin_types = {
    // Text
    {"html", "text/html; charset=utf-8"},
    {"htm", "text/html; charset=utf-8"},
    {"css", "text/css; charset=utf-8"},
    {"js", "text/javascript; charset=utf-8"},
    {"mjs", "text/javascript; charset=utf-8"},
    {"json", "application/json"},
    {"xml", "text/xml; charset=utf-8"},
    {"txt", "text/plain; charset=utf-8"},
    {"csv", "text/csv; charset=utf-8"},
    {"md", "text/markdown; charset=utf-8"},

    // Images
    {"png", "image/png"},
    {"jpg", "image/jpeg"},
    {"jpeg", "image/jpeg"},
    {"gif", "image/gif"},
    {"svg", "image/svg+xml"},
    {"ico", "image/x-icon"},
    {"webp", "image/webp"},
    {"avif", "image/avif"},
    {"bmp", "image/bmp"},
    {"tiff", "image/tiff"},
    {"tif", "image/tiff"},

    // Fonts
    {"woff", "font/woff"},
    {"woff2", "font/woff2"},
    {"ttf", "font/ttf"},
    {"otf", "font/otf"},

    // Audio and video
    {"mp3", "audio/mpeg"},
    {"wav", "audio/wav"},
    {"ogg", "audio/ogg"},
    {"flac", "audio/flac"},
    {"mp4", "video/mp4"},
    {"webm", "video/webm"},
    {"mov", "video/quicktime"},

    // Documents and archives
    {"pdf", "application/pdf"},
    {"zip", "application/zip"},
    {"gz", "application/gzip"},
    {"tar", "application/x-tar"},
    {"7z", "application/x-7z-compressed"},
    {"wasm", "application/wasm"},
};

std::string normalize_extension(std::string_view ext) {
    if (!ext.empty() && ext.front() == '.') {
        ext.remove_prefix(1);
    }
    std::string result(ext);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

struct Registry {
    std::mutex mutex;
    std::unordered_map<std::string, std::string> types;
};

Registry& registry() {
    static Registry instance;
    return instance;
}

} // anonymous namespace

std::string type_by_extension(std::string_view extension) {
    std::string ext = normalize_extension(extension);
    if (ext.empty()) {
        return {};
    }

    {
        auto& reg = registry();
        std::lock_guard<std::mutex> lock(reg.mutex);
        auto it = reg.types.find(ext);
        if (it != reg.types.end()) {
            return it->second;
        }
    }

    auto it = builtin_types.find(ext);
    if (it != builtin_types.end()) {
        return std::string(it->second);
    }
    return {};
}

std::string type_by_name(std::string_view name) {
    auto slash = name.rfind('/');
    if (slash != std::string_view::npos) {
        name.remove_prefix(slash + 1);
    }
    auto dot = name.rfind('.');
    if (dot == std::string_view::npos || dot + 1 == name.size()) {
        return {};
    }
    return type_by_extension(name.substr(dot + 1));
}

void register_type(std::string_view extension, std::string mime_type) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    reg.types[normalize_extension(extension)] = std::move(mime_type);
}

// ============================================================================
// Content Sniffing
// ============================================================================

namespace {

bool is_ws(uint8_t b) {
    return b == '\t' || b == '\n' || b == '\x0c' || b == '\r' || b == ' ';
}

bool is_tag_terminator(uint8_t b) {
    return b == ' ' || b == '>';
}

// Bytes that never appear in plain text
bool is_binary(uint8_t b) {
    return b <= 0x08 || b == 0x0B || (b >= 0x0E && b <= 0x1A) || (b >= 0x1C && b <= 0x1F);
}

using Bytes = std::string_view;

class Signature {
public:
    virtual ~Signature() = default;
    // `first_non_ws` is the index of the first non-whitespace byte
    virtual std::string_view match(Bytes data, size_t first_non_ws) const = 0;
};

class ExactSig : public Signature {
    Bytes sig_;
    std::string_view type_;

public:
    ExactSig(Bytes sig, std::string_view type) : sig_(sig), type_(type) {}

    std::string_view match(Bytes data, size_t) const override {
        return data.substr(0, sig_.size()) == sig_ ? type_ : std::string_view{};
    }
};

class MaskedSig : public Signature {
    Bytes mask_;
    Bytes pattern_;
    bool skip_ws_;
    std::string_view type_;

public:
    MaskedSig(Bytes mask, Bytes pattern, bool skip_ws, std::string_view type)
        : mask_(mask), pattern_(pattern), skip_ws_(skip_ws), type_(type) {}

    std::string_view match(Bytes data, size_t first_non_ws) const override {
        if (skip_ws_) {
            data.remove_prefix(first_non_ws);
        }
        if (pattern_.size() != mask_.size() || data.size() < pattern_.size()) {
            return {};
        }
        for (size_t i = 0; i < pattern_.size(); ++i) {
            auto db = static_cast<uint8_t>(data[i]) & static_cast<uint8_t>(mask_[i]);
            if (db != static_cast<uint8_t>(pattern_[i])) {
                return {};
            }
        }
        return type_;
    }
};

// Case-insensitive tag prefix followed by a space or '>'
class HtmlSig : public Signature {
    Bytes tag_;

public:
    explicit HtmlSig(Bytes tag) : tag_(tag) {}

    std::string_view match(Bytes data, size_t first_non_ws) const override {
        data.remove_prefix(first_non_ws);
        if (data.size() < tag_.size() + 1) {
            return {};
        }
        for (size_t i = 0; i < tag_.size(); ++i) {
            auto b = static_cast<uint8_t>(tag_[i]);
            auto db = static_cast<uint8_t>(data[i]);
            if (b >= 'A' && b <= 'Z') {
                db &= 0xDF;
            }
            if (b != db) {
                return {};
            }
        }
        if (!is_tag_terminator(static_cast<uint8_t>(data[tag_.size()]))) {
            return {};
        }
        return "text/html; charset=utf-8";
    }
};

// ISO base media file: an ftyp box listing an mp4 brand
class Mp4Sig : public Signature {
public:
    std::string_view match(Bytes data, size_t) const override {
        if (data.size() < 12) {
            return {};
        }
        uint32_t box_size = (static_cast<uint32_t>(static_cast<uint8_t>(data[0])) << 24) |
                            (static_cast<uint32_t>(static_cast<uint8_t>(data[1])) << 16) |
                            (static_cast<uint32_t>(static_cast<uint8_t>(data[2])) << 8) |
                            static_cast<uint32_t>(static_cast<uint8_t>(data[3]));
        if (data.size() < box_size || box_size % 4 != 0) {
            return {};
        }
        if (data.substr(4, 4) != "ftyp") {
            return {};
        }
        for (size_t st = 8; st < box_size; st += 4) {
            if (st == 12) {
                continue; // minor version
            }
            if (data.substr(st, 3) == "mp4") {
                return "video/mp4";
            }
        }
        return {};
    }
};

class TextSig : public Signature {
public:
    std::string_view match(Bytes data, size_t first_non_ws) const override {
        for (size_t i = first_non_ws; i < data.size(); ++i) {
            if (is_binary(static_cast<uint8_t>(data[i]))) {
                return {};
            }
        }
        return "text/plain; charset=utf-8";
    }
};

using namespace std::string_view_literals;

const std::vector<std::unique_ptr<Signature>>& signatures() {
    static const auto table = [] {
        std::vector<std::unique_ptr<Signature>> sigs;
        for (auto tag : {"<!DOCTYPE HTML"sv, "<HTML"sv, "<HEAD"sv, "<SCRIPT"sv, "<IFRAME"sv,
                         "<H1"sv, "<DIV"sv, "<FONT"sv, "<TABLE"sv, "<A"sv, "<STYLE"sv,
                         "<TITLE"sv, "<B"sv, "<BODY"sv, "<BR"sv, "<P"sv, "<!--"sv}) {
            sigs.push_back(std::make_unique<HtmlSig>(tag));
        }
        sigs.push_back(std::make_unique<MaskedSig>(
            "\xFF\xFF\xFF\xFF\xFF"sv, "<?xml"sv, true, "text/xml; charset=utf-8"));
        sigs.push_back(std::make_unique<ExactSig>("%PDF-"sv, "application/pdf"));
        sigs.push_back(std::make_unique<ExactSig>("%!PS-Adobe-"sv, "application/postscript"));

        // Byte order marks
        sigs.push_back(std::make_unique<MaskedSig>(
            "\xFF\xFF\x00\x00"sv, "\xFE\xFF\x00\x00"sv, false, "text/plain; charset=utf-16be"));
        sigs.push_back(std::make_unique<MaskedSig>(
            "\xFF\xFF\x00\x00"sv, "\xFF\xFE\x00\x00"sv, false, "text/plain; charset=utf-16le"));
        sigs.push_back(std::make_unique<MaskedSig>(
            "\xFF\xFF\xFF\x00"sv, "\xEF\xBB\xBF\x00"sv, false, "text/plain; charset=utf-8"));

        // Images
        sigs.push_back(std::make_unique<ExactSig>("\x00\x00\x01\x00"sv, "image/x-icon"));
        sigs.push_back(std::make_unique<ExactSig>("\x00\x00\x02\x00"sv, "image/x-icon"));
        sigs.push_back(std::make_unique<ExactSig>("BM"sv, "image/bmp"));
        sigs.push_back(std::make_unique<ExactSig>("GIF87a"sv, "image/gif"));
        sigs.push_back(std::make_unique<ExactSig>("GIF89a"sv, "image/gif"));
        sigs.push_back(std::make_unique<MaskedSig>(
            "\xFF\xFF\xFF\xFF\x00\x00\x00\x00\xFF\xFF\xFF\xFF\xFF\xFF"sv,
            "RIFF\x00\x00\x00\x00WEBPVP"sv, false, "image/webp"));
        sigs.push_back(std::make_unique<ExactSig>("\x89PNG\x0D\x0A\x1A\x0A"sv, "image/png"));
        sigs.push_back(std::make_unique<ExactSig>("\xFF\xD8\xFF"sv, "image/jpeg"));

        // Audio and video
        sigs.push_back(std::make_unique<MaskedSig>(
            "\xFF\xFF\xFF\xFF\x00\x00\x00\x00\xFF\xFF\xFF\xFF"sv,
            "FORM\x00\x00\x00\x00" "AIFF"sv, false, "audio/aiff"));
        sigs.push_back(std::make_unique<MaskedSig>(
            "\xFF\xFF\xFF"sv, "ID3"sv, false, "audio/mpeg"));
        sigs.push_back(std::make_unique<MaskedSig>(
            "\xFF\xFF\xFF\xFF\xFF"sv, "OggS\x00"sv, false, "application/ogg"));
        sigs.push_back(std::make_unique<MaskedSig>(
            "\xFF\xFF\xFF\xFF\xFF\xFF\xFF\xFF"sv, "MThd\x00\x00\x00\x06"sv, false, "audio/midi"));
        sigs.push_back(std::make_unique<MaskedSig>(
            "\xFF\xFF\xFF\xFF\x00\x00\x00\x00\xFF\xFF\xFF\xFF"sv,
            "RIFF\x00\x00\x00\x00" "AVI "sv, false, "video/avi"));
        sigs.push_back(std::make_unique<MaskedSig>(
            "\xFF\xFF\xFF\xFF\x00\x00\x00\x00\xFF\xFF\xFF\xFF"sv,
            "RIFF\x00\x00\x00\x00WAVE"sv, false, "audio/wave"));
        sigs.push_back(std::make_unique<Mp4Sig>());
        sigs.push_back(std::make_unique<ExactSig>("\x1A\x45\xDF\xA3"sv, "video/webm"));

        // Fonts
        sigs.push_back(std::make_unique<ExactSig>("\x00\x01\x00\x00"sv, "font/ttf"));
        sigs.push_back(std::make_unique<ExactSig>("OTTO"sv, "font/otf"));
        sigs.push_back(std::make_unique<ExactSig>("ttcf"sv, "font/collection"));
        sigs.push_back(std::make_unique<ExactSig>("wOFF"sv, "font/woff"));
        sigs.push_back(std::make_unique<ExactSig>("wOF2"sv, "font/woff2"));

        // Archives
        sigs.push_back(std::make_unique<ExactSig>("\x1F\x8B\x08"sv, "application/x-gzip"));
        sigs.push_back(std::make_unique<ExactSig>("PK\x03\x04"sv, "application/zip"));
        sigs.push_back(std::make_unique<ExactSig>("Rar!\x1A\x07\x00"sv, "application/x-rar-compressed"));
        sigs.push_back(std::make_unique<ExactSig>("Rar!\x1A\x07\x01\x00"sv, "application/x-rar-compressed"));
        sigs.push_back(std::make_unique<ExactSig>("\x00\x61\x73\x6D"sv, "application/wasm"));

        sigs.push_back(std::make_unique<TextSig>());
        return sigs;
    }();
    return table;
}

} // anonymous namespace

std::string detect_content_type(std::string_view data) {
    if (data.size() > sniff_length) {
        data = data.substr(0, sniff_length);
    }

    size_t first_non_ws = 0;
    while (first_non_ws < data.size() && is_ws(static_cast<uint8_t>(data[first_non_ws]))) {
        ++first_non_ws;
    }

    for (const auto& sig : signatures()) {
        auto type = sig->match(data, first_non_ws);
        if (!type.empty()) {
            return std::string(type);
        }
    }
    return "application/octet-stream";
}

// ============================================================================
// Media Type Parsing
// ============================================================================

namespace {

bool is_tspecial(char c) {
    return std::string_view("()<>@,;:\\\"/[]?=").find(c) != std::string_view::npos;
}

bool is_token_char(char c) {
    auto u = static_cast<unsigned char>(c);
    return u > 0x20 && u < 0x7F && !is_tspecial(c);
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

std::string lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

size_t token_length(std::string_view s) {
    size_t n = 0;
    while (n < s.size() && is_token_char(s[n])) {
        ++n;
    }
    return n;
}

Error invalid_media_type(std::string_view what) {
    return Error::io(IoError::InvalidArgument, "mime: " + std::string(what));
}

// Consumes a token or quoted-string value from s
expected<std::string, Error> consume_value(std::string_view& s) {
    if (s.empty()) {
        return unexpected(invalid_media_type("missing parameter value"));
    }
    if (s.front() != '"') {
        size_t n = token_length(s);
        if (n == 0) {
            return unexpected(invalid_media_type("invalid parameter value"));
        }
        std::string value(s.substr(0, n));
        s.remove_prefix(n);
        return value;
    }

    std::string value;
    for (size_t i = 1; i < s.size(); ++i) {
        char c = s[i];
        if (c == '"') {
            s.remove_prefix(i + 1);
            return value;
        }
        // Only tspecials are escaped; other backslashes stay (Windows paths)
        if (c == '\\' && i + 1 < s.size() && is_tspecial(s[i + 1])) {
            value += s[++i];
            continue;
        }
        if (c == '\r' || c == '\n') {
            break;
        }
        value += c;
    }
    return unexpected(invalid_media_type("unterminated quoted-string"));
}

} // anonymous namespace

std::string MediaType::param(std::string_view key) const {
    auto it = params.find(lower(key));
    return it == params.end() ? std::string{} : it->second;
}

expected<MediaType, Error> parse_media_type(std::string_view value) {
    auto semi = value.find(';');
    std::string_view base = trim(value.substr(0, semi));

    // type, or type "/" subtype
    size_t n = token_length(base);
    if (n == 0) {
        return unexpected(invalid_media_type("no media type"));
    }
    if (n < base.size()) {
        if (base[n] != '/' || token_length(base.substr(n + 1)) != base.size() - n - 1 ||
            n + 1 == base.size()) {
            return unexpected(invalid_media_type("expected token after slash"));
        }
    }

    MediaType result;
    result.type = lower(base);

    if (semi == std::string_view::npos) {
        return result;
    }

    std::string_view rest = value.substr(semi);
    for (;;) {
        rest = trim(rest);
        if (rest.empty()) {
            break;
        }
        if (rest.front() != ';') {
            return unexpected(invalid_media_type("invalid media parameter"));
        }
        rest.remove_prefix(1);
        rest = trim(rest);
        if (rest.empty()) {
            break; // trailing semicolon
        }

        size_t key_len = token_length(rest);
        if (key_len == 0) {
            return unexpected(invalid_media_type("invalid media parameter"));
        }
        std::string key = lower(rest.substr(0, key_len));
        rest.remove_prefix(key_len);
        rest = trim(rest);
        if (rest.empty() || rest.front() != '=') {
            return unexpected(invalid_media_type("invalid media parameter"));
        }
        rest.remove_prefix(1);
        rest = trim(rest);

        auto param_value = consume_value(rest);
        if (!param_value) {
            return unexpected(param_value.error());
        }
        if (result.params.count(key) != 0) {
            return unexpected(invalid_media_type("duplicate parameter name"));
        }
        result.params.emplace(std::move(key), std::move(*param_value));
    }
    return result;
}

} // namespace gatefile::mime
