#include "gatefile/server/content_server.hpp"

#include <filesystem>
#include <memory>

#include "gatefile/http/mime.hpp"
#include "gatefile/http/range.hpp"
#include "gatefile/io/stream.hpp"
#include "gatefile/server/multirange.hpp"
#include "gatefile/transport/chunk_stream.hpp"

namespace gatefile {

namespace {

constexpr std::string_view kErrorContentType = "text/plain; charset=utf-8";

} // anonymous namespace

ContentServer::ContentServer(FrameSender& sender, Options options)
    : sender_(sender), options_(std::move(options)) {}

expected<void, Error> ContentServer::commit() {
    if (committed_) {
        return unexpected(Error::io(IoError::InvalidArgument, "response headers already committed"));
    }
    committed_ = true;

    auto sent = sender_.send_header(headers_);
    if (!sent) {
        default_logger().log(default_logger()
            .entry(LogLevel::Error, "sending response headers failed")
            .field("error", sent.error().to_string()));
        return unexpected(sent.error());
    }
    return {};
}

expected<void, Error> ContentServer::serve_error(std::string_view text, int status) {
    for (auto name : {header::cache_control, header::content_encoding, header::etag,
                      header::last_modified, header::content_length}) {
        headers_.erase(name);
    }
    headers_.set(header::content_type, std::string(kErrorContentType));
    headers_.set(header::x_content_type_options, "nosniff");
    headers_.set_status(status);

    default_logger().log(default_logger()
        .entry(LogLevel::Warn, "serving error response")
        .field("status", status)
        .field("reason", text));

    if (auto committed = commit(); !committed) {
        return committed;
    }

    Frame frame;
    frame.content_type = std::string(kErrorContentType);
    frame.data = std::string(text);
    return sender_.send(frame);
}

expected<void, Error> ContentServer::serve_file(const std::string& path, std::string content_type) {
    auto clean = std::filesystem::path(path).lexically_normal().string();

    auto file = FileSource::open(clean);
    if (!file) {
        return unexpected(file.error());
    }
    if ((*file)->is_directory()) {
        return unexpected(Error::file(FileError::InvalidPath, "invalid path " + clean));
    }

    auto& source = **file;
    return serve_content(source, std::move(content_type), source.name(), source.mod_time(), source.size());
}

expected<void, Error> ContentServer::serve(const Resource& resource) {
    if (!resource.content) {
        return unexpected(Error::io(IoError::InvalidArgument, "resource has no content"));
    }
    if (!resource.etag.empty()) {
        headers_.set(header::etag, resource.etag);
    }
    return serve_content(*resource.content, resource.content_type, resource.name,
                         resource.mod_time, resource.size);
}

expected<void, Error> ContentServer::serve_content(ContentSource& content,
                                                   std::string content_type,
                                                   const std::string& name,
                                                   http_date::TimePoint mod_time,
                                                   int64_t size) {
    if (committed_) {
        return unexpected(Error::io(IoError::InvalidArgument, "response headers already committed"));
    }

    if (!http_date::is_unspecified(mod_time)) {
        headers_.set(header::last_modified, http_date::format(mod_time));
    }

    auto ctx = ConditionalContext::from_metadata(sender_.incoming());
    auto preconditions = conditional::evaluate(ctx, headers_, mod_time);
    if (preconditions.done()) {
        default_logger().log(default_logger()
            .entry(LogLevel::Debug, "precondition decided response")
            .field("status", headers_.status()));
        return commit();
    }

    if (content_type.empty()) {
        content_type = mime::type_by_name(name);
        if (content_type.empty()) {
            // Decide between text and binary from the leading bytes
            std::string sniff(options_.sniff_length, '\0');
            auto n = io::read_full(content, sniff.data(), sniff.size());
            if (!n) {
                return unexpected(n.error());
            }
            sniff.resize(*n);
            content_type = mime::detect_content_type(sniff);

            if (auto rewound = content.seek(0); !rewound) {
                return serve_error("seeker can't seek", 500);
            }
        }
    }
    headers_.set(header::content_type, content_type);

    std::vector<ByteRange> ranges;
    auto parsed = range::parse(preconditions.range, size);
    if (parsed) {
        ranges = std::move(*parsed);
    } else if (parsed.error().is(FileError::NoOverlap) && size == 0) {
        // An empty representation ignores the Range header
    } else {
        if (parsed.error().is(FileError::NoOverlap)) {
            headers_.set(header::content_range, range::unsatisfied_content_range(size));
        }
        return serve_error(parsed.error().message(), 416);
    }

    if (range::total_length(ranges) > size) {
        // More bytes requested than the representation holds: serve it whole
        ranges.clear();
    }

    int status = 200;
    int64_t send_size = size;
    ByteReader* body = &content;
    std::unique_ptr<MultiRangeEncoder> encoder;

    if (!name.empty()) {
        headers_.set(header::content_disposition, "attachment; filename=" + name);
    }

    if (ranges.size() == 1) {
        const auto& r = ranges.front();
        if (auto sought = content.seek(r.start); !sought) {
            return unexpected(sought.error());
        }
        send_size = r.length;
        status = 206;
        headers_.set(header::content_range, r.content_range(size));
    } else if (ranges.size() > 1) {
        auto created = MultiRangeEncoder::create(ranges, content_type, size);
        if (!created) {
            return unexpected(created.error());
        }
        encoder = std::move(*created);
        send_size = encoder->encoded_size();
        status = 206;
        headers_.set(header::content_type, encoder->content_type());
    }

    headers_.set(header::accept_ranges, "bytes");
    if (!ranges.empty() || headers_.get(header::content_encoding).empty()) {
        headers_.set(header::content_length, std::to_string(send_size));
        headers_.set(header::transfer_encoding, "identity");
    }
    headers_.set_status(status);

    default_logger().log(default_logger()
        .entry(LogLevel::Debug, "serving content")
        .field("status", status)
        .field("ranges", ranges.size())
        .field("send_size", send_size));

    if (auto committed = commit(); !committed) {
        return committed;
    }

    if (encoder) {
        body = &encoder->start(content);
    }

    ChunkStreamWriter writer(sender_, content_type, options_.chunk_size);
    auto copied = io::copy_n(writer, *body, send_size);
    if (!copied) {
        default_logger().log(default_logger()
            .entry(LogLevel::Error, "streaming response body failed")
            .field("error", copied.error().to_string())
            .field("send_size", send_size));
        return unexpected(copied.error());
    }
    return {};
}

} // namespace gatefile
