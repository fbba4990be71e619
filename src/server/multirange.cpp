#include "gatefile/server/multirange.hpp"

#include "gatefile/core/logging.hpp"
#include "gatefile/http/multipart.hpp"

namespace gatefile {

namespace {

PartHeaders part_headers(const ByteRange& r, std::string_view content_type, int64_t size) {
    return {
        {"Content-Range", r.content_range(size)},
        {"Content-Type", std::string(content_type)},
    };
}

} // anonymous namespace

MultiRangeEncoder::MultiRangeEncoder(std::vector<ByteRange> ranges, std::string content_type,
                                     int64_t size, std::string boundary)
    : ranges_(std::move(ranges))
    , part_content_type_(std::move(content_type))
    , size_(size)
    , boundary_(std::move(boundary)) {
    encoded_size_ = measure(ranges_, part_content_type_, size_, boundary_);
}

MultiRangeEncoder::~MultiRangeEncoder() {
    if (reader_) {
        reader_->close();
    }
    if (producer_.joinable()) {
        producer_.join();
    }
}

expected<std::unique_ptr<MultiRangeEncoder>, Error> MultiRangeEncoder::create(
    std::vector<ByteRange> ranges, std::string content_type, int64_t size) {
    auto boundary = multipart::random_boundary();
    if (!boundary) {
        return unexpected(boundary.error());
    }
    return std::make_unique<MultiRangeEncoder>(
        std::move(ranges), std::move(content_type), size, std::move(*boundary));
}

int64_t MultiRangeEncoder::measure(const std::vector<ByteRange>& ranges,
                                   std::string_view content_type,
                                   int64_t size,
                                   const std::string& boundary) {
    CountingWriter counter;
    MultipartWriter writer(counter, boundary);

    int64_t body = 0;
    for (const auto& r : ranges) {
        // Writes into a CountingWriter cannot fail
        (void)writer.create_part(part_headers(r, content_type, size));
        body += r.length;
    }
    (void)writer.close();
    return counter.count() + body;
}

std::string MultiRangeEncoder::content_type() const {
    return "multipart/byteranges; boundary=" + boundary_;
}

ByteReader& MultiRangeEncoder::start(ContentSource& source) {
    auto [reader, writer] = io::make_pipe();
    reader_.emplace(std::move(reader));

    producer_ = std::thread([this, &source, pipe = std::move(writer)]() mutable {
        MultipartWriter envelope(pipe, boundary_);

        auto fail = [&](const Error& error) {
            default_logger().log(default_logger()
                .entry(LogLevel::Debug, "multi-range producer stopped")
                .field("error", error.to_string()));
            pipe.close(error);
        };

        for (const auto& r : ranges_) {
            if (auto created = envelope.create_part(part_headers(r, part_content_type_, size_)); !created) {
                fail(created.error());
                return;
            }
            if (auto sought = source.seek(r.start); !sought) {
                fail(sought.error());
                return;
            }
            if (auto copied = io::copy_n(envelope, source, r.length); !copied) {
                fail(copied.error());
                return;
            }
        }

        if (auto closed = envelope.close(); !closed) {
            fail(closed.error());
            return;
        }
        pipe.close();
    });

    return *reader_;
}

} // namespace gatefile
