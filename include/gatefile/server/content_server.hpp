#pragma once

#include <cstdint>
#include <string>

#include "gatefile/core/logging.hpp"
#include "gatefile/core/options.hpp"
#include "gatefile/http/conditional.hpp"
#include "gatefile/http/headers.hpp"
#include "gatefile/http/http_date.hpp"
#include "gatefile/io/stream.hpp"
#include "gatefile/transport/frame.hpp"

namespace gatefile {

// ============================================================================
// Resource - content served by ContentServer::serve
// ============================================================================

struct Resource {
    ContentSource* content = nullptr;
    int64_t size = 0;
    http_date::TimePoint mod_time{};   // zero or Unix epoch: unknown
    std::string etag;                  // quoted entity tag, may be empty
    std::string content_type;          // empty: derived from name or sniffed
    std::string name;                  // empty: no content-disposition
};

// ============================================================================
// ContentServer - range and conditional GET over a frame stream
// ============================================================================
//
// Serves one response on a FrameSender: evaluates the inbound validators,
// resolves the Range header, commits the response headers, then streams
// the body as frames. Headers such as etag, cache-control or
// content-encoding may be preset through headers() before serving.

class ContentServer {
    FrameSender& sender_;
    Options options_;
    ResponseHeaders headers_;
    bool committed_ = false;

    expected<void, Error> commit();
    expected<void, Error> serve_error(std::string_view text, int status);

public:
    explicit ContentServer(FrameSender& sender, Options options = {});

    ResponseHeaders& headers() noexcept { return headers_; }
    const ResponseHeaders& headers() const noexcept { return headers_; }

    bool committed() const noexcept { return committed_; }

    // Serves a regular file. Directories are rejected with InvalidPath.
    expected<void, Error> serve_file(const std::string& path, std::string content_type = {});

    // Serves `size` bytes of content. Error responses (416, 500) are sent
    // to the client and count as success; transport, seek and copy failures
    // are returned. When the type must be sniffed, a failed read of the
    // leading bytes is returned before anything is committed; only a failed
    // rewind after sniffing becomes a 500 response.
    expected<void, Error> serve_content(ContentSource& content,
                                        std::string content_type,
                                        const std::string& name,
                                        http_date::TimePoint mod_time,
                                        int64_t size);

    // serve_content for a Resource, with its etag as validator
    expected<void, Error> serve(const Resource& resource);
};

} // namespace gatefile
