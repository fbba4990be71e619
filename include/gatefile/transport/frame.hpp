#pragma once

#include <string>

#include "gatefile/core/error.hpp"
#include "gatefile/http/headers.hpp"
#include "gatefile/transport/metadata.hpp"
#include "gatefile/util/expected.hpp"

namespace gatefile {

// ============================================================================
// Frame - one discrete message of a chunk stream
// ============================================================================

struct Frame {
    std::string content_type;
    std::string data;
};

// ============================================================================
// Transport Capabilities
// ============================================================================
//
// Implemented by the RPC binding. One request owns its stream exclusively.

// Inbound stream of an upload
class FrameReceiver {
public:
    virtual ~FrameReceiver() = default;

    // Request metadata (headers) sent by the client
    virtual const Metadata& incoming() const = 0;

    // Next frame; IoError::EndOfStream once the client finished sending
    virtual expected<Frame, Error> recv() = 0;
};

// Outbound stream of a download
class FrameSender {
public:
    virtual ~FrameSender() = default;

    virtual const Metadata& incoming() const = 0;

    // Transmits response headers; called at most once, before any frame
    virtual expected<void, Error> send_header(const ResponseHeaders& headers) = 0;

    virtual expected<void, Error> send(const Frame& frame) = 0;
};

} // namespace gatefile
