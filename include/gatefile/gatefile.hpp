#pragma once

// Main include file for gatefile

// Utilities
#include "gatefile/util/expected.hpp"
#include "gatefile/util/from_string.hpp"

// Core
#include "gatefile/core/error.hpp"
#include "gatefile/core/logging.hpp"
#include "gatefile/core/options.hpp"

// Byte streams
#include "gatefile/io/pipe.hpp"
#include "gatefile/io/stream.hpp"

// Transport
#include "gatefile/transport/chunk_stream.hpp"
#include "gatefile/transport/frame.hpp"
#include "gatefile/transport/metadata.hpp"

// HTTP semantics
#include "gatefile/http/conditional.hpp"
#include "gatefile/http/etag.hpp"
#include "gatefile/http/headers.hpp"
#include "gatefile/http/http_date.hpp"
#include "gatefile/http/mime.hpp"
#include "gatefile/http/multipart.hpp"
#include "gatefile/http/range.hpp"

// Serving
#include "gatefile/server/content_server.hpp"
#include "gatefile/server/form.hpp"
#include "gatefile/server/multirange.hpp"

namespace gatefile {

// Version info
constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 0;
constexpr int VERSION_PATCH = 0;
constexpr const char *VERSION_STRING = "1.0.0";

} // namespace gatefile
