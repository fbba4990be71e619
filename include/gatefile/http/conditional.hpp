#pragma once

#include <string>
#include <string_view>

#include "gatefile/http/headers.hpp"
#include "gatefile/http/http_date.hpp"
#include "gatefile/transport/metadata.hpp"

namespace gatefile {

// ============================================================================
// Conditional Request Context
// ============================================================================

// Inbound validators of one request. An empty value means the header is
// absent.
struct ConditionalContext {
    std::string range;
    std::string if_range;
    std::string if_match;
    std::string if_none_match;
    std::string if_unmodified_since;
    std::string if_modified_since;

    static ConditionalContext from_metadata(const Metadata& md);
};

// ============================================================================
// Precondition Evaluation (RFC 7232 section 6)
// ============================================================================

enum class Outcome {
    Proceed,
    NotModified,         // 304
    PreconditionFailed   // 412
};

struct Preconditions {
    Outcome outcome = Outcome::Proceed;

    // Range header to honor; empty when absent or discarded by If-Range
    std::string range;

    bool done() const noexcept { return outcome != Outcome::Proceed; }
};

namespace conditional {

enum class CondResult {
    None,
    True,
    False
};

CondResult check_if_match(const ConditionalContext& ctx, std::string_view etag);
CondResult check_if_unmodified_since(const ConditionalContext& ctx, http_date::TimePoint mod_time);
CondResult check_if_none_match(const ConditionalContext& ctx, std::string_view etag);
CondResult check_if_modified_since(const ConditionalContext& ctx, http_date::TimePoint mod_time);
CondResult check_if_range(const ConditionalContext& ctx, std::string_view etag, http_date::TimePoint mod_time);

// Evaluates the validators against the resource. The resource ETag is the
// "etag" entry of `outgoing`. On NotModified and PreconditionFailed the
// status is stored in `outgoing`, and for NotModified the representation
// headers are removed.
Preconditions evaluate(const ConditionalContext& ctx,
                       ResponseHeaders& outgoing,
                       http_date::TimePoint mod_time);

} // namespace conditional

} // namespace gatefile
