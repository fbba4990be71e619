#include <catch2/catch_test_macros.hpp>
#include <gatefile/http/conditional.hpp>
#include <gatefile/http/etag.hpp>
#include <gatefile/http/http_date.hpp>

using namespace gatefile;
using namespace std::chrono_literals;
using conditional::CondResult;

namespace {

// Sun, 06 Nov 1994 08:49:37 GMT
const http_date::TimePoint kModTime = std::chrono::system_clock::from_time_t(784111777);

ResponseHeaders resource_headers(std::string etag = "\"abc\"") {
    ResponseHeaders h;
    h.set(header::content_type, "text/plain; charset=utf-8");
    h.set(header::content_length, "1000");
    h.set(header::last_modified, http_date::format(kModTime));
    if (!etag.empty()) {
        h.set(header::etag, std::move(etag));
    }
    return h;
}

} // namespace

// ============================================================================
// HTTP dates
// ============================================================================

TEST_CASE("HTTP date formatting", "[http_date]") {
    REQUIRE(http_date::format(kModTime) == "Sun, 06 Nov 1994 08:49:37 GMT");
    REQUIRE(http_date::format(kModTime + 750ms) == "Sun, 06 Nov 1994 08:49:37 GMT");
}

TEST_CASE("HTTP date parsing", "[http_date]") {
    SECTION("all three layouts") {
        REQUIRE(http_date::parse("Sun, 06 Nov 1994 08:49:37 GMT") == kModTime);
        REQUIRE(http_date::parse("Sunday, 06-Nov-94 08:49:37 GMT") == kModTime);
        REQUIRE(http_date::parse("Sun Nov  6 08:49:37 1994") == kModTime);
    }

    SECTION("round trip") {
        auto now = http_date::truncate_to_seconds(std::chrono::system_clock::now());
        REQUIRE(http_date::parse(http_date::format(now)) == now);
    }

    SECTION("rejects other text") {
        REQUIRE(!http_date::parse(""));
        REQUIRE(!http_date::parse("yesterday"));
        REQUIRE(!http_date::parse("Sun, 06 Nov 1994 08:49:37 UTC"));
        REQUIRE(!http_date::parse("Sun, 06 Nov 1994 08:49:37 GMT trailing"));
        REQUIRE(!http_date::parse("Sun, 06 Foo 1994 08:49:37 GMT"));
    }

    SECTION("unspecified times") {
        REQUIRE(http_date::is_unspecified(http_date::TimePoint{}));
        REQUIRE(http_date::is_unspecified(std::chrono::system_clock::from_time_t(0)));
        REQUIRE(!http_date::is_unspecified(kModTime));
    }
}

// ============================================================================
// Entity tags
// ============================================================================

TEST_CASE("Entity tag scanning", "[etag]") {
    auto strong = etag::scan("  \"xyz\", \"next\"");
    REQUIRE(strong.tag == "\"xyz\"");
    REQUIRE(strong.remain == ", \"next\"");

    REQUIRE(etag::scan("W/\"weak\"").tag == "W/\"weak\"");
    REQUIRE(etag::scan("xyz").tag.empty());
    REQUIRE(etag::scan("\"unterminated").tag.empty());
    REQUIRE(etag::scan("\"bad space\"").tag.empty());
    REQUIRE(etag::scan("").tag.empty());
}

TEST_CASE("Entity tag comparison", "[etag]") {
    REQUIRE(etag::strong_match("\"a\"", "\"a\""));
    REQUIRE(!etag::strong_match("W/\"a\"", "W/\"a\""));
    REQUIRE(!etag::strong_match("\"a\"", "\"b\""));

    REQUIRE(etag::weak_match("W/\"a\"", "\"a\""));
    REQUIRE(etag::weak_match("\"a\"", "\"a\""));
    REQUIRE(!etag::weak_match("W/\"a\"", "\"b\""));
}

// ============================================================================
// Individual checks
// ============================================================================

TEST_CASE("If-Match check", "[conditional]") {
    ConditionalContext ctx;
    REQUIRE(conditional::check_if_match(ctx, "\"abc\"") == CondResult::None);

    ctx.if_match = "\"xyz\", \"abc\"";
    REQUIRE(conditional::check_if_match(ctx, "\"abc\"") == CondResult::True);

    ctx.if_match = "*";
    REQUIRE(conditional::check_if_match(ctx, "\"abc\"") == CondResult::True);

    ctx.if_match = "W/\"abc\"";
    REQUIRE(conditional::check_if_match(ctx, "W/\"abc\"") == CondResult::False);

    ctx.if_match = "garbage, \"abc\"";
    REQUIRE(conditional::check_if_match(ctx, "\"abc\"") == CondResult::False);
}

TEST_CASE("If-None-Match check", "[conditional]") {
    ConditionalContext ctx;
    ctx.if_none_match = "W/\"abc\"";
    REQUIRE(conditional::check_if_none_match(ctx, "\"abc\"") == CondResult::False);

    ctx.if_none_match = "\"other\"";
    REQUIRE(conditional::check_if_none_match(ctx, "\"abc\"") == CondResult::True);

    ctx.if_none_match = "*";
    REQUIRE(conditional::check_if_none_match(ctx, "\"abc\"") == CondResult::False);
}

TEST_CASE("Date checks", "[conditional]") {
    ConditionalContext ctx;

    SECTION("If-Unmodified-Since") {
        ctx.if_unmodified_since = "Sun, 06 Nov 1994 08:49:37 GMT";
        REQUIRE(conditional::check_if_unmodified_since(ctx, kModTime + 300ms) == CondResult::True);
        REQUIRE(conditional::check_if_unmodified_since(ctx, kModTime + 1s) == CondResult::False);
        REQUIRE(conditional::check_if_unmodified_since(ctx, http_date::TimePoint{}) == CondResult::None);

        ctx.if_unmodified_since = "not a date";
        REQUIRE(conditional::check_if_unmodified_since(ctx, kModTime) == CondResult::None);
    }

    SECTION("If-Modified-Since") {
        ctx.if_modified_since = "Sun, 06 Nov 1994 08:49:37 GMT";
        REQUIRE(conditional::check_if_modified_since(ctx, kModTime) == CondResult::False);
        REQUIRE(conditional::check_if_modified_since(ctx, kModTime + 1h) == CondResult::True);
    }

    SECTION("If-Range") {
        REQUIRE(conditional::check_if_range(ctx, "\"abc\"", kModTime) == CondResult::None);

        ctx.if_range = "\"abc\"";
        REQUIRE(conditional::check_if_range(ctx, "\"abc\"", kModTime) == CondResult::True);
        REQUIRE(conditional::check_if_range(ctx, "\"new\"", kModTime) == CondResult::False);

        ctx.if_range = "W/\"abc\"";
        REQUIRE(conditional::check_if_range(ctx, "W/\"abc\"", kModTime) == CondResult::False);

        ctx.if_range = "Sun, 06 Nov 1994 08:49:37 GMT";
        REQUIRE(conditional::check_if_range(ctx, "", kModTime) == CondResult::True);
        REQUIRE(conditional::check_if_range(ctx, "", kModTime + 2s) == CondResult::False);
        REQUIRE(conditional::check_if_range(ctx, "", http_date::TimePoint{}) == CondResult::False);
    }
}

// ============================================================================
// Full evaluation
// ============================================================================

TEST_CASE("Precondition evaluation", "[conditional]") {
    ConditionalContext ctx;

    SECTION("no validators proceeds with the range") {
        ctx.range = "bytes=0-9";
        auto headers = resource_headers();
        auto result = conditional::evaluate(ctx, headers, kModTime);
        REQUIRE(result.outcome == Outcome::Proceed);
        REQUIRE(!result.done());
        REQUIRE(result.range == "bytes=0-9");
        REQUIRE(headers.status() == 0);
    }

    SECTION("matching If-None-Match is not modified") {
        ctx.if_none_match = "\"abc\"";
        auto headers = resource_headers();
        auto result = conditional::evaluate(ctx, headers, kModTime);
        REQUIRE(result.outcome == Outcome::NotModified);
        REQUIRE(headers.status() == 304);
        REQUIRE(!headers.has(header::content_type));
        REQUIRE(!headers.has(header::content_length));
        REQUIRE(!headers.has(header::last_modified));
        REQUIRE(headers.get(header::etag) == "\"abc\"");
    }

    SECTION("not modified keeps Last-Modified without an ETag") {
        ctx.if_modified_since = "Sun, 06 Nov 1994 08:49:37 GMT";
        auto headers = resource_headers("");
        auto result = conditional::evaluate(ctx, headers, kModTime);
        REQUIRE(result.outcome == Outcome::NotModified);
        REQUIRE(headers.has(header::last_modified));
    }

    SECTION("failed If-Match is a precondition failure") {
        ctx.if_match = "\"other\"";
        auto headers = resource_headers();
        auto result = conditional::evaluate(ctx, headers, kModTime);
        REQUIRE(result.outcome == Outcome::PreconditionFailed);
        REQUIRE(headers.status() == 412);
    }

    SECTION("If-Match takes precedence over If-Unmodified-Since") {
        ctx.if_match = "\"abc\"";
        ctx.if_unmodified_since = "Sat, 01 Jan 1994 00:00:00 GMT";
        auto headers = resource_headers();
        REQUIRE(conditional::evaluate(ctx, headers, kModTime).outcome == Outcome::Proceed);
    }

    SECTION("If-None-Match takes precedence over If-Modified-Since") {
        ctx.if_none_match = "\"other\"";
        ctx.if_modified_since = "Sun, 06 Nov 1994 08:49:37 GMT";
        auto headers = resource_headers();
        REQUIRE(conditional::evaluate(ctx, headers, kModTime).outcome == Outcome::Proceed);
    }

    SECTION("stale If-Range drops the range") {
        ctx.range = "bytes=0-9";
        ctx.if_range = "\"old\"";
        auto headers = resource_headers();
        auto result = conditional::evaluate(ctx, headers, kModTime);
        REQUIRE(result.outcome == Outcome::Proceed);
        REQUIRE(result.range.empty());
    }

    SECTION("validators are read from forwarded metadata") {
        Metadata md{{"grpcgateway-if-none-match", "\"abc\""}, {"Range", "bytes=1-2"}};
        auto from_md = ConditionalContext::from_metadata(md);
        REQUIRE(from_md.if_none_match == "\"abc\"");
        REQUIRE(from_md.range == "bytes=1-2");
        REQUIRE(from_md.if_match.empty());
    }
}
