#include <catch2/catch_test_macros.hpp>
#include <gatefile/http/range.hpp>

using namespace gatefile;

namespace {

std::vector<ByteRange> parse_ok(std::string_view header, int64_t size) {
    auto parsed = range::parse(header, size);
    REQUIRE(parsed);
    return *parsed;
}

} // namespace

TEST_CASE("Range parsing - single ranges", "[range]") {
    SECTION("no header") {
        REQUIRE(parse_ok("", 1000).empty());
    }

    SECTION("first bytes") {
        auto ranges = parse_ok("bytes=0-499", 1000);
        REQUIRE(ranges.size() == 1);
        REQUIRE(ranges[0] == ByteRange{0, 500});
        REQUIRE(ranges[0].content_range(1000) == "bytes 0-499/1000");
    }

    SECTION("suffix") {
        auto ranges = parse_ok("bytes=-100", 1000);
        REQUIRE(ranges[0] == ByteRange{900, 100});
        REQUIRE(ranges[0].content_range(1000) == "bytes 900-999/1000");
    }

    SECTION("suffix longer than content") {
        auto ranges = parse_ok("bytes=-5000", 1000);
        REQUIRE(ranges[0] == ByteRange{0, 1000});
    }

    SECTION("open ended") {
        auto ranges = parse_ok("bytes=900-", 1000);
        REQUIRE(ranges[0] == ByteRange{900, 100});
    }

    SECTION("end clamped to content") {
        auto ranges = parse_ok("bytes=500-5000", 1000);
        REQUIRE(ranges[0] == ByteRange{500, 500});
        REQUIRE(ranges[0].end() == 999);
    }

    SECTION("single byte") {
        auto ranges = parse_ok("bytes=0-0", 1000);
        REQUIRE(ranges[0] == ByteRange{0, 1});
    }
}

TEST_CASE("Range parsing - multiple ranges", "[range]") {
    SECTION("two ranges") {
        auto ranges = parse_ok("bytes=0-0,-1", 1000);
        REQUIRE(ranges.size() == 2);
        REQUIRE(ranges[0] == ByteRange{0, 1});
        REQUIRE(ranges[1] == ByteRange{999, 1});
        REQUIRE(range::total_length(ranges) == 2);
    }

    SECTION("whitespace and empty entries") {
        auto ranges = parse_ok("bytes= 0-9 , ,20-29", 1000);
        REQUIRE(ranges.size() == 2);
        REQUIRE(ranges[1] == ByteRange{20, 10});
    }

    SECTION("non-overlapping entries are dropped when others overlap") {
        auto ranges = parse_ok("bytes=0-9,5000-6000", 1000);
        REQUIRE(ranges.size() == 1);
        REQUIRE(ranges[0] == ByteRange{0, 10});
    }
}

TEST_CASE("Range parsing - errors", "[range]") {
    SECTION("start beyond content") {
        auto parsed = range::parse("bytes=2000-3000", 1000);
        REQUIRE(!parsed);
        REQUIRE(parsed.error().is(FileError::NoOverlap));
        REQUIRE(range::unsatisfied_content_range(1000) == "bytes */1000");
    }

    SECTION("empty content") {
        auto parsed = range::parse("bytes=0-499", 0);
        REQUIRE(!parsed);
        REQUIRE(parsed.error().is(FileError::NoOverlap));
    }

    SECTION("malformed") {
        for (auto header : {"items=0-1", "bytes=abc", "bytes=5-1", "bytes=-", "bytes=--5",
                            "bytes=x-10", "bytes=0-y", "bytes=+1-2", "bytes=-1-2"}) {
            INFO(header);
            auto parsed = range::parse(header, 1000);
            REQUIRE(!parsed);
            REQUIRE(parsed.error().is(FileError::InvalidRange));
        }
    }
}

TEST_CASE("Range parsing is deterministic", "[range]") {
    auto first = range::parse("bytes=0-10,100-200,-50", 1000);
    auto second = range::parse("bytes=0-10,100-200,-50", 1000);
    REQUIRE(first);
    REQUIRE(second);
    REQUIRE(*first == *second);

    for (const auto& r : *first) {
        REQUIRE(r.start >= 0);
        REQUIRE(r.length >= 1);
        REQUIRE(r.start + r.length <= 1000);
    }
}
