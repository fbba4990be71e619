#include <catch2/catch_test_macros.hpp>
#include <gatefile/core/error.hpp>
#include <gatefile/util/expected.hpp>
#include <gatefile/util/from_string.hpp>

#include <string>

using namespace gatefile;

TEST_CASE("Error construction", "[error]") {
    SECTION("IoError") {
        Error e(IoError::ClosedPipe, "client went away");
        REQUIRE(e.is_io());
        REQUIRE(!e.is_file());
        REQUIRE(!e.is_system());
        REQUIRE(e.io_error() == IoError::ClosedPipe);
        REQUIRE(e.message() == "client went away");
        REQUIRE(static_cast<bool>(e));
    }

    SECTION("FileError") {
        Error e(FileError::InvalidRange, "invalid range");
        REQUIRE(e.is_file());
        REQUIRE(e.is(FileError::InvalidRange));
        REQUIRE(!e.is(FileError::NoOverlap));
        REQUIRE(e.file_error() == FileError::InvalidRange);
    }

    SECTION("system error") {
        auto ec = std::make_error_code(std::errc::no_such_file_or_directory);
        Error e(ec);
        REQUIRE(e.is_system());
        REQUIRE(e.system_error() == ec);
    }

    SECTION("default is success") {
        Error e;
        REQUIRE(!static_cast<bool>(e));
    }

    SECTION("end of stream") {
        Error e = Error::end_of_stream();
        REQUIRE(e.is_end_of_stream());
        REQUIRE(e.is(IoError::EndOfStream));
    }
}

TEST_CASE("Error status mapping", "[error]") {
    CHECK(Error::file(FileError::InvalidRange).http_status() == 416);
    CHECK(Error::file(FileError::NoOverlap).http_status() == 416);
    CHECK(Error::file(FileError::SizeLimitExceeded).http_status() == 413);
    CHECK(Error::file(FileError::MessageTooLarge).http_status() == 413);
    CHECK(Error::file(FileError::NotMultipart).http_status() == 400);
    CHECK(Error::file(FileError::MissingBoundary).http_status() == 400);
    CHECK(Error::file(FileError::MissingFile).http_status() == 400);
    CHECK(Error::file(FileError::InvalidPath).http_status() == 404);
    CHECK(Error::io(IoError::ClosedPipe).http_status() == 500);
    CHECK(Error::system(std::make_error_code(std::errc::io_error)).http_status() == 500);
}

TEST_CASE("Error codes and categories", "[error]") {
    SECTION("file category") {
        std::error_code ec = FileError::SizeLimitExceeded;
        REQUIRE(std::string(ec.category().name()) == "gatefile.file");
        REQUIRE(ec.message() == "Size limit exceeded");
    }

    SECTION("io category") {
        auto ec = Error::io(IoError::EndOfStream).code();
        REQUIRE(std::string(ec.category().name()) == "gatefile.io");
    }

    SECTION("to_string includes kind and message") {
        auto text = Error::file(FileError::NoOverlap, "invalid range: failed to overlap").to_string();
        REQUIRE(text == "FileError::Range does not overlap content - invalid range: failed to overlap");
    }

    SECTION("equality ignores message") {
        REQUIRE(Error::file(FileError::InvalidRange, "a") == Error::file(FileError::InvalidRange, "b"));
        REQUIRE(Error::file(FileError::InvalidRange) != Error::file(FileError::NoOverlap));
    }
}

TEST_CASE("expected carries values and errors", "[expected]") {
    SECTION("value") {
        expected<int, Error> e = 42;
        REQUIRE(e.has_value());
        REQUIRE(*e == 42);
        REQUIRE(e.value_or(0) == 42);
    }

    SECTION("error") {
        expected<int, Error> e = unexpected(Error::file(FileError::MissingFile, "http: no such file"));
        REQUIRE(!e.has_value());
        REQUIRE(e.error().is(FileError::MissingFile));
        REQUIRE(e.value_or(7) == 7);
    }

    SECTION("void") {
        expected<void, Error> ok;
        REQUIRE(ok.has_value());

        expected<void, Error> bad = unexpected(Error::end_of_stream());
        REQUIRE(!bad);
        REQUIRE(bad.error().is_end_of_stream());
    }
}

TEST_CASE("from_string parses whole inputs", "[from_string]") {
    SECTION("integers") {
        REQUIRE(*from_string<int64_t>("1000") == 1000);
        REQUIRE(*from_string<int>("-12") == -12);
        REQUIRE(*from_string<size_t>("10240") == 10240u);
    }

    SECTION("rejects partial and empty input") {
        REQUIRE(!from_string<int>("12abc"));
        REQUIRE(!from_string<int>(""));
        REQUIRE(!from_string<int>(" 12"));
        REQUIRE(!from_string<int64_t>("99999999999999999999999"));
    }

    SECTION("booleans") {
        REQUIRE(*from_string<bool>("true"));
        REQUIRE(!*from_string<bool>("off"));
        REQUIRE(!from_string<bool>("maybe"));
    }

    SECTION("optional") {
        auto empty = from_string<std::optional<int>>("");
        REQUIRE(empty);
        REQUIRE(!empty->has_value());
        REQUIRE(from_string<std::optional<int>>("5")->value() == 5);
    }
}
