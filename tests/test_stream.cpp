#include <catch2/catch_test_macros.hpp>
#include <gatefile/io/pipe.hpp>
#include <gatefile/io/stream.hpp>
#include <gatefile/http/headers.hpp>
#include <gatefile/transport/chunk_stream.hpp>
#include <gatefile/transport/metadata.hpp>

#include "support/memory_stream.hpp"

#include <filesystem>
#include <fstream>
#include <thread>

using namespace gatefile;
using gatefile::testing::MemoryReceiver;
using gatefile::testing::MemorySender;

namespace {

class StringWriter : public ByteWriter {
public:
    std::string out;

    expected<size_t, Error> write(std::string_view data) override {
        out.append(data);
        return data.size();
    }
};

std::string pattern(size_t n) {
    std::string s(n, '\0');
    for (size_t i = 0; i < n; ++i) {
        s[i] = static_cast<char>('a' + (i % 26));
    }
    return s;
}

} // namespace

// ============================================================================
// Byte sources
// ============================================================================

TEST_CASE("MemorySource reads and seeks", "[stream]") {
    MemorySource src("hello world");
    char buf[5];

    auto n = src.read(buf, sizeof(buf));
    REQUIRE(n);
    REQUIRE(std::string(buf, *n) == "hello");

    REQUIRE(*src.seek(6) == 6);
    auto rest = io::read_all(src);
    REQUIRE(rest);
    REQUIRE(*rest == "world");

    auto eof = src.read(buf, sizeof(buf));
    REQUIRE(!eof);
    REQUIRE(eof.error().is_end_of_stream());

    REQUIRE(!src.seek(-1));
}

TEST_CASE("FileSource opens regular files", "[stream]") {
    auto path = std::filesystem::temp_directory_path() / "gatefile-stream-test.txt";
    {
        std::ofstream out(path, std::ios::binary);
        out << "0123456789";
    }

    auto opened = FileSource::open(path.string());
    REQUIRE(opened);
    auto& file = **opened;
    REQUIRE(file.size() == 10);
    REQUIRE(!file.is_directory());
    REQUIRE(file.name() == "gatefile-stream-test.txt");
    REQUIRE(file.mod_time().time_since_epoch().count() > 0);

    REQUIRE(*file.seek(4) == 4);
    char buf[3];
    REQUIRE(*io::read_full(file, buf, 3) == 3);
    REQUIRE(std::string(buf, 3) == "456");

    opened->reset();
    std::filesystem::remove(path);
}

TEST_CASE("FileSource reports missing files", "[stream]") {
    auto opened = FileSource::open("/nonexistent/gatefile/file.bin");
    REQUIRE(!opened);
    REQUIRE(opened.error().is(FileError::InvalidPath));
}

TEST_CASE("copy_n transfers exactly n bytes", "[stream]") {
    SECTION("full copy") {
        MemorySource src(pattern(100000));
        StringWriter dst;
        auto copied = io::copy_n(dst, src, 70000);
        REQUIRE(copied);
        REQUIRE(*copied == 70000);
        REQUIRE(dst.out == pattern(70000));
    }

    SECTION("short source") {
        MemorySource src("abc");
        StringWriter dst;
        auto copied = io::copy_n(dst, src, 10);
        REQUIRE(!copied);
        REQUIRE(copied.error().is_end_of_stream());
        REQUIRE(dst.out == "abc");
    }
}

// ============================================================================
// Pipe
// ============================================================================

TEST_CASE("Pipe hands writes to the reader", "[pipe]") {
    auto pipe = io::make_pipe();
    auto& reader = pipe.first;
    std::string payload = pattern(50000);

    std::thread producer([&payload, w = std::move(pipe.second)]() mutable {
        for (size_t off = 0; off < payload.size(); off += 7000) {
            auto r = w.write(std::string_view(payload).substr(off, 7000));
            if (!r) {
                return;
            }
        }
        w.close();
    });

    auto received = io::read_all(reader);
    producer.join();

    REQUIRE(received);
    REQUIRE(*received == payload);
}

TEST_CASE("Pipe propagates close errors", "[pipe]") {
    SECTION("writer closes with an error") {
        auto [reader, writer] = io::make_pipe();
        writer.close(Error::file(FileError::NotSeekable, "seek failed"));
        char buf[8];
        auto r = reader.read(buf, sizeof(buf));
        REQUIRE(!r);
        REQUIRE(r.error().is(FileError::NotSeekable));
    }

    SECTION("writer closes cleanly") {
        auto [reader, writer] = io::make_pipe();
        writer.close();
        char buf[8];
        REQUIRE(reader.read(buf, sizeof(buf)).error().is_end_of_stream());
    }

    SECTION("reader closed before write") {
        auto [reader, writer] = io::make_pipe();
        reader.close();
        auto r = writer.write("data");
        REQUIRE(!r);
        REQUIRE(r.error().is(IoError::ClosedPipe));
    }

    SECTION("reader closes during a blocked write") {
        auto pipe = io::make_pipe();
        auto& reader = pipe.first;
        auto& writer = pipe.second;
        expected<size_t, Error> result = size_t{0};

        std::thread producer([&] { result = writer.write("blocked until read"); });
        char buf[4];
        REQUIRE(*reader.read(buf, sizeof(buf)) == 4);
        reader.close(Error::cancelled());
        producer.join();

        REQUIRE(!result);
        REQUIRE(result.error().is(IoError::Cancelled));
    }
}

// ============================================================================
// Metadata and response headers
// ============================================================================

TEST_CASE("Metadata keys are case-insensitive", "[metadata]") {
    Metadata md{{"Range", "bytes=0-1"}, {"X-Multi", "a"}};
    md.add("x-multi", "b");

    REQUIRE(md.get("range") == "bytes=0-1");
    REQUIRE(md.has("RANGE"));
    REQUIRE(md.values("x-multi").size() == 2);
    REQUIRE(md.get("missing").empty());
    REQUIRE(md.values("missing").empty());

    md.set("X-Multi", "c");
    REQUIRE(md.values("x-multi") == std::vector<std::string>{"c"});

    md.erase("range");
    REQUIRE(!md.has("range"));
}

TEST_CASE("Metadata pick falls back to forwarded keys", "[metadata]") {
    Metadata md{{"grpcgateway-range", "bytes=5-"}};
    REQUIRE(md.pick("range") == "bytes=5-");

    md.set("range", "bytes=0-");
    REQUIRE(md.pick("range") == "bytes=0-");
    REQUIRE(md.pick("if-match").empty());
}

TEST_CASE("ResponseHeaders keep order and replace in place", "[headers]") {
    ResponseHeaders h;
    h.set_status(200);
    h.set("Content-Type", "text/plain");
    h.set("etag", "\"x\"");
    h.set_status(206);

    REQUIRE(h.status() == 206);
    REQUIRE(h.size() == 3);
    REQUIRE(h.entries()[0].first == "code");
    REQUIRE(h.get("CONTENT-TYPE") == "text/plain");

    h.erase("content-type");
    REQUIRE(!h.has("content-type"));
    REQUIRE(h.get("content-type").empty());
    REQUIRE(ResponseHeaders{}.status() == 0);
}

// ============================================================================
// Chunk streams
// ============================================================================

TEST_CASE("ChunkStreamWriter splits into frames", "[chunk_stream]") {
    MemorySender sender;
    ChunkStreamWriter writer(sender, "application/octet-stream", 1000);

    auto r = writer.write(pattern(2500));
    REQUIRE(r);
    REQUIRE(*r == 2500);
    REQUIRE(sender.frames.size() == 3);
    REQUIRE(sender.frames[0].data.size() == 1000);
    REQUIRE(sender.frames[2].data.size() == 500);
    REQUIRE(sender.frames[1].content_type == "application/octet-stream");
    REQUIRE(sender.body() == pattern(2500));
}

TEST_CASE("ChunkStreamWriter stops at the first failed send", "[chunk_stream]") {
    MemorySender sender;
    sender.fail_frame = 1;
    ChunkStreamWriter writer(sender, "", 10);

    auto r = writer.write(pattern(35));
    REQUIRE(!r);
    REQUIRE(r.error().is(IoError::ClosedPipe));
    REQUIRE(sender.frames.size() == 1);
}

TEST_CASE("ChunkStreamReader concatenates frames", "[chunk_stream]") {
    MemoryReceiver receiver;
    receiver.push(pattern(3000), 700);
    receiver.pending.insert(receiver.pending.begin() + 1, Frame{});

    ChunkStreamReader reader(receiver);
    auto all = io::read_all(reader);
    REQUIRE(all);
    REQUIRE(*all == pattern(3000));
    REQUIRE(reader.total() == 3000);
}

TEST_CASE("ChunkStreamReader enforces the size limit", "[chunk_stream]") {
    MemoryReceiver receiver;
    receiver.push(pattern(2048), 256);

    ChunkStreamReader reader(receiver, 1024);
    auto all = io::read_all(reader);

    REQUIRE(!all);
    REQUIRE(all.error().is(FileError::SizeLimitExceeded));
    REQUIRE(receiver.received == 5);
    REQUIRE(reader.total() == 1024);
}

TEST_CASE("ChunkStreamReader passes transport errors through", "[chunk_stream]") {
    MemoryReceiver receiver;
    receiver.push("abc");
    receiver.final_error = Error::io(IoError::Timeout, "deadline exceeded");

    ChunkStreamReader reader(receiver);
    char buf[16];
    REQUIRE(*reader.read(buf, sizeof(buf)) == 3);
    auto r = reader.read(buf, sizeof(buf));
    REQUIRE(!r);
    REQUIRE(r.error().is(IoError::Timeout));
}
