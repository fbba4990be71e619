#include <catch2/catch_test_macros.hpp>
#include <gatefile/http/multipart.hpp>

#include <algorithm>
#include <cctype>

using namespace gatefile;

namespace {

class StringWriter : public ByteWriter {
public:
    std::string out;

    expected<size_t, Error> write(std::string_view data) override {
        out.append(data);
        return data.size();
    }
};

// Hands out at most `step` bytes per read
class TrickleSource : public ByteReader {
    std::string data_;
    size_t pos_ = 0;
    size_t step_;

public:
    TrickleSource(std::string data, size_t step) : data_(std::move(data)), step_(step) {}

    expected<size_t, Error> read(char* dst, size_t len) override {
        if (pos_ >= data_.size()) {
            return unexpected(Error::end_of_stream());
        }
        size_t n = std::min({len, step_, data_.size() - pos_});
        std::copy_n(data_.data() + pos_, n, dst);
        pos_ += n;
        return n;
    }
};

struct ParsedPart {
    std::string form_name;
    std::string file_name;
    std::string content_type;
    std::string body;
};

expected<std::vector<ParsedPart>, Error> read_parts(ByteReader& src, std::string_view boundary) {
    MultipartReader reader(src, boundary);
    std::vector<ParsedPart> parts;
    for (;;) {
        auto part = reader.next_part();
        if (!part) {
            if (part.error().is_end_of_stream()) {
                return parts;
            }
            return unexpected(part.error());
        }
        auto body = io::read_all(**part);
        if (!body) {
            return unexpected(body.error());
        }
        parts.push_back({(*part)->form_name(), (*part)->file_name(),
                         std::string((*part)->content_type()), *body});
    }
}

const std::string kFormBody =
    "preamble text\r\n"
    "--XyZ\r\n"
    "Content-Disposition: form-data; name=\"title\"\r\n"
    "\r\n"
    "hello\r\n"
    "--XyZ\r\n"
    "Content-Disposition: form-data; name=\"upload\"; filename=\"../etc/data.bin\"\r\n"
    "Content-Type: application/octet-stream\r\n"
    "\r\n"
    "line one\r\n--XyZnot a boundary\r\nline two\r\n"
    "--XyZ--\r\n"
    "epilogue";

} // namespace

TEST_CASE("MultipartWriter output layout", "[multipart]") {
    StringWriter out;
    MultipartWriter writer(out, "B");

    REQUIRE(writer.create_part({{"Content-Type", "text/plain"}, {"Content-Range", "bytes 0-0/10"}}));
    REQUIRE(writer.write("a"));
    REQUIRE(writer.create_part({{"Content-Type", "text/plain"}, {"Content-Range", "bytes 9-9/10"}}));
    REQUIRE(writer.write("j"));
    REQUIRE(writer.close());

    REQUIRE(out.out ==
        "--B\r\nContent-Range: bytes 0-0/10\r\nContent-Type: text/plain\r\n\r\na"
        "\r\n--B\r\nContent-Range: bytes 9-9/10\r\nContent-Type: text/plain\r\n\r\nj"
        "\r\n--B--\r\n");
    REQUIRE(writer.form_data_content_type() == "multipart/form-data; boundary=B");

    REQUIRE(writer.close());
    REQUIRE(!writer.create_part({}));
}

TEST_CASE("CountingWriter measures without storing", "[multipart]") {
    CountingWriter counter;
    MultipartWriter writer(counter, "B");
    REQUIRE(writer.create_part({}));
    REQUIRE(writer.write("12345"));
    REQUIRE(writer.close());
    // "--B\r\n" "\r\n" "12345" "\r\n--B--\r\n"
    REQUIRE(counter.count() == 5 + 2 + 5 + 9);
}

TEST_CASE("Random boundaries", "[multipart]") {
    auto a = multipart::random_boundary();
    auto b = multipart::random_boundary();
    REQUIRE(a);
    REQUIRE(b);
    REQUIRE(a->size() == 60);
    REQUIRE(*a != *b);
    REQUIRE(std::all_of(a->begin(), a->end(), [](char c) {
        return std::isxdigit(static_cast<unsigned char>(c)) && !std::isupper(static_cast<unsigned char>(c));
    }));
}

TEST_CASE("MultipartReader parses form bodies", "[multipart]") {
    for (size_t step : {size_t{1}, size_t{3}, size_t{7}, size_t{4096}}) {
        INFO("read step " << step);
        TrickleSource src(kFormBody, step);
        auto parts = read_parts(src, "XyZ");
        REQUIRE(parts);
        REQUIRE(parts->size() == 2);

        const auto& title = (*parts)[0];
        REQUIRE(title.form_name == "title");
        REQUIRE(title.file_name.empty());
        REQUIRE(title.body == "hello");

        const auto& upload = (*parts)[1];
        REQUIRE(upload.form_name == "upload");
        REQUIRE(upload.file_name == "data.bin");
        REQUIRE(upload.content_type == "application/octet-stream");
        REQUIRE(upload.body == "line one\r\n--XyZnot a boundary\r\nline two");
    }
}

TEST_CASE("MultipartReader reads back writer output", "[multipart]") {
    StringWriter out;
    MultipartWriter writer(out, "0123456789abcdef");
    REQUIRE(writer.create_part({{"Content-Disposition", "form-data; name=\"empty\""}}));
    REQUIRE(writer.create_part({{"Content-Disposition", "form-data; name=\"big\"; filename=\"big.txt\""}}));
    std::string big(20000, 'x');
    REQUIRE(writer.write(big));
    REQUIRE(writer.close());

    TrickleSource src(out.out, 1000);
    auto parts = read_parts(src, "0123456789abcdef");
    REQUIRE(parts);
    REQUIRE(parts->size() == 2);
    REQUIRE((*parts)[0].body.empty());
    REQUIRE((*parts)[1].file_name == "big.txt");
    REQUIRE((*parts)[1].body == big);
}

TEST_CASE("MultipartReader skips unread parts", "[multipart]") {
    TrickleSource src(kFormBody, 5);
    MultipartReader reader(src, "XyZ");

    auto first = reader.next_part();
    REQUIRE(first);
    REQUIRE((*first)->form_name() == "title");

    auto second = reader.next_part();
    REQUIRE(second);
    REQUIRE((*second)->form_name() == "upload");

    auto end = reader.next_part();
    REQUIRE(!end);
    REQUIRE(end.error().is_end_of_stream());
    REQUIRE(reader.next_part().error().is_end_of_stream());
}

TEST_CASE("MultipartReader rejects malformed bodies", "[multipart]") {
    SECTION("missing closing delimiter") {
        TrickleSource src("--B\r\nContent-Disposition: form-data; name=\"a\"\r\n\r\nunterminated", 64);
        auto parts = read_parts(src, "B");
        REQUIRE(!parts);
        REQUIRE(parts.error().is(FileError::MalformedMultipart));
    }

    SECTION("malformed header line") {
        TrickleSource src("--B\r\nno colon here\r\n\r\nbody\r\n--B--\r\n", 64);
        auto parts = read_parts(src, "B");
        REQUIRE(!parts);
        REQUIRE(parts.error().is(FileError::MalformedMultipart));
    }

    SECTION("no delimiter at all") {
        TrickleSource src("just some text\r\n", 64);
        auto parts = read_parts(src, "B");
        REQUIRE(!parts);
        REQUIRE(parts.error().is(FileError::MalformedMultipart));
    }

    SECTION("oversized headers") {
        std::string body = "--B\r\nX-Long: " + std::string(70 * 1024, 'h') + "\r\n\r\n\r\n--B--\r\n";
        TrickleSource src(body, 4096);
        auto parts = read_parts(src, "B");
        REQUIRE(!parts);
        REQUIRE(parts.error().is(FileError::MessageTooLarge));
    }
}
