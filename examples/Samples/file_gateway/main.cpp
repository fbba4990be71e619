/**
 * Gatefile - File Gateway Example
 *
 * Serves one file over an in-process frame stream and prints what a
 * gateway would forward: the committed headers on stderr and the body
 * frames on stdout.
 *
 *   gatefile_serve <path> [range] [if-none-match]
 *
 *   gatefile_serve video.mp4 "bytes=0-1023" > first1k.bin
 *   gatefile_serve notes.txt "bytes=0-9,-10"
 */

#include <gatefile/gatefile.hpp>

#include <cstdio>
#include <iostream>

using namespace gatefile;

// Prints headers and frames instead of sending them over the network
class ConsoleSender : public FrameSender {
    Metadata request_;
    size_t frames_ = 0;
    size_t bytes_ = 0;

public:
    explicit ConsoleSender(Metadata request) : request_(std::move(request)) {}

    const Metadata& incoming() const override { return request_; }

    expected<void, Error> send_header(const ResponseHeaders& headers) override {
        for (const auto& [name, value] : headers) {
            std::cerr << name << ": " << value << "\n";
        }
        std::cerr << std::endl;
        return {};
    }

    expected<void, Error> send(const Frame& frame) override {
        if (std::fwrite(frame.data.data(), 1, frame.data.size(), stdout) != frame.data.size()) {
            return unexpected(Error::last_system_error("write stdout"));
        }
        ++frames_;
        bytes_ += frame.data.size();
        return {};
    }

    size_t frames() const { return frames_; }
    size_t bytes() const { return bytes_; }
};

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "usage: " << argv[0] << " <path> [range] [if-none-match]" << std::endl;
        return 2;
    }

    auto options = Options::from_env();
    options.apply_logging();

    Metadata request;
    if (argc > 2) {
        request.set(header::range, argv[2]);
    }
    if (argc > 3) {
        request.set(header::if_none_match, argv[3]);
    }

    ConsoleSender sender(std::move(request));
    ContentServer server(sender, options);

    auto served = server.serve_file(argv[1]);
    std::fflush(stdout);
    if (!served) {
        log_error("serve failed: " + served.error().to_string());
        return served.error().http_status() == 404 ? 1 : 3;
    }

    default_logger().log(default_logger()
        .entry(LogLevel::Info, "served")
        .field("status", server.headers().status())
        .field("frames", sender.frames())
        .field("bytes", sender.bytes()));
    return 0;
}
