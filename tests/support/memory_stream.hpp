#pragma once

#include <deque>
#include <optional>
#include <string>
#include <vector>

#include <gatefile/transport/frame.hpp>

namespace gatefile::testing {

// Records what a ContentServer commits and sends
class MemorySender : public FrameSender {
public:
    Metadata request;
    std::optional<ResponseHeaders> committed;
    std::vector<Frame> frames;
    int header_calls = 0;

    // Fail the send of frame number N (0-based) when set
    std::optional<size_t> fail_frame;

    const Metadata& incoming() const override { return request; }

    expected<void, Error> send_header(const ResponseHeaders& headers) override {
        ++header_calls;
        committed = headers;
        return {};
    }

    expected<void, Error> send(const Frame& frame) override {
        if (fail_frame && frames.size() == *fail_frame) {
            return unexpected(Error::io(IoError::ClosedPipe, "client went away"));
        }
        frames.push_back(frame);
        return {};
    }

    std::string body() const {
        std::string out;
        for (const auto& f : frames) {
            out += f.data;
        }
        return out;
    }

    std::string_view header(std::string_view name) const {
        return committed ? committed->get(name) : std::string_view{};
    }

    int status() const {
        return committed ? committed->status() : 0;
    }
};

// Replays scripted frames, then ends the stream
class MemoryReceiver : public FrameReceiver {
public:
    Metadata request;
    std::deque<Frame> pending;
    std::optional<Error> final_error;
    size_t received = 0;

    const Metadata& incoming() const override { return request; }

    expected<Frame, Error> recv() override {
        if (pending.empty()) {
            if (final_error) {
                return unexpected(*final_error);
            }
            return unexpected(Error::end_of_stream());
        }
        Frame frame = std::move(pending.front());
        pending.pop_front();
        ++received;
        return frame;
    }

    // Splits data into frames of at most frame_size bytes
    void push(const std::string& data, size_t frame_size = 1024) {
        for (size_t off = 0; off < data.size(); off += frame_size) {
            pending.push_back(Frame{"", data.substr(off, frame_size)});
        }
    }
};

} // namespace gatefile::testing
