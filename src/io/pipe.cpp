#include "gatefile/io/pipe.hpp"

#include <algorithm>
#include <condition_variable>
#include <cstring>
#include <mutex>

namespace gatefile::io {

namespace detail {

struct PipeState {
    std::mutex mutex;
    std::condition_variable cv;

    // Pending write, consumed in place by the reader
    const char* data = nullptr;
    size_t remaining = 0;

    bool writer_closed = false;
    std::optional<Error> writer_error;

    bool reader_closed = false;
    std::optional<Error> reader_error;
};

} // namespace detail

namespace {

Error closed_pipe() {
    return Error::io(IoError::ClosedPipe, "io: read/write on closed pipe");
}

} // anonymous namespace

// ============================================================================
// PipeReader
// ============================================================================

PipeReader::~PipeReader() {
    if (state_) {
        close();
    }
}

expected<size_t, Error> PipeReader::read(char* dst, size_t len) {
    auto& s = *state_;
    std::unique_lock<std::mutex> lock(s.mutex);

    if (s.reader_closed) {
        return unexpected(closed_pipe());
    }

    s.cv.wait(lock, [&] { return s.remaining > 0 || s.writer_closed; });

    if (s.remaining == 0) {
        if (s.writer_error) {
            return unexpected(*s.writer_error);
        }
        return unexpected(Error::end_of_stream());
    }

    size_t n = std::min(len, s.remaining);
    std::memcpy(dst, s.data, n);
    s.data += n;
    s.remaining -= n;
    if (s.remaining == 0) {
        s.data = nullptr;
        s.cv.notify_all();
    }
    return n;
}

void PipeReader::close(std::optional<Error> error) {
    auto& s = *state_;
    std::lock_guard<std::mutex> lock(s.mutex);
    if (s.reader_closed) {
        return;
    }
    s.reader_closed = true;
    s.reader_error = std::move(error);
    s.cv.notify_all();
}

// ============================================================================
// PipeWriter
// ============================================================================

PipeWriter::~PipeWriter() {
    if (state_) {
        close();
    }
}

expected<size_t, Error> PipeWriter::write(std::string_view data) {
    auto& s = *state_;
    std::unique_lock<std::mutex> lock(s.mutex);

    if (s.writer_closed) {
        return unexpected(closed_pipe());
    }
    if (s.reader_closed) {
        return unexpected(s.reader_error ? *s.reader_error : closed_pipe());
    }
    if (data.empty()) {
        return size_t{0};
    }

    s.data = data.data();
    s.remaining = data.size();
    s.cv.notify_all();

    s.cv.wait(lock, [&] { return s.remaining == 0 || s.reader_closed; });

    size_t consumed = data.size() - s.remaining;
    if (s.remaining > 0) {
        s.data = nullptr;
        s.remaining = 0;
        return unexpected(s.reader_error ? *s.reader_error : closed_pipe());
    }
    return consumed;
}

void PipeWriter::close(std::optional<Error> error) {
    auto& s = *state_;
    std::lock_guard<std::mutex> lock(s.mutex);
    if (s.writer_closed) {
        return;
    }
    s.writer_closed = true;
    s.writer_error = std::move(error);
    s.cv.notify_all();
}

std::pair<PipeReader, PipeWriter> make_pipe() {
    auto state = std::make_shared<detail::PipeState>();
    return {PipeReader(state), PipeWriter(state)};
}

} // namespace gatefile::io
