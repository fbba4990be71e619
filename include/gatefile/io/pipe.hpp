#pragma once

#include <memory>
#include <optional>
#include <utility>

#include "gatefile/io/stream.hpp"

namespace gatefile::io {

// ============================================================================
// Synchronous In-process Pipe
// ============================================================================
//
// Unbuffered rendezvous between one writer thread and one reader thread.
// A write blocks until the reader has consumed all of it or the read side
// is closed. Closing one side wakes the other.

namespace detail {
struct PipeState;
}

class PipeReader : public ByteReader {
    std::shared_ptr<detail::PipeState> state_;

public:
    explicit PipeReader(std::shared_ptr<detail::PipeState> state) : state_(std::move(state)) {}
    ~PipeReader() override;

    PipeReader(PipeReader&&) noexcept = default;
    PipeReader& operator=(PipeReader&&) noexcept = default;

    // Returns data of the pending write, EndOfStream after the writer
    // closed, or the error the writer closed with
    expected<size_t, Error> read(char* dst, size_t len) override;

    // Subsequent writes fail with `error` (ClosedPipe by default)
    void close(std::optional<Error> error = std::nullopt);
};

class PipeWriter : public ByteWriter {
    std::shared_ptr<detail::PipeState> state_;

public:
    explicit PipeWriter(std::shared_ptr<detail::PipeState> state) : state_(std::move(state)) {}
    ~PipeWriter() override;

    PipeWriter(PipeWriter&&) noexcept = default;
    PipeWriter& operator=(PipeWriter&&) noexcept = default;

    expected<size_t, Error> write(std::string_view data) override;

    // Reader sees end of stream, or `error` when given
    void close(std::optional<Error> error = std::nullopt);
};

std::pair<PipeReader, PipeWriter> make_pipe();

} // namespace gatefile::io
