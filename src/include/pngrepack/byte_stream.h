#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <span>
#include <vector>

/**
 * \file byte_stream.h
 * \brief Minimal sequential byte source/sink interfaces used by the transcoder.
 */

namespace pngrepack {

/// I/O operation status.
enum class IoStatus : uint8_t {
    Ok,
    /// The source has no more bytes (reads only).
    EndOfStream,
    /// The underlying stream reported an error.
    Failed,
};

struct IoResult final {
    IoStatus status = IoStatus::Ok;
    size_t bytes    = 0;
};

/**
 * \brief Readable byte stream.
 *
 * \ref read may return fewer bytes than requested. A result with
 * \ref IoStatus::Ok always carries at least one byte when \p out is non-empty;
 * the end of the stream is reported as \ref IoStatus::EndOfStream with zero
 * bytes.
 */
class ByteSource {
public:
    virtual ~ByteSource()                                  = default;
    virtual IoResult read(std::span<std::byte> out) noexcept = 0;
};

/// Writable byte stream. \ref write either consumes all bytes or fails.
class ByteSink {
public:
    virtual ~ByteSink()                                              = default;
    virtual IoStatus write(std::span<const std::byte> bytes) noexcept = 0;
};

/**
 * \brief Reads until \p out is full or the source ends.
 *
 * Returns \ref IoStatus::Ok only when \p out was filled completely. When the
 * source ends early, returns \ref IoStatus::EndOfStream and stores the number of
 * bytes obtained in \p got (which lets callers tell a clean end from a
 * truncated record).
 */
IoStatus
read_full(ByteSource& source, std::span<std::byte> out, size_t* got) noexcept;

/// Reads from an in-memory byte span.
class SpanSource final : public ByteSource {
public:
    explicit SpanSource(std::span<const std::byte> bytes) noexcept;

    IoResult read(std::span<std::byte> out) noexcept override;

    size_t position() const noexcept { return pos_; }
    size_t remaining() const noexcept { return bytes_.size() - pos_; }

private:
    std::span<const std::byte> bytes_;
    size_t pos_ = 0;
};

/// Appends written bytes to a caller-owned vector.
class VectorSink final : public ByteSink {
public:
    explicit VectorSink(std::vector<std::byte>* out) noexcept;

    IoStatus write(std::span<const std::byte> bytes) noexcept override;

private:
    std::vector<std::byte>* out_ = nullptr;
};

/// Counts written bytes and discards them.
class CountingSink final : public ByteSink {
public:
    IoStatus write(std::span<const std::byte> bytes) noexcept override;

    uint64_t count() const noexcept { return count_; }

private:
    uint64_t count_ = 0;
};

/// Reads from a `std::FILE*` (not owned).
class StdioSource final : public ByteSource {
public:
    explicit StdioSource(std::FILE* f) noexcept;

    IoResult read(std::span<std::byte> out) noexcept override;

private:
    std::FILE* f_ = nullptr;
};

/// Writes to a `std::FILE*` (not owned).
class StdioSink final : public ByteSink {
public:
    explicit StdioSink(std::FILE* f) noexcept;

    IoStatus write(std::span<const std::byte> bytes) noexcept override;

private:
    std::FILE* f_ = nullptr;
};

}  // namespace pngrepack
