#pragma once

#include "pngrepack/byte_stream.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

#include <zlib.h>

/**
 * \file zlib_codec.h
 * \brief Streaming zlib inflate/deflate adapters over byte sources and sinks.
 */

namespace pngrepack {

/// Lowest and highest accepted deflate levels (-1 selects the zlib default).
inline constexpr int kMinDeflateLevel = -1;
inline constexpr int kMaxDeflateLevel = 9;

enum class InflateStatus : uint8_t {
    /// Output was produced (or the output span was empty).
    Ok,
    /// The zlib stream is complete.
    StreamEnd,
    /// The compressed data is invalid.
    Corrupt,
    /// The source ended before the zlib stream was complete.
    SourceEnded,
    /// The source reported an error.
    SourceFailed,
    /// zlib failed to allocate or is not initialized.
    Failed,
};

/**
 * \brief Pull-based zlib decompressor.
 *
 * Compressed bytes are read from a \ref ByteSource on demand through a small
 * internal input buffer.
 */
class ZlibInflater final {
public:
    ZlibInflater() noexcept = default;
    ~ZlibInflater() noexcept;

    ZlibInflater(const ZlibInflater&)            = delete;
    ZlibInflater& operator=(const ZlibInflater&) = delete;

    bool init() noexcept;

    /**
     * \brief Decompresses into \p out until it is full or the stream ends.
     *
     * \p produced receives the number of bytes written to \p out, which may be
     * non-zero for any returned status.
     */
    InflateStatus inflate_from(ByteSource& source, std::span<std::byte> out,
                               size_t* produced) noexcept;

    /// Input bytes read from the source but not consumed by the decoder.
    size_t pending_input() const noexcept;

    uint64_t total_in() const noexcept;
    uint64_t total_out() const noexcept;

private:
    z_stream strm_ {};
    bool active_      = false;
    bool source_done_ = false;
    std::array<std::byte, 16384> in_buf_ {};
};

enum class DeflateStatus : uint8_t {
    Ok,
    /// The output sink reported an error.
    SinkFailed,
    /// zlib failed (bad level, allocation failure, or misuse).
    Failed,
};

/**
 * \brief Push-based zlib compressor.
 *
 * Compressed bytes are handed to a \ref ByteSink in pieces of at most the
 * internal output buffer size.
 */
class ZlibDeflater final {
public:
    ZlibDeflater() noexcept = default;
    ~ZlibDeflater() noexcept;

    ZlibDeflater(const ZlibDeflater&)            = delete;
    ZlibDeflater& operator=(const ZlibDeflater&) = delete;

    /// \p level is -1 (zlib default) or 0..9.
    bool init(int level) noexcept;

    DeflateStatus write(std::span<const std::byte> in, ByteSink& out) noexcept;

    /// Emits all pending output and ends the current deflate block on a byte
    /// boundary (Z_SYNC_FLUSH).
    DeflateStatus flush(ByteSink& out) noexcept;

    /// Completes the stream (Z_FINISH), including the Adler-32 trailer.
    DeflateStatus finish(ByteSink& out) noexcept;

    uint64_t total_in() const noexcept;
    uint64_t total_out() const noexcept;

private:
    DeflateStatus pump(std::span<const std::byte> in, int mode,
                       ByteSink& out) noexcept;

    z_stream strm_ {};
    bool active_ = false;
    std::array<std::byte, 16384> out_buf_ {};
};

}  // namespace pngrepack
