#pragma once

#include "pngrepack/byte_stream.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

/**
 * \file idat_rechunker.h
 * \brief Packages a compressed byte stream into fresh IDAT chunks.
 */

namespace pngrepack {

/**
 * \brief Buffers compressed bytes and emits them as IDAT chunks.
 *
 * A chunk is emitted whenever the buffer reaches the target size, and on
 * \ref flush for whatever is buffered. Emitted chunks are never empty and
 * never larger than the target. Each chunk's CRC is computed independently of
 * any input-side checksum.
 */
class IdatRechunker final : public ByteSink {
public:
    IdatRechunker(ByteSink& out, uint32_t target_chunk_bytes) noexcept;

    IoStatus write(std::span<const std::byte> bytes) noexcept override;

    /// Emits the buffered bytes (if any) as one chunk.
    IoStatus flush() noexcept;

    uint32_t chunks_written() const noexcept { return chunks_; }
    /// Payload bytes emitted (excluding chunk framing).
    uint64_t bytes_written() const noexcept { return bytes_; }
    /// Largest payload emitted so far.
    uint32_t largest_chunk() const noexcept { return largest_; }

private:
    ByteSink* out_ = nullptr;
    size_t target_ = 0;
    std::vector<std::byte> buf_;
    uint32_t chunks_  = 0;
    uint64_t bytes_   = 0;
    uint32_t largest_ = 0;
};

}  // namespace pngrepack
