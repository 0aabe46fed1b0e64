#pragma once

#include "pngrepack/byte_stream.h"
#include "pngrepack/repack_status.h"

#include <cstdint>

/**
 * \file png_repack.h
 * \brief Re-encodes the IDAT stream of a PNG at a new zlib level.
 */

namespace pngrepack {

/// Default size of emitted IDAT chunks.
inline constexpr uint32_t kDefaultIdatChunkBytes = 1U << 16;

/// Default amount of decoded image data recompressed per flush cycle. Chosen so
/// that stored (level 0) blocks plus their framing fit one default IDAT chunk.
inline constexpr uint32_t kDefaultInflateBufferBytes = (1U << 16) - 16U;

/// Resource limits applied while transcoding untrusted files.
struct RepackLimits final {
    /// Largest non-IDAT chunk payload buffered for CRC validation (0 = unlimited).
    uint64_t max_chunk_bytes = 0;
    /// Largest decoded IDAT stream (0 = unlimited).
    uint64_t max_inflated_bytes = 0;
};

struct RepackOptions final {
    /// zlib level: -1 (zlib default) or 0..9.
    int level = -1;
    /// Upper bound for each emitted IDAT chunk payload (1..2^31-1).
    uint32_t idat_chunk_bytes = kDefaultIdatChunkBytes;
    /// Decoded bytes per inflate/deflate/flush cycle (1..2^30).
    uint32_t inflate_buffer_bytes = kDefaultInflateBufferBytes;
    RepackLimits limits;
};

struct RepackResult final {
    RepackStatus status = RepackStatus::Ok;

    /// Chunks read from the source (IHDR and IDAT included).
    uint32_t chunks_in = 0;
    /// Chunks written to the sink.
    uint32_t chunks_out = 0;

    uint32_t idat_chunks_in  = 0;
    uint32_t idat_chunks_out = 0;
    /// IDAT payload bytes read / written.
    uint64_t idat_bytes_in  = 0;
    uint64_t idat_bytes_out = 0;

    /// Size of the decoded IDAT stream.
    uint64_t inflated_bytes = 0;
    /// IDAT payload bytes found after the end of the zlib stream (dropped).
    uint64_t trailing_idat_bytes = 0;

    uint64_t bytes_out = 0;
};

/**
 * \brief Copies a PNG from \p source to \p sink, recompressing its IDAT run.
 *
 * The signature, IHDR and every non-IDAT chunk are copied unchanged once their
 * CRC has been confirmed. The IDAT run is decoded and re-encoded at
 * \ref RepackOptions::level and re-emitted as new IDAT chunks in its original
 * position. The pass ends at a clean end of \p source between chunks.
 *
 * Re-encoded IDAT chunks are written as the decoded stream advances, which can
 * be before the CRC of the input IDAT chunk they came from has been checked.
 * On failure the bytes already written to \p sink are not a valid PNG and
 * must be discarded.
 */
RepackResult
repack_png(ByteSource& source, ByteSink& sink,
           const RepackOptions& options) noexcept;

/// Returns true when \p options are within their accepted ranges.
bool
validate_repack_options(const RepackOptions& options) noexcept;

}  // namespace pngrepack
