#pragma once

#include "pngrepack/byte_stream.h"
#include "pngrepack/chunk_cursor.h"
#include "pngrepack/repack_status.h"

#include <cstdint>

/**
 * \file png_verify.h
 * \brief Validating PNG walk: framing, CRCs, IDAT ordering and zlib stream.
 */

namespace pngrepack {

struct VerifyOptions final {
    /// Decode the IDAT stream (otherwise only its chunk CRCs are checked).
    bool inflate_image_data = true;
    /// Largest decoded IDAT stream (0 = unlimited).
    uint64_t max_inflated_bytes = 0;
};

struct VerifyResult final {
    RepackStatus status = RepackStatus::Ok;
    /// Chunks whose CRC was confirmed (IHDR included).
    uint32_t chunks      = 0;
    uint32_t idat_chunks = 0;
    uint64_t idat_bytes  = 0;
    /// Size of the decoded IDAT stream (0 unless inflated).
    uint64_t inflated_bytes = 0;
    bool has_idat           = false;
    bool has_iend           = false;
};

/**
 * \brief Walks a PNG with the same rules as \ref repack_png without writing it.
 *
 * Each chunk is reported to \p visitor (optional) after its CRC is confirmed.
 * When \ref VerifyOptions::inflate_image_data is set, the decoded IDAT stream is
 * written to \p inflated_out (optional).
 */
VerifyResult
verify_png(ByteSource& source, const VerifyOptions& options,
           ChunkVisitor* visitor, ByteSink* inflated_out) noexcept;

}  // namespace pngrepack
