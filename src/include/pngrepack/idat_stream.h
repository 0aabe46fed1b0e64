#pragma once

#include "pngrepack/byte_stream.h"
#include "pngrepack/chunk_cursor.h"
#include "pngrepack/repack_status.h"

#include <cstddef>
#include <cstdint>
#include <span>

/**
 * \file idat_stream.h
 * \brief Presents a run of consecutive IDAT chunks as one logical byte stream.
 */

namespace pngrepack {

/**
 * \brief Logical reader over an IDAT run.
 *
 * Construct it when the walker has just read the first IDAT header into the
 * cursor. Reads cross chunk boundaries transparently: each exhausted chunk has
 * its CRC checked before the next header is read. The stream ends at the first
 * non-IDAT header (left pending in the cursor) or at a clean end of the source.
 *
 * Errors are latched: once \ref error is not Ok, \ref read returns
 * \ref IoStatus::Failed.
 */
class IdatStreamReader final : public ByteSource {
public:
    IdatStreamReader(ByteSource& source, ChunkCursor* cursor) noexcept;

    IoResult read(std::span<std::byte> out) noexcept override;

    /// Consumes and validates the rest of the run. \p discarded receives the
    /// number of payload bytes skipped.
    RepackStatus drain(uint64_t* discarded) noexcept;

    /// Reports each IDAT chunk after its CRC is confirmed.
    void set_visitor(ChunkVisitor* visitor) noexcept { visitor_ = visitor; }

    RepackStatus error() const noexcept { return error_; }
    bool ended() const noexcept { return ended_; }

    /// IDAT chunks whose headers were read (including the first).
    uint32_t chunks() const noexcept { return chunks_; }
    /// IDAT payload bytes consumed.
    uint64_t bytes() const noexcept { return bytes_; }

private:
    bool finish_chunk() noexcept;
    bool fail(RepackStatus status) noexcept;

    ByteSource* source_    = nullptr;
    ChunkCursor* cursor_   = nullptr;
    ChunkVisitor* visitor_ = nullptr;
    RepackStatus error_    = RepackStatus::Ok;
    bool ended_            = false;
    uint32_t chunks_       = 1;
    uint64_t bytes_        = 0;
};

}  // namespace pngrepack
