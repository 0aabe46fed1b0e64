#pragma once

#include "pngrepack/byte_stream.h"
#include "pngrepack/chunk_crc.h"
#include "pngrepack/png_chunk.h"
#include "pngrepack/repack_status.h"

#include <array>
#include <cstdint>

/**
 * \file chunk_cursor.h
 * \brief Position of a PNG walker within the chunk sequence of a byte source.
 */

namespace pngrepack {

/**
 * \brief The walker's view of the chunk currently being consumed.
 *
 * Owned by the container walker. The IDAT merger advances it across chunk
 * boundaries; when the merger reads a non-IDAT header it leaves that header in
 * the cursor with \ref pending_header set, so the walker resumes from it instead
 * of reading a new one.
 */
struct ChunkCursor final {
    ChunkHeader header;
    /// Payload bytes of \ref header not consumed yet.
    uint32_t remaining = 0;
    /// CRC over the type and the consumed payload bytes of \ref header.
    ChunkCrc crc;
    /// \ref header was read from the source but not yet handled by the walker.
    bool pending_header = false;
    /// The source ended cleanly at a chunk boundary.
    bool at_end = false;
};

/// Chunk summary reported to a \ref ChunkVisitor once its CRC is confirmed.
struct ChunkInfo final {
    uint32_t type   = 0;
    uint32_t length = 0;
    uint32_t crc    = 0;
};

class ChunkVisitor {
public:
    virtual ~ChunkVisitor()                         = default;
    virtual void on_chunk(const ChunkInfo& chunk) = 0;
};

/**
 * \brief Reads and checks the PNG signature.
 *
 * Returns \ref RepackStatus::NotAPngFile when the bytes differ from the magic
 * (or the source is empty) and \ref RepackStatus::Truncated when the source ends
 * inside a matching prefix.
 */
RepackStatus
read_png_signature(ByteSource& source) noexcept;

/**
 * \brief Reads the next chunk header into \p cursor.
 *
 * Resets the cursor's CRC and feeds it the type. On a clean end of the source
 * sets \ref ChunkCursor::at_end and returns Ok.
 */
RepackStatus
read_chunk_header(ByteSource& source, ChunkCursor* cursor) noexcept;

/// Reads the 4-byte CRC field that follows a chunk payload.
RepackStatus
read_chunk_crc(ByteSource& source, uint32_t* stored) noexcept;

/**
 * \brief Consumes the payload and CRC of the chunk in \p cursor without keeping
 * it.
 *
 * Returns \ref RepackStatus::ContainerCrcMismatch when the stored CRC differs.
 */
RepackStatus
skip_chunk(ByteSource& source, ChunkCursor* cursor, uint32_t* stored) noexcept;

/**
 * \brief Classifies an IDAT run whose zlib stream ended early at a non-IDAT
 * chunk.
 *
 * Skips the chunks that follow (starting with the pending header in
 * \p cursor). Returns \ref RepackStatus::WrongImageDataOrder when another IDAT
 * chunk appears, \ref RepackStatus::CorruptImageStream when the source ends
 * first, or the first framing error met on the way.
 */
RepackStatus
classify_interrupted_run(ByteSource& source, ChunkCursor* cursor) noexcept;

/**
 * \brief Reads and validates the IHDR chunk that must follow the signature.
 *
 * \p payload receives the 13 IHDR bytes and \p stored_crc the trailing CRC.
 */
RepackStatus
read_ihdr_chunk(ByteSource& source, ChunkCursor* cursor,
                std::array<std::byte, kPngIhdrLength>* payload,
                uint32_t* stored_crc) noexcept;

}  // namespace pngrepack
