#pragma once

#include "pngrepack/byte_stream.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

/**
 * \file png_chunk.h
 * \brief PNG container wire format: signature, chunk headers, chunk emission.
 */

namespace pngrepack {

inline constexpr uint32_t kPngSignatureSize = 8;
inline constexpr std::array<std::byte, kPngSignatureSize> kPngSignature = {
    std::byte { 0x89 }, std::byte { 0x50 }, std::byte { 0x4E },
    std::byte { 0x47 }, std::byte { 0x0D }, std::byte { 0x0A },
    std::byte { 0x1A }, std::byte { 0x0A },
};

/// Chunk length field limit (PNG lengths are at most 2^31-1).
inline constexpr uint32_t kPngMaxChunkLength = 0x7FFFFFFFU;

inline constexpr uint32_t kPngChunkHeaderSize = 8;
inline constexpr uint32_t kPngChunkCrcSize    = 4;

inline constexpr uint32_t kPngIhdrLength            = 13;
inline constexpr uint32_t kPngIhdrCompressionOffset = 10;

/// Packs four ASCII characters into a big-endian FourCC integer.
constexpr uint32_t
fourcc(char a, char b, char c, char d) noexcept
{
    return (static_cast<uint32_t>(static_cast<uint8_t>(a)) << 24)
           | (static_cast<uint32_t>(static_cast<uint8_t>(b)) << 16)
           | (static_cast<uint32_t>(static_cast<uint8_t>(c)) << 8)
           | (static_cast<uint32_t>(static_cast<uint8_t>(d)) << 0);
}

inline constexpr uint32_t kPngIhdr = fourcc('I', 'H', 'D', 'R');
inline constexpr uint32_t kPngIdat = fourcc('I', 'D', 'A', 'T');
inline constexpr uint32_t kPngIend = fourcc('I', 'E', 'N', 'D');

/// Length and type fields that precede a chunk's payload.
struct ChunkHeader final {
    uint32_t length = 0;
    uint32_t type   = 0;
};

/// Reads a big-endian u32 from the first 4 bytes of \p bytes.
uint32_t
load_u32be(std::span<const std::byte> bytes) noexcept;

/// Stores \p v big-endian into the first 4 bytes of \p out.
void
store_u32be(uint32_t v, std::span<std::byte> out) noexcept;

/// Decodes the 8-byte `length || type` header. The length is not range checked.
ChunkHeader
decode_chunk_header(std::span<const std::byte> bytes) noexcept;

/// Encodes \p header into 8 bytes.
void
encode_chunk_header(const ChunkHeader& header, std::span<std::byte> out) noexcept;

/// True when the ancillary bit (bit 5 of the first type byte) is clear.
constexpr bool
is_critical_chunk(uint32_t type) noexcept
{
    return ((type >> 24) & 0x20U) == 0;
}

/// True when all four type bytes are ASCII letters.
bool
is_valid_chunk_type(uint32_t type) noexcept;

/**
 * \brief Writes a complete chunk: length, type, \p data, CRC over type+data.
 *
 * \p data must not exceed \ref kPngMaxChunkLength bytes.
 */
IoStatus
write_chunk(ByteSink& sink, uint32_t type,
            std::span<const std::byte> data) noexcept;

/**
 * \brief Appends a terminal-safe rendering of a chunk type to \p out.
 *
 * Printable ASCII is copied; other bytes are escaped as `\xNN`.
 */
void
format_chunk_type(uint32_t type, std::string* out) noexcept;

}  // namespace pngrepack
