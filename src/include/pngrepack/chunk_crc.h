#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

/**
 * \file chunk_crc.h
 * \brief Resettable CRC-32 accumulator for PNG chunk type+data.
 */

namespace pngrepack {

/**
 * \brief CRC-32 (IEEE 802.3, reflected polynomial 0xEDB88320) accumulator.
 *
 * A value type: each chunk being validated or produced owns its own instance
 * and calls \ref reset at the chunk boundary. Backed by zlib's `crc32`.
 */
class ChunkCrc final {
public:
    ChunkCrc() noexcept = default;

    void reset() noexcept { state_ = 0; }

    void update(std::span<const std::byte> bytes) noexcept;

    /// Feeds a big-endian FourCC chunk type.
    void update_fourcc(uint32_t type) noexcept;

    uint32_t value() const noexcept { return state_; }

    /// CRC over `type || data`, as stored in a chunk's trailing field.
    static uint32_t of(uint32_t type, std::span<const std::byte> data) noexcept;

private:
    uint32_t state_ = 0;
};

}  // namespace pngrepack
