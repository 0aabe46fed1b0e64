#include "pngrepack/chunk_crc.h"

#include "pngrepack/png_chunk.h"

#include <array>

#include <zlib.h>

namespace pngrepack {

void
ChunkCrc::update(std::span<const std::byte> bytes) noexcept
{
    const Bytef* p = reinterpret_cast<const Bytef*>(bytes.data());
    size_t left    = bytes.size();
    uLong crc      = static_cast<uLong>(state_);
    while (left > 0) {
        // crc32() takes a uInt length.
        const uInt n = (left > 0x40000000U) ? 0x40000000U
                                            : static_cast<uInt>(left);
        crc          = ::crc32(crc, p, n);
        p += n;
        left -= n;
    }
    state_ = static_cast<uint32_t>(crc);
}


void
ChunkCrc::update_fourcc(uint32_t type) noexcept
{
    std::array<std::byte, 4> tag {};
    store_u32be(type, tag);
    update(tag);
}


uint32_t
ChunkCrc::of(uint32_t type, std::span<const std::byte> data) noexcept
{
    ChunkCrc crc;
    crc.update_fourcc(type);
    crc.update(data);
    return crc.value();
}

}  // namespace pngrepack
