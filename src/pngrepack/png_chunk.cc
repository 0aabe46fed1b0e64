#include "pngrepack/png_chunk.h"

#include "pngrepack/chunk_crc.h"

#include <cstdio>

namespace pngrepack {

uint32_t
load_u32be(std::span<const std::byte> bytes) noexcept
{
    return (static_cast<uint32_t>(static_cast<uint8_t>(bytes[0])) << 24)
           | (static_cast<uint32_t>(static_cast<uint8_t>(bytes[1])) << 16)
           | (static_cast<uint32_t>(static_cast<uint8_t>(bytes[2])) << 8)
           | (static_cast<uint32_t>(static_cast<uint8_t>(bytes[3])) << 0);
}


void
store_u32be(uint32_t v, std::span<std::byte> out) noexcept
{
    out[0] = std::byte { static_cast<uint8_t>((v >> 24) & 0xFF) };
    out[1] = std::byte { static_cast<uint8_t>((v >> 16) & 0xFF) };
    out[2] = std::byte { static_cast<uint8_t>((v >> 8) & 0xFF) };
    out[3] = std::byte { static_cast<uint8_t>((v >> 0) & 0xFF) };
}


ChunkHeader
decode_chunk_header(std::span<const std::byte> bytes) noexcept
{
    ChunkHeader h;
    h.length = load_u32be(bytes.subspan(0, 4));
    h.type   = load_u32be(bytes.subspan(4, 4));
    return h;
}


void
encode_chunk_header(const ChunkHeader& header, std::span<std::byte> out) noexcept
{
    store_u32be(header.length, out.subspan(0, 4));
    store_u32be(header.type, out.subspan(4, 4));
}


bool
is_valid_chunk_type(uint32_t type) noexcept
{
    for (int shift = 24; shift >= 0; shift -= 8) {
        const uint32_t c = (type >> shift) & 0xFFU;
        const bool upper = c >= 'A' && c <= 'Z';
        const bool lower = c >= 'a' && c <= 'z';
        if (!upper && !lower) {
            return false;
        }
    }
    return true;
}


IoStatus
write_chunk(ByteSink& sink, uint32_t type,
            std::span<const std::byte> data) noexcept
{
    if (data.size() > kPngMaxChunkLength) {
        return IoStatus::Failed;
    }

    std::array<std::byte, kPngChunkHeaderSize> header {};
    ChunkHeader h;
    h.length = static_cast<uint32_t>(data.size());
    h.type   = type;
    encode_chunk_header(h, header);

    std::array<std::byte, kPngChunkCrcSize> crc {};
    store_u32be(ChunkCrc::of(type, data), crc);

    IoStatus st = sink.write(header);
    if (st != IoStatus::Ok) {
        return st;
    }
    if (!data.empty()) {
        st = sink.write(data);
        if (st != IoStatus::Ok) {
            return st;
        }
    }
    return sink.write(crc);
}


void
format_chunk_type(uint32_t type, std::string* out) noexcept
{
    if (!out) {
        return;
    }
    for (int shift = 24; shift >= 0; shift -= 8) {
        const unsigned c = static_cast<unsigned>((type >> shift) & 0xFFU);
        if (c >= 0x20U && c < 0x7FU && c != '\\') {
            out->push_back(static_cast<char>(c));
            continue;
        }
        char buf[8];
        std::snprintf(buf, sizeof(buf), "\\x%02X", c);
        out->append(buf);
    }
}

}  // namespace pngrepack
