#include "pngrepack/chunk_cursor.h"

#include <cstring>

namespace pngrepack {
namespace {

    static RepackStatus short_read_status(IoStatus st) noexcept
    {
        return (st == IoStatus::Failed) ? RepackStatus::ReadFailed
                                        : RepackStatus::Truncated;
    }

}  // namespace


RepackStatus
read_png_signature(ByteSource& source) noexcept
{
    std::array<std::byte, kPngSignatureSize> sig {};
    size_t got        = 0;
    const IoStatus st = read_full(source, sig, &got);
    if (st == IoStatus::Failed) {
        return RepackStatus::ReadFailed;
    }
    if (got == 0) {
        return RepackStatus::NotAPngFile;
    }
    if (std::memcmp(sig.data(), kPngSignature.data(), got) != 0) {
        return RepackStatus::NotAPngFile;
    }
    if (got < kPngSignatureSize) {
        return RepackStatus::Truncated;
    }
    return RepackStatus::Ok;
}


RepackStatus
read_chunk_header(ByteSource& source, ChunkCursor* cursor) noexcept
{
    std::array<std::byte, kPngChunkHeaderSize> raw {};
    size_t got        = 0;
    const IoStatus st = read_full(source, raw, &got);
    if (st == IoStatus::EndOfStream && got == 0) {
        cursor->at_end         = true;
        cursor->pending_header = false;
        cursor->remaining      = 0;
        return RepackStatus::Ok;
    }
    if (st != IoStatus::Ok) {
        return short_read_status(st);
    }

    const ChunkHeader h = decode_chunk_header(raw);
    if (h.length > kPngMaxChunkLength) {
        return RepackStatus::ChunkTooLarge;
    }
    cursor->header    = h;
    cursor->remaining = h.length;
    cursor->crc.reset();
    cursor->crc.update_fourcc(h.type);
    return RepackStatus::Ok;
}


RepackStatus
read_chunk_crc(ByteSource& source, uint32_t* stored) noexcept
{
    std::array<std::byte, kPngChunkCrcSize> raw {};
    const IoStatus st = read_full(source, raw, nullptr);
    if (st != IoStatus::Ok) {
        return short_read_status(st);
    }
    *stored = load_u32be(raw);
    return RepackStatus::Ok;
}


RepackStatus
skip_chunk(ByteSource& source, ChunkCursor* cursor, uint32_t* stored) noexcept
{
    std::array<std::byte, 4096> scratch {};
    while (cursor->remaining > 0) {
        const size_t n = (cursor->remaining < scratch.size())
                             ? static_cast<size_t>(cursor->remaining)
                             : scratch.size();
        const std::span<std::byte> piece(scratch.data(), n);
        const IoStatus io = read_full(source, piece, nullptr);
        if (io != IoStatus::Ok) {
            return short_read_status(io);
        }
        cursor->crc.update(piece);
        cursor->remaining -= static_cast<uint32_t>(n);
    }

    const RepackStatus st = read_chunk_crc(source, stored);
    if (st != RepackStatus::Ok) {
        return st;
    }
    if (*stored != cursor->crc.value()) {
        return RepackStatus::ContainerCrcMismatch;
    }
    return RepackStatus::Ok;
}


RepackStatus
classify_interrupted_run(ByteSource& source, ChunkCursor* cursor) noexcept
{
    uint32_t stored = 0;
    while (cursor->pending_header) {
        if (cursor->header.type == kPngIdat) {
            return RepackStatus::WrongImageDataOrder;
        }
        RepackStatus st = skip_chunk(source, cursor, &stored);
        if (st != RepackStatus::Ok) {
            return st;
        }
        st = read_chunk_header(source, cursor);
        if (st != RepackStatus::Ok) {
            return st;
        }
        cursor->pending_header = !cursor->at_end;
    }
    return RepackStatus::CorruptImageStream;
}


RepackStatus
read_ihdr_chunk(ByteSource& source, ChunkCursor* cursor,
                std::array<std::byte, kPngIhdrLength>* payload,
                uint32_t* stored_crc) noexcept
{
    RepackStatus st = read_chunk_header(source, cursor);
    if (st != RepackStatus::Ok) {
        return st;
    }
    if (cursor->at_end || cursor->header.type != kPngIhdr) {
        return RepackStatus::MissingHeader;
    }
    if (cursor->header.length != kPngIhdrLength) {
        return RepackStatus::BadHeaderLength;
    }

    const IoStatus io = read_full(source, *payload, nullptr);
    if (io != IoStatus::Ok) {
        return short_read_status(io);
    }
    cursor->remaining = 0;
    if ((*payload)[kPngIhdrCompressionOffset] != std::byte { 0 }) {
        return RepackStatus::UnsupportedCompressionMethod;
    }
    cursor->crc.update(*payload);

    st = read_chunk_crc(source, stored_crc);
    if (st != RepackStatus::Ok) {
        return st;
    }
    if (*stored_crc != cursor->crc.value()) {
        return RepackStatus::ContainerCrcMismatch;
    }
    return RepackStatus::Ok;
}

}  // namespace pngrepack
