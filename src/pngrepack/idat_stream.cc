#include "pngrepack/idat_stream.h"

#include <array>

namespace pngrepack {

IdatStreamReader::IdatStreamReader(ByteSource& source,
                                   ChunkCursor* cursor) noexcept
    : source_(&source)
    , cursor_(cursor)
{
}


bool
IdatStreamReader::fail(RepackStatus status) noexcept
{
    error_ = status;
    return false;
}


bool
IdatStreamReader::finish_chunk() noexcept
{
    uint32_t stored       = 0;
    const RepackStatus st = read_chunk_crc(*source_, &stored);
    if (st != RepackStatus::Ok) {
        return fail(st);
    }
    if (stored != cursor_->crc.value()) {
        return fail(RepackStatus::ImageDataCrcMismatch);
    }
    if (visitor_) {
        ChunkInfo info;
        info.type   = cursor_->header.type;
        info.length = cursor_->header.length;
        info.crc    = stored;
        visitor_->on_chunk(info);
    }
    return true;
}


IoResult
IdatStreamReader::read(std::span<std::byte> out) noexcept
{
    IoResult res;
    if (error_ != RepackStatus::Ok) {
        res.status = IoStatus::Failed;
        return res;
    }
    if (ended_) {
        res.status = IoStatus::EndOfStream;
        return res;
    }
    if (out.empty()) {
        return res;
    }

    while (cursor_->remaining == 0) {
        if (!finish_chunk()) {
            res.status = IoStatus::Failed;
            return res;
        }
        const RepackStatus st = read_chunk_header(*source_, cursor_);
        if (st != RepackStatus::Ok) {
            fail(st);
            res.status = IoStatus::Failed;
            return res;
        }
        if (cursor_->at_end) {
            ended_     = true;
            res.status = IoStatus::EndOfStream;
            return res;
        }
        if (cursor_->header.type != kPngIdat) {
            cursor_->pending_header = true;
            ended_                  = true;
            res.status              = IoStatus::EndOfStream;
            return res;
        }
        chunks_ += 1;
    }

    const size_t want = (out.size() < cursor_->remaining)
                            ? out.size()
                            : static_cast<size_t>(cursor_->remaining);
    const IoResult r  = source_->read(out.first(want));
    if (r.status == IoStatus::Failed) {
        fail(RepackStatus::ReadFailed);
        res.status = IoStatus::Failed;
        return res;
    }
    if (r.status == IoStatus::EndOfStream || r.bytes == 0) {
        fail(RepackStatus::Truncated);
        res.status = IoStatus::Failed;
        return res;
    }

    cursor_->crc.update(out.first(r.bytes));
    cursor_->remaining -= static_cast<uint32_t>(r.bytes);
    bytes_ += r.bytes;
    res.bytes = r.bytes;
    return res;
}


RepackStatus
IdatStreamReader::drain(uint64_t* discarded) noexcept
{
    std::array<std::byte, 4096> scratch {};
    uint64_t n = 0;
    for (;;) {
        const IoResult r = read(scratch);
        if (r.status == IoStatus::Failed) {
            break;
        }
        if (r.status == IoStatus::EndOfStream) {
            break;
        }
        n += r.bytes;
    }
    if (discarded) {
        *discarded = n;
    }
    return error_;
}

}  // namespace pngrepack
