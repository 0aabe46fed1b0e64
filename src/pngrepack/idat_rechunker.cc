#include "pngrepack/idat_rechunker.h"

#include "pngrepack/png_chunk.h"

namespace pngrepack {

IdatRechunker::IdatRechunker(ByteSink& out,
                             uint32_t target_chunk_bytes) noexcept
    : out_(&out)
    , target_(target_chunk_bytes == 0 ? 1U : target_chunk_bytes)
{
    buf_.reserve((target_ < (1U << 16)) ? target_ : (1U << 16));
}


IoStatus
IdatRechunker::write(std::span<const std::byte> bytes) noexcept
{
    while (!bytes.empty()) {
        const size_t room = target_ - buf_.size();
        const size_t n    = (bytes.size() < room) ? bytes.size() : room;
        buf_.insert(buf_.end(), bytes.begin(),
                    bytes.begin() + static_cast<std::ptrdiff_t>(n));
        bytes = bytes.subspan(n);
        if (buf_.size() == target_) {
            const IoStatus st = flush();
            if (st != IoStatus::Ok) {
                return st;
            }
        }
    }
    return IoStatus::Ok;
}


IoStatus
IdatRechunker::flush() noexcept
{
    if (buf_.empty()) {
        return IoStatus::Ok;
    }
    const IoStatus st = write_chunk(*out_, kPngIdat, buf_);
    if (st != IoStatus::Ok) {
        return st;
    }
    const uint32_t n = static_cast<uint32_t>(buf_.size());
    chunks_ += 1;
    bytes_ += n;
    if (n > largest_) {
        largest_ = n;
    }
    buf_.clear();
    return IoStatus::Ok;
}

}  // namespace pngrepack
