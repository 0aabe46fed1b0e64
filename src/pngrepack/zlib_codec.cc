#include "pngrepack/zlib_codec.h"

namespace pngrepack {

ZlibInflater::~ZlibInflater() noexcept
{
    if (active_) {
        (void)inflateEnd(&strm_);
    }
}


bool
ZlibInflater::init() noexcept
{
    if (active_) {
        (void)inflateEnd(&strm_);
        active_ = false;
    }
    strm_          = z_stream {};
    strm_.zalloc   = Z_NULL;
    strm_.zfree    = Z_NULL;
    strm_.opaque   = Z_NULL;
    strm_.next_in  = Z_NULL;
    strm_.avail_in = 0;
    source_done_   = false;
    if (inflateInit(&strm_) != Z_OK) {
        return false;
    }
    active_ = true;
    return true;
}


InflateStatus
ZlibInflater::inflate_from(ByteSource& source, std::span<std::byte> out,
                           size_t* produced) noexcept
{
    *produced = 0;
    if (!active_) {
        return InflateStatus::Failed;
    }

    while (*produced < out.size()) {
        if (strm_.avail_in == 0 && !source_done_) {
            const IoResult r = source.read(in_buf_);
            if (r.status == IoStatus::Failed) {
                return InflateStatus::SourceFailed;
            }
            if (r.status == IoStatus::EndOfStream || r.bytes == 0) {
                source_done_ = true;
            } else {
                strm_.next_in  = reinterpret_cast<Bytef*>(in_buf_.data());
                strm_.avail_in = static_cast<uInt>(r.bytes);
            }
        }

        const size_t room = out.size() - *produced;
        const uInt chunk  = (room > 0x40000000U) ? 0x40000000U
                                                 : static_cast<uInt>(room);
        strm_.next_out    = reinterpret_cast<Bytef*>(out.data() + *produced);
        strm_.avail_out   = chunk;

        const int ret = inflate(&strm_, Z_NO_FLUSH);
        *produced += chunk - strm_.avail_out;

        if (ret == Z_STREAM_END) {
            return InflateStatus::StreamEnd;
        }
        if (ret == Z_BUF_ERROR) {
            // No progress: more input is needed.
            if (source_done_ && strm_.avail_in == 0) {
                return InflateStatus::SourceEnded;
            }
            continue;
        }
        if (ret == Z_MEM_ERROR) {
            return InflateStatus::Failed;
        }
        if (ret != Z_OK) {
            return InflateStatus::Corrupt;
        }
        if (source_done_ && strm_.avail_in == 0 && strm_.avail_out != 0) {
            return InflateStatus::SourceEnded;
        }
    }
    return InflateStatus::Ok;
}


size_t
ZlibInflater::pending_input() const noexcept
{
    return active_ ? static_cast<size_t>(strm_.avail_in) : 0;
}


uint64_t
ZlibInflater::total_in() const noexcept
{
    return active_ ? static_cast<uint64_t>(strm_.total_in) : 0;
}


uint64_t
ZlibInflater::total_out() const noexcept
{
    return active_ ? static_cast<uint64_t>(strm_.total_out) : 0;
}


ZlibDeflater::~ZlibDeflater() noexcept
{
    if (active_) {
        (void)deflateEnd(&strm_);
    }
}


bool
ZlibDeflater::init(int level) noexcept
{
    if (active_) {
        (void)deflateEnd(&strm_);
        active_ = false;
    }
    if (level < kMinDeflateLevel || level > kMaxDeflateLevel) {
        return false;
    }
    strm_        = z_stream {};
    strm_.zalloc = Z_NULL;
    strm_.zfree  = Z_NULL;
    strm_.opaque = Z_NULL;
    if (deflateInit(&strm_, level) != Z_OK) {
        return false;
    }
    active_ = true;
    return true;
}


DeflateStatus
ZlibDeflater::pump(std::span<const std::byte> in, int mode,
                   ByteSink& out) noexcept
{
    if (!active_) {
        return DeflateStatus::Failed;
    }

    const std::byte* p = in.data();
    size_t left        = in.size();
    for (;;) {
        if (strm_.avail_in == 0 && left > 0) {
            const uInt n   = (left > 0x40000000U) ? 0x40000000U
                                                  : static_cast<uInt>(left);
            strm_.next_in  = reinterpret_cast<Bytef*>(const_cast<std::byte*>(p));
            strm_.avail_in = n;
            p += n;
            left -= n;
        }
        // Only request the flush once all input has been handed to zlib.
        const int flush = (left == 0) ? mode : Z_NO_FLUSH;

        strm_.next_out  = reinterpret_cast<Bytef*>(out_buf_.data());
        strm_.avail_out = static_cast<uInt>(out_buf_.size());

        const int ret = deflate(&strm_, flush);
        if (ret == Z_STREAM_ERROR) {
            return DeflateStatus::Failed;
        }

        const size_t have = out_buf_.size() - strm_.avail_out;
        if (have > 0) {
            if (out.write(std::span<const std::byte>(out_buf_.data(), have))
                != IoStatus::Ok) {
                return DeflateStatus::SinkFailed;
            }
        }

        if (flush == Z_FINISH) {
            if (ret == Z_STREAM_END) {
                return DeflateStatus::Ok;
            }
            continue;
        }
        if (strm_.avail_out != 0 && strm_.avail_in == 0 && left == 0) {
            return DeflateStatus::Ok;
        }
    }
}


DeflateStatus
ZlibDeflater::write(std::span<const std::byte> in, ByteSink& out) noexcept
{
    if (in.empty()) {
        return active_ ? DeflateStatus::Ok : DeflateStatus::Failed;
    }
    return pump(in, Z_NO_FLUSH, out);
}


DeflateStatus
ZlibDeflater::flush(ByteSink& out) noexcept
{
    return pump({}, Z_SYNC_FLUSH, out);
}


DeflateStatus
ZlibDeflater::finish(ByteSink& out) noexcept
{
    return pump({}, Z_FINISH, out);
}


uint64_t
ZlibDeflater::total_in() const noexcept
{
    return active_ ? static_cast<uint64_t>(strm_.total_in) : 0;
}


uint64_t
ZlibDeflater::total_out() const noexcept
{
    return active_ ? static_cast<uint64_t>(strm_.total_out) : 0;
}

}  // namespace pngrepack
