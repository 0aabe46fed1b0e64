#include "pngrepack/byte_stream.h"

#include <cstring>

namespace pngrepack {

IoStatus
read_full(ByteSource& source, std::span<std::byte> out, size_t* got) noexcept
{
    size_t n = 0;
    while (n < out.size()) {
        const IoResult r = source.read(out.subspan(n));
        if (r.status == IoStatus::Failed) {
            if (got) {
                *got = n;
            }
            return IoStatus::Failed;
        }
        if (r.status == IoStatus::EndOfStream || r.bytes == 0) {
            if (got) {
                *got = n;
            }
            return IoStatus::EndOfStream;
        }
        n += r.bytes;
    }
    if (got) {
        *got = n;
    }
    return IoStatus::Ok;
}


SpanSource::SpanSource(std::span<const std::byte> bytes) noexcept
    : bytes_(bytes)
{
}


IoResult
SpanSource::read(std::span<std::byte> out) noexcept
{
    IoResult res;
    if (out.empty()) {
        return res;
    }
    const size_t avail = bytes_.size() - pos_;
    if (avail == 0) {
        res.status = IoStatus::EndOfStream;
        return res;
    }
    const size_t n = (out.size() < avail) ? out.size() : avail;
    std::memcpy(out.data(), bytes_.data() + pos_, n);
    pos_ += n;
    res.bytes = n;
    return res;
}


VectorSink::VectorSink(std::vector<std::byte>* out) noexcept
    : out_(out)
{
}


IoStatus
VectorSink::write(std::span<const std::byte> bytes) noexcept
{
    if (!out_) {
        return IoStatus::Failed;
    }
    out_->insert(out_->end(), bytes.begin(), bytes.end());
    return IoStatus::Ok;
}


IoStatus
CountingSink::write(std::span<const std::byte> bytes) noexcept
{
    count_ += static_cast<uint64_t>(bytes.size());
    return IoStatus::Ok;
}


StdioSource::StdioSource(std::FILE* f) noexcept
    : f_(f)
{
}


IoResult
StdioSource::read(std::span<std::byte> out) noexcept
{
    IoResult res;
    if (!f_) {
        res.status = IoStatus::Failed;
        return res;
    }
    if (out.empty()) {
        return res;
    }
    const size_t n = std::fread(out.data(), 1, out.size(), f_);
    if (n > 0) {
        res.bytes = n;
        return res;
    }
    res.status = std::ferror(f_) ? IoStatus::Failed : IoStatus::EndOfStream;
    return res;
}


StdioSink::StdioSink(std::FILE* f) noexcept
    : f_(f)
{
}


IoStatus
StdioSink::write(std::span<const std::byte> bytes) noexcept
{
    if (!f_) {
        return IoStatus::Failed;
    }
    if (bytes.empty()) {
        return IoStatus::Ok;
    }
    const size_t n = std::fwrite(bytes.data(), 1, bytes.size(), f_);
    return (n == bytes.size()) ? IoStatus::Ok : IoStatus::Failed;
}

}  // namespace pngrepack
