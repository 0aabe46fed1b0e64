#include "pngrepack/png_repack.h"

#include "pngrepack/chunk_cursor.h"
#include "pngrepack/idat_rechunker.h"
#include "pngrepack/idat_stream.h"
#include "pngrepack/png_chunk.h"
#include "pngrepack/zlib_codec.h"

#include <array>
#include <vector>

namespace pngrepack {
namespace {

    // Non-IDAT payloads are read in pieces of this size so a hostile length
    // field cannot trigger one huge up-front allocation.
    static constexpr size_t kCopyPieceBytes = 1U << 16;

    static constexpr uint32_t kMaxInflateBufferBytes = 1U << 30;

    static RepackStatus deflate_failure(DeflateStatus status) noexcept
    {
        return (status == DeflateStatus::SinkFailed)
                   ? RepackStatus::WriteFailed
                   : RepackStatus::CodecFailed;
    }


    class TallySink final : public ByteSink {
    public:
        explicit TallySink(ByteSink& out) noexcept
            : out_(&out)
        {
        }

        IoStatus write(std::span<const std::byte> bytes) noexcept override
        {
            const IoStatus st = out_->write(bytes);
            if (st == IoStatus::Ok) {
                bytes_ += static_cast<uint64_t>(bytes.size());
            }
            return st;
        }

        uint64_t bytes() const noexcept { return bytes_; }

    private:
        ByteSink* out_  = nullptr;
        uint64_t bytes_ = 0;
    };


    class Repacker final {
    public:
        Repacker(ByteSource& source, ByteSink& sink,
                 const RepackOptions& options) noexcept
            : source_(&source)
            , sink_(sink)
            , options_(&options)
        {
        }

        RepackStatus run() noexcept;

        RepackResult result(RepackStatus status) const noexcept
        {
            RepackResult res = stats_;
            res.status       = status;
            res.bytes_out    = sink_.bytes();
            return res;
        }

    private:
        RepackStatus header() noexcept;
        RepackStatus copy_chunk() noexcept;
        RepackStatus repack_idat() noexcept;
        RepackStatus recompress(ZlibDeflater* deflater,
                                IdatRechunker* rechunker,
                                std::span<const std::byte> plain) noexcept;
        RepackStatus emit_verified(std::span<const std::byte> payload,
                                   uint32_t crc) noexcept;

        ByteSource* source_           = nullptr;
        TallySink sink_;
        const RepackOptions* options_ = nullptr;
        ChunkCursor cursor_;
        std::vector<std::byte> chunk_buf_;
        bool have_idat_ = false;
        RepackResult stats_;
    };


    RepackStatus Repacker::emit_verified(std::span<const std::byte> payload,
                                         uint32_t crc) noexcept
    {
        std::array<std::byte, kPngChunkHeaderSize> head {};
        std::array<std::byte, kPngChunkCrcSize> tail {};
        encode_chunk_header(cursor_.header, head);
        store_u32be(crc, tail);

        if (sink_.write(head) != IoStatus::Ok) {
            return RepackStatus::WriteFailed;
        }
        if (!payload.empty() && sink_.write(payload) != IoStatus::Ok) {
            return RepackStatus::WriteFailed;
        }
        if (sink_.write(tail) != IoStatus::Ok) {
            return RepackStatus::WriteFailed;
        }
        stats_.chunks_out += 1;
        return RepackStatus::Ok;
    }


    RepackStatus Repacker::header() noexcept
    {
        RepackStatus st = read_png_signature(*source_);
        if (st != RepackStatus::Ok) {
            return st;
        }
        if (sink_.write(kPngSignature) != IoStatus::Ok) {
            return RepackStatus::WriteFailed;
        }

        std::array<std::byte, kPngIhdrLength> ihdr {};
        uint32_t crc = 0;
        st           = read_ihdr_chunk(*source_, &cursor_, &ihdr, &crc);
        if (st != RepackStatus::Ok) {
            return st;
        }
        stats_.chunks_in += 1;
        return emit_verified(ihdr, crc);
    }


    RepackStatus Repacker::copy_chunk() noexcept
    {
        const uint64_t max_chunk = options_->limits.max_chunk_bytes;
        if (max_chunk != 0U && cursor_.header.length > max_chunk) {
            return RepackStatus::LimitExceeded;
        }

        chunk_buf_.clear();
        while (cursor_.remaining > 0) {
            const size_t n   = (cursor_.remaining < kCopyPieceBytes)
                                   ? static_cast<size_t>(cursor_.remaining)
                                   : kCopyPieceBytes;
            const size_t old = chunk_buf_.size();
            chunk_buf_.resize(old + n);
            const std::span<std::byte> piece(chunk_buf_.data() + old, n);
            const IoStatus io = read_full(*source_, piece, nullptr);
            if (io == IoStatus::Failed) {
                return RepackStatus::ReadFailed;
            }
            if (io != IoStatus::Ok) {
                return RepackStatus::Truncated;
            }
            cursor_.crc.update(piece);
            cursor_.remaining -= static_cast<uint32_t>(n);
        }

        uint32_t stored       = 0;
        const RepackStatus st = read_chunk_crc(*source_, &stored);
        if (st != RepackStatus::Ok) {
            return st;
        }
        if (stored != cursor_.crc.value()) {
            return RepackStatus::ContainerCrcMismatch;
        }
        return emit_verified(chunk_buf_, stored);
    }


    RepackStatus Repacker::recompress(ZlibDeflater* deflater,
                                      IdatRechunker* rechunker,
                                      std::span<const std::byte> plain) noexcept
    {
        DeflateStatus ds = deflater->write(plain, *rechunker);
        if (ds != DeflateStatus::Ok) {
            return deflate_failure(ds);
        }
        ds = deflater->flush(*rechunker);
        if (ds != DeflateStatus::Ok) {
            return deflate_failure(ds);
        }
        if (rechunker->flush() != IoStatus::Ok) {
            return RepackStatus::WriteFailed;
        }
        return RepackStatus::Ok;
    }


    RepackStatus Repacker::repack_idat() noexcept
    {
        IdatStreamReader reader(*source_, &cursor_);
        ZlibInflater inflater;
        ZlibDeflater deflater;
        if (!inflater.init() || !deflater.init(options_->level)) {
            return RepackStatus::CodecFailed;
        }
        IdatRechunker rechunker(sink_, options_->idat_chunk_bytes);

        std::vector<std::byte> plain(options_->inflate_buffer_bytes);
        const uint64_t max_inflated = options_->limits.max_inflated_bytes;

        RepackStatus st = RepackStatus::Ok;
        for (;;) {
            size_t produced         = 0;
            const InflateStatus ist = inflater.inflate_from(reader, plain,
                                                            &produced);
            if (produced > 0) {
                stats_.inflated_bytes += produced;
                if (max_inflated != 0U
                    && stats_.inflated_bytes > max_inflated) {
                    return RepackStatus::LimitExceeded;
                }
                st = recompress(&deflater, &rechunker,
                                std::span<const std::byte>(plain.data(),
                                                           produced));
                if (st != RepackStatus::Ok) {
                    return st;
                }
            }

            if (ist == InflateStatus::Ok) {
                continue;
            }
            if (ist == InflateStatus::StreamEnd) {
                break;
            }
            if (ist == InflateStatus::SourceFailed) {
                return (reader.error() != RepackStatus::Ok)
                           ? reader.error()
                           : RepackStatus::ReadFailed;
            }
            if (ist == InflateStatus::Failed) {
                return RepackStatus::CodecFailed;
            }
            // Corrupt or short zlib data. Finish reading the run so damage
            // inside a chunk is reported as that chunk's CRC failure.
            const RepackStatus drained = reader.drain(nullptr);
            if (drained != RepackStatus::Ok) {
                return drained;
            }
            if (ist == InflateStatus::SourceEnded) {
                return classify_interrupted_run(*source_, &cursor_);
            }
            return RepackStatus::CorruptImageStream;
        }

        uint64_t skipped = 0;
        st               = reader.drain(&skipped);
        if (st != RepackStatus::Ok) {
            return st;
        }

        const DeflateStatus ds = deflater.finish(rechunker);
        if (ds != DeflateStatus::Ok) {
            return deflate_failure(ds);
        }
        if (rechunker.flush() != IoStatus::Ok) {
            return RepackStatus::WriteFailed;
        }

        stats_.chunks_in += reader.chunks() - 1U;
        stats_.chunks_out += rechunker.chunks_written();
        stats_.idat_chunks_in      = reader.chunks();
        stats_.idat_chunks_out     = rechunker.chunks_written();
        stats_.idat_bytes_in       = reader.bytes();
        stats_.idat_bytes_out      = rechunker.bytes_written();
        stats_.trailing_idat_bytes = static_cast<uint64_t>(
                                         inflater.pending_input())
                                     + skipped;
        return RepackStatus::Ok;
    }


    RepackStatus Repacker::run() noexcept
    {
        RepackStatus st = header();
        if (st != RepackStatus::Ok) {
            return st;
        }

        for (;;) {
            if (!cursor_.pending_header) {
                st = read_chunk_header(*source_, &cursor_);
                if (st != RepackStatus::Ok) {
                    return st;
                }
                if (cursor_.at_end) {
                    return RepackStatus::Ok;
                }
            }
            cursor_.pending_header = false;
            stats_.chunks_in += 1;

            if (cursor_.header.type == kPngIdat) {
                if (have_idat_) {
                    return RepackStatus::WrongImageDataOrder;
                }
                have_idat_ = true;
                st         = repack_idat();
                if (st != RepackStatus::Ok) {
                    return st;
                }
                if (cursor_.at_end) {
                    return RepackStatus::Ok;
                }
                continue;
            }

            st = copy_chunk();
            if (st != RepackStatus::Ok) {
                return st;
            }
        }
    }

}  // namespace


bool
validate_repack_options(const RepackOptions& options) noexcept
{
    if (options.level < kMinDeflateLevel || options.level > kMaxDeflateLevel) {
        return false;
    }
    if (options.idat_chunk_bytes == 0U
        || options.idat_chunk_bytes > kPngMaxChunkLength) {
        return false;
    }
    if (options.inflate_buffer_bytes == 0U
        || options.inflate_buffer_bytes > kMaxInflateBufferBytes) {
        return false;
    }
    return true;
}


RepackResult
repack_png(ByteSource& source, ByteSink& sink,
           const RepackOptions& options) noexcept
{
    if (!validate_repack_options(options)) {
        RepackResult res;
        res.status = RepackStatus::InvalidOptions;
        return res;
    }

    Repacker repacker(source, sink, options);
    const RepackStatus st = repacker.run();
    return repacker.result(st);
}

}  // namespace pngrepack
