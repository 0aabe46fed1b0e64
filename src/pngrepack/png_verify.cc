#include "pngrepack/png_verify.h"

#include "pngrepack/idat_stream.h"
#include "pngrepack/png_chunk.h"
#include "pngrepack/zlib_codec.h"

#include <array>
#include <vector>

namespace pngrepack {
namespace {

    static void report(ChunkVisitor* visitor, const ChunkHeader& header,
                       uint32_t crc) noexcept
    {
        if (!visitor) {
            return;
        }
        ChunkInfo info;
        info.type   = header.type;
        info.length = header.length;
        info.crc    = crc;
        visitor->on_chunk(info);
    }


    static RepackStatus inflate_run(ByteSource* source, ChunkCursor* cursor,
                                    IdatStreamReader* reader,
                                    const VerifyOptions& options,
                                    ByteSink* out, VerifyResult* res) noexcept
    {
        ZlibInflater inflater;
        if (!inflater.init()) {
            return RepackStatus::CodecFailed;
        }

        std::vector<std::byte> plain(1U << 16);
        for (;;) {
            size_t produced         = 0;
            const InflateStatus ist = inflater.inflate_from(*reader, plain,
                                                            &produced);
            if (produced > 0) {
                res->inflated_bytes += produced;
                if (options.max_inflated_bytes != 0U
                    && res->inflated_bytes > options.max_inflated_bytes) {
                    return RepackStatus::LimitExceeded;
                }
                if (out
                    && out->write(std::span<const std::byte>(plain.data(),
                                                             produced))
                           != IoStatus::Ok) {
                    return RepackStatus::WriteFailed;
                }
            }
            switch (ist) {
            case InflateStatus::Ok: continue;
            case InflateStatus::StreamEnd: return reader->drain(nullptr);
            case InflateStatus::SourceFailed:
                return (reader->error() != RepackStatus::Ok)
                           ? reader->error()
                           : RepackStatus::ReadFailed;
            case InflateStatus::Failed: return RepackStatus::CodecFailed;
            case InflateStatus::Corrupt: {
                const RepackStatus drained = reader->drain(nullptr);
                return (drained != RepackStatus::Ok)
                           ? drained
                           : RepackStatus::CorruptImageStream;
            }
            case InflateStatus::SourceEnded: {
                const RepackStatus drained = reader->drain(nullptr);
                if (drained != RepackStatus::Ok) {
                    return drained;
                }
                return classify_interrupted_run(*source, cursor);
            }
            }
            return RepackStatus::CorruptImageStream;
        }
    }


    static RepackStatus walk(ByteSource& source, const VerifyOptions& options,
                             ChunkVisitor* visitor, ByteSink* inflated_out,
                             VerifyResult* res) noexcept
    {
        RepackStatus st = read_png_signature(source);
        if (st != RepackStatus::Ok) {
            return st;
        }

        ChunkCursor cursor;
        std::array<std::byte, kPngIhdrLength> ihdr {};
        uint32_t crc = 0;
        st           = read_ihdr_chunk(source, &cursor, &ihdr, &crc);
        if (st != RepackStatus::Ok) {
            return st;
        }
        res->chunks += 1;
        report(visitor, cursor.header, crc);

        for (;;) {
            if (!cursor.pending_header) {
                st = read_chunk_header(source, &cursor);
                if (st != RepackStatus::Ok) {
                    return st;
                }
                if (cursor.at_end) {
                    return RepackStatus::Ok;
                }
            }
            cursor.pending_header = false;

            if (cursor.header.type == kPngIdat) {
                if (res->has_idat) {
                    return RepackStatus::WrongImageDataOrder;
                }
                res->has_idat = true;

                IdatStreamReader reader(source, &cursor);
                reader.set_visitor(visitor);
                st = options.inflate_image_data
                         ? inflate_run(&source, &cursor, &reader, options,
                                       inflated_out, res)
                         : reader.drain(nullptr);
                res->idat_chunks = reader.chunks();
                res->idat_bytes  = reader.bytes();
                if (st != RepackStatus::Ok) {
                    return st;
                }
                res->chunks += reader.chunks();
                if (cursor.at_end) {
                    return RepackStatus::Ok;
                }
                continue;
            }

            st = skip_chunk(source, &cursor, &crc);
            if (st != RepackStatus::Ok) {
                return st;
            }
            res->chunks += 1;
            if (cursor.header.type == kPngIend) {
                res->has_iend = true;
            }
            report(visitor, cursor.header, crc);
        }
    }

}  // namespace


VerifyResult
verify_png(ByteSource& source, const VerifyOptions& options,
           ChunkVisitor* visitor, ByteSink* inflated_out) noexcept
{
    VerifyResult res;
    res.status = walk(source, options, visitor, inflated_out, &res);
    return res;
}

}  // namespace pngrepack
