#include "pngrepack/idat_rechunker.h"
#include "pngrepack/chunk_crc.h"
#include "pngrepack/png_chunk.h"

#include <gtest/gtest.h>

#include <cstdint>
#include <vector>

namespace pngrepack {
namespace {

    static std::vector<std::byte> make_payload(size_t n)
    {
        std::vector<std::byte> out(n);
        for (size_t i = 0; i < n; ++i) {
            out[i] = std::byte { static_cast<uint8_t>(i * 13) };
        }
        return out;
    }


    // Parses emitted IDAT chunks back into payloads, checking their framing.
    static std::vector<std::vector<std::byte>>
    parse_idat_chunks(const std::vector<std::byte>& bytes)
    {
        std::vector<std::vector<std::byte>> out;
        const std::span<const std::byte> all(bytes);
        size_t off = 0;
        while (off < bytes.size()) {
            const ChunkHeader h = decode_chunk_header(all.subspan(off, 8));
            EXPECT_EQ(h.type, kPngIdat);
            const std::span<const std::byte> data = all.subspan(off + 8,
                                                                h.length);
            EXPECT_EQ(load_u32be(all.subspan(off + 8 + h.length, 4)),
                      ChunkCrc::of(kPngIdat, data));
            out.emplace_back(data.begin(), data.end());
            off += 12 + h.length;
        }
        return out;
    }


    class FailingSink final : public ByteSink {
    public:
        IoStatus write(std::span<const std::byte>) noexcept override
        {
            return IoStatus::Failed;
        }
    };


    TEST(IdatRechunker, SplitsAtTargetAndFlushesRemainder)
    {
        const std::vector<std::byte> payload = make_payload(25);

        std::vector<std::byte> out;
        VectorSink sink(&out);
        IdatRechunker rechunker(sink, 10);
        const std::span<const std::byte> all(payload);
        ASSERT_EQ(rechunker.write(all.first(3)), IoStatus::Ok);
        ASSERT_EQ(rechunker.write(all.subspan(3)), IoStatus::Ok);
        EXPECT_EQ(rechunker.chunks_written(), 2U);
        ASSERT_EQ(rechunker.flush(), IoStatus::Ok);
        ASSERT_EQ(rechunker.flush(), IoStatus::Ok);

        const std::vector<std::vector<std::byte>> chunks = parse_idat_chunks(
            out);
        ASSERT_EQ(chunks.size(), 3U);
        EXPECT_EQ(chunks[0].size(), 10U);
        EXPECT_EQ(chunks[1].size(), 10U);
        EXPECT_EQ(chunks[2].size(), 5U);
        EXPECT_EQ(chunks[2].back(), payload.back());

        EXPECT_EQ(rechunker.chunks_written(), 3U);
        EXPECT_EQ(rechunker.bytes_written(), 25U);
        EXPECT_EQ(rechunker.largest_chunk(), 10U);
    }


    TEST(IdatRechunker, FlushWithoutDataEmitsNothing)
    {
        std::vector<std::byte> out;
        VectorSink sink(&out);
        IdatRechunker rechunker(sink, 64);
        ASSERT_EQ(rechunker.flush(), IoStatus::Ok);
        EXPECT_TRUE(out.empty());
        EXPECT_EQ(rechunker.chunks_written(), 0U);
    }


    TEST(IdatRechunker, ZeroTargetEmitsSingleByteChunks)
    {
        const std::vector<std::byte> payload = make_payload(3);
        std::vector<std::byte> out;
        VectorSink sink(&out);
        IdatRechunker rechunker(sink, 0);
        ASSERT_EQ(rechunker.write(payload), IoStatus::Ok);
        EXPECT_EQ(parse_idat_chunks(out).size(), 3U);
    }


    TEST(IdatRechunker, PropagatesSinkFailure)
    {
        const std::vector<std::byte> payload = make_payload(12);
        FailingSink sink;
        IdatRechunker rechunker(sink, 8);
        EXPECT_EQ(rechunker.write(payload), IoStatus::Failed);
        EXPECT_EQ(rechunker.chunks_written(), 0U);
    }

}  // namespace
}  // namespace pngrepack
