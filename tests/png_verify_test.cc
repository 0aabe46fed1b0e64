#include "pngrepack/png_verify.h"
#include "pngrepack/png_chunk.h"

#include <gtest/gtest.h>

#include <cstdint>
#include <string_view>
#include <vector>

#include <zlib.h>

namespace pngrepack {
namespace {

    static void append_u32be(std::vector<std::byte>* out, uint32_t v)
    {
        out->push_back(std::byte { static_cast<uint8_t>((v >> 24) & 0xFF) });
        out->push_back(std::byte { static_cast<uint8_t>((v >> 16) & 0xFF) });
        out->push_back(std::byte { static_cast<uint8_t>((v >> 8) & 0xFF) });
        out->push_back(std::byte { static_cast<uint8_t>((v >> 0) & 0xFF) });
    }


    static void append_png_chunk(std::vector<std::byte>* out, uint32_t type,
                                 std::span<const std::byte> data)
    {
        append_u32be(out, static_cast<uint32_t>(data.size()));
        const size_t type_off = out->size();
        append_u32be(out, type);
        out->insert(out->end(), data.begin(), data.end());
        uLong crc = crc32(0L, Z_NULL, 0);
        crc       = crc32(crc,
                          reinterpret_cast<const Bytef*>(out->data() + type_off),
                          static_cast<uInt>(4 + data.size()));
        append_u32be(out, static_cast<uint32_t>(crc));
    }


    static std::vector<std::byte> make_ihdr()
    {
        std::vector<std::byte> ihdr;
        append_u32be(&ihdr, 16);
        append_u32be(&ihdr, 16);
        ihdr.push_back(std::byte { 8 });
        ihdr.push_back(std::byte { 0 });
        ihdr.push_back(std::byte { 0 });
        ihdr.push_back(std::byte { 0 });
        ihdr.push_back(std::byte { 0 });
        return ihdr;
    }


    static std::vector<std::byte> make_scanlines()
    {
        std::vector<std::byte> raw;
        for (uint32_t y = 0; y < 16; ++y) {
            raw.push_back(std::byte { 1 });  // Sub filter
            for (uint32_t x = 0; x < 16; ++x) {
                raw.push_back(std::byte { static_cast<uint8_t>(y ^ x) });
            }
        }
        return raw;
    }


    static std::vector<std::byte> zlib_compress(std::span<const std::byte> in)
    {
        uLongf size = compressBound(static_cast<uLong>(in.size()));
        std::vector<std::byte> out(size);
        EXPECT_EQ(compress2(reinterpret_cast<Bytef*>(out.data()), &size,
                            reinterpret_cast<const Bytef*>(in.data()),
                            static_cast<uLong>(in.size()), 9),
                  Z_OK);
        out.resize(size);
        return out;
    }


    static std::vector<std::byte> make_png(bool with_iend)
    {
        const std::vector<std::byte> z = zlib_compress(make_scanlines());
        const std::span<const std::byte> zs(z);

        std::vector<std::byte> png(kPngSignature.begin(), kPngSignature.end());
        append_png_chunk(&png, kPngIhdr, make_ihdr());
        append_png_chunk(&png, fourcc('g', 'A', 'M', 'A'),
                         std::vector<std::byte>(4, std::byte { 1 }));
        append_png_chunk(&png, kPngIdat, zs.first(5));
        append_png_chunk(&png, kPngIdat, zs.subspan(5));
        if (with_iend) {
            append_png_chunk(&png, kPngIend, {});
        }
        return png;
    }


    class CollectingVisitor final : public ChunkVisitor {
    public:
        void on_chunk(const ChunkInfo& chunk) override
        {
            types.push_back(chunk.type);
        }

        std::vector<uint32_t> types;
    };


    TEST(PngVerify, WalksValidFile)
    {
        const std::vector<std::byte> png = make_png(true);
        SpanSource source(png);
        CollectingVisitor visitor;
        std::vector<std::byte> plain;
        VectorSink sink(&plain);
        VerifyOptions options;

        const VerifyResult res = verify_png(source, options, &visitor, &sink);
        ASSERT_EQ(res.status, RepackStatus::Ok);
        EXPECT_EQ(res.chunks, 5U);
        EXPECT_EQ(res.idat_chunks, 2U);
        EXPECT_TRUE(res.has_idat);
        EXPECT_TRUE(res.has_iend);
        EXPECT_EQ(plain, make_scanlines());
        EXPECT_EQ(res.inflated_bytes, plain.size());

        const std::vector<uint32_t> expected = { kPngIhdr,
                                                 fourcc('g', 'A', 'M', 'A'),
                                                 kPngIdat, kPngIdat,
                                                 kPngIend };
        EXPECT_EQ(visitor.types, expected);
    }


    TEST(PngVerify, FramingOnlyModeSkipsDecoding)
    {
        std::vector<std::byte> png = make_png(false);
        SpanSource source(png);
        VerifyOptions options;
        options.inflate_image_data = false;

        const VerifyResult res = verify_png(source, options, nullptr, nullptr);
        ASSERT_EQ(res.status, RepackStatus::Ok);
        EXPECT_FALSE(res.has_iend);
        EXPECT_EQ(res.inflated_bytes, 0U);
        EXPECT_EQ(res.idat_bytes, png.size() - 8 - 25 - 16 - 24);
    }


    TEST(PngVerify, ReportsFirstProblem)
    {
        {
            std::vector<std::byte> png = make_png(true);
            png[8 + 25 + 8] ^= std::byte { 0x01 };  // gAMA payload
            SpanSource source(png);
            CollectingVisitor visitor;
            VerifyOptions options;
            const VerifyResult res = verify_png(source, options, &visitor,
                                                nullptr);
            EXPECT_EQ(res.status, RepackStatus::ContainerCrcMismatch);
            EXPECT_EQ(visitor.types.size(), 1U);
        }
        {
            std::vector<std::byte> png = make_png(true);
            png[8 + 25 + 16 + 8 + 1] ^= std::byte { 0x01 };  // First IDAT
            SpanSource source(png);
            VerifyOptions options;
            EXPECT_EQ(verify_png(source, options, nullptr, nullptr).status,
                      RepackStatus::ImageDataCrcMismatch);
        }
        {
            std::vector<std::byte> png = make_png(false);
            append_png_chunk(&png, fourcc('t', 'E', 'X', 't'),
                             std::vector<std::byte>(2, std::byte { 'a' }));
            append_png_chunk(&png, kPngIdat, {});
            SpanSource source(png);
            VerifyOptions options;
            EXPECT_EQ(verify_png(source, options, nullptr, nullptr).status,
                      RepackStatus::WrongImageDataOrder);
        }
        {
            const std::vector<std::byte> png = make_png(true);
            SpanSource source(png);
            VerifyOptions options;
            options.max_inflated_bytes = 100;
            EXPECT_EQ(verify_png(source, options, nullptr, nullptr).status,
                      RepackStatus::LimitExceeded);
        }
        {
            std::vector<std::byte> png = make_png(true);
            png[0]                     = std::byte { 'G' };
            SpanSource source(png);
            VerifyOptions options;
            EXPECT_EQ(verify_png(source, options, nullptr, nullptr).status,
                      RepackStatus::NotAPngFile);
        }
    }

}  // namespace
}  // namespace pngrepack
