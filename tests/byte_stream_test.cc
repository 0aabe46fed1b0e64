#include "pngrepack/byte_stream.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <vector>

namespace pngrepack {
namespace {

    static std::vector<std::byte> make_bytes(size_t n)
    {
        std::vector<std::byte> out(n);
        for (size_t i = 0; i < n; ++i) {
            out[i] = std::byte { static_cast<uint8_t>(i * 7 + 1) };
        }
        return out;
    }


    // Returns at most `step` bytes per read.
    class TrickleSource final : public ByteSource {
    public:
        TrickleSource(std::span<const std::byte> bytes, size_t step) noexcept
            : bytes_(bytes)
            , step_(step)
        {
        }

        IoResult read(std::span<std::byte> out) noexcept override
        {
            IoResult res;
            if (pos_ == bytes_.size()) {
                res.status = IoStatus::EndOfStream;
                return res;
            }
            size_t n = bytes_.size() - pos_;
            n        = (n < step_) ? n : step_;
            n        = (n < out.size()) ? n : out.size();
            std::memcpy(out.data(), bytes_.data() + pos_, n);
            pos_ += n;
            res.bytes = n;
            return res;
        }

    private:
        std::span<const std::byte> bytes_;
        size_t step_ = 1;
        size_t pos_  = 0;
    };


    class BrokenSource final : public ByteSource {
    public:
        IoResult read(std::span<std::byte>) noexcept override
        {
            IoResult res;
            res.status = IoStatus::Failed;
            return res;
        }
    };


    TEST(ByteStream, SpanSourceReadsInOrderThenEnds)
    {
        const std::vector<std::byte> bytes = make_bytes(10);
        SpanSource source(bytes);

        std::array<std::byte, 4> buf {};
        IoResult r = source.read(buf);
        EXPECT_EQ(r.status, IoStatus::Ok);
        EXPECT_EQ(r.bytes, 4U);
        EXPECT_EQ(buf[0], bytes[0]);
        EXPECT_EQ(source.position(), 4U);
        EXPECT_EQ(source.remaining(), 6U);

        r = source.read(std::span<std::byte>());
        EXPECT_EQ(r.status, IoStatus::Ok);
        EXPECT_EQ(r.bytes, 0U);

        std::array<std::byte, 16> big {};
        r = source.read(big);
        EXPECT_EQ(r.status, IoStatus::Ok);
        EXPECT_EQ(r.bytes, 6U);
        EXPECT_EQ(big[5], bytes[9]);

        r = source.read(big);
        EXPECT_EQ(r.status, IoStatus::EndOfStream);
        EXPECT_EQ(r.bytes, 0U);
    }


    TEST(ByteStream, ReadFullJoinsShortReads)
    {
        const std::vector<std::byte> bytes = make_bytes(33);
        TrickleSource source(bytes, 3);

        std::vector<std::byte> buf(20);
        size_t got = 0;
        EXPECT_EQ(read_full(source, buf, &got), IoStatus::Ok);
        EXPECT_EQ(got, 20U);
        EXPECT_TRUE(std::equal(buf.begin(), buf.end(), bytes.begin()));

        EXPECT_EQ(read_full(source, buf, &got), IoStatus::EndOfStream);
        EXPECT_EQ(got, 13U);

        EXPECT_EQ(read_full(source, buf, &got), IoStatus::EndOfStream);
        EXPECT_EQ(got, 0U);
    }


    TEST(ByteStream, ReadFullReportsFailure)
    {
        BrokenSource source;
        std::array<std::byte, 4> buf {};
        size_t got = 99;
        EXPECT_EQ(read_full(source, buf, &got), IoStatus::Failed);
        EXPECT_EQ(got, 0U);
    }


    TEST(ByteStream, VectorAndCountingSinks)
    {
        const std::vector<std::byte> bytes = make_bytes(9);

        std::vector<std::byte> out;
        VectorSink sink(&out);
        EXPECT_EQ(sink.write(std::span<const std::byte>(bytes).first(4)),
                  IoStatus::Ok);
        EXPECT_EQ(sink.write(std::span<const std::byte>(bytes).subspan(4)),
                  IoStatus::Ok);
        EXPECT_EQ(out, bytes);

        VectorSink detached(nullptr);
        EXPECT_EQ(detached.write(bytes), IoStatus::Failed);

        CountingSink counter;
        EXPECT_EQ(counter.write(bytes), IoStatus::Ok);
        EXPECT_EQ(counter.write(bytes), IoStatus::Ok);
        EXPECT_EQ(counter.count(), 18U);
    }


    TEST(ByteStream, StdioSinkAndSourceRoundTripThroughFile)
    {
        std::FILE* f = std::tmpfile();
        ASSERT_NE(f, nullptr);

        const std::vector<std::byte> bytes = make_bytes(5000);
        StdioSink sink(f);
        EXPECT_EQ(sink.write(bytes), IoStatus::Ok);
        EXPECT_EQ(sink.write(std::span<const std::byte>()), IoStatus::Ok);
        std::rewind(f);

        StdioSource source(f);
        std::vector<std::byte> back(6000);
        size_t got = 0;
        EXPECT_EQ(read_full(source, back, &got), IoStatus::EndOfStream);
        EXPECT_EQ(got, bytes.size());
        back.resize(got);
        EXPECT_EQ(back, bytes);
        std::fclose(f);

        StdioSource closed(nullptr);
        std::array<std::byte, 4> buf {};
        EXPECT_EQ(closed.read(buf).status, IoStatus::Failed);
        StdioSink closed_sink(nullptr);
        EXPECT_EQ(closed_sink.write(buf), IoStatus::Failed);
    }

}  // namespace
}  // namespace pngrepack
