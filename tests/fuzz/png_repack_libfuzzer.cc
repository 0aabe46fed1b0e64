#include "pngrepack/png_chunk.h"
#include "pngrepack/png_repack.h"
#include "pngrepack/png_verify.h"

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <span>
#include <vector>

namespace pngrepack {

[[noreturn]] static void
fuzz_trap() noexcept
{
#if defined(__clang__) || defined(__GNUC__)
    __builtin_trap();
#else
    std::abort();
#endif
}


// A successful repack must produce a file that passes verification with the
// same decoded size.
static void
verify_output(const std::vector<std::byte>& out,
              const RepackResult& res) noexcept
{
    SpanSource source(out);
    VerifyOptions options;
    const VerifyResult v = verify_png(source, options, nullptr, nullptr);
    if (v.status != RepackStatus::Ok) {
        fuzz_trap();
    }
    if (v.inflated_bytes != res.inflated_bytes) {
        fuzz_trap();
    }
    if (res.bytes_out != out.size()) {
        fuzz_trap();
    }
}

}  // namespace pngrepack

extern "C" int
LLVMFuzzerTestOneInput(const uint8_t* data, size_t size)
{
    using namespace pngrepack;

    if (size < 1) {
        return 0;
    }

    // The first byte selects level and chunk size; the rest is the file.
    const uint8_t knob = data[0];
    const std::span<const std::byte> bytes(reinterpret_cast<const std::byte*>(
                                               data + 1),
                                           size - 1);

    RepackOptions options;
    options.level                     = static_cast<int>(knob % 11U) - 1;
    options.idat_chunk_bytes          = 1U + static_cast<uint32_t>(knob >> 4)
                                                 * 97U;
    options.inflate_buffer_bytes      = 4096;
    options.limits.max_chunk_bytes    = 1U << 20;
    options.limits.max_inflated_bytes = 1U << 24;

    std::vector<std::byte> out;
    SpanSource source(bytes);
    VectorSink sink(&out);
    const RepackResult res = repack_png(source, sink, options);
    if (res.status == RepackStatus::Ok) {
        verify_output(out, res);
    }
    return 0;
}
