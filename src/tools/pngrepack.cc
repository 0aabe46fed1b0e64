#include "pngrepack/build_info.h"
#include "pngrepack/byte_stream.h"
#include "pngrepack/png_chunk.h"
#include "pngrepack/png_repack.h"
#include "pngrepack/png_verify.h"
#include "pngrepack/zlib_codec.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <string_view>
#include <vector>

namespace pngrepack {
namespace {

    static void usage(const char* argv0)
    {
        std::printf(
            "Usage: %s [options] <input> <output>\n"
            "       %s --list <input> [input...]\n"
            "\n"
            "Recompresses the image data (IDAT) of a PNG file at a new zlib level.\n"
            "All other chunks are copied unchanged. Use - for stdin/stdout.\n"
            "\n"
            "Options:\n"
            "  --help                  Show this help\n"
            "  --version               Print PngRepack build info\n"
            "  --no-build-info         Hide build info header\n"
            "  -l, --level N           zlib level -1..9 (default: 9)\n"
            "  --chunk-size N          Max IDAT chunk payload in bytes (default: 65536)\n"
            "  --max-chunk-bytes N     Refuse non-IDAT chunks larger than N bytes\n"
            "                          (default: 0=unlimited)\n"
            "  --max-inflated-bytes N  Refuse image data decoding to more than N bytes\n"
            "                          (default: 0=unlimited)\n"
            "  --force                 Overwrite an existing output file\n"
            "  --verify                Re-read the output and check CRCs and image data\n"
            "  --list                  Validate inputs and list their chunks (no output)\n"
            "  -q, --quiet             Only report errors\n",
            argv0 ? argv0 : "pngrepack", argv0 ? argv0 : "pngrepack");
    }


    static bool parse_u64_arg(const char* s, uint64_t* out)
    {
        if (!s || !*s || !out) {
            return false;
        }
        char* end            = nullptr;
        unsigned long long v = std::strtoull(s, &end, 10);
        if (!end || *end != '\0') {
            return false;
        }
        *out = static_cast<uint64_t>(v);
        return true;
    }


    static bool parse_u32_arg(const char* s, uint32_t* out)
    {
        uint64_t v = 0;
        if (!parse_u64_arg(s, &v) || v > 0xFFFFFFFFULL) {
            return false;
        }
        *out = static_cast<uint32_t>(v);
        return true;
    }


    static bool parse_level_arg(const char* s, int* out)
    {
        if (!s || !*s || !out) {
            return false;
        }
        char* end = nullptr;
        long v    = std::strtol(s, &end, 10);
        if (!end || *end != '\0' || v < kMinDeflateLevel
            || v > kMaxDeflateLevel) {
            return false;
        }
        *out = static_cast<int>(v);
        return true;
    }


    static const char* repack_status_name(RepackStatus status) noexcept
    {
        switch (status) {
        case RepackStatus::Ok: return "ok";
        case RepackStatus::NotAPngFile: return "not_a_png_file";
        case RepackStatus::MissingHeader: return "missing_ihdr";
        case RepackStatus::BadHeaderLength: return "bad_ihdr_length";
        case RepackStatus::UnsupportedCompressionMethod:
            return "unsupported_compression_method";
        case RepackStatus::ChunkTooLarge: return "chunk_too_large";
        case RepackStatus::ContainerCrcMismatch: return "chunk_crc_mismatch";
        case RepackStatus::ImageDataCrcMismatch: return "idat_crc_mismatch";
        case RepackStatus::WrongImageDataOrder: return "wrong_idat_order";
        case RepackStatus::CorruptImageStream: return "corrupt_idat_stream";
        case RepackStatus::Truncated: return "truncated";
        case RepackStatus::InvalidOptions: return "invalid_options";
        case RepackStatus::LimitExceeded: return "limit_exceeded";
        case RepackStatus::ReadFailed: return "read_failed";
        case RepackStatus::WriteFailed: return "write_failed";
        case RepackStatus::CodecFailed: return "codec_failed";
        }
        return "unknown";
    }


    static void print_build_info_header(std::FILE* out)
    {
        std::string line1;
        std::string line2;
        format_build_info_lines(&line1, &line2);
        std::fprintf(out, "%s\n%s\n", line1.c_str(), line2.c_str());
    }


    static bool is_stdio_path(std::string_view path) noexcept
    {
        return path == "-";
    }


    static bool file_exists(const std::string& path)
    {
        std::FILE* f = std::fopen(path.c_str(), "rb");
        if (!f) {
            return false;
        }
        std::fclose(f);
        return true;
    }


    class ChunkPrinter final : public ChunkVisitor {
    public:
        explicit ChunkPrinter(std::FILE* out) noexcept
            : out_(out)
        {
        }

        void on_chunk(const ChunkInfo& chunk) override
        {
            std::string type;
            format_chunk_type(chunk.type, &type);
            std::fprintf(out_, "  [%u] %s length=%u crc=%08X%s%s\n", index_,
                         type.c_str(), chunk.length, chunk.crc,
                         is_critical_chunk(chunk.type) ? " critical" : "",
                         is_valid_chunk_type(chunk.type) ? ""
                                                         : " malformed_type");
            index_ += 1;
        }

    private:
        std::FILE* out_ = nullptr;
        uint32_t index_ = 0;
    };


    static bool list_file(const char* path, std::FILE* info)
    {
        std::FILE* f = is_stdio_path(path) ? stdin : std::fopen(path, "rb");
        if (!f) {
            std::fprintf(stderr, "pngrepack: %s: open_failed\n", path);
            return false;
        }

        std::fprintf(info, "== %s\n", path);
        StdioSource source(f);
        ChunkPrinter printer(info);
        CountingSink inflated;
        VerifyOptions options;
        const VerifyResult res = verify_png(source, options, &printer,
                                            &inflated);
        if (f != stdin) {
            std::fclose(f);
        }

        if (res.status != RepackStatus::Ok) {
            std::fprintf(stderr, "pngrepack: %s: %s\n", path,
                         repack_status_name(res.status));
            return false;
        }
        std::fprintf(info,
                     "  chunks=%u idat_chunks=%u idat_bytes=%llu "
                     "inflated=%llu iend=%u\n",
                     res.chunks, res.idat_chunks,
                     static_cast<unsigned long long>(res.idat_bytes),
                     static_cast<unsigned long long>(res.inflated_bytes),
                     res.has_iend ? 1U : 0U);
        return true;
    }


    static bool verify_file(const std::string& path, uint64_t expect_inflated,
                            const RepackLimits& limits)
    {
        std::FILE* f = std::fopen(path.c_str(), "rb");
        if (!f) {
            std::fprintf(stderr, "pngrepack: %s: verify open_failed\n",
                         path.c_str());
            return false;
        }
        StdioSource source(f);
        VerifyOptions options;
        options.max_inflated_bytes = limits.max_inflated_bytes;
        const VerifyResult res     = verify_png(source, options, nullptr,
                                                nullptr);
        std::fclose(f);

        if (res.status != RepackStatus::Ok) {
            std::fprintf(stderr, "pngrepack: %s: verify=%s\n", path.c_str(),
                         repack_status_name(res.status));
            return false;
        }
        if (res.inflated_bytes != expect_inflated) {
            std::fprintf(stderr,
                         "pngrepack: %s: verify inflated=%llu expected=%llu\n",
                         path.c_str(),
                         static_cast<unsigned long long>(res.inflated_bytes),
                         static_cast<unsigned long long>(expect_inflated));
            return false;
        }
        return true;
    }


    struct RepackJob final {
        std::string input;
        std::string output;
        bool force  = false;
        bool verify = false;
        bool quiet  = false;
        RepackOptions options;
    };


    static bool run_repack(const RepackJob& job, std::FILE* info)
    {
        const bool to_stdout = is_stdio_path(job.output);
        if (!to_stdout && !job.force && file_exists(job.output)) {
            std::fprintf(stderr, "pngrepack: %s: exists (use --force)\n",
                         job.output.c_str());
            return false;
        }

        std::FILE* in = is_stdio_path(job.input)
                            ? stdin
                            : std::fopen(job.input.c_str(), "rb");
        if (!in) {
            std::fprintf(stderr, "pngrepack: %s: open_failed\n",
                         job.input.c_str());
            return false;
        }

        // Output goes to <output>.tmp and is renamed only on success.
        const std::string tmp_path = to_stdout ? std::string()
                                               : job.output + ".tmp";
        std::FILE* out = to_stdout ? stdout
                                   : std::fopen(tmp_path.c_str(), "wb");
        if (!out) {
            std::fprintf(stderr, "pngrepack: %s: create_failed\n",
                         tmp_path.c_str());
            if (in != stdin) {
                std::fclose(in);
            }
            return false;
        }

        StdioSource source(in);
        StdioSink sink(out);
        const RepackResult res = repack_png(source, sink, job.options);

        if (in != stdin) {
            std::fclose(in);
        }
        bool closed_ok = true;
        if (to_stdout) {
            closed_ok = std::fflush(stdout) == 0;
        } else {
            closed_ok = std::fclose(out) == 0;
        }

        if (res.status != RepackStatus::Ok || !closed_ok) {
            std::fprintf(stderr, "pngrepack: %s: %s\n", job.input.c_str(),
                         res.status != RepackStatus::Ok
                             ? repack_status_name(res.status)
                             : "write_failed");
            if (!to_stdout) {
                (void)std::remove(tmp_path.c_str());
            }
            return false;
        }

        if (!to_stdout) {
            if (job.verify
                && !verify_file(tmp_path, res.inflated_bytes,
                                job.options.limits)) {
                (void)std::remove(tmp_path.c_str());
                return false;
            }
#if defined(_WIN32)
            (void)std::remove(job.output.c_str());
#endif
            if (std::rename(tmp_path.c_str(), job.output.c_str()) != 0) {
                std::fprintf(stderr, "pngrepack: %s: rename_failed\n",
                             job.output.c_str());
                (void)std::remove(tmp_path.c_str());
                return false;
            }
        }

        if (!job.quiet) {
            std::fprintf(info,
                         "%s -> %s: level=%d idat_chunks=%u->%u "
                         "idat_bytes=%llu->%llu inflated=%llu",
                         job.input.c_str(), job.output.c_str(),
                         job.options.level, res.idat_chunks_in,
                         res.idat_chunks_out,
                         static_cast<unsigned long long>(res.idat_bytes_in),
                         static_cast<unsigned long long>(res.idat_bytes_out),
                         static_cast<unsigned long long>(res.inflated_bytes));
            if (res.trailing_idat_bytes != 0U) {
                std::fprintf(info, " dropped_trailing=%llu",
                             static_cast<unsigned long long>(
                                 res.trailing_idat_bytes));
            }
            std::fprintf(info, "\n");
        }
        return true;
    }

}  // namespace
}  // namespace pngrepack


int
main(int argc, char** argv)
{
    using namespace pngrepack;

    bool show_build_info = true;
    bool list_only       = false;
    RepackJob job;
    job.options.level = 9;
    std::vector<std::string> paths;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (!arg) {
            continue;
        }
        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            usage(argv[0]);
            return 0;
        }
        if (std::strcmp(arg, "--version") == 0) {
            print_build_info_header(stdout);
            return 0;
        }
        if (std::strcmp(arg, "--no-build-info") == 0) {
            show_build_info = false;
            continue;
        }
        if ((std::strcmp(arg, "-l") == 0 || std::strcmp(arg, "--level") == 0)
            && i + 1 < argc) {
            if (!parse_level_arg(argv[i + 1], &job.options.level)) {
                std::fprintf(stderr, "invalid --level value\n");
                return 2;
            }
            i += 1;
            continue;
        }
        if (std::strcmp(arg, "--chunk-size") == 0 && i + 1 < argc) {
            if (!parse_u32_arg(argv[i + 1], &job.options.idat_chunk_bytes)
                || job.options.idat_chunk_bytes == 0U
                || job.options.idat_chunk_bytes > kPngMaxChunkLength) {
                std::fprintf(stderr, "invalid --chunk-size value\n");
                return 2;
            }
            i += 1;
            continue;
        }
        if (std::strcmp(arg, "--max-chunk-bytes") == 0 && i + 1 < argc) {
            if (!parse_u64_arg(argv[i + 1],
                               &job.options.limits.max_chunk_bytes)) {
                std::fprintf(stderr, "invalid --max-chunk-bytes value\n");
                return 2;
            }
            i += 1;
            continue;
        }
        if (std::strcmp(arg, "--max-inflated-bytes") == 0 && i + 1 < argc) {
            if (!parse_u64_arg(argv[i + 1],
                               &job.options.limits.max_inflated_bytes)) {
                std::fprintf(stderr, "invalid --max-inflated-bytes value\n");
                return 2;
            }
            i += 1;
            continue;
        }
        if (std::strcmp(arg, "--force") == 0) {
            job.force = true;
            continue;
        }
        if (std::strcmp(arg, "--verify") == 0) {
            job.verify = true;
            continue;
        }
        if (std::strcmp(arg, "--list") == 0) {
            list_only = true;
            continue;
        }
        if (std::strcmp(arg, "-q") == 0 || std::strcmp(arg, "--quiet") == 0) {
            job.quiet       = true;
            show_build_info = false;
            continue;
        }
        if (arg[0] == '-' && arg[1] != '\0') {
            std::fprintf(stderr, "unknown option: %s\n", arg);
            return 2;
        }
        paths.emplace_back(arg);
    }

    if (list_only) {
        if (paths.empty()) {
            usage(argv[0]);
            return 2;
        }
        if (show_build_info) {
            print_build_info_header(stdout);
        }
        bool any_failed = false;
        for (size_t i = 0; i < paths.size(); ++i) {
            if (!list_file(paths[i].c_str(), stdout)) {
                any_failed = true;
            }
        }
        return any_failed ? 1 : 0;
    }

    if (paths.size() != 2U) {
        usage(argv[0]);
        return 2;
    }
    job.input  = paths[0];
    job.output = paths[1];
    if (job.verify && is_stdio_path(job.output)) {
        std::fprintf(stderr, "pngrepack: --verify requires an output file\n");
        return 2;
    }

    // Keep stdout clean when it carries the PNG.
    std::FILE* info = is_stdio_path(job.output) ? stderr : stdout;
    if (show_build_info) {
        print_build_info_header(info);
    }
    return run_repack(job, info) ? 0 : 1;
}
