#include "pngrepack/build_info.h"

#include "pngrepack/build_info_generated.h"

#include <string>

#include <zlib.h>

namespace pngrepack {
namespace {

    static constexpr bool linkage_static() noexcept
    {
#if defined(PNGREPACK_BUILD_LINKAGE_STATIC) && PNGREPACK_BUILD_LINKAGE_STATIC
        return true;
#else
        return false;
#endif
    }

    static constexpr bool linkage_shared() noexcept
    {
#if defined(PNGREPACK_BUILD_LINKAGE_SHARED) && PNGREPACK_BUILD_LINKAGE_SHARED
        return true;
#else
        return false;
#endif
    }

    static constexpr BuildInfo kBuildInfo = {
        /*version=*/PNGREPACK_BUILDINFO_VERSION,
        /*build_timestamp_utc=*/PNGREPACK_BUILDINFO_BUILD_TIMESTAMP_UTC,
        /*build_type=*/PNGREPACK_BUILDINFO_BUILD_TYPE,
        /*system_name=*/PNGREPACK_BUILDINFO_SYSTEM_NAME,
        /*system_processor=*/PNGREPACK_BUILDINFO_SYSTEM_PROCESSOR,
        /*cxx_compiler_id=*/PNGREPACK_BUILDINFO_CXX_COMPILER_ID,
        /*cxx_compiler_version=*/PNGREPACK_BUILDINFO_CXX_COMPILER_VERSION,
        /*zlib_compile_version=*/ZLIB_VERSION,
        /*linkage_static=*/linkage_static(),
        /*linkage_shared=*/linkage_shared(),
    };

}  // namespace

const BuildInfo&
build_info() noexcept
{
    return kBuildInfo;
}


std::string_view
zlib_runtime_version() noexcept
{
    const char* v = zlibVersion();
    return v ? std::string_view(v) : std::string_view();
}

namespace {

    static const char* linkage_string(const BuildInfo& bi) noexcept
    {
        if (bi.linkage_static) {
            return "static";
        }
        if (bi.linkage_shared) {
            return "shared";
        }
        return "unknown";
    }

    static void append_sv(std::string* out, std::string_view s) noexcept
    {
        if (!out) {
            return;
        }
        out->append(s.data(), s.size());
    }

}  // namespace

void
format_build_info_lines(const BuildInfo& bi, std::string* line1,
                        std::string* line2) noexcept
{
    if (line1) {
        line1->clear();
        line1->reserve(128);
        line1->append("PngRepack v");
        append_sv(line1, bi.version);
        line1->append(" ");
        append_sv(line1, bi.build_type);
        line1->append(" [zlib ");
        append_sv(line1, bi.zlib_compile_version);
        const std::string_view runtime = zlib_runtime_version();
        if (!runtime.empty() && runtime != bi.zlib_compile_version) {
            line1->append(", runtime ");
            append_sv(line1, runtime);
        }
        line1->append("] ");
        line1->append(linkage_string(bi));
    }

    if (line2) {
        line2->clear();
        line2->reserve(160);
        line2->append("built with ");
        append_sv(line2, bi.cxx_compiler_id);
        line2->append("-");
        append_sv(line2, bi.cxx_compiler_version);
        line2->append(" for ");
        append_sv(line2, bi.system_name);
        line2->append("/");
        append_sv(line2, bi.system_processor);

        if (!bi.build_timestamp_utc.empty()) {
            line2->append(" (");
            append_sv(line2, bi.build_timestamp_utc);
            line2->append(")");
        }
    }
}


void
format_build_info_lines(std::string* line1, std::string* line2) noexcept
{
    format_build_info_lines(build_info(), line1, line2);
}

}  // namespace pngrepack
