#include "pngrepack/build_info.h"

#include <gtest/gtest.h>

#include <string>

#include <zlib.h>

namespace pngrepack {
namespace {

    TEST(BuildInfo, LinkedLibraryHeaderNamesProjectAndZlib)
    {
        std::string line1;
        std::string line2;
        format_build_info_lines(&line1, &line2);

        EXPECT_EQ(line1.rfind("PngRepack v", 0), 0U);
        EXPECT_NE(line1.find(std::string("[zlib ") + ZLIB_VERSION),
                  std::string::npos);
        EXPECT_EQ(line2.rfind("built with ", 0), 0U);

        const BuildInfo& bi = build_info();
        EXPECT_FALSE(bi.version.empty());
        EXPECT_EQ(bi.zlib_compile_version, std::string_view(ZLIB_VERSION));
        EXPECT_NE(bi.linkage_static, bi.linkage_shared);
        EXPECT_FALSE(zlib_runtime_version().empty());
    }


    TEST(BuildInfo, FormatsGivenFields)
    {
        BuildInfo bi;
        bi.version              = "1.2.3";
        bi.build_type           = "Debug";
        bi.system_name          = "Linux";
        bi.system_processor     = "x86_64";
        bi.cxx_compiler_id      = "GNU";
        bi.cxx_compiler_version = "13.2.0";
        bi.zlib_compile_version = zlib_runtime_version();
        bi.linkage_static       = true;

        std::string line1;
        std::string line2 = "stale";
        format_build_info_lines(bi, &line1, &line2);
        EXPECT_EQ(line1, std::string("PngRepack v1.2.3 Debug [zlib ")
                             + std::string(zlib_runtime_version())
                             + "] static");
        EXPECT_EQ(line2, "built with GNU-13.2.0 for Linux/x86_64");

        bi.build_timestamp_utc = "2026-01-02T03:04:05Z";
        bi.linkage_static      = false;
        format_build_info_lines(bi, &line1, nullptr);
        EXPECT_EQ(line1.substr(line1.size() - 8), " unknown");
        format_build_info_lines(bi, nullptr, &line2);
        EXPECT_EQ(line2, "built with GNU-13.2.0 for Linux/x86_64 "
                         "(2026-01-02T03:04:05Z)");
    }

}  // namespace
}  // namespace pngrepack
