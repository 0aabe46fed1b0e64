#pragma once

#include <string>
#include <string_view>

/**
 * \file build_info.h
 * \brief Runtime information about how PngRepack was built.
 */

namespace pngrepack {

/**
 * \brief PngRepack build information.
 *
 * Values are compiled into the binary at build time.
 */
struct BuildInfo final {
    /// PngRepack version string (e.g. "0.2.0").
    std::string_view version;

    /// Build timestamp in UTC (ISO-8601), or empty if not recorded.
    std::string_view build_timestamp_utc;

    /// Build type string (e.g. "Release", "Debug", "multi-config").
    std::string_view build_type;

    /// Target platform (e.g. "Linux", "Darwin", "Windows").
    std::string_view system_name;

    /// Target CPU architecture (e.g. "x86_64", "arm64").
    std::string_view system_processor;

    /// Compiler ID (e.g. "Clang", "GNU", "MSVC").
    std::string_view cxx_compiler_id;

    /// Compiler version string.
    std::string_view cxx_compiler_version;

    /// zlib version the library was compiled against.
    std::string_view zlib_compile_version;

    /// True if this binary was built from the static library target.
    bool linkage_static = false;
    /// True if this binary was built from the shared library target.
    bool linkage_shared = false;
};

/// Returns build information for the linked PngRepack library.
const BuildInfo&
build_info() noexcept;

/// zlib version reported by the zlib library loaded at runtime.
std::string_view
zlib_runtime_version() noexcept;

/**
 * \brief Formats a stable, human-readable build info header (2 lines).
 *
 * Output format:
 * - `PngRepack vX.Y.Z <build_type> [zlib <version>] <linkage>`
 * - `built with <compiler> for <system>/<arch> (<timestamp>)`
 */
void
format_build_info_lines(const BuildInfo& info, std::string* line1,
                        std::string* line2) noexcept;

/// Convenience overload for the linked PngRepack library build.
void
format_build_info_lines(std::string* line1, std::string* line2) noexcept;

}  // namespace pngrepack
