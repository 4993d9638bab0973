// kleis/driver/stdlib_finder.hpp - Standard library auto-detection
//
// Locates the bundled structure definitions (std/*.kleis).
// Used by the TypeChecker facade and the kleisc CLI.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string_view>
#include <vector>

namespace kleis
{

/// Standard library files, in load order
[[nodiscard]] const std::vector<std::string_view> & stdlib_files();

/**
 * Try to find the standard library in standard locations.
 *
 * Search order:
 * 1. Installed path (from cmake install, KLEIS_STDLIB_INSTALL_PATH)
 * 2. Relative to executable: <prefix>/share/kleis/std/
 * 3. Development layout: <build>/../std/
 * 4. Source tree (KLEIS_STDLIB_SOURCE_DIR)
 *
 * @return Path to stdlib directory, or nullopt if not found
 */
[[nodiscard]] std::optional<std::filesystem::path> find_stdlib();

}  // namespace kleis
