// kleis/driver/stdlib_finder.cpp - Standard library auto-detection
//
#include "kleis/driver/stdlib_finder.hpp"

namespace fs = std::filesystem;

namespace kleis
{

namespace
{

// A directory counts as the stdlib only if it holds the prelude.
bool is_stdlib_dir(const fs::path & dir)
{
  std::error_code ec;
  return fs::is_regular_file(dir / "prelude.kleis", ec);
}

}  // namespace

const std::vector<std::string_view> & stdlib_files()
{
  // Later files refer to structures of earlier ones.
  static const std::vector<std::string_view> files = {
    "prelude.kleis",
    "spaces.kleis",
    "matrices.kleis",
    "tensors.kleis",
  };
  return files;
}

std::optional<fs::path> find_stdlib()
{
  // 1. Check installed path (from cmake install)
#ifdef KLEIS_STDLIB_INSTALL_PATH
  {
    fs::path installed = KLEIS_STDLIB_INSTALL_PATH;
    if (is_stdlib_dir(installed)) {
      return installed;
    }
  }
#endif

  // 2. Check relative to executable location
  // Typical layout:
  //   Installed: <prefix>/bin/kleisc, <prefix>/share/kleis/std/
  //   Development: <build>/kleisc, <project>/std/
  {
    std::error_code ec;
    auto exe_path = fs::read_symlink("/proc/self/exe", ec);
    if (!ec) {
      auto bin_dir = exe_path.parent_path();

      // Check relative to bin: ../share/kleis/std/
      auto share_stdlib = bin_dir / ".." / "share" / "kleis" / "std";
      if (is_stdlib_dir(share_stdlib)) {
        return fs::canonical(share_stdlib, ec);
      }

      // Check for development: ../std/ (build/kleisc -> <project>/std/)
      auto dev_stdlib = bin_dir / ".." / "std";
      if (is_stdlib_dir(dev_stdlib)) {
        return fs::canonical(dev_stdlib, ec);
      }
    }
  }

  // 3. Source tree (tests run from the build directory)
#ifdef KLEIS_STDLIB_SOURCE_DIR
  {
    fs::path source = KLEIS_STDLIB_SOURCE_DIR;
    if (is_stdlib_dir(source)) {
      return source;
    }
  }
#endif

  return std::nullopt;
}

}  // namespace kleis
