#include "core/fs_utils.hpp"

#include "../common/temp_dir.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstddef>
#include <filesystem>
#include <string>

namespace fs = std::filesystem;

namespace {

std::size_t CountTempSiblings(const fs::path& dir) {
  std::size_t count = 0;
  for (const auto& entry : fs::directory_iterator(dir)) {
    if (entry.path().filename().string().find(".tmp.") != std::string::npos) {
      ++count;
    }
  }
  return count;
}

} // namespace

TEST_CASE("Atomic text write publishes content and creates parents", "[core][fs]") {
  const fs::path root = fourree::tests::common::CreateUniqueTempDir("fourree-fs-ok");
  const fs::path target = root / "nested" / "summary.json";

  std::string error;
  REQUIRE(fourree::core::WriteTextFileAtomic(target, "{}\n", error));

  std::string contents;
  REQUIRE(fourree::core::ReadTextFile(target, contents, error));
  REQUIRE(contents == "{}\n");
  REQUIRE(CountTempSiblings(target.parent_path()) == 0U);

  // Overwrites replace the previous file.
  REQUIRE(fourree::core::WriteTextFileAtomic(target, "[]\n", error));
  REQUIRE(fourree::core::ReadTextFile(target, contents, error));
  REQUIRE(contents == "[]\n");

  fourree::tests::common::RemovePathBestEffort(root);
}

TEST_CASE("Failed atomic write leaves no temp file behind", "[core][fs]") {
  const fs::path root = fourree::tests::common::CreateUniqueTempDir("fourree-fs-fail");

  // A non-empty directory in the way cannot be replaced by the temp file.
  const fs::path target = root / "occupied";
  fs::create_directories(target / "child");

  std::string error;
  REQUIRE_FALSE(fourree::core::WriteTextFileAtomic(target, "data", error));
  REQUIRE(error.find("failed to publish output file") != std::string::npos);
  REQUIRE(fs::is_directory(target));
  REQUIRE(CountTempSiblings(root) == 0U);

  fourree::tests::common::RemovePathBestEffort(root);
}

TEST_CASE("Atomic write rejects an empty path", "[core][fs]") {
  std::string error;
  REQUIRE_FALSE(fourree::core::WriteTextFileAtomic(fs::path(), "data", error));
  REQUIRE(error == "output path cannot be empty");
}

TEST_CASE("Reading a missing file reports the path", "[core][fs]") {
  std::string contents;
  std::string error;
  REQUIRE_FALSE(fourree::core::ReadTextFile("/nonexistent/fourree/schema.json", contents, error));
  REQUIRE(error.find("/nonexistent/fourree/schema.json") != std::string::npos);
}
