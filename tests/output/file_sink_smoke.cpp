#include "output/file_sink.hpp"

#include "../common/assertions.hpp"
#include "../common/temp_dir.hpp"

#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;
using fourree::tests::common::Fail;
using fourree::tests::common::ReadFileToString;

int main() {
  const fs::path temp_root = fourree::tests::common::CreateUniqueTempDir("fourree-file-sink");
  std::string error;

  // Rows only appear under the final name after Close.
  {
    const fs::path target = temp_root / "nested" / "rows.tsv";
    fourree::output::FileSink sink(target);
    if (!sink.Open(error)) {
      Fail("open failed: " + error);
    }
    if (sink.temp_path().empty() || !fs::exists(sink.temp_path())) {
      Fail("open should create the temp file");
    }
    if (!sink.Write("a\tb\n", error) || !sink.Write("c\td\n", error)) {
      Fail("write failed: " + error);
    }
    if (fs::exists(target)) {
      Fail("target must not exist before Close");
    }

    const fs::path temp_path = sink.temp_path();
    if (!sink.Close(error)) {
      Fail("close failed: " + error);
    }
    if (ReadFileToString(target) != "a\tb\nc\td\n" || sink.bytes_written() != 8U) {
      Fail("published file has unexpected content");
    }
    if (fs::exists(temp_path) || !sink.temp_path().empty()) {
      Fail("temp file must be gone after publish");
    }
    if (sink.Describe() != target.string()) {
      Fail("Describe should name the target path");
    }
  }

  // An abandoned sink leaves the previous file untouched and no temp behind.
  {
    const fs::path target = temp_root / "keep.tsv";
    {
      fourree::output::FileSink first(target);
      if (!first.Open(error) || !first.Write("old\n", error) || !first.Close(error)) {
        Fail("seeding the existing file failed: " + error);
      }
    }

    fs::path temp_path;
    {
      fourree::output::FileSink abandoned(target);
      if (!abandoned.Open(error) || !abandoned.Write("partial", error)) {
        Fail("open/write failed: " + error);
      }
      temp_path = abandoned.temp_path();
    }
    if (fs::exists(temp_path)) {
      Fail("destructor must remove the temp file");
    }
    if (ReadFileToString(target) != "old\n") {
      Fail("a failed run must not replace the published file");
    }

    fourree::output::FileSink overwrite(target);
    if (!overwrite.Open(error) || !overwrite.Write("new\n", error) || !overwrite.Close(error)) {
      Fail("overwrite failed: " + error);
    }
    if (ReadFileToString(target) != "new\n") {
      Fail("a completed run should replace the published file");
    }
  }

  // Lifecycle misuse is reported, not ignored.
  {
    fourree::output::FileSink sink(temp_root / "misuse.tsv");
    if (sink.Write("x", error)) {
      Fail("write before open must fail");
    }
    if (sink.Close(error)) {
      Fail("close before open must fail");
    }

    fourree::output::FileSink directory_target(temp_root);
    if (directory_target.Open(error)) {
      Fail("opening a directory as output must fail");
    }
    fourree::tests::common::AssertContains(error, "is a directory");
  }

  fourree::tests::common::RemovePathBestEffort(temp_root);
  std::cout << "file_sink_smoke: ok\n";
  return 0;
}
