#include "tw/storage/io_util.h"

#include <array>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include <sys/stat.h>

#include "test_util.h"

namespace {

  using tw::test::Expect;
  using tw::test::Fail;
  using tw::test::TempDir;

  std::vector<uint8_t> ReadFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  }

  size_t CountEntries(const std::filesystem::path& dir) {
    size_t count = 0;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
      (void)entry;
      ++count;
    }
    return count;
  }

  void TestCrashBeforeRenameKeepsOldContent() {
    TempDir dir("tw_io_");
    const auto target = dir.path() / "state.json";
    {
      std::ofstream seed(target, std::ios::binary | std::ios::trunc);
      const std::array<uint8_t, 4> baseline{0xDE, 0xAD, 0xBE, 0xEF};
      seed.write(reinterpret_cast<const char*>(baseline.data()), static_cast<std::streamsize>(baseline.size()));
    }

    tw::storage::AtomicReplaceHooks hooks;
    hooks.before_rename = [](const std::filesystem::path& temp, const std::filesystem::path&) {
      Expect(std::filesystem::exists(temp), "The staged file must exist before the rename");
      throw std::runtime_error("simulated crash");
    };

    const std::array<uint8_t, 4> update{0xBA, 0xAD, 0xF0, 0x0D};
    bool threw = false;
    try {
      tw::storage::AtomicReplace(target, std::span<const uint8_t>(update.data(), update.size()), 0640, hooks);
    } catch (const tw::Error& err) {
      threw = std::string(err.what()).find("simulated crash") != std::string::npos;
      Expect(!err.context.empty(), "Failures carry their context");
    }
    Expect(threw, "Expected simulated crash before rename");

    auto bytes = ReadFile(target);
    Expect(bytes == std::vector<uint8_t>{0xDE, 0xAD, 0xBE, 0xEF}, "A failed replace leaves the old content");
    Expect(CountEntries(dir.path()) == 1, "A failed replace leaves no staging file behind");

    tw::storage::AtomicReplace(target, std::span<const uint8_t>(update.data(), update.size()), 0640);
    bytes = ReadFile(target);
    Expect(bytes == std::vector<uint8_t>(update.begin(), update.end()), "A replace installs the new content");
  }

  void TestPermissionsApplied() {
    TempDir dir("tw_io_");
    const auto target = dir.path() / "log.json";
    const std::string text = "{}\n";
    const auto* bytes = reinterpret_cast<const uint8_t*>(text.data());
    for (mode_t mode : {mode_t{0600}, mode_t{0644}}) {
      tw::storage::AtomicReplace(target, std::span<const uint8_t>(bytes, text.size()), mode);
      struct stat st {};
      Expect(::stat(target.c_str(), &st) == 0, "stat failed");
      Expect((st.st_mode & 0777) == mode, "Replaced files get the requested mode");
    }
  }

  void TestMissingDirectoryFails() {
    TempDir dir("tw_io_");
    const auto target = dir.path() / "absent" / "state.json";
    const std::array<uint8_t, 1> payload{0x01};
    try {
      tw::storage::AtomicReplace(target, std::span<const uint8_t>(payload.data(), payload.size()), 0640);
    } catch (const tw::Error& err) {
      Expect(err.domain == tw::ErrorDomain::IO, "A missing directory is an I/O error");
      return;
    }
    Fail("Replacing into a missing directory must fail");
  }

  void TestReadWholeFile() {
    TempDir dir("tw_io_");
    Expect(!tw::storage::ReadWholeFile(dir.path() / "nope").has_value(), "Missing files read as nullopt");
    const auto path = dir.path() / "big";
    const std::string content(20000, 'q');
    std::ofstream(path, std::ios::binary) << content;
    auto read = tw::storage::ReadWholeFile(path);
    Expect(read && *read == content, "Files larger than one buffer read whole");
    try {
      tw::storage::ReadWholeFile(dir.path());
      Fail("Reading a directory must fail");
    } catch (const tw::Error& err) {
      Expect(err.domain == tw::ErrorDomain::IO, "Read failures are I/O errors");
    }
  }

  void TestEnsureDirectory() {
    TempDir dir("tw_io_");
    const auto nested = dir.path() / "a" / "b" / "c";
    tw::storage::EnsureDirectory(nested, 0750);
    Expect(std::filesystem::is_directory(nested), "Nested directories are created");
    struct stat st {};
    Expect(::stat(nested.c_str(), &st) == 0, "stat failed");
    Expect((st.st_mode & 0777 & ~mode_t{0750}) == 0, "Created directories are no wider than requested");
    tw::storage::EnsureDirectory(nested, 0750);

    const auto file = dir.path() / "plain";
    std::ofstream(file) << "x";
    try {
      tw::storage::EnsureDirectory(file / "sub", 0750);
      Fail("A file in the path must fail");
    } catch (const tw::Error& err) {
      Expect(err.domain == tw::ErrorDomain::IO, "Directory failures are I/O errors");
    }
  }

} // namespace

int main() {
  TestCrashBeforeRenameKeepsOldContent();
  TestPermissionsApplied();
  TestMissingDirectoryFails();
  TestReadWholeFile();
  TestEnsureDirectory();
  std::cout << "io util tests ok\n";
  return 0;
}
