#include "../common/assertions.hpp"
#include "../common/cli_dispatch.hpp"
#include "../common/temp_dir.hpp"

#include <filesystem>
#include <iostream>
#include <string>

namespace {

using picamd::tests::common::AssertContains;
using picamd::tests::common::DispatchCaptured;
using picamd::tests::common::Fail;

void VersionListsBackends() {
  const auto result = DispatchCaptured({"picamd", "version"});
  if (result.exit_code != 0) {
    Fail("version returned non-zero exit code");
  }
  AssertContains(result.out, "picamd 0.1.0");
  AssertContains(result.out, "backend sim: available");
  AssertContains(result.out, "backend webcam: ");
  AssertContains(result.out, "opencv: ");
}

void UsageErrors() {
  auto result = DispatchCaptured({"picamd"});
  if (result.exit_code != 2) {
    Fail("missing subcommand should exit 2");
  }
  AssertContains(result.err, "usage:");

  result = DispatchCaptured({"picamd", "record"});
  if (result.exit_code != 2) {
    Fail("unknown subcommand should exit 2");
  }
  AssertContains(result.err, "error: unknown subcommand: record");

  result = DispatchCaptured({"picamd", "serve", "--port", "70000"});
  if (result.exit_code != 2) {
    Fail("out of range port should exit 2");
  }
  AssertContains(result.err, "invalid value for --port: 70000");

  result = DispatchCaptured({"picamd", "still"});
  if (result.exit_code != 2) {
    Fail("still without output should exit 2");
  }
  AssertContains(result.err, "still requires exactly 1 argument: <out.jpg>");
}

void StillWithSimBackend(const std::filesystem::path& root) {
  const std::filesystem::path output = root / "probe.jpg";
  const auto result = DispatchCaptured({"picamd", "still", output.string(), "--backend", "sim",
                                        "--video-dir", (root / "video").string(), "--log-level",
                                        "error"});
  if (result.exit_code != 0) {
    Fail("still with the sim backend failed: " + result.err);
  }
  AssertContains(result.out, "still: " + output.string());
  if (!std::filesystem::exists(output) || std::filesystem::file_size(output) == 0U) {
    Fail("still did not write a JPEG");
  }
}

} // namespace

int main() {
  const picamd::tests::common::ScopedTempDir temp("picamd-cli-smoke");
  VersionListsBackends();
  UsageErrors();
  StillWithSimBackend(temp.path());
  std::cout << "cli_dispatch_smoke: ok\n";
  return 0;
}
