#include "capture/file_stability.hpp"

#include "../common/manual_clock.hpp"
#include "../common/temp_dir.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

namespace {

// Replays `sizes`; a negative entry is an unreadable sample. The last entry
// repeats once the script runs out.
picamd::capture::FileSizeProbe ScriptedProbe(std::vector<long long> sizes, int& calls) {
  return [sizes, &calls](std::uintmax_t& size, std::string& error) {
    const std::size_t index =
        std::min(static_cast<std::size_t>(calls), sizes.size() - 1U);
    ++calls;
    if (sizes[index] < 0) {
      error = "no such file";
      return false;
    }
    size = static_cast<std::uintmax_t>(sizes[index]);
    return true;
  };
}

} // namespace

TEST_CASE("A settled file is stable after three equal samples", "[capture][stability]") {
  picamd::tests::common::ManualClock clock;
  int calls = 0;
  const auto result =
      picamd::capture::WaitForStableSize(ScriptedProbe({4096}, calls), clock);

  REQUIRE(result.stable);
  REQUIRE(result.checks == 3);
  REQUIRE(result.size_bytes == 4096U);
  // Sleeps only between samples, never after the deciding one.
  REQUIRE(clock.Sleeps() == std::vector<std::chrono::milliseconds>(
                                2, std::chrono::milliseconds(500)));
}

TEST_CASE("A growing file restarts the equal-sample count", "[capture][stability]") {
  picamd::tests::common::ManualClock clock;
  int calls = 0;
  const auto result = picamd::capture::WaitForStableSize(
      ScriptedProbe({100, 200, 200, 300, 300, 300}, calls), clock);

  REQUIRE(result.stable);
  REQUIRE(result.checks == 6);
  REQUIRE(result.size_bytes == 300U);
}

TEST_CASE("Unreadable samples count as a change", "[capture][stability]") {
  picamd::tests::common::ManualClock clock;
  int calls = 0;
  const auto result = picamd::capture::WaitForStableSize(
      ScriptedProbe({50, 50, -1, 50, 50, 50}, calls), clock);

  REQUIRE(result.stable);
  REQUIRE(result.checks == 6);
}

TEST_CASE("Exhausting the checks reports the last size without failing",
          "[capture][stability]") {
  picamd::tests::common::ManualClock clock;
  int calls = 0;
  std::vector<long long> growing;
  for (int i = 1; i <= 30; ++i) {
    growing.push_back(i * 10);
  }
  const auto result = picamd::capture::WaitForStableSize(ScriptedProbe(growing, calls), clock,
                                                         picamd::capture::StabilityOptions{});

  REQUIRE_FALSE(result.stable);
  REQUIRE(result.checks == 20);
  REQUIRE(result.size_bytes == 200U);
  REQUIRE(calls == 20);
}

TEST_CASE("The file probe reads sizes from disk", "[capture][stability]") {
  const picamd::tests::common::ScopedTempDir temp("picamd-stability-test");
  const auto path = temp.path() / "camera_video.mp4";
  const auto probe = picamd::capture::MakeFileSizeProbe(path);

  std::uintmax_t size = 0;
  std::string error;
  REQUIRE_FALSE(probe(size, error));

  {
    std::ofstream out(path, std::ios::binary);
    out << std::string(1234, 'x');
  }
  REQUIRE(probe(size, error));
  REQUIRE(size == 1234U);
}
