#ifndef PICAMD_TESTS_COMMON_SCRIPTED_TRANSCODER_HPP_
#define PICAMD_TESTS_COMMON_SCRIPTED_TRANSCODER_HPP_

#include "transcode/transcoder.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <utility>

namespace picamd::tests::common {

// Hardware- and ffmpeg-free transcoder.
//
// Success writes `output_bytes` bytes to the output path; a non-zero
// `exit_code` fails without touching the output. `HoldNext()` parks the next
// call until `Unblock()` so tests can observe the converting window.
class ScriptedTranscoder final : public transcode::ITranscoder {
public:
  struct Script {
    int exit_code = 0;
    std::string detail;
    std::size_t output_bytes = 1024;
    // Writes nothing even on success (exit 0 with a missing output).
    bool skip_output = false;
  };

  ScriptedTranscoder() = default;
  explicit ScriptedTranscoder(Script script) : script_(std::move(script)) {}

  transcode::TranscodeResult Transcode(const std::filesystem::path& input,
                                       const std::filesystem::path& output) override {
    Script script;
    {
      std::unique_lock<std::mutex> lock(mu_);
      ++calls_;
      last_input_ = input;
      last_output_ = output;
      in_call_ = true;
      changed_.notify_all();
      changed_.wait(lock, [this]() { return !hold_; });
      in_call_ = false;
      script = script_;
    }

    transcode::TranscodeResult result;
    result.exit_code = script.exit_code;
    result.detail = script.detail;
    result.elapsed = std::chrono::milliseconds(1);
    if (script.exit_code != 0) {
      return result;
    }
    if (!script.skip_output) {
      std::ofstream out(output, std::ios::binary | std::ios::trunc);
      const std::string payload(script.output_bytes, 'm');
      out.write(payload.data(), static_cast<std::streamsize>(payload.size()));
    }
    result.ok = true;
    return result;
  }

  void SetScript(Script script) {
    std::lock_guard<std::mutex> lock(mu_);
    script_ = std::move(script);
  }

  void HoldNext() {
    std::lock_guard<std::mutex> lock(mu_);
    hold_ = true;
  }

  void Unblock() {
    std::lock_guard<std::mutex> lock(mu_);
    hold_ = false;
    changed_.notify_all();
  }

  // Waits until a held call is parked inside Transcode.
  bool WaitUntilInCall(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mu_);
    return changed_.wait_for(lock, timeout, [this]() { return in_call_; });
  }

  int calls() const {
    std::lock_guard<std::mutex> lock(mu_);
    return calls_;
  }

  std::filesystem::path last_input() const {
    std::lock_guard<std::mutex> lock(mu_);
    return last_input_;
  }

private:
  mutable std::mutex mu_;
  std::condition_variable changed_;
  Script script_;
  bool hold_ = false;
  bool in_call_ = false;
  int calls_ = 0;
  std::filesystem::path last_input_;
  std::filesystem::path last_output_;
};

} // namespace picamd::tests::common

#endif // PICAMD_TESTS_COMMON_SCRIPTED_TRANSCODER_HPP_
