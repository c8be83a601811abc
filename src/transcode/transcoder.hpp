#pragma once

#include <chrono>
#include <filesystem>
#include <string>

namespace picamd::transcode {

struct TranscodeResult {
  bool ok = false;
  // Process exit status; -1 when the process could not be launched.
  int exit_code = -1;
  // Captured stdout/stderr of the external tool, or the launch failure text.
  std::string detail;
  std::chrono::milliseconds elapsed{0};
};

// Converts a raw elementary stream into the final container.
//
// Implementations block until the conversion finishes. The output may still
// be settling on disk when this returns; callers run a stability wait.
class ITranscoder {
public:
  virtual ~ITranscoder() = default;
  virtual TranscodeResult Transcode(const std::filesystem::path& input,
                                    const std::filesystem::path& output) = 0;
};

// Stream-copy remux through the ffmpeg command-line tool:
//   <binary> -hide_banner -loglevel error -y -i <input> -c:v copy <output>
class FfmpegTranscoder final : public ITranscoder {
public:
  explicit FfmpegTranscoder(std::string binary = "ffmpeg");

  TranscodeResult Transcode(const std::filesystem::path& input,
                            const std::filesystem::path& output) override;

  std::string BuildCommand(const std::filesystem::path& input,
                           const std::filesystem::path& output) const;

private:
  std::string binary_;
};

// Runs `command` through the shell, capturing combined stdout/stderr.
// Returns false only when the process could not be launched.
bool RunShellCommand(const std::string& command, std::string& output, int& exit_code,
                     std::string& error);

// Wraps `text` in single quotes for a POSIX shell.
std::string ShellQuote(const std::string& text);

} // namespace picamd::transcode
