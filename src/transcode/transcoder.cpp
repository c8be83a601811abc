#include "transcode/transcoder.hpp"

#include <cstdio>
#include <utility>

#if !defined(_WIN32)
#include <sys/wait.h>
#endif

namespace picamd::transcode {

namespace {

constexpr std::size_t kMaxDetailBytes = 4096;

} // namespace

bool RunShellCommand(const std::string& command, std::string& output, int& exit_code,
                     std::string& error) {
  output.clear();
  exit_code = -1;
  error.clear();

  // Grouped so stderr of every command in a compound line is captured.
  const std::string wrapped = "{ " + command + "; } 2>&1";
  FILE* pipe = popen(wrapped.c_str(), "r");
  if (pipe == nullptr) {
    error = "failed to execute command: " + command;
    return false;
  }

  char buffer[4096];
  while (std::fgets(buffer, static_cast<int>(sizeof(buffer)), pipe) != nullptr) {
    if (output.size() < kMaxDetailBytes) {
      output.append(buffer);
    }
  }

  const int raw_status = pclose(pipe);
  if (raw_status == -1) {
    exit_code = -1;
  } else if (WIFEXITED(raw_status)) {
    exit_code = WEXITSTATUS(raw_status);
  } else {
    exit_code = raw_status;
  }
  return true;
}

std::string ShellQuote(const std::string& text) {
  std::string quoted = "'";
  for (const char ch : text) {
    if (ch == '\'') {
      quoted += "'\\''";
    } else {
      quoted.push_back(ch);
    }
  }
  quoted.push_back('\'');
  return quoted;
}

FfmpegTranscoder::FfmpegTranscoder(std::string binary) : binary_(std::move(binary)) {}

std::string FfmpegTranscoder::BuildCommand(const std::filesystem::path& input,
                                           const std::filesystem::path& output) const {
  return ShellQuote(binary_) + " -hide_banner -loglevel error -y -i " +
         ShellQuote(input.string()) + " -c:v copy " + ShellQuote(output.string());
}

TranscodeResult FfmpegTranscoder::Transcode(const std::filesystem::path& input,
                                            const std::filesystem::path& output) {
  TranscodeResult result;
  const auto started = std::chrono::steady_clock::now();

  std::string launch_error;
  if (!RunShellCommand(BuildCommand(input, output), result.detail, result.exit_code,
                       launch_error)) {
    result.detail = launch_error;
  }
  result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  // 127: the shell could not find the binary.
  if (result.exit_code == 127 && result.detail.empty()) {
    result.detail = "transcoder binary not found: " + binary_;
  }
  result.ok = result.exit_code == 0;
  return result;
}

} // namespace picamd::transcode
