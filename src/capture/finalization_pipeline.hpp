#pragma once

#include "capture/device_registry.hpp"
#include "capture/file_stability.hpp"
#include "core/clock.hpp"
#include "core/logging/logger.hpp"
#include "transcode/transcoder.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <thread>

namespace picamd::capture {

enum class JobState {
  kNone = 0,
  kRunning,
  kSucceeded,
  kFailed,
};

const char* ToString(JobState state);

struct FinalizationJob {
  std::uint64_t sequence = 0;
  std::filesystem::path input_path;
  std::filesystem::path output_path;
  core::IClock::WallTimePoint started_at{};
  JobState state = JobState::kNone;
  std::string failure_detail;
  int exit_code = -1;
  std::chrono::milliseconds transcode_elapsed{0};
  std::uintmax_t output_size_bytes = 0;
  // False when the stability wait ran out of checks (advisory).
  bool stable = false;
};

struct FinalizationOptions {
  std::filesystem::path output_path;
  StabilityOptions stability;
};

// Turns a finished raw recording into the downloadable final file.
//
// Runs on its own worker: transcode, then a size-stability wait on the
// output. The pipeline takes over the recording's device token and holds
// the Converting mode for the whole job, so no new capture can start while
// the output is being produced. Every outcome ends with the mode back at
// Idle. Transcode failures are terminal for that recording (no retry) and
// leave the raw input in place.
class FinalizationPipeline {
public:
  FinalizationPipeline(DeviceRegistry& registry, transcode::ITranscoder& transcoder,
                       core::IClock& clock, core::logging::Logger& logger,
                       FinalizationOptions options);
  ~FinalizationPipeline();

  FinalizationPipeline(const FinalizationPipeline&) = delete;
  FinalizationPipeline& operator=(const FinalizationPipeline&) = delete;

  // Takes ownership of `token`. A missing input short-circuits to a failed
  // job and releases the device without invoking the transcoder.
  void Begin(const DeviceToken& token, const std::filesystem::path& input);

  bool running() const;
  FinalizationJob LastJob() const;
  const std::filesystem::path& output_path() const {
    return options_.output_path;
  }

  // Joins the current worker, if any.
  void Wait();

private:
  void Run(DeviceToken token);
  void Finish(const DeviceToken& token, JobState state, std::string failure_detail);

  DeviceRegistry& registry_;
  transcode::ITranscoder& transcoder_;
  core::IClock& clock_;
  core::logging::Logger& logger_;
  FinalizationOptions options_;

  std::mutex lifecycle_mu_;
  std::thread worker_;

  mutable std::mutex mu_;
  FinalizationJob job_;
  std::uint64_t next_sequence_ = 1;
};

} // namespace picamd::capture
