#include "capture/finalization_pipeline.hpp"

#include "core/fs_utils.hpp"
#include "core/time_utils.hpp"

#include <utility>

namespace picamd::capture {

const char* ToString(const JobState state) {
  switch (state) {
  case JobState::kNone:
    return "none";
  case JobState::kRunning:
    return "running";
  case JobState::kSucceeded:
    return "succeeded";
  case JobState::kFailed:
    return "failed";
  }
  return "unknown";
}

FinalizationPipeline::FinalizationPipeline(DeviceRegistry& registry,
                                           transcode::ITranscoder& transcoder,
                                           core::IClock& clock, core::logging::Logger& logger,
                                           FinalizationOptions options)
    : registry_(registry), transcoder_(transcoder), clock_(clock), logger_(logger),
      options_(std::move(options)) {}

FinalizationPipeline::~FinalizationPipeline() {
  Wait();
}

void FinalizationPipeline::Begin(const DeviceToken& token, const std::filesystem::path& input) {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mu_);
  if (worker_.joinable()) {
    worker_.join();
  }

  std::lock_guard<std::mutex> lock(mu_);
  job_ = FinalizationJob{};
  job_.sequence = next_sequence_++;
  job_.input_path = input;
  job_.output_path = options_.output_path;
  job_.started_at = clock_.WallNow();

  // A stale final file must not be served as the result of this recording.
  std::string remove_error;
  if (!core::RemoveFileIfExists(options_.output_path, remove_error)) {
    logger_.Warn("failed to remove previous final output", {{"error", remove_error}});
  }

  std::uintmax_t raw_size = 0;
  std::string size_error;
  if (!core::RegularFileExists(input) || !core::ReadFileSize(input, raw_size, size_error)) {
    job_.state = JobState::kFailed;
    job_.failure_detail = "raw recording not found: " + input.string();
    logger_.Error("raw recording missing; skipping transcode", {{"path", input.string()}});
    registry_.Release(token);
    return;
  }
  const std::string raw_size_text = std::to_string(raw_size);
  logger_.Info("raw recording size",
               {{"path", input.string()},
                {"bytes", raw_size_text},
                {"mib", core::FormatFixed(static_cast<double>(raw_size) / 1048576.0, 2)}});

  DeviceToken converting;
  if (!registry_.HandOff(token, CaptureMode::kConverting, converting)) {
    job_.state = JobState::kFailed;
    job_.failure_detail = "recording token was no longer current";
    logger_.Error("finalization could not take over the device token");
    return;
  }

  job_.state = JobState::kRunning;
  worker_ = std::thread([this, converting]() { Run(converting); });
}

void FinalizationPipeline::Run(const DeviceToken token) {
  std::filesystem::path input;
  {
    std::lock_guard<std::mutex> lock(mu_);
    input = job_.input_path;
  }

  logger_.Info("transcode started",
               {{"input", input.string()}, {"output", options_.output_path.string()}});
  const transcode::TranscodeResult result = transcoder_.Transcode(input, options_.output_path);
  const std::string exit_text = std::to_string(result.exit_code);
  const std::string elapsed_text =
      core::FormatFixed(static_cast<double>(result.elapsed.count()) / 1000.0, 2);
  {
    std::lock_guard<std::mutex> lock(mu_);
    job_.exit_code = result.exit_code;
    job_.transcode_elapsed = result.elapsed;
  }

  if (!result.ok) {
    logger_.Error("transcode failed; raw recording preserved",
                  {{"exit_code", exit_text},
                   {"elapsed_s", elapsed_text},
                   {"detail", result.detail},
                   {"raw", input.string()}});
    Finish(token, JobState::kFailed,
           "transcoder exited with code " + exit_text +
               (result.detail.empty() ? std::string() : ": " + result.detail));
    return;
  }
  logger_.Info("transcode finished", {{"elapsed_s", elapsed_text}});

  if (!core::RegularFileExists(options_.output_path)) {
    logger_.Error("final output missing after transcode",
                  {{"path", options_.output_path.string()}});
    Finish(token, JobState::kFailed, "final output missing after transcode");
    return;
  }

  logger_.Info("waiting for final output to settle");
  const StabilityResult stability = WaitForStableSize(MakeFileSizeProbe(options_.output_path),
                                                      clock_, options_.stability);
  const std::string size_text = std::to_string(stability.size_bytes);
  const std::string checks_text = std::to_string(stability.checks);
  if (stability.stable) {
    logger_.Info("final output size stable", {{"bytes", size_text}, {"checks", checks_text}});
  } else {
    logger_.Warn("final output stability timeout; proceeding",
                 {{"bytes", size_text}, {"checks", checks_text}});
  }
  {
    std::lock_guard<std::mutex> lock(mu_);
    job_.output_size_bytes = stability.size_bytes;
    job_.stable = stability.stable;
  }
  Finish(token, JobState::kSucceeded, "");
  logger_.Info("final output ready for download", {{"path", options_.output_path.string()}});
}

void FinalizationPipeline::Finish(const DeviceToken& token, const JobState state,
                                  std::string failure_detail) {
  // Job state and mode change together so readers never see a finished job
  // while the camera is still reserved (or the reverse).
  std::lock_guard<std::mutex> lock(mu_);
  job_.state = state;
  job_.failure_detail = std::move(failure_detail);
  registry_.Release(token);
}

bool FinalizationPipeline::running() const {
  std::lock_guard<std::mutex> lock(mu_);
  return job_.state == JobState::kRunning;
}

FinalizationJob FinalizationPipeline::LastJob() const {
  std::lock_guard<std::mutex> lock(mu_);
  return job_;
}

void FinalizationPipeline::Wait() {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mu_);
  if (worker_.joinable()) {
    worker_.join();
  }
}

} // namespace picamd::capture
