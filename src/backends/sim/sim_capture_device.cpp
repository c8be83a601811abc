#include "backends/sim/sim_capture_device.hpp"

#include <algorithm>
#include <charconv>
#include <chrono>
#include <iterator>
#include <system_error>

namespace picamd::backends::sim {

namespace {

constexpr std::uint32_t kDefaultFrameSizeBytes = 2048;
constexpr std::uint32_t kDefaultRawBytesPerFrame = 4096;

bool ParseUInt32(const std::string& text, std::uint32_t& value) {
  if (text.empty()) {
    return false;
  }

  std::uint32_t parsed = 0;
  const char* begin = text.data();
  const char* end = begin + text.size();
  const auto [ptr, ec] = std::from_chars(begin, end, parsed);
  if (ec != std::errc() || ptr != end) {
    return false;
  }

  value = parsed;
  return true;
}

bool IsNumericParam(const std::string& key) {
  return key == "capture_fail_every_n" || key == "frame_size_bytes" ||
         key == "raw_bytes_per_frame";
}

// Annex-B access unit: start code, NAL header, then a filler payload.
void AppendAccessUnit(std::vector<char>& out, std::uint8_t nal_header, std::uint32_t size,
                      std::uint64_t seq) {
  static constexpr char kStartCode[] = {0x00, 0x00, 0x00, 0x01};
  out.insert(out.end(), std::begin(kStartCode), std::end(kStartCode));
  out.push_back(static_cast<char>(nal_header));
  for (std::uint32_t i = 0; i < size; ++i) {
    out.push_back(static_cast<char>((seq + i) % 0xFDU + 1U));
  }
}

} // namespace

SimCaptureDevice::SimCaptureDevice(core::IClock& clock) : clock_(clock) {
  params_ = {
      {"backend", "sim"},
      {"frame_size_bytes", std::to_string(kDefaultFrameSizeBytes)},
      {"raw_bytes_per_frame", std::to_string(kDefaultRawBytesPerFrame)},
      {"capture_fail_every_n", "0"},
      {"pace_frames", "true"},
  };
}

SimCaptureDevice::~SimCaptureDevice() {
  std::lock_guard<std::mutex> lock(mu_);
  if (raw_file_.is_open()) {
    raw_file_.close();
  }
}

bool SimCaptureDevice::Open(std::string& error) {
  std::lock_guard<std::mutex> lock(mu_);
  ++counters_.open_calls;
  if (open_) {
    error = "sim device already open: device or resource busy";
    return false;
  }

  const std::string injected = ParamOrEmpty("open_error");
  if (!injected.empty()) {
    error = injected;
    return false;
  }

  open_ = true;
  ++counters_.successful_opens;
  return true;
}

bool SimCaptureDevice::Configure(const CaptureFormat& format, std::string& error) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!open_) {
    error = "sim device must be open before configure";
    return false;
  }
  if (running_) {
    error = "sim device cannot be reconfigured while running";
    return false;
  }
  if (format.width == 0U || format.height == 0U || format.fps == 0U) {
    error = "sim device rejects zero width, height or fps";
    return false;
  }

  format_ = format;
  return true;
}

bool SimCaptureDevice::Start(std::string& error) {
  std::lock_guard<std::mutex> lock(mu_);
  ++counters_.start_calls;
  if (!open_) {
    error = "sim device must be open before start";
    return false;
  }
  if (running_) {
    error = "sim device is already running";
    return false;
  }

  const std::string injected = ParamOrEmpty("start_error");
  if (!injected.empty()) {
    error = injected;
    return false;
  }

  running_ = true;
  return true;
}

bool SimCaptureDevice::StartRecording(const std::filesystem::path& raw_path,
                                      std::string& error) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!running_) {
    error = "sim device must be running before start_recording";
    return false;
  }
  if (recording_) {
    error = "sim device is already recording";
    return false;
  }

  raw_file_.open(raw_path, std::ios::binary | std::ios::trunc);
  if (!raw_file_) {
    error = "failed to open raw output '" + raw_path.string() + "'";
    return false;
  }

  // SPS + PPS stand-ins so the file starts the way an encoder stream does.
  std::vector<char> header;
  AppendAccessUnit(header, 0x67U, 16U, 0U);
  AppendAccessUnit(header, 0x68U, 4U, 0U);
  raw_file_.write(header.data(), static_cast<std::streamsize>(header.size()));
  raw_file_.flush();

  raw_path_ = raw_path;
  recording_ = true;
  recording_started_at_ = clock_.SteadyNow();
  ++counters_.recordings_started;
  return true;
}

bool SimCaptureDevice::StopRecording(std::string& error) {
  std::lock_guard<std::mutex> lock(mu_);
  return FinishRecordingLocked(error);
}

bool SimCaptureDevice::FinishRecordingLocked(std::string& error) {
  if (!recording_) {
    return true;
  }
  recording_ = false;

  // Frames are produced at the configured rate for the recorded interval.
  const auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                              clock_.SteadyNow() - recording_started_at_)
                              .count();
  const std::uint64_t frame_count = std::max<std::uint64_t>(
      1U, static_cast<std::uint64_t>(std::max<std::int64_t>(0, elapsed_ms)) * format_.fps / 1000U);
  const std::uint32_t per_frame = ParamOrDefault("raw_bytes_per_frame", kDefaultRawBytesPerFrame);

  std::vector<char> chunk;
  for (std::uint64_t i = 0; i < frame_count; ++i) {
    chunk.clear();
    AppendAccessUnit(chunk, (i % static_cast<std::uint64_t>(format_.fps)) == 0U ? 0x65U : 0x41U,
                     per_frame, counters_.recorded_frames + i);
    raw_file_.write(chunk.data(), static_cast<std::streamsize>(chunk.size()));
  }
  counters_.recorded_frames += frame_count;
  ++counters_.recordings_stopped;

  raw_file_.flush();
  const bool write_ok = static_cast<bool>(raw_file_);
  raw_file_.close();
  if (!write_ok) {
    error = "failed while writing raw output '" + raw_path_.string() + "'";
    return false;
  }
  return true;
}

bool SimCaptureDevice::CaptureFrame(std::vector<std::uint8_t>& jpeg, std::string& error) {
  // Frames arrive at the configured rate, as they would from a sensor.
  std::chrono::milliseconds frame_period{0};
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (ParamOrEmpty("pace_frames") != "false" && format_.fps > 0U) {
      frame_period = std::chrono::milliseconds(1000U / format_.fps);
    }
  }
  clock_.SleepFor(frame_period);

  std::lock_guard<std::mutex> lock(mu_);
  if (!running_) {
    error = "sim device must be running before capture_frame";
    return false;
  }

  const std::uint64_t seq = ++counters_.capture_calls;
  const std::string injected = ParamOrEmpty("capture_error");
  if (!injected.empty()) {
    error = injected;
    return false;
  }
  const std::uint32_t fail_every_n = ParamOrDefault("capture_fail_every_n", 0U);
  if (fail_every_n > 0U && seq % fail_every_n == 0U) {
    error = "sim frame capture timed out";
    return false;
  }

  const std::uint32_t payload = ParamOrDefault("frame_size_bytes", kDefaultFrameSizeBytes);
  jpeg.clear();
  jpeg.reserve(static_cast<std::size_t>(payload) + 12U);
  // SOI + APP0 marker, then the sequence number so consecutive frames differ.
  jpeg.insert(jpeg.end(), {0xFFU, 0xD8U, 0xFFU, 0xE0U});
  for (int shift = 56; shift >= 0; shift -= 8) {
    jpeg.push_back(static_cast<std::uint8_t>((seq >> shift) & 0xFFU));
  }
  for (std::uint32_t i = 0; i < payload; ++i) {
    jpeg.push_back(static_cast<std::uint8_t>((seq + i) % 0xFEU));
  }
  jpeg.insert(jpeg.end(), {0xFFU, 0xD9U});
  return true;
}

bool SimCaptureDevice::Stop(std::string& error) {
  std::lock_guard<std::mutex> lock(mu_);
  bool ok = FinishRecordingLocked(error);
  running_ = false;
  return ok;
}

bool SimCaptureDevice::Close(std::string& error) {
  std::lock_guard<std::mutex> lock(mu_);
  bool ok = FinishRecordingLocked(error);
  running_ = false;
  if (open_) {
    open_ = false;
    ++counters_.close_calls;
  }
  return ok;
}

bool SimCaptureDevice::IsOpen() const {
  std::lock_guard<std::mutex> lock(mu_);
  return open_;
}

bool SimCaptureDevice::SetParam(const std::string& key, const std::string& value,
                                std::string& error) {
  if (key.empty()) {
    error = "parameter key cannot be empty";
    return false;
  }

  std::uint32_t parsed = 0;
  if (IsNumericParam(key) && !ParseUInt32(value, parsed)) {
    error = "invalid " + key + " parameter value: " + value;
    return false;
  }

  std::lock_guard<std::mutex> lock(mu_);
  if (value.empty()) {
    params_.erase(key);
  } else {
    params_[key] = value;
  }
  return true;
}

DeviceConfig SimCaptureDevice::DumpConfig() const {
  std::lock_guard<std::mutex> lock(mu_);
  DeviceConfig config = params_;
  config["open"] = open_ ? "true" : "false";
  config["running"] = running_ ? "true" : "false";
  config["recording"] = recording_ ? "true" : "false";
  config["width"] = std::to_string(format_.width);
  config["height"] = std::to_string(format_.height);
  config["fps"] = std::to_string(format_.fps);
  config["profile"] = ToString(format_.profile);
  return config;
}

SimCaptureDevice::Snapshot SimCaptureDevice::DebugSnapshot() const {
  std::lock_guard<std::mutex> lock(mu_);
  Snapshot snapshot = counters_;
  snapshot.open = open_;
  snapshot.running = running_;
  snapshot.recording = recording_;
  snapshot.format = format_;
  return snapshot;
}

std::string SimCaptureDevice::ParamOrEmpty(const std::string& key) const {
  const auto it = params_.find(key);
  return it == params_.end() ? std::string() : it->second;
}

std::uint32_t SimCaptureDevice::ParamOrDefault(const std::string& key,
                                               const std::uint32_t fallback) const {
  std::uint32_t value = 0;
  const auto it = params_.find(key);
  if (it == params_.end() || !ParseUInt32(it->second, value)) {
    return fallback;
  }
  return value;
}

} // namespace picamd::backends::sim
