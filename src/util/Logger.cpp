#include "util/Logger.hpp"
#include "util/DebugRegistry.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cstdio>
#include <ctime>
#include <vector>

namespace netdiag::util {

static spdlog::level::level_enum to_spd(LogLevel level) {
  switch (level) {
    case LogLevel::Debug:    return spdlog::level::debug;
    case LogLevel::Info:     return spdlog::level::info;
    case LogLevel::Warning:  return spdlog::level::warn;
    case LogLevel::Error:    return spdlog::level::err;
    case LogLevel::Critical: return spdlog::level::critical;
    case LogLevel::Off:      return spdlog::level::off;
  }
  return spdlog::level::err;
}

LogLevel log_level_from_string(std::string_view s, LogLevel def) {
  std::string v(s);
  for (auto& c : v) if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
  if (v == "debug") return LogLevel::Debug;
  if (v == "info") return LogLevel::Info;
  if (v == "warn" || v == "warning") return LogLevel::Warning;
  if (v == "error") return LogLevel::Error;
  if (v == "critical" || v == "fatal") return LogLevel::Critical;
  if (v == "off" || v == "none") return LogLevel::Off;
  return def;
}

const char* log_level_name(LogLevel level) {
  switch (level) {
    case LogLevel::Debug:    return "debug";
    case LogLevel::Info:     return "info";
    case LogLevel::Warning:  return "warning";
    case LogLevel::Error:    return "error";
    case LogLevel::Critical: return "critical";
    case LogLevel::Off:      return "off";
  }
  return "error";
}

SpdLogger::SpdLogger(std::shared_ptr<spdlog::logger> impl, std::filesystem::path run_dir)
  : impl_(std::move(impl)), run_dir_(std::move(run_dir)),
    debug_(std::make_unique<DebugRegistry>(*this, run_dir_)) {}

SpdLogger::~SpdLogger() = default;

void SpdLogger::log(LogLevel level, std::string_view msg, const Where& where) {
  spdlog::source_loc loc{where.file_name(), static_cast<int>(where.line()), where.function_name()};
  impl_->log(loc, to_spd(level), "{}", msg);
}

void SpdLogger::set_level(LogLevel level) {
  impl_->set_level(to_spd(level));
  for (auto& sink : impl_->sinks()) sink->set_level(to_spd(level));
}

std::string run_stamp() {
  // One stamp per process so every logger built in this run shares a directory
  static const std::string stamp = []{
    std::time_t t = std::time(nullptr);
    std::tm tm{};
    ::localtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d_%H-%M-%S", &tm);
    return std::string(buf);
  }();
  return stamp;
}

int prune_log_runs(const std::filesystem::path& dir, int keep) {
  if (keep < 0) return 0;
  std::error_code ec;
  if (!std::filesystem::is_directory(dir, ec)) return 0;
  std::vector<std::filesystem::path> runs;
  for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
    if (entry.is_directory(ec)) runs.push_back(entry.path());
  }
  if (static_cast<int>(runs.size()) <= keep) return 0;
  std::sort(runs.begin(), runs.end(),
            [](const auto& a, const auto& b){ return a.filename().string() < b.filename().string(); });
  int removed = 0;
  const size_t excess = runs.size() - static_cast<size_t>(keep);
  for (size_t i = 0; i < excess; ++i) {
    std::filesystem::remove_all(runs[i], ec);
    if (!ec) ++removed;
  }
  return removed;
}

std::unique_ptr<SpdLogger> make_logger(const LogSettings& settings) {
  std::vector<spdlog::sink_ptr> sinks;
  if (settings.console) sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

  std::filesystem::path file_path;
  if (!settings.dir.empty()) {
    // Prune first so the run we are about to create is never a candidate
    if (settings.max_runs >= 1) prune_log_runs(settings.dir, settings.max_runs - 1);
    file_path = settings.dir / run_stamp() / "debug.log";
    std::error_code ec;
    std::filesystem::create_directories(file_path.parent_path(), ec);
    if (ec) {
      std::fprintf(stderr, "netdiag: cannot create log directory %s: %s\n",
                   file_path.parent_path().c_str(), ec.message().c_str());
      file_path.clear();
    } else {
      sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(file_path.string()));
    }
  }

  auto impl = std::make_shared<spdlog::logger>("netdiag", sinks.begin(), sinks.end());
  impl->set_pattern("%Y-%m-%d %H:%M:%S,%e - %^%l%$ - %s:%# - %v");
  impl->flush_on(spdlog::level::warn);
  auto out = std::make_unique<SpdLogger>(std::move(impl), file_path.parent_path());
  out->set_level(settings.level);
  if (!file_path.empty()) out->info("File logging enabled. Logs are saved to: " + file_path.string());
  return out;
}

} // namespace netdiag::util
