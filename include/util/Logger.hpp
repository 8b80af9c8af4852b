#pragma once
#include <filesystem>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>

namespace spdlog { class logger; }

namespace netdiag::util {

class DebugRegistry;

enum class LogLevel { Debug, Info, Warning, Error, Critical, Off };

[[nodiscard]] LogLevel log_level_from_string(std::string_view s, LogLevel def = LogLevel::Error);
[[nodiscard]] const char* log_level_name(LogLevel level);

// Logging capability handed to every monitor. The level helpers capture the
// caller's file, function and line.
class Logger {
public:
  using Where = std::source_location;

  virtual ~Logger() = default;
  virtual void log(LogLevel level, std::string_view msg, const Where& where) = 0;

  void debug(std::string_view msg, const Where& w = Where::current())    { log(LogLevel::Debug, msg, w); }
  void info(std::string_view msg, const Where& w = Where::current())     { log(LogLevel::Info, msg, w); }
  void warning(std::string_view msg, const Where& w = Where::current())  { log(LogLevel::Warning, msg, w); }
  void error(std::string_view msg, const Where& w = Where::current())    { log(LogLevel::Error, msg, w); }
  void critical(std::string_view msg, const Where& w = Where::current()) { log(LogLevel::Critical, msg, w); }
};

// Discards everything.
class NullLogger final : public Logger {
public:
  void log(LogLevel, std::string_view, const Where&) override {}
};

class SpdLogger final : public Logger {
public:
  explicit SpdLogger(std::shared_ptr<spdlog::logger> impl, std::filesystem::path run_dir = {});
  ~SpdLogger() override;
  void log(LogLevel level, std::string_view msg, const Where& where) override;
  void set_level(LogLevel level);
  [[nodiscard]] const std::shared_ptr<spdlog::logger>& impl() const { return impl_; }
  // Empty when file logging is off.
  [[nodiscard]] const std::filesystem::path& run_dir() const { return run_dir_; }
  // Exit-time dump functions writing beside this run's debug.log.
  [[nodiscard]] DebugRegistry& debug_functions() { return *debug_; }
private:
  std::shared_ptr<spdlog::logger> impl_;
  std::filesystem::path run_dir_;
  std::unique_ptr<DebugRegistry> debug_;
};

struct LogSettings {
  LogLevel level{LogLevel::Error};
  bool console{true};
  std::filesystem::path dir{};  // empty: no file output
  int max_runs{-1};             // < 1 keeps every run directory
};

// Console sink on stderr plus, when settings.dir is set, a per-run
// <dir>/<YYYY-MM-DD_HH-MM-SS>/debug.log file. Old run directories beyond
// max_runs are pruned before the new one is opened.
[[nodiscard]] std::unique_ptr<SpdLogger> make_logger(const LogSettings& settings);

// Remove the oldest run directories under dir so that at most 'keep' remain
// (keep < 0 keeps all). Directory names sort chronologically. Returns the
// number removed.
int prune_log_runs(const std::filesystem::path& dir, int keep);

// Name of the run directory for the current process start.
[[nodiscard]] std::string run_stamp();

} // namespace netdiag::util
