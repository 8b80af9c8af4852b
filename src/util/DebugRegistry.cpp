#include "util/DebugRegistry.hpp"

#include <fmt/format.h>

#include <fstream>
#include <stdexcept>
#include <utility>

namespace netdiag::util {

DebugRegistry::DebugRegistry(Logger& log, std::filesystem::path run_dir)
  : log_(log), run_dir_(std::move(run_dir)) {}

void DebugRegistry::add(std::string name, Fn fn) {
  if (!fn) {
    log_.warning(fmt::format("Attempted to register a non-callable object: {}", name));
    return;
  }
  log_.debug(fmt::format("Registered exit logging function: {}", name));
  fns_.push_back({std::move(name), std::move(fn)});
}

int DebugRegistry::run() {
  log_.info("Running registered exit logging functions...");
  if (run_dir_.empty()) {
    if (!fns_.empty()) log_.info("File logging is off; exit logging functions skipped");
    return 0;
  }
  int written = 0;
  for (const auto& e : fns_) {
    std::string output;
    try {
      output = e.fn();
    } catch (const std::exception& ex) {
      log_.error(fmt::format("Error running debug function {}: {}", e.name, ex.what()));
      continue;
    }
    if (output.empty()) continue;

    const auto file = run_dir_ / (e.name + ".log");
    std::error_code ec;
    const bool has_content = std::filesystem::exists(file, ec) && std::filesystem::file_size(file, ec) > 0 && !ec;
    std::ofstream out(file, std::ios::app);
    if (!out) {
      log_.error(fmt::format("Error running debug function {}: cannot open {}", e.name, file.string()));
      continue;
    }
    if (has_content) out << "\n\n" << std::string(80, '*') << "\n\n\n";
    out << output << "\n";
    out.close();
    if (!out) {
      log_.error(fmt::format("Error running debug function {}: write to {} failed", e.name, file.string()));
      continue;
    }
    ++written;
    log_.info(fmt::format("Appended output for {} to {}", e.name, file.string()));
  }
  return written;
}

} // namespace netdiag::util
