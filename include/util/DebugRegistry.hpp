#pragma once
#include "util/Logger.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace netdiag::util {

// Functions run once before exit whose text output is kept in the run
// directory, one <name>.log per function.
class DebugRegistry {
public:
  using Fn = std::function<std::string()>;

  DebugRegistry(Logger& log, std::filesystem::path run_dir);

  // An empty fn is refused with a warning.
  void add(std::string name, Fn fn);

  // Appends each function's non-empty output to <run_dir>/<name>.log. A file
  // that already has content gets a separator row of '*' first. A function
  // that throws is logged at error and the rest still run. Returns the
  // number of files appended to.
  int run();

  [[nodiscard]] size_t size() const { return fns_.size(); }
  [[nodiscard]] const std::filesystem::path& run_dir() const { return run_dir_; }

private:
  struct Entry { std::string name; Fn fn; };
  Logger& log_;
  std::filesystem::path run_dir_;
  std::vector<Entry> fns_;
};

} // namespace netdiag::util
