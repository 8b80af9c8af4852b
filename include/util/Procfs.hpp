// Helpers for reading /proc with an optional root remap
#pragma once
#include <optional>
#include <string>
#include <vector>

namespace netdiag::util {

// Map an absolute /proc path to an alternate root if NETDIAG_PROC_ROOT is set
auto map_proc_path(const std::string& abs) -> std::string;

// Read entire file as string. Returns std::nullopt on error.
auto read_file_string(const std::string& abs) -> std::optional<std::string>;

// List directory entries (names only). Returns empty vector on error.
auto list_dir(const std::string& abs) -> std::vector<std::string>;

// Target of a symbolic link, std::nullopt if it is not a readable link.
auto read_symlink(const std::string& abs) -> std::optional<std::string>;

// True when every character of s is a decimal digit (and s is non-empty).
[[nodiscard]] bool is_all_digits(const std::string& s);

} // namespace netdiag::util
