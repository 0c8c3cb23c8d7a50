#pragma once

#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace shipit {

struct unmovable {
  unmovable() = default;
  unmovable(unmovable const &) = delete;
  unmovable &operator=(unmovable const &) = delete;
};

// RAII file pointer with custom deleter
struct file_deleter {
  void operator()(std::FILE *file) const noexcept;
};
using file_ptr_t = std::unique_ptr<std::FILE, file_deleter>;

// Open file with RAII wrapper. Returns nullptr on failure.
file_ptr_t util_open_file(std::filesystem::path const &path, char const *mode);

// Load entire file into memory as text.
// Throws std::runtime_error if file cannot be opened or read.
std::string util_load_text_file(std::filesystem::path const &path);

// Quote a string for safe interpolation into a POSIX shell command line.
// Produces a single-quoted word; embedded single quotes become '\''.
// Example: it's -> 'it'\''s'
std::string util_shell_quote(std::string_view value);

// Join argv-style words with single spaces, verbatim (no quoting).
std::string util_join(std::vector<std::string> const &words, std::string_view sep = " ");

// Strip spaces and tabs from both ends.
std::string_view util_trim(std::string_view s);

class scoped_path_cleanup : public unmovable {
 public:
  explicit scoped_path_cleanup(std::filesystem::path path);
  ~scoped_path_cleanup();

  void reset(std::filesystem::path path = {});
  std::filesystem::path const &path() const { return path_; }

 private:
  void cleanup();

  std::filesystem::path path_;
};

}  // namespace shipit
