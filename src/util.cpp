#include "util.h"

#include <cstdio>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace shipit {

void file_deleter::operator()(std::FILE *file) const noexcept {
  if (file) { static_cast<void>(std::fclose(file)); }
}

file_ptr_t util_open_file(std::filesystem::path const &path, char const *mode) {
  return file_ptr_t{ std::fopen(path.c_str(), mode) };
}

std::string util_load_text_file(std::filesystem::path const &path) {
  auto file{ util_open_file(path, "rb") };
  if (!file) {
    throw std::runtime_error("util_load_text_file: failed to open file: " +
                             path.string());
  }

  std::string content;
  std::string chunk(4096, '\0');
  for (;;) {
    size_t const n{ std::fread(chunk.data(), 1, chunk.size(), file.get()) };
    content.append(chunk.data(), n);
    if (n < chunk.size()) {
      if (std::ferror(file.get())) {
        throw std::runtime_error("util_load_text_file: failed to read file: " +
                                 path.string());
      }
      break;
    }
  }

  return content;
}

std::string util_shell_quote(std::string_view value) {
  std::string result;
  result.reserve(value.size() + 2);
  result.push_back('\'');
  for (char const c : value) {
    if (c == '\'') {
      result.append("'\\''");
    } else {
      result.push_back(c);
    }
  }
  result.push_back('\'');
  return result;
}

std::string util_join(std::vector<std::string> const &words, std::string_view sep) {
  std::string result;
  for (size_t i{ 0 }; i < words.size(); ++i) {
    if (i > 0) { result.append(sep); }
    result.append(words[i]);
  }
  return result;
}

std::string_view util_trim(std::string_view s) {
  size_t begin{ 0 };
  while (begin < s.size() && (s[begin] == ' ' || s[begin] == '\t')) { ++begin; }
  size_t end{ s.size() };
  while (end > begin && (s[end - 1] == ' ' || s[end - 1] == '\t')) { --end; }
  return s.substr(begin, end - begin);
}

scoped_path_cleanup::scoped_path_cleanup(std::filesystem::path path)
    : path_{ std::move(path) } {}

scoped_path_cleanup::~scoped_path_cleanup() { cleanup(); }

void scoped_path_cleanup::reset(std::filesystem::path path) {
  cleanup();
  path_ = std::move(path);
}

void scoped_path_cleanup::cleanup() {
  if (path_.empty()) { return; }
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
  path_.clear();
}

}  // namespace shipit
