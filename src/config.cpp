#include "config.h"

#include "error.h"
#include "tui.h"
#include "util.h"

#include <iterator>
#include <stdexcept>
#include <utility>

namespace shipit {

namespace {

std::vector<std::string_view> split_lines(std::string_view content) {
  std::vector<std::string_view> lines;
  size_t line_start{ 0 };

  while (line_start < content.size()) {
    size_t const line_end{ content.find('\n', line_start) };
    auto line{ content.substr(
        line_start,
        (line_end == std::string_view::npos ? content.size() : line_end) - line_start) };
    if (!line.empty() && line.back() == '\r') { line.remove_suffix(1); }
    lines.push_back(line);

    if (line_end == std::string_view::npos) { break; }
    line_start = line_end + 1;
  }

  return lines;
}

bool is_blank(std::string_view line) { return util_trim(line).empty(); }

std::string location(std::filesystem::path const &path, size_t line_number) {
  return path.string() + ":" + std::to_string(line_number);
}

std::string_view trim_right(std::string_view line) {
  size_t const end{ line.find_last_not_of(" \t") };
  return end == std::string_view::npos ? std::string_view{} : line.substr(0, end + 1);
}

// Matches ^\[[^:\]]+(:local)?\]$ after trailing whitespace is dropped.
std::optional<config_section> parse_section_header(std::string_view line) {
  line = trim_right(line);
  if (line.size() < 3 || line.front() != '[' || line.back() != ']') {
    return std::nullopt;
  }

  auto name{ line.substr(1, line.size() - 2) };
  bool const is_local{ name.ends_with(kLocalSuffix) };
  if (is_local) { name.remove_suffix(std::string_view{ kLocalSuffix }.size()); }

  if (name.empty()) { return std::nullopt; }
  for (char const c : name) {
    if (c == ':' || c == ']') { return std::nullopt; }
  }

  return config_section{ .name = std::string{ name }, .is_local = is_local, .body = {} };
}

std::string unquote(std::string_view value) {
  if (value.size() >= 2 && value.front() == value.back() &&
      (value.front() == '"' || value.front() == '\'')) {
    value = value.substr(1, value.size() - 2);
  }
  return std::string{ value };
}

// key = value, key=value or key: value
std::pair<std::string, std::string> parse_header_line(std::string_view line,
                                                      size_t line_number,
                                                      std::filesystem::path const &path) {
  size_t const sep{ line.find_first_of("=:") };
  auto const key{ sep == std::string_view::npos ? std::string_view{}
                                                : util_trim(line.substr(0, sep)) };

  if (key.empty() || key.find_first_of(" \t") != std::string_view::npos) {
    throw error(errc::malformed_header,
                "Malformed config header at " + location(path, line_number) +
                    ": expected 'key = value', got '" + std::string{ line } + "'");
  }

  return { std::string{ key }, unquote(util_trim(line.substr(sep + 1))) };
}

struct pending_section {
  config_section section;
  std::vector<std::string_view> lines;
};

std::string join_body(std::vector<std::string_view> lines) {
  while (!lines.empty() && is_blank(lines.back())) { lines.pop_back(); }

  std::string body;
  for (size_t i{ 0 }; i < lines.size(); ++i) {
    if (i > 0) { body.push_back('\n'); }
    body.append(lines[i]);
  }
  return body;
}

void require_header_key(config_document const &doc, char const *key) {
  auto const *value{ doc.header_value(key) };
  if (!value || value->empty()) {
    throw error(errc::incomplete_config,
                "Incomplete config " + doc.path.string() + ": missing required key '" +
                    key + "'");
  }
}

}  // namespace

std::string const *config_document::header_value(std::string_view key) const {
  auto const it{ header.find(std::string{ key }) };
  return it == header.end() ? nullptr : &it->second;
}

std::string const &config_document::host() const {
  require_header_key(*this, "host");
  return *header_value("host");
}

std::string const &config_document::remote_path() const {
  require_header_key(*this, "path");
  return *header_value("path");
}

std::optional<std::filesystem::path> config_locate(std::filesystem::path const &start_dir,
                                                   std::string_view file_name) {
  namespace fs = std::filesystem;

  auto cur{ fs::absolute(start_dir).lexically_normal() };
  if (!cur.has_filename() && cur != cur.root_path()) { cur = cur.parent_path(); }

  // One check per path component bounds the walk even if parent_path misbehaves.
  auto const max_steps{ static_cast<size_t>(std::distance(cur.begin(), cur.end())) };

  for (size_t step{ 0 }; step < max_steps; ++step) {
    auto const candidate{ cur / file_name };
    std::error_code ec;
    if (fs::is_regular_file(candidate, ec)) { return candidate; }

    auto const parent{ cur.parent_path() };
    if (parent == cur) { break; }
    cur = parent;
  }

  return std::nullopt;
}

std::filesystem::path config_find(std::string_view file_name) {
  auto const cwd{ std::filesystem::current_path() };
  if (auto const found{ config_locate(cwd, file_name) }) {
    tui::debug("Found config: %s", found->string().c_str());
    return *found;
  }

  throw error(errc::config_not_found,
              "Config file " + std::string{ file_name } + " not found in " +
                  cwd.string() + " or any parent directory");
}

config_document config_parse(std::string_view content, std::filesystem::path const &path) {
  config_document doc;
  doc.path = path;

  auto const lines{ split_lines(content) };
  size_t i{ 0 };

  while (i < lines.size() && is_blank(lines[i])) { ++i; }

  for (; i < lines.size() && !is_blank(lines[i]); ++i) {
    if (parse_section_header(lines[i])) { break; }

    auto const trimmed{ util_trim(lines[i]) };
    if (trimmed.front() == '#') { continue; }

    auto [key, value]{ parse_header_line(trimmed, i + 1, path) };
    doc.header[std::move(key)] = std::move(value);
  }

  std::vector<pending_section> pending;
  bool after_blank{ true };

  for (; i < lines.size(); ++i) {
    auto const line{ lines[i] };

    if (is_blank(line)) {
      if (!pending.empty()) { pending.back().lines.push_back(line); }
      after_blank = true;
      continue;
    }

    if (after_blank && line.front() == '[') {
      auto section{ parse_section_header(line) };
      if (!section) {
        throw error(errc::malformed_section,
                    "Malformed section header at " + location(path, i + 1) + ": '" +
                        std::string{ line } + "' (expected [name] or [name:local])");
      }

      for (auto const &existing : pending) {
        if (existing.section.name == section->name &&
            existing.section.is_local == section->is_local) {
          throw error(errc::duplicate_section,
                      "Duplicate section at " + location(path, i + 1) + ": '" +
                          std::string{ line } + "'");
        }
      }

      pending.push_back(pending_section{ .section = std::move(*section), .lines = {} });
      after_blank = false;
      continue;
    }

    if (pending.empty()) {
      throw error(errc::malformed_section,
                  "Expected a section header at " + location(path, i + 1) + ", got '" +
                      std::string{ line } +
                      "' (header keys must all be in the first block, with no blank "
                      "lines between them)");
    }

    pending.back().lines.push_back(line);
    after_blank = false;
  }

  doc.sections.reserve(pending.size());
  for (auto &p : pending) {
    p.section.body = join_body(std::move(p.lines));
    doc.sections.push_back(std::move(p.section));
  }

  require_header_key(doc, "host");
  require_header_key(doc, "path");

  return doc;
}

config_document config_load(std::filesystem::path const &path) {
  tui::debug("Loading config from file: %s", path.string().c_str());

  std::string content;
  try {
    content = util_load_text_file(path);
  } catch (std::runtime_error const &e) {
    throw error(errc::config_unreadable,
                "Cannot read config " + path.string() + ": " + e.what());
  }

  return config_parse(content, path);
}

std::string config_format_section(config_section const &section) {
  std::string out{ "[" + section.name };
  if (section.is_local) { out += kLocalSuffix; }
  out += "]\n";
  out += section.body;
  out += '\n';
  return out;
}

}  // namespace shipit
