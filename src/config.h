#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace shipit {

inline constexpr char kDefaultConfigName[]{ ".shipit" };
inline constexpr char kLocalSuffix[]{ ":local" };

struct config_section {
  std::string name;  // base target name, without the :local suffix
  bool is_local{ false };
  std::string body;  // verbatim script lines, no header line, no trailing newline
};

struct config_document {
  std::filesystem::path path;
  std::unordered_map<std::string, std::string> header;
  std::vector<config_section> sections;  // file order

  std::string const *header_value(std::string_view key) const;

  std::string const &host() const;
  std::string const &remote_path() const;
};

// Walk from start_dir toward the filesystem root looking for file_name.
// Root is checked once. Returns the absolute path of the first match.
std::optional<std::filesystem::path> config_locate(std::filesystem::path const &start_dir,
                                                   std::string_view file_name);

// config_locate from the current directory; throws error(config_not_found).
std::filesystem::path config_find(std::string_view file_name);

// Parse config text. Never executes anything. Throws shipit::error on malformed
// input, duplicate sections, or a missing host/path.
config_document config_parse(std::string_view content, std::filesystem::path const &path);

config_document config_load(std::filesystem::path const &path);

// "[name]" or "[name:local]" followed by the body.
std::string config_format_section(config_section const &section);

}  // namespace shipit
