#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace shipit {

enum class errc {
  config_not_found,
  config_unreadable,
  malformed_header,
  incomplete_config,
  malformed_section,
  duplicate_section,
  target_not_found,
  local_script_failed,
  remote_script_failed,
  remote_directory_missing,
  local_file_not_found,
};

std::string_view errc_name(errc code);

// Every shipit error is terminal for the current invocation.
class error : public std::runtime_error {
 public:
  error(errc code, std::string const &message);

  errc code() const { return code_; }

 private:
  errc code_;
};

}  // namespace shipit
