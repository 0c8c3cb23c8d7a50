#include "error.h"

namespace shipit {

std::string_view errc_name(errc code) {
  switch (code) {
    case errc::config_not_found: return "config_not_found";
    case errc::config_unreadable: return "config_unreadable";
    case errc::malformed_header: return "malformed_header";
    case errc::incomplete_config: return "incomplete_config";
    case errc::malformed_section: return "malformed_section";
    case errc::duplicate_section: return "duplicate_section";
    case errc::target_not_found: return "target_not_found";
    case errc::local_script_failed: return "local_script_failed";
    case errc::remote_script_failed: return "remote_script_failed";
    case errc::remote_directory_missing: return "remote_directory_missing";
    case errc::local_file_not_found: return "local_file_not_found";
  }
  return "unknown";
}

error::error(errc code, std::string const &message)
    : std::runtime_error{ message }, code_{ code } {}

}  // namespace shipit
