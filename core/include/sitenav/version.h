#pragma once

#include <string>

namespace sitenav {

/// Captures core build version and source provenance details.
struct VersionInfo {
  std::string version;
  std::string git_commit;
  bool git_dirty = false;
};

/// Returns compile-time version/provenance for the current build.
/// MUST not perform IO.
VersionInfo get_version_info();
/// Returns a human-readable version + provenance string.
std::string version_string();

}  // namespace sitenav
