#pragma once

#include <string>

namespace hql {

/// Captures core build version and source provenance details.
/// MUST be stable and available to the CLI.
struct VersionInfo {
  std::string version;
  std::string git_commit;
  bool git_dirty = false;
};

/// Returns compile-time version/provenance for the current core build.
/// MUST not perform IO and MUST be safe to call frequently.
VersionInfo get_version_info();
/// Returns a human-readable version + provenance string, e.g. "0.3.0 (abc123-dirty)".
std::string version_string();

}  // namespace hql
