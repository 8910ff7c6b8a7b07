#include "sitenav/version.h"

#ifndef SITENAV_VERSION
#define SITENAV_VERSION "0.0.0"
#endif

#ifndef SITENAV_GIT_COMMIT
#define SITENAV_GIT_COMMIT "unknown"
#endif

#ifndef SITENAV_GIT_DIRTY
#define SITENAV_GIT_DIRTY 0
#endif

namespace sitenav {

VersionInfo get_version_info() {
  VersionInfo info;
  info.version = SITENAV_VERSION;
  info.git_commit = SITENAV_GIT_COMMIT;
  info.git_dirty = (SITENAV_GIT_DIRTY != 0);
  return info;
}

std::string version_string() {
  VersionInfo info = get_version_info();
  std::string out = info.version + " (" + info.git_commit;
  if (info.git_dirty) out += "-dirty";
  out += ")";
  return out;
}

}  // namespace sitenav
