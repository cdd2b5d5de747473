#include "hql/version.h"

namespace hql {

namespace {

#ifndef HQL_VERSION
#define HQL_VERSION "0.0.0"
#endif

#ifndef HQL_GIT_COMMIT
#define HQL_GIT_COMMIT "unknown"
#endif

#ifndef HQL_GIT_DIRTY
#define HQL_GIT_DIRTY 0
#endif

}  // namespace

VersionInfo get_version_info() {
  VersionInfo info;
  info.version = HQL_VERSION;
  info.git_commit = HQL_GIT_COMMIT;
  info.git_dirty = (HQL_GIT_DIRTY != 0);
  return info;
}

std::string version_string() {
  VersionInfo info = get_version_info();
  std::string out = info.version + " (" + info.git_commit;
  if (info.git_dirty) out += "-dirty";
  out += ")";
  return out;
}

}  // namespace hql
