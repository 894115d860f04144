#include "xmlnav/version.h"

#ifndef XMLNAV_VERSION
#define XMLNAV_VERSION "0.0.0"
#endif

#ifndef XMLNAV_GIT_COMMIT
#define XMLNAV_GIT_COMMIT "unknown"
#endif

#ifndef XMLNAV_GIT_DIRTY
#define XMLNAV_GIT_DIRTY 0
#endif

namespace xmlnav {

VersionInfo get_version_info() {
  VersionInfo info;
  info.version = XMLNAV_VERSION;
  info.git_commit = XMLNAV_GIT_COMMIT;
  info.git_dirty = (XMLNAV_GIT_DIRTY != 0);
  return info;
}

std::string version_string() {
  VersionInfo info = get_version_info();
  std::string out = info.version + " (" + info.git_commit;
  if (info.git_dirty) out += "-dirty";
  out += ")";
  return out;
}

}  // namespace xmlnav
