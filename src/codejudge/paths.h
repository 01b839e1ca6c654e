#ifndef CODEJUDGE_PATHS_H_
#define CODEJUDGE_PATHS_H_

#include <codejudge/paths.h>

fs::path Workdir(fs::path&&);

// for cjail boxes
// if inside_box = true, the path is as seen from inside the chroot and root/id are not used
fs::path RunBoxPath(const fs::path& root, long id);
fs::path BoxPayload(const fs::path& box, bool inside_box = false);
fs::path BoxStdout(const fs::path& box, bool inside_box = false);
fs::path BoxStderr(const fs::path& box, bool inside_box = false);

#endif  // CODEJUDGE_PATHS_H_
