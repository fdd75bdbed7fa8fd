#include "common/system.hpp"
#include <errno.h>
#include <sys/types.h>
#include <pwd.h>
#include <grp.h>
#include <cctype>
#include <cstdlib>

namespace grader {

static int parse_id(const char *name) {
    if (!*name) return -1;
    for (const char *p = name; *p; ++p)
        if (!isdigit((unsigned char)*p)) return -1;
    long id = strtol(name, nullptr, 10);
    if (id > 0x7fffffff) return -1;
    return (int) id;
}

int get_userid(const char *name)
{
    struct passwd *pwd;

    errno = 0;
    pwd = getpwnam(name);

    if (!pwd || errno) return parse_id(name);
    return (int) pwd->pw_uid;
}

int get_groupid(const char *name)
{
    struct group *g;

    errno = 0;
    g = getgrnam(name);

    if (!g || errno) return parse_id(name);
    return (int) g->gr_gid;
}

int get_primary_groupid(int user_id)
{
    struct passwd *pwd;

    errno = 0;
    pwd = getpwuid((uid_t) user_id);

    if (!pwd || errno) return -1;
    return (int) pwd->pw_gid;
}

}  // namespace grader
