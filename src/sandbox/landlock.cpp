/*
 * codeloop - Filesystem jail implementation (Landlock)
 *
 * The ruleset handles every ABI v1 filesystem right; anything not
 * granted below is denied to the confined process.
 */
#include <codeloop/sandbox/landlock.hpp>

#include <cstring>
#include <cerrno>
#include <unistd.h>
#include <fcntl.h>

// ============================================================================
// Landlock syscall wrappers (not in glibc until very recently)
// ============================================================================

#ifdef __linux__

#include <sys/prctl.h>
#include <sys/syscall.h>
#include <linux/landlock.h>

#ifndef __NR_landlock_create_ruleset
#define __NR_landlock_create_ruleset 444
#endif
#ifndef __NR_landlock_add_rule
#define __NR_landlock_add_rule 445
#endif
#ifndef __NR_landlock_restrict_self
#define __NR_landlock_restrict_self 446
#endif

// All filesystem access rights (Landlock ABI v1)
#define CODELOOP_LANDLOCK_FS_ALL ( \
    LANDLOCK_ACCESS_FS_EXECUTE          | \
    LANDLOCK_ACCESS_FS_WRITE_FILE       | \
    LANDLOCK_ACCESS_FS_READ_FILE        | \
    LANDLOCK_ACCESS_FS_READ_DIR         | \
    LANDLOCK_ACCESS_FS_REMOVE_DIR       | \
    LANDLOCK_ACCESS_FS_REMOVE_FILE      | \
    LANDLOCK_ACCESS_FS_MAKE_CHAR        | \
    LANDLOCK_ACCESS_FS_MAKE_DIR         | \
    LANDLOCK_ACCESS_FS_MAKE_REG         | \
    LANDLOCK_ACCESS_FS_MAKE_SOCK        | \
    LANDLOCK_ACCESS_FS_MAKE_FIFO        | \
    LANDLOCK_ACCESS_FS_MAKE_BLOCK       | \
    LANDLOCK_ACCESS_FS_MAKE_SYM         \
)

#define CODELOOP_LANDLOCK_FS_READ ( \
    LANDLOCK_ACCESS_FS_EXECUTE          | \
    LANDLOCK_ACCESS_FS_READ_FILE        | \
    LANDLOCK_ACCESS_FS_READ_DIR         \
)

static inline int landlock_create_ruleset(
    const struct landlock_ruleset_attr* attr,
    size_t size, __u32 flags) {
    return static_cast<int>(syscall(__NR_landlock_create_ruleset, attr, size, flags));
}

static inline int landlock_add_rule(
    int ruleset_fd, enum landlock_rule_type type,
    const void* attr, __u32 flags) {
    return static_cast<int>(syscall(__NR_landlock_add_rule, ruleset_fd, type, attr, flags));
}

static inline int landlock_restrict_self(int ruleset_fd, __u32 flags) {
    return static_cast<int>(syscall(__NR_landlock_restrict_self, ruleset_fd, flags));
}

// Missing directories are skipped; any other failure aborts confinement.
static int add_path_rule(int ruleset_fd, const char* path, __u64 access, bool required) {
    int dir_fd = open(path, O_PATH | O_CLOEXEC);
    if (dir_fd < 0) {
        return required ? errno : 0;
    }

    struct landlock_path_beneath_attr path_attr;
    memset(&path_attr, 0, sizeof(path_attr));
    path_attr.allowed_access = access;
    path_attr.parent_fd = dir_fd;

    int ret = landlock_add_rule(ruleset_fd, LANDLOCK_RULE_PATH_BENEATH, &path_attr, 0);
    int saved = errno;
    close(dir_fd);
    return ret < 0 ? saved : 0;
}

#endif // __linux__

namespace codeloop {

bool FsJail::is_supported() {
#ifdef __linux__
    static const bool supported = []() {
        struct landlock_ruleset_attr attr;
        memset(&attr, 0, sizeof(attr));
        attr.handled_access_fs = CODELOOP_LANDLOCK_FS_ALL;
        int fd = landlock_create_ruleset(&attr, sizeof(attr), 0);
        if (fd < 0) {
            return false;
        }
        close(fd);
        return true;
    }();
    return supported;
#else
    return false;
#endif
}

int FsJail::confine(const char* writable_dir, const char* const* extra_ro_dirs) {
#ifndef __linux__
    (void)writable_dir;
    (void)extra_ro_dirs;
    return ENOSYS;
#else
    struct landlock_ruleset_attr ruleset_attr;
    memset(&ruleset_attr, 0, sizeof(ruleset_attr));
    ruleset_attr.handled_access_fs = CODELOOP_LANDLOCK_FS_ALL;

    int ruleset_fd = landlock_create_ruleset(&ruleset_attr, sizeof(ruleset_attr), 0);
    if (ruleset_fd < 0) {
        return errno;
    }

    int err = add_path_rule(ruleset_fd, writable_dir, CODELOOP_LANDLOCK_FS_ALL, true);
    if (err != 0) {
        close(ruleset_fd);
        return err;
    }

    // Enough of the system for an interpreter to start and import its stdlib
    static const char* const readonly_dirs[] = {
        "/usr",
        "/lib",
        "/lib64",
        "/bin",
        "/sbin",
        "/etc",
        "/dev",
        "/proc",
        "/sys",
        NULL
    };
    for (int i = 0; readonly_dirs[i] != NULL; ++i) {
        err = add_path_rule(ruleset_fd, readonly_dirs[i], CODELOOP_LANDLOCK_FS_READ, false);
        if (err != 0) {
            close(ruleset_fd);
            return err;
        }
    }
    if (extra_ro_dirs) {
        for (int i = 0; extra_ro_dirs[i] != NULL; ++i) {
            err = add_path_rule(ruleset_fd, extra_ro_dirs[i], CODELOOP_LANDLOCK_FS_READ, false);
            if (err != 0) {
                close(ruleset_fd);
                return err;
            }
        }
    }

    // Required before restrict_self for unprivileged callers
    if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) < 0) {
        err = errno;
        close(ruleset_fd);
        return err;
    }
    if (landlock_restrict_self(ruleset_fd, 0) < 0) {
        err = errno;
        close(ruleset_fd);
        return err;
    }
    close(ruleset_fd);
    return 0;
#endif
}

} // namespace codeloop
