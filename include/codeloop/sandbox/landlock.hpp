/*
 * codeloop - Filesystem jail (Landlock)
 * 
 * Confines a freshly forked sandbox child to its ephemeral working
 * directory using the Linux Landlock LSM: read-write beneath that
 * directory, read/execute on system directories, nothing else.
 * 
 * Landlock is unprivileged and available since Linux 5.13. On older
 * kernels confine() reports ENOSYS/EOPNOTSUPP and the caller decides
 * whether to run unconfined.
 */
#ifndef codeloop_SANDBOX_LANDLOCK_HPP
#define codeloop_SANDBOX_LANDLOCK_HPP

namespace codeloop {

class FsJail {
public:
    // Probes the kernel once and caches the answer.
    static bool is_supported();

    // Restrict the calling process (and its future children).
    // 
    // Meant to run between fork() and exec() in a multithreaded parent:
    // it only issues syscalls, never allocates or logs. `extra_ro_dirs`
    // is a NULL-terminated list of additional read-only trees (for an
    // interpreter installed outside /usr), or NULL.
    // 
    // Returns 0 on success or an errno value.
    static int confine(const char* writable_dir, const char* const* extra_ro_dirs);

private:
    FsJail();
};

} // namespace codeloop

#endif // codeloop_SANDBOX_LANDLOCK_HPP
