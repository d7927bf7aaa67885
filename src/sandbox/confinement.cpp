/*
 * scriptdeck C++ - Process Confinement Implementation
 *
 * Landlock is unprivileged (no root/capabilities needed) and available
 * since Linux 5.13. Namespaces need unprivileged user namespaces to be
 * enabled. Both degrade gracefully; resource limits and no_new_privs do
 * not.
 */
#include <scriptdeck/sandbox/confinement.hpp>
#include <scriptdeck/core/logger.hpp>

#include <cstring>
#include <cerrno>
#include <csignal>
#include <sched.h>
#include <sys/resource.h>
#include <sys/prctl.h>
#include <unistd.h>
#include <fcntl.h>

// ============================================================================
// Landlock syscall wrappers (not in glibc until very recently)
// ============================================================================

#include <linux/landlock.h>
#include <sys/syscall.h>

#ifndef __NR_landlock_create_ruleset
#define __NR_landlock_create_ruleset 444
#endif
#ifndef __NR_landlock_add_rule
#define __NR_landlock_add_rule 445
#endif
#ifndef __NR_landlock_restrict_self
#define __NR_landlock_restrict_self 446
#endif

#ifndef LANDLOCK_CREATE_RULESET_VERSION
#define LANDLOCK_CREATE_RULESET_VERSION (1U << 0)
#endif
#ifndef LANDLOCK_ACCESS_FS_REFER
#define LANDLOCK_ACCESS_FS_REFER (1ULL << 13)
#endif

// Filesystem access rights of Landlock ABI v1
#define LANDLOCK_ACCESS_FS_V1 ( \
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

#define LANDLOCK_ACCESS_FS_READ_ONLY ( \
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

namespace scriptdeck {

static int landlock_abi_version() {
    int abi = landlock_create_ruleset(NULL, 0, LANDLOCK_CREATE_RULESET_VERSION);
    return abi < 0 ? 0 : abi;
}

Confinement::Confinement(const ConfinementOptions& options)
    : options_(options)
    , landlock_supported_(landlock_abi_version() > 0)
{
    if (options_.readonly_paths.empty()) {
        options_.readonly_paths = default_readonly_paths();
    }
}

std::vector<std::string> Confinement::default_readonly_paths() {
    std::vector<std::string> paths;
    paths.push_back("/usr");
    paths.push_back("/lib");
    paths.push_back("/lib64");
    return paths;
}

void Confinement::allow_path(const std::string& path) {
    if (report_.filesystem_restricted) return;
    for (size_t i = 0; i < options_.readonly_paths.size(); ++i) {
        if (options_.readonly_paths[i] == path) return;
    }
    options_.readonly_paths.push_back(path);
}

bool Confinement::apply_limit(int resource, uint64_t value, const char* name) {
    struct rlimit rl;
    rl.rlim_cur = static_cast<rlim_t>(value);
    rl.rlim_max = static_cast<rlim_t>(value);
    if (setrlimit(resource, &rl) != 0) {
        LOG_ERROR("[Confinement] setrlimit(%s, %llu) failed: %s",
                  name, static_cast<unsigned long long>(value), strerror(errno));
        return false;
    }
    return true;
}

bool Confinement::restrict_process() {
    bool ok = true;
    
    if (options_.memory_limit_mb > 0) {
        ok = apply_limit(RLIMIT_AS,
                         static_cast<uint64_t>(options_.memory_limit_mb) * 1024 * 1024,
                         "RLIMIT_AS") && ok;
    }
    if (options_.cpu_seconds > 0) {
        ok = apply_limit(RLIMIT_CPU, static_cast<uint64_t>(options_.cpu_seconds),
                         "RLIMIT_CPU") && ok;
    }
    if (options_.max_open_files > 0) {
        ok = apply_limit(RLIMIT_NOFILE, static_cast<uint64_t>(options_.max_open_files),
                         "RLIMIT_NOFILE") && ok;
    }
    if (options_.max_processes > 0) {
        ok = apply_limit(RLIMIT_NPROC, static_cast<uint64_t>(options_.max_processes),
                         "RLIMIT_NPROC") && ok;
    }
    ok = apply_limit(RLIMIT_FSIZE, 0, "RLIMIT_FSIZE") && ok;
    ok = apply_limit(RLIMIT_CORE, 0, "RLIMIT_CORE") && ok;
    report_.limits_applied = ok;
    
    // Oversized writes must fail with EFBIG rather than kill the worker
    signal(SIGXFSZ, SIG_IGN);
    
    if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) < 0) {
        LOG_ERROR("[Confinement] Failed to set no_new_privs: %s", strerror(errno));
        return false;
    }
    report_.no_new_privs = true;
    
    // Die with the supervisor. The parent may already be gone by now.
    if (prctl(PR_SET_PDEATHSIG, SIGKILL, 0, 0, 0) < 0) {
        LOG_ERROR("[Confinement] Failed to set parent-death signal: %s", strerror(errno));
        return false;
    }
    if (getppid() == 1) {
        LOG_ERROR("[Confinement] Supervisor exited before confinement completed");
        return false;
    }
    
    return ok;
}

bool Confinement::isolate_network() {
    if (unshare(CLONE_NEWUSER | CLONE_NEWNET) == 0) {
        report_.network_isolated = true;
        LOG_DEBUG("[Confinement] Entered private user + network namespace");
        return true;
    }
    
    int err = errno;
    if (unshare(CLONE_NEWNET) == 0) {
        report_.network_isolated = true;
        LOG_DEBUG("[Confinement] Entered private network namespace");
        return true;
    }
    
    LOG_WARN("[Confinement] Network namespace unavailable (%s). Network NOT isolated.",
             strerror(err));
    return false;
}

bool Confinement::restrict_filesystem() {
    if (!landlock_supported_) {
        LOG_WARN("[Confinement] Landlock not supported by this kernel. Filesystem NOT restricted.");
        return false;
    }
    
    // 1. Create a ruleset handling every FS access type the kernel knows
    struct landlock_ruleset_attr ruleset_attr;
    memset(&ruleset_attr, 0, sizeof(ruleset_attr));
    ruleset_attr.handled_access_fs = LANDLOCK_ACCESS_FS_V1;
    if (landlock_abi_version() >= 2) {
        ruleset_attr.handled_access_fs |= LANDLOCK_ACCESS_FS_REFER;
    }
    
    int ruleset_fd = landlock_create_ruleset(&ruleset_attr, sizeof(ruleset_attr), 0);
    if (ruleset_fd < 0) {
        LOG_ERROR("[Confinement] Failed to create Landlock ruleset: %s", strerror(errno));
        return false;
    }
    
    // 2. Read-only access to the interpreter and system libraries. Paths
    //    that do not exist on this system are skipped.
    for (size_t i = 0; i < options_.readonly_paths.size(); ++i) {
        const std::string& dir_path = options_.readonly_paths[i];
        int dir_fd = open(dir_path.c_str(), O_PATH | O_CLOEXEC);
        if (dir_fd < 0) {
            continue;
        }
        
        struct landlock_path_beneath_attr path_attr;
        memset(&path_attr, 0, sizeof(path_attr));
        path_attr.allowed_access = LANDLOCK_ACCESS_FS_READ_ONLY;
        path_attr.parent_fd = dir_fd;
        
        int ret = landlock_add_rule(ruleset_fd, LANDLOCK_RULE_PATH_BENEATH, &path_attr, 0);
        close(dir_fd);
        
        if (ret < 0) {
            LOG_WARN("[Confinement] Failed to add Landlock rule for '%s': %s",
                     dir_path.c_str(), strerror(errno));
        } else {
            LOG_DEBUG("[Confinement] Allowed R/O: %s", dir_path.c_str());
        }
    }
    
    // 3. no_new_privs is required before restrict_self
    if (!report_.no_new_privs) {
        if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) < 0) {
            LOG_ERROR("[Confinement] Failed to set no_new_privs: %s", strerror(errno));
            close(ruleset_fd);
            return false;
        }
        report_.no_new_privs = true;
    }
    
    // 4. Enforce the ruleset on this process and everything it spawns
    if (landlock_restrict_self(ruleset_fd, 0) < 0) {
        LOG_ERROR("[Confinement] Failed to restrict self: %s", strerror(errno));
        close(ruleset_fd);
        return false;
    }
    
    close(ruleset_fd);
    report_.filesystem_restricted = true;
    LOG_DEBUG("[Confinement] Landlock ruleset active, no write access anywhere");
    return true;
}

} // namespace scriptdeck
