#include "Privilege.h"
#include "Logging.h"
#include <cerrno>
#include <string>
#include <vector>
#include <unistd.h>
#ifdef SOCKREAP_HAVE_LIBCAP
#include <sys/capability.h>
#endif
#ifdef SOCKREAP_HAVE_SECCOMP
#include <seccomp.h>
#endif

namespace sockreap {

static void log_capabilities(const std::string& context) {
#ifdef SOCKREAP_HAVE_LIBCAP
    cap_t caps = cap_get_proc();
    if (!caps) {
        Logger::instance().warn("Failed to get current capabilities for " + context);
        return;
    }
    char* cap_text = cap_to_text(caps, nullptr);
    if (cap_text) {
        Logger::instance().debug("Capabilities " + context + ": " + std::string(cap_text));
        cap_free(cap_text);
    }
    cap_free(caps);
#else
    (void)context;
#endif
}

void drop_capabilities(bool keep_kill){
#ifdef SOCKREAP_HAVE_LIBCAP
    Logger::instance().info("Dropping capabilities (keep_kill=" + std::string(keep_kill ? "true" : "false") + ")");
    log_capabilities("before drop");

    cap_t caps = cap_get_proc();
    if(!caps){ Logger::instance().warn("cap_get_proc failed"); return; }
    cap_clear(caps);
    std::vector<cap_value_t> keep = { CAP_DAC_READ_SEARCH, CAP_SYS_PTRACE };
    if(keep_kill) keep.push_back(CAP_KILL);
    cap_set_flag(caps, CAP_PERMITTED, static_cast<int>(keep.size()), keep.data(), CAP_SET);
    cap_set_flag(caps, CAP_EFFECTIVE, static_cast<int>(keep.size()), keep.data(), CAP_SET);
    if(cap_set_proc(caps)!=0){
        // Unprivileged callers cannot raise what they never had; retry with an empty set.
        cap_clear(caps);
        if(cap_set_proc(caps)!=0) Logger::instance().error("cap_set_proc failed");
    } else {
        log_capabilities("after drop");
    }
    cap_free(caps);
#else
    (void)keep_kill;
    Logger::instance().info("Capability dropping not available (libcap not compiled in)");
#endif
}

bool has_kill_capability(){
#ifdef SOCKREAP_HAVE_LIBCAP
    cap_t caps = cap_get_proc();
    if(!caps) return geteuid() == 0;
    cap_flag_value_t v = CAP_CLEAR;
    bool ok = cap_get_flag(caps, CAP_KILL, CAP_EFFECTIVE, &v) == 0 && v == CAP_SET;
    cap_free(caps);
    return ok;
#else
    return geteuid() == 0;
#endif
}

bool apply_seccomp_profile(bool allow_signals){
#ifdef SOCKREAP_HAVE_SECCOMP
    static bool seccomp_applied = false;
    if (seccomp_applied) return true;

    Logger::instance().info(std::string("Applying seccomp profile (signals ") + (allow_signals ? "allowed" : "blocked") + ")");
    scmp_filter_ctx ctx = seccomp_init(SCMP_ACT_ERRNO(EPERM));
    if(!ctx) {
        Logger::instance().error("Failed to initialize seccomp context");
        return false;
    }
    auto allow=[&](int call){ return seccomp_rule_add(ctx, SCMP_ACT_ALLOW, call, 0)==0; };
    std::vector<int> calls = { SCMP_SYS(read), SCMP_SYS(write), SCMP_SYS(writev), SCMP_SYS(open), SCMP_SYS(openat),
                    SCMP_SYS(close), SCMP_SYS(fstat), SCMP_SYS(newfstatat), SCMP_SYS(statx), SCMP_SYS(lseek),
                    SCMP_SYS(mmap), SCMP_SYS(mprotect), SCMP_SYS(munmap), SCMP_SYS(mremap), SCMP_SYS(brk), SCMP_SYS(futex),
                    SCMP_SYS(rt_sigaction), SCMP_SYS(rt_sigprocmask), SCMP_SYS(getpid), SCMP_SYS(gettid),
                    SCMP_SYS(clock_gettime), SCMP_SYS(clock_nanosleep), SCMP_SYS(nanosleep), SCMP_SYS(getrandom),
                    SCMP_SYS(ioctl), SCMP_SYS(getdents64), SCMP_SYS(prlimit64), SCMP_SYS(access), SCMP_SYS(faccessat),
                    SCMP_SYS(readlink), SCMP_SYS(readlinkat), SCMP_SYS(getuid), SCMP_SYS(geteuid), SCMP_SYS(getgid),
                    SCMP_SYS(getegid), SCMP_SYS(uname), SCMP_SYS(sysinfo), SCMP_SYS(socket), SCMP_SYS(connect),
                    SCMP_SYS(capget), SCMP_SYS(exit), SCMP_SYS(exit_group) };
    if(allow_signals) calls.push_back(SCMP_SYS(kill));
    for(int c: calls){
        if(!allow(c)){
            Logger::instance().error("Failed to allow syscall " + std::to_string(c) + " in seccomp");
            seccomp_release(ctx);
            return false;
        }
    }
    if(seccomp_load(ctx)!=0){
        Logger::instance().error("Failed to load seccomp profile");
        seccomp_release(ctx);
        return false;
    }
    seccomp_release(ctx);
    seccomp_applied = true;
    return true;
#else
    (void)allow_signals;
    Logger::instance().info("Seccomp not available (not compiled in)");
    return false;
#endif
}

bool is_privilege_available(){
#ifdef SOCKREAP_HAVE_LIBCAP
    return true;
#else
    return false;
#endif
}

bool is_seccomp_available(){
#ifdef SOCKREAP_HAVE_SECCOMP
    return true;
#else
    return false;
#endif
}

}
