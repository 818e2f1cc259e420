// Linux privilege & sandbox helpers (best-effort; compile-time gated)
#pragma once

namespace sockreap {

// Clears every capability except CAP_DAC_READ_SEARCH and CAP_SYS_PTRACE
// (reading other users' /proc/<pid>/fd), plus CAP_KILL when keep_kill is set.
void drop_capabilities(bool keep_kill);
// True when the effective set carries CAP_KILL (or we run as euid 0 without libcap).
bool has_kill_capability();
// Installs a syscall allowlist. kill(2) is only permitted with allow_signals.
bool apply_seccomp_profile(bool allow_signals);
bool is_privilege_available();
bool is_seccomp_available();

}
