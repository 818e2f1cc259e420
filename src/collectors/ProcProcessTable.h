#pragma once
#include "../core/Collector.h"
#include <string>

namespace sockreap {

// ProcessLookup backed by <proc_root>/<pid>/{comm,stat,status,exe,cmdline}.
class ProcProcessTable : public ProcessLookup {
public:
    explicit ProcProcessTable(std::string proc_root = "/proc");

    std::optional<ProcessIdentity> lookup(int pid) const override;
    bool exists(int pid) const override;

    // State letter from /proc/<pid>/stat ('R', 'S', 'Z', ...) or '\0' when unreadable.
    char state(int pid) const;
    const std::string& proc_root() const { return proc_root_; }

private:
    std::string pid_path(int pid, const char* leaf) const;

    std::string proc_root_;
    bool live_; // proc_root is the running kernel's procfs
};

// Last path component, without the kernel's " (deleted)" suffix.
std::string exe_basename(const std::string& path);

// Field after the "(comm)" group of a stat line; handles names containing ')' and spaces.
bool split_stat_line(const std::string& stat, std::string& comm, std::string& rest);

}
