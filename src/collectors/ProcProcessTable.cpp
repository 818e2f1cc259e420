#include "ProcProcessTable.h"
#include "../core/Utils.h"
#include <cerrno>
#include <csignal>
#include <sstream>
#include <unistd.h>

namespace sockreap {

std::string exe_basename(const std::string& path) {
    std::string p = path;
    const std::string deleted = " (deleted)";
    if (p.size() > deleted.size() && p.compare(p.size() - deleted.size(), deleted.size(), deleted) == 0)
        p.erase(p.size() - deleted.size());
    auto slash = p.rfind('/');
    return slash == std::string::npos ? p : p.substr(slash + 1);
}

bool split_stat_line(const std::string& stat, std::string& comm, std::string& rest) {
    auto open = stat.find('(');
    auto close = stat.rfind(')');
    if (open == std::string::npos || close == std::string::npos || close < open) return false;
    comm = stat.substr(open + 1, close - open - 1);
    rest = close + 2 <= stat.size() ? stat.substr(close + 2) : std::string();
    return true;
}

ProcProcessTable::ProcProcessTable(std::string proc_root)
    : proc_root_(std::move(proc_root)), live_(proc_root_ == "/proc") {}

std::string ProcProcessTable::pid_path(int pid, const char* leaf) const {
    return proc_root_ + "/" + std::to_string(pid) + "/" + leaf;
}

std::optional<ProcessIdentity> ProcProcessTable::lookup(int pid) const {
    if (pid <= 0) return std::nullopt;
    ProcessIdentity ident;
    std::string data;
    if (utils::read_file(pid_path(pid, "comm"), data, 256)) {
        ident.name = utils::trim(data);
    } else if (utils::read_file(pid_path(pid, "stat"), data, 4096)) {
        std::string rest;
        if (!split_stat_line(data, ident.name, rest)) return std::nullopt;
    } else {
        return std::nullopt;
    }
    if (utils::read_file(pid_path(pid, "status"), data)) {
        std::istringstream ss(data);
        std::string line;
        while (std::getline(ss, line)) {
            if (line.rfind("Uid:", 0) != 0) continue;
            std::istringstream fields(line.substr(4));
            long long real_uid = -1;
            if (fields >> real_uid && real_uid >= 0) ident.uid = static_cast<std::uint32_t>(real_uid);
            break;
        }
    }
    // comm is cut at 15 bytes; the executable keeps the full name
    char buf[4096];
    ssize_t n = ::readlink(pid_path(pid, "exe").c_str(), buf, sizeof(buf) - 1);
    if (n > 0) {
        ident.exe_name = exe_basename(std::string(buf, static_cast<std::size_t>(n)));
    } else if (utils::read_file(pid_path(pid, "cmdline"), data, 4096) && !data.empty()) {
        ident.exe_name = exe_basename(std::string(data.c_str()));
    }
    return ident;
}

char ProcProcessTable::state(int pid) const {
    std::string data, comm, rest;
    if (!utils::read_file(pid_path(pid, "stat"), data, 4096)) return '\0';
    if (!split_stat_line(data, comm, rest) || rest.empty()) return '\0';
    return rest[0];
}

bool ProcProcessTable::exists(int pid) const {
    if (pid <= 0) return false;
    char st = state(pid);
    if (st != '\0') return st != 'Z' && st != 'X' && st != 'x';
    if (!live_) return false;
    // hidepid= mounts hide other users' entries; ask the kernel directly
    if (::kill(static_cast<pid_t>(pid), 0) == 0) return true;
    return errno == EPERM;
}

}
