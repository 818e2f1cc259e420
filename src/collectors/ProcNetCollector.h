#pragma once
#include "../core/Collector.h"
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace sockreap {

// Reads the kernel socket tables under <proc_root>/net and attributes each
// socket inode to its owning processes through <proc_root>/<pid>/fd.
class ProcNetCollector : public SocketCollector {
public:
    struct Stats {
        std::size_t tables_read = 0;
        std::size_t lines_skipped = 0; // malformed lines
        std::size_t fd_dirs_denied = 0; // processes whose fd table was unreadable
        std::size_t unattributed = 0; // sockets with no owning PID found
    };

    explicit ProcNetCollector(std::string proc_root = "/proc", bool tcp = true, bool udp = true)
        : proc_root_(std::move(proc_root)), tcp_(tcp), udp_(udp) {}

    std::string name() const override { return "procnet"; }
    std::vector<RawSocket> collect() override;
    const Stats& stats() const { return stats_; }

    // Parses one data line of a /proc/net/{tcp,tcp6,udp,udp6} table.
    static bool parse_line(const std::string& line, Protocol proto, bool ipv6, RawSocket& out);
    // "0100007F" -> 127.0.0.1 (kernel prints each 32-bit word in host order)
    static bool decode_address(const std::string& hex, bool ipv6, IpAddress& out);

private:
    using InodeOwners = std::unordered_map<std::uint64_t, std::vector<int>>;
    InodeOwners build_inode_map();
    bool read_table(const std::string& file, Protocol proto, bool ipv6, const InodeOwners& owners, std::vector<RawSocket>& out);

    std::string proc_root_;
    bool tcp_;
    bool udp_;
    Stats stats_;
};

}
