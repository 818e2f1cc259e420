#include "ProcNetCollector.h"
#include "../core/Errors.h"
#include "../core/Logging.h"
#include "../core/Utils.h"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <dirent.h>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace sockreap {

namespace {

// socket:[12345] -> 12345
bool parse_socket_link(const char* target, std::uint64_t& inode) {
    static const char prefix[] = "socket:[";
    if (strncmp(target, prefix, sizeof(prefix) - 1) != 0) return false;
    const char* start = target + sizeof(prefix) - 1;
    char* end = nullptr;
    errno = 0;
    unsigned long long v = strtoull(start, &end, 10);
    if (errno != 0 || end == start || *end != ']') return false;
    inode = v;
    return true;
}

bool parse_hex(const std::string& s, unsigned long& out) {
    if (s.empty()) return false;
    char* end = nullptr;
    errno = 0;
    out = strtoul(s.c_str(), &end, 16);
    return errno == 0 && *end == '\0';
}

// "0100007F:1F90" -> address + port
bool parse_endpoint(const std::string& tok, bool ipv6, Endpoint& ep) {
    auto colon = tok.find(':');
    if (colon == std::string::npos) return false;
    unsigned long port = 0;
    if (!parse_hex(tok.substr(colon + 1), port) || port > 0xFFFF) return false;
    if (!ProcNetCollector::decode_address(tok.substr(0, colon), ipv6, ep.address)) return false;
    ep.port = static_cast<std::uint16_t>(port);
    return true;
}

}

bool ProcNetCollector::decode_address(const std::string& hex, bool ipv6, IpAddress& out) {
    const size_t words = ipv6 ? 4 : 1;
    if (hex.size() != words * 8) return false;
    IpAddress ip;
    ip.family = ipv6 ? IpAddress::Family::V6 : IpAddress::Family::V4;
    for (size_t w = 0; w < words; ++w) {
        unsigned long v = 0;
        if (!parse_hex(hex.substr(w * 8, 8), v)) return false;
        std::uint32_t word = static_cast<std::uint32_t>(v);
        std::memcpy(ip.bytes.data() + w * 4, &word, sizeof(word));
    }
    out = ip;
    return true;
}

bool ProcNetCollector::parse_line(const std::string& line, Protocol proto, bool ipv6, RawSocket& out) {
    // sl local_address rem_address st tx:rx tr:tm retrnsmt uid timeout inode ...
    std::istringstream ss(line);
    std::vector<std::string> tokens;
    std::string tok;
    while (ss >> tok && tokens.size() < 10) tokens.push_back(tok);
    if (tokens.size() < 10) return false;
    if (tokens[0].empty() || tokens[0].back() != ':') return false;

    RawSocket raw;
    raw.protocol = proto;
    Endpoint remote;
    if (!parse_endpoint(tokens[1], ipv6, raw.local)) return false;
    if (!parse_endpoint(tokens[2], ipv6, remote)) return false;
    if (!(remote.port == 0 && remote.address.is_unspecified())) raw.remote = remote;

    unsigned long st = 0;
    if (!parse_hex(tokens[3], st)) return false;
    if (proto == Protocol::TCP) raw.state = tcp_state_from_code(static_cast<unsigned>(st));

    if (auto uid = utils::parse_int(tokens[7]); uid && *uid >= 0) raw.uid = static_cast<std::uint32_t>(*uid);
    if (auto inode = utils::parse_int(tokens[9]); inode && *inode > 0) raw.inode = static_cast<std::uint64_t>(*inode);
    out = raw;
    return true;
}

ProcNetCollector::InodeOwners ProcNetCollector::build_inode_map() {
    InodeOwners owners;
    DIR* dir = opendir(proc_root_.c_str());
    if (!dir) {
        throw Error(ErrorKind::CollectionFailed, errno_message("cannot open " + proc_root_, errno));
    }
    struct dirent* entry;
    while ((entry = readdir(dir)) != nullptr) {
        int pid;
        if (!utils::is_valid_pid(entry->d_name, &pid)) continue;
        std::string fd_path = proc_root_ + "/" + entry->d_name + "/fd";
        DIR* fd_dir = opendir(fd_path.c_str());
        if (!fd_dir) {
            if (errno == EACCES || errno == EPERM) ++stats_.fd_dirs_denied;
            continue; // exited or not ours
        }
        struct dirent* fd_entry;
        while ((fd_entry = readdir(fd_dir)) != nullptr) {
            if (fd_entry->d_name[0] == '.') continue;
            std::string link = fd_path + "/" + fd_entry->d_name;
            char target[128];
            ssize_t len = readlink(link.c_str(), target, sizeof(target) - 1);
            if (len <= 0) continue;
            target[len] = '\0';
            std::uint64_t inode;
            if (!parse_socket_link(target, inode)) continue;
            auto& pids = owners[inode];
            // a process holding the same socket on several fds counts once
            if (pids.empty() || pids.back() != pid) pids.push_back(pid);
        }
        closedir(fd_dir);
    }
    closedir(dir);
    return owners;
}

bool ProcNetCollector::read_table(const std::string& file, Protocol proto, bool ipv6,
                                  const InodeOwners& owners, std::vector<RawSocket>& out) {
    std::string path = proc_root_ + "/net/" + file;
    std::ifstream in(path);
    if (!in) {
        if (errno == ENOENT) Logger::instance().debug("Socket table not present: " + path);
        else Logger::instance().warn(errno_message("Cannot read socket table " + path, errno));
        return false;
    }
    std::string line;
    bool header = true;
    while (std::getline(in, line)) {
        if (header) { header = false; continue; }
        if (utils::trim(line).empty()) continue;
        RawSocket raw;
        if (!parse_line(line, proto, ipv6, raw)) {
            ++stats_.lines_skipped;
            Logger::instance().trace("Unparsed line in " + path + ": " + line);
            continue;
        }
        auto it = raw.inode ? owners.find(*raw.inode) : owners.end();
        if (it == owners.end()) {
            ++stats_.unattributed;
            out.push_back(raw);
            continue;
        }
        for (int pid : it->second) {
            RawSocket owned = raw;
            owned.pid = pid;
            out.push_back(owned);
        }
    }
    ++stats_.tables_read;
    return true;
}

std::vector<RawSocket> ProcNetCollector::collect() {
    stats_ = Stats{};
    InodeOwners owners = build_inode_map();
    std::vector<RawSocket> out;
    struct Table { const char* file; Protocol proto; bool ipv6; bool enabled; };
    const Table tables[] = {
        {"tcp", Protocol::TCP, false, tcp_}, {"tcp6", Protocol::TCP, true, tcp_},
        {"udp", Protocol::UDP, false, udp_}, {"udp6", Protocol::UDP, true, udp_}
    };
    size_t wanted = 0;
    for (const auto& t : tables) {
        if (!t.enabled) continue;
        ++wanted;
        read_table(t.file, t.proto, t.ipv6, owners, out);
    }
    if (wanted > 0 && stats_.tables_read == 0) {
        throw Error(ErrorKind::CollectionFailed, "no socket table under " + proc_root_ + "/net could be read");
    }
    if (stats_.fd_dirs_denied > 0) {
        Logger::instance().warn(std::to_string(stats_.fd_dirs_denied) +
                                " process fd tables were unreadable; their sockets are listed as PID 0 (unknown). "
                                "Run as root or with CAP_SYS_PTRACE for full attribution");
    }
    Logger::instance().debug("Collected " + std::to_string(out.size()) + " socket observations from " +
                             std::to_string(stats_.tables_read) + " tables (" + std::to_string(stats_.lines_skipped) +
                             " malformed lines skipped)");
    return out;
}

}
