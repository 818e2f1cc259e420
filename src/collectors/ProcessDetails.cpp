#include "ProcessDetails.h"
#include "ProcProcessTable.h"
#include "../core/Errors.h"
#include "../core/Logging.h"
#include "../core/Utils.h"
#include <fcntl.h>
#include <pwd.h>
#include <sstream>
#include <unistd.h>
#include <vector>
#ifdef SOCKREAP_HAVE_OPENSSL
#include <openssl/evp.h>
#endif

namespace sockreap {

namespace {

std::vector<std::string> split_ws(const std::string& s) {
    std::istringstream ss(s);
    std::vector<std::string> out;
    std::string tok;
    while (ss >> tok) out.push_back(tok);
    return out;
}

std::uint64_t to_u64(const std::vector<std::string>& toks, size_t i) {
    if (i >= toks.size()) return 0;
    auto v = utils::parse_int(toks[i]);
    return v && *v > 0 ? static_cast<std::uint64_t>(*v) : 0;
}

std::optional<long long> read_btime(const std::string& proc_root) {
    std::string data;
    if (!utils::read_file(proc_root + "/stat", data, 1 << 20)) return std::nullopt;
    std::istringstream ss(data);
    std::string line;
    while (std::getline(ss, line)) {
        if (line.rfind("btime ", 0) == 0) return utils::parse_int(line.substr(6));
    }
    return std::nullopt;
}

std::optional<double> read_uptime(const std::string& proc_root) {
    std::string data;
    if (!utils::read_file(proc_root + "/uptime", data, 256)) return std::nullopt;
    std::istringstream ss(data);
    double up = 0;
    if (!(ss >> up)) return std::nullopt;
    return up;
}

}

std::string format_duration(std::uint64_t secs) {
    std::uint64_t days = secs / 86400;
    std::uint64_t hours = (secs % 86400) / 3600;
    std::uint64_t minutes = (secs % 3600) / 60;
    std::uint64_t seconds = secs % 60;
    std::string s = std::to_string(seconds) + "s";
    if (days == 0 && hours == 0 && minutes == 0) return s;
    s = std::to_string(minutes) + "m " + s;
    if (days == 0 && hours == 0) return s;
    s = std::to_string(hours) + "h " + s;
    if (days == 0) return s;
    return std::to_string(days) + "d " + s;
}

std::string sha256_file(const std::string& path) {
#ifdef SOCKREAP_HAVE_OPENSSL
    int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd == -1) return "";
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        close(fd);
        return "";
    }
    std::string hex;
    if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1) {
        unsigned char buf[8192];
        ssize_t n;
        bool ok = true;
        while ((n = read(fd, buf, sizeof(buf))) != 0) {
            if (n < 0) { ok = false; break; }
            if (EVP_DigestUpdate(ctx, buf, static_cast<size_t>(n)) != 1) { ok = false; break; }
        }
        unsigned char md[EVP_MAX_MD_SIZE];
        unsigned int mdlen = 0;
        if (ok && EVP_DigestFinal_ex(ctx, md, &mdlen) == 1) {
            static const char* hx = "0123456789abcdef";
            for (unsigned i = 0; i < mdlen; i++) { hex.push_back(hx[md[i] >> 4]); hex.push_back(hx[md[i] & 0xF]); }
        }
    }
    EVP_MD_CTX_free(ctx);
    close(fd);
    return hex;
#else
    (void)path;
    return "";
#endif
}

ProcessDetails describe_process(int pid, const std::string& proc_root, bool hash_exe) {
    std::string base = proc_root + "/" + std::to_string(pid);
    std::string stat;
    if (pid <= 0 || !utils::read_file(base + "/stat", stat, 4096)) {
        throw Error(ErrorKind::NotFound, "process " + std::to_string(pid) + " does not exist");
    }
    ProcessDetails d;
    d.pid = pid;
    std::string rest;
    if (!split_stat_line(stat, d.name, rest)) {
        throw Error(ErrorKind::NotFound, "process " + std::to_string(pid) + " has an unparsable stat entry");
    }
    // rest starts at field 3 (state)
    auto f = split_ws(rest);
    if (!f.empty() && !f[0].empty()) d.state = f[0][0];
    d.ppid = static_cast<int>(to_u64(f, 1));
    std::uint64_t utime = to_u64(f, 11), stime = to_u64(f, 12);
    d.threads = static_cast<long>(to_u64(f, 17));
    std::uint64_t start_ticks = to_u64(f, 19);
    long page = sysconf(_SC_PAGESIZE);
    d.rss_bytes = to_u64(f, 21) * static_cast<std::uint64_t>(page > 0 ? page : 4096);

    ProcProcessTable table(proc_root);
    if (auto ident = table.lookup(pid)) {
        if (!ident->name.empty()) d.name = ident->name;
        d.uid = ident->uid;
    }
    if (d.uid) {
        if (auto* pw = getpwuid(*d.uid); pw) d.user = pw->pw_name;
    }

    std::string raw;
    if (utils::read_file(base + "/cmdline", raw)) {
        for (char c : raw) d.cmdline.push_back(c == '\0' ? ' ' : c);
        d.cmdline = utils::trim(d.cmdline);
    }
    char exe_buf[4096];
    ssize_t n = readlink((base + "/exe").c_str(), exe_buf, sizeof(exe_buf) - 1);
    if (n > 0) { exe_buf[n] = '\0'; d.exe = exe_buf; }

    long hz = sysconf(_SC_CLK_TCK);
    double start_secs = hz > 0 ? static_cast<double>(start_ticks) / hz : 0.0;
    if (auto btime = read_btime(proc_root)) {
        d.start_time = std::chrono::system_clock::time_point(
            std::chrono::seconds(*btime + static_cast<long long>(start_secs)));
    }
    if (auto up = read_uptime(proc_root); up && *up >= start_secs) {
        double run = *up - start_secs;
        d.run_time_seconds = static_cast<std::uint64_t>(run);
        if (run > 0 && hz > 0) d.cpu_percent = 100.0 * static_cast<double>(utime + stime) / hz / run;
    }

    if (hash_exe) {
        if (d.exe.empty()) {
            Logger::instance().warn("Cannot hash executable of PID " + std::to_string(pid) + ": exe link unreadable");
        } else {
            d.exe_sha256 = sha256_file(base + "/exe");
#ifndef SOCKREAP_HAVE_OPENSSL
            Logger::instance().warn("Executable hashing not available (OpenSSL not compiled in)");
#endif
        }
    }
    return d;
}

}
