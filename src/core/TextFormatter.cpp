#include "TextFormatter.h"
#include "JsonUtil.h"
#include <iomanip>
#include <sstream>

namespace sockreap {
namespace text {

std::string format_endpoint(const IpAddress& addr, std::uint16_t port){
    if(addr.family == IpAddress::Family::V6) return "[" + addr.to_string() + "]:" + std::to_string(port);
    return addr.to_string() + ":" + std::to_string(port);
}

static std::string record_line(const SocketRecord& r){
    std::string line = r.summary() + "  " + format_endpoint(r.local_address(), r.local_port());
    auto ra = r.remote_address();
    line += " -> " + (ra ? format_endpoint(*ra, r.remote_port().value_or(0)) : std::string("*"));
    return line;
}

std::string format_records(const std::vector<SocketRecord>& records){
    std::ostringstream os;
    for(const auto& r : records) os << record_line(r) << "\n";
    return os.str();
}

std::string format_view(const SocketIndexView& view, ViewMode mode){
    std::ostringstream os;
    os << "Pid:Port -- Name -- Status -- Protocol (generation " << view.generation() << ", " << view.size() << " sockets)\n";
    if(mode == ViewMode::Port){
        for(auto port : view.all_ports()){
            auto recs = view.sockets_by_port(port);
            os << "Port " << port << " (" << recs.size() << (recs.size() == 1 ? " socket" : " sockets") << ")\n";
            for(const auto& r : recs) os << "  " << record_line(r) << "\n";
        }
    } else {
        for(int pid : view.all_pids()){
            auto recs = view.sockets_by_pid(pid);
            os << "PID " << pid << " " << (recs.empty() ? kUnknownProcess : recs.front().owning_process_name().c_str());
            if(!recs.empty() && recs.front().owning_uid()) os << " (uid " << *recs.front().owning_uid() << ")";
            os << "\n";
            for(const auto& r : recs) os << "  " << record_line(r) << "\n";
        }
    }
    return os.str();
}

std::string format_targets(const TerminationRequest& request, const std::vector<int>& pids,
                           const SocketIndex& index, const std::vector<SafetyDecision>& decisions){
    std::ostringstream os;
    os << "About to terminate " << request.describe() << " (" << to_string(request.policy) << "):\n";
    for(size_t i=0;i<pids.size();++i){
        auto recs = index.sockets_by_pid(pids[i]);
        os << "  PID " << pids[i] << " " << (recs.empty() ? kUnknownProcess : recs.front().owning_process_name().c_str())
           << ", " << recs.size() << (recs.size() == 1 ? " socket" : " sockets");
        if(i < decisions.size() && !decisions[i].allowed) os << "  [protected: " << decisions[i].reason << "]";
        os << "\n";
    }
    return os.str();
}

std::string format_outcomes(const std::vector<TerminationOutcome>& outcomes){
    std::ostringstream os;
    for(const auto& o : outcomes){
        os << "PID " << o.pid << " (" << o.process_name << "): " << to_string(o.final_state);
        for(const auto& s : o.stages){
            os << " | " << signal_name(s.signal) << (s.delivered ? " delivered" : " not delivered")
               << (s.absent_after ? ", gone" : ", alive");
        }
        if(o.error) os << " | " << to_string(*o.error);
        if(!o.detail.empty()) os << ": " << o.detail;
        os << "\n";
    }
    return os.str();
}

std::string format_details(const ProcessDetails& d, const std::vector<SocketRecord>& sockets){
    std::ostringstream os;
    os << "Process " << d.pid << " (" << d.name << ")\n";
    os << "  State:        " << d.state << "\n";
    os << "  Parent PID:   " << d.ppid << "\n";
    if(d.uid) os << "  User:         " << (d.user.empty() ? std::to_string(*d.uid) : d.user + " (" + std::to_string(*d.uid) + ")") << "\n";
    os << "  Command:      " << (d.cmdline.empty() ? "[" + d.name + "]" : d.cmdline) << "\n";
    if(!d.exe.empty()) os << "  Executable:   " << d.exe << "\n";
    if(!d.exe_sha256.empty()) os << "  SHA256:       " << d.exe_sha256 << "\n";
    os << "  Memory usage: " << d.rss_bytes << " bytes\n";
    os << "  CPU usage:    " << std::fixed << std::setprecision(2) << d.cpu_percent << "%\n";
    os << "  Threads:      " << d.threads << "\n";
    os << "  Run time:     " << format_duration(d.run_time_seconds) << "\n";
    if(d.start_time) os << "  Start time:   " << jsonutil::time_to_iso(*d.start_time) << "\n";
    os << "  Sockets:      " << sockets.size() << "\n";
    for(const auto& r : sockets) os << "    " << record_line(r) << "\n";
    return os.str();
}

}
}
