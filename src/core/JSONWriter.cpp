#include "JSONWriter.h"
#include "JsonUtil.h"
#include "BuildInfo.h"
#include <map>
#include <sstream>
#include <unistd.h>
#include <sys/utsname.h>

namespace sockreap {
namespace {

    struct CanonVal {
        enum Type { T_OBJ, T_ARR, T_STR, T_NUM } type = T_OBJ;
        std::map<std::string, CanonVal> obj;
        std::vector<CanonVal> arr;
        std::string str; // string text, or raw token for numbers / true / false / null
        CanonVal() = default;
        explicit CanonVal(Type t): type(t) {}
    };

    static void canon_emit(const CanonVal& v, std::ostream& os);
    using jsonutil::escape;

    static CanonVal str_val(const std::string& s){ CanonVal v{CanonVal::T_STR}; v.str = s; return v; }
    static CanonVal raw_val(const std::string& tok){ CanonVal v{CanonVal::T_NUM}; v.str = tok; return v; }
    static CanonVal num_val(long long n){ return raw_val(std::to_string(n)); }
    static CanonVal bool_val(bool b){ return raw_val(b ? "true" : "false"); }
    static CanonVal null_val(){ return raw_val("null"); }

    static void emit_array(const CanonVal& v, std::ostream& os) {
        os << '[';
        bool first = true;
        for (const auto& e : v.arr) {
            if (!first) os << ',';
            first = false;
            canon_emit(e, os);
        }
        os << ']';
    }

    static void emit_object(const CanonVal& v, std::ostream& os) {
        os << '{';
        bool first = true;
        for (const auto& kv : v.obj) {
            if (!first) os << ',';
            first = false;
            os << '"' << escape(kv.first) << '"' << ':';
            canon_emit(kv.second, os);
        }
        os << '}';
    }

    static void canon_emit(const CanonVal& v, std::ostream& os) {
        switch (v.type) {
            case CanonVal::T_STR: os << '"' << escape(v.str) << '"'; break;
            case CanonVal::T_NUM: os << v.str; break;
            case CanonVal::T_ARR: emit_array(v, os); break;
            case CanonVal::T_OBJ: emit_object(v, os); break;
        }
    }

    static CanonVal build_meta_object() {
        CanonVal meta{CanonVal::T_OBJ};
        struct utsname u{};
        if (uname(&u) == 0) {
            meta.obj["hostname"] = str_val(u.nodename);
            meta.obj["kernel"] = str_val(u.release);
        }
        meta.obj["euid"] = num_val(static_cast<long long>(geteuid()));
        meta.obj["tool_version"] = str_val(buildinfo::APP_VERSION);
        meta.obj["collected_at"] = str_val(jsonutil::time_to_iso(std::chrono::system_clock::now()));
        return meta;
    }

    static CanonVal endpoint_val(const IpAddress& addr, std::uint16_t port) {
        CanonVal ep{CanonVal::T_OBJ};
        ep.obj["address"] = str_val(addr.to_string());
        ep.obj["port"] = num_val(port);
        return ep;
    }

    static CanonVal record_val(const SocketRecord& r) {
        CanonVal o{CanonVal::T_OBJ};
        o.obj["protocol"] = str_val(to_string(r.protocol()));
        o.obj["local"] = endpoint_val(r.local_address(), r.local_port());
        auto ra = r.remote_address();
        o.obj["remote"] = ra ? endpoint_val(*ra, r.remote_port().value_or(0)) : null_val();
        auto st = r.connection_state();
        if (st) o.obj["state"] = str_val(to_string(*st));
        o.obj["pid"] = num_val(r.owning_pid());
        o.obj["process"] = str_val(r.owning_process_name());
        o.obj["uid"] = r.owning_uid() ? num_val(*r.owning_uid()) : null_val();
        o.obj["inode"] = r.kernel_inode() ? raw_val(std::to_string(*r.kernel_inode())) : null_val();
        return o;
    }

    static CanonVal records_val(const std::vector<SocketRecord>& records) {
        CanonVal arr{CanonVal::T_ARR};
        for (const auto& r : records) arr.arr.push_back(record_val(r));
        return arr;
    }

    static std::string pretty_print_json(const std::string& compact_json) {
        std::string out;
        out.reserve(compact_json.size() * 2);
        int depth = 0;
        bool in_string = false;
        bool esc = false;

        auto indent = [&](int d) {
            for (int i = 0; i < d; i++) out.append("  ");
        };

        for (size_t i = 0; i < compact_json.size(); ++i) {
            char c = compact_json[i];
            if (!in_string && (c == '}' || c == ']')) {
                // keep empty containers on one line
                char prev = out.empty() ? '\0' : out.back();
                if (prev == '{' || prev == '[') { out.push_back(c); depth--; continue; }
                out.push_back('\n');
                depth--;
                if (depth < 0) depth = 0;
                indent(depth);
                out.push_back(c);
                continue;
            }
            out.push_back(c);
            if (esc) { esc = false; continue; }
            if (c == '\\') { esc = true; continue; }
            if (c == '"') { in_string = !in_string; continue; }
            if (in_string) continue;

            switch (c) {
                case '{':
                case '[': {
                    char next = i + 1 < compact_json.size() ? compact_json[i + 1] : '\0';
                    depth++;
                    if (next == '}' || next == ']') break;
                    out.push_back('\n');
                    indent(depth);
                    break;
                }
                case ',':
                    out.push_back('\n');
                    indent(depth);
                    break;
                case ':':
                    out.push_back(' ');
                    break;
                default:
                    break;
            }
        }
        out.push_back('\n');
        return out;
    }

    static std::string render(const CanonVal& root, bool pretty) {
        std::ostringstream os;
        canon_emit(root, os);
        if (pretty) return pretty_print_json(os.str());
        return os.str() + "\n";
    }

}

std::string JSONWriter::write_sockets(const std::string& query, std::uint64_t generation, const std::vector<SocketRecord>& records) const {
    CanonVal root{CanonVal::T_OBJ};
    root.obj["meta"] = build_meta_object();
    root.obj["query"] = str_val(query);
    root.obj["generation"] = raw_val(std::to_string(generation));
    root.obj["count"] = num_val(static_cast<long long>(records.size()));
    root.obj["sockets"] = records_val(records);
    return render(root, pretty_);
}

std::string JSONWriter::write_view(const SocketIndexView& view, ViewMode mode) const {
    CanonVal root{CanonVal::T_OBJ};
    root.obj["meta"] = build_meta_object();
    root.obj["generation"] = raw_val(std::to_string(view.generation()));
    root.obj["count"] = num_val(static_cast<long long>(view.size()));
    root.obj["view"] = str_val(mode == ViewMode::Port ? "port" : "process");
    CanonVal groups{CanonVal::T_ARR};
    if (mode == ViewMode::Port) {
        for (auto port : view.all_ports()) {
            CanonVal g{CanonVal::T_OBJ};
            g.obj["port"] = num_val(port);
            g.obj["sockets"] = records_val(view.sockets_by_port(port));
            groups.arr.push_back(std::move(g));
        }
    } else {
        for (int pid : view.all_pids()) {
            auto recs = view.sockets_by_pid(pid);
            CanonVal g{CanonVal::T_OBJ};
            g.obj["pid"] = num_val(pid);
            g.obj["process"] = str_val(recs.empty() ? std::string(kUnknownProcess) : recs.front().owning_process_name());
            g.obj["sockets"] = records_val(recs);
            groups.arr.push_back(std::move(g));
        }
    }
    root.obj["groups"] = std::move(groups);
    return render(root, pretty_);
}

std::string JSONWriter::write_termination(const TerminationRequest& request, const std::vector<TerminationOutcome>& outcomes) const {
    CanonVal root{CanonVal::T_OBJ};
    root.obj["meta"] = build_meta_object();
    CanonVal req{CanonVal::T_OBJ};
    req.obj["target"] = str_val(request.target == TerminationRequest::Target::Port ? "port" : "pid");
    req.obj["value"] = num_val(request.value);
    req.obj["policy"] = str_val(to_string(request.policy));
    root.obj["request"] = std::move(req);
    CanonVal arr{CanonVal::T_ARR};
    size_t verified = 0;
    for (const auto& o : outcomes) {
        CanonVal v{CanonVal::T_OBJ};
        v.obj["pid"] = num_val(o.pid);
        v.obj["process"] = str_val(o.process_name);
        v.obj["requested_signal"] = str_val(signal_name(o.requested_signal));
        v.obj["delivered"] = bool_val(o.delivered);
        v.obj["verified_absent"] = bool_val(o.verified_absent);
        v.obj["error"] = o.error ? str_val(to_string(*o.error)) : null_val();
        v.obj["detail"] = str_val(o.detail);
        v.obj["final_state"] = str_val(to_string(o.final_state));
        CanonVal stages{CanonVal::T_ARR};
        for (const auto& s : o.stages) {
            CanonVal sv{CanonVal::T_OBJ};
            sv.obj["signal"] = str_val(signal_name(s.signal));
            sv.obj["delivered"] = bool_val(s.delivered);
            sv.obj["absent_after"] = bool_val(s.absent_after);
            stages.arr.push_back(std::move(sv));
        }
        v.obj["stages"] = std::move(stages);
        if (o.verified_absent) ++verified;
        arr.arr.push_back(std::move(v));
    }
    root.obj["outcomes"] = std::move(arr);
    root.obj["verified_absent"] = num_val(static_cast<long long>(verified));
    root.obj["total"] = num_val(static_cast<long long>(outcomes.size()));
    return render(root, pretty_);
}

std::string JSONWriter::write_details(const ProcessDetails& d, const std::vector<SocketRecord>& sockets) const {
    CanonVal root{CanonVal::T_OBJ};
    root.obj["meta"] = build_meta_object();
    CanonVal p{CanonVal::T_OBJ};
    p.obj["pid"] = num_val(d.pid);
    p.obj["ppid"] = num_val(d.ppid);
    p.obj["name"] = str_val(d.name);
    p.obj["state"] = str_val(std::string(1, d.state));
    p.obj["uid"] = d.uid ? num_val(*d.uid) : null_val();
    p.obj["user"] = d.user.empty() ? null_val() : str_val(d.user);
    p.obj["cmdline"] = str_val(d.cmdline);
    p.obj["exe"] = d.exe.empty() ? null_val() : str_val(d.exe);
    p.obj["rss_bytes"] = raw_val(std::to_string(d.rss_bytes));
    p.obj["threads"] = num_val(d.threads);
    p.obj["start_time"] = d.start_time ? str_val(jsonutil::time_to_iso(*d.start_time)) : null_val();
    p.obj["run_time_seconds"] = raw_val(std::to_string(d.run_time_seconds));
    p.obj["run_time"] = str_val(format_duration(d.run_time_seconds));
    std::ostringstream cpu;
    cpu.precision(2);
    cpu << std::fixed << d.cpu_percent;
    p.obj["cpu_percent"] = raw_val(cpu.str());
    p.obj["exe_sha256"] = d.exe_sha256.empty() ? null_val() : str_val(d.exe_sha256);
    root.obj["process"] = std::move(p);
    root.obj["sockets"] = records_val(sockets);
    return render(root, pretty_);
}

std::string JSONWriter::write_error(const Error& err) const {
    CanonVal root{CanonVal::T_OBJ};
    CanonVal e{CanonVal::T_OBJ};
    e.obj["kind"] = str_val(to_string(err.kind()));
    e.obj["message"] = str_val(err.what());
    root.obj["error"] = std::move(e);
    return render(root, pretty_);
}

}
