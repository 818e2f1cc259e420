#include "core/ArgumentParser.h"
#include "core/ConfigValidator.h"
#include "core/Errors.h"
#include "core/JSONWriter.h"
#include "core/Logging.h"
#include "core/Privilege.h"
#include "core/Session.h"
#include "core/TerminationEngine.h"
#include "core/TextFormatter.h"
#include "collectors/ProcNetCollector.h"
#include "collectors/ProcProcessTable.h"
#include "collectors/ProcessDetails.h"
#include <cctype>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <unistd.h>

using namespace sockreap;

namespace {

enum ExitCode {
    kExitOk = 0,
    kExitUnverified = 1,
    kExitUsage = 2,
    kExitCollection = 3,
    kExitNotFound = 4,
    kExitSeccomp = 5,
    kExitDeclined = 6
};

int exit_code_for(ErrorKind kind){
    switch(kind){
        case ErrorKind::CollectionFailed: return kExitCollection;
        case ErrorKind::NotFound: return kExitNotFound;
        case ErrorKind::NotConfirmed: return kExitDeclined;
        case ErrorKind::InvalidArgument: return kExitUsage;
        default: return kExitUnverified;
    }
}

SocketPredicate listing_filter(const Config& cfg){
    std::vector<SocketPredicate> preds;
    if(cfg.protocol == "tcp") preds.push_back(predicates::protocol_is(Protocol::TCP));
    else if(cfg.protocol == "udp") preds.push_back(predicates::protocol_is(Protocol::UDP));
    if(!cfg.states.empty()){
        std::vector<TcpState> states;
        for(const auto& s : cfg.states) if(auto st = parse_tcp_state(s)) states.push_back(*st);
        preds.push_back(predicates::state_in(std::move(states)));
    }
    if(cfg.listen_only) preds.push_back(predicates::listening());
    return predicates::all_of(std::move(preds));
}

// Interactive y/N prompt on the controlling terminal. Anything else is a refusal.
bool ask_confirmation(const std::string& review){
    std::cerr << review;
    if(!isatty(STDIN_FILENO)){
        Logger::instance().warn("stdin is not a terminal and --yes was not given; not terminating");
        return false;
    }
    std::cerr << "Proceed? [y/N] " << std::flush;
    std::string answer;
    if(!std::getline(std::cin, answer)) return false;
    for(auto& c : answer) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return answer == "y" || answer == "yes";
}

int run_kill(const Config& cfg, Session& session, std::ostream& out, const JSONWriter& writer){
    PosixSignalSender sender;
    TerminationEngine engine(session, sender, TerminationEngine::Settings::from_config(cfg));
    SignalPolicy policy = cfg.force ? SignalPolicy::ForcefulOnly : SignalPolicy::GracefulThenForceful;
    TerminationRequest request = cfg.target_port != -1 ? TerminationRequest::for_port(cfg.target_port, policy)
                                                        : TerminationRequest::for_pid(cfg.target_pid, policy);

    bool confirmed = cfg.assume_yes;
    if(!confirmed){
        auto pids = engine.resolve_targets(request);
        std::vector<SafetyDecision> decisions;
        for(int pid : pids) decisions.push_back(engine.safety_check(pid));
        confirmed = ask_confirmation(text::format_targets(request, pids, *session.index(), decisions));
    }
    if(confirmed) request.confirmation = Confirmation::granted();

    auto outcomes = engine.terminate(request);
    if(cfg.json) out << writer.write_termination(request, outcomes);
    else out << text::format_outcomes(outcomes);

    bool all_gone = true;
    bool permission_denied = false;
    for(const auto& o : outcomes){
        if(!o.verified_absent) all_gone = false;
        if(o.error && *o.error == ErrorKind::PermissionDenied) permission_denied = true;
    }
    if(permission_denied && !has_kill_capability())
        Logger::instance().warn("Signals were refused; rerun as the process owner or with CAP_KILL");
    return all_gone ? kExitOk : kExitUnverified;
}

int run_command(const Config& cfg, Session& session, std::ostream& out){
    JSONWriter writer(cfg.pretty);
    switch(cfg.command){
        case Command::List: {
            auto view = session.index()->filter(listing_filter(cfg));
            if(cfg.json) out << writer.write_view(view, cfg.view);
            else out << text::format_view(view, cfg.view);
            return kExitOk;
        }
        case Command::Port: {
            auto index = session.index();
            auto port = static_cast<std::uint16_t>(cfg.target_port);
            if(!index->has_port(port))
                throw Error(ErrorKind::NotFound, "no socket on port " + std::to_string(cfg.target_port));
            auto recs = index->sockets_by_port(port);
            if(cfg.json) out << writer.write_sockets("port " + std::to_string(cfg.target_port), index->generation(), recs);
            else out << text::format_records(recs);
            return kExitOk;
        }
        case Command::Pid: {
            auto index = session.index();
            if(!index->has_pid(cfg.target_pid))
                throw Error(ErrorKind::NotFound, "PID " + std::to_string(cfg.target_pid) + " owns no socket");
            auto recs = index->sockets_by_pid(cfg.target_pid);
            if(cfg.json) out << writer.write_sockets("pid " + std::to_string(cfg.target_pid), index->generation(), recs);
            else out << text::format_records(recs);
            return kExitOk;
        }
        case Command::Details: {
            auto details = describe_process(cfg.target_pid, cfg.proc_root, cfg.hash_exe);
            std::vector<SocketRecord> sockets;
            try {
                sockets = session.index()->sockets_by_pid(cfg.target_pid);
            } catch(const Error& e){
                Logger::instance().warn(std::string("Socket list unavailable: ") + e.what());
            }
            if(cfg.json) out << writer.write_details(details, sockets);
            else out << text::format_details(details, sockets);
            return kExitOk;
        }
        case Command::Kill:
            return run_kill(cfg, session, out, writer);
    }
    return kExitOk;
}

}

int main(int argc, char** argv) {
    Logger::instance().set_level(LogLevel::Info);
    Config cfg;
    ArgumentParser parser;
    try {
        if(!parser.parse(argc, argv, cfg)) return kExitOk;
    } catch(const std::invalid_argument& e){
        std::cerr << e.what() << "\n";
        parser.print_help();
        return kExitUsage;
    }

    ConfigValidator validator;
    if(!validator.validate(cfg) || !validator.load_external_files(cfg)) return kExitUsage;
    LogLevel lvl = LogLevel::Info;
    parse_log_level(cfg.log_level, lvl);
    Logger::instance().set_level(lvl);

    const bool signals = cfg.command == Command::Kill;
    if(cfg.drop_priv) drop_capabilities(signals);
    if(cfg.seccomp){
        if(!apply_seccomp_profile(signals)){
            Logger::instance().error("Failed to apply seccomp profile");
            if(cfg.seccomp_strict){
                Logger::instance().error("Exiting due to --seccomp-strict");
                return kExitSeccomp;
            }
        }
    }

    std::ofstream file;
    if(!cfg.output_file.empty()){
        file.open(cfg.output_file);
        if(!file){
            std::cerr << "Failed to open output file: " << cfg.output_file << "\n";
            return kExitUsage;
        }
    }
    std::ostream& out = cfg.output_file.empty() ? std::cout : file;

    ProcNetCollector collector(cfg.proc_root, cfg.protocol != "udp", cfg.protocol != "tcp");
    ProcProcessTable processes(cfg.proc_root);
    Session session(collector, processes);

    int rc = kExitOk;
    try {
        rc = run_command(cfg, session, out);
    } catch(const Error& e){
        Logger::instance().error(std::string(to_string(e.kind())) + ": " + e.what());
        if(cfg.json) out << JSONWriter(cfg.pretty).write_error(e);
        rc = exit_code_for(e.kind());
    }
    out.flush();
    if(!out){
        std::cerr << "Failed to write output\n";
        return kExitUnverified;
    }
    return rc;
}
