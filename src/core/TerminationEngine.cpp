#include "TerminationEngine.h"
#include "Logging.h"
#include <algorithm>
#include <cerrno>
#include <csignal>
#include <thread>
#include <unistd.h>

namespace sockreap {

const char* to_string(SignalPolicy p){
    return p == SignalPolicy::ForcefulOnly ? "forceful-only" : "graceful-then-forceful";
}

const char* to_string(TerminationState s){
    switch(s){
        case TerminationState::Pending: return "Pending";
        case TerminationState::SignalSent: return "SignalSent";
        case TerminationState::VerifiedTerminated: return "VerifiedTerminated";
        case TerminationState::StillAliveFailed: return "StillAliveFailed";
        case TerminationState::Denied: return "Denied";
    }
    return "Pending";
}

std::string signal_name(int signo){
    if(signo == SIGTERM) return "SIGTERM";
    if(signo == SIGKILL) return "SIGKILL";
    return "signal " + std::to_string(signo);
}

bool matches_process_name(const std::string& configured, const ProcessIdentity& ident){
    if(configured.empty()) return false;
    if(configured == ident.name || configured == ident.exe_name) return true;
    return ident.name.size() == kCommNameMax && configured.size() > kCommNameMax &&
           configured.compare(0, kCommNameMax, ident.name) == 0;
}

int PosixSignalSender::send(int pid, int signo){
    if(::kill(static_cast<pid_t>(pid), signo) == 0) return 0;
    return errno;
}

TerminationRequest TerminationRequest::for_pid(int pid, SignalPolicy policy, Confirmation c){
    TerminationRequest r;
    r.target = Target::Pid; r.value = pid; r.policy = policy; r.confirmation = c;
    return r;
}

TerminationRequest TerminationRequest::for_port(int port, SignalPolicy policy, Confirmation c){
    TerminationRequest r;
    r.target = Target::Port; r.value = port; r.policy = policy; r.confirmation = c;
    return r;
}

std::string TerminationRequest::describe() const {
    return (target == Target::Pid ? "PID " : "port ") + std::to_string(value);
}

TerminationEngine::Settings TerminationEngine::Settings::from_config(const Config& cfg){
    auto clamp = [](int ms){ return std::chrono::milliseconds(std::max(0, std::min(ms, kMaxWaitMs))); };
    Settings s;
    s.grace = clamp(cfg.grace_ms);
    s.kill_wait = clamp(cfg.kill_wait_ms);
    s.poll_interval = std::chrono::milliseconds(std::max(1, std::min(cfg.poll_interval_ms, 1000)));
    s.protected_pids = cfg.protected_pids;
    s.protected_names = cfg.protected_names;
    return s;
}

TerminationEngine::TerminationEngine(Session& session, SignalSender& sender, Settings settings, Sleeper sleeper)
    : session_(session), sender_(sender), settings_(std::move(settings)), sleep_(std::move(sleeper)) {
    if(settings_.self_pid == 0) settings_.self_pid = static_cast<int>(::getpid());
    if(!sleep_) sleep_ = [](std::chrono::milliseconds d){ std::this_thread::sleep_for(d); };
    // Every wait is bounded even when Settings were filled in by hand
    auto cap = std::chrono::milliseconds(kMaxWaitMs);
    settings_.grace = std::min(settings_.grace, cap);
    settings_.kill_wait = std::min(settings_.kill_wait, cap);
    if(settings_.poll_interval.count() <= 0) settings_.poll_interval = std::chrono::milliseconds(1);
}

std::vector<int> TerminationEngine::resolve_targets(const TerminationRequest& request){
    auto index = session_.index();
    if(request.target == TerminationRequest::Target::Port){
        if(request.value < 0 || request.value > 65535)
            throw Error(ErrorKind::InvalidArgument, "port " + std::to_string(request.value) + " is outside 0-65535");
        auto pids = index->pids_on_port(static_cast<std::uint16_t>(request.value));
        if(pids.empty())
            throw Error(ErrorKind::NotFound, "no socket on port " + std::to_string(request.value) +
                        " in index generation " + std::to_string(index->generation()));
        return pids;
    }
    if(!index->has_pid(request.value))
        throw Error(ErrorKind::NotFound, "PID " + std::to_string(request.value) + " owns no socket in index generation " +
                    std::to_string(index->generation()));
    return {request.value};
}

SafetyDecision TerminationEngine::safety_check(int pid) const {
    if(pid == 0) return SafetyDecision::deny("PID 0 is not a process: the socket owner could not be determined");
    if(pid < 0) return SafetyDecision::deny("PID " + std::to_string(pid) + " would signal a whole process group");
    if(pid == 1) return SafetyDecision::deny("PID 1 is the init process and is always protected");
    if(pid == settings_.self_pid) return SafetyDecision::deny("PID " + std::to_string(pid) + " is this sockreap process");
    if(std::find(settings_.protected_pids.begin(), settings_.protected_pids.end(), pid) != settings_.protected_pids.end())
        return SafetyDecision::deny("PID " + std::to_string(pid) + " is on the protected PID list");
    if(!settings_.protected_names.empty()){
        auto ident = session_.processes().lookup(pid);
        if(ident){
            for(const auto& name : settings_.protected_names){
                if(matches_process_name(name, *ident))
                    return SafetyDecision::deny("PID " + std::to_string(pid) + " (" + ident->name + ") matches protected process name '" + name + "'");
            }
        }
    }
    return SafetyDecision::allow();
}

std::string TerminationEngine::indexed_owner(int pid) const {
    auto records = session_.index()->sockets_by_pid(pid);
    if(records.empty() || records.front().owning_process_name() == kUnknownProcess) return {};
    return records.front().owning_process_name();
}

bool TerminationEngine::wait_gone(int pid, std::chrono::milliseconds budget){
    const auto& processes = session_.processes();
    if(!processes.exists(pid)) return true;
    auto remaining = budget;
    while(remaining.count() > 0){
        auto step = std::min(settings_.poll_interval, remaining);
        sleep_(step);
        remaining -= step;
        if(!processes.exists(pid)) return true;
    }
    return false;
}

// Returns true when the process is known to be gone after this stage.
bool TerminationEngine::run_stage(int pid, int signo, std::chrono::milliseconds wait, TerminationOutcome& out){
    out.requested_signal = signo;
    out.final_state = TerminationState::SignalSent;
    int err = sender_.send(pid, signo);
    SignalStage stage;
    stage.signal = signo;
    if(err == 0){
        stage.delivered = true;
        out.delivered = true;
        stage.absent_after = wait_gone(pid, wait);
        Logger::instance().debug("Sent " + signal_name(signo) + " to PID " + std::to_string(pid) +
                                 (stage.absent_after ? "; process exited" : "; process still present"));
        out.stages.push_back(stage);
        return stage.absent_after;
    }
    std::string what = "kill(" + std::to_string(pid) + ", " + signal_name(signo) + ")";
    if(err == ESRCH){
        stage.absent_after = true;
        out.stages.push_back(stage);
        // Gone between checks: idempotent success, only an error if nothing was ever delivered
        if(!out.delivered){
            out.error = ErrorKind::ProcessVanished;
            out.detail = "PID " + std::to_string(pid) + " exited before " + signal_name(signo) + " could be delivered";
        }
        return true;
    }
    out.error = err == EPERM ? ErrorKind::PermissionDenied : ErrorKind::SignalDeliveryFailed;
    out.detail = errno_message(what, err);
    stage.absent_after = !session_.processes().exists(pid);
    out.stages.push_back(stage);
    return stage.absent_after;
}

TerminationOutcome TerminationEngine::execute(int pid, SignalPolicy policy){
    TerminationOutcome out;
    out.pid = pid;
    const auto& processes = session_.processes();
    auto ident = processes.lookup(pid);
    out.process_name = ident && !ident->name.empty() ? ident->name : kUnknownProcess;
    const int first = policy == SignalPolicy::ForcefulOnly ? SIGKILL : SIGTERM;
    out.requested_signal = first;

    if(!processes.exists(pid)){
        out.error = ErrorKind::ProcessVanished;
        out.detail = "PID " + std::to_string(pid) + " exited before any signal was sent";
        out.verified_absent = true;
        out.final_state = TerminationState::VerifiedTerminated;
        return out;
    }

    // The PID may have been recycled since the index was built
    std::string owner = indexed_owner(pid);
    if(ident && !owner.empty() && !matches_process_name(owner, *ident)){
        out.process_name = owner;
        out.error = ErrorKind::ProcessVanished;
        out.detail = "PID " + std::to_string(pid) + " is now '" + ident->name + "', not the indexed owner '" + owner +
                     "'; no signal sent";
        out.verified_absent = true;
        out.final_state = TerminationState::VerifiedTerminated;
        Logger::instance().warn(out.detail);
        return out;
    }

    bool gone = run_stage(pid, first, first == SIGKILL ? settings_.kill_wait : settings_.grace, out);
    bool first_failed = out.error && *out.error != ErrorKind::ProcessVanished;
    if(!gone && !first_failed && policy == SignalPolicy::GracefulThenForceful){
        Logger::instance().info("PID " + std::to_string(pid) + " (" + out.process_name + ") ignored SIGTERM for " +
                                std::to_string(settings_.grace.count()) + "ms; escalating to SIGKILL");
        run_stage(pid, SIGKILL, settings_.kill_wait, out);
    }

    out.verified_absent = !processes.exists(pid);
    out.final_state = out.verified_absent ? TerminationState::VerifiedTerminated : TerminationState::StillAliveFailed;
    if(!out.verified_absent && out.detail.empty())
        out.detail = "PID " + std::to_string(pid) + " still present after " + signal_name(out.requested_signal);
    return out;
}

std::vector<TerminationOutcome> TerminationEngine::terminate(const TerminationRequest& request){
    if(!request.confirmation.given)
        throw Error(ErrorKind::NotConfirmed, "termination of " + request.describe() + " was not confirmed");
    auto pids = resolve_targets(request);
    Logger::instance().info("Terminating " + request.describe() + ": " + std::to_string(pids.size()) + " process(es), policy " +
                            to_string(request.policy));
    std::vector<TerminationOutcome> outcomes;
    outcomes.reserve(pids.size());
    for(int pid : pids){
        auto decision = safety_check(pid);
        if(!decision.allowed){
            TerminationOutcome denied;
            denied.pid = pid;
            auto ident = session_.processes().lookup(pid);
            denied.process_name = ident && !ident->name.empty() ? ident->name : kUnknownProcess;
            denied.requested_signal = request.policy == SignalPolicy::ForcefulOnly ? SIGKILL : SIGTERM;
            denied.error = ErrorKind::ProtectedTarget;
            denied.detail = decision.reason;
            denied.final_state = TerminationState::Denied;
            Logger::instance().warn("Refusing to signal " + decision.reason);
            outcomes.push_back(std::move(denied));
            continue;
        }
        auto outcome = execute(pid, request.policy);
        if(outcome.error && *outcome.error != ErrorKind::ProcessVanished)
            Logger::instance().warn(std::string(to_string(*outcome.error)) + ": " + outcome.detail);
        outcomes.push_back(std::move(outcome));
    }
    return outcomes;
}

}
