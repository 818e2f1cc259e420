#pragma once
#include "Config.h"
#include "Errors.h"
#include "Session.h"
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace sockreap {

enum class SignalPolicy { GracefulThenForceful, ForcefulOnly };

enum class TerminationState { Pending, SignalSent, VerifiedTerminated, StillAliveFailed, Denied };

const char* to_string(SignalPolicy p);
const char* to_string(TerminationState s);
// "SIGTERM", "SIGKILL", or "signal N"
std::string signal_name(int signo);

// Longest name /proc/<pid>/comm reports (TASK_COMM_LEN - 1).
constexpr std::size_t kCommNameMax = 15;

// True when a configured process name denotes this process: equal to comm,
// a longer name whose first 15 bytes equal a full-length comm, or equal to
// the executable's basename.
bool matches_process_name(const std::string& configured, const ProcessIdentity& ident);

// Delivers a signal; returns 0 on success or the errno of the failure.
class SignalSender {
public:
    virtual ~SignalSender() = default;
    virtual int send(int pid, int signo) = 0;
};

class PosixSignalSender : public SignalSender {
public:
    int send(int pid, int signo) override;
};

// Set by the presentation layer once the operator has reviewed the targets.
struct Confirmation {
    bool given = false;
    static Confirmation granted() { return Confirmation{true}; }
};

struct TerminationRequest {
    enum class Target { Pid, Port };
    Target target = Target::Pid;
    int value = 0;
    SignalPolicy policy = SignalPolicy::GracefulThenForceful;
    Confirmation confirmation;

    static TerminationRequest for_pid(int pid, SignalPolicy policy, Confirmation c = {});
    static TerminationRequest for_port(int port, SignalPolicy policy, Confirmation c = {});
    std::string describe() const; // "PID 42" / "port 8080"
};

struct SafetyDecision {
    bool allowed = true;
    std::string reason; // verbatim denial reason when !allowed

    static SafetyDecision allow() { return {}; }
    static SafetyDecision deny(std::string why) { return SafetyDecision{false, std::move(why)}; }
};

struct SignalStage {
    int signal = 0;
    bool delivered = false;
    bool absent_after = false; // process gone when this stage's wait ended
};

struct TerminationOutcome {
    int pid = 0;
    std::string process_name;
    int requested_signal = 0; // last signal attempted (or that would have been)
    bool delivered = false; // at least one signal reached the process
    bool verified_absent = false; // result of the final existence check
    std::optional<ErrorKind> error;
    std::string detail;
    TerminationState final_state = TerminationState::Pending;
    std::vector<SignalStage> stages;
};

class TerminationEngine {
public:
    struct Settings {
        std::chrono::milliseconds grace{500};
        std::chrono::milliseconds kill_wait{500};
        std::chrono::milliseconds poll_interval{25};
        std::vector<int> protected_pids;
        std::vector<std::string> protected_names;
        int self_pid = 0; // 0 = getpid()

        static Settings from_config(const Config& cfg);
    };
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    TerminationEngine(Session& session, SignalSender& sender, Settings settings, Sleeper sleeper = {});

    // Distinct PIDs for the request in the session's current generation.
    // Throws Error(NotFound) when the port or PID is not indexed.
    std::vector<int> resolve_targets(const TerminationRequest& request);
    SafetyDecision safety_check(int pid) const;
    TerminationOutcome execute(int pid, SignalPolicy policy);
    // Full pipeline: confirmation, resolution, safety, execution. One outcome
    // per resolved PID; a failing PID never stops the others.
    std::vector<TerminationOutcome> terminate(const TerminationRequest& request);

    const Settings& settings() const { return settings_; }

private:
    bool run_stage(int pid, int signo, std::chrono::milliseconds wait, TerminationOutcome& out);
    bool wait_gone(int pid, std::chrono::milliseconds budget);
    // Owner name the current generation records for pid; empty when not
    // indexed or unresolved.
    std::string indexed_owner(int pid) const;

    Session& session_;
    SignalSender& sender_;
    Settings settings_;
    Sleeper sleep_;
};

}
