#pragma once
#include "Config.h"
#include "SocketIndex.h"
#include "TerminationEngine.h"
#include "../collectors/ProcessDetails.h"
#include <string>
#include <vector>

namespace sockreap {
namespace text {

// "0.0.0.0:8080", "[::1]:53"
std::string format_endpoint(const IpAddress& addr, std::uint16_t port);
// One line per record: "PID:PORT -- NAME Status: STATE -- Protocol: TCP  local -> remote"
std::string format_records(const std::vector<SocketRecord>& records);
std::string format_view(const SocketIndexView& view, ViewMode mode);
// Review text shown before asking for confirmation.
std::string format_targets(const TerminationRequest& request, const std::vector<int>& pids,
                           const SocketIndex& index, const std::vector<SafetyDecision>& decisions);
std::string format_outcomes(const std::vector<TerminationOutcome>& outcomes);
std::string format_details(const ProcessDetails& details, const std::vector<SocketRecord>& sockets);

}
}
