#pragma once
#include "Config.h"
#include "Errors.h"
#include "SocketIndex.h"
#include "TerminationEngine.h"
#include "../collectors/ProcessDetails.h"
#include <string>
#include <vector>

namespace sockreap {

// Renders query and termination results as JSON with sorted keys.
// Compact by default; pretty adds two-space indentation.
class JSONWriter {
public:
    explicit JSONWriter(bool pretty = false) : pretty_(pretty) {}

    // Flat record list, e.g. the answer to sockets_by_port().
    std::string write_sockets(const std::string& query, std::uint64_t generation, const std::vector<SocketRecord>& records) const;
    // Whole view grouped by port or by process.
    std::string write_view(const SocketIndexView& view, ViewMode mode) const;
    std::string write_termination(const TerminationRequest& request, const std::vector<TerminationOutcome>& outcomes) const;
    std::string write_details(const ProcessDetails& details, const std::vector<SocketRecord>& sockets) const;
    std::string write_error(const Error& err) const;

private:
    bool pretty_;
};

}
