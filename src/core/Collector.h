#pragma once
#include "SocketRecord.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sockreap {

struct ProcessIdentity {
    std::string name;
    std::optional<std::uint32_t> uid; // hidden without privilege on hardened kernels
    std::string exe_name; // basename of the executable, else of argv[0]; empty when unreadable
};

// PID -> process identity, plus the liveness probe the termination engine polls.
class ProcessLookup {
public:
    virtual ~ProcessLookup() = default;
    virtual std::optional<ProcessIdentity> lookup(int pid) const = 0;
    // false once the process is gone or only a zombie remains
    virtual bool exists(int pid) const = 0;
};

// Source of raw socket observations. Throws Error(CollectionFailed) when the
// socket table cannot be read at all.
class SocketCollector {
public:
    virtual ~SocketCollector() = default;
    virtual std::string name() const = 0;
    virtual std::vector<RawSocket> collect() = 0;
};

using SocketCollectorPtr = std::unique_ptr<SocketCollector>;
using ProcessLookupPtr = std::unique_ptr<ProcessLookup>;

}
