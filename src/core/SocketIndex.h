#pragma once
#include "Collector.h"
#include "SocketRecord.h"
#include <cstdint>
#include <functional>
#include <memory>
#include <set>
#include <unordered_map>
#include <vector>

namespace sockreap {

class SocketIndexView;
using SocketPredicate = std::function<bool(const SocketRecord&)>;

// Placeholder name for sockets whose owner could not be resolved.
extern const char* const kUnknownProcess;

// One generation of socket records with port and PID inverted indexes.
// Immutable after build(); a refresh builds a new instance instead of
// touching this one, so concurrent readers need no locking.
class SocketIndex : public std::enable_shared_from_this<SocketIndex> {
    struct BuildTag { explicit BuildTag() = default; };

public:
    using Ptr = std::shared_ptr<const SocketIndex>;

    // Only reachable through build(); public for std::make_shared.
    SocketIndex(BuildTag, std::uint64_t generation, std::vector<SocketRecord> records);

    static Ptr build(const std::vector<RawSocket>& raw, const ProcessLookup& processes);

    std::uint64_t generation() const { return generation_; }
    const std::vector<SocketRecord>& records() const { return records_; }
    std::size_t size() const { return records_.size(); }

    std::vector<SocketRecord> sockets_by_port(std::uint16_t port) const;
    std::vector<SocketRecord> sockets_by_pid(int pid) const;
    std::set<std::uint16_t> all_ports() const;
    std::set<int> all_pids() const;
    // Distinct owners of a port in ascending order; empty if the port is not indexed.
    std::vector<int> pids_on_port(std::uint16_t port) const;
    bool has_port(std::uint16_t port) const { return by_port_.count(port) != 0; }
    bool has_pid(int pid) const { return by_pid_.count(pid) != 0; }

    SocketIndexView filter(SocketPredicate predicate) const;
    SocketIndexView view() const;

private:
    friend class SocketIndexView;

    std::vector<SocketRecord> collect(const std::vector<std::size_t>& positions) const;

    std::uint64_t generation_;
    std::vector<SocketRecord> records_;
    std::unordered_map<std::uint16_t, std::vector<std::size_t>> by_port_;
    std::unordered_map<int, std::vector<std::size_t>> by_pid_;
};

// Filtered read-only view pinned to the generation it was created from. It
// keeps answering with that generation's data after the owning session
// rebuilds; compare generation() against the session to detect staleness.
class SocketIndexView {
public:
    std::uint64_t generation() const { return index_->generation(); }
    std::size_t size() const { return positions_.size(); }
    bool empty() const { return positions_.empty(); }

    std::vector<SocketRecord> records() const;
    std::vector<SocketRecord> sockets_by_port(std::uint16_t port) const;
    std::vector<SocketRecord> sockets_by_pid(int pid) const;
    std::set<std::uint16_t> all_ports() const;
    std::set<int> all_pids() const;

    SocketIndexView filter(const SocketPredicate& predicate) const;

private:
    friend class SocketIndex;
    SocketIndexView(SocketIndex::Ptr index, std::vector<std::size_t> positions);

    std::vector<SocketRecord> select(const std::vector<std::size_t>* candidates) const;

    SocketIndex::Ptr index_;
    std::vector<std::size_t> positions_;
    std::vector<bool> member_;
};

namespace predicates {
SocketPredicate protocol_is(Protocol p);
// TCP sockets in any of the given states; UDP sockets never match.
SocketPredicate state_in(std::vector<TcpState> states);
// TCP LISTEN sockets and unconnected UDP sockets.
SocketPredicate listening();
SocketPredicate all_of(std::vector<SocketPredicate> preds);
}

}
