#include "SocketIndex.h"
#include "Logging.h"
#include <algorithm>
#include <atomic>

namespace sockreap {

const char* const kUnknownProcess = "unknown";

namespace {

std::atomic<std::uint64_t> next_generation{1};

std::optional<Endpoint> normalize_remote(const std::optional<Endpoint>& remote){
    // The kernel reports 0.0.0.0:0 / [::]:0 for "no peer"
    if(!remote) return std::nullopt;
    if(remote->port == 0 && remote->address.is_unspecified()) return std::nullopt;
    return remote;
}

SocketOwner resolve_owner(const RawSocket& raw, const ProcessLookup& processes){
    SocketOwner owner;
    owner.pid = raw.pid.value_or(0);
    owner.process_name = kUnknownProcess;
    owner.uid = raw.uid;
    if(owner.pid <= 0) return owner;
    auto ident = processes.lookup(owner.pid);
    if(!ident) return owner;
    if(!ident->name.empty()) owner.process_name = ident->name;
    if(ident->uid) owner.uid = ident->uid;
    return owner;
}

}

SocketIndex::SocketIndex(BuildTag, std::uint64_t generation, std::vector<SocketRecord> records)
    : generation_(generation), records_(std::move(records)) {
    for(std::size_t i=0;i<records_.size();++i){
        by_port_[records_[i].local_port()].push_back(i);
        by_pid_[records_[i].owning_pid()].push_back(i);
    }
}

SocketIndex::Ptr SocketIndex::build(const std::vector<RawSocket>& raw, const ProcessLookup& processes){
    std::vector<SocketRecord> records;
    records.reserve(raw.size());
    size_t unresolved = 0;
    for(const auto& r : raw){
        SocketOwner owner = resolve_owner(r, processes);
        if(owner.process_name == kUnknownProcess) ++unresolved;
        auto remote = normalize_remote(r.remote);
        if(r.protocol == Protocol::TCP){
            records.push_back(SocketRecord::tcp(r.local, r.state.value_or(TcpState::Unknown), remote, std::move(owner), r.inode));
        } else {
            records.push_back(SocketRecord::udp(r.local, remote, std::move(owner), r.inode));
        }
    }
    std::stable_sort(records.begin(), records.end(), record_order);
    std::uint64_t gen = next_generation.fetch_add(1);
    Logger::instance().debug("Built socket index generation " + std::to_string(gen) + ": " + std::to_string(records.size()) +
                             " sockets, " + std::to_string(unresolved) + " without a resolvable owner");
    return std::make_shared<SocketIndex>(BuildTag{}, gen, std::move(records));
}

std::vector<SocketRecord> SocketIndex::collect(const std::vector<std::size_t>& positions) const {
    std::vector<SocketRecord> out;
    out.reserve(positions.size());
    for(auto p : positions) out.push_back(records_[p]);
    return out;
}

std::vector<SocketRecord> SocketIndex::sockets_by_port(std::uint16_t port) const {
    auto it = by_port_.find(port);
    if(it == by_port_.end()) return {};
    return collect(it->second);
}

std::vector<SocketRecord> SocketIndex::sockets_by_pid(int pid) const {
    auto it = by_pid_.find(pid);
    if(it == by_pid_.end()) return {};
    return collect(it->second);
}

std::set<std::uint16_t> SocketIndex::all_ports() const {
    std::set<std::uint16_t> out;
    for(const auto& kv : by_port_) out.insert(kv.first);
    return out;
}

std::set<int> SocketIndex::all_pids() const {
    std::set<int> out;
    for(const auto& kv : by_pid_) out.insert(kv.first);
    return out;
}

std::vector<int> SocketIndex::pids_on_port(std::uint16_t port) const {
    auto it = by_port_.find(port);
    if(it == by_port_.end()) return {};
    std::set<int> pids;
    for(auto p : it->second) pids.insert(records_[p].owning_pid());
    return std::vector<int>(pids.begin(), pids.end());
}

SocketIndexView SocketIndex::view() const {
    std::vector<std::size_t> all(records_.size());
    for(std::size_t i=0;i<all.size();++i) all[i] = i;
    return SocketIndexView(shared_from_this(), std::move(all));
}

SocketIndexView SocketIndex::filter(SocketPredicate predicate) const {
    return view().filter(predicate);
}

SocketIndexView::SocketIndexView(SocketIndex::Ptr index, std::vector<std::size_t> positions)
    : index_(std::move(index)), positions_(std::move(positions)), member_(index_->size(), false) {
    for(auto p : positions_) member_[p] = true;
}

std::vector<SocketRecord> SocketIndexView::select(const std::vector<std::size_t>* candidates) const {
    if(!candidates) return {};
    std::vector<SocketRecord> out;
    for(auto p : *candidates) if(member_[p]) out.push_back(index_->records_[p]);
    return out;
}

std::vector<SocketRecord> SocketIndexView::records() const {
    return index_->collect(positions_);
}

std::vector<SocketRecord> SocketIndexView::sockets_by_port(std::uint16_t port) const {
    auto it = index_->by_port_.find(port);
    return select(it == index_->by_port_.end() ? nullptr : &it->second);
}

std::vector<SocketRecord> SocketIndexView::sockets_by_pid(int pid) const {
    auto it = index_->by_pid_.find(pid);
    return select(it == index_->by_pid_.end() ? nullptr : &it->second);
}

std::set<std::uint16_t> SocketIndexView::all_ports() const {
    std::set<std::uint16_t> out;
    for(auto p : positions_) out.insert(index_->records_[p].local_port());
    return out;
}

std::set<int> SocketIndexView::all_pids() const {
    std::set<int> out;
    for(auto p : positions_) out.insert(index_->records_[p].owning_pid());
    return out;
}

SocketIndexView SocketIndexView::filter(const SocketPredicate& predicate) const {
    std::vector<std::size_t> kept;
    for(auto p : positions_) if(!predicate || predicate(index_->records_[p])) kept.push_back(p);
    return SocketIndexView(index_, std::move(kept));
}

namespace predicates {

SocketPredicate protocol_is(Protocol p){
    return [p](const SocketRecord& r){ return r.protocol() == p; };
}

SocketPredicate state_in(std::vector<TcpState> states){
    return [states = std::move(states)](const SocketRecord& r){
        auto st = r.connection_state();
        return st && std::find(states.begin(), states.end(), *st) != states.end();
    };
}

SocketPredicate listening(){
    return [](const SocketRecord& r){
        if(r.protocol() == Protocol::UDP) return !r.remote_address().has_value();
        return r.connection_state() == TcpState::Listen;
    };
}

SocketPredicate all_of(std::vector<SocketPredicate> preds){
    return [preds = std::move(preds)](const SocketRecord& r){
        for(const auto& p : preds) if(p && !p(r)) return false;
        return true;
    };
}

}

}
