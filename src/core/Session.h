#pragma once
#include "Collector.h"
#include "SocketIndex.h"

namespace sockreap {

// Owns exactly one SocketIndex generation at a time and swaps it wholesale
// on rebuild(). Views and records handed out earlier stay valid.
class Session {
public:
    Session(SocketCollector& collector, const ProcessLookup& processes)
        : collector_(collector), processes_(processes) {}

    // Collects a fresh snapshot and makes it current. Throws Error(CollectionFailed).
    SocketIndex::Ptr rebuild();
    // Current generation, collected on first use.
    SocketIndex::Ptr index();
    bool has_index() const { return static_cast<bool>(current_); }
    bool is_current(const SocketIndexView& view) const { return current_ && view.generation() == current_->generation(); }

    const ProcessLookup& processes() const { return processes_; }

private:
    SocketCollector& collector_;
    const ProcessLookup& processes_;
    SocketIndex::Ptr current_;
};

}
