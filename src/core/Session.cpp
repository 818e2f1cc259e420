#include "Session.h"
#include "Errors.h"
#include "Logging.h"

namespace sockreap {

SocketIndex::Ptr Session::rebuild(){
    std::vector<RawSocket> raw;
    try {
        raw = collector_.collect();
    } catch(const Error&) {
        throw;
    } catch(const std::exception& ex) {
        throw Error(ErrorKind::CollectionFailed, collector_.name() + ": " + ex.what());
    }
    auto next = SocketIndex::build(raw, processes_);
    if(current_) Logger::instance().debug("Replacing socket index generation " + std::to_string(current_->generation()) +
                                          " with " + std::to_string(next->generation()));
    current_ = next;
    return current_;
}

SocketIndex::Ptr Session::index(){
    if(!current_) return rebuild();
    return current_;
}

}
