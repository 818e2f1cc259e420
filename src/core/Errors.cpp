#include "Errors.h"
#include <cstring>

namespace sockreap {

const char* to_string(ErrorKind kind){
    switch(kind){
        case ErrorKind::CollectionFailed: return "CollectionFailed";
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::PermissionDenied: return "PermissionDenied";
        case ErrorKind::ProcessVanished: return "ProcessVanished";
        case ErrorKind::SignalDeliveryFailed: return "SignalDeliveryFailed";
        case ErrorKind::ProtectedTarget: return "ProtectedTarget";
        case ErrorKind::NotConfirmed: return "NotConfirmed";
        case ErrorKind::InvalidArgument: return "InvalidArgument";
    }
    return "Unknown";
}

std::string errno_message(const std::string& what, int err){
    return what + ": " + std::strerror(err) + " (errno=" + std::to_string(err) + ")";
}

}
