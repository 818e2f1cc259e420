#include "Config.h"

namespace sockreap {

const char* command_name(Command c){
    switch(c){
        case Command::List: return "list";
        case Command::Port: return "port";
        case Command::Pid: return "pid";
        case Command::Details: return "details";
        case Command::Kill: return "kill";
    }
    return "list";
}

bool parse_command(const std::string& s, Command& out){
    if(s=="list") { out = Command::List; return true; }
    if(s=="port") { out = Command::Port; return true; }
    if(s=="pid") { out = Command::Pid; return true; }
    if(s=="details") { out = Command::Details; return true; }
    if(s=="kill") { out = Command::Kill; return true; }
    return false;
}

}
