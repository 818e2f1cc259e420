#include "SocketRecord.h"
#include <arpa/inet.h>
#include <algorithm>
#include <cctype>
#include <tuple>

namespace sockreap {

namespace {

struct StateName { TcpState state; const char* name; };

// Indexed by kernel code - 1 (include/net/tcp_states.h)
const StateName kTcpStates[] = {
    {TcpState::Established, "ESTABLISHED"}, {TcpState::SynSent, "SYN_SENT"},
    {TcpState::SynRecv, "SYN_RECV"}, {TcpState::FinWait1, "FIN_WAIT1"},
    {TcpState::FinWait2, "FIN_WAIT2"}, {TcpState::TimeWait, "TIME_WAIT"},
    {TcpState::Close, "CLOSE"}, {TcpState::CloseWait, "CLOSE_WAIT"},
    {TcpState::LastAck, "LAST_ACK"}, {TcpState::Listen, "LISTEN"},
    {TcpState::Closing, "CLOSING"}, {TcpState::NewSynRecv, "NEW_SYN_RECV"}
};

std::size_t address_length(IpAddress::Family f){ return f == IpAddress::Family::V4 ? 4 : 16; }

// Orders an absent endpoint first.
bool endpoint_less(const std::optional<Endpoint>& a, const std::optional<Endpoint>& b){
    if(!a || !b) return !a && b;
    if(a->address != b->address) return a->address < b->address;
    return a->port < b->port;
}

const std::optional<Endpoint>& remote_of(const Transport& t){
    if(auto* tcp = std::get_if<TcpTransport>(&t)) return tcp->remote;
    return std::get<UdpTransport>(t).remote;
}

}

const char* to_string(Protocol p){ return p == Protocol::TCP ? "TCP" : "UDP"; }

const char* to_string(TcpState s){
    for(const auto& e : kTcpStates) if(e.state == s) return e.name;
    return "UNKNOWN";
}

TcpState tcp_state_from_code(unsigned code){
    if(code >= 1 && code <= sizeof(kTcpStates)/sizeof(kTcpStates[0])) return kTcpStates[code-1].state;
    return TcpState::Unknown;
}

std::optional<TcpState> parse_tcp_state(const std::string& name){
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c){ return std::toupper(c); });
    for(const auto& e : kTcpStates) if(upper == e.name) return e.state;
    return std::nullopt;
}

IpAddress IpAddress::v4(std::uint8_t a, std::uint8_t b, std::uint8_t c, std::uint8_t d){
    IpAddress ip;
    ip.family = Family::V4;
    ip.bytes[0]=a; ip.bytes[1]=b; ip.bytes[2]=c; ip.bytes[3]=d;
    return ip;
}

std::optional<IpAddress> IpAddress::parse(const std::string& text){
    IpAddress ip;
    if(inet_pton(AF_INET, text.c_str(), ip.bytes.data()) == 1){ ip.family = Family::V4; return ip; }
    if(inet_pton(AF_INET6, text.c_str(), ip.bytes.data()) == 1){ ip.family = Family::V6; return ip; }
    return std::nullopt;
}

std::string IpAddress::to_string() const {
    char buf[INET6_ADDRSTRLEN] = {};
    int af = family == Family::V4 ? AF_INET : AF_INET6;
    if(!inet_ntop(af, bytes.data(), buf, sizeof(buf))) return "?";
    return buf;
}

bool IpAddress::is_unspecified() const {
    auto n = address_length(family);
    return std::all_of(bytes.begin(), bytes.begin()+n, [](std::uint8_t b){ return b == 0; });
}

bool IpAddress::is_loopback() const {
    if(family == Family::V4) return bytes[0] == 127;
    for(std::size_t i=0;i<15;++i) if(bytes[i] != 0) return false;
    return bytes[15] == 1;
}

bool IpAddress::operator<(const IpAddress& o) const {
    if(family != o.family) return family < o.family;
    return bytes < o.bytes;
}

SocketRecord SocketRecord::tcp(const Endpoint& local, TcpState state, std::optional<Endpoint> remote,
                               SocketOwner owner, std::optional<std::uint64_t> inode){
    return SocketRecord(local, TcpTransport{state, std::move(remote)}, std::move(owner), inode);
}

SocketRecord SocketRecord::udp(const Endpoint& local, std::optional<Endpoint> remote,
                               SocketOwner owner, std::optional<std::uint64_t> inode){
    return SocketRecord(local, UdpTransport{std::move(remote)}, std::move(owner), inode);
}

Protocol SocketRecord::protocol() const {
    return std::holds_alternative<TcpTransport>(transport_) ? Protocol::TCP : Protocol::UDP;
}

std::optional<IpAddress> SocketRecord::remote_address() const {
    const auto& r = remote_of(transport_);
    if(!r) return std::nullopt;
    return r->address;
}

std::optional<std::uint16_t> SocketRecord::remote_port() const {
    const auto& r = remote_of(transport_);
    if(!r) return std::nullopt;
    return r->port;
}

std::optional<TcpState> SocketRecord::connection_state() const {
    if(auto* tcp = std::get_if<TcpTransport>(&transport_)) return tcp->state;
    return std::nullopt;
}

std::string SocketRecord::summary() const {
    auto st = connection_state();
    return std::to_string(owner_.pid) + ":" + std::to_string(local_.port) + " -- " + owner_.process_name +
           " Status: " + (st ? to_string(*st) : "N/A") + " -- Protocol: " + to_string(protocol());
}

bool SocketRecord::operator==(const SocketRecord& o) const {
    return protocol() == o.protocol() && local_ == o.local_ && connection_state() == o.connection_state() &&
           remote_of(transport_) == remote_of(o.transport_) && owner_.pid == o.owner_.pid &&
           owner_.process_name == o.owner_.process_name && owner_.uid == o.owner_.uid && inode_ == o.inode_;
}

bool record_order(const SocketRecord& a, const SocketRecord& b){
    auto ka = std::make_tuple(static_cast<int>(a.protocol()), a.local_port());
    auto kb = std::make_tuple(static_cast<int>(b.protocol()), b.local_port());
    if(ka != kb) return ka < kb;
    if(a.local_address() != b.local_address()) return a.local_address() < b.local_address();
    if(a.owning_pid() != b.owning_pid()) return a.owning_pid() < b.owning_pid();
    const auto& ra = remote_of(a.transport());
    const auto& rb = remote_of(b.transport());
    if(endpoint_less(ra, rb)) return true;
    if(endpoint_less(rb, ra)) return false;
    return a.kernel_inode().value_or(0) < b.kernel_inode().value_or(0);
}

}
