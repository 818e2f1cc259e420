#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace sockreap {

enum class Protocol { TCP = 0, UDP = 1 };

enum class TcpState {
    Established, SynSent, SynRecv, FinWait1, FinWait2, TimeWait, Close,
    CloseWait, LastAck, Listen, Closing, NewSynRecv, Unknown
};

const char* to_string(Protocol p);
const char* to_string(TcpState s);
// Kernel numbering used in /proc/net/tcp ("0A" = LISTEN). Unknown codes map to TcpState::Unknown.
TcpState tcp_state_from_code(unsigned code);
// Accepts the names produced by to_string(TcpState), case-insensitive.
std::optional<TcpState> parse_tcp_state(const std::string& name);

struct IpAddress {
    enum class Family : std::uint8_t { V4 = 4, V6 = 6 };

    Family family = Family::V4;
    std::array<std::uint8_t, 16> bytes{}; // V4 uses the first four

    static IpAddress v4(std::uint8_t a, std::uint8_t b, std::uint8_t c, std::uint8_t d);
    static std::optional<IpAddress> parse(const std::string& text);

    std::string to_string() const;
    bool is_unspecified() const;
    bool is_loopback() const;

    bool operator==(const IpAddress& o) const { return family == o.family && bytes == o.bytes; }
    bool operator!=(const IpAddress& o) const { return !(*this == o); }
    bool operator<(const IpAddress& o) const;
};

struct Endpoint {
    IpAddress address;
    std::uint16_t port = 0;
    bool operator==(const Endpoint& o) const { return address == o.address && port == o.port; }
};

// TCP carries a connection state, UDP cannot.
struct TcpTransport {
    TcpState state = TcpState::Unknown;
    std::optional<Endpoint> remote;
};

struct UdpTransport {
    std::optional<Endpoint> remote; // set for connect()ed UDP sockets
};

using Transport = std::variant<TcpTransport, UdpTransport>;

struct SocketOwner {
    int pid = 0; // 0 when the socket could not be attributed
    std::string process_name;
    std::optional<std::uint32_t> uid;
};

// Immutable snapshot of one socket at collection time.
class SocketRecord {
public:
    static SocketRecord tcp(const Endpoint& local, TcpState state, std::optional<Endpoint> remote,
                            SocketOwner owner, std::optional<std::uint64_t> inode = std::nullopt);
    static SocketRecord udp(const Endpoint& local, std::optional<Endpoint> remote,
                            SocketOwner owner, std::optional<std::uint64_t> inode = std::nullopt);

    Protocol protocol() const;
    std::uint16_t local_port() const { return local_.port; }
    const IpAddress& local_address() const { return local_.address; }
    std::optional<IpAddress> remote_address() const;
    std::optional<std::uint16_t> remote_port() const;
    std::optional<TcpState> connection_state() const;
    const Transport& transport() const { return transport_; }

    int owning_pid() const { return owner_.pid; }
    const std::string& owning_process_name() const { return owner_.process_name; }
    std::optional<std::uint32_t> owning_uid() const { return owner_.uid; }
    std::optional<std::uint64_t> kernel_inode() const { return inode_; }

    // "PID:PORT -- NAME Status: STATE -- Protocol: TCP"
    std::string summary() const;

    bool operator==(const SocketRecord& o) const;
    bool operator!=(const SocketRecord& o) const { return !(*this == o); }

private:
    SocketRecord(const Endpoint& local, Transport transport, SocketOwner owner, std::optional<std::uint64_t> inode)
        : local_(local), transport_(std::move(transport)), owner_(std::move(owner)), inode_(inode) {}

    Endpoint local_;
    Transport transport_;
    SocketOwner owner_;
    std::optional<std::uint64_t> inode_;
};

// Stable display order: (protocol, local_port, local_address), then owner and
// remote endpoint so that equal keys still sort deterministically.
bool record_order(const SocketRecord& a, const SocketRecord& b);

// One socket observation as delivered by a SocketCollector.
struct RawSocket {
    Protocol protocol = Protocol::TCP;
    Endpoint local;
    std::optional<Endpoint> remote;
    std::optional<TcpState> state; // ignored for UDP
    std::optional<int> pid; // absent when no owning process was found
    std::optional<std::uint32_t> uid; // socket uid from the kernel table
    std::optional<std::uint64_t> inode;
};

}
