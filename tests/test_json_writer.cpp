#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/core/JSONWriter.h"
#include "../src/core/Logging.h"
#include <nlohmann/json.hpp>
#include <csignal>

namespace sockreap {

class NamedProcesses : public ProcessLookup {
public:
    std::optional<ProcessIdentity> lookup(int pid) const override {
        if (pid == 1234) return ProcessIdentity{"nginx", 33};
        if (pid == 890) return ProcessIdentity{"systemd-resolve", 101};
        return std::nullopt;
    }
    bool exists(int) const override { return true; }
};

class JSONWriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().set_level(LogLevel::Error);
        RawSocket web;
        web.local = Endpoint{IpAddress::v4(0, 0, 0, 0), 8080};
        web.state = TcpState::Listen;
        web.pid = 1234;
        web.inode = 100;
        RawSocket dns;
        dns.protocol = Protocol::UDP;
        dns.local = Endpoint{IpAddress::v4(127, 0, 0, 53), 53};
        dns.pid = 890;
        RawSocket peer;
        peer.local = Endpoint{*IpAddress::parse("::1"), 5432};
        peer.remote = Endpoint{*IpAddress::parse("::1"), 40000};
        peer.state = TcpState::Established;
        index = SocketIndex::build({web, dns, peer}, processes);
    }

    NamedProcesses processes;
    SocketIndex::Ptr index;
    JSONWriter writer;
};

TEST_F(JSONWriterTest, SocketsDocument) {
    std::string out = writer.write_sockets("port 8080", index->generation(), index->sockets_by_port(8080));
    nlohmann::json j;
    ASSERT_NO_THROW(j = nlohmann::json::parse(out));
    EXPECT_EQ(j["query"], "port 8080");
    EXPECT_EQ(j["generation"].get<std::uint64_t>(), index->generation());
    EXPECT_EQ(j["count"], 1);
    ASSERT_EQ(j["sockets"].size(), 1u);
    const auto& s = j["sockets"][0];
    EXPECT_EQ(s["protocol"], "TCP");
    EXPECT_EQ(s["state"], "LISTEN");
    EXPECT_EQ(s["pid"], 1234);
    EXPECT_EQ(s["process"], "nginx");
    EXPECT_EQ(s["uid"], 33);
    EXPECT_EQ(s["inode"], 100);
    EXPECT_EQ(s["local"]["address"], "0.0.0.0");
    EXPECT_EQ(s["local"]["port"], 8080);
    EXPECT_TRUE(s["remote"].is_null());
    EXPECT_TRUE(j.contains("meta"));
    EXPECT_TRUE(j["meta"].contains("tool_version"));
    EXPECT_TRUE(j["meta"].contains("collected_at"));
}

TEST_F(JSONWriterTest, UdpRecordHasNoStateKey) {
    auto j = nlohmann::json::parse(writer.write_sockets("pid 890", index->generation(), index->sockets_by_pid(890)));
    ASSERT_EQ(j["sockets"].size(), 1u);
    EXPECT_FALSE(j["sockets"][0].contains("state"));
    EXPECT_EQ(j["sockets"][0]["protocol"], "UDP");
}

TEST_F(JSONWriterTest, PortView) {
    auto j = nlohmann::json::parse(writer.write_view(index->view(), ViewMode::Port));
    EXPECT_EQ(j["view"], "port");
    EXPECT_EQ(j["count"], 3);
    ASSERT_EQ(j["groups"].size(), 3u);
    EXPECT_EQ(j["groups"][0]["port"], 53);
    EXPECT_EQ(j["groups"][2]["port"], 8080);
}

TEST_F(JSONWriterTest, ProcessView) {
    auto j = nlohmann::json::parse(writer.write_view(index->view(), ViewMode::Process));
    EXPECT_EQ(j["view"], "process");
    ASSERT_EQ(j["groups"].size(), 3u);
    EXPECT_EQ(j["groups"][0]["pid"], 0);
    EXPECT_EQ(j["groups"][0]["process"], "unknown");
    EXPECT_EQ(j["groups"][0]["sockets"][0]["remote"]["port"], 40000);
    EXPECT_EQ(j["groups"][2]["process"], "nginx");
}

TEST_F(JSONWriterTest, EmptyFilteredViewIsValid) {
    auto empty = index->filter(predicates::state_in({TcpState::TimeWait}));
    auto j = nlohmann::json::parse(writer.write_view(empty, ViewMode::Port));
    EXPECT_EQ(j["count"], 0);
    EXPECT_TRUE(j["groups"].is_array());
    EXPECT_TRUE(j["groups"].empty());
}

TEST_F(JSONWriterTest, TerminationDocument) {
    TerminationOutcome done;
    done.pid = 1234;
    done.process_name = "nginx";
    done.requested_signal = SIGKILL;
    done.delivered = true;
    done.verified_absent = true;
    done.final_state = TerminationState::VerifiedTerminated;
    done.stages = {SignalStage{SIGTERM, true, false}, SignalStage{SIGKILL, true, true}};
    TerminationOutcome denied;
    denied.pid = 1;
    denied.process_name = "systemd";
    denied.requested_signal = SIGTERM;
    denied.error = ErrorKind::ProtectedTarget;
    denied.detail = "PID 1 is the init process and is always protected";
    denied.final_state = TerminationState::Denied;

    auto req = TerminationRequest::for_port(8080, SignalPolicy::GracefulThenForceful, Confirmation::granted());
    auto j = nlohmann::json::parse(writer.write_termination(req, {done, denied}));
    EXPECT_EQ(j["request"]["target"], "port");
    EXPECT_EQ(j["request"]["value"], 8080);
    EXPECT_EQ(j["request"]["policy"], "graceful-then-forceful");
    EXPECT_EQ(j["total"], 2);
    EXPECT_EQ(j["verified_absent"], 1);
    auto& first = j["outcomes"][0];
    EXPECT_EQ(first["final_state"], "VerifiedTerminated");
    EXPECT_EQ(first["requested_signal"], "SIGKILL");
    EXPECT_TRUE(first["error"].is_null());
    ASSERT_EQ(first["stages"].size(), 2u);
    EXPECT_EQ(first["stages"][0]["signal"], "SIGTERM");
    EXPECT_EQ(first["stages"][0]["absent_after"], false);
    auto& second = j["outcomes"][1];
    EXPECT_EQ(second["error"], "ProtectedTarget");
    EXPECT_EQ(second["final_state"], "Denied");
    EXPECT_EQ(second["delivered"], false);
    EXPECT_TRUE(second["stages"].empty());
}

TEST_F(JSONWriterTest, DetailsDocument) {
    ProcessDetails d;
    d.pid = 42;
    d.ppid = 1;
    d.name = "python3";
    d.state = 'S';
    d.uid = 1000;
    d.cmdline = "python3 -m \"http.server\"";
    d.rss_bytes = 2097152;
    d.threads = 3;
    d.run_time_seconds = 125;
    d.cpu_percent = 2.4;
    auto j = nlohmann::json::parse(writer.write_details(d, index->sockets_by_pid(1234)));
    EXPECT_EQ(j["process"]["pid"], 42);
    EXPECT_EQ(j["process"]["state"], "S");
    EXPECT_EQ(j["process"]["cmdline"], "python3 -m \"http.server\"");
    EXPECT_EQ(j["process"]["run_time"], "2m 5s");
    EXPECT_DOUBLE_EQ(j["process"]["cpu_percent"].get<double>(), 2.4);
    EXPECT_TRUE(j["process"]["exe"].is_null());
    EXPECT_TRUE(j["process"]["start_time"].is_null());
    EXPECT_EQ(j["sockets"].size(), 1u);
}

TEST_F(JSONWriterTest, ErrorDocument) {
    auto j = nlohmann::json::parse(writer.write_error(Error(ErrorKind::NotFound, "no socket on port 9999")));
    EXPECT_EQ(j["error"]["kind"], "NotFound");
    EXPECT_EQ(j["error"]["message"], "no socket on port 9999");
}

TEST_F(JSONWriterTest, CompactAndPrettyAgree) {
    JSONWriter pretty(true);
    std::string compact_out = writer.write_view(index->view(), ViewMode::Port);
    std::string pretty_out = pretty.write_view(index->view(), ViewMode::Port);
    EXPECT_EQ(compact_out.find("\n  "), std::string::npos);
    EXPECT_NE(pretty_out.find("\n  \""), std::string::npos);
    auto a = nlohmann::json::parse(compact_out);
    auto b = nlohmann::json::parse(pretty_out);
    a.erase("meta");
    b.erase("meta");
    EXPECT_EQ(a, b);
}

TEST_F(JSONWriterTest, KeysAreSorted) {
    std::string out = writer.write_error(Error(ErrorKind::NotFound, "x"));
    EXPECT_LT(out.find("\"kind\""), out.find("\"message\""));
}

}
