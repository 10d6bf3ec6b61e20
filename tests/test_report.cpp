#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"
#include "report.hpp"

#include <cmath>
#include <limits>

TEST_CASE("Report", "[report]") {
    FakeSystem sys;
    LivenessValidator liveness(sys, FakeSystem::kUid);

    AgentRecord managed;
    managed.specifier = "111.2222.333";
    managed.pid = "500";
    managed.socket = "/tmp/ssh-agent-111.2222.333/agent.sock";
    managed.managed = {.pid = true, .socket = true};
    managed.origin = ManagedOrigin{.directory = "/tmp/ssh-agent-111.2222.333",
                                   .expires_at = sys.clock + 3900};
    managed.valid = true;
    managed.identities = {"id_ed25519"};

    SECTION("ExportLines") {
        REQUIRE(report::export_lines("500", "/s") ==
                "SSH_AUTH_SOCK=/s; export SSH_AUTH_SOCK;\nSSH_AGENT_PID=500; export SSH_AGENT_PID;\n");
        REQUIRE(report::unset_lines() == "unset SSH_AUTH_SOCK;\nunset SSH_AGENT_PID;\n");
    }

    SECTION("Remaining") {
        REQUIRE(report::remaining(100.0, 200.0) == "expired");
        REQUIRE(report::remaining(200.0, 200.0) == "expired");
        REQUIRE(report::remaining(245.0, 200.0) == "45s");
        REQUIRE(report::remaining(200.0 + 600, 200.0) == "10m");
        REQUIRE(report::remaining(200.0 + 3900, 200.0) == "1h 05m");
    }

    SECTION("RemainingOutOfRange") {
        REQUIRE(report::remaining(std::nan(""), 200.0) == "expired");
        REQUIRE(report::remaining(-std::numeric_limits<double>::infinity(), 200.0) == "expired");
        REQUIRE(report::remaining(std::numeric_limits<double>::infinity(), 200.0) == "2500000h 00m");
        REQUIRE(report::remaining(1e300, 200.0) == "2500000h 00m");
    }

    SECTION("DescribeFarFutureExpiration") {
        AgentRecord far = managed;
        far.origin = ManagedOrigin{.directory = "/tmp/ssh-agent-111.2222.333", .expires_at = 1e300};
        auto text = report::describe(far, liveness, sys.clock);
        REQUIRE(text.find("  expires:    - (2500000h 00m)\n") != std::string::npos);
    }

    SECTION("DescribeManaged") {
        auto text = report::describe(managed, liveness, sys.clock);
        REQUIRE(text.starts_with("111.2222.333 [valid]\n"));
        REQUIRE(text.find("500 (managed)") != std::string::npos);
        REQUIRE(text.find("(1h 05m)") != std::string::npos);
        REQUIRE(text.find("identities: id_ed25519") != std::string::npos);
    }

    SECTION("DescribeForeign") {
        AgentRecord foreign;
        foreign.specifier = "000.0000.env";
        foreign.pid = "777";
        foreign.socket = "/run/agent.sock";
        foreign.exported = {.pid = true, .socket = true};

        auto text = report::describe(foreign, liveness, sys.clock);
        REQUIRE(text.starts_with("000.0000.env [invalid] *\n"));
        REQUIRE(text.find("foreign, exported") != std::string::npos);
        REQUIRE(text.find("expires") == std::string::npos);
        REQUIRE(text.find("identities: -") != std::string::npos);
    }

    SECTION("Json") {
        auto j = report::to_json(managed, liveness);
        REQUIRE(j["specifier"] == "111.2222.333");
        REQUIRE(j["valid"] == true);
        REQUIRE(j["managed"]["pid"] == true);
        REQUIRE(j["exported"]["socket"] == false);
        REQUIRE(j["expires_at"].get<double>() == sys.clock + 3900);
        REQUIRE(j["identities"] == nlohmann::json::array({"id_ed25519"}));
        REQUIRE(j["started_at"].is_null());

        AgentRecord foreign;
        REQUIRE(report::to_json(foreign, liveness)["expires_at"].is_null());
    }
}
