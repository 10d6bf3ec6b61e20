#include <catch2/catch_test_macros.hpp>

#include "discovery/managed_store.hpp"
#include "fakes.hpp"

#include <format>

namespace {

const std::string kTmp = "/tmp";

std::string make_agent(FakeSystem& sys, const std::string& spec, int pid, bool socket,
                       double expires_at) {
    auto dir = kTmp + "/ssh-agent-" + spec;
    sys.add_dir(dir);
    if (pid > 0) sys.add_file(dir + "/agent.pid", std::format("{}\n", pid));
    if (socket) sys.add_socket(dir + "/agent.sock");
    sys.add_file(dir + "/agent.expiration", std::format("{:.6f}\n", expires_at));
    return dir;
}

} // namespace

TEST_CASE("ManagedAgentStore", "[store]") {
    FakeSystem sys;
    FakeKeyTools tools(sys);
    sys.add_dir(kTmp);
    sys.add_dir("/keys");

    LivenessValidator liveness(sys, FakeSystem::kUid);
    IdentityMatcher matcher(sys, tools, "/keys");
    ManagedAgentStore store(sys, liveness, matcher, kTmp);
    Ambient ambient{.agent_pid = "", .auth_sock = "", .euid = FakeSystem::kUid};

    SECTION("EmptyRoot") {
        REQUIRE(store.scan(ambient).empty());
    }

    SECTION("LiveAgentIsValid") {
        sys.add_process(500, 10.0);
        auto dir = make_agent(sys, "111.2222.333", 500, true, sys.clock + 3600);

        auto reg = store.scan(ambient);
        REQUIRE(reg.size() == 1);
        auto& r = reg.at("111.2222.333");
        REQUIRE(r.specifier == "111.2222.333");
        REQUIRE(r.pid == "500");
        REQUIRE(r.socket == dir + "/agent.sock");
        REQUIRE(r.managed == PidSocketFlags{true, true});
        REQUIRE(r.exported == PidSocketFlags{false, false});
        REQUIRE(r.valid);
        REQUIRE(r.identities.empty());
        REQUIRE(r.managed_origin()->directory == dir);
        REQUIRE(r.expires_at() == sys.clock + 3600);
    }

    SECTION("ExpiredAgentIsInvalidButKept") {
        sys.add_process(500, 10.0);
        auto dir = make_agent(sys, "111.2222.333", 500, true, sys.clock - 3600);

        auto reg = store.scan(ambient);
        REQUIRE(reg.size() == 1);
        REQUIRE_FALSE(reg.at("111.2222.333").valid);
        REQUIRE(sys.exists(dir));
        REQUIRE(tools.list_calls == 0);
    }

    SECTION("UnreadableExpirationCountsAsExpired") {
        sys.add_process(500, 10.0);
        auto dir = make_agent(sys, "111.2222.333", 500, true, 0);
        sys.add_file(dir + "/agent.expiration", "garbage");

        auto reg = store.scan(ambient);
        REQUIRE_FALSE(reg.at("111.2222.333").valid);
        REQUIRE(reg.at("111.2222.333").expires_at() == 0.0);
    }

    SECTION("OutOfRangeExpirationCountsAsExpired") {
        sys.add_process(500, 10.0);
        auto dir = make_agent(sys, "111.2222.333", 500, true, 0);

        for (const char* text : {"inf", "-inf", "nan", "1e300", "-5"}) {
            sys.add_file(dir + "/agent.expiration", text);

            auto reg = store.scan(ambient);
            INFO(text);
            REQUIRE_FALSE(reg.at("111.2222.333").valid);
            REQUIRE(reg.at("111.2222.333").expires_at() == 0.0);
            REQUIRE(sys.exists(dir));
        }
    }

    SECTION("DeadAgentWithoutSocketIsReaped") {
        auto dir = make_agent(sys, "111.2222.333", 500, false, sys.clock + 3600);

        REQUIRE(store.scan(ambient).empty());
        REQUIRE_FALSE(sys.exists(dir));
        REQUIRE_FALSE(sys.exists(dir + "/agent.pid"));
        REQUIRE_FALSE(sys.exists(dir + "/agent.expiration"));
    }

    SECTION("EmptyDirectoryIsReaped") {
        sys.add_dir(kTmp + "/ssh-agent-111.2222.333");
        REQUIRE(store.scan(ambient).empty());
        REQUIRE_FALSE(sys.exists(kTmp + "/ssh-agent-111.2222.333"));
    }

    SECTION("LivePidKeepsDirectory") {
        sys.add_process(500, 10.0);
        auto dir = make_agent(sys, "111.2222.333", 500, false, sys.clock + 3600);

        auto reg = store.scan(ambient);
        REQUIRE(reg.size() == 1);
        REQUIRE_FALSE(reg.at("111.2222.333").valid);
        REQUIRE(reg.at("111.2222.333").socket.empty());
        REQUIRE(sys.exists(dir));
    }

    SECTION("LeftoverSocketKeepsDirectory") {
        auto dir = make_agent(sys, "111.2222.333", 500, true, sys.clock + 3600);

        auto reg = store.scan(ambient);
        REQUIRE(reg.size() == 1);
        REQUIRE_FALSE(reg.at("111.2222.333").valid);
        REQUIRE(sys.exists(dir));
    }

    SECTION("ForeignOwnedSocketPathStillKeepsDirectory") {
        auto dir = make_agent(sys, "111.2222.333", 500, false, sys.clock + 3600);
        sys.add_socket(dir + "/agent.sock", FakeSystem::kOtherUid);

        auto reg = store.scan(ambient);
        REQUIRE(reg.size() == 1);
        REQUIRE(sys.exists(dir));
    }

    SECTION("SkipsNonMatchingAndForeignEntries") {
        sys.add_process(500, 10.0);
        make_agent(sys, "111.2222.333", 500, true, sys.clock + 3600);
        sys.add_dir(kTmp + "/ssh-XXXXabcdef");
        sys.add_file(kTmp + "/ssh-agent-222.3333.444", "not a directory");
        sys.add_dir(kTmp + "/ssh-agent-333.4444.555", FakeSystem::kOtherUid);

        auto reg = store.scan(ambient);
        REQUIRE(reg.size() == 1);
        REQUIRE(reg.contains("111.2222.333"));
        // Entries we do not own are never reaped.
        REQUIRE(sys.exists(kTmp + "/ssh-agent-333.4444.555"));
        REQUIRE(sys.exists(kTmp + "/ssh-agent-222.3333.444"));
    }

    SECTION("ExportedFlags") {
        sys.add_process(500, 10.0);
        auto dir = make_agent(sys, "111.2222.333", 500, true, sys.clock + 3600);
        ambient.agent_pid = "500";
        ambient.auth_sock = dir + "/agent.sock";

        auto reg = store.scan(ambient);
        REQUIRE(reg.at("111.2222.333").exported == PidSocketFlags{true, true});
        REQUIRE(reg.at("111.2222.333").is_exported());
    }

    SECTION("IdentitiesResolvedForValidAgents") {
        sys.add_process(500, 10.0);
        auto dir = make_agent(sys, "111.2222.333", 500, true, sys.clock + 3600);
        sys.add_file("/keys/work", kPemHeader);
        tools.key_fingerprints["/keys/work"] = "SHA256:work";
        tools.held[dir + "/agent.sock"] = {"SHA256:work"};

        auto reg = store.scan(ambient);
        REQUIRE(reg.at("111.2222.333").identities == std::vector<std::string>{"work"});
    }

    SECTION("OrderedBySpecifier") {
        sys.add_process(500, 10.0);
        sys.add_process(501, 10.0);
        make_agent(sys, "222.0000.000", 500, true, sys.clock + 3600);
        make_agent(sys, "111.0000.000", 501, true, sys.clock + 3600);

        auto reg = store.scan(ambient);
        REQUIRE(reg.begin()->first == "111.0000.000");
    }
}
