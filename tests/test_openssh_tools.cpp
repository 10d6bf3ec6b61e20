#include <catch2/catch_test_macros.hpp>

#include "platform/linux/openssh_tools.hpp"
#include "platform/linux/subprocess.hpp"

TEST_CASE("OpenSshTools output parsing", "[tools]") {

    SECTION("AgentPid") {
        std::string out = "SSH_AUTH_SOCK=/tmp/ssh-agent-1/agent.sock; export SSH_AUTH_SOCK;\n"
                          "SSH_AGENT_PID=31337; export SSH_AGENT_PID;\n"
                          "echo Agent pid 31337;\n";
        REQUIRE(OpenSshTools::parse_agent_pid(out) == 31337);
        REQUIRE(OpenSshTools::parse_agent_pid("echo nothing;\n") == -1);
        REQUIRE(OpenSshTools::parse_agent_pid("SSH_AGENT_PID=; export") == -1);
    }

    SECTION("FingerprintField") {
        REQUIRE(OpenSshTools::fingerprint_field(
                    "256 SHA256:p9Wk2Yx/9QvX8a4U me@host (ED25519)") == "SHA256:p9Wk2Yx/9QvX8a4U");
        REQUIRE(OpenSshTools::fingerprint_field("3072 MD5:aa:bb:cc /home/me/.ssh/id_rsa (RSA)") ==
                "MD5:aa:bb:cc");
        REQUIRE(OpenSshTools::fingerprint_field("").empty());
        REQUIRE(OpenSshTools::fingerprint_field("256").empty());
    }
}

TEST_CASE("run_command", "[tools]") {

    SECTION("CapturesStdout") {
        auto res = run_command({"sh", "-c", "echo hello"});
        REQUIRE(res.has_value());
        REQUIRE(res->exit_code == 0);
        REQUIRE(res->out == "hello\n");
    }

    SECTION("PassesEnvironment") {
        auto res = run_command({"sh", "-c", "echo $SSH_AGENT_PID:$SSH_AUTH_SOCK"},
                               {{"SSH_AGENT_PID", "12"}, {"SSH_AUTH_SOCK", "/s"}});
        REQUIRE(res.has_value());
        REQUIRE(res->out == "12:/s\n");
    }

    SECTION("ReportsExitCode") {
        auto res = run_command({"sh", "-c", "exit 3"});
        REQUIRE(res.has_value());
        REQUIRE(res->exit_code == 3);
    }

    SECTION("MissingExecutable") {
        auto res = run_command({"definitely-not-a-real-binary-xyz"});
        REQUIRE_FALSE(res.has_value());
    }

    SECTION("SpawnFailureFromFakeAgent") {
        OpenSshTools tools("false", "false", "false");
        auto pid = tools.spawn_agent(60, "/tmp/unused.sock");
        REQUIRE_FALSE(pid.has_value());

        auto fp = tools.fingerprint("/nonexistent");
        REQUIRE_FALSE(fp.has_value());
    }

    SECTION("NoIdentitiesExitCode") {
        // ssh-add -l exits 1 when the agent holds nothing.
        OpenSshTools tools("true", "false", "true");
        auto held = tools.list_fingerprints("1", "/tmp/unused.sock");
        REQUIRE(held.has_value());
        REQUIRE(held->empty());
    }
}
