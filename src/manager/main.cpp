#include "agent_registry.hpp"
#include "cli.hpp"
#include "config.hpp"
#include "platform/linux/linux_system.hpp"
#include "platform/linux/openssh_tools.hpp"
#include "report.hpp"

#include <nlohmann/json.hpp>
#include <print>
#include <string>
#include <vector>

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} [options] <command> [args]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  start [IDENTITY]            Start an agent (reuses a matching one)");
    std::println(stderr, "  stop [SELECTOR] [--all]     Stop an agent, or every managed agent");
    std::println(stderr, "  env [SELECTOR]              Print shell exports for an agent");
    std::println(stderr, "  status [SELECTOR] [--json]  Show agents");
    std::println(stderr, "Selectors:");
    std::println(stderr, "  -s, --specifier SPEC        Agent with this specifier");
    std::println(stderr, "  -i, --identity NAME         Agent holding this key file");
    std::println(stderr, "Options:");
    std::println(stderr, "  -c, --config PATH           Config file path");
    std::println(stderr, "  -v, --verbose               Enable verbose logging");
    std::println(stderr, "  -h, --help                  Show this help");
}

static int fail(const AgentError& err) {
    std::println(stderr, "Error: {}", err.message);
    return 1;
}

int main(int argc, char* argv[]) {
    auto parsed = parse_command_line(argc, argv);
    if (!parsed) {
        std::println(stderr, "{}", parsed.error());
        usage(argv[0]);
        return 2;
    }
    if (parsed->help) {
        usage(argv[0]);
        return 0;
    }

    const bool verbose = parsed->verbose;
    const bool all = parsed->all;
    const bool as_json = parsed->as_json;
    const std::string& config_path = parsed->config_path;
    const Selector& selector = parsed->selector;
    const std::vector<std::string>& positional = parsed->positional;
    const std::string command = positional[0];

    Config config;
    if (!config_path.empty()) {
        config = Config::load(config_path);
    } else {
        config = Config::load_default();
    }
    config.apply_env();

    if (auto ok = config.validate(); !ok) {
        return fail({AgentError::Kind::ConfigurationError, ok.error()});
    }

    LinuxSystem system;
    OpenSshTools tools(config.tools.agent, config.tools.add, config.tools.keygen);
    AgentRegistry registry(std::move(config), Ambient::capture(), system, tools, verbose);

    if (command == "start") {
        std::string identity = positional.size() > 1 ? positional[1] : "";
        auto started = registry.start(identity);
        if (!started) return fail(started.error());

        std::print("{}", report::export_lines(started->pid, started->socket));
        std::println(stderr, "{} agent {} (pid {})",
                     started->already_running ? "Reusing" : "Started",
                     started->specifier, started->pid);
        return 0;
    }

    if (command == "stop") {
        auto agents = registry.discover();
        if (all) {
            bool failed = false;
            for (auto& [spec, record] : agents) {
                if (!record.is_managed() || !registry.liveness().pid_valid(record.pid)) continue;
                if (!registry.stop(record)) failed = true;
                std::println(stderr, "Stopped agent {}", spec);
                if (record.is_exported()) std::print("{}", report::unset_lines());
            }
            return failed ? 1 : 0;
        }

        auto record = AgentRegistry::select(agents, selector);
        if (!record) return fail(record.error());

        bool cleaned = registry.stop(*record);
        std::println(stderr, "Stopped agent {}", record->specifier);
        if (record->is_exported()) std::print("{}", report::unset_lines());
        return cleaned ? 0 : 1;
    }

    if (command == "env") {
        auto record = AgentRegistry::select(registry.discover(), selector);
        if (!record) return fail(record.error());

        if (!record->valid) {
            std::println(stderr, "Warning: agent {} is not valid", record->specifier);
        }
        std::print("{}", report::export_lines(record->pid, record->socket));
        return 0;
    }

    if (command == "status") {
        auto agents = registry.discover();
        std::vector<AgentRecord> shown;
        if (selector.mode == Selector::Mode::Default) {
            for (auto& [spec, record] : agents) shown.push_back(record);
        } else {
            auto record = AgentRegistry::select(agents, selector);
            if (!record) return fail(record.error());
            shown.push_back(std::move(*record));
        }

        if (as_json) {
            auto arr = nlohmann::json::array();
            for (auto& record : shown) arr.push_back(report::to_json(record, registry.liveness()));
            std::println("{}", arr.dump(2));
            return 0;
        }

        if (shown.empty()) {
            std::println("No agents");
            return 0;
        }
        for (auto& record : shown) {
            std::print("{}", report::describe(record, registry.liveness(), system.now()));
        }
        return 0;
    }

    std::println(stderr, "Unknown command: {}", command);
    usage(argv[0]);
    return 2;
}
