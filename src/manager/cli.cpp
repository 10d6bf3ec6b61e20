#include "cli.hpp"

std::expected<CommandLine, std::string> parse_command_line(int argc, const char* const argv[]) {
    CommandLine cl;

    auto value_of = [&](int& i, const std::string& opt) -> std::expected<std::string, std::string> {
        if (i + 1 >= argc) return std::unexpected("Option " + opt + " requires a value");
        return std::string(argv[++i]);
    };

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--verbose" || arg == "-v") {
            cl.verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            auto path = value_of(i, arg);
            if (!path) return std::unexpected(path.error());
            cl.config_path = *path;
        } else if (arg == "--specifier" || arg == "-s") {
            auto spec = value_of(i, arg);
            if (!spec) return std::unexpected(spec.error());
            cl.selector = Selector::by_specifier(*spec);
        } else if (arg == "--identity" || arg == "-i") {
            auto name = value_of(i, arg);
            if (!name) return std::unexpected(name.error());
            cl.selector = Selector::by_identity(*name);
        } else if (arg == "--all") {
            cl.all = true;
        } else if (arg == "--json") {
            cl.as_json = true;
        } else if (arg == "--help" || arg == "-h") {
            cl.help = true;
            return cl;
        } else if (arg.starts_with("-")) {
            return std::unexpected("Unknown option: " + arg);
        } else {
            cl.positional.push_back(arg);
        }
    }

    if (cl.positional.empty()) {
        return std::unexpected(std::string("No command given"));
    }
    return cl;
}
