#include <iostream>
#include <string>
#include <vector>
#include <fmt/format.h>
#include "cli/theme.hpp"
#include <core/config.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <ssh/client.hpp>

static constexpr const char* KTEST_VERSION = "0.1.0";

static void print_usage() {
    std::cout << "\n" << theme::color::BOLD << "  ktest" << theme::color::RESET
              << theme::dim("  remote command runner for test hosts") << "\n\n";
    std::cout << theme::usage("ktest connect", "Connect, verify the host and disconnect");
    std::cout << theme::usage("ktest run <command>", "Run a command and print its output");
    std::cout << theme::usage("ktest send <local> <remote>", "Copy a file to the host");
    std::cout << theme::usage("ktest download <remote> <local>", "Copy a file from the host");
    std::cout << "\n";
    std::cout << theme::usage("--config PATH", "Config file (default ~/.ktest/config.yaml)");
    std::cout << theme::usage("--retries N", "Reconnect and retry up to N times");
    std::cout << theme::usage("--retry-interval SECS", "Wait between retries");
    std::cout << theme::usage("--timeout SECS", "Per-attempt deadline (0 = none)");
    std::cout << theme::usage("--env NAME=VALUE", "Set a remote environment variable");
    std::cout << theme::usage("--quiet", "Do not log per-operation timing");
    std::cout << theme::usage("--verbose", "Echo the debug log to stderr");
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    ktest --version        Show version\n"
              << "    ktest --help           Show this help"
              << theme::color::RESET << "\n\n";
}

struct CliArgs {
    std::string config_path;
    std::string command;
    std::vector<std::string> positional;
    OpOptions opts;
    bool echo_log = false;
};

// Returns false (after printing why) on a malformed command line
static bool parse_args(int argc, char** argv, CliArgs& args) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        auto value = [&](std::string& out) {
            if (i + 1 >= argc) {
                std::cout << theme::fail("Missing value for " + arg);
                return false;
            }
            out = argv[++i];
            return true;
        };
        auto seconds = [&](std::chrono::milliseconds& out) {
            std::string v;
            if (!value(v)) return false;
            int secs = safe_stoi(v, -1);
            if (secs < 0) {
                std::cout << theme::fail(fmt::format("Invalid {} value: {}", arg, v));
                return false;
            }
            out = std::chrono::seconds(secs);
            return true;
        };

        if (arg == "--config") {
            if (!value(args.config_path)) return false;
        } else if (arg == "--retries") {
            std::string v;
            if (!value(v)) return false;
            args.opts.retries = safe_stoi(v, -1);
            if (args.opts.retries < 0) {
                std::cout << theme::fail("Invalid --retries value: " + v);
                return false;
            }
        } else if (arg == "--retry-interval") {
            if (!seconds(args.opts.retry_interval)) return false;
        } else if (arg == "--timeout") {
            if (!seconds(args.opts.timeout)) return false;
        } else if (arg == "--env") {
            std::string v;
            if (!value(v)) return false;
            auto eq = v.find('=');
            if (eq == std::string::npos || eq == 0) {
                std::cout << theme::fail("Expected NAME=VALUE for --env, got: " + v);
                return false;
            }
            args.opts.env[v.substr(0, eq)] = v.substr(eq + 1);
        } else if (arg == "--quiet") {
            args.opts.verbose = false;
        } else if (arg == "--verbose") {
            args.echo_log = true;
        } else if (arg.rfind("--", 0) == 0) {
            std::cout << theme::fail("Unknown option: " + arg);
            return false;
        } else if (args.command.empty()) {
            args.command = arg;
        } else {
            args.positional.push_back(arg);
        }
    }
    return true;
}

static bool expect_positional(const CliArgs& args, size_t count, const std::string& usage) {
    if (args.positional.size() == count) return true;
    std::cout << theme::fail("Usage: " + usage);
    return false;
}

static int report(const SSHResult& result) {
    if (!result.output.empty()) {
        std::cout << result.output;
        if (result.output.back() != '\n') std::cout << "\n";
    }
    if (result.failed()) {
        std::cout << theme::fail(result.describe());
        return 1;
    }
    return 0;
}

int main(int argc, char** argv) {
    try {
        if (argc >= 2) {
            std::string first = argv[1];
            if (first == "--version") {
                std::cout << "ktest version " << KTEST_VERSION << "\n";
                return 0;
            }
            if (first == "--help" || first == "-h") {
                print_usage();
                return 0;
            }
        }

        CliArgs args;
        if (!parse_args(argc, argv, args)) return 1;
        if (args.command.empty()) {
            print_usage();
            return 1;
        }

        auto loaded = args.config_path.empty() ? Config::load_default()
                                               : Config::load(args.config_path);
        if (loaded.is_err()) {
            std::cout << theme::fail(loaded.error);
            return 1;
        }
        Config config = loaded.value;
        config.apply_env_overrides();
        auto valid = config.validate();
        if (valid.is_err()) {
            std::cout << theme::fail(valid.error);
            return 1;
        }

        if (!config.log_path().empty()) set_log_path(config.log_path());
        set_log_echo(args.echo_log || config.log_echo());

        const std::string& cmd = args.command;
        if (cmd != "connect" && cmd != "run" && cmd != "send" && cmd != "download") {
            std::cout << theme::fail("Unknown command: " + cmd);
            print_usage();
            return 1;
        }
        if (cmd == "connect" && !expect_positional(args, 0, "ktest connect")) return 1;
        if (cmd == "run" && args.positional.empty()) {
            std::cout << theme::fail("Usage: ktest run <command>");
            return 1;
        }
        if (cmd == "send" && !expect_positional(args, 2, "ktest send <local> <remote>")) return 1;
        if (cmd == "download" && !expect_positional(args, 2, "ktest download <remote> <local>")) return 1;

        SSHClient client(config.client_config());
        auto connected = client.connect();
        if (connected.failed()) {
            std::cout << theme::fail(connected.describe());
            return 1;
        }

        int status = 0;
        if (cmd == "connect") {
            std::cout << theme::ok("Connected to " + config.target().identity());
        } else if (cmd == "run") {
            std::string command;
            for (const auto& part : args.positional) {
                if (!command.empty()) command += " ";
                command += part;
            }
            status = report(client.run(command, args.opts));
        } else if (cmd == "send") {
            status = report(client.send(args.positional[0], args.positional[1], args.opts));
        } else {
            status = report(client.download(args.positional[0], args.positional[1], args.opts));
        }

        client.close();
        return status;
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
