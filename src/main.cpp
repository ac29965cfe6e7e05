// main.cpp - Main entry point
#include <getopt.h>
#include <cstdlib>
#include <iostream>
#include <set>
#include "conf/config.hpp"
#include "core/executor.hpp"
#include "core/inventory.hpp"
#include "core/reconciler.hpp"
#include "core/state.hpp"
#include "ctl/hymofs.hpp"
#include "ctl/rule_list.hpp"
#include "defs.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;
using namespace hymoctl;

struct CliOptions {
    std::string config_file;
    std::string command;
    fs::path moduledir;
    fs::path device;
    bool verbose = false;
    bool raw = false;
    std::vector<std::string> partitions;
    std::string output;
    std::vector<std::string> args;
};

static void print_help() {
    std::cout << "Usage: hymoctl [OPTIONS] <command> [args...]\n\n";
    std::cout << "Kernel Commands:\n";
    std::cout << "  status             Show device presence and modules with loaded rules\n";
    std::cout << "  version            Show the kernel protocol version\n";
    std::cout << "  list               List active rules (JSON, or raw text with --raw)\n";
    std::cout << "  clear              Clear all rules\n\n";

    std::cout << "Rule Commands (raw <subcommand>):\n";
    std::cout << "  raw add <src> <target> [type]  Redirect src to target\n";
    std::cout << "  raw delete <src>               Delete the rule for src\n";
    std::cout << "  raw hide <path>                Hide path from directory listings\n";
    std::cout << "  raw inject <dir>               Mark dir as injectable\n\n";

    std::cout << "Tree Commands:\n";
    std::cout << "  inject <target_base> <module_dir>  Overlay module_dir onto target_base\n";
    std::cout << "  remove <target_base> <module_dir>  Remove the rules of that overlay\n\n";

    std::cout << "Module Commands (module <subcommand>):\n";
    std::cout << "  module list        List enabled modules\n";
    std::cout << "  module add <id>    Apply a module's partitions\n";
    std::cout << "  module delete <id> Remove a module's rules\n\n";

    std::cout << "Configuration Commands (config <subcommand>):\n";
    std::cout << "  config gen         Generate default config file\n";
    std::cout << "  config show        Show current configuration\n\n";

    std::cout << "Options:\n";
    std::cout << "  -c, --config FILE       Config file path\n";
    std::cout << "  -m, --moduledir DIR     Module directory\n";
    std::cout << "  -d, --device PATH       Control device path\n";
    std::cout << "  -v, --verbose           Verbose logging\n";
    std::cout << "  -p, --partition NAME    Add partition (can be used multiple times)\n";
    std::cout << "  -r, --raw               Raw output for list\n";
    std::cout << "  -o, --output FILE       Output file (for config gen)\n";
    std::cout << "  -h, --help              Show this help\n";
    std::cout << "\nExamples:\n";
    std::cout << "  hymoctl status                          # Probe the device\n";
    std::cout << "  hymoctl inject /system /data/mod/system # Overlay a tree\n";
    std::cout << "  hymoctl module add my_module            # Apply a module\n";
}

static CliOptions parse_args(int argc, char* argv[]) {
    CliOptions opts;

    static struct option long_options[] = {{"config", required_argument, 0, 'c'},
                                           {"moduledir", required_argument, 0, 'm'},
                                           {"device", required_argument, 0, 'd'},
                                           {"verbose", no_argument, 0, 'v'},
                                           {"partition", required_argument, 0, 'p'},
                                           {"raw", no_argument, 0, 'r'},
                                           {"output", required_argument, 0, 'o'},
                                           {"help", no_argument, 0, 'h'},
                                           {0, 0, 0, 0}};

    int opt;
    int option_index = 0;

    while ((opt = getopt_long(argc, argv, "c:m:d:vp:ro:h", long_options, &option_index)) != -1) {
        switch (opt) {
        case 'c':
            opts.config_file = optarg;
            break;
        case 'm':
            opts.moduledir = optarg;
            break;
        case 'd':
            opts.device = optarg;
            break;
        case 'v':
            opts.verbose = true;
            break;
        case 'p':
            opts.partitions.push_back(optarg);
            break;
        case 'r':
            opts.raw = true;
            break;
        case 'o':
            opts.output = optarg;
            break;
        case 'h':
            print_help();
            exit(0);
        default:
            print_help();
            exit(1);
        }
    }

    if (optind < argc) {
        opts.command = argv[optind];
        optind++;
        while (optind < argc) {
            opts.args.push_back(argv[optind]);
            optind++;
        }
    }

    return opts;
}

static Config load_config(const CliOptions& opts) {
    Config config;
    if (!opts.config_file.empty()) {
        config = Config::from_file(opts.config_file);
    } else {
        config = Config::load_default();
    }
    config.merge_with_cli(opts.moduledir, opts.device, opts.verbose, opts.partitions);
    return config;
}

static void print_config(const Config& config, ControlChannel& channel) {
    std::cout << "{\n";
    std::cout << "  \"moduledir\": \"" << json_escape(config.moduledir.string()) << "\",\n";
    std::cout << "  \"device\": \"" << json_escape(config.device.string()) << "\",\n";
    std::cout << "  \"target_root\": \"" << json_escape(config.target_root.string()) << "\",\n";
    std::cout << "  \"state_dir\": \"" << json_escape(config.state_dir.string()) << "\",\n";
    std::cout << "  \"log_file\": \"" << json_escape(config.log_file.string()) << "\",\n";
    std::cout << "  \"verbose\": " << (config.verbose ? "true" : "false") << ",\n";
    std::cout << "  \"hymofs_status\": \"" << status_name(channel.check_status()) << "\",\n";
    std::cout << "  \"partitions\": [";
    for (size_t i = 0; i < config.partitions.size(); ++i) {
        std::cout << "\"" << json_escape(config.partitions[i]) << "\"";
        if (i < config.partitions.size() - 1)
            std::cout << ", ";
    }
    std::cout << "]\n";
    std::cout << "}\n";
}

static int report_stats(const std::string& what, const ApplyStats& stats) {
    std::cout << what << ": " << (stats.attempted - stats.failed) << "/" << stats.attempted
              << " rules applied";
    if (stats.failed > 0) {
        std::cout << " (" << stats.failed << " failed, see log)";
    }
    std::cout << "\n";
    return stats.failed == 0 ? 0 : 1;
}

int main(int argc, char* argv[]) {
    try {
        CliOptions cli = parse_args(argc, argv);

        Logger::getInstance().init(cli.verbose, fs::path());

        if (cli.command.empty()) {
            print_help();
            return 0;
        }

        Config config = load_config(cli);
        Logger::getInstance().init(config.verbose, config.log_file);

        HymoFS hymofs(config.device);

        enum class Command {
            STATUS,
            VERSION,
            LIST,
            CLEAR,
            RAW,
            INJECT,
            REMOVE,
            MODULE,
            CONFIG,
            UNKNOWN
        };

        auto get_command = [](const std::string& cmd) -> Command {
            if (cmd == "status")
                return Command::STATUS;
            if (cmd == "version")
                return Command::VERSION;
            if (cmd == "list")
                return Command::LIST;
            if (cmd == "clear")
                return Command::CLEAR;
            if (cmd == "raw")
                return Command::RAW;
            if (cmd == "inject")
                return Command::INJECT;
            if (cmd == "remove")
                return Command::REMOVE;
            if (cmd == "module")
                return Command::MODULE;
            if (cmd == "config")
                return Command::CONFIG;
            return Command::UNKNOWN;
        };

        switch (get_command(cli.command)) {
        case Command::STATUS: {
            HymoFSStatus status = hymofs.check_status();
            std::cout << "{\n";
            std::cout << "  \"device\": \"" << json_escape(config.device.string()) << "\",\n";
            std::cout << "  \"status\": \"" << status_name(status) << "\",\n";
            std::cout << "  \"available\": "
                      << (status == HymoFSStatus::Available ? "true" : "false") << ",\n";
            std::cout << "  \"active_modules\": [";
            if (auto active = kernel_active_modules(hymofs, config.moduledir.string())) {
                size_t i = 0;
                for (const auto& id : *active) {
                    std::cout << (i++ ? ", " : "") << "\"" << json_escape(id) << "\"";
                }
            }
            std::cout << "]\n";
            std::cout << "}\n";
            return 0;
        }

        case Command::VERSION: {
            auto version = hymofs.get_version();
            if (!version) {
                std::cerr << "HymoFS protocol version unknown (device " << config.device.string()
                          << " not usable).\n";
                return 1;
            }
            std::cout << *version << "\n";

            RuntimeState state = load_runtime_state(config.state_dir);
            if (state.kernel_version != *version) {
                state.kernel_version = *version;
                state.save(config.state_dir);
            }
            return 0;
        }

        case Command::LIST: {
            std::string dump = hymofs.list_active_rules();
            if (cli.raw) {
                std::cout << dump;
                if (!dump.empty() && dump.back() != '\n')
                    std::cout << "\n";
                return 0;
            }
            std::vector<RuleEntry> rules = parse_rule_listing(dump);
            std::cout << rules_to_json(rules) << "\n";
            return 0;
        }

        case Command::CLEAR: {
            hymofs.clear_rules();
            RuntimeState state = load_runtime_state(config.state_dir);
            if (!state.active_module_ids.empty()) {
                state.active_module_ids.clear();
                state.save(config.state_dir);
            }
            std::cout << "All rules cleared.\n";
            LOG_INFO("CLI: Cleared all rules");
            return 0;
        }

        case Command::RAW: {
            if (cli.args.empty()) {
                std::cerr << "Usage: hymoctl raw <add|delete|hide|inject> ...\n";
                return 1;
            }
            std::string cmd = cli.args[0];

            if (cmd == "add") {
                if (cli.args.size() < 3) {
                    std::cerr << "Usage: hymoctl raw add <src> <target> [type]\n";
                    return 1;
                }
                uint8_t type = 0;
                if (cli.args.size() >= 4) {
                    auto parsed = parse_rule_type(cli.args[3]);
                    if (!parsed) {
                        std::cerr << "Rule type must be a number within 0..255\n";
                        std::cerr << "Usage: hymoctl raw add <src> <target> [type]\n";
                        return 1;
                    }
                    type = *parsed;
                }
                hymofs.add_rule(cli.args[1], cli.args[2], type);
            } else if (cmd == "delete" || cmd == "hide" || cmd == "inject") {
                if (cli.args.size() < 2) {
                    std::cerr << "Usage: hymoctl raw " << cmd << " <path>\n";
                    return 1;
                }
                if (cmd == "delete")
                    hymofs.delete_rule(cli.args[1]);
                else if (cmd == "hide")
                    hymofs.hide_path(cli.args[1]);
                else
                    hymofs.inject_dir(cli.args[1]);
            } else {
                std::cerr << "Unknown raw command: " << cmd << "\n";
                std::cerr << "Available: add, delete, hide, inject\n";
                return 1;
            }

            std::cout << "Command executed successfully.\n";
            LOG_INFO("Executed raw command: " + cmd);
            return 0;
        }

        case Command::INJECT:
        case Command::REMOVE: {
            if (cli.args.size() < 2) {
                std::cerr << "Usage: hymoctl " << cli.command << " <target_base> <module_dir>\n";
                return 1;
            }
            fs::path target_base = cli.args[0];
            fs::path module_dir = cli.args[1];
            if (!is_real_directory(module_dir)) {
                std::cout << "Nothing to do: " << module_dir.string() << " is not a directory\n";
                return 0;
            }

            if (get_command(cli.command) == Command::INJECT) {
                return report_stats("Injected " + module_dir.string(),
                                    inject_directory(hymofs, target_base, module_dir));
            }
            return report_stats("Removed " + module_dir.string(),
                                remove_directory_rules(hymofs, target_base, module_dir));
        }

        case Command::MODULE: {
            if (cli.args.empty()) {
                std::cerr << "Usage: hymoctl module <list|add|delete>\n";
                return 1;
            }
            std::string subcmd = cli.args[0];

            if (subcmd == "list") {
                RuntimeState state = load_runtime_state(config.state_dir);
                auto modules = scan_modules(config.moduledir);
                auto loaded = kernel_active_modules(hymofs, config.moduledir.string());
                std::cout << "[";
                for (size_t i = 0; i < modules.size(); ++i) {
                    const Module& m = modules[i];
                    std::cout << (i == 0 ? "\n" : ",\n");
                    std::cout << "  {\"id\": \"" << json_escape(m.id) << "\", \"name\": \""
                              << json_escape(m.name) << "\", \"version\": \""
                              << json_escape(m.version) << "\", \"author\": \""
                              << json_escape(m.author) << "\", \"active\": "
                              << (state.is_active(m.id) ? "true" : "false")
                              << ", \"rules_loaded\": "
                              << (loaded && loaded->count(m.id) ? "true" : "false") << "}";
                }
                std::cout << (modules.empty() ? "]\n" : "\n]\n");
                return 0;
            }

            if (subcmd != "add" && subcmd != "delete") {
                std::cerr << "Unknown module subcommand: " << subcmd << "\n";
                std::cerr << "Available: list, add, delete\n";
                return 1;
            }
            if (cli.args.size() < 2) {
                std::cerr << "Usage: hymoctl module " << subcmd << " <module_id>\n";
                return 1;
            }
            std::string module_id = cli.args[1];
            if (!is_real_directory(config.moduledir / module_id)) {
                std::cerr << "Error: Module not found: " << module_id << "\n";
                return 1;
            }

            RuntimeState state = load_runtime_state(config.state_dir);
            if (subcmd == "add") {
                ModuleResult result = apply_module(hymofs, config, module_id);
                if (!result.has_content()) {
                    std::cout << "No content found to add for module " << module_id << "\n";
                    return 0;
                }
                if (state.mark_active(module_id))
                    state.save(config.state_dir);
                LOG_INFO("CLI: Added module " + module_id);
                return report_stats("Module " + module_id, result.stats);
            }

            ModuleResult result = revert_module(hymofs, config, module_id);
            if (state.mark_inactive(module_id))
                state.save(config.state_dir);
            if (!result.has_content()) {
                std::cout << "No active rules found for module " << module_id << "\n";
                return 0;
            }
            LOG_INFO("CLI: Removed rules for module " + module_id);
            return report_stats("Module " + module_id, result.stats);
        }

        case Command::CONFIG: {
            if (cli.args.empty()) {
                std::cerr << "Usage: hymoctl config <gen|show>\n";
                return 1;
            }
            std::string subcmd = cli.args[0];

            if (subcmd == "gen") {
                fs::path output = cli.output.empty() ? default_config_path() : fs::path(cli.output);
                if (!Config().save_to_file(output)) {
                    std::cerr << "Failed to write config: " << output.string() << "\n";
                    return 1;
                }
                std::cout << "Generated config: " << output.string() << "\n";
                return 0;
            } else if (subcmd == "show") {
                print_config(config, hymofs);
                return 0;
            }
            std::cerr << "Unknown config subcommand: " << subcmd << "\n";
            std::cerr << "Available: gen, show\n";
            return 1;
        }

        case Command::UNKNOWN:
            break;
        }

        std::cerr << "Unknown command: " << cli.command << "\n\n";
        print_help();
        return 1;
    } catch (const ControlError& e) {
        std::cerr << "Error [" << error_kind_name(e.kind()) << "]: " << e.what() << "\n";
        LOG_ERROR(e.what());
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal Error: " << e.what() << "\n";
        LOG_ERROR("Fatal Error: " + std::string(e.what()));
        return 1;
    }
}
