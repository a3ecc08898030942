// main.cpp - Main entry point
#include <getopt.h>
#include <cstdlib>
#include <iostream>
#include <memory>
#include "conf/config.hpp"
#include "core/controller.hpp"
#include "core/errors.hpp"
#include "core/inventory.hpp"
#include "core/registry.hpp"
#include "core/state.hpp"
#include "defs.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;
using namespace modulate;

struct CliOptions {
    std::string config_file;
    std::string command;
    fs::path working_dir;
    fs::path backup_dir;
    fs::path mods_dir;
    bool verbose = false;
    bool discard_pending = false;
    std::string output;
    std::vector<std::string> args;
};

static void print_help() {
    std::cout << "Usage: modulate [OPTIONS] <command> [args...]\n\n";
    std::cout << "Source Commands:\n";
    std::cout << "  list               List sources, active ones in priority order\n";
    std::cout << "  enable <id>        Activate a source (highest priority)\n";
    std::cout << "  disable <id>       Deactivate a source\n";
    std::cout << "  order <id>...      Set the active order, lowest priority first\n\n";

    std::cout << "Deployment Commands:\n";
    std::cout << "  plan               Show the operations sync would apply\n";
    std::cout << "  sync               Deploy the active sources to the working dir\n";
    std::cout << "  clear              Deactivate everything and restore the working dir\n";
    std::cout << "  tree               Show the deployed tree\n\n";

    std::cout << "Configuration Commands (config <subcommand>):\n";
    std::cout << "  config gen         Generate default config file\n";
    std::cout << "  config show        Show current configuration\n\n";

    std::cout << "<id> is a source uuid or name.\n\n";

    std::cout << "Options:\n";
    std::cout << "  -c, --config FILE       Config file path\n";
    std::cout << "  -w, --workdir DIR       Working directory\n";
    std::cout << "  -b, --backupdir DIR     Backup directory\n";
    std::cout << "  -m, --modsdir DIR       Directory holding the sources\n";
    std::cout << "  -v, --verbose           Verbose logging\n";
    std::cout << "  -o, --output FILE       Output file (for config gen)\n";
    std::cout << "  -d, --discard-pending   Forget an interrupted sync (for sync)\n";
    std::cout << "  -h, --help              Show this help\n";
    std::cout << "\nExamples:\n";
    std::cout << "  modulate enable my-mod         # Activate my-mod\n";
    std::cout << "  modulate sync                  # Deploy\n";
    std::cout << "  modulate -v plan               # Dry run\n";
}

static CliOptions parse_args(int argc, char* argv[]) {
    CliOptions opts;

    static struct option long_options[] = {{"config", required_argument, 0, 'c'},
                                           {"workdir", required_argument, 0, 'w'},
                                           {"backupdir", required_argument, 0, 'b'},
                                           {"modsdir", required_argument, 0, 'm'},
                                           {"verbose", no_argument, 0, 'v'},
                                           {"output", required_argument, 0, 'o'},
                                           {"discard-pending", no_argument, 0, 'd'},
                                           {"help", no_argument, 0, 'h'},
                                           {0, 0, 0, 0}};

    int opt;
    int option_index = 0;

    while ((opt = getopt_long(argc, argv, "c:w:b:m:vo:dh", long_options, &option_index)) != -1) {
        switch (opt) {
        case 'c':
            opts.config_file = optarg;
            break;
        case 'w':
            opts.working_dir = optarg;
            break;
        case 'b':
            opts.backup_dir = optarg;
            break;
        case 'm':
            opts.mods_dir = optarg;
            break;
        case 'v':
            opts.verbose = true;
            break;
        case 'o':
            opts.output = optarg;
            break;
        case 'd':
            opts.discard_pending = true;
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
    Config config =
        opts.config_file.empty() ? Config::load_default() : Config::from_file(opts.config_file);
    config.merge_with_cli(opts.working_dir, opts.backup_dir, opts.mods_dir, opts.verbose);
    return config;
}

// Everything a command needs: the sources, the persisted order and the
// deployed tree.
struct Session {
    Config config;
    SourceRegistry registry;
    std::unique_ptr<OverlayController> controller;

    std::string uuid_of(const SourceHandle& handle) const {
        if (!registry.contains(handle)) {
            return "";
        }
        return registry.get(handle).metadata.uuid;
    }

    std::string name_of(const SourceHandle& handle) const {
        if (!registry.contains(handle)) {
            return to_string(handle);
        }
        return registry.get(handle).metadata.name;
    }

    SourceHandle handle_of(const std::string& uuid) const {
        auto found = uuid.empty() ? std::nullopt : registry.find(uuid);
        return found ? *found : SourceHandle{};
    }

    SourceHandle resolve(const std::string& id) const {
        auto found = registry.find(id);
        if (!found) {
            throw OverlayError(ErrorKind::InvalidHandle, "no source named '" + id + "'");
        }
        return *found;
    }
};

static void open_session(Session& session) {
    for (auto& source : discover_sources(session.config.mods_dir)) {
        session.registry.add_source(std::move(source));
    }

    RuntimeState state = load_runtime_state(session.config.state_file);
    for (const auto& uuid : state.active_sources) {
        auto handle = session.registry.find(uuid);
        if (!handle) {
            LOG_WARN("Active source " + uuid + " is no longer available");
            continue;
        }
        session.registry.activate(*handle);
    }

    session.controller = std::make_unique<OverlayController>(
        session.registry, session.config.working_dir, session.config.backup_dir,
        session.config.conflict_policy);

    auto handle_of = [&session](const std::string& uuid) { return session.handle_of(uuid); };
    std::optional<ProvenancedNode> pending;
    if (state.has_pending) {
        pending = build_tree(state.pending_applied, handle_of);
    }
    session.controller->restore(build_tree(state.deployed, handle_of), std::move(pending));
}

static bool save_session(const Session& session) {
    auto uuid_of = [&session](const SourceHandle& handle) { return session.uuid_of(handle); };

    RuntimeState state;
    for (const auto& handle : session.registry.active_handles()) {
        state.active_sources.push_back(session.uuid_of(handle));
    }
    state.deployed = flatten_tree(session.controller->deployed(), uuid_of);
    if (const ProvenancedNode* applied = session.controller->pending_applied()) {
        state.has_pending = true;
        state.pending_applied = flatten_tree(*applied, uuid_of);
    }

    if (!state.save(session.config.state_file)) {
        std::cerr << "Failed to save state to " << session.config.state_file << "\n";
        return false;
    }
    return true;
}

static void print_source_list(const Session& session) {
    const auto& active = session.registry.active_handles();
    std::cout << "Active sources (lowest priority first):\n";
    if (active.empty()) {
        std::cout << "  (none)\n";
    }
    for (size_t i = 0; i < active.size(); ++i) {
        const Source& source = session.registry.get(active[i]);
        std::cout << "  " << i + 1 << ". " << source.metadata.name << " "
                  << source.metadata.version << " [" << source.metadata.uuid << "]\n";
    }

    std::cout << "Inactive sources:\n";
    if (session.registry.inactive_handles().empty()) {
        std::cout << "  (none)\n";
    }
    for (const auto& handle : session.registry.inactive_handles()) {
        const Source& source = session.registry.get(handle);
        std::cout << "  - " << source.metadata.name << " " << source.metadata.version << " ["
                  << source.metadata.uuid << "]\n";
    }

    if (session.controller->has_pending()) {
        std::cout << "\nAn interrupted sync is pending; run 'modulate sync' to resume.\n";
    }
}

static int run_sync(Session& session) {
    SyncReport report = session.controller->synchronize();
    bool saved = save_session(session);

    if (!report.ok()) {
        const OperationFailure& failure = *report.failure();
        std::cerr << "Sync failed at operation " << failure.index + 1 << " of "
                  << report.execution.total << " (" << to_string(failure.kind)
                  << "): " << failure.message << "\n";
        std::cerr << report.execution.completed << " operations are applied; fix the cause "
                  << "or change the active sources and run 'modulate sync' again.\n";
        return 1;
    }

    if (report.resumed) {
        std::cout << "Recovered from an interrupted sync.\n";
    }
    std::cout << "Applied " << report.execution.applied() << " operations.\n";
    return saved ? 0 : 1;
}

int main(int argc, char* argv[]) {
    try {
        CliOptions cli = parse_args(argc, argv);

        if (cli.command.empty()) {
            print_help();
            return 0;
        }

        Config config = load_config(cli);

        // Initialize logger globally for all commands
        Logger::getInstance().init(config.verbose, config.log_file);

        if (cli.command == "config") {
            if (cli.args.empty()) {
                std::cerr << "Usage: modulate config <gen|show>\n";
                return 1;
            }
            std::string subcmd = cli.args[0];
            if (subcmd == "gen") {
                std::string output = cli.output.empty() ? CONFIG_FILENAME : cli.output;
                if (!Config().save_to_file(output)) {
                    std::cerr << "Failed to write " << output << "\n";
                    return 1;
                }
                std::cout << "Generated config: " << output << "\n";
                return 0;
            } else if (subcmd == "show") {
                std::cout << "working_dir = " << config.working_dir.string() << "\n";
                std::cout << "backup_dir = " << config.backup_dir.string() << "\n";
                std::cout << "mods_dir = " << config.mods_dir.string() << "\n";
                std::cout << "state_file = " << config.state_file.string() << "\n";
                std::cout << "log_file = " << config.log_file.string() << "\n";
                std::cout << "verbose = " << (config.verbose ? "true" : "false") << "\n";
                std::cout << "conflict_policy = " << to_string(config.conflict_policy) << "\n";
                return 0;
            }
            std::cerr << "Unknown config subcommand: " << subcmd << "\n";
            std::cerr << "Available: gen, show\n";
            return 1;
        }

        Session session;
        session.config = config;
        open_session(session);

        if (cli.command == "list") {
            print_source_list(session);
            return 0;
        } else if (cli.command == "enable" || cli.command == "disable") {
            if (cli.args.empty()) {
                std::cerr << "Usage: modulate " << cli.command << " <id>...\n";
                return 1;
            }
            for (const auto& id : cli.args) {
                SourceHandle handle = session.resolve(id);
                if (cli.command == "enable") {
                    session.registry.activate(handle);
                } else {
                    session.registry.deactivate(handle);
                }
            }
            std::cout << "Run 'modulate sync' to apply.\n";
            return save_session(session) ? 0 : 1;
        } else if (cli.command == "order") {
            std::vector<SourceHandle> order;
            for (const auto& id : cli.args) {
                order.push_back(session.resolve(id));
            }
            session.registry.reorder(order);
            std::cout << "Run 'modulate sync' to apply.\n";
            return save_session(session) ? 0 : 1;
        } else if (cli.command == "plan") {
            std::vector<Operation> ops = session.controller->plan();
            if (ops.empty()) {
                std::cout << "Nothing to do.\n";
            }
            for (const auto& op : ops) {
                std::cout << to_string(op.kind) << " " << op.path;
                if (op.kind == OperationKind::CreateFile ||
                    op.kind == OperationKind::ChangeSource) {
                    std::cout << " <- " << session.name_of(op.source);
                }
                std::cout << "\n";
            }
            return 0;
        } else if (cli.command == "sync") {
            if (cli.discard_pending) {
                session.controller->discard_pending();
            }
            return run_sync(session);
        } else if (cli.command == "clear") {
            std::vector<SourceHandle> active = session.registry.active_handles();
            for (const auto& handle : active) {
                session.registry.deactivate(handle);
            }
            return run_sync(session);
        } else if (cli.command == "tree") {
            session.controller->deployed().print(std::cout);
            return 0;
        }

        std::cerr << "Unknown command: " << cli.command << "\n";
        print_help();
        return 1;
    } catch (const OverlayError& e) {
        LOG_ERROR(e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
