// prana: Command-line interface for the self-regulation loop
//
// Usage: prana <command> [options]
//
// Commands:
//   run        Drive the orchestrator until warp drive (Ctrl-C stops it)
//   replay     Apply a JSON event file to a fresh agent and diagnose it
//   config     Print the effective configuration
//   help       Show this help

#include <prana/prana.hpp>
#include <iostream>
#include <string>
#include <cstring>
#include <cstdlib>
#include <csignal>
#include <thread>
#include <chrono>
#include <atomic>
#include <fstream>
#include <iomanip>

using namespace prana;

// Get program name from path
static const char* prog_name(const char* path) {
    const char* last = path;
    for (const char* p = path; *p; ++p) {
        if (*p == '/') last = p + 1;
    }
    return last;
}

// Signal handler for graceful shutdown
static std::atomic<bool> stop_requested{false};

static void stop_signal_handler(int sig) {
    (void)sig;
    stop_requested = true;
}

void print_usage(const char* prog) {
    const char* name = prog_name(prog);
    std::cerr << "prana " << PRANA_VERSION << " - Agent self-regulation loop\n\n"
              << "Usage: " << name << " <command> [options]\n\n"
              << "Commands:\n"
              << "  run                Drive the phase orchestrator to warp drive\n"
              << "  replay <file>      Replay a JSON event list into a fresh agent\n"
              << "  config             Print the effective configuration as JSON\n"
              << "  version            Show version\n"
              << "  help               Show this help\n\n"
              << "Options:\n"
              << "  --config PATH      Load configuration from a JSON file\n"
              << "  --efficiency X     Efficiency reported by every team (run, default 0.9)\n"
              << "  --heal             Run a heal pass after replay\n"
              << "  --json             Output as JSON\n"
              << "  --seed N           Seed memory noise and scrubbing (0 = random)\n"
              << "  --verbose          Enable verbose debug logging\n"
              << "  -v, --version      Show version\n";
}

static void print_status(const Agent& agent) {
    const auto& orch = agent.orchestrator();
    std::cout << "Phase:       " << phase_name(orch.phase())
              << (orch.is_light_speed() ? " (light speed)" : "") << "\n";
    std::cout << "Complexity:  " << orch.complexity() << "\n";
    std::cout << "Teams:       ";
    bool first = true;
    for (const Team* team : orch.active_teams()) {
        std::cout << (first ? "" : ", ") << team->name;
        first = false;
    }
    std::cout << "\n";

    const auto& emotions = agent.emotions();
    auto dominant = emotions.dominant_emotion();
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "Emotions:    dominant " << emotion_name(dominant.first)
              << " (" << dominant.second << "), stability " << emotions.stability()
              << ", adaptability " << emotions.adaptability()
              << ", social " << emotions.social_alignment() << "\n";

    std::cout << "Health:\n";
    for (HealthMetric m : ALL_HEALTH_METRICS) {
        std::cout << "  " << std::left << std::setw(28) << metric_name(m)
                  << std::right << agent.health().metric(m) << "\n";
    }
    std::cout << "Errors:      " << agent.health().error_log().size()
              << " logged, " << agent.health().unhealed_count() << " unhealed\n";
    std::cout << "Incentives:  total " << agent.incentives().total_reward()
              << ", scaling r=" << agent.incentives().reward_scaling()
              << " p=" << agent.incentives().penalty_scaling() << "\n";
}

static nlohmann::json issue_json(const Issue& issue) {
    nlohmann::json j = {
        {"issue", issue.label()},
        {"severity", issue.severity},
        {"description", issue.description}
    };
    if (issue.count) j["count"] = *issue.count;
    return j;
}

static nlohmann::json report_json(const HealReport& report) {
    nlohmann::json actions = nlohmann::json::array();
    for (const auto& a : report.actions) {
        actions.push_back({
            {"issue", a.issue},
            {"strategy", strategy_name(a.strategy)},
            {"outcome", a.outcome}
        });
    }
    return {{"status", heal_status_name(report.status)}, {"actions", actions}};
}

int cmd_config(const AgentConfig& config) {
    nlohmann::json j = config;
    std::cout << j.dump(2) << "\n";
    return 0;
}

int cmd_run(const AgentConfig& config, float efficiency, bool json_output) {
    SystemResourceMonitor monitor;
    Agent agent(config, &monitor);

    Orchestrator& orch = agent.orchestrator();
    for (size_t i = 0; i < TEAM_COUNT; ++i) {
        orch.set_team_efficiency(i, efficiency);
    }

    std::signal(SIGTERM, stop_signal_handler);
    std::signal(SIGINT, stop_signal_handler);

    Ticker ticker(orch);
    ticker.on_tick([](const TickOutcome& outcome) {
        if (outcome.action == TickAction::Idle) return;
        log_debug("run", "%s -> %s", tick_action_name(outcome.action), phase_name(outcome.phase));
    });

    std::cerr << "[run] Warp sequence starting (efficiency=" << efficiency
              << ", sustain=" << config.orchestrator.sustain_ms << "ms)\n";

    ticker.start();
    while (ticker.is_running() && !stop_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    ticker.stop();

    auto stats = ticker.stats();
    if (json_output) {
        nlohmann::json out = agent.status_json();
        out["run"] = {
            {"completed", stats.completed},
            {"ticks", stats.ticks},
            {"advanced", stats.advanced},
            {"reverted", stats.reverted},
            {"throttled", stats.throttled},
            {"idle", stats.idle}
        };
        std::cout << out.dump(2) << "\n";
    } else {
        std::cout << (stats.completed ? "Warp drive reached" : "Stopped before warp drive")
                  << " after " << stats.ticks << " ticks ("
                  << stats.advanced << " advanced, " << stats.reverted << " reverted, "
                  << stats.throttled << " throttled)\n\n";
        print_status(agent);
    }
    return stats.completed ? 0 : 2;
}

int cmd_replay(const AgentConfig& config, const std::string& path, bool heal, bool json_output) {
    std::ifstream in(path);
    if (!in) {
        std::cerr << "Error: Cannot open " << path << "\n";
        return 1;
    }

    nlohmann::json doc;
    try {
        in >> doc;
    } catch (const nlohmann::json::parse_error& e) {
        std::cerr << "Error: " << path << ": " << e.what() << "\n";
        return 1;
    }

    const nlohmann::json& events = doc.is_object() ? doc.value("events", nlohmann::json::array()) : doc;
    if (!events.is_array()) {
        std::cerr << "Error: " << path << " must hold an event array (or {\"events\": [...]})\n";
        return 1;
    }

    Agent agent(config);
    size_t applied = 0;
    for (const auto& ev : events) {
        agent.apply_event(ev);
        applied++;
    }
    log_debug("replay", "applied %zu events from %s", applied, path.c_str());

    auto issues = agent.health().diagnose();
    nlohmann::json out = {{"events", applied}};
    nlohmann::json issue_list = nlohmann::json::array();
    for (const auto& issue : issues) issue_list.push_back(issue_json(issue));
    out["issues"] = issue_list;

    if (heal) {
        out["heal"] = report_json(agent.heal());
    }

    if (json_output) {
        out["status"] = agent.status_json();
        std::cout << out.dump(2) << "\n";
        return 0;
    }

    std::cout << "Replayed " << applied << " events from " << path << "\n\n";
    if (issues.empty()) {
        std::cout << "No issues found.\n";
    } else {
        std::cout << "Issues (" << issues.size() << "):\n";
        for (const auto& issue : issues) {
            std::cout << "  [" << std::fixed << std::setprecision(2) << issue.severity << "] "
                      << issue.label() << ": " << issue.description;
            if (issue.count) std::cout << " (x" << *issue.count << ")";
            std::cout << "\n";
        }
    }

    if (heal) {
        const auto& h = out["heal"];
        std::cout << "\nHeal: " << h["status"].get<std::string>() << "\n";
        for (const auto& a : h["actions"]) {
            std::cout << "  " << a["issue"].get<std::string>() << " -> "
                      << a["strategy"].get<std::string>() << ": "
                      << a["outcome"].get<std::string>() << "\n";
        }
    }

    std::cout << "\n";
    print_status(agent);
    return 0;
}

int main(int argc, char* argv[]) {
    std::string command;
    std::string config_path;
    std::string replay_file;
    float efficiency = 0.9f;
    bool json_output = false;
    bool heal = false;
    bool verbose = false;
    bool seed_given = false;
    uint64_t seed = 0;

    // Parse arguments
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (strcmp(argv[i], "--efficiency") == 0 && i + 1 < argc) {
            efficiency = std::strtof(argv[++i], nullptr);
        } else if (strcmp(argv[i], "--seed") == 0 && i + 1 < argc) {
            seed = std::strtoull(argv[++i], nullptr, 10);
            seed_given = true;
        } else if (strcmp(argv[i], "--json") == 0) {
            json_output = true;
        } else if (strcmp(argv[i], "--heal") == 0) {
            heal = true;
        } else if (strcmp(argv[i], "--verbose") == 0) {
            verbose = true;
        } else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            std::cout << "prana " << PRANA_VERSION << "\n";
            return 0;
        } else if (argv[i][0] != '-') {
            if (command.empty()) {
                command = argv[i];
            } else if (command == "replay" && replay_file.empty()) {
                replay_file = argv[i];
            }
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (command.empty() || command == "help") {
        print_usage(argv[0]);
        return 0;
    }
    if (command == "version") {
        std::cout << "prana " << PRANA_VERSION << "\n";
        return 0;
    }

    try {
        AgentConfig config;
        if (!config_path.empty()) {
            config = load_config(config_path);
        }
        if (seed_given) {
            config.memory.seed = seed;
            config.health.seed = seed;
        }
        set_log_level(verbose ? LogLevel::Debug : parse_log_level(config.log_level));

        if (command == "config") {
            return cmd_config(config);
        }
        if (command == "run") {
            return cmd_run(config, efficiency, json_output);
        }
        if (command == "replay") {
            if (replay_file.empty()) {
                std::cerr << "Usage: prana replay <events.json> [--heal] [--json]\n";
                return 1;
            }
            return cmd_replay(config, replay_file, heal, json_output);
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cerr << "Unknown command: " << command << "\n\n";
    print_usage(argv[0]);
    return 1;
}
