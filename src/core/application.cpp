/*
 * scriptdeck C++ - Application Implementation
 *
 * Central application singleton managing the lifecycle of all components.
 */
#include <scriptdeck/core/application.hpp>
#include <scriptdeck/core/logger.hpp>
#include <scriptdeck/core/utils.hpp>

#include <iostream>
#include <cstring>
#include <unistd.h>

namespace scriptdeck {

// ============================================================================
// Utility Functions
// ============================================================================

void print_usage(const char* prog) {
    std::cout << AppInfo::NAME << " - sandboxed Python script runner\n\n"
              << "Usage: " << prog << " [options] <command> [args]\n\n"
              << "Options:\n"
              << "  --config PATH  Configuration file (default ~/.scriptdeck/config.json)\n"
              << "  -h, --help     Show this help message\n"
              << "  -v, --version  Show version\n\n"
              << "Commands:\n";
    
    const std::vector<CommandDef>& cmds = core_commands();
    for (size_t i = 0; i < cmds.size(); ++i) {
        std::cout << "  " << cmds[i].usage << "\n"
                  << "      " << cmds[i].description << "\n";
    }
    
    std::cout << "\nExit status: 0 on success, 1 on failure, 2 on usage errors.\n"
              << "\nExample:\n"
              << "  " << prog << " run hello.py --stdin 'world'\n";
}

void print_version() {
    std::cout << AppInfo::NAME << " v" << AppInfo::VERSION << "\n";
}

// ============================================================================
// Application Implementation
// ============================================================================

Application& Application::instance() {
    static Application app;
    return app;
}

Application::Application()
    : config_file_(join_path(home_dir(), ".scriptdeck/config.json"))
    , config_required_(false)
    , command_(nullptr)
    , exit_code_(EXIT_OK)
{}

bool Application::parse_args(int argc, char* argv[]) {
    prog_ = argc > 0 ? argv[0] : AppInfo::NAME;
    
    // Global options come before the subcommand
    int i = 1;
    for (; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(prog_.c_str());
            exit_code_ = EXIT_OK;
            return false;
        }
        if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            print_version();
            exit_code_ = EXIT_OK;
            return false;
        }
        if (strcmp(argv[i], "--config") == 0) {
            if (i + 1 >= argc) {
                std::cerr << "Error: --config requires a path\n";
                exit_code_ = EXIT_USAGE;
                return false;
            }
            config_file_ = std::string(argv[++i]);
            config_required_ = true;
            continue;
        }
        break;
    }
    
    if (i >= argc) {
        print_usage(prog_.c_str());
        exit_code_ = EXIT_USAGE;
        return false;
    }
    
    command_ = find_command(argv[i]);
    if (!command_) {
        std::cerr << "Error: unknown command '" << argv[i] << "'\n"
                  << "Run '" << prog_ << " --help' for the list of commands.\n";
        exit_code_ = EXIT_USAGE;
        return false;
    }
    
    std::vector<std::string> rest(argv + i + 1, argv + argc);
    std::string error;
    if (!parse_command_args(rest, command_args_, error)) {
        std::cerr << "Error: " << error << "\nUsage: " << prog_ << " " << command_->usage << "\n";
        exit_code_ = EXIT_USAGE;
        return false;
    }
    
    size_t count = command_args_.positional.size();
    if (count < command_->min_args || count > command_->max_args) {
        std::cerr << "Usage: " << prog_ << " " << command_->usage << "\n";
        exit_code_ = EXIT_USAGE;
        return false;
    }
    return true;
}

void Application::setup_logging() {
    Logger::instance().set_color(isatty(STDERR_FILENO) != 0);
    
    std::string log_level = config_.get_string("log_level", "warn");
    LogLevel level;
    if (parse_log_level(log_level, level)) {
        Logger::instance().set_level(level);
    } else {
        Logger::instance().set_level(LogLevel::WARN);
        LOG_WARN("Unknown log_level '%s', using warn", log_level.c_str());
    }
}

bool Application::setup_storage() {
    std::string base = join_path(home_dir(), ".scriptdeck");
    std::string scripts_dir = expand_home(config_.get_string("storage.base_dir", join_path(base, "scripts")));
    std::string db_path = expand_home(config_.get_string("storage.db_path", join_path(base, "db/scripts.db")));
    
    if (!store_.open(db_path, scripts_dir)) {
        std::cerr << "Error: cannot open script storage: " << store_.last_error() << "\n";
        return false;
    }
    LOG_INFO("[App] Storage: %s (scripts in %s)", db_path.c_str(), scripts_dir.c_str());
    return true;
}

void Application::setup_sandbox() {
    SupervisorConfig sandbox_config = SupervisorConfig::from_config(config_);
    LOG_DEBUG("[App] Worker %s, default timeout %ds, max %ds",
              sandbox_config.worker_path.c_str(),
              sandbox_config.default_timeout_seconds,
              sandbox_config.max_timeout_seconds);
    
    supervisor_.reset(new SandboxSupervisor(sandbox_config));
    runner_.reset(new ScriptRunner(store_, *supervisor_));
}

bool Application::init(int argc, char* argv[]) {
    if (!parse_args(argc, argv)) {
        return false;
    }

    // Quiet until the configured level is known
    Logger::instance().set_level(LogLevel::WARN);
    if (!config_.load(config_file_, config_required_)) {
        std::cerr << "Error: " << config_.last_error() << "\n";
        exit_code_ = EXIT_FAILED;
        return false;
    }
    
    setup_logging();
    LOG_DEBUG("%s v%s starting (config %s)", AppInfo::NAME, AppInfo::VERSION, config_file_.c_str());
    
    if (!setup_storage()) {
        exit_code_ = EXIT_FAILED;
        return false;
    }
    setup_sandbox();
    return true;
}

int Application::run() {
    if (!command_ || !runner_) {
        return EXIT_FAILED;
    }
    
    CommandContext ctx(*runner_, std::cout, std::cerr);
    exit_code_ = command_->handler(ctx, command_args_);
    if (exit_code_ == EXIT_USAGE) {
        std::cerr << "Usage: " << prog_ << " " << command_->usage << "\n";
    }
    std::cout.flush();
    return exit_code_;
}

void Application::shutdown() {
    runner_.reset();
    supervisor_.reset();
    store_.close();
    LOG_DEBUG("Goodbye!");
}

} // namespace scriptdeck
