/*
 * scriptdeck C++ - Application
 *
 * Process-wide singleton owning the configuration, the script store, the
 * sandbox supervisor and the script runner for one CLI invocation.
 *
 *   init()     - parse arguments, load config, open storage
 *   run()      - dispatch the subcommand, returns the exit code
 *   shutdown() - close storage
 */
#ifndef scriptdeck_CORE_APPLICATION_HPP
#define scriptdeck_CORE_APPLICATION_HPP

#include <scriptdeck/core/config.hpp>
#include <scriptdeck/core/commands.hpp>
#include <scriptdeck/storage/script_store.hpp>
#include <scriptdeck/storage/script_runner.hpp>
#include <scriptdeck/sandbox/supervisor.hpp>
#include <memory>
#include <string>
#include <vector>

namespace scriptdeck {

struct AppInfo {
    static constexpr const char* NAME = "scriptdeck";
    static constexpr const char* VERSION = "0.3.0";
};

void print_usage(const char* prog);
void print_version();

class Application {
public:
    static Application& instance();
    
    // False when the process should exit right away with exit_code()
    // (--help, --version, usage errors, startup failures).
    bool init(int argc, char* argv[]);
    int run();
    void shutdown();
    
    int exit_code() const { return exit_code_; }
    
    Config& config() { return config_; }
    ScriptRunner* runner() { return runner_.get(); }
    
private:
    Application();
    Application(const Application&);
    Application& operator=(const Application&);
    
    bool parse_args(int argc, char* argv[]);
    void setup_logging();
    bool setup_storage();
    void setup_sandbox();
    
    Config config_;
    std::string config_file_;
    bool config_required_;
    
    std::string prog_;
    const CommandDef* command_;
    CommandArgs command_args_;
    int exit_code_;
    
    ScriptStore store_;
    std::unique_ptr<SandboxSupervisor> supervisor_;
    std::unique_ptr<ScriptRunner> runner_;
};

} // namespace scriptdeck

#endif // scriptdeck_CORE_APPLICATION_HPP
