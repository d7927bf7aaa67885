/*
 * scriptdeck C++ - CLI Commands
 *
 * One handler per subcommand. Handlers talk to the Script Runner only and
 * write to the streams they are given, so they run the same from main()
 * and from tests.
 */
#ifndef scriptdeck_CORE_COMMANDS_HPP
#define scriptdeck_CORE_COMMANDS_HPP

#include <scriptdeck/storage/script_runner.hpp>
#include <ostream>
#include <string>
#include <vector>

namespace scriptdeck {

// Process exit codes
const int EXIT_OK = 0;
const int EXIT_FAILED = 1;
const int EXIT_USAGE = 2;

struct CommandArgs {
    std::vector<std::string> positional;
    bool has_stdin;
    std::string stdin_text;
    std::string stdin_file;
    int timeout_seconds;            // 0 = configured default
    bool json;
    std::string description;
    std::vector<std::string> tags;
    
    CommandArgs() : has_stdin(false), timeout_seconds(0), json(false) {}
};

struct CommandContext {
    ScriptRunner& runner;
    std::ostream& out;
    std::ostream& err;
    
    CommandContext(ScriptRunner& r, std::ostream& o, std::ostream& e)
        : runner(r), out(o), err(e) {}
};

typedef int (*CommandHandler)(CommandContext& ctx, const CommandArgs& args);

struct CommandDef {
    const char* name;
    const char* usage;
    const char* description;
    size_t min_args;
    size_t max_args;
    CommandHandler handler;
};

// Every subcommand, in help order
const std::vector<CommandDef>& core_commands();

// nullptr when unknown
const CommandDef* find_command(const std::string& name);

// Parse the options following a subcommand name. Returns false with
// `error` set on a malformed option.
bool parse_command_args(const std::vector<std::string>& argv, CommandArgs& out, std::string& error);

namespace commands {
    int cmd_run(CommandContext& ctx, const CommandArgs& args);
    int cmd_exec(CommandContext& ctx, const CommandArgs& args);
    int cmd_save(CommandContext& ctx, const CommandArgs& args);
    int cmd_show(CommandContext& ctx, const CommandArgs& args);
    int cmd_delete(CommandContext& ctx, const CommandArgs& args);
    int cmd_list(CommandContext& ctx, const CommandArgs& args);
    int cmd_search(CommandContext& ctx, const CommandArgs& args);
    int cmd_collections(CommandContext& ctx, const CommandArgs& args);
    int cmd_create_collection(CommandContext& ctx, const CommandArgs& args);
    int cmd_delete_collection(CommandContext& ctx, const CommandArgs& args);
}

} // namespace scriptdeck

#endif // scriptdeck_CORE_COMMANDS_HPP
