/*
 * scriptdeck C++ - CLI Commands Implementation
 */
#include <scriptdeck/core/commands.hpp>
#include <scriptdeck/core/logger.hpp>
#include <scriptdeck/core/utils.hpp>

#include <iostream>
#include <sstream>
#include <cstdlib>
#include <cerrno>
#include <climits>

namespace scriptdeck {

namespace {

std::string dump_json(const Json& j, int indent) {
    return j.dump(indent, ' ', false, Json::error_handler_t::replace);
}

bool read_source(const std::string& path, std::string& out) {
    if (path == "-") {
        std::ostringstream ss;
        ss << std::cin.rdbuf();
        out = ss.str();
        return true;
    }
    return read_file(path, out);
}

// Resolve --stdin / --stdin-file into the text handed to the script
bool resolve_stdin(CommandContext& ctx, const CommandArgs& args, std::string& out) {
    if (args.has_stdin) {
        out = args.stdin_text;
        return true;
    }
    if (!args.stdin_file.empty()) {
        if (!read_file(args.stdin_file, out)) {
            ctx.err << "Error: cannot read stdin file " << args.stdin_file << "\n";
            return false;
        }
        return true;
    }
    out.clear();
    return true;
}

int print_result(CommandContext& ctx, const ExecutionResult& result, bool json) {
    if (json) {
        ctx.out << dump_json(result.to_json(), 2) << "\n";
        return result.succeeded ? EXIT_OK : EXIT_FAILED;
    }
    
    ctx.out << result.stdout_text;
    if (!result.stderr_text.empty()) {
        ctx.err << result.stderr_text;
        if (result.stderr_text[result.stderr_text.size() - 1] != '\n') ctx.err << "\n";
    }
    if (result.succeeded && result.has_return_value) {
        ctx.out << "Return value: " << dump_json(result.return_value, -1) << "\n";
    }
    if (!result.succeeded) {
        ctx.err << "Error: " << result.error_message << "\n";
    }
    return result.succeeded ? EXIT_OK : EXIT_FAILED;
}

int report_failure(CommandContext& ctx, const ScriptOpResult& r) {
    ctx.err << "Error: " << r.error << "\n";
    return EXIT_FAILED;
}

void print_metadata_line(CommandContext& ctx, const ScriptMetadata& meta) {
    ctx.out << meta.collection << "/" << meta.name;
    if (!meta.description.empty()) {
        ctx.out << " - " << meta.description;
    }
    if (!meta.tags.empty()) {
        ctx.out << " [" << join(meta.tags, ", ") << "]";
    }
    ctx.out << "\n";
}

int print_script_list(CommandContext& ctx, const std::vector<ScriptMetadata>& scripts, bool json) {
    if (json) {
        Json arr = Json::array();
        for (size_t i = 0; i < scripts.size(); ++i) {
            arr.push_back(scripts[i].to_json());
        }
        ctx.out << dump_json(arr, 2) << "\n";
        return EXIT_OK;
    }
    for (size_t i = 0; i < scripts.size(); ++i) {
        print_metadata_line(ctx, scripts[i]);
    }
    if (scripts.empty()) {
        ctx.out << "No scripts.\n";
    }
    return EXIT_OK;
}

} // anonymous namespace

// ============================================================================
// Registry
// ============================================================================

const std::vector<CommandDef>& core_commands() {
    static const std::vector<CommandDef> cmds = {
        {"run", "run <file|-> [--stdin TEXT | --stdin-file PATH] [--timeout N] [--json]",
         "Run a script file in the sandbox", 1, 1, commands::cmd_run},
        {"exec", "exec <collection> <name> [--stdin TEXT | --stdin-file PATH] [--timeout N] [--json]",
         "Run a saved script", 2, 2, commands::cmd_exec},
        {"save", "save <collection> <name> <file> [--description D] [--tag T]...",
         "Save a script into a collection", 3, 3, commands::cmd_save},
        {"show", "show <collection> <name> [--json]",
         "Print a saved script and its metadata", 2, 2, commands::cmd_show},
        {"delete", "delete <collection> <name>",
         "Delete a saved script", 2, 2, commands::cmd_delete},
        {"list", "list [collection] [--json]",
         "List saved scripts", 0, 1, commands::cmd_list},
        {"search", "search <query> [--json]",
         "Find scripts by name or tag", 1, 1, commands::cmd_search},
        {"collections", "collections [--json]",
         "List collections", 0, 0, commands::cmd_collections},
        {"create-collection", "create-collection <name>",
         "Create a collection", 1, 1, commands::cmd_create_collection},
        {"delete-collection", "delete-collection <name>",
         "Delete a collection and its scripts", 1, 1, commands::cmd_delete_collection},
    };
    return cmds;
}

const CommandDef* find_command(const std::string& name) {
    const std::vector<CommandDef>& cmds = core_commands();
    for (size_t i = 0; i < cmds.size(); ++i) {
        if (name == cmds[i].name) return &cmds[i];
    }
    return nullptr;
}

bool parse_command_args(const std::vector<std::string>& argv, CommandArgs& out, std::string& error) {
    for (size_t i = 0; i < argv.size(); ++i) {
        const std::string& arg = argv[i];
        bool has_value = i + 1 < argv.size();
        
        if (arg == "--json") {
            out.json = true;
        } else if (arg == "--stdin" || arg == "--stdin-file" || arg == "--timeout" ||
                   arg == "--description" || arg == "--tag") {
            if (!has_value) {
                error = "Option " + arg + " requires a value";
                return false;
            }
            const std::string& value = argv[++i];
            if (arg == "--stdin") {
                out.has_stdin = true;
                out.stdin_text = value;
            } else if (arg == "--stdin-file") {
                out.stdin_file = value;
            } else if (arg == "--timeout") {
                errno = 0;
                char* end = nullptr;
                long n = std::strtol(value.c_str(), &end, 10);
                if (errno != 0 || end == value.c_str() || *end != '\0' || n <= 0 || n > INT_MAX) {
                    error = "Invalid timeout '" + value + "'";
                    return false;
                }
                out.timeout_seconds = static_cast<int>(n);
            } else if (arg == "--description") {
                out.description = value;
            } else {
                out.tags.push_back(value);
            }
        } else if (arg.size() > 1 && arg[0] == '-' && arg != "-") {
            error = "Unknown option " + arg;
            return false;
        } else {
            out.positional.push_back(arg);
        }
    }
    
    if (out.has_stdin && !out.stdin_file.empty()) {
        error = "--stdin and --stdin-file are mutually exclusive";
        return false;
    }
    return true;
}

// ============================================================================
// Command Implementations
// ============================================================================

namespace commands {

int cmd_run(CommandContext& ctx, const CommandArgs& args) {
    const std::string& path = args.positional[0];
    if (path == "-" && args.stdin_file == "-") {
        ctx.err << "Error: script and stdin cannot both come from standard input\n";
        return EXIT_USAGE;
    }
    
    std::string source;
    if (!read_source(path, source)) {
        ctx.err << "Error: cannot read script " << path << "\n";
        return EXIT_FAILED;
    }
    std::string input;
    if (!resolve_stdin(ctx, args, input)) return EXIT_FAILED;
    
    LOG_DEBUG("[CLI] run %s (%zu bytes, timeout %d)", path.c_str(), source.size(), args.timeout_seconds);
    return print_result(ctx, ctx.runner.execute(source, input, args.timeout_seconds), args.json);
}

int cmd_exec(CommandContext& ctx, const CommandArgs& args) {
    std::string input;
    if (!resolve_stdin(ctx, args, input)) return EXIT_FAILED;
    
    ExecutionResult result = ctx.runner.execute_saved(args.positional[1], args.positional[0],
                                                      input, args.timeout_seconds);
    return print_result(ctx, result, args.json);
}

int cmd_save(CommandContext& ctx, const CommandArgs& args) {
    const std::string& collection = args.positional[0];
    const std::string& name = args.positional[1];
    
    std::string code;
    if (!read_source(args.positional[2], code)) {
        ctx.err << "Error: cannot read script " << args.positional[2] << "\n";
        return EXIT_FAILED;
    }
    
    ScriptOpResult r = ctx.runner.save(name, code, collection, args.description, args.tags);
    if (!r.success) return report_failure(ctx, r);
    
    ctx.out << "Saved " << collection << "/" << name << "\n";
    return EXIT_OK;
}

int cmd_show(CommandContext& ctx, const CommandArgs& args) {
    LoadedScript script;
    ScriptOpResult r = ctx.runner.load(args.positional[1], args.positional[0], script);
    if (!r.success) return report_failure(ctx, r);
    
    if (args.json) {
        Json j = script.metadata.to_json();
        j["code"] = script.code;
        ctx.out << dump_json(j, 2) << "\n";
        return EXIT_OK;
    }
    
    const ScriptMetadata& meta = script.metadata;
    ctx.out << "# " << meta.collection << "/" << meta.name << " (" << meta.filename << ")\n";
    if (!meta.description.empty()) ctx.out << "# " << meta.description << "\n";
    if (!meta.tags.empty()) ctx.out << "# tags: " << join(meta.tags, ", ") << "\n";
    ctx.out << script.code;
    if (!script.code.empty() && script.code[script.code.size() - 1] != '\n') ctx.out << "\n";
    return EXIT_OK;
}

int cmd_delete(CommandContext& ctx, const CommandArgs& args) {
    ScriptOpResult r = ctx.runner.remove(args.positional[1], args.positional[0]);
    if (!r.success) return report_failure(ctx, r);
    
    ctx.out << "Deleted " << args.positional[0] << "/" << args.positional[1] << "\n";
    return EXIT_OK;
}

int cmd_list(CommandContext& ctx, const CommandArgs& args) {
    if (args.positional.empty()) {
        return print_script_list(ctx, ctx.runner.list_all(), args.json);
    }
    
    const std::string& collection = args.positional[0];
    std::vector<std::string> known = ctx.runner.list_collections();
    bool found = false;
    for (size_t i = 0; i < known.size() && !found; ++i) {
        found = known[i] == collection;
    }
    if (!found) {
        ctx.err << "Error: Collection '" << collection << "' does not exist\n";
        return EXIT_FAILED;
    }
    return print_script_list(ctx, ctx.runner.list(collection), args.json);
}

int cmd_search(CommandContext& ctx, const CommandArgs& args) {
    return print_script_list(ctx, ctx.runner.search(args.positional[0]), args.json);
}

int cmd_collections(CommandContext& ctx, const CommandArgs& args) {
    std::vector<std::string> names = ctx.runner.list_collections();
    if (args.json) {
        ctx.out << dump_json(Json(names), 2) << "\n";
        return EXIT_OK;
    }
    for (size_t i = 0; i < names.size(); ++i) {
        ctx.out << names[i] << "\n";
    }
    return EXIT_OK;
}

int cmd_create_collection(CommandContext& ctx, const CommandArgs& args) {
    ScriptOpResult r = ctx.runner.create_collection(args.positional[0]);
    if (!r.success) return report_failure(ctx, r);
    
    ctx.out << "Created collection " << args.positional[0] << "\n";
    return EXIT_OK;
}

int cmd_delete_collection(CommandContext& ctx, const CommandArgs& args) {
    ScriptOpResult r = ctx.runner.delete_collection(args.positional[0]);
    if (!r.success) return report_failure(ctx, r);
    
    ctx.out << "Deleted collection " << args.positional[0] << "\n";
    return EXIT_OK;
}

} // namespace commands

} // namespace scriptdeck
