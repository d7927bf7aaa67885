/*
 * scriptdeck C++ - Sandboxed Python Script Runner
 *
 * Runs user scripts in a confined worker process and keeps a library of
 * saved scripts grouped into collections.
 *
 * Usage:
 *   ./scriptdeck [--config config.json] <command> [args]
 */
#include <scriptdeck/core/application.hpp>

int main(int argc, char* argv[]) {
    auto& app = scriptdeck::Application::instance();
    
    if (!app.init(argc, argv)) {
        // --help/--version, usage errors or startup failures
        return app.exit_code();
    }
    
    int result = app.run();
    app.shutdown();
    
    return result;
}
