/*
 * codeloop - plan, run and repair Python programs with an LLM
 * 
 * Usage:
 *   ./codeloop [options] "task text"
 *   ./codeloop --demo
 *   ./codeloop --ping
 * 
 * Settings come from config.json, .env and OPENROUTER_* variables.
 */
#include <codeloop/core/application.hpp>

int main(int argc, char* argv[]) {
    auto& app = codeloop::Application::instance();
    
    if (!app.init(argc, argv)) {
        // --help/--version, usage and configuration errors
        int code = app.exit_code();
        app.shutdown();
        return code;
    }
    
    int result = app.run();
    app.shutdown();
    
    return result;
}
