/*
 * parabox - Sandboxed plugin runner
 *
 * Installs approved plugins from the catalog and runs them in isolated
 * host processes.
 *
 * Usage:
 *   ./parabox [options] [config.json] <command> [args]
 */

#include <parabox/core/application.hpp>

int main(int argc, char* argv[]) {
    parabox::Application& app = parabox::Application::instance();

    if (!app.init(argc, argv)) {
        // init returns false for --help/--version or a usage error
        return app.exit_code();
    }

    int result = app.run();
    app.shutdown();

    return result;
}
