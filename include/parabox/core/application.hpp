/*
 * parabox - Application Class
 *
 * Command-line driver for the plugin subsystem: loads configuration, sets
 * up logging, builds the plugin manager against the HTTP catalog and runs
 * one command.
 */
#ifndef PARABOX_CORE_APPLICATION_HPP
#define PARABOX_CORE_APPLICATION_HPP

#include "config.hpp"
#include "../plugin/catalog.hpp"
#include "../plugin/manager.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace parabox {

struct AppInfo {
    static constexpr const char* VERSION = "1.0.0";
    static constexpr const char* NAME = "parabox";
};

class Application {
public:
    static Application& instance();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    Config& config() { return config_; }
    const Config& config() const { return config_; }

    PluginManager& plugins() { return *manager_; }

    bool is_running() const { return running_.load(); }
    void stop() { running_.store(false); }

    // False for --help/--version or a usage error; exit_code() tells which
    bool init(int argc, char* argv[]);

    // Executes the command given on the command line
    int run();

    void shutdown();

    int exit_code() const { return exit_code_; }

private:
    Application();

    bool parse_args(int argc, char* argv[], const char** config_file);
    void setup_logging();
    void setup_manager();

    int cmd_status();
    int cmd_list();
    int cmd_install();
    int cmd_set_enabled(bool enabled);
    int cmd_menu();
    int cmd_click();
    int cmd_run();

    // Waits for the host to come up and report its menu
    void wait_for_menu(int timeout_ms, const std::string& menu_id);

    std::atomic<bool> running_;
    int exit_code_;
    bool force_remote_;
    std::string command_;
    std::vector<std::string> args_;

    Config config_;
    std::unique_ptr<HttpCatalogClient> catalog_;
    std::unique_ptr<PluginManager> manager_;
    int listener_id_;
};

void print_usage(const char* prog);
void print_version();

} // namespace parabox

#endif // PARABOX_CORE_APPLICATION_HPP
