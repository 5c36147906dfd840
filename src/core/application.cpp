/*
 * parabox - Application Implementation
 *
 * Central application singleton managing configuration, the plugin manager
 * and the command dispatch.
 */
#include <parabox/core/application.hpp>
#include <parabox/core/logger.hpp>
#include <parabox/core/utils.hpp>

#include <iostream>
#include <csignal>
#include <cstring>
#include <mutex>
#include <curl/curl.h>

namespace parabox {

// ============================================================================
// Utility Functions
// ============================================================================

void print_usage(const char* prog) {
    std::cout << AppInfo::NAME << " - sandboxed plugin runner\n\n"
              << "Usage: " << prog << " [options] [config.json] <command> [args]\n\n"
              << "Commands:\n"
              << "  status                 Show the plugin status\n"
              << "  list                   List approved catalog plugins\n"
              << "  install [id [version]] Download, verify and install a plugin\n"
              << "  enable | disable       Toggle plugin execution\n"
              << "  menu                   Print the running plugin's menu items\n"
              << "  click <pluginId> <id>  Invoke a menu item\n"
              << "  run                    Run the plugin and print its output until interrupted\n\n"
              << "Options:\n"
              << "  -h, --help             Show this help message\n"
              << "  -v, --version          Show version\n"
              << "  --remote-enabled       Open the remote plugin gate for this run\n\n"
              << "Config file format (JSON):\n"
              << "  {\n"
              << "    \"log_level\": \"info\",\n"
              << "    \"data_dir\": \"~/.parabox\",\n"
              << "    \"catalog\": { \"base_url\": \"http://localhost:8000\", \"token\": \"...\" },\n"
              << "    \"plugins\": { \"remote_enabled\": true }\n"
              << "  }\n";
}

void print_version() {
    std::cout << AppInfo::NAME << " v" << AppInfo::VERSION << "\n";
}

namespace {

std::mutex g_output_mutex;

void print_json(const Json& value) {
    std::lock_guard<std::mutex> lock(g_output_mutex);
    std::cout << value.dump() << std::endl;
}

void print_event(const PluginOutputEvent& event) {
    std::lock_guard<std::mutex> lock(g_output_mutex);
    std::cout << to_json(event).dump() << std::endl;
}

Json error_json(const std::string& code) {
    Json obj = Json::object();
    obj.set("ok", false);
    obj.set("error", code);
    return obj;
}

void signal_handler(int sig) {
    (void)sig;
    Application::instance().stop();
}

} // namespace

// ============================================================================
// Application Implementation
// ============================================================================

Application& Application::instance() {
    static Application app;
    return app;
}

Application::Application()
    : running_(true)
    , exit_code_(0)
    , force_remote_(false)
    , listener_id_(0)
{}

bool Application::parse_args(int argc, char* argv[], const char** config_file) {
    *config_file = nullptr;

    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return false;
        }
        if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            print_version();
            return false;
        }
        if (strcmp(argv[i], "--remote-enabled") == 0) {
            force_remote_ = true;
            continue;
        }

        std::string arg = argv[i];
        if (command_.empty() && !*config_file && arg.size() > 5 &&
            arg.compare(arg.size() - 5, 5, ".json") == 0) {
            *config_file = argv[i];
        } else if (command_.empty()) {
            command_ = arg;
        } else {
            args_.push_back(arg);
        }
    }

    if (command_.empty()) {
        print_usage(argv[0]);
        exit_code_ = 2;
        return false;
    }
    return true;
}

void Application::setup_logging() {
    std::string log_level = config_.get_string("log_level", "info");
    if (!Logger::instance().set_level(log_level)) {
        LOG_WARN("Unknown log_level '%s', keeping info", log_level.c_str());
    }
}

void Application::setup_manager() {
    std::string base_url = config_.get_string("catalog.base_url", "http://localhost:8000");
    long timeout_ms = static_cast<long>(config_.get_int("catalog.timeout_ms", 30000));

    // Token is read at request time so a changed environment is honored
    const Config* config = &config_;
    TokenProvider tokens = [config]() {
        return config->get_string_or_env("catalog.token", "PARABOX_ACCESS_TOKEN", "");
    };
    catalog_.reset(new HttpCatalogClient(base_url, tokens, timeout_ms));

    ManagerOptions options;
    options.data_dir = resolve_user_path(config_.get_string("data_dir", "~/.parabox"));
    options.remote_enabled = force_remote_ || config_.get_bool("plugins.remote_enabled", false);
    options.click_timeout_ms = static_cast<int>(config_.get_int("plugins.click_timeout_ms", 1200));
    options.max_pending_clicks = config_.get_size("plugins.max_pending_clicks", 20);
    options.max_menu_items = config_.get_size("plugins.max_menu_items", 10);
    options.stop_grace_ms = static_cast<int>(config_.get_int("plugins.stop_grace_ms", 200));

    std::string host_path = config_.get_string("plugins.host_path", "");
    if (host_path.empty()) {
        host_path = join_path(executable_dir(), "parabox-plugin-host");
    }
    options.host.executable = resolve_user_path(host_path);
    options.host.exit_grace_ms = options.stop_grace_ms;
    options.host.log_level = config_.get_string("log_level", "");
    options.host.limits.memory_limit_bytes = config_.get_size("sandbox.memory_limit", 64 * 1024 * 1024, 1024 * 1024);
    options.host.limits.stack_limit_bytes = config_.get_size("sandbox.stack_limit", 512 * 1024, 4096);
    options.host.limits.load_timeout_ms = static_cast<int>(config_.get_int("sandbox.load_timeout_ms", 1000));
    options.host.limits.click_timeout_ms = static_cast<int>(config_.get_int("sandbox.click_timeout_ms", 400));

    LOG_DEBUG("Data directory: %s", options.data_dir.c_str());
    LOG_DEBUG("Plugin host: %s", options.host.executable.c_str());

    manager_.reset(new PluginManager(options, *catalog_));
    listener_id_ = manager_->add_output_listener(print_event);
}

bool Application::init(int argc, char* argv[]) {
    curl_global_init(CURL_GLOBAL_ALL);
    Logger::instance().set_tag("supervisor");

    const char* config_file = nullptr;
    if (!parse_args(argc, argv, &config_file)) {
        return false;
    }

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    signal(SIGPIPE, SIG_IGN);

    if (config_file) {
        if (!config_.load_file(config_file)) {
            LOG_WARN("Failed to load config from %s, using defaults", config_file);
        } else {
            LOG_DEBUG("Loaded config from %s", config_file);
        }
    }

    setup_logging();
    setup_manager();
    manager_->init();
    return true;
}

void Application::wait_for_menu(int timeout_ms, const std::string& menu_id) {
    int64_t deadline = monotonic_ms() + timeout_ms;
    while (running_.load() && monotonic_ms() < deadline) {
        PluginStatus status = manager_->get_status();
        if (!status.running) return;
        for (size_t i = 0; i < status.menu_items.size(); ++i) {
            if (menu_id.empty() || status.menu_items[i].id == menu_id) return;
        }
        sleep_ms(50);
    }
}

int Application::cmd_status() {
    print_json(to_json(manager_->get_status()));
    return 0;
}

int Application::cmd_list() {
    CatalogResult result = manager_->list_approved();
    if (!result.success) {
        print_json(error_json(result.error));
        return 1;
    }
    Json arr = Json::array();
    for (size_t i = 0; i < result.entries.size(); ++i) {
        arr.push(to_json(result.entries[i]));
    }
    print_json(arr);
    return 0;
}

int Application::cmd_install() {
    InstallSelection selection;
    if (args_.size() > 0) selection.plugin_id = args_[0];
    if (args_.size() > 1) selection.version = args_[1];

    StatusResult result = manager_->install(selection);
    if (!result.success) {
        print_json(error_json(result.error));
        return 1;
    }
    print_json(to_json(result.status));
    return 0;
}

int Application::cmd_set_enabled(bool enabled) {
    StatusResult result = manager_->set_enabled(enabled);
    if (!result.success) {
        print_json(error_json(result.error));
        return 1;
    }
    print_json(to_json(result.status));
    return 0;
}

int Application::cmd_menu() {
    int wait_ms = static_cast<int>(config_.get_int("plugins.menu_wait_ms", 500));
    wait_for_menu(wait_ms, "");
    print_json(to_json(manager_->get_menu_items()));
    return 0;
}

int Application::cmd_click() {
    if (args_.size() < 2) {
        LOG_ERROR("click needs <pluginId> <id>");
        return 2;
    }
    wait_for_menu(static_cast<int>(config_.get_int("sandbox.load_timeout_ms", 1000)) + 1000, args_[1]);

    MenuClickResult result = manager_->click_menu_item(args_[0], args_[1]);
    Json obj = Json::object();
    obj.set("ok", result.success);
    if (!result.success) obj.set("error", result.error);
    print_json(obj);
    return result.success ? 0 : 1;
}

int Application::cmd_run() {
    LOG_INFO("Running; press Ctrl+C to stop");
    while (running_.load()) {
        sleep_ms(100);
    }
    return 0;
}

int Application::run() {
    if (command_ == "status") return cmd_status();
    if (command_ == "list") return cmd_list();
    if (command_ == "install") return cmd_install();
    if (command_ == "enable") return cmd_set_enabled(true);
    if (command_ == "disable") return cmd_set_enabled(false);
    if (command_ == "menu") return cmd_menu();
    if (command_ == "click") return cmd_click();
    if (command_ == "run") return cmd_run();

    LOG_ERROR("Unknown command '%s'", command_.c_str());
    return 2;
}

void Application::shutdown() {
    LOG_DEBUG("Shutting down...");

    if (manager_) {
        manager_->remove_output_listener(listener_id_);
        manager_->shutdown();
        manager_.reset();
    }
    catalog_.reset();

    curl_global_cleanup();
}

} // namespace parabox
