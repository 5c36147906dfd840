#include "test_support.hpp"

#include <parabox/core/utils.hpp>

#include <cstdlib>
#include <dirent.h>
#include <fstream>
#include <ftw.h>
#include <stdio.h>
#include <unistd.h>

namespace parabox {
namespace test {

namespace {

int remove_entry(const char* path, const struct stat*, int, struct FTW*) {
    return ::remove(path);
}

} // namespace

TempDir::TempDir() {
    const char* base = std::getenv("TMPDIR");
    std::string tmpl = join_path(base && base[0] ? base : "/tmp", "parabox-test-XXXXXX");
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    if (mkdtemp(&buf[0])) {
        path_ = &buf[0];
    }
}

TempDir::~TempDir() {
    if (!path_.empty()) {
        nftw(path_.c_str(), remove_entry, 16, FTW_DEPTH | FTW_PHYS);
    }
}

std::string TempDir::file(const std::string& name) const {
    return join_path(path_, name);
}

FakeCatalog::FakeCatalog()
    : list_calls_(0)
    , fetch_calls_(0)
    , delay_ms_(0)
    , in_flight_(0)
    , max_in_flight_(0)
{}

PluginCatalogEntry FakeCatalog::add_plugin(const std::string& id, const std::string& version,
                                           const std::string& code) {
    PluginCatalogEntry entry;
    entry.id = id;
    entry.version = version;
    entry.name = "Plugin " + id;
    entry.sha256 = sha256_hex(code);
    entry.permissions = Json::object();

    PluginBundle bundle;
    bundle.manifest_json = manifest_for(id, version);
    bundle.code = code;
    bundle.sha256 = entry.sha256;

    std::lock_guard<std::mutex> lock(mutex_);
    entries_.push_back(entry);
    bundles_[id + "@" + version] = bundle;
    return entry;
}

void FakeCatalog::set_entries(const std::vector<PluginCatalogEntry>& entries) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_ = entries;
}

void FakeCatalog::set_bundle(const std::string& id, const std::string& version, const PluginBundle& bundle) {
    std::lock_guard<std::mutex> lock(mutex_);
    bundles_[id + "@" + version] = bundle;
}

void FakeCatalog::set_list_error(const std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    list_error_ = error;
}

void FakeCatalog::set_fetch_error(const std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    fetch_error_ = error;
}

void FakeCatalog::set_call_delay_ms(int delay_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    delay_ms_ = delay_ms;
}

int FakeCatalog::max_concurrent_calls() {
    std::lock_guard<std::mutex> lock(mutex_);
    return max_in_flight_;
}

void FakeCatalog::enter_call() {
    int delay_ms = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++in_flight_;
        if (in_flight_ > max_in_flight_) max_in_flight_ = in_flight_;
        delay_ms = delay_ms_;
    }
    if (delay_ms > 0) sleep_ms(delay_ms);
}

void FakeCatalog::leave_call() {
    std::lock_guard<std::mutex> lock(mutex_);
    --in_flight_;
}

CatalogResult FakeCatalog::list() {
    enter_call();
    leave_call();
    std::lock_guard<std::mutex> lock(mutex_);
    ++list_calls_;
    if (!list_error_.empty()) return CatalogResult::fail(list_error_);
    return CatalogResult::ok(entries_);
}

BundleResult FakeCatalog::fetch_bundle(const std::string& id, const std::string& version) {
    enter_call();
    leave_call();
    std::lock_guard<std::mutex> lock(mutex_);
    ++fetch_calls_;
    if (!fetch_error_.empty()) return BundleResult::fail(fetch_error_);

    std::map<std::string, PluginBundle>::const_iterator it = bundles_.find(id + "@" + version);
    if (it == bundles_.end()) return BundleResult::fail(errors::kApiFailed);
    return BundleResult::ok(it->second);
}

std::string manifest_for(const std::string& id, const std::string& version) {
    Json manifest = Json::object();
    manifest.set("id", id);
    manifest.set("version", version);
    manifest.set("name", "Plugin " + id);
    manifest.set("entry", "main.lua");
    manifest.set("permissions", Json::object());
    return manifest.dump();
}

std::vector<pid_t> child_processes() {
    std::vector<pid_t> children;
    DIR* proc = opendir("/proc");
    if (!proc) return children;

    pid_t self = getpid();
    while (struct dirent* entry = readdir(proc)) {
        char* end = NULL;
        long pid = std::strtol(entry->d_name, &end, 10);
        if (pid <= 0 || *end != '\0') continue;

        std::ifstream stat_file(std::string("/proc/") + entry->d_name + "/stat");
        std::string line;
        if (!std::getline(stat_file, line)) continue;

        // "pid (comm) state ppid ..."; comm may contain spaces and parens
        size_t close_paren = line.rfind(')');
        if (close_paren == std::string::npos || close_paren + 2 >= line.size()) continue;
        char state = line[close_paren + 2];
        long ppid = std::strtol(line.c_str() + close_paren + 3, NULL, 10);
        if (ppid == self && state != 'Z') {
            children.push_back(static_cast<pid_t>(pid));
        }
    }
    closedir(proc);
    return children;
}

std::string host_binary() {
    return PARABOX_HOST_BINARY;
}

} // namespace test
} // namespace parabox
