#include "test_support.hpp"

#include <parabox/sandbox/sandbox_host.hpp>
#include <parabox/ipc/protocol.hpp>
#include <parabox/core/utils.hpp>
#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <string>
#include <vector>
#include <unistd.h>

using namespace parabox;

class SandboxHostTest : public ::testing::Test {
protected:
    SandboxHostTest() {
        limits_.load_timeout_ms = 500;
        limits_.click_timeout_ms = 100;
        host_.reset(new SandboxHost(limits_, [this](const Json& msg) { events_.push_back(msg); }));
    }

    std::string write_plugin(const std::string& code) {
        std::string path = dir_.file("main.lua");
        EXPECT_TRUE(write_file_atomic(path, code));
        return path;
    }

    void load(const std::string& code) {
        host_->handle_command(protocol::make_load("p1", "1.0.0", write_plugin(code), Json::object()));
    }

    Json click(const std::string& id, const std::string& request_id = "r1",
               const std::string& plugin_id = "p1") {
        events_.clear();
        host_->handle_command(protocol::make_menu_click(plugin_id, id, request_id));
        EXPECT_EQ(events_.size(), 1u);
        return events_.empty() ? Json() : events_.back();
    }

    std::vector<Json> events_of(const std::string& type) const {
        std::vector<Json> out;
        for (size_t i = 0; i < events_.size(); ++i) {
            if (protocol::message_type(events_[i]) == type) out.push_back(events_[i]);
        }
        return out;
    }

    test::TempDir dir_;
    SandboxLimits limits_;
    std::vector<Json> events_;
    std::unique_ptr<SandboxHost> host_;
};

// ============================================================================
// Load
// ============================================================================

TEST_F(SandboxHostTest, LoadsPluginAndBecomesReady) {
    load("say('loaded')");
    EXPECT_EQ(host_->state(), HostState::Ready);
    EXPECT_EQ(host_->plugin_id(), "p1");

    std::vector<Json> says = events_of(protocol::kSay);
    ASSERT_EQ(says.size(), 1u);
    EXPECT_EQ(says[0]["pluginId"].as_string(), "p1");
    EXPECT_EQ(says[0]["text"].as_string(), "loaded");
}

TEST_F(SandboxHostTest, LoadRequiresIdentityFields) {
    host_->handle_command(protocol::make_load("  ", "1.0.0", write_plugin(""), Json::object()));
    ASSERT_EQ(events_.size(), 1u);
    EXPECT_EQ(events_[0]["type"].as_string(), "error");
    EXPECT_EQ(events_[0]["message"].as_string(), protocol::kInvalidLoadCmd);
    EXPECT_TRUE(host_->finished());
    EXPECT_EQ(host_->exit_code(), 1);
}

TEST_F(SandboxHostTest, LoadRequiresPermissions) {
    Json cmd = protocol::make_load("p1", "1.0.0", write_plugin(""), Json::object());
    cmd.set("permissions", "everything");
    host_->handle_command(cmd);
    ASSERT_EQ(events_.size(), 1u);
    EXPECT_EQ(events_[0]["message"].as_string(), protocol::kPermissionsRequired);
    EXPECT_TRUE(host_->finished());
}

TEST_F(SandboxHostTest, MissingPermissionsKeyIsRejected) {
    Json cmd = protocol::make_load("p1", "1.0.0", write_plugin(""), Json::object());
    cmd.remove("permissions");
    host_->handle_command(cmd);
    ASSERT_EQ(events_.size(), 1u);
    EXPECT_EQ(events_[0]["message"].as_string(), protocol::kPermissionsRequired);
}

TEST_F(SandboxHostTest, IdentityCheckedBeforePermissions) {
    Json cmd = protocol::make_load("p1", "", write_plugin(""), Json());
    host_->handle_command(cmd);
    ASSERT_EQ(events_.size(), 1u);
    EXPECT_EQ(events_[0]["message"].as_string(), protocol::kInvalidLoadCmd);
}

TEST_F(SandboxHostTest, UnreadableEntryFails) {
    host_->handle_command(protocol::make_load("p1", "1.0.0", dir_.file("missing.lua"), Json::array()));
    ASSERT_EQ(events_.size(), 1u);
    EXPECT_EQ(events_[0]["message"].as_string(), protocol::kEntryReadFailed);
    EXPECT_EQ(host_->exit_code(), 1);
}

TEST_F(SandboxHostTest, ScriptErrorFailsLoad) {
    load("say('before') error('broken')");
    ASSERT_EQ(events_.size(), 2u);
    EXPECT_EQ(events_[0]["type"].as_string(), "say");
    EXPECT_EQ(events_[1]["message"].as_string(), protocol::kVmExecFailed);
    EXPECT_TRUE(host_->finished());
}

TEST_F(SandboxHostTest, SyntaxErrorFailsLoad) {
    load("function (");
    ASSERT_EQ(events_.size(), 1u);
    EXPECT_EQ(events_[0]["message"].as_string(), protocol::kVmExecFailed);
}

TEST_F(SandboxHostTest, LoadTimeoutFailsLoad) {
    load("while true do end");
    ASSERT_EQ(events_.size(), 1u);
    EXPECT_EQ(events_[0]["message"].as_string(), protocol::kVmExecFailed);
}

TEST_F(SandboxHostTest, SecondLoadIsIgnored) {
    load("say('one')");
    events_.clear();
    host_->handle_command(protocol::make_load("p2", "2", write_plugin("say('two')"), Json::object()));
    EXPECT_TRUE(events_.empty());
    EXPECT_EQ(host_->plugin_id(), "p1");
    EXPECT_EQ(host_->state(), HostState::Ready);
}

TEST_F(SandboxHostTest, UnknownCommandsAreIgnored) {
    Json cmd = Json::object();
    cmd.set("type", "reboot");
    host_->handle_command(cmd);
    host_->handle_command(Json::array());
    EXPECT_TRUE(events_.empty());
    EXPECT_EQ(host_->state(), HostState::Idle);
}

// ============================================================================
// Capabilities
// ============================================================================

TEST_F(SandboxHostTest, OutputIsTrimmedAndClipped) {
    load("say('  hi  ')\n"
         "say(string.rep('a', 250))\n"
         "suggestion(string.rep('\\u{2603}', 201))\n");
    ASSERT_EQ(events_.size(), 3u);
    EXPECT_EQ(events_[0]["text"].as_string(), "hi");
    EXPECT_EQ(events_[1]["text"].as_string().size(), 200u);
    EXPECT_EQ(events_[2]["type"].as_string(), "suggestion");
    EXPECT_EQ(utf8_length(events_[2]["text"].as_string()), 200u);
}

TEST_F(SandboxHostTest, EmptyAndNonStringOutputIsDropped) {
    load("say('   ')\n"
         "say(42)\n"
         "say({})\n"
         "say()\n"
         "suggestion(nil)\n"
         "suggestion(setmetatable({}, {__tostring = function() return 'x' end}))\n");
    EXPECT_TRUE(events_.empty());
    EXPECT_EQ(host_->state(), HostState::Ready);
}

TEST_F(SandboxHostTest, MenuItemsAreCappedAtTen) {
    load("for i = 1, 12 do addMenuItem({id = 'item' .. i, label = 'Item ' .. i}) end");
    std::vector<Json> items = events_of(protocol::kMenuAdd);
    ASSERT_EQ(items.size(), 10u);
    EXPECT_EQ(items[0]["item"]["id"].as_string(), "item1");
    EXPECT_EQ(items[0]["item"]["label"].as_string(), "Item 1");
    EXPECT_EQ(items[9]["item"]["id"].as_string(), "item10");
}

TEST_F(SandboxHostTest, MenuItemFieldsAreValidated) {
    load("addMenuItem({id = '', label = 'x'})\n"
         "addMenuItem({id = 'a'})\n"
         "addMenuItem({id = 5, label = 'x'})\n"
         "addMenuItem('a')\n"
         "addMenuItem(setmetatable({}, {__index = function(t, k) return 'meta' end}))\n"
         "addMenuItem({id = '  ' .. string.rep('i', 90), label = string.rep('l', 90)})\n");
    std::vector<Json> items = events_of(protocol::kMenuAdd);
    ASSERT_EQ(items.size(), 1u);
    EXPECT_EQ(items[0]["item"]["id"].as_string(), std::string(80, 'i'));
    EXPECT_EQ(items[0]["item"]["label"].as_string(), std::string(80, 'l'));
}

TEST_F(SandboxHostTest, ConsoleAndModuleGlobalsExist) {
    load("console.log('x') console.warn('y') console.error('z')\n"
         "assert(module.exports == exports)\n"
         "exports.answer = 42\n");
    EXPECT_EQ(host_->state(), HostState::Ready);
    EXPECT_TRUE(events_.empty());
}

TEST_F(SandboxHostTest, SandboxedGlobalsAreAbsentInPlugins) {
    load("if io or os or require or load or string.dump then error('exposed') end");
    EXPECT_EQ(host_->state(), HostState::Ready);
}

// ============================================================================
// Menu clicks
// ============================================================================

TEST_F(SandboxHostTest, ClickRunsHandler) {
    load("onMenuClick('go', function() say('done') end)");
    events_.clear();
    host_->handle_command(protocol::make_menu_click("p1", "go", "r1"));

    ASSERT_EQ(events_.size(), 2u);
    EXPECT_EQ(events_[0]["type"].as_string(), "say");
    EXPECT_EQ(events_[0]["text"].as_string(), "done");
    EXPECT_EQ(events_[1]["type"].as_string(), "menu:click:result");
    EXPECT_EQ(events_[1]["requestId"].as_string(), "r1");
    EXPECT_TRUE(events_[1]["ok"].as_bool());
}

TEST_F(SandboxHostTest, ClickBeforeLoadIsNotLoaded) {
    Json result = click("go");
    EXPECT_FALSE(result["ok"].as_bool());
    EXPECT_EQ(result["error"].as_string(), protocol::kNotLoaded);
}

TEST_F(SandboxHostTest, ClickAfterFailedLoadIsIgnored) {
    load("error('x')");
    events_.clear();
    host_->handle_command(protocol::make_menu_click("p1", "go", "r1"));
    EXPECT_TRUE(events_.empty());
}

TEST_F(SandboxHostTest, ClickForOtherPluginIsMismatch) {
    load("onMenuClick('go', function() end)");
    Json result = click("go", "r1", "p2");
    EXPECT_EQ(result["error"].as_string(), protocol::kPluginMismatch);

    Json padded = click("go", "r2", " p1 ");
    EXPECT_TRUE(padded["ok"].as_bool());
}

TEST_F(SandboxHostTest, ClickWithEmptyIdIsInvalid) {
    load("");
    Json result = click("   ");
    EXPECT_EQ(result["error"].as_string(), protocol::kInvalidMenuId);
}

TEST_F(SandboxHostTest, ClickWithoutHandler) {
    load("addMenuItem({id = 'go', label = 'Go'})");
    Json result = click("go");
    EXPECT_EQ(result["error"].as_string(), protocol::kNoHandler);
}

TEST_F(SandboxHostTest, FailingHandlerReportsAndHostSurvives) {
    load("onMenuClick('bad', function() error('nope') end)\n"
         "onMenuClick('spin', function() while true do end end)\n"
         "onMenuClick('ok', function() end)\n");
    EXPECT_EQ(click("bad")["error"].as_string(), protocol::kMenuClickFailed);
    EXPECT_EQ(click("spin")["error"].as_string(), protocol::kMenuClickFailed);
    EXPECT_TRUE(click("ok")["ok"].as_bool());
}

TEST_F(SandboxHostTest, ClickWithoutRequestIdIsIgnored) {
    load("onMenuClick('go', function() say('ran') end)");
    events_.clear();
    host_->handle_command(protocol::make_menu_click("p1", "go", "  "));
    EXPECT_TRUE(events_.empty());
}

TEST_F(SandboxHostTest, RequestIdIsClipped) {
    load("onMenuClick('go', function() end)");
    Json result = click("go", std::string(100, 'r'));
    EXPECT_EQ(result["requestId"].as_string(), std::string(80, 'r'));
}

TEST_F(SandboxHostTest, HandlerIdsAreClippedConsistently) {
    load("onMenuClick(string.rep('m', 100), function() end)");
    EXPECT_TRUE(click(std::string(90, 'm'))["ok"].as_bool());
}

TEST_F(SandboxHostTest, RegisteringHandlerAgainReplacesIt) {
    load("onMenuClick('go', function() say('first') end)\n"
         "onMenuClick('go', function() say('second') end)\n");
    events_.clear();
    host_->handle_command(protocol::make_menu_click("p1", "go", "r1"));
    ASSERT_EQ(events_.size(), 2u);
    EXPECT_EQ(events_[0]["text"].as_string(), "second");
}

TEST_F(SandboxHostTest, HandlerTableIsCapped) {
    load("for i = 1, 10 do onMenuClick('h' .. i, function() end) end\n"
         "onMenuClick('h11', function() end)\n"
         "onMenuClick('h1', function() say('replaced') end)\n");
    EXPECT_EQ(click("h11")["error"].as_string(), protocol::kNoHandler);
    EXPECT_TRUE(click("h10")["ok"].as_bool());

    events_.clear();
    host_->handle_command(protocol::make_menu_click("p1", "h1", "r1"));
    ASSERT_EQ(events_.size(), 2u);
    EXPECT_EQ(events_[0]["text"].as_string(), "replaced");
}

TEST_F(SandboxHostTest, NonFunctionHandlerIsIgnored) {
    load("onMenuClick('go', 'not a function')\nonMenuClick(5, function() end)");
    EXPECT_EQ(click("go")["error"].as_string(), protocol::kNoHandler);
    EXPECT_EQ(click("5")["error"].as_string(), protocol::kNoHandler);
}

// ============================================================================
// Shutdown
// ============================================================================

TEST_F(SandboxHostTest, ShutdownDisposes) {
    load("onMenuClick('go', function() end)");
    host_->handle_command(protocol::make_shutdown());
    EXPECT_TRUE(host_->finished());
    EXPECT_EQ(host_->exit_code(), 0);

    events_.clear();
    host_->handle_command(protocol::make_menu_click("p1", "go", "r1"));
    EXPECT_TRUE(events_.empty());
}

TEST_F(SandboxHostTest, DisposeRunsPendingFinalizersSafely) {
    load("local t = setmetatable({}, {__gc = function() say('collected') end})\n"
         "onMenuClick('go', function() return t end)\n");
    host_->dispose();
    EXPECT_EQ(host_->state(), HostState::Disposed);
}

// ============================================================================
// Watchdog
// ============================================================================

namespace {

// Backtracking pattern that keeps the C matcher busy for hours
const char* const kRunawayMatch = "string.find(string.rep('a', 200000), '.-.-.-b')";

} // namespace

TEST(SandboxWatchdogDeathTest, RunawayLibraryCallAtLoadEndsProcess) {
    test::TempDir dir;
    std::string path = dir.file("main.lua");
    ASSERT_TRUE(write_file_atomic(path, kRunawayMatch));

    SandboxLimits limits;
    limits.load_timeout_ms = 300;
    limits.watchdog_grace_ms = 200;

    int64_t start_ms = monotonic_ms();
    EXPECT_EXIT({
        // A hang shows up as SIGALRM instead of a stuck test run
        alarm(10);
        SandboxHost host(limits, [](const Json&) {}, [](const Json& last_message) {
            bool load_failed = last_message.get_string("message") == protocol::kVmExecFailed;
            _exit(load_failed ? SandboxHost::kOverrunExitCode : 4);
        });
        host.handle_command(protocol::make_load("p1", "1.0.0", path, Json::object()));
        _exit(0);
    }, ::testing::ExitedWithCode(SandboxHost::kOverrunExitCode), "");
    EXPECT_LT(monotonic_ms() - start_ms, 1500);
}

TEST(SandboxWatchdogTest, InterruptibleLoopNeverReachesWatchdog) {
    test::TempDir dir;
    std::string path = dir.file("main.lua");
    ASSERT_TRUE(write_file_atomic(path, "while true do end"));

    SandboxLimits limits;
    limits.load_timeout_ms = 100;
    limits.watchdog_grace_ms = 150;

    std::atomic<int> overruns(0);
    std::vector<Json> events;
    {
        SandboxHost host(limits, [&events](const Json& msg) { events.push_back(msg); },
                         [&overruns](const Json&) { ++overruns; });
        host.handle_command(protocol::make_load("p1", "1.0.0", path, Json::object()));
        EXPECT_EQ(host.state(), HostState::Disposed);
        sleep_ms(400);
    }
    EXPECT_EQ(overruns.load(), 0);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].get_string("message"), "VM_EXEC_FAILED");
}

TEST(WatchdogTest, FiresOnceAfterDeadline) {
    std::atomic<int> fired(0);
    Watchdog watchdog([&fired]() { ++fired; });
    watchdog.arm(monotonic_ms() + 50);
    EXPECT_TRUE(watchdog.armed());
    sleep_ms(250);
    EXPECT_EQ(fired.load(), 1);
    EXPECT_FALSE(watchdog.armed());
}

TEST(WatchdogTest, DisarmBeforeDeadlineDoesNotFire) {
    std::atomic<int> fired(0);
    Watchdog watchdog([&fired]() { ++fired; });
    watchdog.arm(monotonic_ms() + 100);
    watchdog.disarm();
    sleep_ms(250);
    EXPECT_EQ(fired.load(), 0);
}

TEST(WatchdogTest, RearmingMovesTheDeadline) {
    std::atomic<int> fired(0);
    Watchdog watchdog([&fired]() { ++fired; });
    watchdog.arm(monotonic_ms() + 100);
    watchdog.arm(monotonic_ms() + 400);
    sleep_ms(200);
    EXPECT_EQ(fired.load(), 0);
    sleep_ms(400);
    EXPECT_EQ(fired.load(), 1);
    watchdog.stop();
}

TEST(HostStateTest, Names) {
    EXPECT_STREQ(host_state_name(HostState::Idle), "idle");
    EXPECT_STREQ(host_state_name(HostState::Ready), "ready");
    EXPECT_STREQ(host_state_name(HostState::Disposed), "disposed");
}
