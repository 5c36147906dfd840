#include "test_support.hpp"

#include <parabox/plugin/state_store.hpp>
#include <parabox/core/utils.hpp>
#include <gtest/gtest.h>

using namespace parabox;

class StateStoreTest : public ::testing::Test {
protected:
    std::string state_path() const { return dir_.file(StateStore::kFileName); }

    test::TempDir dir_;
};

TEST_F(StateStoreTest, MissingFileYieldsDefaults) {
    StateStore store(state_path());
    PluginRuntimeState state = store.load();
    EXPECT_FALSE(state.enabled);
    EXPECT_FALSE(state.has_installed);
}

TEST_F(StateStoreTest, CorruptFileYieldsDefaults) {
    ASSERT_TRUE(write_file_atomic(state_path(), "{\"enabled\": tru"));
    StateStore store(state_path());
    PluginRuntimeState state = store.load();
    EXPECT_FALSE(state.enabled);
    EXPECT_FALSE(state.has_installed);
}

TEST_F(StateStoreTest, NonObjectFileYieldsDefaults) {
    ASSERT_TRUE(write_file_atomic(state_path(), "[true]"));
    StateStore store(state_path());
    EXPECT_FALSE(store.load().enabled);
}

TEST_F(StateStoreTest, SaveThenLoad) {
    StateStore store(state_path());

    PluginRuntimeState state;
    state.enabled = true;
    state.has_installed = true;
    state.installed.id = "p1";
    state.installed.version = "1.0.0";
    state.installed.name = "Demo";
    state.installed.sha256 = "abcdef0123456789";
    state.installed.permissions = Json::array();
    state.installed.permissions.push("menu");
    ASSERT_TRUE(store.save(state));

    PluginRuntimeState loaded = store.load();
    EXPECT_TRUE(loaded.enabled);
    ASSERT_TRUE(loaded.has_installed);
    EXPECT_EQ(loaded.installed.id, "p1");
    EXPECT_EQ(loaded.installed.version, "1.0.0");
    EXPECT_EQ(loaded.installed.name, "Demo");
    EXPECT_EQ(loaded.installed.sha256, "abcdef0123456789");
    EXPECT_TRUE(loaded.installed.permissions.is_array());
}

TEST_F(StateStoreTest, PersistedKeysUseCatalogNames) {
    StateStore store(state_path());

    PluginRuntimeState state;
    state.has_installed = true;
    state.installed.id = "p1";
    state.installed.version = "2";
    state.installed.sha256 = "00112233445566778899";
    state.installed.permissions = Json::object();
    ASSERT_TRUE(store.save(state));

    std::string text;
    ASSERT_TRUE(read_file(state_path(), text));
    Json obj = Json::parse(text);
    ASSERT_TRUE(obj["enabled"].is_bool());
    EXPECT_FALSE(obj["enabled"].as_bool());
    EXPECT_EQ(obj["installed"]["id"].as_string(), "p1");
    EXPECT_EQ(obj["installed"]["sha256"].as_string(), "00112233445566778899");
    EXPECT_TRUE(obj["installed"]["permissions"].is_object());
}

TEST_F(StateStoreTest, InstalledWithoutIdIsDropped) {
    ASSERT_TRUE(write_file_atomic(state_path(),
        "{\"enabled\":true,\"installed\":{\"version\":\"1\",\"permissions\":{}}}"));
    StateStore store(state_path());
    PluginRuntimeState state = store.load();
    EXPECT_TRUE(state.enabled);
    EXPECT_FALSE(state.has_installed);
}

TEST_F(StateStoreTest, SaveCreatesDataDirectory) {
    StateStore store(dir_.file("nested/data/plugins.state.json"));
    PluginRuntimeState state;
    state.enabled = true;
    ASSERT_TRUE(store.save(state));
    EXPECT_TRUE(store.load().enabled);
}

TEST_F(StateStoreTest, SaveReplacesPreviousContent) {
    StateStore store(state_path());
    PluginRuntimeState state;
    state.enabled = true;
    ASSERT_TRUE(store.save(state));
    state.enabled = false;
    ASSERT_TRUE(store.save(state));
    EXPECT_FALSE(store.load().enabled);
}

TEST_F(StateStoreTest, SaveFailsWhenPathIsADirectory) {
    ASSERT_TRUE(mkdir_p(state_path()));
    StateStore store(state_path());
    PluginRuntimeState state;
    EXPECT_FALSE(store.save(state));
}
