#include "test_support.hpp"

#include <parabox/plugin/installer.hpp>
#include <parabox/core/utils.hpp>
#include <gtest/gtest.h>

#include <cctype>

using namespace parabox;

// ============================================================================
// Bundle store
// ============================================================================

TEST(BundleStoreTest, EncodesUnsafeBytes) {
    EXPECT_EQ(BundleStore::encode_segment("demo-plugin.v2"), "demo-plugin.v2");
    EXPECT_EQ(BundleStore::encode_segment("a/b"), "a_2fb");
    EXPECT_EQ(BundleStore::encode_segment("a b_c"), "a_20b_5fc");
    EXPECT_EQ(BundleStore::encode_segment("\xC3\xA9"), "_c3_a9");
}

TEST(BundleStoreTest, LeadingDotsNeverFormTraversal) {
    EXPECT_EQ(BundleStore::encode_segment("."), "_2e");
    EXPECT_EQ(BundleStore::encode_segment(".."), "_2e.");
    EXPECT_EQ(BundleStore::encode_segment(".hidden"), "_2ehidden");
    EXPECT_EQ(BundleStore::encode_segment(""), "_");
}

TEST(BundleStoreTest, DistinctInputsStayDistinct) {
    EXPECT_NE(BundleStore::encode_segment("a/b"), BundleStore::encode_segment("a_b"));
    EXPECT_NE(BundleStore::encode_segment("a_2fb"), BundleStore::encode_segment("a/b"));
}

TEST(BundleStoreTest, DeterministicLayout) {
    BundleStore store("/data/plugins");
    EXPECT_EQ(store.entry_path("p1", "1.0.0"), "/data/plugins/p1/1.0.0/main.lua");
    EXPECT_EQ(store.manifest_path("../x", "1"), "/data/plugins/_2e._2fx/1/manifest.json");
}

TEST(BundleStoreTest, WriteStoresCodeAndManifest) {
    test::TempDir dir;
    BundleStore store(dir.file("plugins"));
    ASSERT_TRUE(store.write("p1", "1.0.0", "say('hi')", "{\"id\":\"p1\"}"));
    EXPECT_TRUE(store.has_entry("p1", "1.0.0"));

    std::string code;
    ASSERT_TRUE(read_file(store.entry_path("p1", "1.0.0"), code));
    EXPECT_EQ(code, "say('hi')");

    std::string manifest;
    ASSERT_TRUE(read_file(store.manifest_path("p1", "1.0.0"), manifest));
    EXPECT_EQ(manifest, "{\"id\":\"p1\"}");
}

// ============================================================================
// Installer
// ============================================================================

class InstallerTest : public ::testing::Test {
protected:
    InstallerTest()
        : store_(dir_.file("plugins"))
        , installer_(catalog_, store_)
    {}

    PluginCatalogEntry entry(const std::string& id, const std::string& version) {
        PluginCatalogEntry e;
        e.id = id;
        e.version = version;
        e.name = "Name";
        e.sha256 = std::string(64, 'a');
        e.permissions = Json::object();
        return e;
    }

    test::TempDir dir_;
    test::FakeCatalog catalog_;
    BundleStore store_;
    Installer installer_;
};

TEST_F(InstallerTest, ListDropsIncompleteEntries) {
    std::vector<PluginCatalogEntry> entries;
    entries.push_back(entry("good", "1"));

    PluginCatalogEntry no_name = entry("no-name", "1");
    no_name.name = "  ";
    entries.push_back(no_name);

    PluginCatalogEntry short_hash = entry("short", "1");
    short_hash.sha256 = "abcdef";
    entries.push_back(short_hash);

    PluginCatalogEntry bad_hash = entry("badhash", "1");
    bad_hash.sha256 = std::string(64, 'z');
    entries.push_back(bad_hash);

    PluginCatalogEntry no_perms = entry("noperms", "1");
    no_perms.permissions = Json();
    entries.push_back(no_perms);

    PluginCatalogEntry string_perms = entry("strperms", "1");
    string_perms.permissions = "all";
    entries.push_back(string_perms);

    PluginCatalogEntry array_perms = entry("arrayperms", "1");
    array_perms.permissions = Json::array();
    entries.push_back(array_perms);

    PluginCatalogEntry no_version = entry("nover", "");
    entries.push_back(no_version);

    catalog_.set_entries(entries);

    CatalogResult result = installer_.list_approved();
    ASSERT_TRUE(result.success);
    ASSERT_EQ(result.entries.size(), 2u);
    EXPECT_EQ(result.entries[0].id, "good");
    EXPECT_EQ(result.entries[1].id, "arrayperms");
}

TEST_F(InstallerTest, ListPropagatesCatalogErrors) {
    catalog_.set_list_error(errors::kNotLoggedIn);
    CatalogResult result = installer_.list_approved();
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, errors::kNotLoggedIn);
}

TEST_F(InstallerTest, ResolvePrefersExactThenIdThenFirst) {
    std::vector<PluginCatalogEntry> entries;
    entries.push_back(entry("a", "1"));
    entries.push_back(entry("b", "1"));
    entries.push_back(entry("b", "2"));

    PluginCatalogEntry out;
    InstallSelection exact;
    exact.plugin_id = "b";
    exact.version = "2";
    ASSERT_TRUE(Installer::resolve(entries, exact, out));
    EXPECT_EQ(out.version, "2");

    InstallSelection id_only;
    id_only.plugin_id = "b";
    id_only.version = "9";
    ASSERT_TRUE(Installer::resolve(entries, id_only, out));
    EXPECT_EQ(out.id, "b");
    EXPECT_EQ(out.version, "1");

    InstallSelection unknown;
    unknown.plugin_id = "zzz";
    ASSERT_TRUE(Installer::resolve(entries, unknown, out));
    EXPECT_EQ(out.id, "a");

    ASSERT_TRUE(Installer::resolve(entries, InstallSelection(), out));
    EXPECT_EQ(out.id, "a");

    EXPECT_FALSE(Installer::resolve(std::vector<PluginCatalogEntry>(), InstallSelection(), out));
}

TEST_F(InstallerTest, DownloadWritesVerifiedBundle) {
    PluginCatalogEntry e = catalog_.add_plugin("p1", "1.0.0", "say('hello')");

    BundleResult result = installer_.download(e);
    ASSERT_TRUE(result.success) << result.error;
    EXPECT_EQ(result.entry_path, store_.entry_path("p1", "1.0.0"));

    std::string code;
    ASSERT_TRUE(read_file(result.entry_path, code));
    EXPECT_EQ(code, "say('hello')");
}

TEST_F(InstallerTest, HashComparisonIgnoresCase) {
    PluginCatalogEntry e = catalog_.add_plugin("p1", "1.0.0", "say('hello')");
    PluginBundle bundle;
    bundle.manifest_json = test::manifest_for("p1", "1.0.0");
    bundle.code = "say('hello')";
    bundle.sha256 = e.sha256;
    for (size_t i = 0; i < bundle.sha256.size(); ++i) {
        bundle.sha256[i] = static_cast<char>(toupper(bundle.sha256[i]));
    }
    catalog_.set_bundle("p1", "1.0.0", bundle);

    EXPECT_TRUE(installer_.download(e).success);
}

TEST_F(InstallerTest, ServerHashMismatchWritesNothing) {
    PluginCatalogEntry e = catalog_.add_plugin("p1", "1.0.0", "say('hello')");
    PluginBundle bundle;
    bundle.manifest_json = test::manifest_for("p1", "1.0.0");
    bundle.code = "say('tampered')";
    bundle.sha256 = e.sha256;
    catalog_.set_bundle("p1", "1.0.0", bundle);

    BundleResult result = installer_.download(e);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, errors::kSha256Mismatch);
    EXPECT_FALSE(path_exists(store_.entry_path("p1", "1.0.0")));
    EXPECT_FALSE(path_exists(store_.bundle_dir("p1", "1.0.0")));
}

TEST_F(InstallerTest, CatalogHashMismatchWritesNothing) {
    PluginCatalogEntry e = catalog_.add_plugin("p1", "1.0.0", "say('hello')");
    // Server agrees with its own code but the catalog declared another hash
    e.sha256 = sha256_hex("something else");

    BundleResult result = installer_.download(e);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, errors::kSha256Mismatch);
    EXPECT_FALSE(path_exists(store_.entry_path("p1", "1.0.0")));
}

TEST_F(InstallerTest, IncompleteBundleFailsGenerically) {
    PluginCatalogEntry e = catalog_.add_plugin("p1", "1.0.0", "say('hello')");
    PluginBundle bundle;
    bundle.code = "say('hello')";
    bundle.sha256 = e.sha256;
    catalog_.set_bundle("p1", "1.0.0", bundle);

    BundleResult result = installer_.download(e);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, errors::kDownloadFailed);
}

TEST_F(InstallerTest, FetchErrorsPassThrough) {
    PluginCatalogEntry e = catalog_.add_plugin("p1", "1.0.0", "say('hello')");
    catalog_.set_fetch_error(errors::kNetworkError);

    BundleResult result = installer_.download(e);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, errors::kNetworkError);
}

// ============================================================================
// HTTP catalog error mapping (no server needed)
// ============================================================================

TEST(HttpCatalogTest, MissingTokenIsNotLoggedIn) {
    HttpCatalogClient client("http://127.0.0.1:9", []() { return std::string(); }, 1000);
    CatalogResult result = client.list();
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, errors::kNotLoggedIn);
}

TEST(HttpCatalogTest, UnreachableServerIsNetworkError) {
    // Port 9 (discard) is closed on test machines; the connection is refused
    HttpCatalogClient client("http://127.0.0.1:9/", []() { return std::string("token"); }, 2000);
    BundleResult result = client.fetch_bundle("p1", "1.0.0");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, errors::kNetworkError);
}
