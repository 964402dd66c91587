#include "mirror_for_plex/services/identity/metadata_resolver.hpp"
#include "mirror_for_plex/services/identity/identity_cache.hpp"
#include "test_helpers.hpp"

using namespace mirror_for_plex;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;
using test::MockCatalogClient;
using test::TempDir;
using test::make_entry;

namespace {

using SearchResult = std::expected<std::vector<services::CatalogEntry>, core::SyncError>;

class MetadataResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        cache = std::make_shared<services::IdentityCache>(dir / "matches.json");
        ASSERT_TRUE(cache->load());
        primary = std::make_shared<NiceMock<MockCatalogClient>>("anilist");
        secondary = std::make_shared<NiceMock<MockCatalogClient>>("tvdb");
    }

    TempDir dir;
    std::shared_ptr<services::IdentityCache> cache;
    std::shared_ptr<NiceMock<MockCatalogClient>> primary;
    std::shared_ptr<NiceMock<MockCatalogClient>> secondary;
};

} // namespace

TEST_F(MetadataResolverTest, ResolvesLocalizedTitleThroughSynonym) {
    const auto folder = dir / "Attack on Titan S4";
    EXPECT_CALL(*primary, search_titles("attack on titan"))
        .WillOnce(Return(SearchResult{std::vector<services::CatalogEntry>{
            make_entry("16498", {"Shingeki no Kyojin", "Attack on Titan"}),
            make_entry("110277", {"Shingeki no Kyojin: The Final Season", "Attack on Titan Final Season",
                                  "Attack on Titan: Final Season"},
                       "https://img.example/110277.jpg"),
        }}));

    services::MetadataResolver resolver(cache, primary, nullptr);
    auto identity = resolver.resolve(folder, "進撃の巨人 The Final Season");

    ASSERT_TRUE(identity.is_resolved());
    // "attack on titan" equals the first entry exactly, so it wins over the longer synonym
    EXPECT_EQ(identity.source_id, "16498");
    EXPECT_EQ(identity.catalog, "anilist");
    EXPECT_EQ(identity.romaji_title, "Shingeki no Kyojin");

    auto cached = cache->lookup(folder);
    ASSERT_TRUE(cached.has_value());
    EXPECT_EQ(cached->source_id, "16498");
}

TEST_F(MetadataResolverTest, ResolvesWhenOnlySynonymMatches) {
    const auto folder = dir / "Attack on Titan S4";
    EXPECT_CALL(*primary, search_titles("attack on titan"))
        .WillOnce(Return(SearchResult{std::vector<services::CatalogEntry>{
            make_entry("110277", {"Shingeki no Kyojin: The Final Season", "進撃の巨人 The Final Season",
                                  "Attack on Titan: Final Season"},
                       "https://img.example/110277.jpg"),
        }}));

    services::MetadataResolver resolver(cache, primary, nullptr);
    auto identity = resolver.resolve(folder, "進撃の巨人 The Final Season");

    ASSERT_TRUE(identity.is_resolved());
    EXPECT_EQ(identity.source_id, "110277");
    EXPECT_EQ(identity.image_url, "https://img.example/110277.jpg");
    EXPECT_EQ(identity.image_file_name, "anilist_110277.jpg");
    EXPECT_EQ(identity.synopsis, "Synopsis of Shingeki no Kyojin: The Final Season");
    EXPECT_EQ(identity.folder_path, services::IdentityCache::normalize_key(folder));
}

TEST_F(MetadataResolverTest, UnreachableCatalogCachesUnresolvedFolder) {
    const auto folder = dir / "Frieren";
    EXPECT_CALL(*primary, search_titles(_))
        .Times(1)
        .WillOnce(Return(SearchResult{std::unexpected(core::SyncError::TransientNetworkError)}));

    services::MetadataResolver resolver(cache, primary, nullptr);
    auto first = resolver.resolve(folder, "Frieren");
    EXPECT_FALSE(first.is_resolved());

    // Second call is served from the cache without another search
    auto second = resolver.resolve(folder, "Frieren");
    EXPECT_FALSE(second.is_resolved());

    services::IdentityCache reloaded(dir / "matches.json");
    ASSERT_TRUE(reloaded.load());
    auto persisted = reloaded.lookup(folder);
    ASSERT_TRUE(persisted.has_value());
    EXPECT_FALSE(persisted->is_resolved());
}

TEST_F(MetadataResolverTest, FallsBackToSecondaryCatalog) {
    const auto folder = dir / "Planetes";
    EXPECT_CALL(*primary, search_titles("planetes"))
        .WillOnce(Return(SearchResult{std::vector<services::CatalogEntry>{
            make_entry("1", {"Naruto"}),
        }}));
    EXPECT_CALL(*secondary, search_titles("planetes"))
        .WillOnce(Return(SearchResult{std::vector<services::CatalogEntry>{
            make_entry("78904", {"Planetes", "Planetes"}, "https://tvdb.example/78904.jpg"),
        }}));

    services::MetadataResolver resolver(cache, primary, secondary);
    auto identity = resolver.resolve(folder, "Planetes");

    ASSERT_TRUE(identity.is_resolved());
    EXPECT_EQ(identity.catalog, "tvdb");
    EXPECT_EQ(identity.source_id, "78904");
    EXPECT_EQ(identity.image_file_name, "tvdb_78904.jpg");
}

TEST_F(MetadataResolverTest, SecondaryNotQueriedWhenPrimaryMatches) {
    EXPECT_CALL(*primary, search_titles("planetes"))
        .WillOnce(Return(SearchResult{std::vector<services::CatalogEntry>{
            make_entry("329", {"Planetes"}),
        }}));
    EXPECT_CALL(*secondary, search_titles(_)).Times(0);

    services::MetadataResolver resolver(cache, primary, secondary);
    auto identity = resolver.resolve(dir / "Planetes", "Planetes");

    EXPECT_EQ(identity.catalog, "anilist");
    EXPECT_EQ(identity.source_id, "329");
}

TEST_F(MetadataResolverTest, EntryWithoutImageHasNoFileName) {
    EXPECT_CALL(*primary, search_titles("mushishi"))
        .WillOnce(Return(SearchResult{std::vector<services::CatalogEntry>{
            make_entry("457", {"Mushishi"}),
        }}));

    services::MetadataResolver resolver(cache, primary, nullptr);
    auto identity = resolver.resolve(dir / "Mushishi [BD]", "");

    ASSERT_TRUE(identity.is_resolved());
    EXPECT_TRUE(identity.image_file_name.empty());
}

TEST_F(MetadataResolverTest, CachedIdentitySkipsCatalogs) {
    core::FolderIdentity known;
    known.folder_path = (dir / "Frieren").string();
    known.source_id = "154587";
    known.catalog = "anilist";
    known.romaji_title = "Sousou no Frieren";
    ASSERT_TRUE(cache->store(known));

    EXPECT_CALL(*primary, search_titles(_)).Times(0);
    EXPECT_CALL(*secondary, search_titles(_)).Times(0);

    services::MetadataResolver resolver(cache, primary, secondary);
    auto identity = resolver.resolve(dir / "Frieren" / "", "Something Else");

    EXPECT_EQ(identity.source_id, "154587");
}

TEST_F(MetadataResolverTest, NoCatalogsConfiguredIsUnresolved) {
    services::MetadataResolver resolver(cache, nullptr, nullptr);
    auto identity = resolver.resolve(dir / "Frieren", "Frieren");

    EXPECT_FALSE(identity.is_resolved());
    EXPECT_TRUE(cache->lookup(dir / "Frieren").has_value());
}
