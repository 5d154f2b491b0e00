//
// Created by gregorian-rayne on 1/14/26.
//

#include "lpa/models/registry_cache.hpp"
#include "lpa/utils/file_utils.hpp"

#include <gtest/gtest.h>

namespace lpa::models
{
    class RegistryCacheTest : public ::testing::Test {
    protected:
        void SetUp() override {
            root_ = fs::temp_directory_path() /
                    (std::string("lpa_registry_cache_") + ::testing::UnitTest::GetInstance()->current_test_info()->name());
            fs::remove_all(root_);
            models_ = root_ / "app" / "Models";
            cache_dir_ = root_ / ".lpa" / "cache";

            ASSERT_TRUE(file_utils::write_file(models_ / "Post.php",
                "<?php\nnamespace App\\Models;\n"
                "use Illuminate\\Database\\Eloquent\\Model;\n"
                "class Post extends Model { protected $table = 'blog_posts'; }\n").is_ok());
        }

        void TearDown() override {
            fs::remove_all(root_);
        }

        fs::path root_;
        fs::path models_;
        fs::path cache_dir_;
    };

    TEST_F(RegistryCacheTest, SerializeRoundTrip) {
        const auto registry = load_registry({models_}, {});

        auto restored = RegistryCache::deserialize(RegistryCache::serialize(registry));

        ASSERT_TRUE(restored.is_ok());
        EXPECT_EQ(restored.value().resolve_table("App\\Models\\Post").value(), "blog_posts");
        EXPECT_TRUE(restored.value().has_model_for_table("blog_posts"));
    }

    TEST_F(RegistryCacheTest, DeserializeRejectsGarbage) {
        auto restored = RegistryCache::deserialize("{not json");

        ASSERT_TRUE(restored.is_err());
    }

    TEST_F(RegistryCacheTest, KeyChangesWithOptions) {
        RegistryOptions mapped;
        mapped.table_mappings = {{"Post", "posts_archive"}};

        EXPECT_EQ(RegistryCache::compute_key({models_}, {}), RegistryCache::compute_key({models_}, {}));
        EXPECT_NE(RegistryCache::compute_key({models_}, {}), RegistryCache::compute_key({models_}, mapped));
    }

    TEST_F(RegistryCacheTest, StoresAndReuses) {
        const RegistryCache cache(cache_dir_);

        const auto first = load_registry({models_}, {}, &cache);
        const auto key = RegistryCache::compute_key({models_}, {});
        EXPECT_TRUE(fs::exists(cache.path_for(key)));

        const auto cached = cache.load(key);
        ASSERT_TRUE(cached.has_value());
        EXPECT_EQ(cached->size(), first.size());

        auto removed = cache.clear();
        ASSERT_TRUE(removed.is_ok());
        EXPECT_EQ(removed.value(), 1u);
        EXPECT_FALSE(cache.load(key).has_value());
    }

    TEST_F(RegistryCacheTest, MissingDirectoryYieldsEmptyRegistry) {
        const auto registry = load_registry({root_ / "nowhere"}, {});

        EXPECT_TRUE(registry.empty());
    }
}
