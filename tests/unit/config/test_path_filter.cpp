//
// Created by gregorian-rayne on 1/14/26.
//

#include "lpa/config/path_filter.hpp"
#include "lpa/config/config.hpp"
#include "lpa/utils/file_utils.hpp"

#include <gtest/gtest.h>

namespace lpa::config
{
    class PathFilterTest : public ::testing::Test {
    protected:
        void SetUp() override {
            dir_ = fs::temp_directory_path() /
                   (std::string("lpa_path_filter_") + ::testing::UnitTest::GetInstance()->current_test_info()->name());
            fs::remove_all(dir_);
            for (const auto* file : {
                     "app/Models/User.php",
                     "app/Http/Controllers/UserController.php",
                     "app/Http/Controllers/notes.txt",
                     "routes/web.php",
                     "vendor/laravel/framework/src/Model.php",
                     "storage/framework/views/compiled.php",
                     "database/seeders/UserSeeder.php",
                 }) {
                ASSERT_TRUE(file_utils::write_file(dir_ / file, "<?php\n").is_ok());
            }
        }

        void TearDown() override {
            fs::remove_all(dir_);
        }

        static std::vector<std::string> relative_paths(const std::vector<engine::SourceFile>& files) {
            std::vector<std::string> paths;
            for (const auto& file : files) {
                paths.push_back(file.relative_path);
            }
            return paths;
        }

        fs::path dir_;
    };

    TEST_F(PathFilterTest, CollectsPhpFilesSorted) {
        const PathFilter filter(dir_, {"app", "routes"}, {});

        auto files = filter.collect();

        ASSERT_TRUE(files.is_ok());
        EXPECT_EQ(relative_paths(files.value()), (std::vector<std::string>{
            "app/Http/Controllers/UserController.php",
            "app/Models/User.php",
            "routes/web.php",
        }));
        EXPECT_EQ(files.value()[1].path, dir_ / "app/Models/User.php");
    }

    TEST_F(PathFilterTest, ExcludedPatterns) {
        const PathFilter filter(dir_, {"."}, {"vendor/*", "storage/*", "*Seeder.php"});

        auto files = filter.collect();

        ASSERT_TRUE(files.is_ok());
        EXPECT_EQ(relative_paths(files.value()), (std::vector<std::string>{
            "app/Http/Controllers/UserController.php",
            "app/Models/User.php",
            "routes/web.php",
        }));
    }

    TEST_F(PathFilterTest, OverlappingPathsAreDeduplicated) {
        const PathFilter filter(dir_, {"app", "app/Models", "app/Models/User.php"}, {});

        auto files = filter.collect();

        ASSERT_TRUE(files.is_ok());
        EXPECT_EQ(files.value().size(), 2u);
    }

    TEST_F(PathFilterTest, MissingSubPathIsSkipped) {
        const PathFilter filter(dir_, {"routes", "modules"}, {});

        auto files = filter.collect();

        ASSERT_TRUE(files.is_ok());
        EXPECT_EQ(relative_paths(files.value()), std::vector<std::string>{"routes/web.php"});
    }

    TEST_F(PathFilterTest, MissingBaseDirectory) {
        const PathFilter filter(dir_ / "nope", {"app"}, {});

        auto files = filter.collect();

        ASSERT_TRUE(files.is_err());
        EXPECT_EQ(files.error().code(), ErrorCode::NotFound);
    }

    TEST_F(PathFilterTest, FromConfig) {
        Config config;
        config.general.base_path = dir_.string();

        const auto filter = PathFilter::from_config(config);

        EXPECT_EQ(filter.base(), dir_);
        EXPECT_TRUE(filter.is_excluded("vendor/laravel/framework/src/Model.php"));
        EXPECT_TRUE(filter.is_excluded("Storage/logs/x.php"));
        EXPECT_FALSE(filter.is_excluded("app/Models/User.php"));

        auto files = filter.collect();
        ASSERT_TRUE(files.is_ok());
        EXPECT_EQ(files.value().size(), 4u);
    }

}  // namespace lpa::config
