//
// Created by gregorian-rayne on 1/14/26.
//

#include "lpa/models/model_registry.hpp"
#include "lpa/utils/file_utils.hpp"

#include <gtest/gtest.h>

namespace lpa::models
{
    class ModelRegistryTest : public ::testing::Test {
    protected:
        void add(const std::string& file, const std::string& source) {
            const auto added = builder_.add_source(file, source);
            EXPECT_TRUE(added.is_ok()) << file;
        }

        RegistryBuilder builder_;
    };

    TEST_F(ModelRegistryTest, ConventionalTable) {
        add("app/Models/OrderItem.php",
            "<?php\nnamespace App\\Models;\n\n"
            "use Illuminate\\Database\\Eloquent\\Model;\n\n"
            "class OrderItem extends Model {}\n");

        const auto registry = builder_.build();

        ASSERT_TRUE(registry.is_model("App\\Models\\OrderItem"));
        auto table = registry.resolve_table("App\\Models\\OrderItem");
        ASSERT_TRUE(table.is_ok());
        EXPECT_EQ(table.value(), "order_items");
        EXPECT_TRUE(registry.has_model_for_table("order_items"));
    }

    TEST_F(ModelRegistryTest, TablePropertyAndMethod) {
        add("app/Models/Legacy.php",
            "<?php\nnamespace App\\Models;\n"
            "use Illuminate\\Database\\Eloquent\\Model;\n"
            "class Legacy extends Model {\n"
            "    protected $table = 'tbl_legacy';\n"
            "}\n"
            "class Report extends Model {\n"
            "    public function getTable() { return 'reports_v2'; }\n"
            "}\n");

        const auto registry = builder_.build();

        EXPECT_EQ(registry.resolve_table("App\\Models\\Legacy").value(), "tbl_legacy");
        EXPECT_EQ(registry.resolve_table("App\\Models\\Report").value(), "reports_v2");
    }

    TEST_F(ModelRegistryTest, InheritsAncestorTable) {
        add("app/Models/Animal.php",
            "<?php\nnamespace App\\Models;\n"
            "use Illuminate\\Database\\Eloquent\\Model;\n"
            "class Animal extends Model { protected $table = 'animals_all'; }\n"
            "class Dog extends Animal {}\n");

        const auto registry = builder_.build();

        ASSERT_TRUE(registry.is_model("App\\Models\\Dog"));
        EXPECT_EQ(registry.resolve_table("App\\Models\\Dog").value(), "animals_all");
        EXPECT_EQ(registry.parent_of("App\\Models\\Dog"), "App\\Models\\Animal");
    }

    TEST_F(ModelRegistryTest, OwnTableOverridesAncestor) {
        add("app/Models/Animal.php",
            "<?php\nnamespace App\\Models;\n"
            "use Illuminate\\Database\\Eloquent\\Model;\n"
            "class Animal extends Model { protected $table = 'animals_all'; }\n"
            "class Cat extends Animal { protected $table = 'cats_only'; }\n");

        const auto registry = builder_.build();

        EXPECT_EQ(registry.resolve_table("App\\Models\\Animal").value(), "animals_all");
        EXPECT_EQ(registry.resolve_table("App\\Models\\Cat").value(), "cats_only");
    }

    TEST_F(ModelRegistryTest, GetTableBeatsPropertyInSameClass) {
        add("app/Models/Archive.php",
            "<?php\nnamespace App\\Models;\n"
            "use Illuminate\\Database\\Eloquent\\Model;\n"
            "class Archive extends Model {\n"
            "    protected $table = 'archives_old';\n"
            "    public function getTable() { return 'archives_new'; }\n"
            "}\n");

        const auto registry = builder_.build();

        EXPECT_EQ(registry.resolve_table("App\\Models\\Archive").value(), "archives_new");
    }

    TEST_F(ModelRegistryTest, DynamicTableIsNotMatched) {
        add("app/Models/Tenant.php",
            "<?php\nnamespace App\\Models;\n"
            "use Illuminate\\Database\\Eloquent\\Model;\n"
            "class Tenant extends Model {\n"
            "    public function getTable() { return 'tenant_' . $this->id; }\n"
            "}\n");

        const auto registry = builder_.build();

        EXPECT_TRUE(registry.is_model("App\\Models\\Tenant"));
        auto table = registry.resolve_table("App\\Models\\Tenant");
        ASSERT_TRUE(table.is_err());
        EXPECT_EQ(table.error().code(), ErrorCode::NotFound);
    }

    TEST_F(ModelRegistryTest, NonModelsAreKnownButNotModels) {
        add("app/Services/Billing.php",
            "<?php\nnamespace App\\Services;\n"
            "class Billing {}\n");

        const auto registry = builder_.build();

        EXPECT_TRUE(registry.knows_class("App\\Services\\Billing"));
        EXPECT_FALSE(registry.is_model("App\\Services\\Billing"));
        EXPECT_TRUE(registry.empty());
    }

    TEST_F(ModelRegistryTest, CycleIsNotAModel) {
        add("app/Models/Cycle.php",
            "<?php\nnamespace App\\Models;\n"
            "class A extends B {}\n"
            "class B extends A {}\n");

        const auto registry = builder_.build();

        EXPECT_FALSE(registry.is_model("App\\Models\\A"));
        EXPECT_FALSE(registry.is_model("App\\Models\\B"));
    }

    TEST(ModelRegistryOptionsTest, MappingsAndCustomBases) {
        RegistryOptions options;
        options.base_classes = {"App\\Support\\BaseModel"};
        options.table_mappings = {{"Invoice", "billing_invoices"}};

        RegistryBuilder builder(options);
        const auto added = builder.add_source("app/Models/Invoice.php",
                           "<?php\nnamespace App\\Models;\n"
                           "use App\\Support\\BaseModel;\n"
                           "class Invoice extends BaseModel {}\n"
                           "class Payment extends BaseModel {}\n");
        ASSERT_TRUE(added.is_ok());
        EXPECT_EQ(added.value(), 2u);

        const auto registry = builder.build();

        EXPECT_EQ(registry.resolve_table("App\\Models\\Invoice").value(), "billing_invoices");
        EXPECT_EQ(registry.resolve_table("App\\Models\\Payment").value(), "payments");
        EXPECT_TRUE(registry.is_orm_base("App\\Support\\BaseModel"));
    }

    TEST(ModelRegistryEntriesTest, SortedByClassName) {
        RegistryBuilder builder;
        const auto added = builder.add_source("m.php",
                           "<?php\nnamespace App\\Models;\n"
                           "use Illuminate\\Database\\Eloquent\\Model;\n"
                           "class Zebra extends Model {}\n"
                           "class Apple extends Model {}\n");
        ASSERT_TRUE(added.is_ok());

        auto registry = builder.build();
        const auto entries = registry.entries();

        ASSERT_EQ(entries.size(), 2u);
        EXPECT_EQ(entries[0].class_name, "App\\Models\\Apple");
        EXPECT_EQ(entries[1].table, "zebras");

        registry.clear();
        EXPECT_TRUE(registry.empty());
        EXPECT_TRUE(registry.is_orm_base("Illuminate\\Database\\Eloquent\\Model"));
    }

    class ModelDirectoryTest : public ::testing::Test {
    protected:
        void SetUp() override {
            dir_ = fs::temp_directory_path() /
                   (std::string("lpa_models_") + ::testing::UnitTest::GetInstance()->current_test_info()->name());
            fs::remove_all(dir_);
        }

        void TearDown() override {
            fs::remove_all(dir_);
        }

        fs::path dir_;
    };

    TEST_F(ModelDirectoryTest, MissingDirectoryGivesEmptyRegistry) {
        RegistryBuilder builder;

        EXPECT_EQ(builder.scan_directory(dir_ / "app" / "Models"), 0u);

        const auto registry = builder.build();
        EXPECT_TRUE(registry.empty());
        EXPECT_FALSE(registry.knows_class("App\\Models\\User"));
    }

    TEST_F(ModelDirectoryTest, UnparseableModelFileIsSkipped) {
        ASSERT_TRUE(file_utils::write_file(dir_ / "User.php",
            "<?php\nnamespace App\\Models;\n"
            "use Illuminate\\Database\\Eloquent\\Model;\n"
            "class User extends Model {}\n").is_ok());
        ASSERT_TRUE(file_utils::write_file(dir_ / "Broken.php",
            "<?php\nnamespace App\\Models;\n"
            "class Broken extends Model {\n"
            "    public function oops( {\n").is_ok());

        RegistryBuilder builder;
        EXPECT_EQ(builder.scan_directory(dir_), 1u);

        const auto registry = builder.build();
        EXPECT_EQ(registry.size(), 1u);
        EXPECT_TRUE(registry.is_model("App\\Models\\User"));
        EXPECT_FALSE(registry.knows_class("App\\Models\\Broken"));
    }

    TEST(RegistryBuilderTest, UnparseableSourceIsReported) {
        RegistryBuilder builder;

        const auto added = builder.add_source("app/Models/Broken.php", "<?php\nclass Broken extends Model {\n");

        ASSERT_TRUE(added.is_err());
        EXPECT_EQ(added.error().code(), ErrorCode::ParseError);
        EXPECT_TRUE(builder.records().empty());
    }
}
