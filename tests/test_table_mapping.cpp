#include <gtest/gtest.h>
#include "fixtures.hpp"
#include "orm/db_enum.hpp"

using namespace dbutils::orm;

namespace {

std::vector<std::string> names(const FieldSelection<fleet::Driver>& selection) {
    std::vector<std::string> result;
    for (const auto* field : selection.fields) {
        result.push_back(field->name);
    }
    return result;
}

} // anonymous namespace

TEST(TableMappingTest, DeclarationOrderAndKey) {
    const auto mapping = mapping_for<fleet::Driver>();
    EXPECT_EQ(mapping.table_name(), "Driver");
    ASSERT_EQ(mapping.fields().size(), 6u);
    EXPECT_EQ(mapping.fields()[0].name, "Id");
    EXPECT_TRUE(mapping.has_key());
    EXPECT_EQ(mapping.key_field()->name, "Id");
}

TEST(TableMappingTest, CreateSkipsKeyAndNotes) {
    const auto mapping = mapping_for<fleet::Driver>();
    auto selection = mapping.fields_for(Operation::Create, true);

    EXPECT_EQ(names(selection),
              (std::vector<std::string>{"Name", "License", "Rating", "Active"}));
    // The key is skipped for Create, so it is not reported either
    EXPECT_EQ(selection.primary_key, nullptr);
}

TEST(TableMappingTest, RetrieveKeepsEveryColumn) {
    const auto mapping = mapping_for<fleet::Driver>();
    auto selection = mapping.fields_for(Operation::Retrieve, false);

    EXPECT_EQ(selection.fields.size(), 6u);
    ASSERT_NE(selection.primary_key, nullptr);
    EXPECT_EQ(selection.primary_key->name, "Id");
}

TEST(TableMappingTest, ExcludePrimaryKeyStillReportsIt) {
    const auto mapping = mapping_for<fleet::Driver>();
    auto selection = mapping.fields_for(Operation::Update, true);

    EXPECT_EQ(names(selection),
              (std::vector<std::string>{"Name", "License", "Rating", "Active"}));
    ASSERT_NE(selection.primary_key, nullptr);
    EXPECT_EQ(selection.primary_key->name, "Id");
}

TEST(TableMappingTest, KeylessMapping) {
    const auto mapping = mapping_for<fleet::AuditEntry>();
    EXPECT_FALSE(mapping.has_key());
    EXPECT_EQ(mapping.fields_for(Operation::Delete, false).primary_key, nullptr);
}

TEST(TableMappingTest, GetAndSetThroughFields) {
    const auto mapping = mapping_for<fleet::Driver>();
    fleet::Driver driver;
    driver.name = "Niki";

    const auto& name = mapping.fields()[1];
    EXPECT_EQ(std::get<std::string>(name.get(driver)), "Niki");

    name.set(driver, dbutils::core::Value(std::string("James")));
    EXPECT_EQ(driver.name, "James");

    const auto& license = mapping.fields()[2];
    EXPECT_TRUE(dbutils::core::is_null(license.get(driver)));
}

TEST(TableMappingTest, SecondKeyIsRejected) {
    TableMapping<fleet::Driver> mapping("Driver");
    mapping.key("Id", &fleet::Driver::id);
    EXPECT_THROW(mapping.key("Name", &fleet::Driver::name), MappingError);
}

TEST(TableMappingTest, DuplicateColumnIsRejected) {
    TableMapping<fleet::Driver> mapping("Driver");
    mapping.column("Name", &fleet::Driver::name);
    EXPECT_THROW(mapping.column("Name", &fleet::Driver::notes), MappingError);
}

TEST(TableMappingTest, DuplicateColumnDifferingOnlyInCaseIsRejected) {
    TableMapping<fleet::Driver> mapping("Driver");
    mapping.key("Id", &fleet::Driver::id).column("Name", &fleet::Driver::name);
    EXPECT_THROW(mapping.column("name", &fleet::Driver::notes), MappingError);
    EXPECT_THROW(mapping.column("ID", &fleet::Driver::rating), MappingError);
}

TEST(TableMappingTest, EmptyNamesAreRejected) {
    EXPECT_THROW(TableMapping<fleet::Driver>(""), MappingError);
    TableMapping<fleet::Driver> mapping("Driver");
    EXPECT_THROW(mapping.column("", &fleet::Driver::name), MappingError);
}

TEST(TableMappingTest, DbEnumMapping) {
    const auto mapping = mapping_for<DbEnum<int>>();
    ASSERT_EQ(mapping.fields().size(), 2u);
    EXPECT_EQ(mapping.fields()[0].name, "Name");
    EXPECT_EQ(mapping.fields()[1].name, "Value");
    EXPECT_FALSE(mapping.has_key());
}
