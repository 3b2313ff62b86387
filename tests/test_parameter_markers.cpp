#include <gtest/gtest.h>
#include "orm/parameter_markers.hpp"

using namespace dbutils::orm;
using dbutils::core::Value;

TEST(ParameterMarkersTest, ReplacesNamedMarkersInOrder) {
    auto bound = bind_named_parameters(
        "SELECT * FROM Driver WHERE Rating > @min AND Name = @name",
        {{"name", "Alain"}, {"min", 4.5}});

    EXPECT_EQ(bound.sql, "SELECT * FROM Driver WHERE Rating > ? AND Name = ?");
    ASSERT_EQ(bound.values.size(), 2u);
    EXPECT_EQ(std::get<double>(bound.values[0]), 4.5);
    EXPECT_EQ(std::get<std::string>(bound.values[1]), "Alain");
}

TEST(ParameterMarkersTest, RepeatedMarkerBindsTwice) {
    auto bound = bind_named_parameters("SELECT @x, @X", {{"x", 1}});
    EXPECT_EQ(bound.sql, "SELECT ?, ?");
    EXPECT_EQ(bound.values.size(), 2u);
}

TEST(ParameterMarkersTest, LongerNameIsNotAPrefixMatch) {
    auto bound = bind_named_parameters("VALUES (@Name_1, @Name_10)",
                                       {{"Name_1", "a"}, {"Name_10", "b"}});
    EXPECT_EQ(bound.sql, "VALUES (?, ?)");
    ASSERT_EQ(bound.values.size(), 2u);
    EXPECT_EQ(std::get<std::string>(bound.values[0]), "a");
    EXPECT_EQ(std::get<std::string>(bound.values[1]), "b");
}

TEST(ParameterMarkersTest, LiteralsIdentifiersAndCommentsAreUntouched) {
    std::string sql =
        "SELECT '@Id', [@Id], \"@Id\", 'it''s @Id' -- @Id\n"
        "/* @Id */ FROM T WHERE Id = @Id";
    auto bound = bind_named_parameters(sql, {{"Id", 3}});

    EXPECT_EQ(bound.sql,
              "SELECT '@Id', [@Id], \"@Id\", 'it''s @Id' -- @Id\n"
              "/* @Id */ FROM T WHERE Id = ?");
    EXPECT_EQ(bound.values.size(), 1u);
}

TEST(ParameterMarkersTest, NestedBlockCommentsAreUntouched) {
    auto bound = bind_named_parameters("/* a /* b */ @Id */ SELECT @Id", {{"Id", 5}});

    EXPECT_EQ(bound.sql, "/* a /* b */ @Id */ SELECT ?");
    EXPECT_EQ(bound.values.size(), 1u);
}

TEST(ParameterMarkersTest, UnterminatedBlockCommentRunsToTheEnd) {
    auto bound = bind_named_parameters("SELECT 1 /* @Id", {{"Id", 5}});

    EXPECT_EQ(bound.sql, "SELECT 1 /* @Id");
    EXPECT_TRUE(bound.values.empty());
}

TEST(ParameterMarkersTest, SystemFunctionsAndLocalVariablesAreKept) {
    auto bound = bind_named_parameters(
        "DECLARE @n INT = @count; SELECT @@ROWCOUNT, @n", {{"count", 5}});
    EXPECT_EQ(bound.sql, "DECLARE @n INT = ?; SELECT @@ROWCOUNT, @n");
    EXPECT_EQ(bound.values.size(), 1u);
}

TEST(ParameterMarkersTest, NullValueIsBound) {
    auto bound = bind_named_parameters("UPDATE T SET License = @License",
                                       {{"License", Value()}});
    ASSERT_EQ(bound.values.size(), 1u);
    EXPECT_TRUE(dbutils::core::is_null(bound.values[0]));
}

TEST(ParameterMarkersTest, ProcedureCall) {
    auto bound = build_procedure_call("GetDriverVehicles", {{"@driverId", 7}, {"active", true}});
    EXPECT_EQ(bound.sql, "EXEC GetDriverVehicles @driverId = ?, @active = ?");
    ASSERT_EQ(bound.values.size(), 2u);
    EXPECT_EQ(std::get<std::int64_t>(bound.values[0]), 7);
}

TEST(ParameterMarkersTest, ProcedureCallWithoutParameters) {
    auto bound = build_procedure_call("PurgeTrips", {});
    EXPECT_EQ(bound.sql, "EXEC PurgeTrips");
    EXPECT_TRUE(bound.values.empty());
}

TEST(ParameterMarkersTest, BindCommandDispatchesOnType) {
    auto proc = bind_command(make_command("PurgeTrips", {{"days", 30}}));
    EXPECT_EQ(proc.sql, "EXEC PurgeTrips @days = ?");

    auto text = bind_command(make_command("DELETE FROM Trip WHERE Age > @days", {{"days", 30}}));
    EXPECT_EQ(text.sql, "DELETE FROM Trip WHERE Age > ?");
}
