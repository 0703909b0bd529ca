#include <gtest/gtest.h>
#include "genoflow/common/errors.hpp"
#include "genoflow/plan/references.hpp"

using namespace genoflow;

TEST(ReferencesTests, ParseReferences_ReplacesExactReferenceText)
{
    Value::Map config{
        {"input", "${output.filter.vcf}"},
        {"nested", Value::List{"plain", "${output.filter.ids}"}},
        {"count", 3},
    };
    Value::Map parsed = parse_references(config, "task 'x'");

    EXPECT_EQ(parsed.at("input"), output_ref("filter", "vcf"));
    EXPECT_EQ(parsed.at("nested"), (Value{Value::List{"plain", output_ref("filter", "ids")}}));
    EXPECT_EQ(parsed.at("count"), Value{3});
}

TEST(ReferencesTests, ParseReferences_EmbeddedReference_Throws)
{
    Value::Map config{{"path", "prefix/${output.filter.vcf}"}};
    try
    {
        parse_references(config, "task 'x'");
        FAIL() << "Expected PlanError";
    }
    catch (const PlanError& e)
    {
        EXPECT_EQ(e.code(), PlanErrorCode::InvalidConfiguration);
        EXPECT_NE(std::string(e.what()).find("task 'x'.path"), std::string::npos);
    }
}

TEST(ReferencesTests, CollectReferences_FindsAllInOrder)
{
    Value::Map config{
        {"a", output_ref("t1", "k1")},
        {"b", Value::Map{{"c", Value::List{output_ref("t2", "k2"), output_ref("t1", "k1")}}}},
    };
    auto refs = collect_references(config);
    ASSERT_EQ(refs.size(), 3u);
    EXPECT_EQ(refs[0], (OutputReference{"t1", "k1"}));
    EXPECT_EQ(refs[1], (OutputReference{"t2", "k2"}));
    EXPECT_EQ(refs[2], (OutputReference{"t1", "k1"}));
}
