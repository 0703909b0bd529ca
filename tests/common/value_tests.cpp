#include <gtest/gtest.h>
#include "genoflow/common/value.hpp"
#include "genoflow/common/value.inline.hpp"

using namespace genoflow;

// =============================================================================
// Construction and kind
// =============================================================================

TEST(ValueTests, DefaultConstructed_IsNull)
{
    Value v;
    EXPECT_TRUE(v.is_null());
    EXPECT_EQ(v.kind(), ValueKind::Null);
}

TEST(ValueTests, Constructors_SelectExpectedKind)
{
    EXPECT_EQ(Value{true}.kind(), ValueKind::Bool);
    EXPECT_EQ(Value{42}.kind(), ValueKind::Int);
    EXPECT_EQ(Value{std::int64_t{1} << 40}.kind(), ValueKind::Int);
    EXPECT_EQ(Value{0.5}.kind(), ValueKind::Double);
    EXPECT_EQ(Value{"text"}.kind(), ValueKind::String);
    EXPECT_EQ(Value{ArtifactLocator{"file:///x"}}.kind(), ValueKind::Artifact);
    EXPECT_EQ((Value{OutputReference{"a", "b"}}.kind()), ValueKind::Reference);
    EXPECT_EQ(Value{Value::List{}}.kind(), ValueKind::List);
    EXPECT_EQ(Value{Value::Map{}}.kind(), ValueKind::Map);
}

TEST(ValueTests, As_WrongType_Throws)
{
    Value v{"text"};
    EXPECT_EQ(v.as<std::string>(), "text");
    EXPECT_THROW((void)v.as<std::int64_t>(), ValueTypeError);
    EXPECT_EQ(v.try_as<double>(), nullptr);
}

TEST(ValueTests, IntAndDouble_NeverEqual)
{
    EXPECT_NE(Value{1}, Value{1.0});
    EXPECT_TRUE(Value{1}.is_numeric());
    EXPECT_DOUBLE_EQ(Value{3}.to_double(), 3.0);
    EXPECT_THROW((void)Value{"3"}.to_double(), ValueTypeError);
}

TEST(ValueTests, Equality_IsStructural)
{
    Value::Map a{{"x", Value::List{1, 2.5, "s"}}, {"y", nullptr}};
    Value::Map b{{"y", nullptr}, {"x", Value::List{1, 2.5, "s"}}};
    EXPECT_EQ(Value{a}, Value{b});

    b["x"].as<Value::List>().push_back(Value{false});
    EXPECT_NE(Value{a}, Value{b});
}

TEST(ValueTests, ContainsReferences_FindsNestedReference)
{
    Value plain{Value::Map{{"a", Value::List{1, 2}}}};
    EXPECT_FALSE(plain.contains_references());

    Value nested{Value::Map{{"a", Value::List{1, Value{OutputReference{"t", "k"}}}}}};
    EXPECT_TRUE(nested.contains_references());
}

TEST(ValueTests, Describe_RendersCompactForm)
{
    Value v{Value::Map{{"n", 1}, {"s", "x"}, {"r", Value{OutputReference{"t", "k"}}}}};
    EXPECT_EQ(v.describe(), "{n: 1, r: ${output.t.k}, s: \"x\"}");
}

// =============================================================================
// OutputReference syntax
// =============================================================================

TEST(ValueTests, OutputReference_Parse_ExactReference)
{
    auto ref = OutputReference::parse("${output.scoring.max_score}");
    ASSERT_TRUE(ref.has_value());
    EXPECT_EQ(ref->task_id, "scoring");
    EXPECT_EQ(ref->output_key, "max_score");
    EXPECT_EQ(ref->to_string(), "${output.scoring.max_score}");
}

TEST(ValueTests, OutputReference_Parse_KeyMayContainDots)
{
    auto ref = OutputReference::parse("${output.a.b.c}");
    ASSERT_TRUE(ref.has_value());
    EXPECT_EQ(ref->task_id, "a");
    EXPECT_EQ(ref->output_key, "b.c");
}

TEST(ValueTests, OutputReference_Parse_RejectsMalformed)
{
    EXPECT_FALSE(OutputReference::parse("${output.a}").has_value());
    EXPECT_FALSE(OutputReference::parse("${output..k}").has_value());
    EXPECT_FALSE(OutputReference::parse("prefix ${output.a.k}").has_value());
    EXPECT_FALSE(OutputReference::parse("${output.a.k}${output.b.k}").has_value());
    EXPECT_FALSE(OutputReference::parse("${input.a.k}").has_value());
    EXPECT_TRUE(OutputReference::mentions_reference("prefix ${output.a.k}"));
    EXPECT_FALSE(OutputReference::mentions_reference("plain"));
}
