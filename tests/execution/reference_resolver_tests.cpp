#include <gtest/gtest.h>
#include "genoflow/execution/reference_resolver.hpp"
#include "genoflow/execution/result_store.hpp"
#include "test_helpers.hpp"

using namespace genoflow;
using namespace genoflow_test;

class ReferenceResolverTests : public ::testing::Test
{
protected:
    void SetUp() override
    {
        m_plan = make_plan({
            make_task("A"),
            make_task("B", {"A"},
                      {{"ids", output_ref("A", "ids")},
                       {"nested", Value::Map{{"list", Value::List{1, output_ref("A", "count")}}}},
                       {"literal", "text"}}),
        });
        m_store = std::make_unique<ResultStore>(*m_plan);
    }

    void succeed_a(Value::Map outputs)
    {
        auto t = now_timestamp();
        ASSERT_TRUE(m_store->mark_running(0, t));
        ASSERT_TRUE(m_store->mark_succeeded(0, std::move(outputs), t));
    }

    std::shared_ptr<const Plan> m_plan;
    std::unique_ptr<ResultStore> m_store;
};

TEST_F(ReferenceResolverTests, ResolveConfig_SubstitutesAtAnyDepth)
{
    succeed_a({{"ids", Value::List{"v1", "v2"}}, {"count", 2}});
    ReferenceResolver resolver{*m_store};

    Value::Map config = resolver.resolve_config(m_plan->tasks[1]);
    EXPECT_EQ(config.at("ids"), (Value{Value::List{"v1", "v2"}}));
    EXPECT_EQ(config.at("nested"), (Value{Value::Map{{"list", Value::List{1, 2}}}}));
    EXPECT_EQ(config.at("literal"), Value{"text"});
    EXPECT_FALSE(Value{config}.contains_references());
}

TEST_F(ReferenceResolverTests, ResolveConfig_ProducerNotSucceeded_Unresolved)
{
    ReferenceResolver resolver{*m_store};
    try
    {
        resolver.resolve_config(m_plan->tasks[1]);
        FAIL() << "Expected ResolutionError";
    }
    catch (const ResolutionError& e)
    {
        EXPECT_EQ(e.code(), ResolutionErrorCode::UnresolvedReference);
        EXPECT_EQ(std::string(e.what()).rfind("Task 'B': ", 0), 0u);
    }
}

TEST_F(ReferenceResolverTests, ResolveConfig_MissingKey_MissingOutputKey)
{
    succeed_a({{"ids", Value::List{}}});
    ReferenceResolver resolver{*m_store};
    try
    {
        resolver.resolve_config(m_plan->tasks[1]);
        FAIL() << "Expected ResolutionError";
    }
    catch (const ResolutionError& e)
    {
        EXPECT_EQ(e.code(), ResolutionErrorCode::MissingOutputKey);
        EXPECT_NE(std::string(e.what()).find("count"), std::string::npos);
    }
}

TEST_F(ReferenceResolverTests, ResolveReference_UnknownTask_Unresolved)
{
    ReferenceResolver resolver{*m_store};
    EXPECT_THROW(resolver.resolve_reference(OutputReference{"Z", "k"}), ResolutionError);
}

TEST_F(ReferenceResolverTests, Resolve_NullOutputIsAValue)
{
    succeed_a({{"ids", nullptr}, {"count", 0}});
    ReferenceResolver resolver{*m_store};
    EXPECT_TRUE(resolver.resolve(output_ref("A", "ids")).is_null());
}
