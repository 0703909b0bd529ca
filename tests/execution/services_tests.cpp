#include <gtest/gtest.h>
#include "genoflow/execution/run_context.hpp"
#include "genoflow/execution/services.inline.hpp"
#include "test_helpers.hpp"

using namespace genoflow;
using namespace genoflow_test;

namespace
{

struct EmbeddingClient
{
    std::string url;
};

struct Cache
{
    int hits{0};
};

} // namespace

TEST(ServicesTests, SetAndGet_ReturnsSameInstance)
{
    ServiceSet services;
    auto client = std::make_shared<EmbeddingClient>(EmbeddingClient{"http://localhost:8000"});
    services.set("genos", client);

    EXPECT_TRUE(services.contains("genos"));
    EXPECT_EQ(services.get<EmbeddingClient>("genos"), client);
    EXPECT_EQ(services.names(), std::vector<std::string>{"genos"});
}

TEST(ServicesTests, Get_Absent_ReturnsNull)
{
    ServiceSet services;
    EXPECT_EQ(services.get<Cache>("cache"), nullptr);
}

TEST(ServicesTests, Get_WrongType_Throws)
{
    ServiceSet services;
    services.set("cache", std::make_shared<Cache>());
    EXPECT_THROW((void)services.get<EmbeddingClient>("cache"), ServiceTypeError);
}

TEST(ServicesTests, Set_EmptyNameOrNull_Throws)
{
    ServiceSet services;
    EXPECT_THROW(services.set("", std::make_shared<Cache>()), std::invalid_argument);
    EXPECT_THROW(services.set("cache", std::shared_ptr<Cache>{}), std::invalid_argument);
}

TEST(ServicesTests, Remove_DropsService)
{
    ServiceSet services;
    services.set("cache", std::make_shared<Cache>());
    EXPECT_TRUE(services.remove("cache"));
    EXPECT_FALSE(services.remove("cache"));
    EXPECT_EQ(services.size(), 0u);
}

TEST(ServicesTests, RunContext_ExposesServicesByName)
{
    ServiceSet services;
    auto cache = std::make_shared<Cache>();
    services.set("cache", cache);

    auto plan = make_plan({make_task("A")});
    auto registry = std::make_shared<TaskRegistry>();
    RunContext ctx{plan, registry, services};

    EXPECT_EQ(ctx.service<Cache>("cache"), cache);
    EXPECT_EQ(ctx.service<Cache>("missing"), nullptr);
    EXPECT_EQ(ctx.results().size(), 1u);
}

TEST(ServicesTests, RunContext_NullPlanOrRegistry_Throws)
{
    auto registry = std::make_shared<TaskRegistry>();
    EXPECT_THROW(RunContext(nullptr, registry), std::invalid_argument);
    EXPECT_THROW(RunContext(make_plan({}), nullptr), std::invalid_argument);
}
