#include <gtest/gtest.h>
#include "buildflow/common/buildflow_exceptions.hpp"
#include "buildflow/common/dependency_resolver.hpp"

#include <algorithm>

using namespace buildflow;

// =============================================================================
// Test Fixture
// =============================================================================

class DependencyResolverTests : public ::testing::Test
{
protected:
    void add(const std::string& name, std::vector<std::string> dependencies = {})
    {
        TaskDefinition definition;
        definition.name = name;
        definition.dependencies = std::move(dependencies);
        registry.register_task(std::move(definition));
    }

    /// The usual Clean/Restore/Build/Test/Pack/Default graph.
    void add_pipeline()
    {
        add("Clean");
        add("Restore", {"Clean"});
        add("Build", {"Restore"});
        add("Test", {"Build"});
        add("Pack", {"Build"});
        add("Default", {"Build", "Test", "Pack"});
    }

    static size_t position(const ExecutionPlan& plan, const std::string& name)
    {
        auto names = plan.task_names();
        return static_cast<size_t>(std::find(names.begin(), names.end(), name) - names.begin());
    }

    TaskRegistry registry;
};

// =============================================================================
// Ordering
// =============================================================================

TEST_F(DependencyResolverTests, Resolve_Pipeline_DefaultOrder)
{
    add_pipeline();
    DependencyResolver resolver(registry);

    auto plan = resolver.resolve("Default");
    EXPECT_EQ(plan.target, "Default");
    EXPECT_EQ(plan.task_names(),
              (std::vector<std::string>{"Clean", "Restore", "Build", "Test", "Pack", "Default"}));
}

TEST_F(DependencyResolverTests, Resolve_Leaf_OnlyItself)
{
    add_pipeline();
    DependencyResolver resolver(registry);
    EXPECT_EQ(resolver.resolve("Clean").task_names(), (std::vector<std::string>{"Clean"}));
}

TEST_F(DependencyResolverTests, Resolve_Pack_ExcludesUnrelatedTasks)
{
    add_pipeline();
    DependencyResolver resolver(registry);
    EXPECT_EQ(resolver.resolve("Pack").task_names(),
              (std::vector<std::string>{"Clean", "Restore", "Build", "Pack"}));
}

TEST_F(DependencyResolverTests, Resolve_Diamond_SharedDependencyOnce)
{
    add("A");
    add("B", {"A"});
    add("C", {"A"});
    add("D", {"B", "C"});
    DependencyResolver resolver(registry);

    auto plan = resolver.resolve("D");
    EXPECT_EQ(plan.task_names(), (std::vector<std::string>{"A", "B", "C", "D"}));
}

TEST_F(DependencyResolverTests, Resolve_EveryDependencyPrecedesDependent)
{
    add("Z");
    add("Y", {"Z"});
    add("X", {"Z", "Y"});
    add("W", {"X", "Y"});
    add("V", {"W", "Z"});
    DependencyResolver resolver(registry);

    auto plan = resolver.resolve("V");
    ASSERT_EQ(plan.task_count(), 5u);
    ASSERT_EQ(plan.dependency_positions.size(), plan.task_count());
    for (size_t i = 0; i < plan.task_count(); ++i)
    {
        for (const auto& dependency : plan.tasks[i]->dependencies())
        {
            EXPECT_LT(position(plan, dependency), i)
                << dependency << " must precede " << plan.tasks[i]->name();
        }
        for (size_t dep : plan.dependency_positions[i])
        {
            EXPECT_LT(dep, i);
        }
    }
}

TEST_F(DependencyResolverTests, Resolve_Twice_SameOrder)
{
    add_pipeline();
    DependencyResolver resolver(registry);
    EXPECT_EQ(resolver.resolve("Default").task_names(), resolver.resolve("Default").task_names());
}

// =============================================================================
// Errors
// =============================================================================

TEST_F(DependencyResolverTests, Resolve_UnknownTarget_Throws)
{
    add_pipeline();
    DependencyResolver resolver(registry);
    try
    {
        resolver.resolve("Publish");
        FAIL() << "Expected UnknownTaskError";
    }
    catch (const UnknownTaskError& e)
    {
        EXPECT_EQ(e.task_name(), "Publish");
        EXPECT_TRUE(e.referenced_by().empty());
    }
}

TEST_F(DependencyResolverTests, Resolve_UnknownDependency_NamesReferrer)
{
    add("Build", {"Restore"});
    DependencyResolver resolver(registry);
    try
    {
        resolver.resolve("Build");
        FAIL() << "Expected UnknownTaskError";
    }
    catch (const UnknownTaskError& e)
    {
        EXPECT_EQ(e.task_name(), "Restore");
        EXPECT_EQ(e.referenced_by(), "Build");
    }
}

TEST_F(DependencyResolverTests, Resolve_TwoTaskCycle_ReportsPath)
{
    add("A", {"B"});
    add("B", {"A"});
    DependencyResolver resolver(registry);
    try
    {
        resolver.resolve("A");
        FAIL() << "Expected CyclicDependencyError";
    }
    catch (const CyclicDependencyError& e)
    {
        EXPECT_EQ(e.cycle(), (std::vector<std::string>{"A", "B", "A"}));
        EXPECT_NE(std::string(e.what()).find("A -> B -> A"), std::string::npos);
        EXPECT_EQ(e.code(), BuildFlowErrorCode::CyclicDependency);
        EXPECT_STREQ(error_code_name(e.code()), "CyclicDependency");
    }
}

TEST_F(DependencyResolverTests, Resolve_CycleBelowTarget_ExcludesTargetFromCycle)
{
    add("Top", {"A"});
    add("A", {"B"});
    add("B", {"C"});
    add("C", {"A"});
    DependencyResolver resolver(registry);
    try
    {
        resolver.resolve("Top");
        FAIL() << "Expected CyclicDependencyError";
    }
    catch (const CyclicDependencyError& e)
    {
        EXPECT_EQ(e.cycle(), (std::vector<std::string>{"A", "B", "C", "A"}));
    }
}

TEST_F(DependencyResolverTests, ValidateAll_DetectsCycleUnreachableFromDefault)
{
    add_pipeline();
    add("Lint", {"Format"});
    add("Format", {"Lint"});
    DependencyResolver resolver(registry);

    EXPECT_NO_THROW(resolver.resolve("Default"));
    EXPECT_THROW(resolver.validate_all(), CyclicDependencyError);
}

TEST_F(DependencyResolverTests, ValidateAll_CleanGraph_Succeeds)
{
    add_pipeline();
    DependencyResolver resolver(registry);
    EXPECT_NO_THROW(resolver.validate_all());
}
