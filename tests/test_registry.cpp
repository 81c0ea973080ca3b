#include <gtest/gtest.h>
#include <taskchain/core/registry.hpp>
#include <taskchain/core/executor.hpp>
#include "test_doubles.hpp"
#include <memory>
#include <stdexcept>

using namespace taskchain;

static std::unique_ptr<Executor> make_executor() {
    ExecutionContext ctx; ctx.running_in_console = true; ctx.running_unit_tests = true;
    return std::make_unique<Executor>(ctx, ExecutorConfig{},
        std::make_unique<taskchain::testing::RecordingNotifier>(),
        std::make_unique<taskchain::testing::FakeHttpClient>());
}

TEST(Registry, ListIsSortedAndRunReturnsOutput) {
    OrchestrationRegistry reg;
    reg.add("zeta", "last", [](Executor& ex){ ex.run_closure([]{ return std::string("z"); }); });
    reg.add("alpha", "first", [](Executor& ex){
        ex.run_closure([]{ return std::string("a1"); }).run_closure([]{ return std::string("a2"); });
    });
    auto entries = reg.list();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].name, "alpha");
    EXPECT_EQ(entries[1].description, "last");

    auto ex = make_executor();
    auto out = reg.run("alpha", *ex);
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(*out, "a1a2");
}

TEST(Registry, UnknownNameAndReplacement) {
    OrchestrationRegistry reg;
    auto ex = make_executor();
    EXPECT_FALSE(reg.run("missing", *ex).has_value());
    EXPECT_FALSE(reg.contains("missing"));

    reg.add("job", "v1", [](Executor& e){ e.run_closure([]{ return std::string("v1"); }); });
    reg.add("job", "v2", [](Executor& e){ e.run_closure([]{ return std::string("v2"); }); });
    EXPECT_TRUE(reg.contains("job"));
    EXPECT_EQ(reg.list().size(), 1u);
    EXPECT_EQ(*reg.run("job", *ex), "v2");
}

TEST(Registry, StepExceptionsPropagate) {
    OrchestrationRegistry reg;
    reg.add("broken", "", [](Executor& e){
        e.run_closure([]() -> std::string { throw std::runtime_error("closure failed"); });
    });
    auto ex = make_executor();
    EXPECT_THROW(reg.run("broken", *ex), std::runtime_error);
}
