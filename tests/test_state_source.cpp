#include <gtest/gtest.h>
#include <core/config.hpp>
#include <managers/state_source.hpp>
#include "fakes.hpp"

class StateSourceTest : public ::testing::Test {
protected:
    void SetUp() override {
        config = default_config(MonitorRole::Jobs);
        config.remote.enabled = true;
        jobs = std::make_shared<FakeRunner::Shared>();
        nodes = std::make_shared<FakeRunner::Shared>();
    }

    StateSource make() {
        return StateSource(config, std::make_unique<FakeRunner>(jobs),
                           std::make_unique<FakeRunner>(nodes));
    }

    MonitorConfig config;
    std::shared_ptr<FakeRunner::Shared> jobs;
    std::shared_ptr<FakeRunner::Shared> nodes;
};

TEST_F(StateSourceTest, JobsSuccess) {
    jobs->script.push_back(FakeRunner::ok("1 normal a\n2 quantum b\n"));
    auto source = make();
    auto r = source.query_jobs();
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.size(), 2u);
    ASSERT_EQ(jobs->calls.size(), 1u);
    EXPECT_EQ(jobs->calls[0][0], "docker");
    EXPECT_EQ(jobs->calls[0][3], "squeue");
}

TEST_F(StateSourceTest, EmptyJobListingIsSuccess) {
    jobs->script.push_back(FakeRunner::ok(""));
    auto source = make();
    auto r = source.query_jobs();
    ASSERT_TRUE(r.is_ok());
    EXPECT_TRUE(r.value.empty());
}

TEST_F(StateSourceTest, NonZeroExitIsFailureWithEmptySet) {
    jobs->script.push_back(FakeRunner::exit_code(1, "slurm_load_jobs error\n"));
    auto source = make();
    auto r = source.query_jobs();
    EXPECT_TRUE(r.is_err());
    EXPECT_TRUE(r.value.empty());
    EXPECT_NE(r.error.find("slurm_load_jobs error"), std::string::npos);
}

TEST_F(StateSourceTest, TimeoutIsFailure) {
    jobs->script.push_back(FakeRunner::status(CommandStatus::TimedOut, "timed out after 30000ms"));
    auto source = make();
    EXPECT_TRUE(source.query_jobs().is_err());
}

TEST_F(StateSourceTest, MalformedJobRowIsFailure) {
    jobs->script.push_back(FakeRunner::ok("garbage\n"));
    auto source = make();
    EXPECT_TRUE(source.query_jobs().is_err());
}

TEST_F(StateSourceTest, NodesSuccess) {
    nodes->script.push_back(FakeRunner::ok("c1 mixed\nq1 idle\n"));
    auto source = make();
    auto r = source.query_nodes();
    ASSERT_TRUE(r.is_ok());
    ASSERT_EQ(r.value.size(), 2u);
    EXPECT_EQ(nodes->calls[0][3], "sinfo");
}

TEST_F(StateSourceTest, NodeConnectFailure) {
    nodes->script.push_back(FakeRunner::status(CommandStatus::ConnectFailed, "Connection refused"));
    auto source = make();
    auto r = source.query_nodes();
    EXPECT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("Connection refused"), std::string::npos);
}

TEST_F(StateSourceTest, DisabledRunner) {
    StateSource source(config, nullptr, nullptr);
    EXPECT_FALSE(source.jobs_enabled());
    EXPECT_FALSE(source.nodes_enabled());
    EXPECT_TRUE(source.query_jobs().is_err());
}
