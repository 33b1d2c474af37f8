#include <gtest/gtest.h>
#include <core/config.hpp>
#include <managers/slurm_helpers.hpp>

// ── Job rows ────────────────────────────────────────────────

TEST(JobRows, ParsesIdPartitionAndName) {
    auto r = parse_job_rows("101 normal daxpy\n102 quantum qcsc sampler run\n");
    ASSERT_TRUE(r.is_ok());
    ASSERT_EQ(r.value.size(), 2u);
    EXPECT_EQ(r.value[0].id, "101");
    EXPECT_EQ(r.value[0].partition, "normal");
    EXPECT_EQ(r.value[0].name, "daxpy");
    EXPECT_EQ(r.value[1].partition, "quantum");
    EXPECT_EQ(r.value[1].name, "qcsc sampler run");
}

TEST(JobRows, EmptyOutputIsNoJobs) {
    auto r = parse_job_rows("");
    ASSERT_TRUE(r.is_ok());
    EXPECT_TRUE(r.value.empty());
}

TEST(JobRows, BlankLinesSkipped) {
    auto r = parse_job_rows("\n  \n7 normal x\n\n");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.size(), 1u);
}

TEST(JobRows, MissingPartitionIsMalformed) {
    auto r = parse_job_rows("101 normal a\n102\n");
    EXPECT_TRUE(r.is_err());
    EXPECT_TRUE(r.value.empty());
    EXPECT_NE(r.error.find("row 2"), std::string::npos);
}

// ── Node rows ───────────────────────────────────────────────

TEST(NodeRows, ParsesAndNormalizes) {
    auto r = parse_node_rows("c1 mixed\nc2 idle\nq1 allocated\nq2 down*\n");
    ASSERT_TRUE(r.is_ok());
    ASSERT_EQ(r.value.size(), 4u);
    EXPECT_EQ(r.value[0].token, NodeToken::Mixed);
    EXPECT_EQ(r.value[1].token, NodeToken::Idle);
    EXPECT_EQ(r.value[2].token, NodeToken::Allocated);
    EXPECT_EQ(r.value[3].token, NodeToken::Down);
}

TEST(NodeRows, DuplicateNodeMergedBusyWins) {
    // sinfo -N lists a node once per partition
    auto r = parse_node_rows("c1 idle\nc1 mixed\nc2 alloc\nc2 idle\n");
    ASSERT_TRUE(r.is_ok());
    ASSERT_EQ(r.value.size(), 2u);
    EXPECT_EQ(r.value[0].node_id, "c1");
    EXPECT_EQ(r.value[0].token, NodeToken::Mixed);
    EXPECT_EQ(r.value[1].token, NodeToken::Allocated);
}

TEST(NodeRows, NodeNamesLowerCased) {
    auto r = parse_node_rows("C1 allocated\nc1 idle\nQ2 MIXED\n");
    ASSERT_TRUE(r.is_ok());
    ASSERT_EQ(r.value.size(), 2u);
    EXPECT_EQ(r.value[0].node_id, "c1");
    EXPECT_EQ(r.value[0].token, NodeToken::Allocated);
    EXPECT_EQ(r.value[1].node_id, "q2");
    EXPECT_EQ(r.value[1].token, NodeToken::Mixed);
}

TEST(NodeRows, ExtraFieldIsMalformed) {
    EXPECT_TRUE(parse_node_rows("c1 idle extra\n").is_err());
    EXPECT_TRUE(parse_node_rows("c1\n").is_err());
}

TEST(NodeRows, EmptyOutputIsOkAndEmpty) {
    auto r = parse_node_rows("\n");
    ASSERT_TRUE(r.is_ok());
    EXPECT_TRUE(r.value.empty());
}

// ── Tokens ──────────────────────────────────────────────────

TEST(NodeToken, FlagCharactersStripped) {
    EXPECT_EQ(parse_node_token("idle~"), NodeToken::Idle);
    EXPECT_EQ(parse_node_token("alloc#"), NodeToken::Allocated);
    EXPECT_EQ(parse_node_token("mix-"), NodeToken::Mixed);
    EXPECT_EQ(parse_node_token("drained*"), NodeToken::Down);
    EXPECT_EQ(parse_node_token("IDLE"), NodeToken::Idle);
}

TEST(NodeToken, AllDownSpellings) {
    for (const char* s : {"down", "drain", "drained", "draining", "fail", "failing"}) {
        EXPECT_EQ(parse_node_token(s), NodeToken::Down) << s;
    }
}

TEST(NodeToken, CompletingCountsAsAllocated) {
    EXPECT_EQ(parse_node_token("completing"), NodeToken::Allocated);
}

TEST(NodeToken, UnrecognizedIsUnknown) {
    EXPECT_EQ(parse_node_token("planned"), NodeToken::Unknown);
    EXPECT_EQ(parse_node_token(""), NodeToken::Unknown);
    EXPECT_FALSE(node_token_active(NodeToken::Unknown));
}

// ── Commands ────────────────────────────────────────────────

TEST(Commands, SqueueInContainer) {
    JobSourceConfig j;
    j.docker_cmd = "podman";
    j.container = "login";
    std::vector<std::string> expected = {"podman", "exec", "login", "squeue",
                                         "-t", "RUNNING", "-h", "-o", "%i %P %j"};
    EXPECT_EQ(build_squeue_command(j), expected);
}

TEST(Commands, SqueueOnHostWithUserFilter) {
    JobSourceConfig j;
    j.docker_cmd = "docker";
    j.slurm_user = "alice";
    std::vector<std::string> expected = {"squeue", "-u", "alice",
                                         "-t", "RUNNING", "-h", "-o", "%i %P %j"};
    EXPECT_EQ(build_squeue_command(j), expected);
}

TEST(Commands, Sinfo) {
    RemoteSourceConfig r;
    r.docker_cmd = "docker";
    r.container = "slurmctld";
    std::vector<std::string> expected = {"docker", "exec", "slurmctld", "sinfo",
                                         "-N", "-h", "-o", "%N %T"};
    EXPECT_EQ(build_sinfo_command(r), expected);
}
