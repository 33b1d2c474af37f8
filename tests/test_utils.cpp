#include <gtest/gtest.h>
#include <core/utils.hpp>

TEST(Utils, ParseLong) {
    EXPECT_EQ(parse_long("42").value_or(0), 42);
    EXPECT_EQ(parse_long("-3").value_or(0), -3);
    EXPECT_FALSE(parse_long("4x"));
    EXPECT_FALSE(parse_long(""));
}

TEST(Utils, ParseDouble) {
    EXPECT_DOUBLE_EQ(parse_double("0.25").value_or(0.0), 0.25);
    EXPECT_FALSE(parse_double("bright"));
}

TEST(Utils, ShellQuotePlainWordUnchanged) {
    EXPECT_EQ(shell_quote("sinfo"), "sinfo");
    EXPECT_EQ(shell_quote("-N"), "-N");
}

TEST(Utils, ShellQuoteSpacesAndQuotes) {
    EXPECT_EQ(shell_quote("%N %T"), "'%N %T'");
    EXPECT_EQ(shell_quote("it's"), "'it'\\''s'");
    EXPECT_EQ(shell_quote(""), "''");
}

TEST(Utils, JoinCommand) {
    EXPECT_EQ(join_command({"docker", "exec", "login", "sinfo", "-o", "%N %T"}),
              "docker exec login sinfo -o '%N %T'");
}

TEST(Utils, SplitWhitespace) {
    auto v = split_whitespace("  c1 \t mixed  ");
    ASSERT_EQ(v.size(), 2u);
    EXPECT_EQ(v[0], "c1");
    EXPECT_EQ(v[1], "mixed");
}
