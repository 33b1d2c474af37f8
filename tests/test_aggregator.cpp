#include <gtest/gtest.h>
#include <managers/aggregator.hpp>
#include <managers/display_mapper.hpp>
#include <core/constants.hpp>

// ── Aggregation ─────────────────────────────────────────────

TEST(Aggregate, NoFactsIsAllFalse) {
    auto s = aggregate({}, {}, "quantum");
    EXPECT_FALSE(s.classical_active);
    EXPECT_FALSE(s.quantum_active);
    EXPECT_TRUE(s.node_active.empty());
}

TEST(Aggregate, PartitionSplit) {
    auto s = aggregate({{"1", "normal", "a"}}, {}, "quantum");
    EXPECT_TRUE(s.classical_active);
    EXPECT_FALSE(s.quantum_active);

    s = aggregate({{"2", "quantum", "b"}}, {}, "quantum");
    EXPECT_FALSE(s.classical_active);
    EXPECT_TRUE(s.quantum_active);

    s = aggregate({{"1", "normal", "a"}, {"2", "quantum", "b"}}, {}, "quantum");
    EXPECT_TRUE(s.classical_active);
    EXPECT_TRUE(s.quantum_active);
}

TEST(Aggregate, PartitionMatchIsExact) {
    auto s = aggregate({{"1", "quantum-dev", "a"}, {"2", "Quantum", "b"}}, {}, "quantum");
    EXPECT_TRUE(s.classical_active);
    EXPECT_FALSE(s.quantum_active);
}

TEST(Aggregate, CustomQuantumPartition) {
    auto s = aggregate({{"1", "qpu", "a"}}, {}, "qpu");
    EXPECT_TRUE(s.quantum_active);
    EXPECT_FALSE(s.classical_active);
}

TEST(Aggregate, NodeStates) {
    std::vector<NodeState> nodes = {
        {"c1", NodeToken::Mixed}, {"c2", NodeToken::Idle},
        {"c3", NodeToken::Allocated}, {"c4", NodeToken::Down},
        {"q1", NodeToken::Unknown},
    };
    auto s = aggregate({}, nodes, "quantum");
    std::map<std::string, bool> expected = {
        {"c1", true}, {"c2", false}, {"c3", true}, {"c4", false}};
    EXPECT_EQ(s.node_active, expected);
}

// ── Mapping ─────────────────────────────────────────────────

static CanonicalSnapshot snap(bool classical, bool quantum) {
    CanonicalSnapshot s;
    s.classical_active = classical;
    s.quantum_active = quantum;
    return s;
}

TEST(DisplayMapper, NothingRunning) {
    auto d = map_snapshot(snap(false, false));
    EXPECT_FALSE(d.indicator_a);
    EXPECT_FALSE(d.indicator_b);
    EXPECT_FALSE(d.matrix_text.has_value());
}

TEST(DisplayMapper, ClassicalOnly) {
    auto d = map_snapshot(snap(true, false));
    EXPECT_TRUE(d.indicator_a);
    EXPECT_FALSE(d.indicator_b);
    ASSERT_TRUE(d.matrix_text.has_value());
    EXPECT_EQ(d.matrix_text->text, "HPC");
    EXPECT_EQ(d.matrix_text->colors,
              std::vector<Rgb>({COLOR_CLASSICAL, COLOR_CLASSICAL, COLOR_CLASSICAL}));
    EXPECT_EQ(d.matrix_text->x_offset, 3);
}

TEST(DisplayMapper, QuantumOnly) {
    auto d = map_snapshot(snap(false, true));
    EXPECT_FALSE(d.indicator_a);
    EXPECT_TRUE(d.indicator_b);
    ASSERT_TRUE(d.matrix_text.has_value());
    EXPECT_EQ(d.matrix_text->text, "Q");
    EXPECT_EQ(d.matrix_text->colors, std::vector<Rgb>({COLOR_QUANTUM}));
    EXPECT_EQ(d.matrix_text->x_offset, 9);
}

TEST(DisplayMapper, Both) {
    auto d = map_snapshot(snap(true, true));
    EXPECT_TRUE(d.indicator_a);
    EXPECT_TRUE(d.indicator_b);
    ASSERT_TRUE(d.matrix_text.has_value());
    EXPECT_EQ(d.matrix_text->text, "QCSC");
    EXPECT_EQ(d.matrix_text->colors,
              std::vector<Rgb>({COLOR_QUANTUM, COLOR_QUANTUM, COLOR_CLASSICAL, COLOR_CLASSICAL}));
    EXPECT_EQ(d.matrix_text->x_offset, 1);
}

TEST(DisplayMapper, ColorValues) {
    EXPECT_EQ(COLOR_CLASSICAL, (Rgb{0, 255, 0}));
    EXPECT_EQ(COLOR_QUANTUM, (Rgb{0, 150, 255}));
}

TEST(DisplayMapper, NodeLightsMirrorSnapshot) {
    auto s = snap(false, true);
    s.node_active = {{"c1", true}, {"q1", false}};
    auto d = map_snapshot(s);
    EXPECT_EQ(d.node_lights, s.node_active);
    // Node lights do not affect the table
    EXPECT_FALSE(d.indicator_a);
    EXPECT_EQ(d.matrix_text->text, "Q");
}

TEST(DisplayMapper, Deterministic) {
    auto s = snap(true, true);
    EXPECT_TRUE(map_snapshot(s) == map_snapshot(s));
}
