#include "memobuild/fingerprint.hpp"
#include "memobuild/graph.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace memobuild;

namespace {

NodeSpec source(std::string name, std::string content) {
    NodeSpec spec;
    spec.kind = NodeKind::Source;
    spec.name = std::move(name);
    spec.context_fingerprint = fingerprint_bytes(content);
    spec.content = std::move(content);
    return spec;
}

NodeSpec step(std::string name, std::vector<NodeId> inputs, std::string instruction) {
    NodeSpec spec;
    spec.kind = NodeKind::Build;
    spec.name = std::move(name);
    spec.inputs = std::move(inputs);
    spec.instruction = std::move(instruction);
    return spec;
}

} // namespace

TEST(BuildGraph, SourceDigestIsContentDigest) {
    BuildGraph graph;
    NodeId a = *graph.add_node(source("A", "hello"));
    auto digest = graph.compute_digest(a);
    ASSERT_TRUE(digest);
    EXPECT_EQ(*digest, fingerprint_bytes("hello"));
}

TEST(BuildGraph, DigestFoldsInputsInstructionAndEnvironment) {
    BuildGraph graph(sha256("env"));
    NodeId a = *graph.add_node(source("A", "hello"));
    NodeId b = *graph.add_node(step("B", {a}, "uppercase"));
    ASSERT_TRUE(graph.compute_digests());

    Hasher h;
    h.update("memobuild-node-v1");
    h.update_u64(1);
    h.update_digest(fingerprint_bytes("hello"));
    h.update_field("uppercase");
    h.update_digest(Digest{});
    h.update_digest(sha256("env"));
    EXPECT_EQ(*graph.node(b).digest, h.finish());
}

TEST(BuildGraph, DigestIsDeterministicAcrossGraphs) {
    auto build = [](const std::string &content) {
        BuildGraph graph(sha256("env"));
        NodeId a = *graph.add_node(source("A", content));
        NodeId b = *graph.add_node(step("B", {a}, "uppercase"));
        EXPECT_TRUE(graph.compute_digests());
        return *graph.node(b).digest;
    };
    EXPECT_EQ(build("hello"), build("hello"));
    EXPECT_NE(build("hello"), build("world"));

    // names are identity, not content
    BuildGraph other(sha256("env"));
    NodeId a = *other.add_node(source("renamed", "hello"));
    NodeId b = *other.add_node(step("also-renamed", {a}, "uppercase"));
    ASSERT_TRUE(other.compute_digests());
    EXPECT_EQ(*other.node(b).digest, build("hello"));
}

TEST(BuildGraph, RepeatedComputeIsStable) {
    BuildGraph graph;
    NodeId a = *graph.add_node(source("A", "x"));
    NodeId b = *graph.add_node(step("B", {a}, "cat"));
    ASSERT_TRUE(graph.compute_digests());
    Digest first = *graph.node(b).digest;
    graph.reset_digests();
    ASSERT_TRUE(graph.compute_digests());
    EXPECT_EQ(*graph.node(b).digest, first);
    EXPECT_EQ(*graph.compute_digest(b), first);
}

TEST(BuildGraph, InputOrderMatters) {
    BuildGraph graph;
    NodeId a = *graph.add_node(source("A", "a"));
    NodeId b = *graph.add_node(source("B", "b"));
    NodeId ab = *graph.add_node(step("AB", {a, b}, "cat"));
    NodeId ba = *graph.add_node(step("BA", {b, a}, "cat"));
    ASSERT_TRUE(graph.compute_digests());
    EXPECT_NE(*graph.node(ab).digest, *graph.node(ba).digest);
}

TEST(BuildGraph, EnvironmentChangesEveryDerivedDigest) {
    BuildGraph one(sha256("linux"));
    BuildGraph two(sha256("darwin"));
    for (BuildGraph *g : {&one, &two}) {
        NodeId a = *g->add_node(source("A", "a"));
        ASSERT_TRUE(g->add_node(step("B", {a}, "cat")));
        ASSERT_TRUE(g->compute_digests());
    }
    EXPECT_EQ(*one.node(0).digest, *two.node(0).digest);
    EXPECT_NE(*one.node(1).digest, *two.node(1).digest);
}

TEST(BuildGraph, UnknownInputIsRejected) {
    BuildGraph graph;
    ASSERT_TRUE(graph.add_node(source("A", "a")));
    auto res = graph.add_node(step("B", {5}, "cat"));
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().kind, ErrorKind::UnknownInput);
    EXPECT_EQ(graph.size(), 1u);
}

TEST(BuildGraph, LateEdgeClosingACycleIsRejected) {
    BuildGraph graph;
    NodeId a = *graph.add_node(source("A", "a"));
    NodeId b = *graph.add_node(step("B", {a}, "one"));
    NodeId c = *graph.add_node(step("C", {b}, "two"));

    auto res = graph.add_input(b, c);
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().kind, ErrorKind::CyclicDependency);
    EXPECT_EQ(graph.node(b).inputs, std::vector<NodeId>{a});

    auto self = graph.add_input(c, c);
    ASSERT_FALSE(self);
    EXPECT_EQ(self.error().kind, ErrorKind::CyclicDependency);
}

TEST(BuildGraph, LateEdgeUpdatesLevelsAndDigests) {
    BuildGraph graph;
    NodeId a = *graph.add_node(source("A", "a"));
    NodeId b = *graph.add_node(step("B", {a}, "one"));
    NodeId c = *graph.add_node(step("C", {a}, "two"));
    ASSERT_TRUE(graph.compute_digests());
    Digest before = *graph.node(b).digest;
    EXPECT_EQ(graph.topological_levels().size(), 2u);

    ASSERT_TRUE(graph.add_input(b, c));
    ASSERT_TRUE(graph.compute_digests());
    EXPECT_NE(*graph.node(b).digest, before);
    const auto &levels = graph.topological_levels();
    ASSERT_EQ(levels.size(), 3u);
    EXPECT_EQ(levels[2], std::vector<NodeId>{b});
}

TEST(BuildGraph, SiblingsShareALevel) {
    BuildGraph graph;
    NodeId a = *graph.add_node(source("A", "a"));
    NodeId c = *graph.add_node(step("C", {a}, "reverse"));
    NodeId d = *graph.add_node(step("D", {a}, "uppercase"));
    NodeId e = *graph.add_node(step("E", {c, d}, "cat"));

    const auto &levels = graph.topological_levels();
    ASSERT_EQ(levels.size(), 3u);
    EXPECT_EQ(levels[0], std::vector<NodeId>{a});
    EXPECT_EQ(levels[1], (std::vector<NodeId>{c, d}));
    EXPECT_EQ(levels[2], std::vector<NodeId>{e});
}

TEST(BuildGraph, DownstreamAndLookupByName) {
    BuildGraph graph;
    NodeId a = *graph.add_node(source("A", "a"));
    NodeId z = *graph.add_node(source("Z", "z"));
    NodeId b = *graph.add_node(step("B", {a}, "x"));
    NodeId c = *graph.add_node(step("C", {b, z}, "y"));

    EXPECT_EQ(graph.downstream_of(a), (std::vector<NodeId>{b, c}));
    EXPECT_EQ(graph.downstream_of(z), std::vector<NodeId>{c});
    EXPECT_TRUE(graph.downstream_of(c).empty());
    EXPECT_EQ(graph.find("B"), b);
    EXPECT_FALSE(graph.find("nope"));
}

TEST(BuildGraph, DigestBeforeInputsIsInvalidState) {
    BuildGraph graph;
    NodeId a = *graph.add_node(source("A", "a"));
    NodeId b = *graph.add_node(step("B", {a}, "x"));
    graph.reset_digests();
    auto res = graph.compute_digest(b);
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().kind, ErrorKind::InvalidState);
}

TEST(BuildGraph, DotMarksDirtyNodes) {
    BuildGraph graph;
    NodeId a = *graph.add_node(source("A", "a"));
    NodeId b = *graph.add_node(step("B", {a}, "x"));
    graph.set_dirty(b, true);

    std::string dot = graph.emit_dot();
    EXPECT_NE(dot.find("digraph memobuild"), std::string::npos);
    EXPECT_NE(dot.find("n1 [label=\"B\", fillcolor=\"green\"]"), std::string::npos);
    EXPECT_NE(dot.find("n0 -> n1;"), std::string::npos);
}

TEST(BuildGraph, DotLabelsAreEscaped) {
    BuildGraph graph;
    ASSERT_TRUE(graph.add_node(source(R"(say "hi" \n)", "a")));
    std::string dot = graph.emit_dot();
    EXPECT_NE(dot.find(R"(label="say \"hi\" \\n")"), std::string::npos) << dot;
}

TEST(BuildGraph, LongChainLevelsWithoutRecursion) {
    constexpr size_t length = 100000;
    BuildGraph graph;
    NodeId prev = *graph.add_node(source("", "seed"));
    for (size_t i = 1; i < length; ++i)
        prev = *graph.add_node(step("", {prev}, "next"));

    const auto &levels = graph.topological_levels();
    ASSERT_EQ(levels.size(), length);
    EXPECT_EQ(levels.back(), std::vector<NodeId>{prev});
    ASSERT_TRUE(graph.compute_digests());
}

TEST(BuildGraph, SnapshotRoundTripPreservesDigests) {
    BuildGraph graph(sha256("env"));
    NodeId a = *graph.add_node(source("A", "a"));
    NodeId b = *graph.add_node(step("B", {a}, "one"));
    NodeId c = *graph.add_node(step("C", {a}, "two"));
    ASSERT_TRUE(graph.add_input(b, c));
    ASSERT_TRUE(graph.compute_digests());

    auto restored = BuildGraph::from_json(graph.to_json());
    ASSERT_TRUE(restored) << restored.error().message;
    ASSERT_TRUE(restored->compute_digests());
    ASSERT_EQ(restored->size(), graph.size());
    for (NodeId id = 0; id < graph.size(); ++id) {
        EXPECT_EQ(restored->node(id).inputs, graph.node(id).inputs);
        EXPECT_EQ(*restored->node(id).digest, *graph.node(id).digest);
    }
    EXPECT_EQ(restored->node(a).content, std::optional<std::string>("a"));
}

TEST(BuildGraph, SnapshotWithWrongVersionIsRejected) {
    nlohmann::json doc = {{"version", 99}};
    auto res = BuildGraph::from_json(doc);
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().kind, ErrorKind::ParseError);
}
