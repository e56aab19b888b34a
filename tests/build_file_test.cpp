#include "memobuild/build_file.hpp"
#include "memobuild/fingerprint.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace memobuild;
using json = nlohmann::json;

TEST(BuildFile, ParsesStepsInOrder) {
    testutil::TempDir dir;
    testutil::write_file(dir / "main.c", "int main() {}");

    json doc = json::parse(R"({
        "version": 1,
        "env": {"CC": "gcc"},
        "steps": [
            {"name": "main.c", "source": "main.c"},
            {"name": "banner", "content": "hello"},
            {"name": "bin", "inputs": ["main.c", "banner"], "instruction": "cat"}
        ]})");
    auto loaded = parse_build_description(doc, dir.path());
    ASSERT_TRUE(loaded) << loaded.error().message;

    const BuildGraph &graph = loaded->graph;
    ASSERT_EQ(graph.size(), 3u);
    EXPECT_EQ(graph.node(0).kind, NodeKind::Source);
    EXPECT_EQ(graph.node(0).context_fingerprint, fingerprint_bytes("int main() {}"));
    EXPECT_EQ(graph.node(0).source_path.string(), (dir / "main.c").string());
    EXPECT_EQ(graph.node(1).content, "hello");
    EXPECT_EQ(graph.node(1).context_fingerprint, fingerprint_bytes("hello"));
    EXPECT_EQ(graph.node(2).kind, NodeKind::Build);
    EXPECT_EQ(graph.node(2).inputs, (std::vector<NodeId>{0, 1}));
    EXPECT_EQ(graph.find("bin"), NodeId{2});

    EXPECT_EQ(loaded->env.vars.at("CC"), "gcc");
    EXPECT_EQ(graph.environment_fingerprint(), loaded->env.fingerprint());
}

TEST(BuildFile, DirectorySourceHonorsIgnoreFile) {
    testutil::TempDir dir;
    testutil::write_file(dir / "src/a.txt", "a");
    testutil::write_file(dir / "src/.memobuildignore", "*.log\n");
    json doc = json::parse(R"({"version": 1, "steps": [{"name": "src", "source": "src"}]})");

    auto before = parse_build_description(doc, dir.path());
    ASSERT_TRUE(before) << before.error().message;
    testutil::write_file(dir / "src/noise.log", "ignored");
    auto after = parse_build_description(doc, dir.path());
    ASSERT_TRUE(after);
    EXPECT_EQ(before->graph.node(0).context_fingerprint, after->graph.node(0).context_fingerprint);

    testutil::write_file(dir / "src/a.txt", "changed");
    auto changed = parse_build_description(doc, dir.path());
    ASSERT_TRUE(changed);
    EXPECT_NE(before->graph.node(0).context_fingerprint, changed->graph.node(0).context_fingerprint);
}

TEST(BuildFile, RejectsForwardAndUnknownInputs) {
    json doc = json::parse(R"({"version": 1, "steps": [
        {"name": "a", "inputs": ["b"], "instruction": "x"},
        {"name": "b", "content": "b"}]})");
    auto res = parse_build_description(doc, ".");
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().kind, ErrorKind::UnknownInput);
}

TEST(BuildFile, RejectsDuplicateNames) {
    json doc = json::parse(R"({"version": 1, "steps": [
        {"name": "a", "content": "1"},
        {"name": "a", "content": "2"}]})");
    auto res = parse_build_description(doc, ".");
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().kind, ErrorKind::ParseError);
}

TEST(BuildFile, RejectsMalformedSteps) {
    auto parse = [](std::string_view text) { return parse_build_description(json::parse(text), "."); };

    EXPECT_FALSE(parse(R"({"version": 2, "steps": []})"));
    EXPECT_FALSE(parse(R"({"version": 1})"));
    EXPECT_FALSE(parse(R"({"version": 1, "steps": [{"content": "no name"}]})"));
    EXPECT_FALSE(parse(R"({"version": 1, "steps": [{"name": "x", "content": "a", "digest": "00"}]})"));
    EXPECT_FALSE(parse(R"({"version": 1, "steps": [{"name": "x", "kind": "build"}]})"));
    EXPECT_FALSE(parse(R"({"version": 1, "steps": [{"name": "x", "kind": "widget", "instruction": "y"}]})"));
    EXPECT_FALSE(parse(R"({"version": 1, "steps": [{"name": "x", "digest": "not-hex"}]})"));
    EXPECT_FALSE(parse(R"({"version": 1, "steps": [{"name": "x", "source": "does/not/exist"}]})"));
}

TEST(BuildFile, PlatformAndEnvironmentChangeTheFingerprint) {
    auto env_of = [](std::string_view text) {
        auto loaded = parse_build_description(json::parse(text), ".");
        EXPECT_TRUE(loaded);
        return loaded->graph.environment_fingerprint();
    };
    Digest base = env_of(R"({"version": 1, "platform": "linux-x86_64", "env": {"CC": "gcc"}, "steps": []})");
    EXPECT_EQ(base, env_of(R"({"version": 1, "platform": "linux-x86_64", "env": {"CC": "gcc"}, "steps": []})"));
    EXPECT_NE(base, env_of(R"({"version": 1, "platform": "linux-aarch64", "env": {"CC": "gcc"}, "steps": []})"));
    EXPECT_NE(base, env_of(R"({"version": 1, "platform": "linux-x86_64", "env": {"CC": "clang"}, "steps": []})"));
}

TEST(BuildFile, LoadsRelativeToItsDirectory) {
    testutil::TempDir dir;
    testutil::write_file(dir / "proj/input.txt", "data");
    testutil::write_file(dir / "proj/memobuild.json", R"({"version": 1, "steps": [
        {"name": "input", "source": "input.txt"},
        {"name": "out", "inputs": ["input"], "instruction": "wc -c"}]})");

    auto loaded = load_build_file(dir / "proj/memobuild.json");
    ASSERT_TRUE(loaded) << loaded.error().message;
    EXPECT_EQ(loaded->root.string(), (dir / "proj").string());
    EXPECT_EQ(loaded->graph.node(0).context_fingerprint, fingerprint_bytes("data"));

    auto missing = load_build_file(dir / "nope.json");
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().kind, ErrorKind::FilesystemError);

    testutil::write_file(dir / "broken.json", "{ not json");
    auto broken = load_build_file(dir / "broken.json");
    ASSERT_FALSE(broken);
    EXPECT_EQ(broken.error().kind, ErrorKind::ParseError);
}
