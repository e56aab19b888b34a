#include "memobuild/fingerprint.hpp"
#include "memobuild/worker_pool.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <algorithm>

using namespace memobuild;
namespace fs = std::filesystem;

namespace {

void make_tree(const fs::path &root) {
    testutil::write_file(root / "a.txt", "alpha");
    testutil::write_file(root / "src/main.cpp", "int main() {}");
    testutil::write_file(root / "src/util/u.hpp", "#pragma once");
    testutil::write_file(root / "docs/readme.md", "docs");
    testutil::write_file(root / "build/out.o", "object");
}

} // namespace

TEST(Fingerprint, BytesMatchPlainSha256ForSmallPayloads) {
    EXPECT_EQ(fingerprint_bytes("hello"), sha256("hello"));
    EXPECT_EQ(fingerprint("hello"), sha256("hello"));
}

TEST(Fingerprint, LargePayloadsAreChunked) {
    std::string big(fingerprint_chunk_size * 3 + 17, 'x');
    Digest d = fingerprint_bytes(big);
    EXPECT_NE(d, sha256(big));
    EXPECT_EQ(d, fingerprint_bytes(big));

    std::string other = big;
    other.back() = 'y';
    EXPECT_NE(d, fingerprint_bytes(other));
}

TEST(Fingerprint, FileEqualsBytesOfItsContent) {
    testutil::TempDir dir;
    std::string big(fingerprint_chunk_size + 5, 'z');
    testutil::write_file(dir / "small", "hello");
    testutil::write_file(dir / "big", big);
    testutil::write_file(dir / "empty", "");

    EXPECT_EQ(*fingerprint_file(dir / "small"), fingerprint_bytes("hello"));
    EXPECT_EQ(*fingerprint_file(dir / "big"), fingerprint_bytes(big));
    EXPECT_EQ(*fingerprint_file(dir / "empty"), fingerprint_bytes(""));
}

TEST(Fingerprint, MissingFileIsFilesystemError) {
    testutil::TempDir dir;
    auto res = fingerprint(dir / "missing", IgnoreRules{});
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().kind, ErrorKind::FilesystemError);
}

TEST(Fingerprint, TreeIsDeterministicAcrossPoolSizes) {
    testutil::TempDir dir;
    make_tree(dir.path());

    auto sequential = fingerprint_tree(dir.path(), IgnoreRules{});
    ASSERT_TRUE(sequential);
    for (size_t threads : {1u, 2u, 8u}) {
        WorkerPool pool(threads);
        auto parallel = fingerprint_tree(dir.path(), IgnoreRules{}, &pool);
        ASSERT_TRUE(parallel);
        EXPECT_EQ(parallel->digest, sequential->digest);
    }

    ASSERT_EQ(sequential->entries.size(), 5u);
    EXPECT_TRUE(std::is_sorted(sequential->entries.begin(), sequential->entries.end(),
                               [](const ManifestEntry &a, const ManifestEntry &b) { return a.path < b.path; }));
    EXPECT_EQ(sequential->entries.front().path, "a.txt");
    EXPECT_EQ(sequential->digest, fingerprint_bytes(serialize_manifest(sequential->entries)));
}

TEST(Fingerprint, TreeChangesWithContentAndNames) {
    testutil::TempDir dir;
    make_tree(dir.path());
    Digest before = fingerprint_tree(dir.path(), IgnoreRules{})->digest;

    testutil::write_file(dir / "src/main.cpp", "int main() { return 1; }");
    Digest edited = fingerprint_tree(dir.path(), IgnoreRules{})->digest;
    EXPECT_NE(before, edited);

    fs::rename(dir / "a.txt", dir / "b.txt");
    Digest renamed = fingerprint_tree(dir.path(), IgnoreRules{})->digest;
    EXPECT_NE(edited, renamed);
}

TEST(Fingerprint, IgnoredPathsDoNotAffectDigest) {
    testutil::TempDir dir;
    make_tree(dir.path());
    auto rules = IgnoreRules::parse("build/\n*.md\n");

    auto before = fingerprint_tree(dir.path(), rules);
    ASSERT_TRUE(before);
    EXPECT_EQ(before->entries.size(), 3u);

    testutil::write_file(dir / "build/out.o", "different object");
    testutil::write_file(dir / "docs/new.md", "more docs");
    auto after = fingerprint_tree(dir.path(), rules);
    ASSERT_TRUE(after);
    EXPECT_EQ(before->digest, after->digest);
}

TEST(Fingerprint, SymlinksAreRecordedByTarget) {
    testutil::TempDir dir;
    testutil::write_file(dir / "real.txt", "data");
    fs::create_symlink("real.txt", dir / "link");

    auto tree = fingerprint_tree(dir.path(), IgnoreRules{});
    ASSERT_TRUE(tree);
    auto link = std::find_if(tree->entries.begin(), tree->entries.end(),
                             [](const ManifestEntry &e) { return e.path == "link"; });
    ASSERT_NE(link, tree->entries.end());
    EXPECT_EQ(link->digest, fingerprint_bytes("symlink:real.txt"));
}

TEST(Fingerprint, DispatchesOnPathType) {
    testutil::TempDir dir;
    make_tree(dir.path());
    EXPECT_EQ(*fingerprint(dir / "a.txt", IgnoreRules{}), fingerprint_bytes("alpha"));
    EXPECT_EQ(*fingerprint(dir.path(), IgnoreRules{}), fingerprint_tree(dir.path(), IgnoreRules{})->digest);
}
