#include "memobuild/cache_server.hpp"
#include "memobuild/fingerprint.hpp"
#include "memobuild/tiered_cache.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace memobuild;

namespace {

// Loopback to a server that can be switched off or made to lie.
class SwitchableTransport : public HttpTransport {
public:
    explicit SwitchableTransport(CacheServer &server) : loopback_(server) {
    }

    Result<HttpResponse> send(const HttpRequest &request) override {
        if (down)
            return fail(ErrorKind::NetworkError, "connection refused", true);
        if (request.method == HttpMethod::Put)
            puts++;
        auto res = loopback_.send(request);
        if (res && corrupt_bodies && request.method == HttpMethod::Get && res->status == 200)
            res->body += "!";
        return res;
    }

    bool down = false;
    bool corrupt_bodies = false;
    int puts = 0;

private:
    LoopbackTransport loopback_;
};

class TieredCacheTest : public ::testing::Test {
protected:
    TieredCacheTest() : server_store_(*LocalStore::open(server_dir_.path())), server_(server_store_) {
    }

    std::unique_ptr<TieredCache> make_cache(RemotePolicy policy, const testutil::TempDir &dir) {
        transport_ = std::make_shared<SwitchableTransport>(server_);
        auto remote = std::make_unique<RemoteStore>(transport_);
        remote->set_sleeper([](std::chrono::milliseconds) {});
        return std::make_unique<TieredCache>(*LocalStore::open(dir.path()), std::move(remote), policy);
    }

    testutil::TempDir server_dir_;
    testutil::TempDir client_dir_;
    LocalStore server_store_;
    CacheServer server_;
    std::shared_ptr<SwitchableTransport> transport_;
};

} // namespace

TEST_F(TieredCacheTest, LocalOnlyPutAndGet) {
    TieredCache cache(*LocalStore::open(client_dir_.path()));
    BuildSession session;
    Artifact a = Artifact::from_bytes("local");

    auto miss = cache.get(a.digest, session);
    ASSERT_FALSE(miss);
    EXPECT_EQ(miss.error().kind, ErrorKind::CacheMiss);
    EXPECT_FALSE(*cache.has(a.digest, session));

    ASSERT_TRUE(cache.put(a.digest, a, session));
    EXPECT_TRUE(*cache.has(a.digest, session));
    EXPECT_EQ(cache.get(a.digest, session)->data, "local");
    EXPECT_EQ(session.stats().l1_hits, 1u);
    EXPECT_EQ(session.stats().misses, 1u);
}

TEST_F(TieredCacheTest, PutRejectsArtifactThatDoesNotMatchKey) {
    TieredCache cache(*LocalStore::open(client_dir_.path()));
    BuildSession session;
    Artifact a = Artifact::from_bytes("real");

    auto res = cache.put(fingerprint_bytes("other"), a, session);
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().kind, ErrorKind::CASIntegrityFailure);
    EXPECT_FALSE(cache.local().has(fingerprint_bytes("other")));
    EXPECT_FALSE(cache.memory().has(fingerprint_bytes("other")));
}

TEST_F(TieredCacheTest, SecondLevelHitsArePromotedToMemory) {
    Artifact a = Artifact::from_bytes("on disk");
    {
        auto local = LocalStore::open(client_dir_.path());
        ASSERT_TRUE(local->put(a.digest, a.data));
    }
    TieredCache cache(*LocalStore::open(client_dir_.path()));
    BuildSession session;

    EXPECT_EQ(cache.get(a.digest, session)->data, "on disk");
    EXPECT_EQ(session.stats().l2_hits, 1u);
    EXPECT_TRUE(cache.memory().has(a.digest));
    EXPECT_EQ(cache.get(a.digest, session)->data, "on disk");
    EXPECT_EQ(session.stats().l1_hits, 1u);
}

TEST_F(TieredCacheTest, RemoteHitPopulatesLowerTiers) {
    Artifact a = Artifact::from_bytes("only remote");
    ASSERT_TRUE(server_store_.put(a.digest, a.data));

    auto cache = make_cache(RemotePolicy::ReadWrite, client_dir_);
    BuildSession session;
    auto got = cache->get(a.digest, session);
    ASSERT_TRUE(got);
    EXPECT_EQ(got->data, "only remote");
    EXPECT_EQ(session.stats().l3_hits, 1u);
    EXPECT_TRUE(cache->local().has(a.digest));
    EXPECT_TRUE(cache->memory().has(a.digest));

    // now served without the network
    transport_->down = true;
    EXPECT_EQ(cache->get(a.digest, session)->data, "only remote");
    EXPECT_EQ(session.stats().remote_errors, 0u);
}

TEST_F(TieredCacheTest, HasPromotesFromRemote) {
    Artifact a = Artifact::from_bytes("only remote");
    ASSERT_TRUE(server_store_.put(a.digest, a.data));

    auto cache = make_cache(RemotePolicy::ReadOnly, client_dir_);
    BuildSession session;
    EXPECT_TRUE(*cache->has(a.digest, session));
    EXPECT_TRUE(cache->local().has(a.digest));
}

TEST_F(TieredCacheTest, PutsUploadInTheBackground) {
    auto cache = make_cache(RemotePolicy::ReadWrite, client_dir_);
    BuildSession session;
    Artifact a = Artifact::from_bytes("upload me");

    ASSERT_TRUE(cache->put(a.digest, a, session));
    cache->flush();
    EXPECT_TRUE(server_store_.has(a.digest));
    EXPECT_EQ(session.stats().uploads, 1u);
}

TEST_F(TieredCacheTest, BlobsTheRemoteAlreadyHoldsAreNotSentAgain) {
    Artifact a = Artifact::from_bytes("shared output");
    ASSERT_TRUE(server_store_.put(a.digest, a.data));

    auto cache = make_cache(RemotePolicy::ReadWrite, client_dir_);
    BuildSession session;
    ASSERT_TRUE(cache->put(a.digest, a, session));
    cache->flush();
    EXPECT_EQ(transport_->puts, 0);
    EXPECT_EQ(session.stats().uploads, 0u);
    EXPECT_EQ(session.stats().upload_failures, 0u);

    Artifact b = Artifact::from_bytes("new output");
    ASSERT_TRUE(cache->put(b.digest, b, session));
    cache->flush();
    EXPECT_EQ(transport_->puts, 1);
    EXPECT_EQ(session.stats().uploads, 1u);
}

TEST_F(TieredCacheTest, ActionRecordsUploadTheirBlobFirst) {
    auto cache = make_cache(RemotePolicy::ReadWrite, client_dir_);
    BuildSession session;
    Artifact a = Artifact::from_bytes("output");
    ASSERT_TRUE(cache->local().put(a.digest, a.data));

    ActionRecord record{.node_digest = sha256("node"), .output_digest = a.digest, .size = a.size()};
    ASSERT_TRUE(cache->record_action(record, session));
    cache->flush();
    EXPECT_TRUE(server_store_.has(a.digest));
    EXPECT_TRUE(server_store_.has_action(record.node_digest));

    testutil::TempDir other_client;
    auto other = make_cache(RemotePolicy::ReadOnly, other_client);
    BuildSession other_session;
    auto found = other->lookup_action(record.node_digest, other_session);
    ASSERT_TRUE(found);
    ASSERT_TRUE(found->has_value());
    EXPECT_EQ((*found)->output_digest, a.digest);
    EXPECT_TRUE(other->local().has_action(record.node_digest));
}

TEST_F(TieredCacheTest, ReadOnlyNeverUploads) {
    auto cache = make_cache(RemotePolicy::ReadOnly, client_dir_);
    BuildSession session;
    Artifact a = Artifact::from_bytes("keep local");
    ASSERT_TRUE(cache->put(a.digest, a, session));
    cache->flush();
    EXPECT_FALSE(server_store_.has(a.digest));
}

TEST_F(TieredCacheTest, RemoteOutageDegradesToMiss) {
    auto cache = make_cache(RemotePolicy::ReadWrite, client_dir_);
    transport_->down = true;
    BuildSession session;

    Digest d = fingerprint_bytes("nowhere");
    auto res = cache->get(d, session);
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().kind, ErrorKind::CacheMiss);
    EXPECT_EQ(session.stats().remote_errors, 1u);

    Artifact a = Artifact::from_bytes("still stored");
    EXPECT_TRUE(cache->put(a.digest, a, session));
    cache->flush();
    EXPECT_TRUE(cache->local().has(a.digest));
    EXPECT_EQ(session.stats().upload_failures, 1u);
}

TEST_F(TieredCacheTest, RequiredPolicySurfacesRemoteErrors) {
    auto cache = make_cache(RemotePolicy::Required, client_dir_);
    transport_->down = true;
    BuildSession session;

    auto res = cache->get(fingerprint_bytes("nowhere"), session);
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().kind, ErrorKind::NetworkError);

    Artifact a = Artifact::from_bytes("must upload");
    auto put = cache->put(a.digest, a, session);
    ASSERT_FALSE(put);
    EXPECT_EQ(put.error().kind, ErrorKind::NetworkError);
}

TEST_F(TieredCacheTest, CorruptRemoteArtifactIsNeverStored) {
    Artifact a = Artifact::from_bytes("genuine");
    ASSERT_TRUE(server_store_.put(a.digest, a.data));

    auto cache = make_cache(RemotePolicy::ReadWrite, client_dir_);
    transport_->corrupt_bodies = true;
    BuildSession session;

    auto res = cache->get(a.digest, session);
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().kind, ErrorKind::CASIntegrityFailure);
    EXPECT_FALSE(cache->local().has(a.digest));
    EXPECT_FALSE(cache->memory().has(a.digest));
    EXPECT_EQ(session.stats().integrity_failures, 1u);
}

TEST(RemotePolicy, ParsesNames) {
    EXPECT_EQ(*parse_remote_policy("read-write"), RemotePolicy::ReadWrite);
    EXPECT_EQ(*parse_remote_policy("required"), RemotePolicy::Required);
    EXPECT_EQ(to_string(RemotePolicy::ReadOnly), "read-only");
    EXPECT_FALSE(parse_remote_policy("sometimes"));
}
