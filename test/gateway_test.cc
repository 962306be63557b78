#include "gtest/gtest.h"

#include <fcntl.h>
#include <memory>
#include <string>
#include <sys/stat.h>

#include "fake_source.h"
#include "gateway.h"

class GatewayTest : public ::testing::Test {
  protected:
    void SetUp() override {
        auto source = std::make_unique<FakeSource>();
        source->contents["http://x/a"] = "hello, world";
        source->failing["http://x/b"] = Status::IOError("unreachable");
        gateway_ = std::make_unique<Gateway>(
            FileMap{{"a.txt", "http://x/a"}, {"b.txt", "http://x/b"}},
            std::move(source), /*probe_size=*/true);
    }

    std::unique_ptr<Gateway> gateway_;
};

TEST_F(GatewayTest, RootGetattr) {
    struct stat st;
    ASSERT_TRUE(gateway_->getattr("/", &st).ok());
    EXPECT_EQ(kRootInode, st.st_ino);
    EXPECT_TRUE(S_ISDIR(st.st_mode));
    EXPECT_EQ(2u, st.st_nlink);
    EXPECT_EQ(0, st.st_size);
    // The root never consults the registry.
    EXPECT_FALSE(gateway_->registry().find_inode("a.txt").first);
}

TEST_F(GatewayTest, FileGetattrAssignsStableInode) {
    struct stat st1, st2;
    ASSERT_TRUE(gateway_->getattr("/a.txt", &st1).ok());
    ASSERT_TRUE(gateway_->getattr("/a.txt", &st2).ok());
    EXPECT_EQ(st1.st_ino, st2.st_ino);
    EXPECT_NE(kRootInode, st1.st_ino);
    EXPECT_TRUE(S_ISREG(st1.st_mode));
    EXPECT_EQ(0444u, st1.st_mode & 07777);
    EXPECT_EQ(1u, st1.st_nlink);
    EXPECT_EQ(12, st1.st_size);

    struct stat stb;
    ASSERT_TRUE(gateway_->getattr("/b.txt", &stb).ok());
    EXPECT_NE(st1.st_ino, stb.st_ino);
    // Failed probe: zero-size placeholder.
    EXPECT_EQ(0, stb.st_size);
}

TEST_F(GatewayTest, UnknownNamesAreNotFound) {
    struct stat st;
    EXPECT_TRUE(gateway_->getattr("/c.txt", &st).is_not_found());
    EXPECT_TRUE(gateway_->getattr("/a.txt/inner", &st).is_not_found());
    EXPECT_TRUE(gateway_->getattr("/dir/a.txt", &st).is_not_found());
    EXPECT_FALSE(gateway_->registry().find_inode("c.txt").first);
}

TEST_F(GatewayTest, ReaddirRoot) {
    auto [s, entries] = gateway_->readdir("/");
    ASSERT_TRUE(s.ok()) << s.ToString();
    ASSERT_EQ(4u, entries.size());
    EXPECT_EQ(".", entries[0].name());
    EXPECT_EQ("..", entries[1].name());
    EXPECT_EQ("a.txt", entries[2].name());
    EXPECT_EQ("b.txt", entries[3].name());
    EXPECT_TRUE(S_ISDIR(entries[0].attributes().mode()));
    EXPECT_TRUE(S_ISREG(entries[2].attributes().mode()));

    struct stat st;
    ASSERT_TRUE(gateway_->getattr("/a.txt", &st).ok());
    EXPECT_EQ(st.st_ino, entries[2].attributes().inode());
}

TEST_F(GatewayTest, ReaddirOnFileOrUnknown) {
    auto [s, entries] = gateway_->readdir("/a.txt");
    EXPECT_TRUE(s.is_invalid_argument()) << s.ToString();
    auto [s2, entries2] = gateway_->readdir("/nope");
    EXPECT_TRUE(s2.is_not_found()) << s2.ToString();
}

TEST_F(GatewayTest, OpenRejectsWrites) {
    auto [s, of] = gateway_->open("/a.txt", O_WRONLY);
    EXPECT_TRUE(s.is_permission_denied());
    EXPECT_EQ(nullptr, of);
    auto [s2, of2] = gateway_->open("/a.txt", O_RDWR);
    EXPECT_TRUE(s2.is_permission_denied());
}

TEST_F(GatewayTest, OpenUnknown) {
    auto [s, of] = gateway_->open("/c.txt", O_RDONLY);
    EXPECT_TRUE(s.is_not_found());
    EXPECT_EQ(nullptr, of);
}

TEST_F(GatewayTest, OpenAndRead) {
    auto [s, of] = gateway_->open("/a.txt", O_RDONLY);
    ASSERT_TRUE(s.ok()) << s.ToString();
    ASSERT_NE(nullptr, of);
    EXPECT_EQ("a.txt", of->name);
    EXPECT_EQ("http://x/a", of->url);
    EXPECT_TRUE(of->size_known);

    char buf[5];
    Slice dst(buf, sizeof(buf));
    auto [rs, n] = gateway_->read(of, dst, 7);
    ASSERT_TRUE(rs.ok()) << rs.ToString();
    EXPECT_EQ(5u, n);
    EXPECT_EQ("world", dst.to_string());

    char tail[8];
    Slice eof(tail, sizeof(tail));
    auto [es, en] = gateway_->read(of, eof, 12);
    ASSERT_TRUE(es.ok());
    EXPECT_EQ(0u, en);

    EXPECT_TRUE(gateway_->release(of).ok());
}

TEST_F(GatewayTest, OpenWithUnknownSize) {
    auto [s, of] = gateway_->open("/b.txt", O_RDONLY);
    ASSERT_TRUE(s.ok()) << s.ToString();
    EXPECT_FALSE(of->size_known);

    char buf[4];
    Slice dst(buf, sizeof(buf));
    auto [rs, n] = gateway_->read(of, dst, 0);
    EXPECT_TRUE(rs.is_io_error());
    EXPECT_TRUE(gateway_->release(of).ok());
}

TEST(Gateway, WithoutProbeSizesAreZero) {
    auto source = std::make_unique<FakeSource>();
    source->contents["http://x/a"] = "hello";
    FakeSource *raw = source.get();
    Gateway gateway(FileMap{{"a.txt", "http://x/a"}}, std::move(source),
                    /*probe_size=*/false);

    struct stat st;
    ASSERT_TRUE(gateway.getattr("/a.txt", &st).ok());
    EXPECT_EQ(0, st.st_size);
    EXPECT_EQ(0, st.st_blocks);
    EXPECT_EQ(0, raw->probes.load());
}

TEST(Gateway, ReadWithoutSource) {
    Gateway gateway(FileMap{{"a.txt", "http://x/a"}}, nullptr, true);
    auto [s, of] = gateway.open("/a.txt", O_RDONLY);
    ASSERT_TRUE(s.ok());
    EXPECT_FALSE(of->size_known);
    char buf[4];
    Slice dst(buf, sizeof(buf));
    auto [rs, n] = gateway.read(of, dst, 0);
    EXPECT_TRUE(rs.is_io_error());
    EXPECT_TRUE(gateway.release(of).ok());
}

TEST(Gateway, OpenWithSizeLookupOffSendsNoHead) {
    auto source = std::make_unique<FakeSource>();
    source->contents["http://x/a"] = "hello";
    FakeSource *raw = source.get();
    Gateway gateway(FileMap{{"a.txt", "http://x/a"}}, std::move(source),
                    /*probe_size=*/false);

    struct stat st;
    ASSERT_TRUE(gateway.getattr("/a.txt", &st).ok());
    EXPECT_EQ(0, st.st_size);

    auto [s, of] = gateway.open("/a.txt", O_RDONLY);
    ASSERT_TRUE(s.ok()) << s.ToString();
    EXPECT_FALSE(of->size_known);
    EXPECT_EQ(0, raw->probes.load());

    // Reads still reach the source in full.
    char buf[8];
    Slice dst(buf, sizeof(buf));
    auto [rs, n] = gateway.read(of, dst, 0);
    ASSERT_TRUE(rs.ok());
    EXPECT_EQ("hello", dst.to_string());
    EXPECT_TRUE(gateway.release(of).ok());
}

TEST(Gateway, OpenAgreesWithGetattrAfterFailedSizeLookup) {
    auto source = std::make_unique<FakeSource>();
    source->contents["http://x/a"] = "hello";
    source->failing["http://x/a"] = Status::IOError("timeout");
    FakeSource *raw = source.get();
    Gateway gateway(FileMap{{"a.txt", "http://x/a"}}, std::move(source),
                    /*probe_size=*/true);

    struct stat st;
    ASSERT_TRUE(gateway.getattr("/a.txt", &st).ok());
    EXPECT_EQ(0, st.st_size);

    // The server recovers, but the kernel already holds size 0.
    raw->failing.clear();
    auto [s, of] = gateway.open("/a.txt", O_RDONLY);
    ASSERT_TRUE(s.ok()) << s.ToString();
    EXPECT_FALSE(of->size_known);
    EXPECT_TRUE(gateway.release(of).ok());
}

TEST(Gateway, FailedSizeLookupIsNotRepeated) {
    auto source = std::make_unique<FakeSource>();
    source->failing["http://x/dead"] = Status::IOError("unreachable");
    FakeSource *raw = source.get();
    Gateway gateway(FileMap{{"dead.bin", "http://x/dead"}}, std::move(source),
                    /*probe_size=*/true);

    struct stat st;
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(gateway.getattr("/dead.bin", &st).ok());
        EXPECT_EQ(0, st.st_size);
    }
    auto [s, entries] = gateway.readdir("/");
    ASSERT_TRUE(s.ok());
    EXPECT_EQ(3u, entries.size());
    EXPECT_EQ(1, raw->probes.load());
}

TEST(Gateway, RemoteSizeIsFetchedOnce) {
    auto source = std::make_unique<FakeSource>();
    source->contents["http://x/a"] = "hello";
    FakeSource *raw = source.get();
    Gateway gateway(FileMap{{"a.txt", "http://x/a"}}, std::move(source),
                    /*probe_size=*/true);

    struct stat st;
    ASSERT_TRUE(gateway.getattr("/a.txt", &st).ok());
    ASSERT_TRUE(gateway.getattr("/a.txt", &st).ok());
    EXPECT_EQ(5, st.st_size);
    auto [s, of] = gateway.open("/a.txt", O_RDONLY);
    ASSERT_TRUE(s.ok());
    EXPECT_TRUE(of->size_known);
    EXPECT_TRUE(gateway.release(of).ok());
    EXPECT_EQ(1, raw->probes.load());
}
