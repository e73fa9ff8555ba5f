#include <gtest/gtest.h>
#include <cerrno>
#include <chrono>
#include <thread>
#include <vector>
#include <ssh/connection_manager.hpp>
#include "fake_transport.hpp"
#include "test_support.hpp"

class ConnectionManagerTest : public ::testing::Test {
protected:
    TempDir dir;
    std::shared_ptr<FakeRemote> remote = std::make_shared<FakeRemote>();
    FakeTransport transport{remote};
    ClientConfig config = fake_client_config(dir.write("id_test", TEST_OPENSSH_KEY));
};

TEST_F(ConnectionManagerTest, ConnectEstablishesChannel) {
    ConnectionManager conn(config, transport);
    auto r = conn.connect();
    ASSERT_TRUE(r.success()) << r.describe();
    EXPECT_TRUE(conn.is_connected());
    EXPECT_NE(conn.channel(), nullptr);
    EXPECT_TRUE(conn.lifetime().valid());
    EXPECT_FALSE(conn.lifetime().cancelled());
    EXPECT_EQ(remote->dial_attempts, 1);
    EXPECT_EQ(remote->handshakes, 1);
}

TEST_F(ConnectionManagerTest, RefusedDialsAreRetriedUntilSuccess) {
    config.policy.max_dial_attempts = 5;
    remote->fail_dials(3, ECONNREFUSED);

    ConnectionManager conn(config, transport);
    auto r = conn.connect();
    ASSERT_TRUE(r.success()) << r.describe();
    EXPECT_EQ(remote->dial_attempts, 4);
    EXPECT_EQ(remote->handshakes, 1);
}

TEST_F(ConnectionManagerTest, OtherDialErrorsAreRetriedToo) {
    remote->fail_dials(1, ETIMEDOUT);
    remote->fail_dials(1, EHOSTUNREACH);

    ConnectionManager conn(config, transport);
    EXPECT_TRUE(conn.connect().success());
    EXPECT_EQ(remote->dial_attempts, 3);
}

TEST_F(ConnectionManagerTest, DialExhaustedAfterMaxAttempts) {
    remote->fail_dials(10, ECONNREFUSED);

    ConnectionManager conn(config, transport);
    auto r = conn.connect();
    EXPECT_EQ(r.kind, ErrorKind::DialExhausted);
    EXPECT_NE(r.error.find("Connection refused"), std::string::npos) << r.error;
    EXPECT_EQ(remote->dial_attempts, 3);
    EXPECT_EQ(remote->handshakes, 0);
    EXPECT_FALSE(conn.is_connected());
    EXPECT_FALSE(conn.lifetime().valid());
}

TEST_F(ConnectionManagerTest, MissingKeyFailsBeforeDialing) {
    config.key_path = dir.path() / "no_such_key";
    ConnectionManager conn(config, transport);
    auto r = conn.connect();
    EXPECT_EQ(r.kind, ErrorKind::KeyLoad);
    EXPECT_EQ(remote->dial_attempts, 0);
}

TEST_F(ConnectionManagerTest, GarbageKeyFailsBeforeDialing) {
    config.key_path = dir.write("bad_key", "this is not a key\n");
    ConnectionManager conn(config, transport);
    auto r = conn.connect();
    EXPECT_EQ(r.kind, ErrorKind::KeyParse);
    EXPECT_EQ(remote->dial_attempts, 0);
}

TEST_F(ConnectionManagerTest, HandshakeFailureIsNotRetried) {
    remote->fail_handshake = true;
    ConnectionManager conn(config, transport);
    auto r = conn.connect();
    EXPECT_EQ(r.kind, ErrorKind::Handshake);
    EXPECT_EQ(remote->dial_attempts, 1);
    EXPECT_EQ(remote->handshakes, 1);
    EXPECT_FALSE(conn.is_connected());
}

TEST_F(ConnectionManagerTest, CloseIsIdempotent) {
    ConnectionManager conn(config, transport);
    ASSERT_TRUE(conn.connect().success());
    CancelScope lifetime = conn.lifetime();

    conn.close();
    conn.close();
    EXPECT_FALSE(conn.is_connected());
    EXPECT_TRUE(lifetime.cancelled());
    EXPECT_EQ(remote->channels_closed, 1);
}

TEST_F(ConnectionManagerTest, ConnectReplacesExistingChannel) {
    ConnectionManager conn(config, transport);
    ASSERT_TRUE(conn.connect().success());
    CancelScope first = conn.lifetime();
    ASSERT_TRUE(conn.connect().success());

    EXPECT_EQ(remote->channels_closed, 1);
    EXPECT_EQ(remote->handshakes, 2);
    EXPECT_TRUE(first.cancelled());
    EXPECT_FALSE(conn.lifetime().cancelled());
}

TEST_F(ConnectionManagerTest, ReconnectGivesUpAfterMaxCycles) {
    ConnectionManager conn(config, transport);
    ASSERT_TRUE(conn.connect().success());
    remote->fail_dials(100, ECONNREFUSED);

    auto r = conn.reconnect();
    EXPECT_EQ(r.kind, ErrorKind::ReconnectExhausted);
    // 2 cycles of 3 dial attempts, after the initial connect
    EXPECT_EQ(remote->dial_attempts, 1 + 6);
    EXPECT_FALSE(conn.is_connected());
}

TEST_F(ConnectionManagerTest, ReconnectSucceedsOnLaterCycle) {
    ConnectionManager conn(config, transport);
    ASSERT_TRUE(conn.connect().success());
    remote->fail_dials(3, ECONNREFUSED);   // the whole first cycle

    auto r = conn.reconnect();
    ASSERT_TRUE(r.success()) << r.describe();
    EXPECT_EQ(remote->dial_attempts, 1 + 4);
    EXPECT_TRUE(conn.is_connected());
}

TEST_F(ConnectionManagerTest, ReconnectStopsOnKeyError) {
    ConnectionManager conn(config, transport);
    ASSERT_TRUE(conn.connect().success());
    fs::remove(config.key_path);

    auto r = conn.reconnect();
    EXPECT_EQ(r.kind, ErrorKind::KeyLoad);
    EXPECT_EQ(remote->dial_attempts, 1);
}

TEST_F(ConnectionManagerTest, CloseInterruptsDialBackoff) {
    config.policy.max_dial_attempts = 5;
    config.policy.dial_backoff = std::chrono::seconds(10);
    remote->fail_dials(5, ECONNREFUSED);

    ConnectionManager conn(config, transport);
    std::thread closer([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        conn.close();
    });

    auto start = std::chrono::steady_clock::now();
    auto r = conn.connect();
    auto elapsed = std::chrono::steady_clock::now() - start;
    closer.join();

    EXPECT_EQ(r.kind, ErrorKind::Cancelled);
    EXPECT_LT(elapsed, std::chrono::seconds(5));
    EXPECT_EQ(remote->dial_attempts, 1);
}

TEST_F(ConnectionManagerTest, CloseDuringReconnectStopsIt) {
    config.policy.dial_backoff = std::chrono::seconds(10);
    config.policy.max_reconnect_cycles = 5;
    ConnectionManager conn(config, transport);
    ASSERT_TRUE(conn.connect().success());
    remote->fail_dials(100, ECONNREFUSED);

    std::thread closer([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        conn.close();
    });

    auto start = std::chrono::steady_clock::now();
    auto r = conn.reconnect();
    auto elapsed = std::chrono::steady_clock::now() - start;
    closer.join();

    EXPECT_EQ(r.kind, ErrorKind::Cancelled);
    EXPECT_LT(elapsed, std::chrono::seconds(5));
    EXPECT_FALSE(conn.is_connected());
    // One dial in the first cycle; no further cycles after close()
    EXPECT_EQ(remote->dial_attempts, 1 + 1);
}

TEST_F(ConnectionManagerTest, PinnedHandshakeRecordsVerifiedKey) {
    ClientConfig pinned = fake_client_config(config.key_path,
        HostTrustPolicy::pinned("SHA256:47DEQpj8HBSa+/TImW+5JCeuQeRkm5NMpJWZG3hSuFU"));
    pinned.target.port = 2222;
    fs::path recorded;
    {
        ConnectionManager conn(pinned, transport);
        recorded = conn.verified_hosts_path();
        ASSERT_FALSE(recorded.empty());
        ASSERT_TRUE(conn.connect().success());

        EXPECT_EQ(dir.read(recorded), "[host.example]:2222 " + remote->host_key + "\n");
        std::vector<std::string> expected = {
            "-oStrictHostKeyChecking=yes",
            "-oUserKnownHostsFile=" + recorded.string(),
        };
        EXPECT_EQ(conn.scp_host_key_options(), expected);
    }
    EXPECT_FALSE(fs::exists(recorded));
}

TEST_F(ConnectionManagerTest, FailingToRecordPinnedKeyFailsConnect) {
    ClientConfig pinned = fake_client_config(config.key_path,
        HostTrustPolicy::pinned("SHA256:47DEQpj8HBSa+/TImW+5JCeuQeRkm5NMpJWZG3hSuFU"));
    remote->fail_host_key_write = true;
    ConnectionManager conn(pinned, transport);

    auto r = conn.connect();
    EXPECT_EQ(r.kind, ErrorKind::Handshake);
    EXPECT_FALSE(conn.is_connected());
    EXPECT_EQ(remote->channels_closed, 1);
}

TEST_F(ConnectionManagerTest, OtherPoliciesHaveNoVerifiedHostsFile) {
    ConnectionManager conn(config, transport);
    EXPECT_TRUE(conn.verified_hosts_path().empty());
}
