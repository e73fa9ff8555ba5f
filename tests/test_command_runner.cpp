#include <gtest/gtest.h>
#include <cerrno>
#include <chrono>
#include <thread>
#include <ssh/client.hpp>
#include "fake_transport.hpp"
#include "test_support.hpp"

class CommandRunnerTest : public ::testing::Test {
protected:
    TempDir dir;
    std::shared_ptr<FakeRemote> remote = std::make_shared<FakeRemote>();

    std::unique_ptr<SSHClient> make_client(ClientConfig config) {
        return std::make_unique<SSHClient>(std::move(config),
                                           std::make_unique<FakeTransport>(remote));
    }

    std::unique_ptr<SSHClient> connected_client() {
        auto client = make_client(fake_client_config(dir.write("id_test", TEST_OPENSSH_KEY)));
        auto r = client->connect();
        EXPECT_TRUE(r.success()) << r.describe();
        return client;
    }

    static SSHResult transport_error() {
        return SSHResult::fail(ErrorKind::Execution, "read tcp: connection reset by peer");
    }
};

TEST_F(CommandRunnerTest, ReturnsCombinedOutput) {
    auto client = connected_client();
    remote->queue_exec(SSHResult::ok("out\nerr\n"));

    auto r = client->run("make test");
    ASSERT_TRUE(r.success()) << r.describe();
    EXPECT_EQ(r.output, "out\nerr\n");
    ASSERT_EQ(remote->commands.size(), 1u);
    EXPECT_EQ(remote->commands[0], "make test");
    EXPECT_EQ(client->retry_ledger().size(), 0u);
}

TEST_F(CommandRunnerTest, NotConnectedBeforeConnect) {
    auto client = make_client(fake_client_config(dir.write("id_test", TEST_OPENSSH_KEY)));
    OpOptions opts;
    opts.retries = 3;

    auto r = client->run("uptime", opts);
    EXPECT_EQ(r.kind, ErrorKind::NotConnected);
    EXPECT_EQ(remote->sessions_opened, 0);
    EXPECT_EQ(remote->dial_attempts, 0);
    EXPECT_EQ(client->retry_ledger().size(), 0u);
}

TEST_F(CommandRunnerTest, NonzeroExitKeepsOutput) {
    auto client = connected_client();
    remote->queue_exec(SSHResult::fail(ErrorKind::Execution, "Process exited with status 2",
                                       "no such file\n", 2));

    auto r = client->run("cat /missing");
    EXPECT_EQ(r.kind, ErrorKind::Execution);
    EXPECT_EQ(r.exit_code, 2);
    EXPECT_EQ(r.output, "no such file\n");
}

TEST_F(CommandRunnerTest, ZeroRetriesFailsWithoutReconnect) {
    auto client = connected_client();
    remote->queue_exec(transport_error());

    auto r = client->run("echo hi");
    EXPECT_EQ(r.kind, ErrorKind::Execution);
    EXPECT_EQ(remote->handshakes, 1);
    EXPECT_EQ(remote->commands.size(), 1u);
    EXPECT_EQ(client->retry_ledger().size(), 0u);
}

TEST_F(CommandRunnerTest, ReconnectsAndRetriesAfterTransportError) {
    auto client = connected_client();
    remote->queue_exec(transport_error());
    remote->queue_exec(SSHResult::ok("hi\n"));

    OpOptions opts;
    opts.retries = 2;
    auto r = client->run("echo hi", opts);
    ASSERT_TRUE(r.success()) << r.describe();
    EXPECT_EQ(r.output, "hi\n");
    EXPECT_EQ(remote->handshakes, 2);
    EXPECT_EQ(remote->channels_closed, 1);
    EXPECT_EQ(remote->commands.size(), 2u);
    EXPECT_EQ(client->retry_ledger().size(), 0u);
}

TEST_F(CommandRunnerTest, PermanentFailureMakesRetriesPlusOneAttempts) {
    auto client = connected_client();
    for (int i = 0; i < 10; i++) remote->queue_exec(transport_error());

    OpOptions opts;
    opts.retries = 3;
    auto r = client->run("false", opts);
    EXPECT_EQ(r.kind, ErrorKind::Execution);
    EXPECT_EQ(remote->commands.size(), 4u);
    EXPECT_EQ(remote->handshakes, 1 + 3);
    EXPECT_EQ(client->retry_ledger().size(), 0u);
}

TEST_F(CommandRunnerTest, EachRunStartsWithFreshBudget) {
    auto client = connected_client();
    remote->queue_exec(transport_error());
    remote->queue_exec(transport_error());

    OpOptions opts;
    opts.retries = 1;
    EXPECT_TRUE(client->run("flaky", opts).failed());

    remote->queue_exec(transport_error());
    remote->queue_exec(SSHResult::ok("done\n"));
    auto r = client->run("flaky", opts);
    ASSERT_TRUE(r.success()) << r.describe();
    EXPECT_EQ(r.output, "done\n");
}

TEST_F(CommandRunnerTest, SessionOpenFailureIsNotRetried) {
    auto client = connected_client();
    remote->open_failures = 1;

    OpOptions opts;
    opts.retries = 1;
    auto r = client->run("true", opts);
    EXPECT_EQ(r.kind, ErrorKind::SessionCreation);
    EXPECT_EQ(remote->handshakes, 1);
    EXPECT_EQ(remote->sessions_opened, 0);
    EXPECT_EQ(client->retry_ledger().size(), 0u);
}

TEST_F(CommandRunnerTest, EachAttemptUsesNewSession) {
    auto client = connected_client();
    remote->queue_exec(transport_error());
    remote->queue_exec(SSHResult::ok());

    OpOptions opts;
    opts.retries = 1;
    ASSERT_TRUE(client->run("true", opts).success());
    EXPECT_EQ(remote->sessions_opened, 2);
}

TEST_F(CommandRunnerTest, CallEnvOverridesClientEnv) {
    ClientConfig config = fake_client_config(dir.write("id_test", TEST_OPENSSH_KEY));
    config.env = {{"REGION", "us-west-2"}, {"STAGE", "dev"}};
    auto client = make_client(std::move(config));
    ASSERT_TRUE(client->connect().success());

    OpOptions opts;
    opts.env = {{"STAGE", "ci"}, {"RUN_ID", "7"}};
    ASSERT_TRUE(client->run("env", opts).success());

    ASSERT_EQ(remote->envs.size(), 1u);
    std::map<std::string, std::string> expected = {
        {"REGION", "us-west-2"}, {"RUN_ID", "7"}, {"STAGE", "ci"}};
    EXPECT_EQ(remote->envs[0], expected);
}

TEST_F(CommandRunnerTest, RejectedEnvIsSessionCreation) {
    auto client = connected_client();
    remote->rejected_env.insert("SECRET");

    OpOptions opts;
    opts.env = {{"SECRET", "x"}};
    auto r = client->run("env", opts);
    EXPECT_EQ(r.kind, ErrorKind::SessionCreation);
    EXPECT_TRUE(remote->commands.empty());
}

TEST_F(CommandRunnerTest, RejectedEnvDoesNotReconnect) {
    auto client = connected_client();
    remote->rejected_env.insert("SECRET");

    OpOptions opts;
    opts.retries = 3;
    opts.env = {{"SECRET", "x"}};
    auto r = client->run("env", opts);
    EXPECT_EQ(r.kind, ErrorKind::SessionCreation);
    EXPECT_EQ(remote->handshakes, 1);
    EXPECT_EQ(remote->channels_closed, 0);
    EXPECT_EQ(client->retry_ledger().size(), 0u);
}

TEST_F(CommandRunnerTest, TimeoutReturnsDeadlineExceeded) {
    auto client = connected_client();
    remote->block_exec = true;

    OpOptions opts;
    opts.timeout = std::chrono::milliseconds(100);
    auto start = std::chrono::steady_clock::now();
    auto r = client->run("sleep 600", opts);

    EXPECT_EQ(r.kind, ErrorKind::DeadlineExceeded);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
    EXPECT_EQ(client->retry_ledger().size(), 0u);
}

TEST_F(CommandRunnerTest, TimeoutIsRetriedAfterReconnect) {
    auto client = connected_client();
    remote->block_exec = true;

    OpOptions opts;
    opts.timeout = std::chrono::milliseconds(50);
    opts.retries = 1;
    auto r = client->run("sleep 600", opts);

    EXPECT_EQ(r.kind, ErrorKind::DeadlineExceeded);
    EXPECT_EQ(remote->commands.size(), 2u);
    EXPECT_EQ(remote->handshakes, 2);
}

TEST_F(CommandRunnerTest, CloseCancelsRunWithoutTimeout) {
    auto client = connected_client();
    remote->block_exec = true;

    std::thread closer([&] {
        ASSERT_TRUE(remote->wait_for_execs(1, std::chrono::seconds(5)));
        client->close();
    });

    OpOptions opts;
    opts.retries = 2;
    auto r = client->run("sleep 600", opts);
    closer.join();

    EXPECT_EQ(r.kind, ErrorKind::Cancelled);
    EXPECT_EQ(remote->handshakes, 1);
    EXPECT_EQ(client->retry_ledger().size(), 0u);
}

TEST_F(CommandRunnerTest, CloseCutsRetryIntervalShort) {
    auto client = connected_client();
    remote->queue_exec(transport_error());

    std::thread closer([&] {
        // Wait for the reconnect that precedes the interval
        auto until = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (std::chrono::steady_clock::now() < until) {
            {
                std::lock_guard<std::mutex> lock(remote->mu);
                if (remote->handshakes >= 2) break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        client->close();
    });

    OpOptions opts;
    opts.retries = 2;
    opts.retry_interval = std::chrono::seconds(30);
    auto start = std::chrono::steady_clock::now();
    auto r = client->run("uptime", opts);
    auto elapsed = std::chrono::steady_clock::now() - start;
    closer.join();

    EXPECT_EQ(r.kind, ErrorKind::Cancelled);
    EXPECT_LT(elapsed, std::chrono::seconds(10));
    EXPECT_EQ(remote->commands.size(), 1u);
    EXPECT_EQ(client->retry_ledger().size(), 0u);
}

TEST_F(CommandRunnerTest, ReconnectExhaustionEndsRetries) {
    auto client = connected_client();
    remote->queue_exec(transport_error());
    remote->fail_dials(100, ECONNREFUSED);

    OpOptions opts;
    opts.retries = 5;
    auto r = client->run("uptime", opts);

    EXPECT_EQ(r.kind, ErrorKind::ReconnectExhausted);
    EXPECT_EQ(remote->commands.size(), 1u);
    EXPECT_EQ(remote->dial_attempts, 1 + 6);
    EXPECT_EQ(client->retry_ledger().size(), 0u);
}
