#pragma once

#include <condition_variable>
#include <cstring>
#include <deque>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include <ssh/client_config.hpp>
#include <ssh/transport.hpp>

// Scripted remote host shared by a FakeTransport and every channel and
// session it hands out. Tests queue outcomes and inspect what was asked for.
struct FakeRemote {
    std::mutex mu;
    std::condition_variable cv;

    // errno per dial attempt; an empty script dials successfully
    std::deque<int> dial_script;
    int dial_attempts = 0;

    bool fail_handshake = false;
    int handshakes = 0;
    int channels_closed = 0;

    // known_hosts key text written for the verified host
    std::string host_key = "ssh-ed25519 AAAAC3NzaC1lZDI1NTE5AAAAIKtestkeyfakehost";
    bool fail_host_key_write = false;

    int open_failures = 0;         // the next N open_session() calls fail
    int sessions_opened = 0;

    // Results of successive exec() calls; an empty script succeeds with no output
    std::deque<SSHResult> exec_script;
    std::set<std::string> rejected_env;
    bool block_exec = false;       // exec() waits until its session is closed
    int execs_started = 0;
    std::vector<std::string> commands;
    std::vector<std::map<std::string, std::string>> envs;

    void fail_dials(int count, int code) {
        std::lock_guard<std::mutex> lock(mu);
        for (int i = 0; i < count; i++) dial_script.push_back(code);
    }

    void queue_exec(SSHResult r) {
        std::lock_guard<std::mutex> lock(mu);
        exec_script.push_back(std::move(r));
    }

    // Block until `count` commands have started
    bool wait_for_execs(int count, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mu);
        return cv.wait_for(lock, timeout, [&] { return execs_started >= count; });
    }
};

class FakeSession : public RemoteSession {
public:
    explicit FakeSession(std::shared_ptr<FakeRemote> remote) : remote_(std::move(remote)) {}

    Result<void> set_env(const std::string& name, const std::string& value) override {
        std::lock_guard<std::mutex> lock(remote_->mu);
        if (remote_->rejected_env.count(name)) {
            return Result<void>::Err(ErrorKind::SessionCreation, "ssh: setenv failed");
        }
        env_[name] = value;
        return Result<void>::Ok();
    }

    SSHResult exec(const std::string& command) override {
        std::unique_lock<std::mutex> lock(remote_->mu);
        remote_->commands.push_back(command);
        remote_->envs.push_back(env_);
        remote_->execs_started++;
        remote_->cv.notify_all();

        if (remote_->block_exec) {
            remote_->cv.wait(lock, [&] { return closed_; });
            return SSHResult::fail(ErrorKind::Execution, "session closed");
        }
        if (remote_->exec_script.empty()) return SSHResult::ok();
        SSHResult r = remote_->exec_script.front();
        remote_->exec_script.pop_front();
        return r;
    }

    void close() override {
        {
            std::lock_guard<std::mutex> lock(remote_->mu);
            closed_ = true;
        }
        remote_->cv.notify_all();
    }

private:
    std::shared_ptr<FakeRemote> remote_;
    std::map<std::string, std::string> env_;
    bool closed_ = false;
};

class FakeChannel : public SecureChannel {
public:
    explicit FakeChannel(std::shared_ptr<FakeRemote> remote) : remote_(std::move(remote)) {}

    Result<std::unique_ptr<RemoteSession>> open_session() override {
        std::lock_guard<std::mutex> lock(remote_->mu);
        if (remote_->open_failures > 0) {
            remote_->open_failures--;
            return Result<std::unique_ptr<RemoteSession>>::Err(
                ErrorKind::SessionCreation, "ssh: could not open session");
        }
        remote_->sessions_opened++;
        return Result<std::unique_ptr<RemoteSession>>::Ok(
            std::make_unique<FakeSession>(remote_));
    }

    Result<void> write_host_key(const std::string& host, const std::filesystem::path& file) override {
        std::lock_guard<std::mutex> lock(remote_->mu);
        if (remote_->fail_host_key_write) {
            return Result<void>::Err(ErrorKind::Handshake, "no host key");
        }
        std::ofstream out(file, std::ios::trunc);
        out << host << " " << remote_->host_key << "\n";
        return Result<void>::Ok();
    }

    Result<void> close() override {
        std::lock_guard<std::mutex> lock(remote_->mu);
        remote_->channels_closed++;
        return Result<void>::Ok();
    }

private:
    std::shared_ptr<FakeRemote> remote_;
};

class FakeTransport : public Transport {
public:
    explicit FakeTransport(std::shared_ptr<FakeRemote> remote) : remote_(std::move(remote)) {}

    DialOutcome dial(const RemoteTarget& target,
                     std::chrono::milliseconds,
                     const CancelScope&) override {
        std::lock_guard<std::mutex> lock(remote_->mu);
        remote_->dial_attempts++;
        DialOutcome out;
        if (!remote_->dial_script.empty()) {
            int code = remote_->dial_script.front();
            remote_->dial_script.pop_front();
            if (code != 0) {
                out.error_code = code;
                out.error = "dial tcp " + target.public_ip + ":22: " + std::strerror(code);
                return out;
            }
        }
        out.sock = 42;
        return out;
    }

    Result<std::unique_ptr<SecureChannel>> handshake(
            socket_t,
            const RemoteTarget&,
            const std::string&,
            const PrivateKey&,
            const HostTrustPolicy&,
            std::chrono::milliseconds) override {
        std::lock_guard<std::mutex> lock(remote_->mu);
        remote_->handshakes++;
        if (remote_->fail_handshake) {
            return Result<std::unique_ptr<SecureChannel>>::Err(
                ErrorKind::Handshake, "ssh: handshake failed: unable to authenticate");
        }
        return Result<std::unique_ptr<SecureChannel>>::Ok(
            std::make_unique<FakeChannel>(remote_));
    }

private:
    std::shared_ptr<FakeRemote> remote_;
};

// Config pointing at `key_path` with millisecond-scale connect limits
inline ClientConfig fake_client_config(const std::filesystem::path& key_path,
                                       HostTrustPolicy trust = HostTrustPolicy::insecure_accept_any()) {
    ClientConfig config(std::move(trust));
    config.target.public_ip = "10.0.0.5";
    config.target.public_dns_name = "host.example";
    config.user = "ec2-user";
    config.key_path = key_path;
    config.policy.max_dial_attempts = 3;
    config.policy.dial_timeout = std::chrono::milliseconds(100);
    config.policy.dial_backoff = std::chrono::milliseconds(1);
    config.policy.max_reconnect_cycles = 2;
    return config;
}
