#pragma once

// In-process stand-ins for the SSH transport. A FakeRemote plays every host:
// it counts connects, can refuse them, and keeps the state of every shell
// opened on it so tests can script output and inspect input.

#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <ssh/exec_capture.hpp>
#include <ssh/remote_connection.hpp>

struct FakeShellState {
    std::mutex mutex;
    std::string to_client;            // bytes the next read() returns
    std::string from_client;          // everything written so far
    std::vector<Geometry> resizes;
    Geometry opened_with;
    bool echo = true;                 // writes come back as output
    bool eof = false;
    bool fail_reads = false;
    bool closed = false;

    void emit(const std::string& data) {
        std::lock_guard<std::mutex> lock(mutex);
        to_client += data;
    }

    void hang_up() {
        std::lock_guard<std::mutex> lock(mutex);
        eof = true;
    }

    std::string input() {
        std::lock_guard<std::mutex> lock(mutex);
        return from_client;
    }
};

class FakeShell : public RemoteShell {
public:
    explicit FakeShell(std::shared_ptr<FakeShellState> state) : state_(std::move(state)) {}

    int poll_fd() const override { return -1; }

    ssize_t read(char* buf, size_t len) override {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->fail_reads) return -1;
        size_t n = std::min(len, state_->to_client.size());
        if (n == 0) return 0;
        state_->to_client.copy(buf, n);
        state_->to_client.erase(0, n);
        return static_cast<ssize_t>(n);
    }

    bool eof() override {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->eof && state_->to_client.empty();
    }

    Result<void> write(const char* data, size_t len, int) override {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->closed || state_->eof) {
            return Result<void>::Err(ErrorKind::IOError, "channel closed");
        }
        state_->from_client.append(data, len);
        if (state_->echo) state_->to_client.append(data, len);
        return Result<void>::Ok();
    }

    Result<void> resize(const Geometry& geometry) override {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->resizes.push_back(geometry);
        return Result<void>::Ok();
    }

    void close() override {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->closed = true;
    }

private:
    std::shared_ptr<FakeShellState> state_;
};

// Output of a command that prints `total` bytes of `fill` (forever when
// total is 0) plus `err` on stderr, then exits.
class ScriptedExecStreams : public ExecStreams {
public:
    ScriptedExecStreams(char fill, size_t total, std::string err = "")
        : fill_(fill), total_(total), err_(std::move(err)) {}

    ssize_t read_stdout(char* buf, size_t len) override {
        size_t n = len;
        if (total_ > 0) n = std::min(len, total_ - produced_);
        std::fill(buf, buf + n, fill_);
        produced_ += n;
        return static_cast<ssize_t>(n);
    }

    ssize_t read_stderr(char* buf, size_t len) override {
        size_t n = std::min(len, err_.size());
        err_.copy(buf, n);
        err_.erase(0, n);
        return static_cast<ssize_t>(n);
    }

    bool eof() override { return total_ > 0 && produced_ >= total_ && err_.empty(); }

    void wait(Clock::time_point) override {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    size_t produced() const { return produced_; }

private:
    char fill_;
    size_t total_;
    size_t produced_ = 0;
    std::string err_;
};

class FakeRemote;

class FakeConnection : public RemoteConnection {
public:
    FakeConnection(FakeRemote& remote, const Target& target, int serial)
        : remote_(remote), target_(target), serial_(serial) {}
    ~FakeConnection() override;

    const Target& target() const override { return target_; }
    bool is_alive() override { return alive; }
    Result<ExecResult> exec(const std::string& command, int timeout_ms) override;
    Result<std::unique_ptr<RemoteShell>> open_shell(const Geometry& geometry,
                                                    const std::string& term) override;

    int serial() const { return serial_; }
    std::atomic<bool> alive{true};

private:
    FakeRemote& remote_;
    Target target_;
    int serial_;
};

class FakeRemote : public ConnectionFactory {
public:
    Result<std::unique_ptr<RemoteConnection>> connect(const Target& target, int) override {
        connects++;
        if (connect_delay_ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(connect_delay_ms));
        }
        if (refuse) {
            return Result<std::unique_ptr<RemoteConnection>>::Err(*refuse, "refused by fake");
        }
        int serial = ++serial_;
        live++;
        return Result<std::unique_ptr<RemoteConnection>>::Ok(
            std::make_unique<FakeConnection>(*this, target, serial));
    }

    std::shared_ptr<FakeShellState> last_shell() {
        std::lock_guard<std::mutex> lock(mutex_);
        return shells_.empty() ? nullptr : shells_.back();
    }

    size_t shell_count() {
        std::lock_guard<std::mutex> lock(mutex_);
        return shells_.size();
    }

    std::shared_ptr<FakeShellState> add_shell(const Geometry& geometry) {
        auto state = std::make_shared<FakeShellState>();
        state->opened_with = geometry;
        std::lock_guard<std::mutex> lock(mutex_);
        shells_.push_back(state);
        return state;
    }

    std::atomic<int> connects{0};
    std::atomic<int> live{0};                    // FakeConnections not yet destroyed
    std::atomic<int> execs{0};
    std::optional<ErrorKind> refuse;             // set before use, read by connect()
    int connect_delay_ms = 0;
    std::function<Result<ExecResult>(const std::string&)> exec_handler;
    // When set, exec() reads the command's output from these streams the way
    // the SSH transport does, keeping at most exec_output_cap per stream.
    std::function<std::unique_ptr<ExecStreams>(const std::string&)> exec_streams;
    size_t exec_output_cap = 1024 * 1024;

private:
    std::mutex mutex_;
    std::vector<std::shared_ptr<FakeShellState>> shells_;
    std::atomic<int> serial_{0};
};

inline FakeConnection::~FakeConnection() {
    remote_.live--;
}

inline Result<ExecResult> FakeConnection::exec(const std::string& command, int timeout_ms) {
    remote_.execs++;
    if (remote_.exec_streams) {
        auto streams = remote_.exec_streams(command);
        auto deadline = ExecStreams::Clock::now() + std::chrono::milliseconds(timeout_ms);
        return collect_exec_output(*streams, deadline, remote_.exec_output_cap, timeout_ms);
    }
    if (remote_.exec_handler) return remote_.exec_handler(command);
    ExecResult result;
    result.stdout_data = command + "\n";
    return Result<ExecResult>::Ok(result);
}

inline Result<std::unique_ptr<RemoteShell>> FakeConnection::open_shell(const Geometry& geometry,
                                                                      const std::string&) {
    auto state = remote_.add_shell(geometry);
    return Result<std::unique_ptr<RemoteShell>>::Ok(std::make_unique<FakeShell>(state));
}
