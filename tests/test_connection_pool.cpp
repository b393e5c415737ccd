#include <gtest/gtest.h>
#include <pool/connection_pool.hpp>
#include "fake_remote.hpp"
#include <chrono>
#include <thread>

namespace {

const Target kBuild{"build.example.com", 22, "ci"};
const Target kDocs{"docs.example.com", 22, "ci"};

PoolConfig small_pool(int per_target, ExhaustedPolicy policy) {
    PoolConfig config;
    config.max_per_target = per_target;
    config.max_total = 16;
    config.exhausted_policy = policy;
    config.acquire_timeout_ms = 100;
    config.connect_retries = 0;
    config.retry_backoff_ms = 1;
    return config;
}

BreakerConfig breaker_config(int threshold) {
    BreakerConfig config;
    config.failure_threshold = threshold;
    config.open_duration_ms = 60000;
    return config;
}

} // namespace

TEST(ConnectionPool, ReusesIdleConnection) {
    FakeRemote remote;
    CircuitBreakerRegistry breakers(breaker_config(5));
    ConnectionPool pool(remote, small_pool(2, ExhaustedPolicy::Fail), breakers);

    int first_serial = 0;
    {
        auto lease = pool.acquire(kBuild);
        ASSERT_TRUE(lease.is_ok());
        first_serial = static_cast<FakeConnection&>(lease.value.get()).serial();
    }
    auto again = pool.acquire(kBuild);
    ASSERT_TRUE(again.is_ok());
    EXPECT_EQ(static_cast<FakeConnection&>(again.value.get()).serial(), first_serial);
    EXPECT_EQ(remote.connects.load(), 1);
}

TEST(ConnectionPool, UnhealthyReleaseDiscards) {
    FakeRemote remote;
    CircuitBreakerRegistry breakers(breaker_config(5));
    ConnectionPool pool(remote, small_pool(2, ExhaustedPolicy::Fail), breakers);

    auto lease = pool.acquire(kBuild);
    ASSERT_TRUE(lease.is_ok());
    pool.release(lease.value, false);
    EXPECT_EQ(remote.live.load(), 0);
    EXPECT_EQ(pool.total_connections(), 0);

    ASSERT_TRUE(pool.acquire(kBuild).is_ok());
    EXPECT_EQ(remote.connects.load(), 2);
}

TEST(ConnectionPool, DoubleReleaseIsNoOp) {
    FakeRemote remote;
    CircuitBreakerRegistry breakers(breaker_config(5));
    ConnectionPool pool(remote, small_pool(2, ExhaustedPolicy::Fail), breakers);

    auto lease = pool.acquire(kBuild);
    ASSERT_TRUE(lease.is_ok());
    lease.value.release(true);
    lease.value.release(true);
    pool.release(lease.value, false);

    auto stats = pool.stats();
    ASSERT_EQ(stats.size(), 1u);
    EXPECT_EQ(stats[0].idle, 1);
    EXPECT_EQ(stats[0].in_use, 0);
    EXPECT_EQ(pool.total_connections(), 1);
}

TEST(ConnectionPool, ExhaustedFailsImmediately) {
    FakeRemote remote;
    CircuitBreakerRegistry breakers(breaker_config(5));
    ConnectionPool pool(remote, small_pool(2, ExhaustedPolicy::Fail), breakers);

    auto a = pool.acquire(kBuild);
    auto b = pool.acquire(kBuild);
    ASSERT_TRUE(a.is_ok());
    ASSERT_TRUE(b.is_ok());

    auto start = std::chrono::steady_clock::now();
    auto c = pool.acquire(kBuild);
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(c.is_err());
    EXPECT_EQ(c.error.kind, ErrorKind::PoolExhausted);
    EXPECT_LT(elapsed, std::chrono::milliseconds(50));
    EXPECT_EQ(remote.connects.load(), 2);
}

TEST(ConnectionPool, ExhaustedWaitTimesOut) {
    FakeRemote remote;
    CircuitBreakerRegistry breakers(breaker_config(5));
    ConnectionPool pool(remote, small_pool(2, ExhaustedPolicy::Wait), breakers);

    auto a = pool.acquire(kBuild);
    auto b = pool.acquire(kBuild);
    ASSERT_TRUE(a.is_ok());
    ASSERT_TRUE(b.is_ok());

    auto start = std::chrono::steady_clock::now();
    auto c = pool.acquire(kBuild);
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(c.is_err());
    EXPECT_EQ(c.error.kind, ErrorKind::PoolExhausted);
    EXPECT_GE(elapsed, std::chrono::milliseconds(90));
}

TEST(ConnectionPool, WaiterGetsReleasedConnection) {
    FakeRemote remote;
    CircuitBreakerRegistry breakers(breaker_config(5));
    auto config = small_pool(1, ExhaustedPolicy::Wait);
    config.acquire_timeout_ms = 5000;
    ConnectionPool pool(remote, config, breakers);

    auto held = pool.acquire(kBuild);
    ASSERT_TRUE(held.is_ok());

    std::thread releaser([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        held.value.release(true);
    });
    auto waited = pool.acquire(kBuild);
    releaser.join();

    ASSERT_TRUE(waited.is_ok());
    EXPECT_EQ(remote.connects.load(), 1);
}

TEST(ConnectionPool, GlobalCapEvictsIdleElsewhere) {
    FakeRemote remote;
    CircuitBreakerRegistry breakers(breaker_config(5));
    auto config = small_pool(2, ExhaustedPolicy::Fail);
    config.max_total = 1;
    ConnectionPool pool(remote, config, breakers);

    {
        auto docs = pool.acquire(kDocs);
        ASSERT_TRUE(docs.is_ok());
    }
    EXPECT_EQ(pool.total_connections(), 1);

    auto build = pool.acquire(kBuild);
    ASSERT_TRUE(build.is_ok());
    EXPECT_EQ(pool.total_connections(), 1);
    EXPECT_EQ(remote.live.load(), 1);
}

TEST(ConnectionPool, BreakerOpensAndShortCircuits) {
    FakeRemote remote;
    remote.refuse = ErrorKind::ConnectTimeout;
    CircuitBreakerRegistry breakers(breaker_config(3));
    ConnectionPool pool(remote, small_pool(2, ExhaustedPolicy::Fail), breakers);

    for (int i = 0; i < 3; ++i) {
        auto failed = pool.acquire(kBuild);
        ASSERT_TRUE(failed.is_err());
        EXPECT_EQ(failed.error.kind, ErrorKind::ConnectTimeout);
    }
    EXPECT_EQ(remote.connects.load(), 3);

    auto start = std::chrono::steady_clock::now();
    auto rejected = pool.acquire(kBuild);
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(rejected.is_err());
    EXPECT_EQ(rejected.error.kind, ErrorKind::CircuitOpen);
    EXPECT_LT(elapsed, std::chrono::milliseconds(1));
    EXPECT_EQ(remote.connects.load(), 3);

    auto exec = pool.execute(kBuild, "uptime");
    ASSERT_TRUE(exec.is_err());
    EXPECT_EQ(exec.error.kind, ErrorKind::CircuitOpen);
    EXPECT_EQ(remote.connects.load(), 3);
}

TEST(ConnectionPool, BreakerIsPerTarget) {
    FakeRemote remote;
    remote.refuse = ErrorKind::IOError;
    CircuitBreakerRegistry breakers(breaker_config(1));
    ConnectionPool pool(remote, small_pool(2, ExhaustedPolicy::Fail), breakers);

    ASSERT_TRUE(pool.acquire(kBuild).is_err());
    EXPECT_EQ(breakers.get(kBuild)->state(), CircuitBreaker::State::Open);

    remote.refuse.reset();
    EXPECT_TRUE(pool.acquire(kDocs).is_ok());
}

TEST(ConnectionPool, ExhaustionDoesNotTripBreaker) {
    FakeRemote remote;
    CircuitBreakerRegistry breakers(breaker_config(1));
    ConnectionPool pool(remote, small_pool(1, ExhaustedPolicy::Fail), breakers);

    auto held = pool.acquire(kBuild);
    ASSERT_TRUE(held.is_ok());
    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ(pool.acquire(kBuild).error.kind, ErrorKind::PoolExhausted);
    }
    EXPECT_EQ(breakers.get(kBuild)->state(), CircuitBreaker::State::Closed);
}

TEST(ConnectionPool, RetriesBeforeGivingUp) {
    FakeRemote remote;
    remote.refuse = ErrorKind::ConnectTimeout;
    CircuitBreakerRegistry breakers(breaker_config(5));
    auto config = small_pool(1, ExhaustedPolicy::Fail);
    config.connect_retries = 2;
    ConnectionPool pool(remote, config, breakers);

    auto failed = pool.acquire(kBuild);
    ASSERT_TRUE(failed.is_err());
    EXPECT_EQ(remote.connects.load(), 3);
    EXPECT_EQ(pool.total_connections(), 0);
}

TEST(ConnectionPool, AuthFailureIsNotRetried) {
    FakeRemote remote;
    remote.refuse = ErrorKind::AuthenticationFailed;
    CircuitBreakerRegistry breakers(breaker_config(5));
    auto config = small_pool(1, ExhaustedPolicy::Fail);
    config.connect_retries = 2;
    ConnectionPool pool(remote, config, breakers);

    auto failed = pool.acquire(kBuild);
    ASSERT_TRUE(failed.is_err());
    EXPECT_EQ(failed.error.kind, ErrorKind::AuthenticationFailed);
    EXPECT_EQ(remote.connects.load(), 1);
}

TEST(ConnectionPool, DeadIdleConnectionIsReplaced) {
    FakeRemote remote;
    CircuitBreakerRegistry breakers(breaker_config(5));
    ConnectionPool pool(remote, small_pool(2, ExhaustedPolicy::Fail), breakers);

    {
        auto lease = pool.acquire(kBuild);
        ASSERT_TRUE(lease.is_ok());
        static_cast<FakeConnection&>(lease.value.get()).alive = false;
    }
    auto fresh = pool.acquire(kBuild);
    ASSERT_TRUE(fresh.is_ok());
    EXPECT_EQ(static_cast<FakeConnection&>(fresh.value.get()).serial(), 2);
    EXPECT_EQ(remote.live.load(), 1);
}

TEST(ConnectionPool, SweepEvictsExpiredIdle) {
    FakeRemote remote;
    CircuitBreakerRegistry breakers(breaker_config(5));
    auto config = small_pool(2, ExhaustedPolicy::Fail);
    config.idle_timeout_ms = 10;
    ConnectionPool pool(remote, config, breakers);

    ASSERT_TRUE(pool.warm_up(kBuild, 2).is_ok());
    EXPECT_EQ(pool.total_connections(), 2);
    std::this_thread::sleep_for(std::chrono::milliseconds(30));

    EXPECT_EQ(pool.sweep(), 2);
    EXPECT_EQ(pool.total_connections(), 0);
    EXPECT_EQ(remote.live.load(), 0);
}

TEST(ConnectionPool, WarmUpStopsAtPerTargetCap) {
    FakeRemote remote;
    CircuitBreakerRegistry breakers(breaker_config(5));
    ConnectionPool pool(remote, small_pool(2, ExhaustedPolicy::Fail), breakers);

    auto warmed = pool.warm_up(kBuild, 5);
    ASSERT_TRUE(warmed.is_ok());
    EXPECT_EQ(warmed.value, 2);
    EXPECT_EQ(pool.stats()[0].idle, 2);
}

TEST(ConnectionPool, ExecuteReturnsRemoteOutput) {
    FakeRemote remote;
    remote.exec_handler = [](const std::string& command) {
        ExecResult result;
        result.exit_code = 3;
        result.stdout_data = "ran " + command;
        result.stderr_data = "warning";
        return Result<ExecResult>::Ok(result);
    };
    CircuitBreakerRegistry breakers(breaker_config(1));
    ConnectionPool pool(remote, small_pool(1, ExhaustedPolicy::Fail), breakers);

    auto result = pool.execute(kBuild, "make test");
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value.exit_code, 3);
    EXPECT_EQ(result.value.stdout_data, "ran make test");
    EXPECT_EQ(result.value.stderr_data, "warning");

    // Non-zero exit is not a transport failure
    EXPECT_EQ(breakers.get(kBuild)->state(), CircuitBreaker::State::Closed);
    EXPECT_EQ(pool.stats()[0].idle, 1);
}

TEST(ConnectionPool, ExecuteTransportFailureDiscardsConnection) {
    FakeRemote remote;
    remote.exec_handler = [](const std::string&) {
        return Result<ExecResult>::Err(ErrorKind::IOError, "channel reset");
    };
    CircuitBreakerRegistry breakers(breaker_config(1));
    ConnectionPool pool(remote, small_pool(1, ExhaustedPolicy::Fail), breakers);

    auto result = pool.execute(kBuild, "uptime");
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error.kind, ErrorKind::IOError);
    EXPECT_EQ(remote.live.load(), 0);
    EXPECT_EQ(breakers.get(kBuild)->state(), CircuitBreaker::State::Open);
}

TEST(ConnectionPool, StopRejectsNewAcquires) {
    FakeRemote remote;
    CircuitBreakerRegistry breakers(breaker_config(5));
    ConnectionPool pool(remote, small_pool(2, ExhaustedPolicy::Fail), breakers);

    ASSERT_TRUE(pool.warm_up(kBuild, 1).is_ok());
    pool.stop();
    EXPECT_EQ(remote.live.load(), 0);
    EXPECT_TRUE(pool.acquire(kBuild).is_err());
}

TEST(ConnectionPool, ExecuteTimesOutOnEndlessOutput) {
    FakeRemote remote;
    remote.exec_output_cap = 64 * 1024;
    remote.exec_streams = [](const std::string&) {
        return std::make_unique<ScriptedExecStreams>('y', 0);
    };
    CircuitBreakerRegistry breakers(breaker_config(5));
    ConnectionPool pool(remote, small_pool(1, ExhaustedPolicy::Fail), breakers);

    auto start = std::chrono::steady_clock::now();
    auto result = pool.execute(kBuild, "yes", 200);
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error.kind, ErrorKind::IOError);
    EXPECT_NE(result.error.message.find("timed out"), std::string::npos);
    EXPECT_GE(elapsed, std::chrono::milliseconds(190));
    EXPECT_LT(elapsed, std::chrono::seconds(2));
    EXPECT_EQ(remote.live.load(), 0);
}

TEST(ConnectionPool, ExecuteKeepsNewestOutputWithinCap) {
    FakeRemote remote;
    remote.exec_output_cap = 1024;
    remote.exec_streams = [](const std::string&) {
        return std::make_unique<ScriptedExecStreams>('a', 100000, "warning\n");
    };
    CircuitBreakerRegistry breakers(breaker_config(5));
    ConnectionPool pool(remote, small_pool(1, ExhaustedPolicy::Fail), breakers);

    auto result = pool.execute(kBuild, "cat big.log", 5000);
    ASSERT_TRUE(result.is_ok()) << result.error.message;
    EXPECT_EQ(result.value.stdout_data, std::string(1024, 'a'));
    EXPECT_EQ(result.value.stderr_data, "warning\n");
    EXPECT_TRUE(result.value.truncated);
    EXPECT_EQ(pool.stats()[0].idle, 1);
}

TEST(ConnectionPool, SmallOutputIsNotTruncated) {
    FakeRemote remote;
    remote.exec_output_cap = 1024;
    remote.exec_streams = [](const std::string&) {
        return std::make_unique<ScriptedExecStreams>('z', 10);
    };
    CircuitBreakerRegistry breakers(breaker_config(5));
    ConnectionPool pool(remote, small_pool(1, ExhaustedPolicy::Fail), breakers);

    auto result = pool.execute(kBuild, "echo", 5000);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value.stdout_data, std::string(10, 'z'));
    EXPECT_FALSE(result.value.truncated);
}

TEST(ConnectionPool, SweeperThreadEvictsExpiredIdle) {
    FakeRemote remote;
    CircuitBreakerRegistry breakers(breaker_config(5));
    auto config = small_pool(2, ExhaustedPolicy::Fail);
    config.idle_timeout_ms = 20;
    config.sweep_interval_ms = 10;
    ConnectionPool pool(remote, config, breakers);

    ASSERT_TRUE(pool.warm_up(kBuild, 2).is_ok());
    ASSERT_EQ(pool.total_connections(), 2);
    pool.start_sweeper();

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (pool.total_connections() > 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    EXPECT_EQ(pool.total_connections(), 0);
    EXPECT_EQ(remote.live.load(), 0);
    pool.stop();
}

TEST(ConnectionPool, SweeperThreadRefillsMinIdle) {
    FakeRemote remote;
    CircuitBreakerRegistry breakers(breaker_config(5));
    auto config = small_pool(2, ExhaustedPolicy::Fail);
    config.min_idle = 1;
    config.sweep_interval_ms = 10;
    ConnectionPool pool(remote, config, breakers);

    pool.keep_warm({kBuild});
    pool.start_sweeper();

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (remote.connects.load() == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    pool.stop();
    EXPECT_EQ(remote.connects.load(), 1);
}
