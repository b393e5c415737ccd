#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include <core/config.hpp>
#include <core/types.hpp>
#include <core/worker_pool.hpp>
#include "session.hpp"

class ConnectionPool;

// SessionManager: owns every session, reads all of them from one reactor
// thread, and exposes their output as one lazy event stream.
//
//   create()      local: forkpty a shell, `connected` right away
//                 remote: record the target, attach on a worker
//   write()       ordered per session; queued until a remote session attaches
//   resize()      TIOCSWINSZ or SSH pty-size
//   close()       idempotent teardown
//   next_event()  Output / Connected / Closed across all sessions
//
// Every exit path (close, EOF, read error, shutdown) goes through teardown().
class SessionManager {
public:
    // pool may be null: remote sessions then fail with IOError.
    SessionManager(const Config& config, ConnectionPool* pool);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    // Start the reactor and the worker pool.
    Result<void> start();

    Result<std::string> create(const SessionRequest& request);
    Result<void> write(const std::string& id, const std::string& data);
    Result<void> resize(const std::string& id, const Geometry& geometry);
    Result<void> close(const std::string& id);

    // Next event, or nullopt on timeout. After shutdown() always nullopt.
    std::optional<SessionEvent> next_event(std::chrono::milliseconds timeout);

    // Close every session and stop the reactor and workers.
    void shutdown();

    Result<SessionInfo> session_info(const std::string& id) const;
    // Every live session, oldest first.
    std::vector<SessionInfo> list_sessions() const;
    size_t active_count() const;
    size_t queued_tasks() const { return workers_.pending(); }
    bool stopped() const { return stopped_; }

    // Run slow work (exec requests) on the manager's worker pool.
    bool run_async(WorkerPool::Task task);

private:
    struct PendingEvent {
        enum class Kind { Output, Connected, Closed };
        Kind kind;
        std::shared_ptr<Session> session;
        ClosedEvent closed;
    };

    const Config& config_;
    ConnectionPool* pool_;
    WorkerPool workers_;

    mutable std::mutex sessions_mutex_;
    std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;
    int reserved_ = 0;                         // creates past the cap check, not yet inserted
    std::deque<std::string> closed_order_;     // bounded memory of closed ids
    std::unordered_set<std::string> closed_ids_;

    std::mutex events_mutex_;
    std::condition_variable events_cv_;
    std::deque<PendingEvent> events_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stopped_{false};
    std::thread reactor_;
    int wake_pipe_[2] = {-1, -1};

    // Live session, or SessionClosed / SessionNotFound.
    Result<std::shared_ptr<Session>> lookup(const std::string& id) const;
    bool recently_closed(const std::string& id) const;

    Result<std::string> create_local(const SessionRequest& request);
    Result<std::string> create_remote(const SessionRequest& request);
    // Session-cap bookkeeping around the slow part of create().
    Result<void> reserve_slot();
    void commit_slot(const std::shared_ptr<Session>& session);
    void cancel_slot();
    void attach_remote(const std::shared_ptr<Session>& session);

    void teardown(const std::shared_ptr<Session>& session, const std::string& reason,
                  std::optional<ErrorKind> kind, bool discard_output);

    void push_event(PendingEvent event);
    void queue_output(const std::shared_ptr<Session>& session);

    void reactor_loop();
    void service(const std::shared_ptr<Session>& session);
    void wake_reactor();
    void drain_wake_pipe();
};
