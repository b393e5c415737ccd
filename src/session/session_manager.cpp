#include "session_manager.hpp"
#include "session_backend.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <platform/pty_process.hpp>
#include <platform/socket_util.hpp>
#include <pool/connection_pool.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

// Reads per session per reactor visit, so one chatty session cannot starve
// the rest.
static constexpr int READS_PER_VISIT = 4;

// ── Lifecycle ──────────────────────────────────────────────────

SessionManager::SessionManager(const Config& config, ConnectionPool* pool)
    : config_(config), pool_(pool), workers_(config.sessions().worker_threads) {}

SessionManager::~SessionManager() {
    shutdown();
}

Result<void> SessionManager::start() {
    if (running_) return Result<void>::Ok();
    if (stopped_) {
        return Result<void>::Err(ErrorKind::IOError, "Session manager already shut down");
    }

    if (pipe(wake_pipe_) != 0) {
        return Result<void>::Err(ErrorKind::IOError,
                                 std::string("pipe failed: ") + std::strerror(errno));
    }
    for (int fd : wake_pipe_) {
        platform::set_nonblocking(fd);
        platform::set_cloexec(fd);
    }

    running_ = true;
    workers_.start();
    reactor_ = std::thread(&SessionManager::reactor_loop, this);
    log_info(fmt::format("sessions: started (max {}, {} workers)",
                         config_.sessions().max_sessions, config_.sessions().worker_threads));
    return Result<void>::Ok();
}

void SessionManager::shutdown() {
    if (stopped_.exchange(true)) return;

    std::vector<std::shared_ptr<Session>> all;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        for (auto& [id, s] : sessions_) all.push_back(s);
    }
    for (auto& s : all) {
        teardown(s, "shutdown", std::nullopt, true);
    }

    running_ = false;
    wake_reactor();
    if (reactor_.joinable()) reactor_.join();
    workers_.stop();

    {
        std::lock_guard<std::mutex> lock(events_mutex_);
        events_.clear();
    }
    events_cv_.notify_all();

    for (int& fd : wake_pipe_) {
        if (fd >= 0) {
            ::close(fd);
            fd = -1;
        }
    }
    if (!all.empty()) {
        log_info(fmt::format("sessions: shut down, closed {} session(s)", all.size()));
    }
}

bool SessionManager::run_async(WorkerPool::Task task) {
    if (stopped_) return false;
    return workers_.submit(std::move(task));
}

// ── Lookup ─────────────────────────────────────────────────────

bool SessionManager::recently_closed(const std::string& id) const {
    return closed_ids_.count(id) > 0;
}

Result<std::shared_ptr<Session>> SessionManager::lookup(const std::string& id) const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto it = sessions_.find(id);
    if (it != sessions_.end()) return Result<std::shared_ptr<Session>>::Ok(it->second);
    if (recently_closed(id)) {
        return Result<std::shared_ptr<Session>>::Err(ErrorKind::SessionClosed,
                                                     "Session closed: " + id);
    }
    return Result<std::shared_ptr<Session>>::Err(ErrorKind::SessionNotFound,
                                                 "No such session: " + id);
}

Result<SessionInfo> SessionManager::session_info(const std::string& id) const {
    auto s = lookup(id);
    if (s.is_err()) return Result<SessionInfo>::Err(s.error);
    return Result<SessionInfo>::Ok(s.value->info());
}

std::vector<SessionInfo> SessionManager::list_sessions() const {
    std::vector<std::shared_ptr<Session>> live;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        live.reserve(sessions_.size());
        for (const auto& entry : sessions_) live.push_back(entry.second);
    }
    std::vector<SessionInfo> out;
    out.reserve(live.size());
    for (const auto& session : live) out.push_back(session->info());
    std::sort(out.begin(), out.end(), [](const SessionInfo& a, const SessionInfo& b) {
        return a.created_at != b.created_at ? a.created_at < b.created_at : a.id < b.id;
    });
    return out;
}

size_t SessionManager::active_count() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return sessions_.size();
}

// ── create ─────────────────────────────────────────────────────

Result<void> SessionManager::reserve_slot() {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    if (stopped_ || !running_) {
        return Result<void>::Err(ErrorKind::IOError, "Session manager is not running");
    }
    int active = static_cast<int>(sessions_.size()) + reserved_;
    if (active >= config_.sessions().max_sessions) {
        return Result<void>::Err(ErrorKind::ResourceExhausted,
                                 fmt::format("Session limit reached ({})",
                                             config_.sessions().max_sessions));
    }
    reserved_++;
    return Result<void>::Ok();
}

void SessionManager::commit_slot(const std::shared_ptr<Session>& session) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    reserved_--;
    sessions_.emplace(session->id, session);
}

void SessionManager::cancel_slot() {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    reserved_--;
}

Result<std::string> SessionManager::create(const SessionRequest& request) {
    if (!request.geometry.valid()) {
        return Result<std::string>::Err(ErrorKind::ProtocolError,
                                        fmt::format("Invalid geometry {}x{}",
                                                    request.geometry.cols, request.geometry.rows));
    }
    if (request.kind == SessionKind::Local) return create_local(request);
    return create_remote(request);
}

Result<std::string> SessionManager::create_local(const SessionRequest& request) {
    auto slot = reserve_slot();
    if (slot.is_err()) return Result<std::string>::Err(slot.error);

    const auto& sc = config_.sessions();
    platform::PtySpawnOptions options;
    options.shell = sc.shell;
    options.args = sc.shell_args;
    options.term = sc.term;
    options.geometry = request.geometry;

    auto process = platform::PtyProcess::spawn(options);
    if (process.is_err()) {
        cancel_slot();
        log_error("sessions: spawn failed: " + process.error.message);
        return Result<std::string>::Err(process.error);
    }

    auto session = std::make_shared<Session>(random_hex_id(), SessionKind::Local,
                                             request.geometry, config_.stream());
    int pid = process.value.pid();
    session->backend = std::make_shared<LocalBackend>(std::move(process.value));

    commit_slot(session);
    push_event({PendingEvent::Kind::Connected, session, {}});
    wake_reactor();

    log_info(fmt::format("session {}: local shell pid {} ({}x{})", session->id, pid,
                         request.geometry.cols, request.geometry.rows));
    return Result<std::string>::Ok(session->id);
}

Result<std::string> SessionManager::create_remote(const SessionRequest& request) {
    if (!request.target) {
        return Result<std::string>::Err(ErrorKind::ProtocolError,
                                        "Remote session requires a target");
    }
    if (!pool_) {
        return Result<std::string>::Err(ErrorKind::IOError, "Remote sessions are not available");
    }

    auto slot = reserve_slot();
    if (slot.is_err()) return Result<std::string>::Err(slot.error);

    auto session = std::make_shared<Session>(random_hex_id(), SessionKind::Remote,
                                             request.geometry, config_.stream());
    session->target = request.target;
    commit_slot(session);

    bool queued = workers_.submit([this, session] { attach_remote(session); });
    if (!queued) {
        teardown(session, "shutdown", ErrorKind::IOError, true);
        return Result<std::string>::Err(ErrorKind::IOError, "Session manager is stopping");
    }

    log_info(fmt::format("session {}: remote {} pending attach", session->id,
                         request.target->to_string()));
    return Result<std::string>::Ok(session->id);
}

void SessionManager::attach_remote(const std::shared_ptr<Session>& session) {
    const Target& target = *session->target;
    {
        std::lock_guard<std::mutex> lock(session->mutex);
        if (session->state != SessionState::Active) return;
    }

    auto lease = pool_->acquire(target);
    if (lease.is_err()) {
        log_warn(fmt::format("session {}: attach to {} failed: {}", session->id,
                             target.to_string(), lease.error.message));
        teardown(session, lease.error.message, lease.error.kind, false);
        return;
    }

    Geometry opened_with;
    {
        std::lock_guard<std::mutex> lock(session->mutex);
        opened_with = session->geometry;
    }
    auto shell = lease.value->open_shell(opened_with, config_.sessions().term);
    if (shell.is_err()) {
        lease.value.release(false);
        teardown(session, shell.error.message, shell.error.kind, false);
        return;
    }

    auto backend = std::make_shared<RemoteBackend>(std::move(lease.value), std::move(shell.value));

    // Writers and resizers wait here, so queued input and geometry stay ordered
    std::lock_guard<std::mutex> write_lock(session->write_mutex);
    std::lock_guard<std::mutex> control_lock(session->control_mutex);

    std::vector<std::string> pending;
    Geometry current;
    {
        std::lock_guard<std::mutex> lock(session->mutex);
        if (session->state != SessionState::Active) return;   // closed meanwhile; backend releases
        pending.swap(session->pending_input);
        current = session->geometry;
        session->backend = backend;
    }

    if (current.rows != opened_with.rows || current.cols != opened_with.cols) {
        auto resized = backend->resize(current);
        if (resized.is_err()) {
            log_warn(fmt::format("session {}: resize on attach failed: {}", session->id,
                                 resized.error.message));
        }
    }

    push_event({PendingEvent::Kind::Connected, session, {}});
    wake_reactor();
    log_info(fmt::format("session {}: attached to {}", session->id, target.to_string()));

    for (const auto& chunk : pending) {
        auto written = backend->write(chunk.data(), chunk.size(), config_.sessions().write_timeout_ms);
        if (written.is_err()) {
            log_warn(fmt::format("session {}: queued input failed: {}", session->id,
                                 written.error.message));
            break;
        }
    }
}

// ── write / resize / close ─────────────────────────────────────

Result<void> SessionManager::write(const std::string& id, const std::string& data) {
    auto found = lookup(id);
    if (found.is_err()) return Result<void>::Err(found.error);
    auto& session = found.value;

    std::lock_guard<std::mutex> write_lock(session->write_mutex);
    std::shared_ptr<SessionBackend> backend;
    {
        std::lock_guard<std::mutex> lock(session->mutex);
        if (session->state != SessionState::Active) {
            return Result<void>::Err(ErrorKind::SessionClosed, "Session closed: " + id);
        }
        session->last_activity = std::time(nullptr);
        if (!session->backend) {
            session->pending_input.push_back(data);
            return Result<void>::Ok();
        }
        backend = session->backend;
    }
    return backend->write(data.data(), data.size(), config_.sessions().write_timeout_ms);
}

Result<void> SessionManager::resize(const std::string& id, const Geometry& geometry) {
    if (!geometry.valid()) {
        return Result<void>::Err(ErrorKind::ProtocolError,
                                 fmt::format("Invalid geometry {}x{}", geometry.cols, geometry.rows));
    }

    auto found = lookup(id);
    if (found.is_err()) {
        // Clients may race resize with close
        if (found.error.kind == ErrorKind::SessionClosed) return Result<void>::Ok();
        return Result<void>::Err(found.error);
    }
    auto& session = found.value;

    std::lock_guard<std::mutex> control_lock(session->control_mutex);
    std::shared_ptr<SessionBackend> backend;
    {
        std::lock_guard<std::mutex> lock(session->mutex);
        if (session->state != SessionState::Active) return Result<void>::Ok();
        session->geometry = geometry;
        backend = session->backend;
    }
    if (!backend) return Result<void>::Ok();    // applied on attach
    return backend->resize(geometry);
}

Result<void> SessionManager::close(const std::string& id) {
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(id);
        if (it == sessions_.end()) return Result<void>::Ok();
        session = it->second;
    }
    teardown(session, "closed by client", std::nullopt, true);
    return Result<void>::Ok();
}

void SessionManager::teardown(const std::shared_ptr<Session>& session, const std::string& reason,
                              std::optional<ErrorKind> kind, bool discard_output) {
    std::shared_ptr<SessionBackend> backend;
    {
        std::lock_guard<std::mutex> lock(session->mutex);
        if (session->state != SessionState::Active) return;
        session->state = SessionState::Closing;
        backend = std::move(session->backend);
        session->pending_input.clear();
    }

    session->buffer.close();
    if (discard_output) session->buffer.drain();

    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions_.erase(session->id);
        closed_ids_.insert(session->id);
        closed_order_.push_back(session->id);
        while (closed_order_.size() > CLOSED_ID_MEMORY) {
            closed_ids_.erase(closed_order_.front());
            closed_order_.pop_front();
        }
    }

    if (backend && kind) backend->mark_unhealthy();
    // Last reference kills/reaps the process or returns the lease
    backend.reset();

    {
        std::lock_guard<std::mutex> lock(session->mutex);
        session->state = SessionState::Closed;
    }

    log_info(fmt::format("session {}: closed ({})", session->id, reason));
    PendingEvent ev{PendingEvent::Kind::Closed, session, ClosedEvent{session->id, reason, kind}};
    push_event(std::move(ev));
    wake_reactor();
}

// ── Event stream ───────────────────────────────────────────────

void SessionManager::push_event(PendingEvent event) {
    {
        std::lock_guard<std::mutex> lock(events_mutex_);
        if (stopped_ && !running_) return;
        events_.push_back(std::move(event));
    }
    events_cv_.notify_one();
}

void SessionManager::queue_output(const std::shared_ptr<Session>& session) {
    if (session->output_queued.exchange(true)) return;
    push_event({PendingEvent::Kind::Output, session, {}});
}

std::optional<SessionEvent> SessionManager::next_event(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    std::unique_lock<std::mutex> lock(events_mutex_);

    while (true) {
        if (stopped_) return std::nullopt;
        if (events_.empty()) {
            bool ready = events_cv_.wait_until(lock, deadline, [this] {
                return stopped_ || !events_.empty();
            });
            if (!ready) return std::nullopt;
            continue;
        }

        PendingEvent ev = std::move(events_.front());
        events_.pop_front();

        switch (ev.kind) {
            case PendingEvent::Kind::Connected:
                return SessionEvent(ConnectedEvent{ev.session->id});

            case PendingEvent::Kind::Closed:
                return SessionEvent(std::move(ev.closed));

            case PendingEvent::Kind::Output: {
                lock.unlock();
                ev.session->output_queued = false;
                auto drained = ev.session->buffer.drain();
                if (ev.session->buffer.policy() == OverflowPolicy::Block) {
                    wake_reactor();     // the session may have been parked on a full buffer
                }
                if (drained.data.empty()) {
                    lock.lock();
                    continue;
                }
                return SessionEvent(OutputEvent{ev.session->id, std::move(drained.data),
                                                drained.truncated});
            }
        }
    }
}

// ── Reactor ────────────────────────────────────────────────────

void SessionManager::wake_reactor() {
    if (wake_pipe_[1] < 0) return;
    char b = 1;
    // A full pipe already guarantees a wakeup
    ssize_t n = ::write(wake_pipe_[1], &b, 1);
    (void)n;
}

void SessionManager::drain_wake_pipe() {
    char buf[256];
    while (::read(wake_pipe_[0], buf, sizeof(buf)) > 0) {}
}

void SessionManager::reactor_loop() {
    std::vector<pollfd> fds;
    std::vector<std::shared_ptr<Session>> polled;
    std::vector<std::shared_ptr<Session>> probed;
    bool block_policy = config_.stream().overflow_policy == OverflowPolicy::Block;

    while (running_) {
        fds.clear();
        polled.clear();
        probed.clear();
        fds.push_back({wake_pipe_[0], POLLIN, 0});

        {
            std::lock_guard<std::mutex> lock(sessions_mutex_);
            for (auto& [id, s] : sessions_) {
                // Parked until the consumer drains
                if (block_policy && s->buffer.full()) continue;

                std::lock_guard<std::mutex> slock(s->mutex);
                if (s->state != SessionState::Active || !s->backend) continue;
                int fd = s->backend->poll_fd();
                if (fd >= 0) {
                    fds.push_back({fd, POLLIN, 0});
                    polled.push_back(s);
                }
                if (s->backend->needs_probe()) probed.push_back(s);
            }
        }

        int timeout = probed.empty() ? -1 : REACTOR_POLL_MS;
        int n = ::poll(fds.data(), fds.size(), timeout);
        if (n < 0) {
            if (errno == EINTR) continue;
            log_error(fmt::format("reactor: poll failed: {}", std::strerror(errno)));
            platform::sleep_ms(REACTOR_POLL_MS);
            continue;
        }

        if (fds[0].revents & POLLIN) drain_wake_pipe();

        for (size_t i = 0; i < polled.size(); i++) {
            if (fds[i + 1].revents == 0) continue;
            service(polled[i]);
        }
        for (auto& s : probed) {
            // Already read this cycle
            auto it = std::find(polled.begin(), polled.end(), s);
            if (it != polled.end() && fds[1 + (it - polled.begin())].revents != 0) continue;
            service(s);
        }
    }
}

void SessionManager::service(const std::shared_ptr<Session>& session) {
    std::shared_ptr<SessionBackend> backend;
    {
        std::lock_guard<std::mutex> lock(session->mutex);
        if (session->state != SessionState::Active || !session->backend) return;
        backend = session->backend;
    }

    bool block_policy = session->buffer.policy() == OverflowPolicy::Block;
    char buf[PTY_READ_BUF_SIZE];
    bool got_output = false;

    for (int i = 0; i < READS_PER_VISIT; i++) {
        size_t want = sizeof(buf);
        if (block_policy) {
            want = std::min(want, session->buffer.space());
            if (want == 0) break;
        }

        ssize_t n = backend->read(buf, want);
        if (n > 0) {
            session->buffer.append(buf, static_cast<size_t>(n));
            got_output = true;
            continue;
        }
        if (n == 0) break;

        if (got_output) queue_output(session);
        if (n == SessionBackend::READ_ERROR) {
            teardown(session, "read error", ErrorKind::IOError, false);
        } else {
            teardown(session, backend->end_reason(), std::nullopt, false);
        }
        return;
    }

    if (got_output) {
        session->touch();
        queue_output(session);
    }
}
