#pragma once

#include <deque>
#include <mutex>
#include <string>
#include <core/types.hpp>

// OutputBuffer: bounded, chunked accumulation of one session's pending output.
//
// Appends push a chunk onto a deque (no whole-buffer copy); drain() joins the
// pending chunks once and clears them, so memory tracks unread output only.
// The byte total never exceeds max_bytes():
//   Block      — append() refuses with WouldBlock. The reactor reads at most
//                space() bytes per session, so the producer waits on the fd.
//   DropOldest — the oldest bytes are discarded and truncated() is set until
//                the next drain.
class OutputBuffer {
public:
    enum class AppendStatus {
        Appended,
        Truncated,   // appended, but older data was dropped to make room
        WouldBlock,  // Block policy and not enough space; nothing appended
        Closed,
    };

    struct DrainResult {
        std::string data;
        bool truncated = false;
    };

    OutputBuffer(size_t max_bytes, OverflowPolicy policy);

    OutputBuffer(const OutputBuffer&) = delete;
    OutputBuffer& operator=(const OutputBuffer&) = delete;

    AppendStatus append(std::string chunk);
    AppendStatus append(const char* data, size_t len);

    // Return and clear everything pending.
    DrainResult drain();

    // Copy of the last max_bytes pending bytes, without consuming them.
    std::string tail(size_t max_bytes) const;

    size_t len() const;
    size_t space() const;
    bool full() const;
    bool truncated() const;
    size_t chunk_count() const;
    size_t max_bytes() const { return max_bytes_; }
    OverflowPolicy policy() const { return policy_; }

    // Later appends return Closed.
    void close();
    bool closed() const;

private:
    const size_t max_bytes_;
    const OverflowPolicy policy_;

    mutable std::mutex mutex_;
    std::deque<std::string> chunks_;
    size_t front_offset_ = 0;   // bytes already dropped from chunks_.front()
    size_t total_ = 0;
    bool truncated_ = false;
    bool closed_ = false;

    // Caller holds mutex_.
    void drop_front(size_t bytes);
    AppendStatus append_locked(std::string&& chunk);
};
