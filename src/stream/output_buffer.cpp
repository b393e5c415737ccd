#include "output_buffer.hpp"
#include <algorithm>
#include <iterator>

OutputBuffer::OutputBuffer(size_t max_bytes, OverflowPolicy policy)
    : max_bytes_(max_bytes == 0 ? 1 : max_bytes), policy_(policy) {}

OutputBuffer::AppendStatus OutputBuffer::append(std::string chunk) {
    std::lock_guard<std::mutex> lock(mutex_);
    return append_locked(std::move(chunk));
}

OutputBuffer::AppendStatus OutputBuffer::append(const char* data, size_t len) {
    return append(std::string(data, len));
}

OutputBuffer::AppendStatus OutputBuffer::append_locked(std::string&& chunk) {
    if (closed_) return AppendStatus::Closed;
    if (chunk.empty()) return AppendStatus::Appended;

    if (policy_ == OverflowPolicy::Block) {
        if (total_ + chunk.size() > max_bytes_) return AppendStatus::WouldBlock;
        total_ += chunk.size();
        chunks_.push_back(std::move(chunk));
        return AppendStatus::Appended;
    }

    // DropOldest
    bool dropped = false;
    if (chunk.size() >= max_bytes_) {
        // The new chunk alone fills the buffer: keep its last max_bytes_.
        dropped = total_ > 0 || chunk.size() > max_bytes_;
        chunks_.clear();
        front_offset_ = 0;
        total_ = 0;
        if (chunk.size() > max_bytes_) {
            chunk.erase(0, chunk.size() - max_bytes_);
        }
    } else if (total_ + chunk.size() > max_bytes_) {
        drop_front(total_ + chunk.size() - max_bytes_);
        dropped = true;
    }

    total_ += chunk.size();
    chunks_.push_back(std::move(chunk));
    if (dropped) {
        truncated_ = true;
        return AppendStatus::Truncated;
    }
    return AppendStatus::Appended;
}

void OutputBuffer::drop_front(size_t bytes) {
    while (bytes > 0 && !chunks_.empty()) {
        size_t avail = chunks_.front().size() - front_offset_;
        if (avail <= bytes) {
            bytes -= avail;
            total_ -= avail;
            chunks_.pop_front();
            front_offset_ = 0;
        } else {
            front_offset_ += bytes;
            total_ -= bytes;
            bytes = 0;
        }
    }
}

OutputBuffer::DrainResult OutputBuffer::drain() {
    DrainResult result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        result.truncated = truncated_;
        truncated_ = false;

        if (chunks_.size() == 1 && front_offset_ == 0) {
            result.data = std::move(chunks_.front());
        } else {
            result.data.reserve(total_);
            bool first = true;
            for (auto& c : chunks_) {
                if (first) {
                    result.data.append(c, front_offset_, std::string::npos);
                    first = false;
                } else {
                    result.data.append(c);
                }
            }
        }
        chunks_.clear();
        chunks_.shrink_to_fit();
        front_offset_ = 0;
        total_ = 0;
    }
    return result;
}

std::string OutputBuffer::tail(size_t max_bytes) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t want = std::min(max_bytes, total_);
    std::string out(want, '\0');
    size_t pos = want;
    for (auto it = chunks_.rbegin(); it != chunks_.rend() && pos > 0; ++it) {
        size_t begin = (std::next(it) == chunks_.rend()) ? front_offset_ : 0;
        size_t avail = it->size() - begin;
        size_t take = std::min(avail, pos);
        pos -= take;
        out.replace(pos, take, *it, it->size() - take, take);
    }
    return out;
}

size_t OutputBuffer::len() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_;
}

size_t OutputBuffer::space() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return max_bytes_ - total_;
}

bool OutputBuffer::full() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_ >= max_bytes_;
}

bool OutputBuffer::truncated() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return truncated_;
}

size_t OutputBuffer::chunk_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return chunks_.size();
}

void OutputBuffer::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
}

bool OutputBuffer::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}
