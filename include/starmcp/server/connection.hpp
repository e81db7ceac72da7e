#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>

namespace starmcp::server
{

/**
 * One open SSE stream.
 *
 * Writes are serialized, so the heartbeat loop and broadcasts from other threads
 * may share a connection. The first failed write closes the connection; a closed
 * connection never calls its writer again, which keeps the underlying stream
 * untouched once the owning request handler has returned.
 */
class SseConnection
{
  public:
    /// Writes one complete frame; returns false when the peer is gone.
    using Writer = std::function<bool(const std::string&)>;
    using Clock = std::chrono::steady_clock;

    SseConnection(std::string id, Writer writer);
    SseConnection(const SseConnection&) = delete;
    SseConnection& operator=(const SseConnection&) = delete;

    const std::string& id() const
    {
        return id_;
    }

    bool write(const std::string& frame);

    /// Idempotent. Wakes a pending wait_for().
    void close();
    bool closed() const
    {
        return closed_.load();
    }

    /// Sleeps for `interval` unless closed first. Returns true when the full
    /// interval elapsed with the connection still open.
    bool wait_for(std::chrono::milliseconds interval);

    Clock::time_point last_heartbeat_at() const;
    void touch_heartbeat();

  private:
    void mark_closed();

    std::string id_;
    Writer writer_;
    std::atomic<bool> closed_{false};

    std::mutex write_mutex_;
    mutable std::mutex state_mutex_;
    std::condition_variable cv_;
    Clock::time_point last_heartbeat_at_;
};

/// 128-bit random hex identifier.
std::string generate_connection_id();

} // namespace starmcp::server
