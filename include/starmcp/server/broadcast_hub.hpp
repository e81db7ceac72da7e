#pragma once
#include "starmcp/server/connection.hpp"
#include "starmcp/types.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace starmcp::server
{

/**
 * Registry of open SSE connections with fan-out delivery.
 *
 * broadcast() serializes the message once, writes it to a snapshot of the
 * registered connections outside the registry lock, then removes exactly the
 * connections whose write failed. Connections added or removed while a
 * broadcast is writing are left alone.
 */
class BroadcastHub
{
  public:
    /// Returns false, and closes `conn`, when the hub has been closed by close_all().
    bool add(std::shared_ptr<SseConnection> conn);

    /// Returns false when no connection with that id is registered.
    bool remove(const std::string& id);

    size_t size() const;
    bool contains(const std::string& id) const;
    std::vector<std::string> connection_ids() const;

    /// Sends `message` as an unnamed SSE event. Returns the number of successful deliveries.
    size_t broadcast(const Json& message);

    /// Sends a preformatted SSE frame. Returns the number of successful deliveries.
    size_t broadcast_frame(const std::string& frame);

    /// Closes and forgets every connection. Later add() calls are refused until reopen().
    void close_all();
    void reopen();
    bool is_closed() const;

  private:
    std::vector<std::shared_ptr<SseConnection>> snapshot() const;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<SseConnection>> connections_;
    bool closed_{false};
};

} // namespace starmcp::server
