#pragma once
#include "starmcp/server/broadcast_hub.hpp"
#include "starmcp/server/connection.hpp"

#include <chrono>
#include <memory>

namespace starmcp::server
{

/**
 * Drives the outbound side of an SSE stream.
 *
 * run() sends the `connected` event, registers the connection with the hub,
 * then writes a `ping` event every heartbeat interval until a write fails or the
 * connection is closed. The connection is always deregistered and closed before
 * run() returns. Nothing is ever read from the stream.
 */
class SseConnectionManager
{
  public:
    static constexpr std::chrono::milliseconds DEFAULT_HEARTBEAT_INTERVAL{30000};

    /// Throws ValidationError for a non-positive heartbeat interval.
    explicit SseConnectionManager(BroadcastHub& hub,
                                  std::chrono::milliseconds heartbeat_interval =
                                      DEFAULT_HEARTBEAT_INTERVAL);

    std::shared_ptr<SseConnection> open(SseConnection::Writer writer) const;

    /// Blocks for the lifetime of the stream.
    void run(const std::shared_ptr<SseConnection>& conn);

    std::chrono::milliseconds heartbeat_interval() const
    {
        return heartbeat_interval_;
    }

  private:
    BroadcastHub& hub_;
    std::chrono::milliseconds heartbeat_interval_;
};

} // namespace starmcp::server
