#include "starmcp/server/sse_connection_manager.hpp"

#include "starmcp/exceptions.hpp"
#include "starmcp/server/sse_event.hpp"
#include "starmcp/util/log.hpp"

namespace starmcp::server
{

namespace
{
// Releases the connection on every exit path of run().
class ConnectionScope
{
  public:
    ConnectionScope(BroadcastHub& hub, std::shared_ptr<SseConnection> conn)
        : hub_(hub), conn_(std::move(conn))
    {
    }
    ~ConnectionScope()
    {
        hub_.remove(conn_->id());
        conn_->close();
        log::info("SSE connection closed: " + conn_->id());
    }

  private:
    BroadcastHub& hub_;
    std::shared_ptr<SseConnection> conn_;
};
} // namespace

SseConnectionManager::SseConnectionManager(BroadcastHub& hub,
                                           std::chrono::milliseconds heartbeat_interval)
    : hub_(hub), heartbeat_interval_(heartbeat_interval)
{
    if (heartbeat_interval_.count() <= 0)
        throw ValidationError("heartbeat interval must be positive");
}

std::shared_ptr<SseConnection> SseConnectionManager::open(SseConnection::Writer writer) const
{
    return std::make_shared<SseConnection>(generate_connection_id(), std::move(writer));
}

void SseConnectionManager::run(const std::shared_ptr<SseConnection>& conn)
{
    if (!conn)
        return;
    ConnectionScope scope(hub_, conn);

    if (!conn->write(sse::connected_frame()))
    {
        log::debug("SSE connection " + conn->id() + " failed before registration");
        return;
    }
    if (!hub_.add(conn))
    {
        log::debug("SSE connection " + conn->id() + " refused: hub closed");
        return;
    }
    log::info("SSE connection opened: " + conn->id());

    const std::string ping = sse::ping_frame();
    while (conn->wait_for(heartbeat_interval_))
    {
        if (!conn->write(ping))
        {
            log::debug("SSE heartbeat write failed: " + conn->id());
            break;
        }
        conn->touch_heartbeat();
    }
}

} // namespace starmcp::server
