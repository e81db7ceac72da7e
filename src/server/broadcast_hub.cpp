#include "starmcp/server/broadcast_hub.hpp"

#include "starmcp/server/sse_event.hpp"
#include "starmcp/util/log.hpp"

namespace starmcp::server
{

bool BroadcastHub::add(std::shared_ptr<SseConnection> conn)
{
    if (!conn)
        return false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!closed_)
        {
            connections_[conn->id()] = std::move(conn);
            return true;
        }
    }
    conn->close();
    return false;
}

bool BroadcastHub::remove(const std::string& id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    return connections_.erase(id) > 0;
}

size_t BroadcastHub::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return connections_.size();
}

bool BroadcastHub::contains(const std::string& id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return connections_.count(id) != 0;
}

std::vector<std::string> BroadcastHub::connection_ids() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(connections_.size());
    for (const auto& [id, conn] : connections_)
        ids.push_back(id);
    return ids;
}

std::vector<std::shared_ptr<SseConnection>> BroadcastHub::snapshot() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<SseConnection>> out;
    out.reserve(connections_.size());
    for (const auto& [id, conn] : connections_)
        out.push_back(conn);
    return out;
}

size_t BroadcastHub::broadcast(const Json& message)
{
    return broadcast_frame(sse::format_data(message.dump()));
}

size_t BroadcastHub::broadcast_frame(const std::string& frame)
{
    auto targets = snapshot();
    if (targets.empty())
        return 0;

    size_t delivered = 0;
    std::vector<std::shared_ptr<SseConnection>> failed;
    for (const auto& conn : targets)
    {
        if (conn->write(frame))
            ++delivered;
        else
            failed.push_back(conn);
    }

    if (!failed.empty())
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& conn : failed)
        {
            // Only drop the entry we wrote to; the id may have been re-registered meanwhile.
            auto it = connections_.find(conn->id());
            if (it != connections_.end() && it->second == conn)
                connections_.erase(it);
        }
    }

    log::debug("broadcast delivered to " + std::to_string(delivered) + " connection(s), " +
               std::to_string(failed.size()) + " dropped");
    return delivered;
}

void BroadcastHub::close_all()
{
    std::unordered_map<std::string, std::shared_ptr<SseConnection>> closing;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        closing.swap(connections_);
    }
    for (auto& [id, conn] : closing)
        conn->close();
}

void BroadcastHub::reopen()
{
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = false;
}

bool BroadcastHub::is_closed() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

} // namespace starmcp::server
