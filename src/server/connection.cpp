#include "starmcp/server/connection.hpp"

#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>

namespace starmcp::server
{

SseConnection::SseConnection(std::string id, Writer writer)
    : id_(std::move(id)), writer_(std::move(writer)), last_heartbeat_at_(Clock::now())
{
}

bool SseConnection::write(const std::string& frame)
{
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (closed_)
        return false;

    bool ok = false;
    try
    {
        ok = writer_ && writer_(frame);
    }
    catch (const std::exception&)
    {
        ok = false;
    }
    if (!ok)
        mark_closed();
    return ok;
}

void SseConnection::close()
{
    std::lock_guard<std::mutex> lock(write_mutex_);
    mark_closed();
}

void SseConnection::mark_closed()
{
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool SseConnection::wait_for(std::chrono::milliseconds interval)
{
    std::unique_lock<std::mutex> lock(state_mutex_);
    cv_.wait_for(lock, interval, [this] { return closed_.load(); });
    return !closed_;
}

SseConnection::Clock::time_point SseConnection::last_heartbeat_at() const
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    return last_heartbeat_at_;
}

void SseConnection::touch_heartbeat()
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    last_heartbeat_at_ = Clock::now();
}

std::string generate_connection_id()
{
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dis;

    uint64_t high = dis(gen);
    uint64_t low = dis(gen);

    std::ostringstream oss;
    oss << std::hex << std::setfill('0') << std::setw(16) << high << std::setw(16) << low;
    return oss.str();
}

} // namespace starmcp::server
