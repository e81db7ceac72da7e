#include "starmcp/server/session.hpp"

namespace starmcp::server
{

const char* to_string(SessionState state)
{
    switch (state)
    {
    case SessionState::Uninitialized:
        return "uninitialized";
    case SessionState::Initialized:
        return "initialized";
    }
    return "uninitialized";
}

void Session::record_initialize(const Json& client_capabilities)
{
    std::lock_guard<std::mutex> lock(mutex_);
    capabilities_ = client_capabilities.is_object() ? client_capabilities : Json::object();
}

void Session::mark_initialized()
{
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = SessionState::Initialized;
}

SessionState Session::state() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

Json Session::client_capabilities() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return capabilities_;
}

bool Session::has_client_capability(const std::string& name) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return capabilities_.contains(name);
}

} // namespace starmcp::server
