#pragma once
#include "starmcp/types.hpp"

#include <mutex>

namespace starmcp::server
{

enum class SessionState
{
    Uninitialized,
    Initialized,
};

const char* to_string(SessionState state);

/**
 * Initialization lifecycle of one MCP client session.
 *
 * `initialize` stores the client's declared capabilities without changing state.
 * The `initialized` notification moves the session to Initialized; there is no
 * way back. Other methods are not gated on state.
 *
 * Thread-safe: the HTTP server handles POSTs on a worker pool.
 */
class Session
{
  public:
    Session() = default;
    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    void record_initialize(const Json& client_capabilities);
    void mark_initialized();

    SessionState state() const;
    bool initialized() const
    {
        return state() == SessionState::Initialized;
    }

    Json client_capabilities() const;
    bool has_client_capability(const std::string& name) const;

  private:
    mutable std::mutex mutex_;
    SessionState state_{SessionState::Uninitialized};
    Json capabilities_ = Json::object();
};

} // namespace starmcp::server
