#pragma once
#include "starmcp/mcp/handler.hpp"
#include "starmcp/server/broadcast_hub.hpp"
#include "starmcp/server/sse_connection_manager.hpp"
#include "starmcp/types.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

namespace httplib
{
class Server;
class Response;
} // namespace httplib

namespace starmcp::server
{

/**
 * HTTP front end for the MCP-over-SSE protocol.
 *
 * Routes:
 * - GET  <sse_path>  opens an event stream: `connected`, then `ping` every heartbeat interval;
 *                    503 once max_streams streams are open or the server is stopping
 * - POST <sse_path>  one JSON-RPC message per request; 200 with the envelope, 204 for
 *                    notifications, 400 with a -32700 envelope for bodies that are not JSON
 * - GET  /health     status object
 * - OPTIONS on both  CORS preflight
 *
 * Responses go back in the POST body; the stream only carries keepalives and
 * whatever is pushed through broadcast().
 *
 * Usage:
 *   auto handler = starmcp::mcp::make_mcp_handler(info, tools, session);
 *   SseServer server(handler, info, "127.0.0.1", 38000);
 *   server.start();  // Non-blocking - runs in background thread
 *   // ... server runs ...
 *   server.stop();   // Graceful shutdown
 */
class SseServer
{
  public:
    /**
     * @param handler JSON-RPC dispatcher
     * @param info Name and version reported by /health
     * @param host Host address to bind to
     * @param port Port to listen on
     * @param sse_path Path serving both the stream (GET) and messages (POST)
     * @param heartbeat_interval Delay between `ping` events
     * @param cors_origin Value for Access-Control-Allow-Origin (empty = no CORS headers)
     * @param max_streams Open event streams allowed at once; further GETs get 503
     */
    SseServer(mcp::McpHandler handler, ServerInfo info, std::string host = "127.0.0.1",
              int port = 38000, std::string sse_path = "/sse",
              std::chrono::milliseconds heartbeat_interval =
                  SseConnectionManager::DEFAULT_HEARTBEAT_INTERVAL,
              std::string cors_origin = "*", size_t max_streams = DEFAULT_MAX_STREAMS);

    static constexpr size_t DEFAULT_MAX_STREAMS = 100;
    /// Workers reserved for POST, /health and preflight requests.
    static constexpr size_t REQUEST_WORKERS = 8;

    ~SseServer();

    /**
     * Start the server in background (non-blocking).
     *
     * @return false if already running
     */
    bool start();

    /**
     * Stop the server. Closes every open stream and joins the listener thread.
     * Safe to call multiple times.
     */
    void stop();

    bool running() const
    {
        return running_.load();
    }
    int port() const
    {
        return port_;
    }
    const std::string& host() const
    {
        return host_;
    }
    const std::string& sse_path() const
    {
        return sse_path_;
    }

    /// Pushes `message` to every open stream, dropping streams that fail.
    size_t broadcast(const Json& message);

    size_t connection_count() const
    {
        return hub_.size();
    }

    Json health() const;

  private:
    void run_server();
    void set_cors_headers(httplib::Response& res) const;

    mcp::McpHandler handler_;
    ServerInfo info_;
    std::string host_;
    int port_;
    std::string sse_path_;
    std::string cors_origin_;
    size_t max_streams_;
    std::atomic<size_t> active_streams_{0};

    BroadcastHub hub_;
    SseConnectionManager manager_;

    std::unique_ptr<httplib::Server> svr_;
    std::thread thread_;
    std::atomic<bool> running_{false};
};

} // namespace starmcp::server
