#include "starmcp/server/sse_server.hpp"

#include "starmcp/mcp/jsonrpc.hpp"
#include "starmcp/util/json.hpp"
#include "starmcp/util/log.hpp"

#include <httplib.h>

namespace starmcp::server
{

SseServer::SseServer(mcp::McpHandler handler, ServerInfo info, std::string host, int port,
                     std::string sse_path, std::chrono::milliseconds heartbeat_interval,
                     std::string cors_origin, size_t max_streams)
    : handler_(std::move(handler)), info_(std::move(info)), host_(std::move(host)), port_(port),
      sse_path_(std::move(sse_path)), cors_origin_(std::move(cors_origin)),
      max_streams_(max_streams), manager_(hub_, heartbeat_interval)
{
}

SseServer::~SseServer()
{
    stop();
}

void SseServer::set_cors_headers(httplib::Response& res) const
{
    if (cors_origin_.empty())
        return;
    res.set_header("Access-Control-Allow-Origin", cors_origin_);
    res.set_header("Access-Control-Allow-Headers", "*");
    res.set_header("Access-Control-Allow-Methods", "*");
}

size_t SseServer::broadcast(const Json& message)
{
    return hub_.broadcast(message);
}

Json SseServer::health() const
{
    return Json{{"status", "healthy"},
                {"server", info_.name},
                {"version", info_.version},
                {"connections", hub_.size()}};
}

void SseServer::run_server()
{
    // Routes are already set up
    if (!svr_->listen(host_.c_str(), port_))
        log::error("failed to listen on " + host_ + ":" + std::to_string(port_));
    running_ = false;
}

bool SseServer::start()
{
    if (running_)
        return false;

    svr_ = std::make_unique<httplib::Server>();

    // Security: Set payload and timeout limits to prevent DoS
    svr_->set_payload_max_length(10 * 1024 * 1024); // 10MB max payload
    svr_->set_read_timeout(30, 0);                  // 30 second read timeout
    svr_->set_write_timeout(30, 0);                 // 30 second write timeout

    // One worker per stream plus a fixed set for short requests, so open streams
    // never starve POST /sse or /health.
    const size_t workers = max_streams_ + REQUEST_WORKERS;
    svr_->new_task_queue = [workers] { return new httplib::ThreadPool(workers); };

    // Event stream (GET)
    svr_->Get(sse_path_,
              [this](const httplib::Request&, httplib::Response& res)
              {
                  set_cors_headers(res);

                  if (!running_)
                  {
                      res.status = 503;
                      res.set_content("{\"error\":\"Server is shutting down\"}",
                                      "application/json");
                      return;
                  }

                  // Reserve a stream slot; released when the response is destroyed.
                  if (active_streams_.fetch_add(1) >= max_streams_)
                  {
                      active_streams_.fetch_sub(1);
                      log::warning("rejecting SSE connection: limit of " +
                                   std::to_string(max_streams_) + " reached");
                      res.status = 503;
                      res.set_content("{\"error\":\"Maximum connections reached\"}",
                                      "application/json");
                      return;
                  }
                  std::shared_ptr<void> slot(nullptr,
                                             [this](void*) { active_streams_.fetch_sub(1); });

                  res.status = 200;
                  res.set_header("Cache-Control", "no-cache");
                  res.set_header("Connection", "keep-alive");
                  res.set_header("X-Accel-Buffering", "no");

                  res.set_chunked_content_provider(
                      "text/event-stream",
                      [this, slot](size_t /*offset*/, httplib::DataSink& sink)
                      {
                          auto conn = manager_.open([&sink](const std::string& frame)
                                                    { return sink.write(frame.data(), frame.size()); });
                          // Blocks until the client goes away or the server stops; the
                          // connection is closed before the sink goes out of scope.
                          manager_.run(conn);
                          return false;
                      });
              });

    // JSON-RPC messages (POST)
    svr_->Post(sse_path_,
               [this](const httplib::Request& req, httplib::Response& res)
               {
                   set_cors_headers(res);

                   Json message;
                   try
                   {
                       message = util::json::parse(req.body);
                   }
                   catch (const Json::parse_error& e)
                   {
                       log::error(std::string("failed to parse POST body: ") + e.what());
                       auto envelope = mcp::make_error(Json(), mcp::ParseError,
                                                       std::string("Parse error: ") + e.what());
                       res.status = 400;
                       res.set_content(envelope.dump(), "application/json");
                       return;
                   }

                   if (log::enabled(log::Level::Debug))
                       log::debug("received MCP message: " + message.dump());

                   std::optional<Json> response;
                   try
                   {
                       response = handler_(message);
                   }
                   catch (const std::exception& e)
                   {
                       log::error(std::string("handler raised: ") + e.what());
                       response = mcp::make_error(mcp::request_id(message), mcp::InternalError,
                                                  std::string("Internal error: ") + e.what());
                   }

                   if (!response)
                   {
                       res.status = 204;
                       return;
                   }

                   if (log::enabled(log::Level::Debug))
                       log::debug("sending MCP response: " + response->dump());
                   res.status = 200;
                   res.set_content(response->dump(), "application/json");
               });

    svr_->Get("/health",
              [this](const httplib::Request&, httplib::Response& res)
              {
                  set_cors_headers(res);
                  res.status = 200;
                  res.set_content(health().dump(), "application/json");
              });

    // CORS preflight
    auto preflight = [this](const httplib::Request&, httplib::Response& res)
    {
        set_cors_headers(res);
        res.status = 204;
    };
    svr_->Options(sse_path_, preflight);
    svr_->Options("/health", preflight);

    hub_.reopen();
    running_ = true;

    thread_ = std::thread([this]() { run_server(); });

    // Wait until the listener answers, so callers can connect right away.
    for (int attempt = 0; attempt < 20; ++attempt)
    {
        if (!running_)
            break;
        httplib::Client ready_check(host_.c_str(), port_);
        ready_check.set_connection_timeout(std::chrono::seconds(2));
        ready_check.set_read_timeout(std::chrono::seconds(2));
        if (auto r = ready_check.Get("/health"); r && r->status == 200)
            break;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    if (!running_)
    {
        if (thread_.joinable())
            thread_.join();
        svr_.reset();
        return false;
    }

    log::info("SSE server listening on http://" + host_ + ":" + std::to_string(port_) +
              sse_path_);
    return true;
}

void SseServer::stop()
{
    // Graceful, idempotent shutdown
    running_ = false;
    // Wake every heartbeat loop so the worker threads can finish. The hub stays
    // closed, so a stream that races past the running_ check is refused at add().
    hub_.close_all();
    if (svr_)
        svr_->stop();
    if (thread_.joinable())
        thread_.join();
    svr_.reset();
}

} // namespace starmcp::server
