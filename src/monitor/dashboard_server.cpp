#include "monitor/dashboard_server.h"

#include <atomic>
#include <chrono>
#include <utility>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "core/json_utils.h"
#include "core/log.h"

namespace hydra {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

struct DashboardServer::Impl {
  asio::io_context ioc;
  tcp::acceptor acceptor{ioc};
};

DashboardServer::DashboardServer(DashboardConfig config,
                                 const SnapshotStore* store)
    : config_(std::move(config)), store_(store) {}

DashboardServer::~DashboardServer() {
  Stop();
}

DashboardResponse DashboardServer::HandleRequest(const std::string& method,
                                                 const std::string& target,
                                                 const SnapshotStore& store) {
  DashboardResponse response;
  const std::string path = target.substr(0, target.find('?'));
  if (path != "/api/snapshot" && path != "/api/health") {
    response.status = 404;
    response.body = "{\"error\":\"not found\"}";
    return response;
  }
  if (method != "GET") {
    response.status = 405;
    response.body = "{\"error\":\"method not allowed\"}";
    return response;
  }
  if (path == "/api/health") {
    JsonWriter writer;
    writer.BeginObject()
        .Key("status").String("ok")
        .Key("has_snapshot").Bool(store.has_snapshot())
        .EndObject();
    response.body = writer.str();
    return response;
  }
  if (!store.has_snapshot()) {
    response.status = 503;
    response.body = "{\"error\":\"no snapshot yet\"}";
    return response;
  }
  response.body = DashboardSnapshotToJson(store.Latest());
  return response;
}

bool DashboardServer::Start(std::string* out_error) {
  if (worker_.joinable()) {
    return true;
  }
  if (store_ == nullptr) {
    if (out_error != nullptr) *out_error = "snapshot store 为空";
    return false;
  }
  impl_ = std::make_unique<Impl>();
  beast::error_code ec;
  const auto address = asio::ip::make_address(config_.bind_address, ec);
  if (ec) {
    if (out_error != nullptr) *out_error = "bind_address 非法: " + ec.message();
    return false;
  }
  const tcp::endpoint endpoint(address, static_cast<unsigned short>(config_.port));
  impl_->acceptor.open(endpoint.protocol(), ec);
  if (!ec) impl_->acceptor.set_option(asio::socket_base::reuse_address(true), ec);
  if (!ec) impl_->acceptor.bind(endpoint, ec);
  if (!ec) impl_->acceptor.listen(asio::socket_base::max_listen_connections, ec);
  if (!ec) impl_->acceptor.non_blocking(true, ec);
  if (ec) {
    if (out_error != nullptr) {
      *out_error = "dashboard 监听失败: " + ec.message();
    }
    impl_.reset();
    return false;
  }
  bound_port_ = impl_->acceptor.local_endpoint(ec).port();
  running_ = true;
  worker_ = std::thread(&DashboardServer::ServeLoop, this);
  LogInfo("DASHBOARD_LISTENING: address=" + config_.bind_address +
          ", port=" + std::to_string(bound_port_));
  return true;
}

void DashboardServer::Stop() {
  running_ = false;
  if (worker_.joinable()) {
    worker_.join();
  }
  if (impl_ != nullptr) {
    beast::error_code ec;
    impl_->acceptor.close(ec);
    impl_.reset();
  }
}

namespace {

// 以 50ms 为片驱动 io_context，直到异步操作完成或服务停止。
bool DriveUntil(asio::io_context& ioc, const bool& done,
                const std::atomic<bool>& running) {
  ioc.restart();
  while (!done && running.load()) {
    ioc.run_for(std::chrono::milliseconds(50));
    if (ioc.stopped()) {
      ioc.restart();
    }
  }
  return done;
}

// 取消未完成的操作并排空其回调。
void Abandon(asio::io_context& ioc, beast::tcp_stream& stream) {
  beast::error_code ec;
  stream.socket().cancel(ec);
  stream.socket().close(ec);
  ioc.restart();
  ioc.run_for(std::chrono::milliseconds(100));
}

}  // namespace

void DashboardServer::ServeLoop() {
  const auto io_timeout = std::chrono::milliseconds(config_.io_timeout_ms);
  while (running_.load()) {
    tcp::socket socket(impl_->ioc);
    beast::error_code ec;
    impl_->acceptor.accept(socket, ec);
    if (ec == asio::error::would_block || ec == asio::error::try_again) {
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
      continue;
    }
    if (ec) {
      LogError("DASHBOARD_ACCEPT_FAILED: error=" + ec.message());
      continue;
    }

    beast::tcp_stream stream(std::move(socket));
    beast::flat_buffer buffer;
    http::request<http::string_body> request;
    bool read_done = false;
    stream.expires_after(io_timeout);
    http::async_read(stream, buffer, request,
                     [&](beast::error_code read_ec, std::size_t) {
                       ec = read_ec;
                       read_done = true;
                     });
    if (!DriveUntil(impl_->ioc, read_done, running_)) {
      Abandon(impl_->ioc, stream);
      continue;
    }
    if (ec) {
      if (ec == beast::error::timeout) {
        LogInfo("DASHBOARD_CLIENT_TIMEOUT: io_timeout_ms=" +
                std::to_string(config_.io_timeout_ms));
      }
      Abandon(impl_->ioc, stream);
      continue;
    }
    const DashboardResponse routed =
        HandleRequest(std::string(request.method_string()),
                      std::string(request.target()), *store_);

    http::response<http::string_body> response;
    response.version(request.version());
    response.keep_alive(false);
    response.result(static_cast<http::status>(routed.status));
    response.set(http::field::server, "hydra");
    response.set(http::field::content_type, routed.content_type);
    response.body() = routed.body;
    response.prepare_payload();

    bool write_done = false;
    stream.expires_after(io_timeout);
    http::async_write(stream, response,
                      [&](beast::error_code write_ec, std::size_t) {
                        ec = write_ec;
                        write_done = true;
                      });
    if (!DriveUntil(impl_->ioc, write_done, running_)) {
      Abandon(impl_->ioc, stream);
      continue;
    }
    if (ec) {
      LogError("DASHBOARD_WRITE_FAILED: error=" + ec.message());
    }
    stream.socket().shutdown(tcp::socket::shutdown_send, ec);
  }
}

}  // namespace hydra
