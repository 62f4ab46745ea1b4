#pragma once

#include "grace/rt/IDrainable.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/http.hpp>

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace grace::server {

using Request  = boost::beast::http::request<boost::beast::http::string_body>;
using Response = boost::beast::http::response<boost::beast::http::string_body>;
using Handler  = std::function<Response(const Request&)>;

// HTTP/1.1 listener with graceful drain.
//
// start() binds synchronously and throws boost::system::system_error when the
// address is unusable; serving then runs on ioThreads background threads.
// shutdown() closes the acceptor, closes idle connections, and waits for
// busy ones to send their response.
//
// The lifecycle is one-way: Idle -> Serving -> Stopped. A shutdown() that
// runs before start() moves Idle straight to Stopped, and a later start()
// throws operation_aborted without binding.
class HttpServer : public rt::IDrainable {
public:
  explicit HttpServer(unsigned ioThreads = 2);
  ~HttpServer() override;

  HttpServer(const HttpServer&)            = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  void start(const std::string& host, unsigned short port, Handler handler);

  boost::system::error_code shutdown(const rt::Deadline& deadline) override;

  boost::asio::ip::tcp::endpoint localEndpoint() const;

  bool accepting() const { return accepting_.load(std::memory_order_acquire); }
  std::size_t connections() const;

private:
  class Session;

  void doAccept();
  void onAccept(boost::system::error_code ec, boost::asio::ip::tcp::socket socket);

  Response dispatch(const Request& req);
  void unregisterSession(Session* s);
  void stopIo();

private:
  using WorkGuard = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

  enum class Phase { Idle, Serving, Stopped };

  // Held across start()'s bind and thread spawn; guards phase_, endpoint_
  // and threads_ against a concurrent shutdown().
  mutable std::mutex lifecycleMu_;
  Phase              phase_{Phase::Idle};

  unsigned                       nThreads_;
  boost::asio::io_context        ioc_;
  std::optional<WorkGuard>       work_;
  boost::asio::ip::tcp::acceptor acceptor_;
  boost::asio::ip::tcp::endpoint endpoint_;
  std::vector<std::thread>       threads_;
  Handler                        handler_;

  std::atomic<bool> accepting_{false};

  mutable std::mutex      mu_;
  std::condition_variable drained_;
  std::unordered_map<Session*, std::weak_ptr<Session>> sessions_;
};

} // namespace grace::server
