#include "grace/server/HttpServer.hpp"
#include "grace/util/Logger.hpp"
#include "grace/util/Metrics.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/version.hpp>

#include <chrono>
#include <utility>

namespace grace::server {

using tcp = boost::asio::ip::tcp;
namespace beast = boost::beast;
namespace http  = boost::beast::http;

using util::logger;
using util::LogLevel;

namespace {
constexpr auto kIdleTimeout  = std::chrono::seconds(30);
constexpr auto kWriteTimeout = std::chrono::seconds(30);
} // namespace

// ---------------------- Session ----------------------
class HttpServer::Session : public std::enable_shared_from_this<Session> {
public:
  Session(tcp::socket socket, HttpServer* owner)
    : stream_(std::move(socket))
    , owner_(owner)
  {}

  void run() {
    boost::asio::dispatch(stream_.get_executor(),
                          [self = shared_from_this()]{ self->doRead(); });
  }

  // Close now if idle; otherwise after the current response is written.
  void requestClose() {
    boost::asio::post(stream_.get_executor(), [self = shared_from_this()]{
      self->closeRequested_ = true;
      if (!self->busy_) self->doClose();
    });
  }

private:
  void doRead() {
    req_ = {};
    stream_.expires_after(kIdleTimeout);
    http::async_read(stream_, buffer_, req_,
        [self = shared_from_this()](beast::error_code ec, std::size_t) {
          self->onRead(ec);
        });
  }

  void onRead(beast::error_code ec) {
    if (ec) {
      if (ec != http::error::end_of_stream &&
          ec != boost::asio::error::operation_aborted &&
          ec != beast::error::timeout) {
        logger().log(LogLevel::Debug, "http.read.error", {{"error", ec.message()}});
      }
      doClose();
      return;
    }

    busy_ = true;
    auto res = std::make_shared<Response>(owner_->dispatch(req_));
    res->keep_alive(req_.keep_alive() && !closeRequested_ && owner_->accepting());
    res->prepare_payload();

    stream_.expires_after(kWriteTimeout);
    http::async_write(stream_, *res,
        [self = shared_from_this(), res](beast::error_code ec, std::size_t) {
          self->onWrite(ec, !res->keep_alive());
        });
  }

  void onWrite(beast::error_code ec, bool close) {
    busy_ = false;
    if (ec) {
      logger().log(LogLevel::Debug, "http.write.error", {{"error", ec.message()}});
    }
    if (ec || close || closeRequested_) {
      doClose();
      return;
    }
    doRead();
  }

  void doClose() {
    if (closed_) return;
    closed_ = true;
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    stream_.close();
    owner_->unregisterSession(this);
  }

private:
  beast::tcp_stream  stream_;
  beast::flat_buffer buffer_;
  Request            req_;
  HttpServer*        owner_{nullptr}; // not owned

  // Touched only on the session strand.
  bool busy_{false};
  bool closeRequested_{false};
  bool closed_{false};
};

// ---------------------- HttpServer ----------------------

HttpServer::HttpServer(unsigned ioThreads)
  : nThreads_(ioThreads == 0 ? 1 : ioThreads)
  , acceptor_(ioc_)
{}

HttpServer::~HttpServer() {
  accepting_.store(false, std::memory_order_release);
  stopIo();
}

void HttpServer::start(const std::string& host, unsigned short port, Handler handler) {
  std::lock_guard<std::mutex> life(lifecycleMu_);
  if (phase_ == Phase::Serving) {
    throw boost::system::system_error(boost::asio::error::already_started, "http server start");
  }
  if (phase_ == Phase::Stopped) {
    logger().log(LogLevel::Info, "server.start.refused", {{"reason", "already shut down"}});
    throw boost::system::system_error(boost::asio::error::operation_aborted, "http server start");
  }
  handler_ = std::move(handler);

  boost::system::error_code ec;
  const std::string where = host + ":" + std::to_string(port);

  auto fail = [&](const char* op) {
    boost::system::error_code ignored;
    acceptor_.close(ignored);
    logger().log(LogLevel::Error, "server.start.failed",
                 {{"op", op}, {"address", where}, {"error", ec.message()}});
    throw boost::system::system_error(ec, std::string(op) + " " + where);
  };

  const auto addr = boost::asio::ip::make_address(host, ec);
  if (ec) fail("resolve");
  const tcp::endpoint ep{addr, port};

  acceptor_.open(ep.protocol(), ec);
  if (ec) fail("open");

  acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
  if (ec) fail("set_option");

  acceptor_.bind(ep, ec);
  if (ec) fail("bind");

  acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
  if (ec) fail("listen");

  endpoint_ = acceptor_.local_endpoint(ec);
  if (ec) fail("local_endpoint");

  phase_ = Phase::Serving;
  accepting_.store(true, std::memory_order_release);
  doAccept();

  work_.emplace(ioc_.get_executor());
  threads_.reserve(nThreads_);
  for (unsigned i = 0; i < nThreads_; ++i) {
    threads_.emplace_back([this]{
      for (;;) {
        try {
          ioc_.run();
          return;
        } catch (const std::exception& ex) {
          logger().log(LogLevel::Error, "server.io.exception", {{"error", ex.what()}});
        }
      }
    });
  }

  logger().log(LogLevel::Info, "server.listening",
               {{"address", endpoint_.address().to_string()},
                {"port", std::to_string(endpoint_.port())},
                {"threads", std::to_string(nThreads_)}});
}

boost::system::error_code HttpServer::shutdown(const rt::Deadline& deadline) {
  {
    std::lock_guard<std::mutex> life(lifecycleMu_);
    const Phase was = phase_;
    phase_ = Phase::Stopped;
    if (was != Phase::Serving) {
      accepting_.store(false, std::memory_order_release);
      logger().log(LogLevel::Info, "server.drain.skipped", {{"reason", "not serving"}});
      return {};
    }
  }

  std::vector<std::shared_ptr<Session>> toClose;
  {
    std::lock_guard<std::mutex> lk(mu_);
    accepting_.store(false, std::memory_order_release);
    toClose.reserve(sessions_.size());
    for (auto& kv : sessions_) {
      if (auto sp = kv.second.lock()) toClose.emplace_back(std::move(sp));
    }
  }

  // The acceptor belongs to the I/O threads.
  boost::asio::post(ioc_, [this]{
    boost::system::error_code ignored;
    acceptor_.cancel(ignored);
    acceptor_.close(ignored);
  });

  logger().log(LogLevel::Info, "server.drain", {{"connections", std::to_string(toClose.size())}});
  for (auto& s : toClose) s->requestClose();
  toClose.clear();

  std::unique_lock<std::mutex> lk(mu_);
  const bool drained = drained_.wait_until(lk, deadline.timePoint(),
                                           [this]{ return sessions_.empty(); });
  if (!drained) {
    logger().log(LogLevel::Error, "server.drain.timeout",
                 {{"remaining", std::to_string(sessions_.size())}});
    return boost::asio::error::timed_out;
  }
  lk.unlock();

  stopIo();
  return {};
}

tcp::endpoint HttpServer::localEndpoint() const {
  std::lock_guard<std::mutex> life(lifecycleMu_);
  return endpoint_;
}

std::size_t HttpServer::connections() const {
  std::lock_guard<std::mutex> lk(mu_);
  return sessions_.size();
}

void HttpServer::doAccept() {
  acceptor_.async_accept(
      boost::asio::make_strand(ioc_),
      [this](boost::system::error_code ec, tcp::socket socket) {
        onAccept(ec, std::move(socket));
      });
}

void HttpServer::onAccept(boost::system::error_code ec, tcp::socket socket) {
  if (ec == boost::asio::error::operation_aborted || !accepting()) return;

  if (ec) {
    logger().log(LogLevel::Warn, "server.accept.error", {{"error", ec.message()}});
  } else {
    auto session = std::make_shared<Session>(std::move(socket), this);
    bool registered = false;
    {
      std::lock_guard<std::mutex> lk(mu_);
      if (accepting()) {
        sessions_[session.get()] = session;
        registered = true;
        GRACE_METRIC_SET("http.connections", static_cast<double>(sessions_.size()));
      }
    }
    if (registered) {
      GRACE_METRIC_HIT("http.accepted");
      session->run();
    }
  }

  doAccept();
}

Response HttpServer::dispatch(const Request& req) {
  GRACE_METRIC_HIT("http.requests");
  try {
    return handler_(req);
  } catch (const std::exception& ex) {
    GRACE_METRIC_HIT("http.handler_errors");
    logger().log(LogLevel::Error, "http.handler.exception",
                 {{"target", std::string(req.target().data(), req.target().size())},
                  {"error", ex.what()}});
  }

  Response res{http::status::internal_server_error, req.version()};
  res.set(http::field::server, BOOST_BEAST_VERSION_STRING);
  res.set(http::field::content_type, "text/plain");
  res.body() = "internal server error";
  return res;
}

void HttpServer::unregisterSession(Session* s) {
  bool empty = false;
  {
    std::lock_guard<std::mutex> lk(mu_);
    sessions_.erase(s);
    empty = sessions_.empty();
    GRACE_METRIC_SET("http.connections", static_cast<double>(sessions_.size()));
  }
  if (empty) drained_.notify_all();
}

void HttpServer::stopIo() {
  work_.reset();
  ioc_.stop();
  for (auto& t : threads_) {
    if (t.joinable()) t.join();
  }
  threads_.clear();

  // I/O threads are gone; the acceptor can be closed from here.
  boost::system::error_code ignored;
  acceptor_.close(ignored);
}

} // namespace grace::server
