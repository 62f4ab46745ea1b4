#include "grace/app/Router.hpp"
#include "grace/app/SeedService.hpp"
#include "grace/trace/Tracer.hpp"
#include "grace/util/Metrics.hpp"

#include <boost/beast/version.hpp>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <memory>

namespace grace::app {

namespace http = boost::beast::http;
using server::Request;
using server::Response;

void Router::add(Verb verb, std::string path, server::Handler handler) {
  routes_[{verb, std::move(path)}] = std::move(handler);
}

Response Router::json(const Request& req, http::status status, std::string body) {
  Response res{status, req.version()};
  res.set(http::field::server, BOOST_BEAST_VERSION_STRING);
  res.set(http::field::content_type, "application/json");
  res.body() = std::move(body);
  return res;
}

static std::string errorBody(const char* message) {
  rapidjson::StringBuffer buf;
  rapidjson::Writer<rapidjson::StringBuffer> w(buf);
  w.StartObject();
  w.Key("error"); w.String(message);
  w.EndObject();
  return buf.GetString();
}

Response Router::operator()(const Request& req) const {
  std::string path(req.target().data(), req.target().size());
  auto q = path.find('?');
  if (q != std::string::npos) path.resize(q);

  auto it = routes_.find({req.method(), path});
  if (it != routes_.end()) return it->second(req);

  // Distinguish unknown path from wrong method.
  for (const auto& kv : routes_) {
    if (kv.first.second == path) {
      return json(req, http::status::method_not_allowed, errorBody("method not allowed"));
    }
  }
  return json(req, http::status::not_found, errorBody("not found"));
}

server::Handler makeRoutes(trace::Tracer& tracer, const SeedService* seeds) {
  auto router = std::make_shared<Router>();

  router->add(http::verb::get, "/health", [](const Request& req) {
    return Router::json(req, http::status::ok, R"({"status":"ok"})");
  });

  router->add(http::verb::get, "/metrics", [](const Request& req) {
    auto& reg = util::MetricRegistry::instance();
    rapidjson::StringBuffer buf;
    rapidjson::Writer<rapidjson::StringBuffer> w(buf);
    w.StartObject();
    w.Key("counters");
    w.StartObject();
    for (const auto& kv : reg.snapshotCounters()) { w.Key(kv.first.c_str()); w.Double(kv.second); }
    w.EndObject();
    w.Key("gauges");
    w.StartObject();
    for (const auto& kv : reg.snapshotGauges()) { w.Key(kv.first.c_str()); w.Double(kv.second); }
    w.EndObject();
    w.EndObject();
    return Router::json(req, http::status::ok, buf.GetString());
  });

  router->add(http::verb::get, "/v1/documents", [seeds](const Request& req) {
    rapidjson::StringBuffer buf;
    rapidjson::Writer<rapidjson::StringBuffer> w(buf);
    w.StartObject();
    w.Key("documents");
    w.StartArray();
    if (seeds) {
      for (const auto& d : seeds->documents()) {
        w.StartObject();
        w.Key("id");    w.String(d.id.c_str());
        w.Key("title"); w.String(d.title.c_str());
        w.EndObject();
      }
    }
    w.EndArray();
    w.EndObject();
    return Router::json(req, http::status::ok, buf.GetString());
  });

  return [router, &tracer](const Request& req) {
    trace::Tracer::Scope span(tracer, "http.request");
    span.attr("method", std::string(req.method_string().data(), req.method_string().size()));
    span.attr("target", std::string(req.target().data(), req.target().size()));
    Response res = (*router)(req);
    span.attr("status", std::to_string(res.result_int()));
    return res;
  };
}

} // namespace grace::app
