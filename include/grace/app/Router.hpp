#pragma once

#include "grace/server/HttpServer.hpp"

#include <map>
#include <string>
#include <utility>

namespace grace::trace { class Tracer; }

namespace grace::app {

class SeedService;

// Exact-match routing on (method, path). The query string is ignored.
class Router {
public:
  using Verb = boost::beast::http::verb;

  void add(Verb verb, std::string path, server::Handler handler);

  server::Response operator()(const server::Request& req) const;

  static server::Response json(const server::Request& req,
                               boost::beast::http::status status,
                               std::string body);

private:
  std::map<std::pair<Verb, std::string>, server::Handler> routes_;
};

// Routes served by grace_server: /health, /metrics, /v1/documents.
// seeds may be null when seeding is disabled. Every request is traced.
server::Handler makeRoutes(trace::Tracer& tracer, const SeedService* seeds);

} // namespace grace::app
