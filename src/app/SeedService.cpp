#include "grace/app/SeedService.hpp"

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include <fstream>
#include <sstream>

namespace grace::app {

Result<std::vector<Document>> SeedService::parse(const std::string& json) {
  rapidjson::Document doc;
  doc.Parse(json.c_str(), json.size());
  if (doc.HasParseError()) {
    return Error{std::string("invalid JSON: ") + rapidjson::GetParseError_En(doc.GetParseError())
                 + " at offset " + std::to_string(doc.GetErrorOffset()), "seed"};
  }
  if (!doc.IsObject() || !doc.HasMember("documents") || !doc["documents"].IsArray()) {
    return Error{"missing \"documents\" array", "seed"};
  }

  std::vector<Document> out;
  const auto& arr = doc["documents"];
  out.reserve(arr.Size());
  for (rapidjson::SizeType i = 0; i < arr.Size(); ++i) {
    const auto& v = arr[i];
    const std::string where = "seed.documents[" + std::to_string(i) + "]";
    if (!v.IsObject()) return Error{"expected object", where};
    if (!v.HasMember("id") || !v["id"].IsString()) return Error{"missing string \"id\"", where};

    Document d;
    d.id = v["id"].GetString();
    if (v.HasMember("title") && v["title"].IsString()) d.title = v["title"].GetString();
    out.push_back(std::move(d));
  }
  return out;
}

Result<std::size_t> SeedService::initialize() {
  std::ifstream in(path_);
  if (!in) return Error{"cannot open seed file", path_};

  std::ostringstream ss;
  ss << in.rdbuf();

  auto parsed = parse(ss.str());
  if (!parsed) return parsed.error();

  std::lock_guard<std::mutex> lk(mx_);
  docs_ = std::move(parsed.value());
  return docs_.size();
}

std::vector<Document> SeedService::documents() const {
  std::lock_guard<std::mutex> lk(mx_);
  return docs_;
}

} // namespace grace::app
