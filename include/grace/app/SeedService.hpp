#pragma once

#include "grace/Result.hpp"

#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

namespace grace::app {

struct Document {
  std::string id;
  std::string title;
};

// Loads the sample document set served before real data exists.
// Expected file layout: {"documents":[{"id":"...","title":"..."}, ...]}
class SeedService {
public:
  explicit SeedService(std::string path) : path_(std::move(path)) {}

  // Number of documents loaded, or why nothing was loaded.
  Result<std::size_t> initialize();

  std::vector<Document> documents() const;

  // Parse a seed document; exposed for tests.
  static Result<std::vector<Document>> parse(const std::string& json);

private:
  std::string path_;

  mutable std::mutex    mx_;
  std::vector<Document> docs_;
};

} // namespace grace::app
