#pragma once

#include <nlohmann/json.hpp>

#include <functional>
#include <mutex>
#include <string>

namespace chatgen {

// A single JSON document on disk shared between processes. Every access re-reads the file under an advisory
// lock on "<path>.lock", so a server and a cron-driven reconciler see each other's writes.
class JsonFileDocument {
 public:
  explicit JsonFileDocument(std::string path);

  const std::string& path() const { return path_; }

  // Runs fn on the current document (an empty object when the file is missing). A mutator that returns
  // true has its document written back through "<path>.tmp" + rename.
  bool Mutate(const std::function<bool(nlohmann::json&)>& fn, std::string* err);
  bool Read(const std::function<void(const nlohmann::json&)>& fn, std::string* err);

 private:
  std::string path_;
  std::mutex mu_;

  bool Load(nlohmann::json* out, std::string* err) const;
  bool Persist(const nlohmann::json& doc, std::string* err) const;
};

}  // namespace chatgen
