#pragma once

#include "json_file_store.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace chatgen {

// A message as stored: content is the (possibly encrypted) serialized ContentPart list.
struct StoredMessage {
  std::string id;
  std::string chat_id;
  std::string role;
  std::string content;
  std::string model_id;
  std::string sub_mode;
  std::optional<double> tokens_per_second;
  int64_t created_at_ms = 0;
};

nlohmann::json StoredMessageToJson(const StoredMessage& m);
std::optional<StoredMessage> StoredMessageFromJson(const nlohmann::json& j);

class IMessageStore {
 public:
  virtual ~IMessageStore() = default;

  // Writes the message unless one with the same id exists. *inserted tells which happened.
  virtual bool InsertIfAbsent(const StoredMessage& msg, bool* inserted, std::string* err) = 0;
  // Oldest first.
  virtual std::optional<std::vector<StoredMessage>> ListByChat(const std::string& chat_id, std::string* err) = 0;
};

class InMemoryMessageStore : public IMessageStore {
 public:
  bool InsertIfAbsent(const StoredMessage& msg, bool* inserted, std::string* err) override;
  std::optional<std::vector<StoredMessage>> ListByChat(const std::string& chat_id, std::string* err) override;

 private:
  std::mutex mu_;
  std::unordered_map<std::string, StoredMessage> by_id_;
  std::vector<std::string> order_;
};

// {"messages": {"<id>": {...}}}
class FileMessageStore : public IMessageStore {
 public:
  explicit FileMessageStore(std::string path);

  bool InsertIfAbsent(const StoredMessage& msg, bool* inserted, std::string* err) override;
  std::optional<std::vector<StoredMessage>> ListByChat(const std::string& chat_id, std::string* err) override;

 private:
  JsonFileDocument doc_;
};

// type is "memory" or "file"; anything else falls back to memory.
std::unique_ptr<IMessageStore> MakeMessageStore(const std::string& type, const std::string& path);

}  // namespace chatgen
