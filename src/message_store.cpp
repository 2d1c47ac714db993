#include "message_store.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

namespace chatgen {
namespace {

static std::string StringField(const nlohmann::json& j, const char* key) {
  if (!j.contains(key) || !j[key].is_string()) return {};
  return j[key].get<std::string>();
}

static void SortByCreation(std::vector<StoredMessage>* msgs) {
  std::stable_sort(msgs->begin(), msgs->end(), [](const StoredMessage& a, const StoredMessage& b) {
    return a.created_at_ms < b.created_at_ms;
  });
}

}  // namespace

nlohmann::json StoredMessageToJson(const StoredMessage& m) {
  nlohmann::json j;
  j["id"] = m.id;
  j["chat_id"] = m.chat_id;
  j["role"] = m.role;
  j["content"] = m.content;
  j["model_id"] = m.model_id;
  j["sub_mode"] = m.sub_mode.empty() ? nlohmann::json(nullptr) : nlohmann::json(m.sub_mode);
  j["tokens_per_second"] = m.tokens_per_second ? nlohmann::json(*m.tokens_per_second) : nlohmann::json(nullptr);
  j["created_at"] = m.created_at_ms;
  return j;
}

std::optional<StoredMessage> StoredMessageFromJson(const nlohmann::json& j) {
  if (!j.is_object()) return std::nullopt;
  StoredMessage m;
  m.id = StringField(j, "id");
  if (m.id.empty()) return std::nullopt;
  m.chat_id = StringField(j, "chat_id");
  m.role = StringField(j, "role");
  m.content = StringField(j, "content");
  m.model_id = StringField(j, "model_id");
  m.sub_mode = StringField(j, "sub_mode");
  if (j.contains("tokens_per_second") && j["tokens_per_second"].is_number()) {
    m.tokens_per_second = j["tokens_per_second"].get<double>();
  }
  if (j.contains("created_at") && j["created_at"].is_number_integer()) m.created_at_ms = j["created_at"].get<int64_t>();
  return m;
}

bool InMemoryMessageStore::InsertIfAbsent(const StoredMessage& msg, bool* inserted, std::string* err) {
  (void)err;
  std::lock_guard<std::mutex> lock(mu_);
  const bool fresh = by_id_.emplace(msg.id, msg).second;
  if (fresh) order_.push_back(msg.id);
  if (inserted) *inserted = fresh;
  return true;
}

std::optional<std::vector<StoredMessage>> InMemoryMessageStore::ListByChat(const std::string& chat_id,
                                                                           std::string* err) {
  (void)err;
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<StoredMessage> out;
  for (const auto& id : order_) {
    const auto& m = by_id_.at(id);
    if (m.chat_id == chat_id) out.push_back(m);
  }
  SortByCreation(&out);
  return out;
}

FileMessageStore::FileMessageStore(std::string path) : doc_(std::move(path)) {}

bool FileMessageStore::InsertIfAbsent(const StoredMessage& msg, bool* inserted, std::string* err) {
  bool fresh = false;
  const bool ok = doc_.Mutate(
      [&](nlohmann::json& doc) {
        auto& messages = doc["messages"];
        if (!messages.is_object()) messages = nlohmann::json::object();
        if (messages.contains(msg.id)) return false;
        messages[msg.id] = StoredMessageToJson(msg);
        fresh = true;
        return true;
      },
      err);
  if (inserted) *inserted = fresh;
  return ok;
}

std::optional<std::vector<StoredMessage>> FileMessageStore::ListByChat(const std::string& chat_id, std::string* err) {
  std::vector<StoredMessage> out;
  const bool ok = doc_.Read(
      [&](const nlohmann::json& doc) {
        if (!doc.contains("messages") || !doc["messages"].is_object()) return;
        for (const auto& item : doc["messages"]) {
          auto m = StoredMessageFromJson(item);
          if (m && m->chat_id == chat_id) out.push_back(std::move(*m));
        }
      },
      err);
  if (!ok) return std::nullopt;
  SortByCreation(&out);
  return out;
}

std::unique_ptr<IMessageStore> MakeMessageStore(const std::string& type, const std::string& path) {
  if (type == "file" && !path.empty()) {
    std::cout << "[store] messages type=file path=" << path << "\n";
    return std::make_unique<FileMessageStore>(path);
  }
  std::cout << "[store] messages type=memory\n";
  return std::make_unique<InMemoryMessageStore>();
}

}  // namespace chatgen
