#include "persistence_gateway.hpp"

#include "telemetry_tracker.hpp"

#include <iostream>
#include <utility>

namespace chatgen {

std::optional<std::string> PassthroughCipher::Encrypt(const std::string& plaintext, const std::string& chat_id,
                                                      std::string* err) {
  (void)chat_id;
  (void)err;
  return plaintext;
}

std::optional<std::string> PassthroughCipher::Decrypt(const std::string& ciphertext, const std::string& chat_id,
                                                      std::string* err) {
  (void)chat_id;
  (void)err;
  return ciphertext;
}

PersistenceGateway::PersistenceGateway(IMessageStore* store, IContentCipher* cipher)
    : store_(store), cipher_(cipher ? cipher : &passthrough_) {}

bool PersistenceGateway::SaveMessage(const Message& msg, bool* inserted, std::string* err) {
  auto sealed = cipher_->Encrypt(ContentToJson(msg.content).dump(), msg.chat_id, err);
  if (!sealed) return false;

  StoredMessage row;
  row.id = msg.id;
  row.chat_id = msg.chat_id;
  row.role = msg.role;
  row.content = std::move(*sealed);
  row.model_id = msg.model_id;
  row.sub_mode = msg.sub_mode;
  row.tokens_per_second = RoundTokensPerSecond(msg.tokens_per_second);
  row.created_at_ms = msg.created_at_ms;

  bool fresh = false;
  if (!store_->InsertIfAbsent(row, &fresh, err)) return false;
  if (inserted) *inserted = fresh;
  std::cout << "[persist] message id=" << msg.id << " chat=" << msg.chat_id << " parts=" << msg.content.size()
            << " inserted=" << (fresh ? 1 : 0) << "\n";
  return true;
}

std::optional<Message> PersistenceGateway::Decode(const StoredMessage& stored, std::string* err) {
  auto plain = cipher_->Decrypt(stored.content, stored.chat_id, err);
  if (!plain) return std::nullopt;
  auto j = nlohmann::json::parse(*plain, nullptr, false);
  if (j.is_discarded()) {
    if (err) *err = "stored content is not json: " + stored.id;
    return std::nullopt;
  }
  auto content = ContentFromJson(j, err);
  if (!content) return std::nullopt;

  Message m;
  m.id = stored.id;
  m.chat_id = stored.chat_id;
  m.role = stored.role;
  m.content = std::move(*content);
  m.model_id = stored.model_id;
  m.sub_mode = stored.sub_mode;
  m.tokens_per_second = stored.tokens_per_second;
  m.created_at_ms = stored.created_at_ms;
  return m;
}

std::optional<std::vector<Message>> PersistenceGateway::ListMessages(const std::string& chat_id, std::string* err) {
  auto stored = store_->ListByChat(chat_id, err);
  if (!stored) return std::nullopt;
  std::vector<Message> out;
  out.reserve(stored->size());
  for (const auto& s : *stored) {
    auto m = Decode(s, err);
    if (!m) return std::nullopt;
    out.push_back(std::move(*m));
  }
  return out;
}

std::optional<Message> PersistenceGateway::LatestAssistantMessage(const std::string& chat_id, std::string* err) {
  auto stored = store_->ListByChat(chat_id, err);
  if (!stored) return std::nullopt;
  for (auto it = stored->rbegin(); it != stored->rend(); ++it) {
    if (it->role == "assistant") return Decode(*it, err);
  }
  return std::nullopt;
}

}  // namespace chatgen
