#pragma once

#include "content_assembler.hpp"
#include "message_store.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace chatgen {

// Content-at-rest encryption is supplied by the embedding deployment; keys are scoped per chat.
class IContentCipher {
 public:
  virtual ~IContentCipher() = default;
  virtual std::optional<std::string> Encrypt(const std::string& plaintext, const std::string& chat_id,
                                             std::string* err) = 0;
  virtual std::optional<std::string> Decrypt(const std::string& ciphertext, const std::string& chat_id,
                                             std::string* err) = 0;
};

class PassthroughCipher : public IContentCipher {
 public:
  std::optional<std::string> Encrypt(const std::string& plaintext, const std::string& chat_id,
                                     std::string* err) override;
  std::optional<std::string> Decrypt(const std::string& ciphertext, const std::string& chat_id,
                                     std::string* err) override;
};

struct Message {
  std::string id;
  std::string chat_id;
  std::string role = "assistant";
  std::vector<ContentPart> content;
  std::string model_id;
  std::string sub_mode;
  std::optional<double> tokens_per_second;
  int64_t created_at_ms = 0;
};

class PersistenceGateway {
 public:
  // cipher may be null, meaning pass-through.
  PersistenceGateway(IMessageStore* store, IContentCipher* cipher);

  // Idempotent by message id. An empty content list is a valid message. tokens_per_second is stored rounded
  // to one decimal, absent when it rounds to zero. *inserted is false when the id was already stored.
  bool SaveMessage(const Message& msg, bool* inserted, std::string* err);

  std::optional<std::vector<Message>> ListMessages(const std::string& chat_id, std::string* err);
  // nullopt with empty err means the chat has no assistant message yet.
  std::optional<Message> LatestAssistantMessage(const std::string& chat_id, std::string* err);

 private:
  IMessageStore* store_;
  IContentCipher* cipher_;
  PassthroughCipher passthrough_;

  std::optional<Message> Decode(const StoredMessage& stored, std::string* err);
};

}  // namespace chatgen
