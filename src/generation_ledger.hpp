#pragma once

#include "json_file_store.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace chatgen {

enum class GenerationStatus {
  kStreaming,
  kCompleted,
  kError,
};

const char* GenerationStatusName(GenerationStatus s);
std::optional<GenerationStatus> ParseGenerationStatus(const std::string& s);

// One in-flight generation attempt. Times are unix milliseconds.
struct LedgerRow {
  std::string id;
  std::string chat_id;
  std::string model_id;
  std::string reasoning_effort;
  std::string sub_mode;
  GenerationStatus status = GenerationStatus::kStreaming;

  int64_t started_at_ms = 0;
  std::optional<int64_t> first_chunk_at_ms;
  std::optional<int64_t> completed_at_ms;
  int64_t last_update_at_ms = 0;

  std::string partial_text;
  std::string partial_reasoning;
  // Serialized ContentPart list, set once the generation completed.
  std::optional<nlohmann::json> content_snapshot;
  std::optional<double> tokens_per_second;
  std::optional<int64_t> total_tokens;
  std::optional<std::string> error;

  int64_t created_at_ms = 0;
};

nlohmann::json LedgerRowToJson(const LedgerRow& row);
std::optional<LedgerRow> LedgerRowFromJson(const nlohmann::json& j, std::string* err);

enum class LedgerCreateResult {
  kCreated,
  // Another streaming row for the chat exists; it is returned through *existing.
  kConflict,
  kFailed,
};

class ILedgerStore {
 public:
  virtual ~ILedgerStore() = default;

  // Inserts row unless the chat already has a streaming row. Check and insert are one atomic step.
  virtual LedgerCreateResult CreateIfNoStreaming(const LedgerRow& row, LedgerRow* existing, std::string* err) = 0;
  // Replaces the row with the same id. A missing row is left missing and *found is set false.
  virtual bool Update(const LedgerRow& row, bool* found, std::string* err) = 0;
  virtual bool Delete(const std::string& id, bool* deleted, std::string* err) = 0;
  // nullopt with empty err means no such row.
  virtual std::optional<LedgerRow> Get(const std::string& id, std::string* err) = 0;
  virtual std::optional<LedgerRow> FindStreaming(const std::string& chat_id, std::string* err) = 0;
  // Rows of any status whose last update is strictly before cutoff_ms.
  virtual std::optional<std::vector<LedgerRow>> ListStale(int64_t cutoff_ms, std::string* err) = 0;
};

class InMemoryLedgerStore : public ILedgerStore {
 public:
  LedgerCreateResult CreateIfNoStreaming(const LedgerRow& row, LedgerRow* existing, std::string* err) override;
  bool Update(const LedgerRow& row, bool* found, std::string* err) override;
  bool Delete(const std::string& id, bool* deleted, std::string* err) override;
  std::optional<LedgerRow> Get(const std::string& id, std::string* err) override;
  std::optional<LedgerRow> FindStreaming(const std::string& chat_id, std::string* err) override;
  std::optional<std::vector<LedgerRow>> ListStale(int64_t cutoff_ms, std::string* err) override;

 private:
  std::mutex mu_;
  std::map<std::string, LedgerRow> rows_;
};

// {"generations": {"<id>": {...}}}
class FileLedgerStore : public ILedgerStore {
 public:
  explicit FileLedgerStore(std::string path);

  LedgerCreateResult CreateIfNoStreaming(const LedgerRow& row, LedgerRow* existing, std::string* err) override;
  bool Update(const LedgerRow& row, bool* found, std::string* err) override;
  bool Delete(const std::string& id, bool* deleted, std::string* err) override;
  std::optional<LedgerRow> Get(const std::string& id, std::string* err) override;
  std::optional<LedgerRow> FindStreaming(const std::string& chat_id, std::string* err) override;
  std::optional<std::vector<LedgerRow>> ListStale(int64_t cutoff_ms, std::string* err) override;

 private:
  JsonFileDocument doc_;

  std::optional<std::vector<LedgerRow>> LoadRows(std::string* err);
};

std::unique_ptr<ILedgerStore> MakeLedgerStore(const std::string& type, const std::string& path);

}  // namespace chatgen
