#include "generation_ledger.hpp"

#include <iostream>
#include <utility>

namespace chatgen {
namespace {

static std::string StringField(const nlohmann::json& j, const char* key) {
  if (!j.contains(key) || !j[key].is_string()) return {};
  return j[key].get<std::string>();
}

static std::optional<int64_t> OptionalMillis(const nlohmann::json& j, const char* key) {
  if (!j.contains(key) || !j[key].is_number_integer()) return std::nullopt;
  return j[key].get<int64_t>();
}

template <class T>
static nlohmann::json OrNull(const std::optional<T>& v) {
  return v ? nlohmann::json(*v) : nlohmann::json(nullptr);
}

static nlohmann::json& GenerationsOf(nlohmann::json& doc) {
  auto& g = doc["generations"];
  if (!g.is_object()) g = nlohmann::json::object();
  return g;
}

}  // namespace

const char* GenerationStatusName(GenerationStatus s) {
  switch (s) {
    case GenerationStatus::kStreaming:
      return "streaming";
    case GenerationStatus::kCompleted:
      return "completed";
    case GenerationStatus::kError:
      return "error";
  }
  return "error";
}

std::optional<GenerationStatus> ParseGenerationStatus(const std::string& s) {
  if (s == "streaming") return GenerationStatus::kStreaming;
  if (s == "completed") return GenerationStatus::kCompleted;
  if (s == "error") return GenerationStatus::kError;
  return std::nullopt;
}

nlohmann::json LedgerRowToJson(const LedgerRow& row) {
  nlohmann::json j;
  j["id"] = row.id;
  j["chat_id"] = row.chat_id;
  j["model_id"] = row.model_id;
  j["reasoning_effort"] = row.reasoning_effort;
  j["sub_mode"] = row.sub_mode;
  j["status"] = GenerationStatusName(row.status);
  j["started_at"] = row.started_at_ms;
  j["first_chunk_at"] = OrNull(row.first_chunk_at_ms);
  j["completed_at"] = OrNull(row.completed_at_ms);
  j["last_update_at"] = row.last_update_at_ms;
  j["partial_text"] = row.partial_text;
  j["partial_reasoning"] = row.partial_reasoning;
  j["content_snapshot"] = row.content_snapshot ? *row.content_snapshot : nlohmann::json(nullptr);
  j["tokens_per_second"] = OrNull(row.tokens_per_second);
  j["total_tokens"] = OrNull(row.total_tokens);
  j["error"] = OrNull(row.error);
  j["created_at"] = row.created_at_ms;
  return j;
}

std::optional<LedgerRow> LedgerRowFromJson(const nlohmann::json& j, std::string* err) {
  if (!j.is_object()) {
    if (err) *err = "ledger row is not an object";
    return std::nullopt;
  }
  LedgerRow row;
  row.id = StringField(j, "id");
  if (row.id.empty()) {
    if (err) *err = "ledger row has no id";
    return std::nullopt;
  }
  auto status = ParseGenerationStatus(StringField(j, "status"));
  if (!status) {
    if (err) *err = "ledger row " + row.id + " has unknown status";
    return std::nullopt;
  }
  row.status = *status;
  row.chat_id = StringField(j, "chat_id");
  row.model_id = StringField(j, "model_id");
  row.reasoning_effort = StringField(j, "reasoning_effort");
  row.sub_mode = StringField(j, "sub_mode");
  row.started_at_ms = OptionalMillis(j, "started_at").value_or(0);
  row.first_chunk_at_ms = OptionalMillis(j, "first_chunk_at");
  row.completed_at_ms = OptionalMillis(j, "completed_at");
  row.last_update_at_ms = OptionalMillis(j, "last_update_at").value_or(row.started_at_ms);
  row.partial_text = StringField(j, "partial_text");
  row.partial_reasoning = StringField(j, "partial_reasoning");
  if (j.contains("content_snapshot") && j["content_snapshot"].is_array()) row.content_snapshot = j["content_snapshot"];
  if (j.contains("tokens_per_second") && j["tokens_per_second"].is_number()) {
    row.tokens_per_second = j["tokens_per_second"].get<double>();
  }
  row.total_tokens = OptionalMillis(j, "total_tokens");
  if (j.contains("error") && j["error"].is_string()) row.error = j["error"].get<std::string>();
  row.created_at_ms = OptionalMillis(j, "created_at").value_or(row.started_at_ms);
  return row;
}

LedgerCreateResult InMemoryLedgerStore::CreateIfNoStreaming(const LedgerRow& row, LedgerRow* existing,
                                                            std::string* err) {
  std::lock_guard<std::mutex> lock(mu_);
  for (const auto& [id, r] : rows_) {
    if (r.chat_id == row.chat_id && r.status == GenerationStatus::kStreaming) {
      if (existing) *existing = r;
      return LedgerCreateResult::kConflict;
    }
  }
  if (!rows_.emplace(row.id, row).second) {
    if (err) *err = "duplicate generation id " + row.id;
    return LedgerCreateResult::kFailed;
  }
  return LedgerCreateResult::kCreated;
}

bool InMemoryLedgerStore::Update(const LedgerRow& row, bool* found, std::string* err) {
  (void)err;
  std::lock_guard<std::mutex> lock(mu_);
  auto it = rows_.find(row.id);
  if (found) *found = it != rows_.end();
  if (it != rows_.end()) it->second = row;
  return true;
}

bool InMemoryLedgerStore::Delete(const std::string& id, bool* deleted, std::string* err) {
  (void)err;
  std::lock_guard<std::mutex> lock(mu_);
  const bool erased = rows_.erase(id) > 0;
  if (deleted) *deleted = erased;
  return true;
}

std::optional<LedgerRow> InMemoryLedgerStore::Get(const std::string& id, std::string* err) {
  (void)err;
  std::lock_guard<std::mutex> lock(mu_);
  auto it = rows_.find(id);
  if (it == rows_.end()) return std::nullopt;
  return it->second;
}

std::optional<LedgerRow> InMemoryLedgerStore::FindStreaming(const std::string& chat_id, std::string* err) {
  (void)err;
  std::lock_guard<std::mutex> lock(mu_);
  for (const auto& [id, r] : rows_) {
    if (r.chat_id == chat_id && r.status == GenerationStatus::kStreaming) return r;
  }
  return std::nullopt;
}

std::optional<std::vector<LedgerRow>> InMemoryLedgerStore::ListStale(int64_t cutoff_ms, std::string* err) {
  (void)err;
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<LedgerRow> out;
  for (const auto& [id, r] : rows_) {
    if (r.last_update_at_ms < cutoff_ms) out.push_back(r);
  }
  return out;
}

FileLedgerStore::FileLedgerStore(std::string path) : doc_(std::move(path)) {}

std::optional<std::vector<LedgerRow>> FileLedgerStore::LoadRows(std::string* err) {
  std::vector<LedgerRow> rows;
  const bool ok = doc_.Read(
      [&](const nlohmann::json& doc) {
        if (!doc.contains("generations") || !doc["generations"].is_object()) return;
        for (const auto& item : doc["generations"]) {
          std::string row_err;
          auto row = LedgerRowFromJson(item, &row_err);
          if (!row) {
            std::cout << "[ledger] skip_row ok=0 error=" << row_err << "\n";
            continue;
          }
          rows.push_back(std::move(*row));
        }
      },
      err);
  if (!ok) return std::nullopt;
  return rows;
}

LedgerCreateResult FileLedgerStore::CreateIfNoStreaming(const LedgerRow& row, LedgerRow* existing, std::string* err) {
  auto result = LedgerCreateResult::kCreated;
  const bool ok = doc_.Mutate(
      [&](nlohmann::json& doc) {
        auto& gens = GenerationsOf(doc);
        for (const auto& item : gens) {
          auto r = LedgerRowFromJson(item, nullptr);
          if (r && r->chat_id == row.chat_id && r->status == GenerationStatus::kStreaming) {
            if (existing) *existing = *r;
            result = LedgerCreateResult::kConflict;
            return false;
          }
        }
        if (gens.contains(row.id)) {
          if (err) *err = "duplicate generation id " + row.id;
          result = LedgerCreateResult::kFailed;
          return false;
        }
        gens[row.id] = LedgerRowToJson(row);
        return true;
      },
      err);
  if (!ok) return LedgerCreateResult::kFailed;
  return result;
}

bool FileLedgerStore::Update(const LedgerRow& row, bool* found, std::string* err) {
  bool present = false;
  const bool ok = doc_.Mutate(
      [&](nlohmann::json& doc) {
        auto& gens = GenerationsOf(doc);
        present = gens.contains(row.id);
        if (!present) return false;
        gens[row.id] = LedgerRowToJson(row);
        return true;
      },
      err);
  if (found) *found = present;
  return ok;
}

bool FileLedgerStore::Delete(const std::string& id, bool* deleted, std::string* err) {
  bool erased = false;
  const bool ok = doc_.Mutate(
      [&](nlohmann::json& doc) {
        erased = GenerationsOf(doc).erase(id) > 0;
        return erased;
      },
      err);
  if (deleted) *deleted = erased;
  return ok;
}

std::optional<LedgerRow> FileLedgerStore::Get(const std::string& id, std::string* err) {
  auto rows = LoadRows(err);
  if (!rows) return std::nullopt;
  for (auto& r : *rows) {
    if (r.id == id) return std::move(r);
  }
  return std::nullopt;
}

std::optional<LedgerRow> FileLedgerStore::FindStreaming(const std::string& chat_id, std::string* err) {
  auto rows = LoadRows(err);
  if (!rows) return std::nullopt;
  for (auto& r : *rows) {
    if (r.chat_id == chat_id && r.status == GenerationStatus::kStreaming) return std::move(r);
  }
  return std::nullopt;
}

std::optional<std::vector<LedgerRow>> FileLedgerStore::ListStale(int64_t cutoff_ms, std::string* err) {
  auto rows = LoadRows(err);
  if (!rows) return std::nullopt;
  std::vector<LedgerRow> out;
  for (auto& r : *rows) {
    if (r.last_update_at_ms < cutoff_ms) out.push_back(std::move(r));
  }
  return out;
}

std::unique_ptr<ILedgerStore> MakeLedgerStore(const std::string& type, const std::string& path) {
  if (type == "file" && !path.empty()) {
    std::cout << "[store] ledger type=file path=" << path << "\n";
    return std::make_unique<FileLedgerStore>(path);
  }
  std::cout << "[store] ledger type=memory\n";
  return std::make_unique<InMemoryLedgerStore>();
}

}  // namespace chatgen
