#pragma once

#include <nlohmann/json.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace chatgen {

struct ToolSchema {
  std::string name;
  std::string description;
  nlohmann::json parameters;
};

struct ToolCall {
  std::string id;
  std::string name;
  nlohmann::json arguments = nlohmann::json::object();
};

// A failed tool still produces a result: {"error": "..."} with ok=false.
struct ToolResult {
  std::string tool_call_id;
  std::string name;
  nlohmann::json result;
  bool ok = true;
  std::string error;
};

using ToolHandler = std::function<ToolResult(const std::string& tool_call_id, const nlohmann::json& arguments)>;

ToolResult MakeToolError(const std::string& tool_call_id, const std::string& name, const std::string& message);

class ToolRegistry {
 public:
  ToolRegistry() = default;
  ToolRegistry(const ToolRegistry&) = delete;
  ToolRegistry& operator=(const ToolRegistry&) = delete;
  ToolRegistry(ToolRegistry&& other) noexcept;
  ToolRegistry& operator=(ToolRegistry&& other) noexcept;

  void RegisterTool(ToolSchema schema, ToolHandler handler);
  bool HasTool(const std::string& name) const;
  std::optional<ToolSchema> GetSchema(const std::string& name) const;
  std::optional<ToolHandler> GetHandler(const std::string& name) const;
  size_t Size() const;
  bool Empty() const { return Size() == 0; }

  // Sorted by name so prompts and model requests are stable.
  std::vector<ToolSchema> ListSchemas() const;
  std::vector<ToolSchema> FilterSchemas(const std::vector<std::string>& allow_names) const;

  // Never throws: unknown tools and escaping exceptions become error results.
  ToolResult Execute(const ToolCall& call) const;

 private:
  mutable std::shared_mutex mu_;
  std::unordered_map<std::string, ToolSchema> schemas_;
  std::unordered_map<std::string, ToolHandler> handlers_;
};

std::vector<std::string> ExtractToolNames(const std::vector<ToolSchema>& tools);

// Capability lookup consumed by the orchestrator: capability slugs in, callable tool set out.
class IToolProvider {
 public:
  virtual ~IToolProvider() = default;
  virtual std::shared_ptr<const ToolRegistry> LookupEnabledTools(const std::vector<std::string>& capabilities) = 0;
};

}  // namespace chatgen
