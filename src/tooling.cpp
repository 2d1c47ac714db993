#include "tooling.hpp"

#include "log_format.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <mutex>
#include <string>
#include <vector>

namespace chatgen {

ToolResult MakeToolError(const std::string& tool_call_id, const std::string& name, const std::string& message) {
  ToolResult r;
  r.tool_call_id = tool_call_id;
  r.name = name;
  r.ok = false;
  r.error = message;
  r.result = {{"error", message}};
  return r;
}

ToolRegistry::ToolRegistry(ToolRegistry&& other) noexcept {
  std::unique_lock<std::shared_mutex> lock(other.mu_);
  schemas_ = std::move(other.schemas_);
  handlers_ = std::move(other.handlers_);
}

ToolRegistry& ToolRegistry::operator=(ToolRegistry&& other) noexcept {
  if (this == &other) return *this;
  std::unique_lock<std::shared_mutex> lock_other(other.mu_);
  std::unique_lock<std::shared_mutex> lock_this(mu_);
  schemas_ = std::move(other.schemas_);
  handlers_ = std::move(other.handlers_);
  return *this;
}

void ToolRegistry::RegisterTool(ToolSchema schema, ToolHandler handler) {
  std::unique_lock<std::shared_mutex> lock(mu_);
  const auto name = schema.name;
  schemas_[name] = std::move(schema);
  handlers_[name] = std::move(handler);
}

bool ToolRegistry::HasTool(const std::string& name) const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  return schemas_.find(name) != schemas_.end() && handlers_.find(name) != handlers_.end();
}

std::optional<ToolSchema> ToolRegistry::GetSchema(const std::string& name) const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  auto it = schemas_.find(name);
  if (it == schemas_.end()) return std::nullopt;
  return it->second;
}

std::optional<ToolHandler> ToolRegistry::GetHandler(const std::string& name) const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  auto it = handlers_.find(name);
  if (it == handlers_.end()) return std::nullopt;
  return it->second;
}

size_t ToolRegistry::Size() const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  return schemas_.size();
}

std::vector<ToolSchema> ToolRegistry::ListSchemas() const {
  std::vector<ToolSchema> out;
  {
    std::shared_lock<std::shared_mutex> lock(mu_);
    out.reserve(schemas_.size());
    for (const auto& [_, schema] : schemas_) out.push_back(schema);
  }
  std::sort(out.begin(), out.end(), [](const ToolSchema& a, const ToolSchema& b) { return a.name < b.name; });
  return out;
}

std::vector<ToolSchema> ToolRegistry::FilterSchemas(const std::vector<std::string>& allow_names) const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  std::vector<ToolSchema> out;
  out.reserve(allow_names.size());
  for (const auto& name : allow_names) {
    auto it = schemas_.find(name);
    if (it != schemas_.end()) out.push_back(it->second);
  }
  return out;
}

ToolResult ToolRegistry::Execute(const ToolCall& call) const {
  std::cout << "[tool-call] id=" << call.id << " name=" << call.name
            << " arguments=" << TruncateForLog(SanitizeJsonForLog(call.arguments), 2000) << "\n";
  auto handler = GetHandler(call.name);
  ToolResult r;
  if (!handler) {
    r = MakeToolError(call.id, call.name, "unknown tool: " + call.name);
  } else {
    try {
      r = (*handler)(call.id, call.arguments);
    } catch (const std::exception& e) {
      r = MakeToolError(call.id, call.name, e.what());
    } catch (...) {
      r = MakeToolError(call.id, call.name, "unknown tool failure");
    }
    r.tool_call_id = call.id;
    r.name = call.name;
  }
  std::cout << "[tool-result] id=" << call.id << " name=" << call.name << " ok=" << (r.ok ? 1 : 0)
            << " error=" << (r.error.empty() ? "-" : r.error)
            << " result=" << TruncateForLog(SanitizeJsonForLog(r.result), 2000) << "\n";
  return r;
}

std::vector<std::string> ExtractToolNames(const std::vector<ToolSchema>& tools) {
  std::vector<std::string> out;
  out.reserve(tools.size());
  for (const auto& t : tools) out.push_back(t.name);
  return out;
}

}  // namespace chatgen
