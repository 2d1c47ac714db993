#pragma once

#include "clock.hpp"
#include "http_fetcher.hpp"
#include "orchestrator.hpp"
#include "providers/provider.hpp"
#include "tooling.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace chatgen::fakes {

// Manually advanced clock starting at a fixed instant.
class FakeClock : public IClock {
 public:
  explicit FakeClock(int64_t start_ms = 1760000000000) : now_(FromUnixMillis(start_ms)) {}

  TimePoint Now() const override {
    std::lock_guard<std::mutex> lock(mu_);
    return now_;
  }

  void Advance(std::chrono::milliseconds d) {
    std::lock_guard<std::mutex> lock(mu_);
    now_ += d;
  }

 private:
  mutable std::mutex mu_;
  TimePoint now_;
};

// One scripted model call: the events it emits, optionally failing after them.
struct ScriptedStep {
  std::vector<ModelEvent> events;
  // Advances the clock before each event so timings are measurable.
  std::chrono::milliseconds per_event{0};
  std::string fail_with;
  // Runs once before the first event, standing in for a slow first byte.
  std::function<void()> before_events;
};

inline ModelEvent TextDelta(const std::string& s) {
  ModelEvent ev;
  ev.kind = ModelEventKind::kTextDelta;
  ev.text = s;
  return ev;
}

inline ModelEvent ReasoningDelta(const std::string& s) {
  ModelEvent ev;
  ev.kind = ModelEventKind::kReasoningDelta;
  ev.text = s;
  return ev;
}

inline ModelEvent ToolCallEvent(const std::string& id, const std::string& name, nlohmann::json args) {
  ModelEvent ev;
  ev.kind = ModelEventKind::kToolCall;
  ev.tool_call.id = id;
  ev.tool_call.name = name;
  ev.tool_call.arguments = std::move(args);
  return ev;
}

inline ModelEvent FinishEvent(const std::string& reason, TokenUsage usage = {}) {
  ModelEvent ev;
  ev.kind = ModelEventKind::kFinish;
  ev.finish_reason = reason;
  ev.usage = usage;
  return ev;
}

class ScriptedProvider : public IModelProvider {
 public:
  explicit ScriptedProvider(FakeClock* clock = nullptr) : clock_(clock) {}

  void AddStep(ScriptedStep step) { steps_.push_back(std::move(step)); }
  void SetTextAnswer(std::optional<std::string> answer, std::string err = {}) {
    text_answer_ = std::move(answer);
    text_err_ = std::move(err);
  }

  std::string Name() const override { return "scripted"; }

  bool StreamStep(const StepRequest& req, const ModelEventCallback& on_event, std::string* err) override {
    requests_.push_back(req);
    if (calls_ >= steps_.size()) {
      if (err) *err = "no scripted step";
      return false;
    }
    const auto& step = steps_[calls_++];
    if (step.before_events) step.before_events();
    for (const auto& ev : step.events) {
      if (clock_ && step.per_event.count() > 0) clock_->Advance(step.per_event);
      if (!on_event(ev)) {
        if (err) *err = "cancelled";
        return false;
      }
    }
    if (!step.fail_with.empty()) {
      if (err) *err = step.fail_with;
      return false;
    }
    return true;
  }

  std::optional<std::string> GenerateText(const ModelProfile&, const std::string& system_prompt,
                                          const std::string& prompt, std::string* err) override {
    last_system_prompt_ = system_prompt;
    last_prompt_ = prompt;
    if (!text_answer_ && err) *err = text_err_;
    return text_answer_;
  }

  size_t calls() const { return calls_; }
  const std::vector<StepRequest>& requests() const { return requests_; }
  const std::string& last_system_prompt() const { return last_system_prompt_; }
  const std::string& last_prompt() const { return last_prompt_; }

 private:
  FakeClock* clock_;
  std::vector<ScriptedStep> steps_;
  size_t calls_ = 0;
  std::vector<StepRequest> requests_;
  std::optional<std::string> text_answer_;
  std::string text_err_;
  std::string last_system_prompt_;
  std::string last_prompt_;
};

// Returns canned responses by exact url; unknown urls fail like a connection error.
class FakeFetcher : public IHttpFetcher {
 public:
  void Set(const std::string& url, int status, std::string body, std::string content_type = "application/json") {
    responses_[url] = FetchResponse{status, std::move(body), std::move(content_type)};
  }
  void SetThrow(bool v) { throw_ = v; }

  std::optional<FetchResponse> Get(const std::string& url, const HeaderList& headers, std::string* err) override {
    urls_.push_back(url);
    last_headers_ = headers;
    if (throw_) throw std::runtime_error("fetcher exploded");
    auto it = responses_.find(url);
    if (it == responses_.end()) {
      if (err) *err = "connection refused";
      return std::nullopt;
    }
    return it->second;
  }

  const std::vector<std::string>& urls() const { return urls_; }
  const HeaderList& last_headers() const { return last_headers_; }

 private:
  std::map<std::string, FetchResponse> responses_;
  std::vector<std::string> urls_;
  HeaderList last_headers_;
  bool throw_ = false;
};

class CapturingSink : public IStreamSink {
 public:
  // Write starts failing after `accept` events; -1 accepts everything.
  explicit CapturingSink(int accept = -1) : accept_(accept) {}

  bool Write(const StreamEvent& ev) override {
    if (accept_ >= 0 && static_cast<int>(events_.size()) >= accept_) return false;
    events_.push_back(ev);
    return true;
  }

  const std::vector<StreamEvent>& events() const { return events_; }

  std::vector<StreamEventKind> kinds() const {
    std::vector<StreamEventKind> out;
    for (const auto& e : events_) out.push_back(e.kind);
    return out;
  }

 private:
  int accept_;
  std::vector<StreamEvent> events_;
};

class StaticToolProvider : public IToolProvider {
 public:
  explicit StaticToolProvider(std::shared_ptr<ToolRegistry> registry) : registry_(std::move(registry)) {}

  std::shared_ptr<const ToolRegistry> LookupEnabledTools(const std::vector<std::string>& capabilities) override {
    last_capabilities_ = capabilities;
    return registry_;
  }

  const std::vector<std::string>& last_capabilities() const { return last_capabilities_; }

 private:
  std::shared_ptr<ToolRegistry> registry_;
  std::vector<std::string> last_capabilities_;
};

inline ToolSchema SimpleSchema(const std::string& name) {
  ToolSchema s;
  s.name = name;
  s.description = "test tool " + name;
  s.parameters = {{"type", "object"}, {"properties", {{"q", {{"type", "string"}}}}}};
  return s;
}

}  // namespace chatgen::fakes
