#include "attachments.hpp"

#include "log_format.hpp"

#include <openssl/evp.h>

#include <iostream>
#include <utility>

namespace chatgen {
namespace {

static std::string StringField(const nlohmann::json& j, const char* key) {
  if (!j.contains(key) || !j[key].is_string()) return {};
  return j[key].get<std::string>();
}

static bool IsHttpUrl(const std::string& s) {
  return s.rfind("http://", 0) == 0 || s.rfind("https://", 0) == 0;
}

static bool SplitDataUrl(const std::string& url, std::string* media_type, std::string* data) {
  if (url.rfind("data:", 0) != 0) return false;
  const auto marker = url.find(";base64,");
  if (marker == std::string::npos) return false;
  *media_type = url.substr(5, marker - 5);
  *data = url.substr(marker + 8);
  return true;
}

static std::string MediaTypeOf(const nlohmann::json& part, const std::string& fallback) {
  auto mt = StringField(part, "mediaType");
  if (mt.empty()) mt = StringField(part, "mimeType");
  return mt.empty() ? fallback : mt;
}

// Resolves base64, data-url or http(s) attachment data into a model part.
static ConversationPart AttachmentPart(const std::string& data, std::string media_type, IHttpFetcher* fetcher) {
  ConversationPart p;
  p.kind = ConversationPartKind::kInlineData;
  p.media_type = std::move(media_type);

  std::string dm;
  std::string payload;
  if (SplitDataUrl(data, &dm, &payload)) {
    if (!dm.empty()) p.media_type = dm;
    p.data_base64 = std::move(payload);
    return p;
  }
  if (!IsHttpUrl(data)) {
    p.data_base64 = data;
    return p;
  }

  std::cout << "[attachments] download url=" << TruncateForLog(data, 200) << "\n";
  std::string err;
  std::optional<FetchResponse> res;
  if (fetcher) res = fetcher->Get(data, {}, &err);
  if (res && res->status >= 200 && res->status < 300) {
    p.data_base64 = Base64Encode(res->body);
    if (p.media_type.empty() || p.media_type == "application/octet-stream") {
      auto ct = res->content_type;
      const auto semi = ct.find(';');
      if (semi != std::string::npos) ct = ct.substr(0, semi);
      if (!ct.empty()) p.media_type = ct;
    }
    return p;
  }
  if (res) err = "http " + std::to_string(res->status);
  std::cout << "[attachments] download ok=0 url=" << TruncateForLog(data, 200) << " error=" << err << "\n";
  p.kind = ConversationPartKind::kFileUri;
  p.text = data;
  return p;
}

static bool ParsePart(const nlohmann::json& part, const std::string& role, IHttpFetcher* fetcher,
                      std::vector<ConversationPart>* out) {
  if (part.is_string()) {
    ConversationPart p;
    p.text = part.get<std::string>();
    out->push_back(std::move(p));
    return true;
  }
  if (!part.is_object()) return false;
  const auto type = StringField(part, "type");
  if (type == "text") {
    ConversationPart p;
    p.text = StringField(part, "text");
    if (!p.text.empty()) out->push_back(std::move(p));
    return true;
  }
  if (role != "user") return true;
  if (type == "file") {
    auto data = StringField(part, "data");
    if (data.empty()) data = StringField(part, "url");
    if (data.empty()) return false;
    out->push_back(AttachmentPart(data, MediaTypeOf(part, "application/octet-stream"), fetcher));
    return true;
  }
  if (type == "image") {
    const auto data = StringField(part, "image");
    if (data.empty()) return false;
    out->push_back(AttachmentPart(data, MediaTypeOf(part, "image/png"), fetcher));
    return true;
  }
  return true;
}

}  // namespace

std::string Base64Encode(const std::string& bytes) {
  if (bytes.empty()) return {};
  std::string out(4 * ((bytes.size() + 2) / 3), '\0');
  const int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                reinterpret_cast<const unsigned char*>(bytes.data()), static_cast<int>(bytes.size()));
  out.resize(n < 0 ? 0 : static_cast<size_t>(n));
  return out;
}

std::optional<std::vector<ConversationMessage>> ParseRequestMessages(const nlohmann::json& messages,
                                                                     IHttpFetcher* fetcher,
                                                                     std::string* err) {
  if (!messages.is_array()) {
    if (err) *err = "messages must be an array";
    return std::nullopt;
  }
  std::vector<ConversationMessage> out;
  out.reserve(messages.size());
  for (size_t i = 0; i < messages.size(); ++i) {
    const auto& m = messages[i];
    if (!m.is_object()) {
      if (err) *err = "messages[" + std::to_string(i) + "] must be an object";
      return std::nullopt;
    }
    const auto role = StringField(m, "role");
    if (role != "user" && role != "assistant") continue;

    const nlohmann::json* content = nullptr;
    if (m.contains("content")) content = &m["content"];
    if ((!content || content->is_null()) && m.contains("parts")) content = &m["parts"];

    ConversationMessage cm;
    cm.role = role;
    if (content && content->is_string()) {
      ConversationPart p;
      p.text = content->get<std::string>();
      cm.parts.push_back(std::move(p));
    } else if (content && (content->is_array() || content->is_object())) {
      const auto parts = content->is_array() ? *content : nlohmann::json::array({*content});
      for (const auto& part : parts) {
        if (!ParsePart(part, role, fetcher, &cm.parts)) {
          if (err) *err = "messages[" + std::to_string(i) + "] has an invalid content part";
          return std::nullopt;
        }
      }
    }
    if (!cm.parts.empty()) out.push_back(std::move(cm));
  }
  return out;
}

}  // namespace chatgen
