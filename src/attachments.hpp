#pragma once

#include "http_fetcher.hpp"
#include "providers/provider.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace chatgen {

std::string Base64Encode(const std::string& bytes);

// Request messages are {role, content} where content is a string or an array of parts:
//   {type:text,text}, {type:file,mediaType,data|url}, {type:image,image,mediaType}.
// Attachment data may be base64, a data: url or an http(s) url; urls are downloaded and inlined. A failed
// download keeps the part as a remote file reference. Stored assistant parts other than text are skipped.
std::optional<std::vector<ConversationMessage>> ParseRequestMessages(const nlohmann::json& messages,
                                                                     IHttpFetcher* fetcher,
                                                                     std::string* err);

}  // namespace chatgen
