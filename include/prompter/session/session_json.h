#pragma once

#include <prompter/core/types.h>
#include <prompter/session/session_types.h>

#include <nlohmann/json.hpp>

#include <vector>

namespace prompter::session {

// Conversions between session structures and their JSON form.
//
// The *FromJson functions validate shape: wrong member types, unknown enum
// spellings or unparseable dates yield ErrorCode::ValidationError instead of
// an exception. Dates are ISO 8601 strings in UTC.

nlohmann::json toJson(const ConversationEntry& entry);
Result<ConversationEntry> entryFromJson(const nlohmann::json& j);

Result<std::vector<ConversationEntry>> historyFromJson(const nlohmann::json& j);

nlohmann::json toJson(const SessionContext& context);
Result<SessionContext> contextFromJson(const nlohmann::json& j);

nlohmann::json toJson(const SessionMetadata& metadata);
/// sessionId, lastAccessed and status may be missing; projectName defaults to "unknown"
Result<SessionMetadata> metadataFromJson(const nlohmann::json& j);

nlohmann::json toJson(const Session& session);
/// Requires a `metadata` object; `history` and `context`, when present, must be an array and an object
Result<Session> sessionFromJson(const nlohmann::json& j);

nlohmann::json toJson(const SessionMetadataCache& entry);
Result<SessionMetadataCache> metadataCacheFromJson(const nlohmann::json& j);

nlohmann::json toJson(const LazySessionData& data);

} // namespace prompter::session
