#include <prompter/core/time_parser.h>
#include <prompter/session/session_json.h>

namespace prompter::session {

using nlohmann::json;
using core::TimeParser;

namespace {

Error invalid(const std::string& what) {
    return Error{ErrorCode::ValidationError, what};
}

// Reads an optional string member. Absent or null is fine, any other type is not.
Result<std::optional<std::string>> optionalString(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::optional<std::string>{};
    }
    if (!it->is_string()) {
        return invalid(std::string("'") + key + "' must be a string");
    }
    return std::optional<std::string>(it->get<std::string>());
}

Result<std::optional<TimePoint>> optionalDate(const json& j, const char* key) {
    auto str = optionalString(j, key);
    if (!str) {
        return str.error();
    }
    if (!str.value()) {
        return std::optional<TimePoint>{};
    }
    auto tp = TimeParser::parseISO8601(*str.value());
    if (!tp) {
        return invalid(std::string("'") + key + "' is not an ISO 8601 date: " + *str.value());
    }
    return std::optional<TimePoint>(*tp);
}

Result<std::vector<std::string>> stringArray(const json& j, const char* key) {
    std::vector<std::string> out;
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return out;
    }
    if (!it->is_array()) {
        return invalid(std::string("'") + key + "' must be an array");
    }
    for (const auto& v : *it) {
        if (!v.is_string()) {
            return invalid(std::string("'") + key + "' must contain only strings");
        }
        out.push_back(v.get<std::string>());
    }
    return out;
}

json stringArrayJson(const std::vector<std::string>& values) {
    json arr = json::array();
    for (const auto& v : values) {
        arr.push_back(v);
    }
    return arr;
}

} // namespace

// ---------------------------------------------------------------------------
// ConversationEntry
// ---------------------------------------------------------------------------

json toJson(const ConversationEntry& entry) {
    json j;
    j["prompt"] = entry.prompt;
    j["response"] = entry.response;
    j["timestamp"] = TimeParser::formatISO8601(entry.timestamp);
    j["source"] = toString(entry.source);
    if (entry.metadata) {
        j["metadata"] = *entry.metadata;
    }
    return j;
}

Result<ConversationEntry> entryFromJson(const json& j) {
    if (!j.is_object()) {
        return invalid("history entry must be an object");
    }
    ConversationEntry entry;

    for (const char* key : {"prompt", "response"}) {
        auto it = j.find(key);
        if (it == j.end() || !it->is_string()) {
            return invalid(std::string("history entry requires string '") + key + "'");
        }
    }
    entry.prompt = j["prompt"].get<std::string>();
    entry.response = j["response"].get<std::string>();

    auto ts = optionalDate(j, "timestamp");
    if (!ts) {
        return ts.error();
    }
    if (!ts.value()) {
        return invalid("history entry requires 'timestamp'");
    }
    entry.timestamp = *ts.value();

    auto source = optionalString(j, "source");
    if (!source) {
        return source.error();
    }
    if (!source.value()) {
        return invalid("history entry requires 'source'");
    }
    auto parsedSource = parseEntrySource(*source.value());
    if (!parsedSource) {
        return invalid("unknown entry source: " + *source.value());
    }
    entry.source = *parsedSource;

    if (auto it = j.find("metadata"); it != j.end() && !it->is_null()) {
        if (!it->is_object()) {
            return invalid("entry 'metadata' must be an object");
        }
        entry.metadata = *it;
    }
    return entry;
}

Result<std::vector<ConversationEntry>> historyFromJson(const json& j) {
    if (!j.is_array()) {
        return invalid("'history' must be an array");
    }
    std::vector<ConversationEntry> history;
    history.reserve(j.size());
    for (size_t i = 0; i < j.size(); ++i) {
        auto entry = entryFromJson(j[i]);
        if (!entry) {
            return invalid("history[" + std::to_string(i) + "]: " + entry.error().message);
        }
        history.push_back(std::move(entry).value());
    }
    return history;
}

// ---------------------------------------------------------------------------
// SessionContext
// ---------------------------------------------------------------------------

json toJson(const SessionContext& context) {
    json j = context.extra.is_object() ? context.extra : json::object();
    if (context.currentTopic) {
        j["currentTopic"] = *context.currentTopic;
    }
    j["variables"] = context.variables;
    j["decisions"] = context.decisions;
    j["trackedIssues"] = context.trackedIssues;
    return j;
}

Result<SessionContext> contextFromJson(const json& j) {
    if (!j.is_object()) {
        return invalid("'context' must be an object");
    }
    SessionContext context;
    for (auto it = j.begin(); it != j.end(); ++it) {
        const auto& key = it.key();
        const auto& value = it.value();
        if (key == "currentTopic") {
            if (value.is_null()) {
                continue;
            }
            if (!value.is_string()) {
                return invalid("'currentTopic' must be a string");
            }
            context.currentTopic = value.get<std::string>();
        } else if (key == "variables") {
            if (value.is_null()) {
                continue;
            }
            if (!value.is_object()) {
                return invalid("'variables' must be an object");
            }
            context.variables = value;
        } else if (key == "decisions" || key == "trackedIssues") {
            if (value.is_null()) {
                continue;
            }
            if (!value.is_array()) {
                return invalid("'" + key + "' must be an array");
            }
            (key == "decisions" ? context.decisions : context.trackedIssues) = value;
        } else {
            context.extra[key] = value;
        }
    }
    return context;
}

// ---------------------------------------------------------------------------
// SessionMetadata / Session
// ---------------------------------------------------------------------------

json toJson(const SessionMetadata& metadata) {
    json j;
    j["sessionId"] = metadata.sessionId;
    j["projectName"] = metadata.projectName;
    j["createdDate"] = TimeParser::formatISO8601(metadata.createdDate);
    j["lastAccessed"] = TimeParser::formatISO8601(metadata.lastAccessed);
    j["status"] = toString(metadata.status);
    if (metadata.description) {
        j["description"] = *metadata.description;
    }
    j["tags"] = stringArrayJson(metadata.tags);
    return j;
}

Result<SessionMetadata> metadataFromJson(const json& j) {
    if (!j.is_object()) {
        return invalid("'metadata' must be an object");
    }
    SessionMetadata metadata;

    auto sessionId = optionalString(j, "sessionId");
    if (!sessionId) {
        return sessionId.error();
    }
    metadata.sessionId = sessionId.value().value_or("");

    auto projectName = optionalString(j, "projectName");
    if (!projectName) {
        return projectName.error();
    }
    metadata.projectName = projectName.value().value_or("unknown");
    if (metadata.projectName.empty()) {
        metadata.projectName = "unknown";
    }

    auto created = optionalDate(j, "createdDate");
    if (!created) {
        return created.error();
    }
    if (!created.value()) {
        return invalid("metadata requires 'createdDate'");
    }
    metadata.createdDate = *created.value();

    auto accessed = optionalDate(j, "lastAccessed");
    if (!accessed) {
        return accessed.error();
    }
    metadata.lastAccessed = accessed.value().value_or(metadata.createdDate);

    auto status = optionalString(j, "status");
    if (!status) {
        return status.error();
    }
    if (status.value()) {
        auto parsed = parseSessionStatus(*status.value());
        if (!parsed) {
            return invalid("unknown session status: " + *status.value());
        }
        metadata.status = *parsed;
    }

    auto description = optionalString(j, "description");
    if (!description) {
        return description.error();
    }
    metadata.description = description.value();

    auto tags = stringArray(j, "tags");
    if (!tags) {
        return tags.error();
    }
    metadata.tags = std::move(tags).value();
    return metadata;
}

json toJson(const Session& session) {
    json j;
    j["metadata"] = toJson(session.metadata);
    json history = json::array();
    for (const auto& entry : session.history) {
        history.push_back(toJson(entry));
    }
    j["history"] = std::move(history);
    j["context"] = toJson(session.context);
    return j;
}

Result<Session> sessionFromJson(const json& j) {
    if (!j.is_object()) {
        return invalid("session document must be an object");
    }
    if (!j.contains("metadata")) {
        return invalid("session document has no 'metadata'");
    }

    Session session;
    auto metadata = metadataFromJson(j["metadata"]);
    if (!metadata) {
        return metadata.error();
    }
    session.metadata = std::move(metadata).value();

    if (auto it = j.find("history"); it != j.end() && !it->is_null()) {
        auto history = historyFromJson(*it);
        if (!history) {
            return history.error();
        }
        session.history = std::move(history).value();
    }

    if (auto it = j.find("context"); it != j.end() && !it->is_null()) {
        auto context = contextFromJson(*it);
        if (!context) {
            return context.error();
        }
        session.context = std::move(context).value();
    }
    return session;
}

// ---------------------------------------------------------------------------
// SessionMetadataCache
// ---------------------------------------------------------------------------

json toJson(const SessionMetadataCache& entry) {
    json j;
    j["sessionId"] = entry.sessionId;
    j["projectName"] = entry.projectName;
    j["createdDate"] = TimeParser::formatISO8601(entry.createdDate);
    j["lastAccessed"] = TimeParser::formatISO8601(entry.lastAccessed);
    j["status"] = toString(entry.status);
    j["tags"] = stringArrayJson(entry.tags);
    if (entry.description) {
        j["description"] = *entry.description;
    }
    j["conversationCount"] = entry.conversationCount;
    if (entry.lastEntryTimestamp) {
        j["lastEntryTimestamp"] = TimeParser::formatISO8601(*entry.lastEntryTimestamp);
    }
    j["languages"] = stringArrayJson(entry.languages);
    j["patterns"] = stringArrayJson(entry.patterns);
    j["fileSize"] = entry.fileSize;
    j["lastCacheUpdate"] = TimeParser::formatISO8601(entry.lastCacheUpdate);
    j["cacheVersion"] = entry.cacheVersion;
    j["filePath"] = entry.filePath;
    return j;
}

Result<SessionMetadataCache> metadataCacheFromJson(const json& j) {
    if (!j.is_object()) {
        return invalid("index entry must be an object");
    }
    SessionMetadataCache entry;

    for (const char* key : {"sessionId", "projectName", "status", "cacheVersion", "filePath"}) {
        auto it = j.find(key);
        if (it == j.end() || !it->is_string()) {
            return invalid(std::string("index entry requires string '") + key + "'");
        }
    }
    entry.sessionId = j["sessionId"].get<std::string>();
    entry.projectName = j["projectName"].get<std::string>();
    entry.cacheVersion = j["cacheVersion"].get<std::string>();
    entry.filePath = j["filePath"].get<std::string>();

    auto status = parseSessionStatus(j["status"].get<std::string>());
    if (!status) {
        return invalid("unknown session status in index entry");
    }
    entry.status = *status;

    auto requiredDate = [&](const char* key, TimePoint& out) -> Result<void> {
        auto d = optionalDate(j, key);
        if (!d) {
            return d.error();
        }
        if (!d.value()) {
            return invalid(std::string("index entry requires '") + key + "'");
        }
        out = *d.value();
        return Result<void>();
    };
    if (auto r = requiredDate("createdDate", entry.createdDate); !r) {
        return r.error();
    }
    if (auto r = requiredDate("lastAccessed", entry.lastAccessed); !r) {
        return r.error();
    }
    if (auto r = requiredDate("lastCacheUpdate", entry.lastCacheUpdate); !r) {
        return r.error();
    }

    auto lastEntry = optionalDate(j, "lastEntryTimestamp");
    if (!lastEntry) {
        return lastEntry.error();
    }
    entry.lastEntryTimestamp = lastEntry.value();

    auto description = optionalString(j, "description");
    if (!description) {
        return description.error();
    }
    entry.description = description.value();

    auto assignArray = [&](const char* key, std::vector<std::string>& out) -> Result<void> {
        auto values = stringArray(j, key);
        if (!values) {
            return values.error();
        }
        out = std::move(values).value();
        return Result<void>();
    };
    if (auto r = assignArray("tags", entry.tags); !r) {
        return r.error();
    }
    if (auto r = assignArray("languages", entry.languages); !r) {
        return r.error();
    }
    if (auto r = assignArray("patterns", entry.patterns); !r) {
        return r.error();
    }

    for (const char* key : {"conversationCount", "fileSize"}) {
        auto it = j.find(key);
        if (it == j.end() || !it->is_number_unsigned()) {
            return invalid(std::string("index entry requires non-negative integer '") + key + "'");
        }
    }
    entry.conversationCount = j["conversationCount"].get<size_t>();
    entry.fileSize = j["fileSize"].get<uint64_t>();
    return entry;
}

json toJson(const LazySessionData& data) {
    json j;
    j["metadata"] = toJson(data.metadata);
    if (data.history) {
        json history = json::array();
        for (const auto& entry : *data.history) {
            history.push_back(toJson(entry));
        }
        j["history"] = std::move(history);
    }
    if (data.context) {
        j["context"] = toJson(*data.context);
    }
    j["isFullyLoaded"] = data.isFullyLoaded;
    j["loadedAt"] = TimeParser::formatISO8601(data.loadedAt);
    return j;
}

} // namespace prompter::session
