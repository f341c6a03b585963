#include <prompter/session/session_types.h>

namespace prompter::session {

const char* toString(SessionStatus status) {
    switch (status) {
        case SessionStatus::Active:
            return "active";
        case SessionStatus::Completed:
            return "completed";
        case SessionStatus::Archived:
            return "archived";
    }
    return "active";
}

std::optional<SessionStatus> parseSessionStatus(std::string_view text) {
    if (text == "active") {
        return SessionStatus::Active;
    }
    if (text == "completed") {
        return SessionStatus::Completed;
    }
    if (text == "archived") {
        return SessionStatus::Archived;
    }
    return std::nullopt;
}

const char* toString(EntrySource source) {
    switch (source) {
        case EntrySource::User:
            return "user";
        case EntrySource::ModelA:
            return "claude";
        case EntrySource::ModelB:
            return "gpt-4o";
    }
    return "user";
}

std::optional<EntrySource> parseEntrySource(std::string_view text) {
    if (text == "user") {
        return EntrySource::User;
    }
    if (text == "claude" || text == "model-a") {
        return EntrySource::ModelA;
    }
    if (text == "gpt-4o" || text == "model-b") {
        return EntrySource::ModelB;
    }
    return std::nullopt;
}

} // namespace prompter::session
