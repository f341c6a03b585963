#include <prompter/core/time_parser.h>
#include <prompter/session/metadata_extractor.h>
#include <prompter/session/session_json.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <regex>
#include <utility>

namespace prompter::session {

using nlohmann::json;

namespace {

struct TopicRule {
    std::string name;
    std::regex pattern;
};

constexpr auto kTopicFlags =
    std::regex::ECMAScript | std::regex::icase | std::regex::optimize;

const std::vector<TopicRule>& languageRules() {
    static const std::vector<TopicRule> rules = {
        {"javascript", std::regex(R"(\b(javascript|js|nodejs|npm|yarn)\b)", kTopicFlags)},
        {"typescript", std::regex(R"(\b(typescript|ts)\b)", kTopicFlags)},
        {"python", std::regex(R"(\b(python|py|pip|django|flask)\b)", kTopicFlags)},
        {"react", std::regex(R"(\b(react|jsx|tsx)\b)", kTopicFlags)},
        {"css", std::regex(R"(\b(css|scss|sass|styled)\b)", kTopicFlags)},
        {"sql", std::regex(R"(\b(sql|mysql|postgres|sqlite)\b)", kTopicFlags)},
        {"go", std::regex(R"(\b(golang|go)\b)", kTopicFlags)},
        {"rust", std::regex(R"(\b(rust|cargo)\b)", kTopicFlags)},
        {"java", std::regex(R"(\b(java|spring|maven)\b)", kTopicFlags)},
        {"php", std::regex(R"(\b(php|laravel|composer)\b)", kTopicFlags)},
    };
    return rules;
}

const std::vector<TopicRule>& patternRules() {
    static const std::vector<TopicRule> rules = {
        {"async-await", std::regex(R"(async|await|promise)", kTopicFlags)},
        {"error-handling", std::regex(R"(try|catch|error|exception|throw)", kTopicFlags)},
        {"testing", std::regex(R"(test|jest|mocha|vitest|describe|it\()", kTopicFlags)},
        {"api-integration", std::regex(R"(api|endpoint|http|axios|fetch)", kTopicFlags)},
        {"authentication", std::regex(R"(auth|jwt|token|login|session)", kTopicFlags)},
        {"state-management", std::regex(R"(state|redux|zustand|context)", kTopicFlags)},
        {"component-patterns", std::regex(R"(component|react|vue|angular)", kTopicFlags)},
        {"database", std::regex(R"(database|sql|mongo|postgres|query)", kTopicFlags)},
    };
    return rules;
}

std::vector<std::string> matchRules(const std::vector<TopicRule>& rules, std::string_view text) {
    std::vector<std::string> matched;
    for (const auto& rule : rules) {
        if (std::regex_search(text.begin(), text.end(), rule.pattern)) {
            matched.push_back(rule.name);
        }
    }
    return matched;
}

const std::regex* keyRegex(const std::string& key) {
    static const std::regex metadataKey(R"("metadata"\s*:\s*([\{\[]))");
    static const std::regex historyKey(R"("history"\s*:\s*([\{\[]))");
    static const std::regex contextKey(R"("context"\s*:\s*([\{\[]))");
    if (key == "metadata") {
        return &metadataKey;
    }
    if (key == "history") {
        return &historyKey;
    }
    if (key == "context") {
        return &contextKey;
    }
    return nullptr;
}

// Index of the bracket closing the one at `open`, skipping string literals
std::optional<size_t> matchBracket(std::string_view s, size_t open) {
    const char closing = s[open] == '{' ? '}' : ']';
    int depth = 0;
    bool inString = false;
    bool escaped = false;
    for (size_t i = open; i < s.size(); ++i) {
        const char ch = s[i];
        if (inString) {
            if (escaped) {
                escaped = false;
            } else if (ch == '\\') {
                escaped = true;
            } else if (ch == '"') {
                inString = false;
            }
            continue;
        }
        if (ch == '"') {
            inString = true;
        } else if (ch == '{' || ch == '[') {
            ++depth;
        } else if (ch == '}' || ch == ']') {
            if (--depth == 0) {
                if (ch != closing) {
                    return std::nullopt;
                }
                return i;
            }
        }
    }
    return std::nullopt;
}

// Follows nesting depth and string state of a JSON text while scanning forward
class StructureScanner {
public:
    explicit StructureScanner(std::string_view text) : text_(text) {}

    // Offsets must not decrease between calls
    void advanceTo(size_t offset) {
        for (; pos_ < offset && pos_ < text_.size(); ++pos_) {
            const char ch = text_[pos_];
            if (inString_) {
                if (escaped_) {
                    escaped_ = false;
                } else if (ch == '\\') {
                    escaped_ = true;
                } else if (ch == '"') {
                    inString_ = false;
                }
                continue;
            }
            if (ch == '"') {
                inString_ = true;
            } else if (ch == '{' || ch == '[') {
                ++depth_;
            } else if ((ch == '}' || ch == ']') && --depth_ == 0) {
                rootClosed_ = true;
            }
        }
    }

    /// True when the current offset is a member position of the root object
    bool atRootMember() const { return !inString_ && !rootClosed_ && depth_ == 1; }

private:
    std::string_view text_;
    size_t pos_ = 0;
    int depth_ = 0;
    bool inString_ = false;
    bool escaped_ = false;
    bool rootClosed_ = false;
};

std::optional<json> parseFragment(std::string_view fragment) {
    auto parsed = json::parse(fragment.begin(), fragment.end(), nullptr, false);
    if (parsed.is_discarded()) {
        return std::nullopt;
    }
    return parsed;
}

} // namespace

std::optional<std::string_view> MetadataExtractor::findValueFragment(std::string_view content,
                                                                     const std::string& key,
                                                                     bool last) {
    const auto* re = keyRegex(key);
    if (!re) {
        return std::nullopt;
    }
    const auto rootStart = content.find_first_not_of(" \t\r\n");
    if (rootStart == std::string_view::npos || content[rootStart] != '{') {
        return std::nullopt;
    }

    // Nested members and look-alikes inside strings never count
    StructureScanner scanner(content);
    std::optional<size_t> open;
    for (std::cregex_iterator it(content.data(), content.data() + content.size(), *re), end;
         it != end; ++it) {
        scanner.advanceTo(static_cast<size_t>((*it)[0].first - content.data()));
        if (!scanner.atRootMember()) {
            continue;
        }
        open = static_cast<size_t>((*it)[1].first - content.data());
        if (!last) {
            break;
        }
    }
    if (!open) {
        return std::nullopt;
    }

    auto close = matchBracket(content, *open);
    if (!close) {
        return std::nullopt;
    }
    return content.substr(*open, *close - *open + 1);
}

size_t MetadataExtractor::countPromptMarkers(std::string_view text) {
    static const std::regex promptMarker(R"("prompt"\s*:)");
    return static_cast<size_t>(std::distance(
        std::cregex_iterator(text.data(), text.data() + text.size(), promptMarker),
        std::cregex_iterator()));
}

std::optional<TimePoint> MetadataExtractor::lastTimestampMarker(std::string_view text) {
    static const std::regex timestampMarker(R"re("timestamp"\s*:\s*"([^"]+)")re");
    std::optional<std::string> lastValue;
    for (std::cregex_iterator it(text.data(), text.data() + text.size(), timestampMarker), end;
         it != end; ++it) {
        lastValue = (*it)[1].str();
    }
    if (!lastValue) {
        return std::nullopt;
    }
    return core::TimeParser::parseISO8601(*lastValue);
}

std::vector<std::string> MetadataExtractor::detectLanguages(std::string_view text) {
    return matchRules(languageRules(), text);
}

std::vector<std::string> MetadataExtractor::detectPatterns(std::string_view text) {
    return matchRules(patternRules(), text);
}

std::optional<MetadataExtractor::HeaderInfo>
MetadataExtractor::extractHeaderFast(const std::string& content) {
    auto metadataText = findValueFragment(content, "metadata");
    if (!metadataText || metadataText->front() != '{') {
        return std::nullopt;
    }
    auto metadataJson = parseFragment(*metadataText);
    if (!metadataJson) {
        return std::nullopt;
    }
    auto metadata = metadataFromJson(*metadataJson);
    if (!metadata) {
        return std::nullopt;
    }

    auto historyText = findValueFragment(content, "history");
    if (!historyText || historyText->front() != '[') {
        return std::nullopt;
    }

    HeaderInfo info;
    info.metadata = std::move(metadata).value();
    info.conversationCount = countPromptMarkers(*historyText);
    info.lastEntryTimestamp = lastTimestampMarker(*historyText);
    info.usedFastPath = true;
    return info;
}

Result<MetadataExtractor::HeaderInfo> MetadataExtractor::extractHeaderFull(const std::string& content) {
    auto session = parseSession(content);
    if (!session) {
        return session.error();
    }
    HeaderInfo info;
    info.metadata = std::move(session.value().metadata);
    info.conversationCount = session.value().history.size();
    if (!session.value().history.empty()) {
        info.lastEntryTimestamp = session.value().history.back().timestamp;
    }
    return info;
}

Result<MetadataExtractor::HeaderInfo> MetadataExtractor::extractHeader(const std::string& content) {
    if (auto fast = extractHeaderFast(content)) {
        return std::move(*fast);
    }
    spdlog::debug("[MetadataExtractor] Metadata fragment unusable, parsing full document");
    return extractHeaderFull(content);
}

Result<SessionMetadataCache> MetadataExtractor::extract(const std::filesystem::path& filePath,
                                                        const std::string& content,
                                                        TimePoint computedAt) {
    auto header = extractHeader(content);
    if (!header) {
        return Error{header.error().code,
                     filePath.filename().string() + ": " + header.error().message};
    }
    auto& info = header.value();

    SessionMetadataCache entry;
    entry.sessionId = filePath.stem().string();
    entry.projectName = info.metadata.projectName;
    entry.createdDate = info.metadata.createdDate;
    entry.lastAccessed = info.metadata.lastAccessed;
    entry.status = info.metadata.status;
    entry.tags = info.metadata.tags;
    entry.description = info.metadata.description;
    entry.conversationCount = info.conversationCount;
    entry.lastEntryTimestamp = info.lastEntryTimestamp;

    // Classify conversation text only, so JSON member names do not count as topics
    std::string_view topicText = findValueFragment(content, "history").value_or(content);
    entry.languages = detectLanguages(topicText);
    entry.patterns = detectPatterns(topicText);

    entry.fileSize = content.size();
    // Rounded down so the record survives an ISO round trip and never postdates the read
    entry.lastCacheUpdate = std::chrono::time_point_cast<TimePoint::duration>(
        std::chrono::floor<std::chrono::milliseconds>(computedAt));
    entry.cacheVersion = kCacheVersion;
    entry.filePath = filePath.string();
    return entry;
}

std::optional<SessionContext> MetadataExtractor::extractContextFast(const std::string& content) {
    auto contextText = findValueFragment(content, "context", true);
    if (!contextText || contextText->front() != '{') {
        return std::nullopt;
    }
    auto contextJson = parseFragment(*contextText);
    if (!contextJson) {
        return std::nullopt;
    }
    auto context = contextFromJson(*contextJson);
    if (!context) {
        return std::nullopt;
    }
    return std::move(context).value();
}

Result<SessionContext> MetadataExtractor::extractContext(const std::string& content) {
    if (auto fast = extractContextFast(content)) {
        return std::move(*fast);
    }
    auto session = parseSession(content);
    if (!session) {
        return session.error();
    }
    return std::move(session.value().context);
}

Result<std::vector<ConversationEntry>> MetadataExtractor::extractHistory(const std::string& content) {
    if (auto historyText = findValueFragment(content, "history");
        historyText && historyText->front() == '[') {
        if (auto historyJson = parseFragment(*historyText)) {
            auto history = historyFromJson(*historyJson);
            if (history) {
                return history;
            }
            spdlog::debug("[MetadataExtractor] History fragment invalid: {}",
                          history.error().message);
        }
    }
    auto session = parseSession(content);
    if (!session) {
        return session.error();
    }
    return std::move(session.value().history);
}

Result<Session> MetadataExtractor::parseSession(const std::string& content) {
    auto document = json::parse(content, nullptr, false);
    if (document.is_discarded()) {
        return Error{ErrorCode::CorruptedData, "Session file is not valid JSON"};
    }
    return sessionFromJson(document);
}

} // namespace prompter::session
