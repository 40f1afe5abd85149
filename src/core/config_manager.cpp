// StreamHub - Real-time event fan-out server
// Configuration Manager Implementation

#include "streamhub/core/config_manager.hpp"
#include "streamhub/core/json_value.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace streamhub {
namespace core {

namespace {

using VoidResult = Result<void, ConfigError>;

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) start++;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
    return s.substr(start, end - start);
}

VoidResult validationError(const std::string& field, const std::string& message) {
    return VoidResult::error(
        ConfigError(ConfigError::Code::ValidationError, field + " " + message, field));
}

// =============================================================================
// Simple YAML Parser (configuration subset)
// =============================================================================

class YamlParser {
public:
    explicit YamlParser(const std::string& input) {
        std::istringstream stream(input);
        std::string line;
        while (std::getline(stream, line)) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            lines_.push_back(line);
        }
    }

    Result<JsonValue, ConfigError> parse() {
        JsonValue root = JsonValue::object();
        auto result = parseMapping(root, 0, 0, lines_.size());
        if (result.isError()) {
            return Result<JsonValue, ConfigError>::error(result.error());
        }
        return Result<JsonValue, ConfigError>::success(std::move(root));
    }

private:
    std::vector<std::string> lines_;

    static size_t getIndent(const std::string& line) {
        size_t indent = 0;
        for (char c : line) {
            if (c == ' ') indent++;
            else break;
        }
        return indent;
    }

    static bool isBlankOrComment(const std::string& line) {
        std::string trimmed = trim(line);
        return trimmed.empty() || trimmed[0] == '#';
    }

    static std::string stripComment(const std::string& value) {
        if (!value.empty() && (value.front() == '"' || value.front() == '\'')) {
            return value;
        }
        size_t hash = value.find(" #");
        return hash == std::string::npos ? value : trim(value.substr(0, hash));
    }

    static ConfigError parseError(const std::string& message, size_t lineIndex) {
        return ConfigError(ConfigError::Code::ParseError, message, "",
                           static_cast<int>(lineIndex + 1));
    }

    // End (exclusive) of the block of lines indented deeper than `indent`.
    size_t blockEnd(size_t start, size_t endLine, size_t indent) const {
        size_t i = start;
        while (i < endLine) {
            if (!isBlankOrComment(lines_[i]) && getIndent(lines_[i]) <= indent) {
                break;
            }
            i++;
        }
        return i;
    }

    VoidResult parseMapping(JsonValue& obj, size_t baseIndent,
                            size_t startLine, size_t endLine) {
        size_t i = startLine;
        while (i < endLine) {
            if (isBlankOrComment(lines_[i])) {
                i++;
                continue;
            }

            size_t indent = getIndent(lines_[i]);
            if (indent < baseIndent) {
                break;
            }

            std::string line = trim(lines_[i]);
            size_t colonPos = line.find(':');
            if (colonPos == std::string::npos) {
                return VoidResult::error(parseError("Expected 'key: value'", i));
            }

            std::string key = trim(line.substr(0, colonPos));
            std::string valueStr = stripComment(trim(line.substr(colonPos + 1)));

            if (!valueStr.empty()) {
                auto scalar = parseInline(valueStr, i);
                if (scalar.isError()) {
                    return VoidResult::error(scalar.error());
                }
                obj.set(key, std::move(scalar).value());
                i++;
                continue;
            }

            size_t nestedEnd = blockEnd(i + 1, endLine, indent);
            size_t first = i + 1;
            while (first < nestedEnd && isBlankOrComment(lines_[first])) first++;

            if (first < nestedEnd && trim(lines_[first]).compare(0, 1, "-") == 0) {
                JsonValue list = JsonValue::array();
                for (size_t j = first; j < nestedEnd; ++j) {
                    if (isBlankOrComment(lines_[j])) continue;
                    std::string item = trim(lines_[j]);
                    if (item.empty() || item[0] != '-') {
                        return VoidResult::error(parseError("Expected list item", j));
                    }
                    list.push(parseScalar(stripComment(trim(item.substr(1)))));
                }
                obj.set(key, std::move(list));
            } else {
                JsonValue nested = JsonValue::object();
                auto result = parseMapping(nested, indent + 1, i + 1, nestedEnd);
                if (result.isError()) {
                    return result;
                }
                obj.set(key, std::move(nested));
            }
            i = nestedEnd;
        }
        return VoidResult::success();
    }

    Result<JsonValue, ConfigError> parseInline(const std::string& value, size_t lineIndex) {
        if (value.front() != '[') {
            return Result<JsonValue, ConfigError>::success(parseScalar(value));
        }
        if (value.back() != ']') {
            return Result<JsonValue, ConfigError>::error(
                parseError("Unterminated flow list", lineIndex));
        }

        JsonValue list = JsonValue::array();
        std::string body = trim(value.substr(1, value.size() - 2));
        if (body.empty()) {
            return Result<JsonValue, ConfigError>::success(std::move(list));
        }

        std::istringstream items(body);
        std::string item;
        while (std::getline(items, item, ',')) {
            list.push(parseScalar(trim(item)));
        }
        return Result<JsonValue, ConfigError>::success(std::move(list));
    }

    static JsonValue parseScalar(const std::string& value) {
        std::string cleanValue = value;
        if (cleanValue.size() >= 2 &&
            ((cleanValue.front() == '"' && cleanValue.back() == '"') ||
             (cleanValue.front() == '\'' && cleanValue.back() == '\''))) {
            return JsonValue(cleanValue.substr(1, cleanValue.size() - 2));
        }

        std::string lower = toLower(cleanValue);
        if (lower == "true") return JsonValue(true);
        if (lower == "false") return JsonValue(false);
        if (lower == "null" || lower == "~" || lower.empty()) return JsonValue();

        char* end = nullptr;
        double num = std::strtod(cleanValue.c_str(), &end);
        if (end != nullptr && *end == '\0') {
            return JsonValue(num);
        }

        return JsonValue(cleanValue);
    }
};

// =============================================================================
// Document field readers
// =============================================================================

VoidResult readUnsigned(const JsonValue& section, const std::string& sectionName,
                        const char* key, uint32_t& out) {
    if (!section.contains(key)) {
        return VoidResult::success();
    }
    const JsonValue& value = section[key];
    double number = value.getDouble(-1.0);
    if (!value.isNumber() || number < 0 || std::trunc(number) != number ||
        number > 4294967295.0) {
        return validationError(sectionName + "." + key, "must be a non-negative integer");
    }
    out = static_cast<uint32_t>(number);
    return VoidResult::success();
}

VoidResult readMillis(const JsonValue& section, const std::string& sectionName,
                      const char* key, std::chrono::milliseconds& out) {
    uint32_t millis = static_cast<uint32_t>(out.count());
    auto result = readUnsigned(section, sectionName, key, millis);
    if (result.isSuccess()) {
        out = std::chrono::milliseconds(millis);
    }
    return result;
}

VoidResult readBool(const JsonValue& section, const std::string& sectionName,
                    const char* key, bool& out) {
    if (!section.contains(key)) {
        return VoidResult::success();
    }
    if (!section[key].isBool()) {
        return validationError(sectionName + "." + key, "must be true or false");
    }
    out = section[key].getBool();
    return VoidResult::success();
}

VoidResult readString(const JsonValue& section, const std::string& sectionName,
                      const char* key, std::string& out) {
    if (!section.contains(key)) {
        return VoidResult::success();
    }
    if (!section[key].isString()) {
        return validationError(sectionName + "." + key, "must be a string");
    }
    out = section[key].getString();
    return VoidResult::success();
}

VoidResult validateConfiguration(const Configuration& config) {
    if (config.server.port == 0) {
        return validationError("server.port", "must be between 1 and 65535");
    }
    if (config.server.backlog == 0) {
        return validationError("server.backlog", "must be greater than 0");
    }

    const PoolConfig& pool = config.pool;
    if (pool.maxConnectionsPerUser == 0) {
        return validationError("pool.maxConnectionsPerUser", "must be greater than 0");
    }
    if (pool.maxConnectionsPerTenant == 0) {
        return validationError("pool.maxConnectionsPerTenant", "must be greater than 0");
    }
    if (pool.maxTotalConnections == 0) {
        return validationError("pool.maxTotalConnections", "must be greater than 0");
    }
    if (pool.connectionTimeout.count() <= 0) {
        return validationError("pool.connectionTimeoutMs", "must be greater than 0");
    }
    if (pool.pingInterval.count() <= 0) {
        return validationError("pool.pingIntervalMs", "must be greater than 0");
    }
    if (pool.cleanupInterval.count() <= 0) {
        return validationError("pool.cleanupIntervalMs", "must be greater than 0");
    }
    if (pool.maxMessageQueueSize == 0) {
        return validationError("pool.maxMessageQueueSize", "must be greater than 0");
    }
    if (pool.backpressureThreshold > pool.maxMessageQueueSize) {
        return validationError("pool.backpressureThreshold",
                               "must not exceed pool.maxMessageQueueSize");
    }
    if (!(pool.dropRetentionRatio > 0.0 && pool.dropRetentionRatio <= 1.0)) {
        return validationError("pool.dropRetentionRatio", "must be in (0, 1]");
    }
    for (const auto& channel : pool.defaultChannels) {
        if (channel.empty()) {
            return validationError("pool.defaultChannels", "must not contain empty names");
        }
    }
    return VoidResult::success();
}

// Parses a base-10 unsigned integer occupying the whole string.
bool parseUnsigned(const std::string& text, uint32_t& out) {
    std::string value = trim(text);
    if (value.empty() || !std::isdigit(static_cast<unsigned char>(value[0]))) {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    unsigned long parsed = std::strtoul(value.c_str(), &end, 10);
    if (errno != 0 || end == nullptr || *end != '\0' || parsed > 4294967295UL) {
        return false;
    }
    out = static_cast<uint32_t>(parsed);
    return true;
}

bool parseDouble(const std::string& text, double& out) {
    std::string value = trim(text);
    if (value.empty()) {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    double parsed = std::strtod(value.c_str(), &end);
    if (errno != 0 || end == nullptr || *end != '\0') {
        return false;
    }
    out = parsed;
    return true;
}

bool parseBool(const std::string& text, bool& out) {
    std::string lower = toLower(trim(text));
    if (lower == "true" || lower == "1" || lower == "yes") {
        out = true;
        return true;
    }
    if (lower == "false" || lower == "0" || lower == "no") {
        out = false;
        return true;
    }
    return false;
}

const char* boolText(bool value) {
    return value ? "true" : "false";
}

} // anonymous namespace

// =============================================================================
// ConfigManager Implementation
// =============================================================================

ConfigManager::ConfigManager() = default;

ConfigManager::~ConfigManager() = default;

Result<void, ConfigError> ConfigManager::loadFromFile(const std::string& filePath) {
    bool supported = true;
    ConfigFormat format = detectFormat(filePath, supported);
    if (!supported) {
        return VoidResult::error(
            ConfigError(ConfigError::Code::UnsupportedFormat,
                        "Unsupported configuration file format. Use .json, .yaml, or .yml"));
    }

    auto contentResult = readFile(filePath);
    if (contentResult.isError()) {
        return VoidResult::error(contentResult.error());
    }

    auto result = format == ConfigFormat::JSON
        ? loadFromJsonString(contentResult.value())
        : loadFromYamlString(contentResult.value());
    if (result.isSuccess()) {
        log("Configuration loaded from " + filePath);
    }
    return result;
}

Result<void, ConfigError> ConfigManager::loadFromJsonString(const std::string& jsonContent) {
    auto parsed = parseJson(jsonContent);
    if (parsed.isError()) {
        return VoidResult::error(
            ConfigError(ConfigError::Code::ParseError,
                        parsed.error().message + " at offset " +
                            std::to_string(parsed.error().offset)));
    }

    auto result = applyDocument(parsed.value());
    if (result.isSuccess()) {
        logEffectiveConfig();
    }
    return result;
}

Result<void, ConfigError> ConfigManager::loadFromYamlString(const std::string& yamlContent) {
    YamlParser parser(yamlContent);
    auto parsed = parser.parse();
    if (parsed.isError()) {
        return VoidResult::error(parsed.error());
    }

    auto result = applyDocument(parsed.value());
    if (result.isSuccess()) {
        logEffectiveConfig();
    }
    return result;
}

Result<void, ConfigError> ConfigManager::loadDefaults() {
    {
        std::unique_lock<std::shared_mutex> lock(configMutex_);
        config_ = Configuration{};
    }

    log("Configuration loaded with default values");
    logEffectiveConfig();
    return VoidResult::success();
}

void ConfigManager::applyEnvironmentOverrides() {
    std::unique_lock<std::shared_mutex> lock(configMutex_);

    auto overrideUnsigned = [this](const char* name, uint32_t& target) {
        if (auto val = getEnvVar(name)) {
            uint32_t parsed = 0;
            if (parseUnsigned(*val, parsed)) {
                target = parsed;
                log(std::string("Environment override: ") + name + "=" + *val);
            } else {
                log(std::string("Warning: Invalid ") + name + " value: " + *val);
            }
        }
    };

    auto overrideMillis = [this](const char* name, std::chrono::milliseconds& target) {
        if (auto val = getEnvVar(name)) {
            uint32_t parsed = 0;
            if (parseUnsigned(*val, parsed)) {
                target = std::chrono::milliseconds(parsed);
                log(std::string("Environment override: ") + name + "=" + *val);
            } else {
                log(std::string("Warning: Invalid ") + name + " value: " + *val);
            }
        }
    };

    // Server settings
    if (auto val = getEnvVar("STREAMHUB_PORT")) {
        uint32_t port = 0;
        if (parseUnsigned(*val, port) && port > 0 && port <= 65535) {
            config_.server.port = static_cast<uint16_t>(port);
            log("Environment override: STREAMHUB_PORT=" + *val);
        } else {
            log("Warning: Invalid STREAMHUB_PORT value: " + *val);
        }
    }

    if (auto val = getEnvVar("STREAMHUB_BIND_ADDRESS")) {
        config_.server.bindAddress = *val;
        log("Environment override: STREAMHUB_BIND_ADDRESS=" + *val);
    }

    // Logging settings
    if (auto val = getEnvVar("STREAMHUB_LOG_LEVEL")) {
        if (auto level = parseLogLevelString(*val)) {
            config_.logging.level = *level;
            log("Environment override: STREAMHUB_LOG_LEVEL=" + *val);
        } else {
            log("Warning: Invalid STREAMHUB_LOG_LEVEL value: " + *val);
        }
    }

    if (auto val = getEnvVar("STREAMHUB_LOG_JSON")) {
        bool json = false;
        if (parseBool(*val, json)) {
            config_.logging.json = json;
            log("Environment override: STREAMHUB_LOG_JSON=" + *val);
        } else {
            log("Warning: Invalid STREAMHUB_LOG_JSON value: " + *val);
        }
    }

    // Pool settings
    overrideUnsigned("STREAMHUB_MAX_CONNECTIONS_PER_USER", config_.pool.maxConnectionsPerUser);
    overrideUnsigned("STREAMHUB_MAX_CONNECTIONS_PER_TENANT", config_.pool.maxConnectionsPerTenant);
    overrideUnsigned("STREAMHUB_MAX_TOTAL_CONNECTIONS", config_.pool.maxTotalConnections);
    overrideMillis("STREAMHUB_CONNECTION_TIMEOUT_MS", config_.pool.connectionTimeout);
    overrideMillis("STREAMHUB_PING_INTERVAL_MS", config_.pool.pingInterval);
    overrideMillis("STREAMHUB_CLEANUP_INTERVAL_MS", config_.pool.cleanupInterval);
    overrideUnsigned("STREAMHUB_MAX_MESSAGE_QUEUE_SIZE", config_.pool.maxMessageQueueSize);
    overrideUnsigned("STREAMHUB_BACKPRESSURE_THRESHOLD", config_.pool.backpressureThreshold);

    if (auto val = getEnvVar("STREAMHUB_DROP_RETENTION_RATIO")) {
        double ratio = 0.0;
        if (parseDouble(*val, ratio)) {
            config_.pool.dropRetentionRatio = ratio;
            log("Environment override: STREAMHUB_DROP_RETENTION_RATIO=" + *val);
        } else {
            log("Warning: Invalid STREAMHUB_DROP_RETENTION_RATIO value: " + *val);
        }
    }
}

Result<void, ConfigError> ConfigManager::validate() const {
    std::shared_lock<std::shared_mutex> lock(configMutex_);
    return validateConfiguration(config_);
}

Configuration ConfigManager::getConfig() const {
    std::shared_lock<std::shared_mutex> lock(configMutex_);
    return config_;
}

std::string ConfigManager::dumpConfig(ConfigFormat format) const {
    std::shared_lock<std::shared_mutex> lock(configMutex_);

    const auto& server = config_.server;
    const auto& logging = config_.logging;
    const auto& pool = config_.pool;
    std::ostringstream ss;

    if (format == ConfigFormat::JSON) {
        ss << "{\n";
        ss << "  \"server\": {\n";
        ss << "    \"bindAddress\": \"" << escapeJsonString(server.bindAddress) << "\",\n";
        ss << "    \"port\": " << server.port << ",\n";
        ss << "    \"backlog\": " << server.backlog << "\n";
        ss << "  },\n";
        ss << "  \"logging\": {\n";
        ss << "    \"level\": \"" << logLevelToString(logging.level) << "\",\n";
        ss << "    \"enableConsole\": " << boolText(logging.enableConsole) << ",\n";
        ss << "    \"enableSyslog\": " << boolText(logging.enableSyslog) << ",\n";
        ss << "    \"json\": " << boolText(logging.json) << "\n";
        ss << "  },\n";
        ss << "  \"pool\": {\n";
        ss << "    \"maxConnectionsPerUser\": " << pool.maxConnectionsPerUser << ",\n";
        ss << "    \"maxConnectionsPerTenant\": " << pool.maxConnectionsPerTenant << ",\n";
        ss << "    \"maxTotalConnections\": " << pool.maxTotalConnections << ",\n";
        ss << "    \"connectionTimeoutMs\": " << pool.connectionTimeout.count() << ",\n";
        ss << "    \"pingIntervalMs\": " << pool.pingInterval.count() << ",\n";
        ss << "    \"cleanupIntervalMs\": " << pool.cleanupInterval.count() << ",\n";
        ss << "    \"maxMessageQueueSize\": " << pool.maxMessageQueueSize << ",\n";
        ss << "    \"backpressureThreshold\": " << pool.backpressureThreshold << ",\n";
        ss << "    \"dropRetentionRatio\": " << pool.dropRetentionRatio << ",\n";
        ss << "    \"defaultChannels\": [";
        for (size_t i = 0; i < pool.defaultChannels.size(); ++i) {
            if (i > 0) ss << ", ";
            ss << "\"" << escapeJsonString(pool.defaultChannels[i]) << "\"";
        }
        ss << "]\n";
        ss << "  }\n";
        ss << "}\n";
    } else {
        ss << "server:\n";
        ss << "  bindAddress: \"" << server.bindAddress << "\"\n";
        ss << "  port: " << server.port << "\n";
        ss << "  backlog: " << server.backlog << "\n";
        ss << "logging:\n";
        ss << "  level: " << logLevelToString(logging.level) << "\n";
        ss << "  enableConsole: " << boolText(logging.enableConsole) << "\n";
        ss << "  enableSyslog: " << boolText(logging.enableSyslog) << "\n";
        ss << "  json: " << boolText(logging.json) << "\n";
        ss << "pool:\n";
        ss << "  maxConnectionsPerUser: " << pool.maxConnectionsPerUser << "\n";
        ss << "  maxConnectionsPerTenant: " << pool.maxConnectionsPerTenant << "\n";
        ss << "  maxTotalConnections: " << pool.maxTotalConnections << "\n";
        ss << "  connectionTimeoutMs: " << pool.connectionTimeout.count() << "\n";
        ss << "  pingIntervalMs: " << pool.pingInterval.count() << "\n";
        ss << "  cleanupIntervalMs: " << pool.cleanupInterval.count() << "\n";
        ss << "  maxMessageQueueSize: " << pool.maxMessageQueueSize << "\n";
        ss << "  backpressureThreshold: " << pool.backpressureThreshold << "\n";
        ss << "  dropRetentionRatio: " << pool.dropRetentionRatio << "\n";
        ss << "  defaultChannels: [";
        for (size_t i = 0; i < pool.defaultChannels.size(); ++i) {
            if (i > 0) ss << ", ";
            ss << pool.defaultChannels[i];
        }
        ss << "]\n";
    }

    return ss.str();
}

void ConfigManager::setLogCallback(ConfigLogCallback callback) {
    std::lock_guard<std::mutex> lock(logMutex_);
    logCallback_ = std::move(callback);
}

// =============================================================================
// Private Implementation
// =============================================================================

Result<void, ConfigError> ConfigManager::applyDocument(const JsonValue& root) {
    if (!root.isObject()) {
        return VoidResult::error(
            ConfigError(ConfigError::Code::ParseError,
                        "Configuration root must be an object"));
    }

    Configuration updated = getConfig();

    if (root.contains("server")) {
        const JsonValue& server = root["server"];
        auto r = readString(server, "server", "bindAddress", updated.server.bindAddress);
        if (r.isError()) return r;

        if (server.contains("port")) {
            int64_t port = server["port"].getInt(-1);
            if (!server["port"].isNumber() || port <= 0 || port > 65535) {
                return validationError("server.port", "must be between 1 and 65535");
            }
            updated.server.port = static_cast<uint16_t>(port);
        }

        r = readUnsigned(server, "server", "backlog", updated.server.backlog);
        if (r.isError()) return r;
    }

    if (root.contains("logging")) {
        const JsonValue& logging = root["logging"];
        if (logging.contains("level")) {
            std::string levelStr = logging["level"].getString();
            auto level = parseLogLevelString(levelStr);
            if (!level) {
                return VoidResult::error(
                    ConfigError(ConfigError::Code::ValidationError,
                                "Invalid logging.level: " + levelStr +
                                    ". Valid values: debug, info, warning, error",
                                "logging.level"));
            }
            updated.logging.level = *level;
        }

        auto r = readBool(logging, "logging", "enableConsole", updated.logging.enableConsole);
        if (r.isError()) return r;
        r = readBool(logging, "logging", "enableSyslog", updated.logging.enableSyslog);
        if (r.isError()) return r;
        r = readBool(logging, "logging", "json", updated.logging.json);
        if (r.isError()) return r;
    }

    if (root.contains("pool")) {
        const JsonValue& pool = root["pool"];
        PoolConfig& target = updated.pool;

        std::vector<VoidResult> reads;
        reads.push_back(readUnsigned(pool, "pool", "maxConnectionsPerUser", target.maxConnectionsPerUser));
        reads.push_back(readUnsigned(pool, "pool", "maxConnectionsPerTenant", target.maxConnectionsPerTenant));
        reads.push_back(readUnsigned(pool, "pool", "maxTotalConnections", target.maxTotalConnections));
        reads.push_back(readMillis(pool, "pool", "connectionTimeoutMs", target.connectionTimeout));
        reads.push_back(readMillis(pool, "pool", "pingIntervalMs", target.pingInterval));
        reads.push_back(readMillis(pool, "pool", "cleanupIntervalMs", target.cleanupInterval));
        reads.push_back(readUnsigned(pool, "pool", "maxMessageQueueSize", target.maxMessageQueueSize));
        reads.push_back(readUnsigned(pool, "pool", "backpressureThreshold", target.backpressureThreshold));
        for (const auto& read : reads) {
            if (read.isError()) return read;
        }

        if (pool.contains("dropRetentionRatio")) {
            if (!pool["dropRetentionRatio"].isNumber()) {
                return validationError("pool.dropRetentionRatio", "must be a number");
            }
            target.dropRetentionRatio = pool["dropRetentionRatio"].getDouble();
        }

        if (pool.contains("defaultChannels")) {
            const JsonValue& channels = pool["defaultChannels"];
            if (!channels.isArray()) {
                return validationError("pool.defaultChannels", "must be a list of channel names");
            }
            target.defaultChannels.clear();
            for (const auto& channel : channels.items()) {
                if (!channel.isString()) {
                    return validationError("pool.defaultChannels", "must be a list of channel names");
                }
                target.defaultChannels.push_back(channel.getString());
            }
        }
    }

    auto valid = validateConfiguration(updated);
    if (valid.isError()) {
        return valid;
    }

    std::unique_lock<std::shared_mutex> lock(configMutex_);
    config_ = std::move(updated);
    return VoidResult::success();
}

ConfigFormat ConfigManager::detectFormat(const std::string& filePath, bool& supported) const {
    supported = true;
    size_t dotPos = filePath.rfind('.');
    if (dotPos == std::string::npos) {
        return ConfigFormat::JSON;
    }

    std::string ext = toLower(filePath.substr(dotPos));
    if (ext == ".json") return ConfigFormat::JSON;
    if (ext == ".yaml" || ext == ".yml") return ConfigFormat::YAML;

    supported = false;
    return ConfigFormat::JSON;
}

Result<std::string, ConfigError> ConfigManager::readFile(const std::string& filePath) const {
    std::ifstream file(filePath);
    if (!file.is_open()) {
        return Result<std::string, ConfigError>::error(
            ConfigError(ConfigError::Code::FileNotFound,
                        "Configuration file not found: " + filePath));
    }

    std::ostringstream ss;
    ss << file.rdbuf();

    if (file.bad()) {
        return Result<std::string, ConfigError>::error(
            ConfigError(ConfigError::Code::IOError,
                        "Error reading configuration file: " + filePath));
    }

    return Result<std::string, ConfigError>::success(ss.str());
}

void ConfigManager::log(const std::string& message) const {
    std::lock_guard<std::mutex> lock(logMutex_);
    if (logCallback_) {
        logCallback_(message);
    }
}

void ConfigManager::logEffectiveConfig() const {
    Configuration config = getConfig();
    const auto& pool = config.pool;

    log("Effective configuration:");
    log("  server.bindAddress: " + config.server.bindAddress);
    log("  server.port: " + std::to_string(config.server.port));
    log("  logging.level: " + logLevelToString(config.logging.level));
    log("  logging.json: " + std::string(boolText(config.logging.json)));
    log("  pool.maxConnectionsPerUser: " + std::to_string(pool.maxConnectionsPerUser));
    log("  pool.maxConnectionsPerTenant: " + std::to_string(pool.maxConnectionsPerTenant));
    log("  pool.maxTotalConnections: " + std::to_string(pool.maxTotalConnections));
    log("  pool.connectionTimeoutMs: " + std::to_string(pool.connectionTimeout.count()));
    log("  pool.pingIntervalMs: " + std::to_string(pool.pingInterval.count()));
    log("  pool.cleanupIntervalMs: " + std::to_string(pool.cleanupInterval.count()));
    log("  pool.maxMessageQueueSize: " + std::to_string(pool.maxMessageQueueSize));
    log("  pool.backpressureThreshold: " + std::to_string(pool.backpressureThreshold));
    log("  pool.dropRetentionRatio: " + std::to_string(pool.dropRetentionRatio));
}

std::optional<std::string> ConfigManager::getEnvVar(const std::string& name) const {
    const char* value = std::getenv(name.c_str());
    if (value != nullptr) {
        return std::string(value);
    }
    return std::nullopt;
}

} // namespace core
} // namespace streamhub
