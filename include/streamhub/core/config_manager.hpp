// StreamHub - Real-time event fan-out server
// Configuration Manager - Handles configuration loading and validation
//
// Responsibilities:
// - Parse JSON and YAML configuration documents
// - Apply STREAMHUB_* environment variable overrides
// - Validate pool limits and intervals with field-level error messages
// - Report the effective configuration after every load

#ifndef STREAMHUB_CORE_CONFIG_MANAGER_HPP
#define STREAMHUB_CORE_CONFIG_MANAGER_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "streamhub/core/result.hpp"
#include "streamhub/core/structured_logger.hpp"
#include "streamhub/core/types.hpp"

namespace streamhub {
namespace core {

class JsonValue;

// =============================================================================
// Configuration Format Enumeration
// =============================================================================

/**
 * @brief Configuration document format.
 */
enum class ConfigFormat {
    JSON,
    YAML
};

// =============================================================================
// Configuration Structures
// =============================================================================

/**
 * @brief Listener settings used by the example server.
 */
struct ServerConfig {
    std::string bindAddress = "0.0.0.0";  ///< Bind address (default: all interfaces)
    uint16_t port = 8080;                 ///< Listening port
    uint32_t backlog = 128;               ///< listen() backlog
};

/**
 * @brief Logging configuration section.
 */
struct LoggingConfig {
    LogLevelConfig level = LogLevelConfig::Info;
    bool enableConsole = true;            ///< Write to stderr
    bool enableSyslog = false;            ///< Forward to syslog
    bool json = false;                    ///< One-line JSON records
};

/**
 * @brief Connection pool limits, timers and queue policy.
 */
struct PoolConfig {
    uint32_t maxConnectionsPerUser = 5;
    uint32_t maxConnectionsPerTenant = 1000;
    uint32_t maxTotalConnections = 10000;

    std::chrono::milliseconds connectionTimeout{120000};  ///< Inactivity before sweep
    std::chrono::milliseconds pingInterval{30000};        ///< Keepalive period
    std::chrono::milliseconds cleanupInterval{60000};     ///< Sweep period

    uint32_t maxMessageQueueSize = 100;
    uint32_t backpressureThreshold = 50;  ///< Queue depth reported as congested
    double dropRetentionRatio = 0.7;      ///< Share of the queue kept by the drop policy

    std::vector<ChannelName> defaultChannels{"system"};
};

/**
 * @brief Complete StreamHub configuration.
 */
struct Configuration {
    ServerConfig server;
    LoggingConfig logging;
    PoolConfig pool;
};

// =============================================================================
// Configuration Error
// =============================================================================

/**
 * @brief Configuration error with detailed information.
 */
struct ConfigError {
    enum class Code {
        None,
        FileNotFound,
        ParseError,
        ValidationError,
        UnsupportedFormat,
        IOError
    };

    Code code = Code::None;
    std::string message;
    std::string field;        ///< Field that caused the error (if applicable)
    int line = -1;            ///< Line number in the document (if applicable)

    ConfigError() = default;
    ConfigError(Code c, std::string msg) : code(c), message(std::move(msg)) {}
    ConfigError(Code c, std::string msg, std::string f)
        : code(c), message(std::move(msg)), field(std::move(f)) {}
    ConfigError(Code c, std::string msg, std::string f, int l)
        : code(c), message(std::move(msg)), field(std::move(f)), line(l) {}
};

// =============================================================================
// Configuration Manager
// =============================================================================

/**
 * @brief Log callback type for configuration logging.
 */
using ConfigLogCallback = std::function<void(const std::string&)>;

/**
 * @brief Loads and validates the StreamHub configuration.
 *
 * Precedence, lowest first: built-in defaults, a configuration document,
 * environment variables. A document only overrides the keys it names.
 *
 * Thread Safety:
 * - All public methods are thread-safe
 * - Uses shared_mutex for read/write locking
 *
 * @code
 * ConfigManager manager;
 * manager.setLogCallback([&](const std::string& msg) { logger->info(msg, "Config"); });
 *
 * if (manager.loadFromFile("streamhub.yaml").isError()) {
 *     manager.loadDefaults();
 * }
 * manager.applyEnvironmentOverrides();
 *
 * auto valid = manager.validate();
 * if (valid.isError()) {
 *     std::cerr << valid.error().field << ": " << valid.error().message;
 *     return 1;
 * }
 * ConnectionPool pool(manager.getConfig().pool, timerPal, logger);
 * @endcode
 */
class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager();

    // Non-copyable and non-movable (contains mutex)
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;
    ConfigManager(ConfigManager&&) = delete;
    ConfigManager& operator=(ConfigManager&&) = delete;

    // -------------------------------------------------------------------------
    // Configuration Loading
    // -------------------------------------------------------------------------

    /**
     * @brief Load configuration from a file.
     *
     * Format is chosen by extension: .json, or .yaml / .yml.
     */
    Result<void, ConfigError> loadFromFile(const std::string& filePath);

    Result<void, ConfigError> loadFromJsonString(const std::string& jsonContent);

    /**
     * @brief Load configuration from a YAML string.
     *
     * Supports the subset used by configuration files: nested mappings by
     * two-space indentation, scalars, comments, and flow lists ("[a, b]").
     */
    Result<void, ConfigError> loadFromYamlString(const std::string& yamlContent);

    /**
     * @brief Reset every value to its built-in default.
     */
    Result<void, ConfigError> loadDefaults();

    // -------------------------------------------------------------------------
    // Environment Variable Overrides
    // -------------------------------------------------------------------------

    /**
     * @brief Apply environment variable overrides.
     *
     * Recognized: STREAMHUB_PORT, STREAMHUB_BIND_ADDRESS, STREAMHUB_LOG_LEVEL,
     * STREAMHUB_LOG_JSON, STREAMHUB_MAX_CONNECTIONS_PER_USER,
     * STREAMHUB_MAX_CONNECTIONS_PER_TENANT, STREAMHUB_MAX_TOTAL_CONNECTIONS,
     * STREAMHUB_CONNECTION_TIMEOUT_MS, STREAMHUB_PING_INTERVAL_MS,
     * STREAMHUB_CLEANUP_INTERVAL_MS, STREAMHUB_MAX_MESSAGE_QUEUE_SIZE,
     * STREAMHUB_BACKPRESSURE_THRESHOLD, STREAMHUB_DROP_RETENTION_RATIO.
     *
     * Unparseable values are reported through the log callback and ignored.
     */
    void applyEnvironmentOverrides();

    // -------------------------------------------------------------------------
    // Validation
    // -------------------------------------------------------------------------

    /**
     * @brief Validate the current configuration.
     *
     * @return The first violation found, with ConfigError::field naming
     *         the offending key (e.g. "pool.maxMessageQueueSize")
     */
    Result<void, ConfigError> validate() const;

    // -------------------------------------------------------------------------
    // Configuration Access
    // -------------------------------------------------------------------------

    /**
     * @brief Snapshot of the current configuration.
     */
    Configuration getConfig() const;

    /**
     * @brief Render the effective configuration.
     */
    std::string dumpConfig(ConfigFormat format = ConfigFormat::JSON) const;

    /**
     * @brief Set the configuration log callback.
     *
     * Receives override notices, invalid environment values and the
     * effective configuration after each successful load.
     */
    void setLogCallback(ConfigLogCallback callback);

private:
    Result<void, ConfigError> applyDocument(const JsonValue& root);
    ConfigFormat detectFormat(const std::string& filePath, bool& supported) const;
    Result<std::string, ConfigError> readFile(const std::string& filePath) const;
    void log(const std::string& message) const;
    void logEffectiveConfig() const;
    std::optional<std::string> getEnvVar(const std::string& name) const;

    Configuration config_;
    mutable std::shared_mutex configMutex_;

    ConfigLogCallback logCallback_;
    mutable std::mutex logMutex_;
};

} // namespace core
} // namespace streamhub

#endif // STREAMHUB_CORE_CONFIG_MANAGER_HPP
