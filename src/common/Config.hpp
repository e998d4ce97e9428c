#pragma once

#include <string>
#include <map>
#include <cstdint>

namespace datachat {

/**
 * Application configuration.
 *
 * Loaded from a key=value file (blank lines and '#' comments ignored),
 * then overridden by command-line flags. Timeouts must nest strictly:
 * server.request_timeout_ms > query.timeout_ms > worker.timeout_ms.
 */
struct AppConfig {
    // server.*
    std::string address = "0.0.0.0";
    unsigned short port = 8080;
    unsigned threads = 4;
    int64_t requestTimeoutMs = 120000;

    // storage.*
    std::string storagePath = "datachat.db";

    // cache.*
    size_t cacheCapacity = 32;

    // context.*
    size_t contextMaxEntries = 10;
    size_t contextMaxTokens = 0;      // 0 disables the token budget

    // query.*
    int64_t queryTimeoutMs = 90000;
    int64_t retryBackoffMs = 1000;
    size_t maxPromptChars = 2000;
    size_t maxAbandonedCalls = 8;

    // worker.*
    std::string workerUrl = "http://127.0.0.1:8765/v1/analyze";
    int64_t workerTimeoutMs = 60000;
    std::string workerApiKeyEnv = "DATACHAT_WORKER_API_KEY";
    std::string workerModel = "claude-sonnet-4-5";

    // log.*
    std::string logLevel = "info";
    std::string logFile;

    /**
     * Apply one key=value setting.
     * Returns false for unknown keys; throws std::invalid_argument for
     * malformed values.
     */
    bool set(const std::string& key, const std::string& value);

    /**
     * Check cross-field constraints.
     * Throws std::invalid_argument describing the first violation.
     */
    void validate() const;
};

class ConfigLoader {
public:
    /**
     * Parse key=value lines from a file. A leading '@' on the path is
     * accepted and stripped. Throws std::runtime_error if the file
     * cannot be opened.
     */
    static std::map<std::string, std::string> parseFile(const std::string& path);

    /**
     * Parse key=value lines from text.
     */
    static std::map<std::string, std::string> parseText(const std::string& text);

    /**
     * Apply parsed settings to a config; unknown keys are logged and skipped.
     */
    static void apply(AppConfig& config, const std::map<std::string, std::string>& settings);

    static AppConfig loadFile(const std::string& path);
};

} // namespace datachat
