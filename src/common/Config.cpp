#include "common/Config.hpp"
#include "common/Logger.hpp"
#include "common/StringUtil.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <limits>

namespace datachat {

namespace {

int64_t parseInt(const std::string& key, const std::string& value) {
    size_t consumed = 0;
    int64_t result = 0;
    try {
        result = std::stoll(value, &consumed);
    } catch (const std::logic_error&) {
        throw std::invalid_argument("Invalid integer for " + key + ": '" + value + "'");
    }
    if (consumed != value.size()) {
        throw std::invalid_argument("Invalid integer for " + key + ": '" + value + "'");
    }
    return result;
}

size_t parseSize(const std::string& key, const std::string& value) {
    int64_t v = parseInt(key, value);
    if (v < 0) {
        throw std::invalid_argument(key + " must not be negative");
    }
    return static_cast<size_t>(v);
}

} // anonymous namespace

bool AppConfig::set(const std::string& key, const std::string& value) {
    if (key == "server.address") {
        address = value;
    } else if (key == "server.port") {
        int64_t p = parseInt(key, value);
        if (p <= 0 || p > std::numeric_limits<unsigned short>::max()) {
            throw std::invalid_argument("server.port out of range: " + value);
        }
        port = static_cast<unsigned short>(p);
    } else if (key == "server.threads") {
        threads = static_cast<unsigned>(parseSize(key, value));
    } else if (key == "server.request_timeout_ms") {
        requestTimeoutMs = parseInt(key, value);
    } else if (key == "storage.path") {
        storagePath = value;
    } else if (key == "cache.capacity") {
        cacheCapacity = parseSize(key, value);
    } else if (key == "context.max_entries") {
        contextMaxEntries = parseSize(key, value);
    } else if (key == "context.max_tokens") {
        contextMaxTokens = parseSize(key, value);
    } else if (key == "query.timeout_ms") {
        queryTimeoutMs = parseInt(key, value);
    } else if (key == "query.retry_backoff_ms") {
        retryBackoffMs = parseInt(key, value);
    } else if (key == "query.max_prompt_chars") {
        maxPromptChars = parseSize(key, value);
    } else if (key == "query.max_abandoned_calls") {
        maxAbandonedCalls = parseSize(key, value);
    } else if (key == "worker.url") {
        workerUrl = value;
    } else if (key == "worker.timeout_ms") {
        workerTimeoutMs = parseInt(key, value);
    } else if (key == "worker.api_key_env") {
        workerApiKeyEnv = value;
    } else if (key == "worker.model") {
        workerModel = value;
    } else if (key == "log.level") {
        Logger::parseLevel(value);
        logLevel = value;
    } else if (key == "log.file") {
        logFile = value;
    } else {
        return false;
    }
    return true;
}

void AppConfig::validate() const {
    if (threads == 0) {
        throw std::invalid_argument("server.threads must be at least 1");
    }
    if (cacheCapacity == 0) {
        throw std::invalid_argument("cache.capacity must be at least 1");
    }
    if (contextMaxEntries == 0) {
        throw std::invalid_argument("context.max_entries must be at least 1");
    }
    if (maxPromptChars == 0) {
        throw std::invalid_argument("query.max_prompt_chars must be at least 1");
    }
    if (maxAbandonedCalls == 0) {
        throw std::invalid_argument("query.max_abandoned_calls must be at least 1");
    }
    if (retryBackoffMs < 0) {
        throw std::invalid_argument("query.retry_backoff_ms must not be negative");
    }
    if (workerTimeoutMs <= 0) {
        throw std::invalid_argument("worker.timeout_ms must be positive");
    }
    if (queryTimeoutMs <= workerTimeoutMs) {
        throw std::invalid_argument("query.timeout_ms (" + std::to_string(queryTimeoutMs) +
                                    ") must exceed worker.timeout_ms (" +
                                    std::to_string(workerTimeoutMs) + ")");
    }
    if (requestTimeoutMs <= queryTimeoutMs) {
        throw std::invalid_argument("server.request_timeout_ms (" + std::to_string(requestTimeoutMs) +
                                    ") must exceed query.timeout_ms (" +
                                    std::to_string(queryTimeoutMs) + ")");
    }
    if (workerUrl.rfind("http://", 0) != 0) {
        throw std::invalid_argument("worker.url must start with http://");
    }
}

std::map<std::string, std::string> ConfigLoader::parseText(const std::string& text) {
    std::map<std::string, std::string> settings;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        std::string key = trim(line.substr(0, eq));
        std::string val = trim(line.substr(eq + 1));
        settings[key] = val;
    }
    return settings;
}

std::map<std::string, std::string> ConfigLoader::parseFile(const std::string& path) {
    std::string filePath = path;
    if (!filePath.empty() && filePath[0] == '@') filePath = filePath.substr(1);

    std::ifstream in(filePath);
    if (!in.is_open()) {
        throw std::runtime_error("Cannot open config file: " + filePath);
    }

    std::ostringstream content;
    content << in.rdbuf();
    return parseText(content.str());
}

void ConfigLoader::apply(AppConfig& config, const std::map<std::string, std::string>& settings) {
    for (const auto& [key, value] : settings) {
        if (!config.set(key, value)) {
            LOG_WARN("config", "Ignoring unknown setting: " + key);
        }
    }
}

AppConfig ConfigLoader::loadFile(const std::string& path) {
    AppConfig config;
    apply(config, parseFile(path));
    LOG_INFO("config", "Loaded configuration from " + path);
    return config;
}

} // namespace datachat
