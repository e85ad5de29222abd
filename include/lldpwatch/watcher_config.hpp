#pragma once
#include "logger.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <fstream>
#include <stdexcept>
#include <string>
namespace NSNAME
{
// Delay grows by multiplier after every failed cycle, up to maxDelay.
struct RetryPolicy
{
    std::chrono::milliseconds initialDelay{500};
    std::chrono::milliseconds maxDelay{30000};
    double multiplier{2.0};
};

class Backoff
{
  public:
    explicit Backoff(RetryPolicy policy) :
        policy(policy), current(policy.initialDelay)
    {}
    std::chrono::milliseconds next()
    {
        auto delay = std::min(current, policy.maxDelay);
        // Compared as double, the product may not fit in milliseconds.
        auto grown = static_cast<double>(current.count()) * policy.multiplier;
        if (!(grown < static_cast<double>(policy.maxDelay.count())))
        {
            current = policy.maxDelay;
        }
        else
        {
            current = std::max(
                std::chrono::milliseconds(static_cast<long long>(grown)),
                policy.initialDelay);
        }
        return delay;
    }
    void reset()
    {
        current = policy.initialDelay;
    }

  private:
    RetryPolicy policy;
    std::chrono::milliseconds current;
};

struct WatcherConfig
{
    // Control socket of lldpd, empty for the library default.
    std::string socket;
    RetryPolicy retry;
    std::string logLevel{"info"};
};

inline WatcherConfig parseWatcherConfig(const nlohmann::json& json)
{
    WatcherConfig config;
    config.socket = json.value("socket", std::string{});
    config.retry.initialDelay = std::chrono::milliseconds(json.value(
        "initial-backoff-ms", config.retry.initialDelay.count()));
    config.retry.maxDelay = std::chrono::milliseconds(
        json.value("max-backoff-ms", config.retry.maxDelay.count()));
    config.retry.multiplier =
        json.value("backoff-multiplier", config.retry.multiplier);
    config.logLevel = json.value("log-level", config.logLevel);
    if (config.retry.initialDelay.count() <= 0 ||
        config.retry.maxDelay < config.retry.initialDelay ||
        !(config.retry.multiplier >= 1.0))
    {
        throw std::invalid_argument("Invalid backoff settings in config");
    }
    return config;
}

inline WatcherConfig loadWatcherConfig(const std::string& path)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        throw std::runtime_error("Config File Not Found:" + path);
    }
    return parseWatcherConfig(nlohmann::json::parse(file));
}

inline void applyLogLevel(const WatcherConfig& config)
{
    auto level = spdlog::level::from_str(config.logLevel);
    if (level == spdlog::level::off && config.logLevel != "off")
    {
        LOG_WARNING("Unknown log level {}, keeping current", config.logLevel);
        return;
    }
    setLogLevel(level);
}
} // namespace NSNAME
