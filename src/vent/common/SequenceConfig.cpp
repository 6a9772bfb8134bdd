/**
 * ************************************************************************
 *
 * @file SequenceConfig.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-04
 * @version 0.1
 * @brief 通风口破裂序列配置实现
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#include "SequenceConfig.hpp"
#include <cmath>
#include <fstream>
#include "../singleton/Logger.hpp"

namespace vent
{

std::string_view toString(ConfigError error)
{
    switch (error)
    {
        case ConfigError::InvalidResistanceFraction:
            return "resistanceFraction must be in (0, 1)";
        case ConfigError::NegativeDuration:
            return "durationSeconds must not be negative";
        case ConfigError::NegativeDelay:
            return "initialDelaySeconds must not be negative";
        case ConfigError::InvalidBreakSharpness:
            return "breakSharpness must be positive";
        case ConfigError::NegativeOscillationFrequency:
            return "oscillationFrequency must not be negative";
        case ConfigError::NegativeDampingRate:
            return "dampingRate must not be negative";
        case ConfigError::NonFiniteValue:
            return "config contains NaN or infinite value";
        case ConfigError::FileNotFound:
            return "config file not found";
        case ConfigError::ParseFailed:
            return "config file is not valid json";
        case ConfigError::MissingField:
            return "config is missing a required section";
    }
    return "unknown config error";
}

std::expected<void, ConfigError> validateConfig(const SequenceConfig& config)
{
    const float fields[] = {config.targetAngleX,
                            config.durationSeconds,
                            config.initialDelaySeconds,
                            config.resistanceFraction,
                            config.breakSharpness,
                            config.oscillationFrequency,
                            config.dampingRate};
    for (float value : fields)
    {
        if (!std::isfinite(value))
        {
            return std::unexpected(ConfigError::NonFiniteValue);
        }
    }

    if (config.durationSeconds < 0.0F)
    {
        return std::unexpected(ConfigError::NegativeDuration);
    }
    if (config.initialDelaySeconds < 0.0F)
    {
        return std::unexpected(ConfigError::NegativeDelay);
    }
    // 曲线中会除以 r 和 1 - r
    if (config.resistanceFraction <= 0.0F || config.resistanceFraction >= 1.0F)
    {
        return std::unexpected(ConfigError::InvalidResistanceFraction);
    }
    if (config.breakSharpness <= 0.0F)
    {
        return std::unexpected(ConfigError::InvalidBreakSharpness);
    }
    if (config.oscillationFrequency < 0.0F)
    {
        return std::unexpected(ConfigError::NegativeOscillationFrequency);
    }
    if (config.dampingRate < 0.0F)
    {
        return std::unexpected(ConfigError::NegativeDampingRate);
    }
    return {};
}

std::expected<VentConfig, ConfigError> parseVentConfig(const nlohmann::json& json)
{
    if (!json.is_object() || !json.contains("sequence"))
    {
        return std::unexpected(ConfigError::MissingField);
    }

    VentConfig config;
    try
    {
        const auto& seq = json.at("sequence");
        SequenceConfig& out = config.sequence;
        out.targetAngleX = seq.value("targetAngleX", out.targetAngleX);
        out.durationSeconds = seq.value("durationSeconds", out.durationSeconds);
        out.initialDelaySeconds = seq.value("initialDelaySeconds", out.initialDelaySeconds);
        out.resistanceFraction = seq.value("resistanceFraction", out.resistanceFraction);
        out.breakSharpness = seq.value("breakSharpness", out.breakSharpness);
        out.oscillationFrequency = seq.value("oscillationFrequency", out.oscillationFrequency);
        out.dampingRate = seq.value("dampingRate", out.dampingRate);

        if (const auto iter = json.find("audio"); iter != json.end())
        {
            config.audio.creakClip = iter->value("creak", std::string{});
            config.audio.unloadClip = iter->value("unload", std::string{});
        }
        if (const auto iter = json.find("trigger"); iter != json.end())
        {
            config.trigger.key = iter->value("key", config.trigger.key);
            config.trigger.actorTag = iter->value("actorTag", config.trigger.actorTag);
        }
    }
    catch (const nlohmann::json::exception& ex)
    {
        Logger::warn("[config] parse failed: {}", ex.what());
        return std::unexpected(ConfigError::ParseFailed);
    }

    if (auto valid = validateConfig(config.sequence); !valid)
    {
        return std::unexpected(valid.error());
    }
    return config;
}

std::expected<VentConfig, ConfigError> loadVentConfig(const std::filesystem::path& path)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        Logger::warn("[config] cannot open {}", path.string());
        return std::unexpected(ConfigError::FileNotFound);
    }

    // 不抛异常，失败时返回 discarded 值
    const auto json = nlohmann::json::parse(file, nullptr, false);
    if (json.is_discarded())
    {
        Logger::warn("[config] {} is not valid json", path.string());
        return std::unexpected(ConfigError::ParseFailed);
    }
    return parseVentConfig(json);
}

nlohmann::json toJson(const VentConfig& config)
{
    const SequenceConfig& seq = config.sequence;
    return {{"sequence",
             {{"targetAngleX", seq.targetAngleX},
              {"durationSeconds", seq.durationSeconds},
              {"initialDelaySeconds", seq.initialDelaySeconds},
              {"resistanceFraction", seq.resistanceFraction},
              {"breakSharpness", seq.breakSharpness},
              {"oscillationFrequency", seq.oscillationFrequency},
              {"dampingRate", seq.dampingRate}}},
            {"audio", {{"creak", config.audio.creakClip}, {"unload", config.audio.unloadClip}}},
            {"trigger", {{"key", config.trigger.key}, {"actorTag", config.trigger.actorTag}}}};
}

} // namespace vent
