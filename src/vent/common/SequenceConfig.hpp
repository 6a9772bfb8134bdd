/**
 * ************************************************************************
 *
 * @file SequenceConfig.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-04
 * @version 0.1
 * @brief 通风口破裂序列配置
  - 七个可调参数，构造后不可变
  - 校验失败返回 ConfigError，不抛异常
  - 支持 JSON 配置文件读写
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#pragma once
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>

namespace vent
{

enum class ConfigError : std::uint8_t
{
    InvalidResistanceFraction,    // resistanceFraction 不在 (0,1)
    NegativeDuration,             // durationSeconds < 0
    NegativeDelay,                // initialDelaySeconds < 0
    InvalidBreakSharpness,        // breakSharpness <= 0
    NegativeOscillationFrequency, // oscillationFrequency < 0
    NegativeDampingRate,          // dampingRate < 0
    NonFiniteValue,               // NaN / Inf
    FileNotFound,                 // 配置文件不存在
    ParseFailed,                  // JSON 格式或类型错误
    MissingField                  // 缺少必需的节点
};

[[nodiscard]] std::string_view toString(ConfigError error);

/**
 * @brief 破裂动画参数
 */
struct SequenceConfig
{
    float targetAngleX = -75.0F;        // 目标 X 轴旋转（度）
    float durationSeconds = 1.5F;       // 动画时长
    float initialDelaySeconds = 0.2F;   // 开始松动前的延迟
    float resistanceFraction = 0.8F;    // 阻力阶段占比 (0,1)
    float breakSharpness = 8.0F;        // 断裂陡峭度（指数）
    float oscillationFrequency = 5.0F;  // 回弹振荡频率
    float dampingRate = 3.0F;           // 振荡衰减率
};

/**
 * @brief 音效资源 ID，空字符串表示未配置
 */
struct AudioCues
{
    std::string creakClip;
    std::string unloadClip;
};

/**
 * @brief 触发条件
 */
struct TriggerConfig
{
    std::string key = "F2";
    std::string actorTag = "Player";
};

/**
 * @brief 配置文件整体
 */
struct VentConfig
{
    SequenceConfig sequence;
    AudioCues audio;
    TriggerConfig trigger;
};

/**
 * @brief 校验配置，按字段顺序返回第一个错误
 */
[[nodiscard]] std::expected<void, ConfigError> validateConfig(const SequenceConfig& config);

/**
 * @brief 从 JSON 解析配置，sequence 节点必须存在，其中缺省的字段取默认值
 */
[[nodiscard]] std::expected<VentConfig, ConfigError> parseVentConfig(const nlohmann::json& json);

/**
 * @brief 读取并解析配置文件
 */
[[nodiscard]] std::expected<VentConfig, ConfigError> loadVentConfig(const std::filesystem::path& path);

[[nodiscard]] nlohmann::json toJson(const VentConfig& config);

} // namespace vent
