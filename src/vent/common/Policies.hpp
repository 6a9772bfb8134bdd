/**
 * ************************************************************************
 *
 * @file Policies.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-02
 * @brief 通风口模块全局枚举定义
 *
 * ************************************************************************
 */
#pragma once
#include <cstdint>
#include <string_view>

namespace vent::policies
{

/**
 * @brief 破裂序列阶段
 * 只允许向后迁移，DONE 与 CANCELLED 为终态
 */
enum class SequencePhase : uint8_t
{
    IDLE,      // 未触发
    DELAYING,  // 初始延迟（通风口承重）
    ANIMATING, // 插值旋转
    SNAPPED,   // 已到达目标，等待收尾
    FINISHING, // 发出完成通知
    DONE,      // 结束
    CANCELLED  // 被外部取消
};

/**
 * @brief 玩家状态（由外部玩家控制器解释）
 */
enum class PlayerState : uint8_t
{
    LOCKED, // 演出中
    MOVING  // 自由移动
};

/**
 * @brief 序列使用的音效
 */
enum class AudioCue : uint8_t
{
    CREAK, // 开始松动
    UNLOAD // 谜题完成
};

/**
 * @brief 摄像机视角
 */
enum class CameraView : uint8_t
{
    MAIN, // 主摄像机
    END   // 结束演出摄像机
};

constexpr std::string_view toString(SequencePhase phase)
{
    switch (phase)
    {
        case SequencePhase::IDLE:
            return "Idle";
        case SequencePhase::DELAYING:
            return "Delaying";
        case SequencePhase::ANIMATING:
            return "Animating";
        case SequencePhase::SNAPPED:
            return "Snapped";
        case SequencePhase::FINISHING:
            return "Finishing";
        case SequencePhase::DONE:
            return "Done";
        case SequencePhase::CANCELLED:
            return "Cancelled";
    }
    return "Unknown";
}

constexpr std::string_view toString(AudioCue cue)
{
    return cue == AudioCue::CREAK ? "creak" : "unload";
}

} // namespace vent::policies
