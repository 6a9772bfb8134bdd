/**
 * ************************************************************************
 *
 * @file Events.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-03
 * @version 0.1
 * @brief 通风口模块事件定义
 *
 * 事件分为两类：
 * 1. 序列通知 - 由 BreakSequence 自身的信号发布，订阅者按注册顺序调用
 *    SequenceStarted / PhaseChanged / SequenceCompleted
 *
 * 2. 触发事件 [IMMEDIATE] - 宿主通过 Dispatcher::Trigger() 投递
 *    KeyPressed / ContactEntered，由 VentTriggerSystem 处理
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#pragma once
#include <string>
#include "Policies.hpp"
#include "Types.hpp"

namespace vent::events
{

// =====================================================================
// A. 序列通知
// =====================================================================

/**
 * @brief 序列已启动（activate 时，延迟开始前）
 */
struct SequenceStarted
{
    using is_event_tag = void;
    Orientation initialRotation;
    Orientation targetRotation;
};

/**
 * @brief 阶段切换
 */
struct PhaseChanged
{
    using is_event_tag = void;
    policies::SequencePhase from;
    policies::SequencePhase to;
};

/**
 * @brief 序列完成（Finishing 阶段末尾，玩家状态切换之前）
 */
struct SequenceCompleted
{
    using is_event_tag = void;
    Orientation finalRotation;
};

// =====================================================================
// B. 触发事件
// =====================================================================

/**
 * @brief 按键按下
 * [IMMEDIATE] 使用 trigger
 */
struct KeyPressed
{
    using is_event_tag = void;
    std::string key;
};

/**
 * @brief 碰撞体进入触发区域
 * [IMMEDIATE] 使用 trigger
 */
struct ContactEntered
{
    using is_event_tag = void;
    std::string actorTag;
};

} // namespace vent::events
