/**
 * ************************************************************************
 *
 * @file BreakSequence.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-06
 * @version 0.1
 * @brief 通风口破裂演出序列
    Idle -> Delaying -> Animating -> Snapped -> Finishing -> Done

    - 单次触发：activate 只在 Idle 时生效，之后重复调用直接忽略
    - 每帧由宿主调用 step(deltaTime)，不阻塞、不自建线程
    - 所有等待都以累计时间与阈值比较实现
    - 音效、玩家状态等外部协作者缺失时跳过，不影响阶段推进
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#pragma once
#include <entt/entt.hpp>
#include <expected>
#include "../animation/EasingCurve.hpp"
#include "../common/Events.hpp"
#include "../common/Policies.hpp"
#include "../common/SequenceConfig.hpp"
#include "../common/Types.hpp"
#include "../interface/IAudioSink.hpp"
#include "../interface/IOrientationStore.hpp"
#include "../interface/IPlayerStateNotifier.hpp"

namespace vent
{

/**
 * @brief 序列依赖的外部对象，均为非拥有指针，可以为空
 */
struct SequenceCollaborators
{
    interface::IOrientationStore* orientation = nullptr;
    interface::IAudioSink* audio = nullptr;
    interface::IPlayerStateNotifier* playerState = nullptr;
    AudioCues cues;
};

class BreakSequence
{
public:
    using Phase = policies::SequencePhase;

    static constexpr float POST_SNAP_DELAY_SECONDS = 0.60F; // 到达目标后到发出完成通知的等待

    /**
     * @brief 校验配置并创建序列，配置非法时返回 ConfigError
     */
    [[nodiscard]] static std::expected<BreakSequence, ConfigError> create(const SequenceConfig& config,
                                                                          SequenceCollaborators collaborators);

    /**
     * @brief 记录当前外部朝向作为初始朝向，只在第一次调用时生效
     */
    void captureInitialRotation();

    /**
     * @brief 触发序列
     * 已触发过则什么都不做
     */
    void activate();

    /**
     * @brief 推进一帧
     * @param deltaTime 帧间隔（秒），负数或 NaN 视为 0
     */
    void step(float deltaTime);

    /**
     * @brief 中止尚未收尾的序列，不会发出完成通知
     * @return 是否真的进入了 Cancelled
     */
    bool cancel();

    [[nodiscard]] Phase phase() const { return m_phase; }
    [[nodiscard]] bool triggered() const { return m_phase != Phase::IDLE; }
    [[nodiscard]] bool finished() const { return m_phase == Phase::DONE || m_phase == Phase::CANCELLED; }
    [[nodiscard]] float elapsed() const { return m_elapsed; }
    [[nodiscard]] const Orientation& initialRotation() const { return m_initialRotation; }
    [[nodiscard]] const Orientation& targetRotation() const { return m_targetRotation; }
    [[nodiscard]] const SequenceConfig& config() const { return m_config; }
    [[nodiscard]] const animation::EasingCurve& curve() const { return m_curve; }

    // ========== 通知订阅 ==========

    auto onStarted() { return entt::sink{m_onStarted}; }
    auto onPhaseChanged() { return entt::sink{m_onPhaseChanged}; }
    auto onCompleted() { return entt::sink{m_onCompleted}; }

private:
    BreakSequence(const SequenceConfig& config, SequenceCollaborators collaborators);

    void transitionTo(Phase next);
    void stepDelaying(float deltaTime);
    void stepAnimating(float deltaTime);
    void stepSnapped(float deltaTime);
    void finish();
    void playCue(policies::AudioCue cue);

    SequenceConfig m_config;
    animation::EasingCurve m_curve;
    SequenceCollaborators m_collaborators;

    Phase m_phase = Phase::IDLE;
    float m_elapsed = 0.0F;
    bool m_rotationCaptured = false;
    Orientation m_initialRotation = Orientation::Identity();
    Orientation m_targetRotation = Orientation::Identity();

    entt::sigh<void(const events::SequenceStarted&)> m_onStarted;
    entt::sigh<void(const events::PhaseChanged&)> m_onPhaseChanged;
    entt::sigh<void(const events::SequenceCompleted&)> m_onCompleted;
};

} // namespace vent
