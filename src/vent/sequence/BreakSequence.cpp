/**
 * ************************************************************************
 *
 * @file BreakSequence.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-06
 * @version 0.1
 * @brief 通风口破裂演出序列实现
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#include "BreakSequence.hpp"
#include "../common/Orientation.hpp"
#include "../singleton/Logger.hpp"

namespace vent
{

std::expected<BreakSequence, ConfigError> BreakSequence::create(const SequenceConfig& config,
                                                                SequenceCollaborators collaborators)
{
    if (auto valid = validateConfig(config); !valid)
    {
        Logger::error("[BreakSequence] rejected config: {}", toString(valid.error()));
        return std::unexpected(valid.error());
    }
    return BreakSequence(config, std::move(collaborators));
}

BreakSequence::BreakSequence(const SequenceConfig& config, SequenceCollaborators collaborators)
    : m_config(config), m_curve(config), m_collaborators(std::move(collaborators))
{
}

void BreakSequence::captureInitialRotation()
{
    if (m_rotationCaptured)
    {
        return;
    }
    m_rotationCaptured = true;

    if (m_collaborators.orientation == nullptr)
    {
        Logger::warn("[BreakSequence] no orientation store, initial rotation defaults to identity");
        return;
    }
    m_initialRotation = m_collaborators.orientation->getCurrentOrientation();
}

void BreakSequence::activate()
{
    if (m_phase != Phase::IDLE)
    {
        Logger::debug("[BreakSequence] already triggered ({}), ignoring activate", policies::toString(m_phase));
        return;
    }

    captureInitialRotation();
    m_targetRotation = withPitch(m_initialRotation, m_config.targetAngleX);
    m_elapsed = 0.0F;

    Logger::info("[BreakSequence] activated, target pitch {} deg", m_config.targetAngleX);
    m_onStarted.publish(events::SequenceStarted{.initialRotation = m_initialRotation,
                                                .targetRotation = m_targetRotation});
    transitionTo(Phase::DELAYING);
}

void BreakSequence::step(float deltaTime)
{
    // 负数和 NaN 都不推进时间
    if (!(deltaTime > 0.0F))
    {
        deltaTime = 0.0F;
    }

    switch (m_phase)
    {
        case Phase::DELAYING:
            stepDelaying(deltaTime);
            break;
        case Phase::ANIMATING:
            stepAnimating(deltaTime);
            break;
        case Phase::SNAPPED:
            stepSnapped(deltaTime);
            break;
        case Phase::FINISHING:
            finish();
            break;
        case Phase::IDLE:
        case Phase::DONE:
        case Phase::CANCELLED:
            break;
    }
}

bool BreakSequence::cancel()
{
    switch (m_phase)
    {
        case Phase::DELAYING:
        case Phase::ANIMATING:
        case Phase::SNAPPED:
            Logger::warn("[BreakSequence] cancelled during {}", policies::toString(m_phase));
            transitionTo(Phase::CANCELLED);
            return true;
        default:
            return false;
    }
}

void BreakSequence::transitionTo(Phase next)
{
    const Phase previous = m_phase;
    m_phase = next;
    Logger::debug("[BreakSequence] {} -> {}", policies::toString(previous), policies::toString(next));
    m_onPhaseChanged.publish(events::PhaseChanged{.from = previous, .to = next});
}

void BreakSequence::stepDelaying(float deltaTime)
{
    m_elapsed += deltaTime;
    if (m_elapsed < m_config.initialDelaySeconds)
    {
        return;
    }

    playCue(policies::AudioCue::CREAK);
    m_elapsed = 0.0F;
    transitionTo(Phase::ANIMATING);
}

void BreakSequence::stepAnimating(float deltaTime)
{
    m_elapsed += deltaTime;

    if (m_elapsed >= m_config.durationSeconds)
    {
        // 直接写入目标值，消除曲线的浮点误差
        if (m_collaborators.orientation != nullptr)
        {
            m_collaborators.orientation->setOrientation(m_targetRotation);
        }
        Logger::info("[BreakSequence] snapped to target");
        m_elapsed = 0.0F;
        transitionTo(Phase::SNAPPED);
        return;
    }

    if (m_collaborators.orientation == nullptr)
    {
        return;
    }
    const float normalized = clamp01(m_elapsed / m_config.durationSeconds);
    const float t = m_curve.progress(normalized);
    auto* store = m_collaborators.orientation;
    store->setOrientation(store->blend(m_initialRotation, m_targetRotation, t));
}

void BreakSequence::stepSnapped(float deltaTime)
{
    m_elapsed += deltaTime;
    if (m_elapsed < POST_SNAP_DELAY_SECONDS)
    {
        return;
    }

    playCue(policies::AudioCue::UNLOAD);
    transitionTo(Phase::FINISHING);
    finish();
}

void BreakSequence::finish()
{
    const Orientation finalRotation = m_collaborators.orientation != nullptr
                                          ? m_collaborators.orientation->getCurrentOrientation()
                                          : m_targetRotation;
    m_onCompleted.publish(events::SequenceCompleted{.finalRotation = finalRotation});

    if (m_collaborators.playerState != nullptr)
    {
        m_collaborators.playerState->setPlayerState(policies::PlayerState::MOVING);
    }
    else
    {
        Logger::warn("[BreakSequence] no player state notifier, skipping state change");
    }

    Logger::info("[BreakSequence] completed");
    transitionTo(Phase::DONE);
}

void BreakSequence::playCue(policies::AudioCue cue)
{
    const std::string& clip =
        cue == policies::AudioCue::CREAK ? m_collaborators.cues.creakClip : m_collaborators.cues.unloadClip;

    if (m_collaborators.audio == nullptr || clip.empty())
    {
        Logger::warn("[BreakSequence] {} cue not configured, skipped", policies::toString(cue));
        return;
    }
    Logger::debug("[BreakSequence] play {} cue '{}'", policies::toString(cue), clip);
    m_collaborators.audio->playOnce(clip);
}

} // namespace vent
