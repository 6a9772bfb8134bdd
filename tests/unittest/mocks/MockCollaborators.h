/**
 * ************************************************************************
 *
 * @file MockCollaborators.h
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-10
 * @version 0.1
 * @brief 序列外部协作者的模拟实现（用于单元测试）
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#pragma once
#include "src/vent/common/Events.hpp"
#include "src/vent/interface/IAudioSink.hpp"
#include "src/vent/interface/ICameraRig.hpp"
#include "src/vent/interface/IPlayerStateNotifier.hpp"
#include <algorithm>
#include <string>
#include <string_view>
#include <vector>
#include <gtest/gtest.h>
#include <gmock/gmock.h>

class MockAudioSink : public vent::interface::IAudioSink
{
public:
    MOCK_METHOD(void, playOnce, (std::string_view clipId), (override));
};

class MockPlayerStateNotifier : public vent::interface::IPlayerStateNotifier
{
public:
    MOCK_METHOD(void, setPlayerState, (vent::policies::PlayerState state), (override));
};

class MockCameraRig : public vent::interface::ICameraRig
{
public:
    MOCK_METHOD(void, setActiveView, (vent::policies::CameraView view), (override));
};

/**
 * @brief 记录所有副作用的先后顺序
 */
struct CallLog
{
    std::vector<std::string> entries;

    [[nodiscard]] size_t count(const std::string& entry) const
    {
        return static_cast<size_t>(std::count(entries.begin(), entries.end(), entry));
    }
};

/**
 * @brief 把音效播放写进 CallLog
 */
class RecordingAudioSink : public vent::interface::IAudioSink
{
public:
    explicit RecordingAudioSink(CallLog& log) : m_log(&log) {}

    void playOnce(std::string_view clipId) override { m_log->entries.emplace_back("audio:" + std::string(clipId)); }

private:
    CallLog* m_log;
};

/**
 * @brief 把玩家状态切换写进 CallLog
 */
class RecordingPlayerState : public vent::interface::IPlayerStateNotifier
{
public:
    explicit RecordingPlayerState(CallLog& log) : m_log(&log) {}

    void setPlayerState(vent::policies::PlayerState state) override
    {
        m_log->entries.emplace_back(state == vent::policies::PlayerState::MOVING ? "player:moving" : "player:locked");
    }

private:
    CallLog* m_log;
};

/**
 * @brief 序列通知订阅者
 */
struct SequenceEventRecorder
{
    CallLog* log = nullptr;
    int started = 0;
    int completed = 0;
    std::vector<vent::events::PhaseChanged> phases;

    void onStarted([[maybe_unused]] const vent::events::SequenceStarted& event)
    {
        ++started;
        if (log != nullptr) log->entries.emplace_back("started");
    }

    void onCompleted([[maybe_unused]] const vent::events::SequenceCompleted& event)
    {
        ++completed;
        if (log != nullptr) log->entries.emplace_back("completed");
    }

    void onPhaseChanged(const vent::events::PhaseChanged& event) { phases.push_back(event); }

    template <typename Sequence>
    void attach(Sequence& sequence)
    {
        sequence.onStarted().template connect<&SequenceEventRecorder::onStarted>(*this);
        sequence.onCompleted().template connect<&SequenceEventRecorder::onCompleted>(*this);
        sequence.onPhaseChanged().template connect<&SequenceEventRecorder::onPhaseChanged>(*this);
    }
};
