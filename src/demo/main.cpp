/**
 * ************************************************************************
 *
 * @file main.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-09
 * @version 0.1
 * @brief 通风口破裂演出的无界面宿主
    读取配置 -> 按下触发键 -> 以 16ms 定步长驱动调度器直到序列结束
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#include <atomic>
#include <csignal>
#include <cstdint>
#include <entt/entt.hpp>
#include <string_view>

#include "src/vent/common/Orientation.hpp"
#include "src/vent/common/SequenceConfig.hpp"
#include "src/vent/core/SequenceProcess.hpp"
#include "src/vent/interface/TransformOrientationStore.hpp"
#include "src/vent/sequence/BreakSequence.hpp"
#include "src/vent/singleton/Dispatcher.hpp"
#include "src/vent/singleton/Logger.hpp"
#include "src/vent/systems/VentTriggerSystem.hpp"

namespace
{
std::atomic<bool> g_running{true};

void signalHandler(int signal)
{
    if (signal == SIGINT || signal == SIGTERM)
    {
        g_running.store(false);
    }
}

constexpr std::uint32_t FRAME_INTERVAL_MS = 16;

class LoggingAudioSink : public vent::interface::IAudioSink
{
public:
    void playOnce(std::string_view clipId) override { vent::Logger::info("[audio] play '{}'", clipId); }
};

class LoggingPlayerState : public vent::interface::IPlayerStateNotifier
{
public:
    void setPlayerState(vent::policies::PlayerState state) override
    {
        vent::Logger::info("[player] state -> {}", state == vent::policies::PlayerState::MOVING ? "Moving" : "Locked");
    }
};

class LoggingCameraRig : public vent::interface::ICameraRig
{
public:
    void setActiveView(vent::policies::CameraView view) override
    {
        vent::Logger::info("[camera] active view -> {}", view == vent::policies::CameraView::MAIN ? "main" : "end");
    }
};
} // namespace

int main(int argc, char* argv[])
{
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    vent::VentConfig config;
    config.audio = vent::AudioCues{.creakClip = "vent_creak", .unloadClip = "puzzle_unload"};
    if (argc > 1)
    {
        auto loaded = vent::loadVentConfig(argv[1]);
        if (!loaded)
        {
            vent::Logger::error("failed to load {}: {}", argv[1], vent::toString(loaded.error()));
            return 1;
        }
        config = std::move(*loaded);
    }

    vent::TransformOrientationStore transform;
    LoggingAudioSink audio;
    LoggingPlayerState player;
    LoggingCameraRig camera;

    auto sequence = vent::BreakSequence::create(config.sequence,
                                                vent::SequenceCollaborators{.orientation = &transform,
                                                                            .audio = &audio,
                                                                            .playerState = &player,
                                                                            .cues = config.audio});
    if (!sequence)
    {
        vent::Logger::error("invalid sequence config: {}", vent::toString(sequence.error()));
        return 1;
    }

    vent::systems::VentTriggerSystem triggerSystem(*sequence, config.trigger, &camera);
    triggerSystem.registerHandlers();

    vent::Dispatcher::Trigger(vent::events::KeyPressed{.key = config.trigger.key});

    entt::scheduler scheduler;
    scheduler.attach<vent::SequenceProcess>(*sequence);

    std::uint32_t ticks = 0;
    while (!scheduler.empty())
    {
        if (!g_running.load())
        {
            scheduler.abort(true);
            break;
        }
        scheduler.update(FRAME_INTERVAL_MS);
        ++ticks;
    }

    triggerSystem.unregisterHandlers();

    const auto angles = vent::toEulerDegrees(transform.getCurrentOrientation());
    vent::Logger::info("finished after {} ticks, pitch {:.2f} yaw {:.2f} roll {:.2f}",
                       ticks,
                       angles.pitch,
                       angles.yaw,
                       angles.roll);
    return sequence->phase() == vent::policies::SequencePhase::DONE ? 0 : 1;
}
