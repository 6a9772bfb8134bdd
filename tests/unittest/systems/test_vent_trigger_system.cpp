/**
 * ************************************************************************
 *
 * @file test_vent_trigger_system.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-12
 * @version 0.1
 * @brief 通风口触发系统单元测试
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <optional>
#include "src/vent/common/Orientation.hpp"
#include "src/vent/interface/TransformOrientationStore.hpp"
#include "src/vent/singleton/Dispatcher.hpp"
#include "src/vent/singleton/Logger.hpp"
#include "src/vent/systems/VentTriggerSystem.hpp"
#include "tests/unittest/mocks/MockCollaborators.h"

using Phase = vent::policies::SequencePhase;
using vent::policies::CameraView;
using ::testing::InSequence;
using ::testing::NiceMock;
using ::testing::StrictMock;

class VentTriggerSystemTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        vent::Logger::setLevel(spdlog::level::warn);
        auto created = vent::BreakSequence::create(vent::SequenceConfig{}, {.orientation = &m_transform});
        ASSERT_TRUE(created.has_value());
        m_sequence.emplace(std::move(*created));
        m_recorder.attach(*m_sequence);
    }

    void TearDown() override
    {
        if (m_system)
        {
            m_system->unregisterHandlers();
        }
    }

    void registerSystem(vent::interface::ICameraRig* camera)
    {
        m_system.emplace(*m_sequence, vent::TriggerConfig{.key = "F2", .actorTag = "Player"}, camera);
        m_system->registerHandlers();
    }

    vent::TransformOrientationStore m_transform;
    std::optional<vent::BreakSequence> m_sequence;
    std::optional<vent::systems::VentTriggerSystem> m_system;
    SequenceEventRecorder m_recorder;
};

// 测试 1: 注册时切到主摄像机，触发时切到结束摄像机
TEST_F(VentTriggerSystemTest, SwitchesCameras)
{
    StrictMock<MockCameraRig> camera;
    {
        InSequence order;
        EXPECT_CALL(camera, setActiveView(CameraView::MAIN)).Times(1);
        EXPECT_CALL(camera, setActiveView(CameraView::END)).Times(1);
    }

    registerSystem(&camera);
    vent::Dispatcher::Trigger(vent::events::KeyPressed{.key = "F2"});

    EXPECT_EQ(m_sequence->phase(), Phase::DELAYING);
}

// 测试 2: 注册时记录初始朝向
TEST_F(VentTriggerSystemTest, CapturesSpawnRotationOnRegister)
{
    const vent::Orientation spawn = vent::fromEulerDegrees({.pitch = 0.0F, .yaw = 60.0F, .roll = 0.0F});
    m_transform.setOrientation(spawn);
    registerSystem(nullptr);

    m_transform.setOrientation(vent::Orientation::Identity());
    vent::Dispatcher::Trigger(vent::events::ContactEntered{.actorTag = "Player"});

    EXPECT_TRUE(m_sequence->triggered());
    EXPECT_TRUE(m_sequence->initialRotation().isApprox(spawn, 1e-6F));
}

// 测试 3: 非触发按键被忽略
TEST_F(VentTriggerSystemTest, IgnoresOtherKeys)
{
    StrictMock<MockCameraRig> camera;
    EXPECT_CALL(camera, setActiveView(CameraView::MAIN)).Times(1);
    registerSystem(&camera);

    vent::Dispatcher::Trigger(vent::events::KeyPressed{.key = "F1"});
    vent::Dispatcher::Trigger(vent::events::KeyPressed{.key = "f2"});

    EXPECT_FALSE(m_sequence->triggered());
    EXPECT_EQ(m_recorder.started, 0);
}

// 测试 4: 只有指定标签的角色能触发
TEST_F(VentTriggerSystemTest, ContactRequiresActorTag)
{
    registerSystem(nullptr);

    vent::Dispatcher::Trigger(vent::events::ContactEntered{.actorTag = "Crate"});
    EXPECT_FALSE(m_sequence->triggered());

    vent::Dispatcher::Trigger(vent::events::ContactEntered{.actorTag = "Player"});
    EXPECT_TRUE(m_sequence->triggered());
}

// 测试 5: 多次触发只启动一次
TEST_F(VentTriggerSystemTest, RepeatedTriggersStartOnce)
{
    NiceMock<MockCameraRig> camera;
    registerSystem(&camera);

    vent::Dispatcher::Trigger(vent::events::KeyPressed{.key = "F2"});
    vent::Dispatcher::Trigger(vent::events::ContactEntered{.actorTag = "Player"});
    vent::Dispatcher::Trigger(vent::events::KeyPressed{.key = "F2"});

    EXPECT_EQ(m_recorder.started, 1);
    EXPECT_EQ(m_sequence->phase(), Phase::DELAYING);
}

// 测试 6: 注销后不再响应
TEST_F(VentTriggerSystemTest, UnregisteredSystemIgnoresEvents)
{
    registerSystem(nullptr);
    m_system->unregisterHandlers();
    m_system.reset();

    vent::Dispatcher::Trigger(vent::events::KeyPressed{.key = "F2"});
    vent::Dispatcher::Trigger(vent::events::ContactEntered{.actorTag = "Player"});

    EXPECT_FALSE(m_sequence->triggered());
}

// 测试 7: 队列中的事件在 Update 时处理
TEST_F(VentTriggerSystemTest, EnqueuedEventsWaitForUpdate)
{
    registerSystem(nullptr);

    vent::Dispatcher::Enqueue(vent::events::KeyPressed{.key = "F2"});
    EXPECT_FALSE(m_sequence->triggered());

    vent::Dispatcher::Update();
    EXPECT_TRUE(m_sequence->triggered());
}
