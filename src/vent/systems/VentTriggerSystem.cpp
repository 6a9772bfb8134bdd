/**
 * ************************************************************************
 *
 * @file VentTriggerSystem.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-08
 * @version 0.1
 * @brief 通风口触发系统实现
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#include "VentTriggerSystem.hpp"
#include "../singleton/Dispatcher.hpp"
#include "../singleton/Logger.hpp"

namespace vent::systems
{

VentTriggerSystem::VentTriggerSystem(BreakSequence& sequence, TriggerConfig trigger, interface::ICameraRig* camera)
    : m_sequence(&sequence), m_trigger(std::move(trigger)), m_camera(camera)
{
}

void VentTriggerSystem::registerHandlersImpl()
{
    Dispatcher::Sink<events::KeyPressed>().connect<&VentTriggerSystem::onKeyPressed>(*this);
    Dispatcher::Sink<events::ContactEntered>().connect<&VentTriggerSystem::onContactEntered>(*this);

    if (m_camera != nullptr)
    {
        m_camera->setActiveView(policies::CameraView::MAIN);
    }
    m_sequence->captureInitialRotation();
}

void VentTriggerSystem::unregisterHandlersImpl()
{
    Dispatcher::Sink<events::KeyPressed>().disconnect<&VentTriggerSystem::onKeyPressed>(*this);
    Dispatcher::Sink<events::ContactEntered>().disconnect<&VentTriggerSystem::onContactEntered>(*this);
}

void VentTriggerSystem::onKeyPressed(const events::KeyPressed& event)
{
    if (event.key != m_trigger.key)
    {
        return;
    }
    Logger::debug("[VentTriggerSystem] trigger key {} pressed", event.key);
    triggerBreak();
}

void VentTriggerSystem::onContactEntered(const events::ContactEntered& event)
{
    if (event.actorTag != m_trigger.actorTag)
    {
        return;
    }
    Logger::debug("[VentTriggerSystem] contact with {}", event.actorTag);
    triggerBreak();
}

void VentTriggerSystem::triggerBreak()
{
    if (m_camera != nullptr)
    {
        m_camera->setActiveView(policies::CameraView::END);
    }
    m_sequence->activate();
}

} // namespace vent::systems
