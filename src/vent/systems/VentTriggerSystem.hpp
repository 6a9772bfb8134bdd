/**
 * ************************************************************************
 *
 * @file VentTriggerSystem.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-08
 * @version 0.1
 * @brief 通风口触发系统
    监听全局分发器上的按键和碰撞事件，
    命中配置的按键或角色标签时切到结束摄像机并触发序列
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#pragma once
#include "../common/Events.hpp"
#include "../common/SequenceConfig.hpp"
#include "../interface/ICameraRig.hpp"
#include "../interface/Isystem.hpp"
#include "../sequence/BreakSequence.hpp"

namespace vent::systems
{

class VentTriggerSystem : public interface::EnableRegister<VentTriggerSystem>
{
public:
    VentTriggerSystem(BreakSequence& sequence, TriggerConfig trigger, interface::ICameraRig* camera = nullptr);

    /**
     * @brief 连接事件，显示主摄像机并记录初始朝向
     */
    void registerHandlersImpl();

    void unregisterHandlersImpl();

private:
    void onKeyPressed(const events::KeyPressed& event);
    void onContactEntered(const events::ContactEntered& event);
    void triggerBreak();

    BreakSequence* m_sequence;
    TriggerConfig m_trigger;
    interface::ICameraRig* m_camera;
};

} // namespace vent::systems
