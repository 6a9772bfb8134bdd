/**
 * ************************************************************************
 *
 * @file Dispatcher.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-03
 * @version 0.1
 * @brief 全局单例事件分发器
 *
 * 宿主层（输入、碰撞检测）通过它把触发事件送进通风口模块：
 * - trigger: 立即同步调用所有监听器
 * - enqueue + update: 缓冲到下一次 update 统一处理
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#pragma once

#include <entt/entt.hpp>

#include "SingletonBase.hpp"
#include "../traits/EventTraits.hpp"
namespace vent
{
class Dispatcher : public SingletonBase<Dispatcher>
{
    friend class SingletonBase<Dispatcher>;

public:
    template <traits::Events Event>
    static void Trigger(Event&& event = {})
    {
        getInstance().m_dispatcher.trigger(std::forward<Event>(event));
    }
    template <traits::Events Event>
    static void Enqueue(Event&& event = {})
    {
        getInstance().m_dispatcher.enqueue(std::forward<Event>(event));
    }

    static void Update() { getInstance().m_dispatcher.update(); }

    template <traits::Events Type>
    static auto Sink()
    {
        return getInstance().m_dispatcher.sink<Type>();
    }

private:
    Dispatcher() = default;

    entt::dispatcher m_dispatcher;
};
} // namespace vent
