/**
 * ************************************************************************
 *
 * @file Isystem.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-08
 * @version 0.1
 * @brief 系统接口
    不处理帧更新，仅注册和注销事件处理器
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#pragma once

namespace vent::interface
{
/**
 * @brief 启用注册功能的系统基类模板
 */
template <typename Derived>
struct EnableRegister
{
    /**
     * @brief 注册事件处理器
     */
    void registerHandlers() { static_cast<Derived*>(this)->registerHandlersImpl(); }
    /**
     * @brief 注销事件处理器
     */
    void unregisterHandlers() { static_cast<Derived*>(this)->unregisterHandlersImpl(); }
};
} // namespace vent::interface
