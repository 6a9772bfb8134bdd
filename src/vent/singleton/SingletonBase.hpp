/**
 * ************************************************************************
 *
 * @file SingletonBase.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-03
 * @version 0.1
 * @brief 单例基类模板
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#pragma once

#include <utility>

namespace vent
{
template <typename Device>
class SingletonBase
{
public:
    template <typename... Args>
    static Device& getInstance(Args&&... args)
    {
        // 静态局部变量，确保只初始化一次
        static Device instance(std::forward<Args>(args)...);
        return instance;
    }

    SingletonBase(const SingletonBase&) = delete;
    SingletonBase& operator=(const SingletonBase&) = delete;
    SingletonBase(SingletonBase&&) = delete;
    SingletonBase& operator=(SingletonBase&&) = delete;

protected:
    // 构造函数设为 protected，防止外部直接创建
    SingletonBase() = default;
    virtual ~SingletonBase() = default;
};
} // namespace vent
