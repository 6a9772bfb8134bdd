/**
 * ************************************************************************
 *
 * @file IOrientationStore.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-04
 * @version 0.1
 * @brief 朝向存储抽象（外部 Transform）
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#pragma once
#include "../common/Types.hpp"

namespace vent::interface
{
class IOrientationStore
{
public:
    IOrientationStore() = default;
    IOrientationStore(const IOrientationStore&) = default;
    IOrientationStore& operator=(const IOrientationStore&) = delete;
    IOrientationStore(IOrientationStore&&) = default;
    IOrientationStore& operator=(IOrientationStore&&) = default;
    virtual ~IOrientationStore() = default;

    [[nodiscard]] virtual Orientation getCurrentOrientation() const = 0;
    virtual void setOrientation(const Orientation& orientation) = 0;

    /**
     * @brief 在 from 与 to 之间插值，t 超出 [0,1] 的行为由实现决定
     */
    [[nodiscard]] virtual Orientation blend(const Orientation& from, const Orientation& to, float t) const = 0;
};
} // namespace vent::interface
