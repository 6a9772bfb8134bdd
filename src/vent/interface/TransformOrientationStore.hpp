/**
 * ************************************************************************
 *
 * @file TransformOrientationStore.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-04
 * @version 0.1
 * @brief 进程内朝向存储实现，球面插值
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#pragma once
#include "IOrientationStore.hpp"
#include "../common/Orientation.hpp"

namespace vent
{
/**
 * @brief 只持有一个朝向值的 Transform，宿主没有引擎时使用
 */
class TransformOrientationStore : public interface::IOrientationStore
{
public:
    TransformOrientationStore() = default;
    explicit TransformOrientationStore(const Orientation& initial) : m_orientation(initial.normalized()) {}

    [[nodiscard]] Orientation getCurrentOrientation() const override { return m_orientation; }

    void setOrientation(const Orientation& orientation) override { m_orientation = orientation; }

    [[nodiscard]] Orientation blend(const Orientation& from, const Orientation& to, float t) const override
    {
        return vent::blend(from, to, t);
    }

private:
    Orientation m_orientation = Orientation::Identity();
};
} // namespace vent
