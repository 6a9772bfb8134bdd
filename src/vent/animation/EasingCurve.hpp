/**
 * ************************************************************************
 *
 * @file EasingCurve.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-05
 * @version 0.1
 * @brief 通风口破裂缓动曲线
 *
 * 归一化时间 [0,1] -> 插值系数 [0,1]，无状态。
    阻力阶段 t < r : (t/r)^3 * 0.1
    断裂阶段 t >= r: b = (t-r)/(1-r)
                     0.1 + b^p * 0.9 + sin(b*f*pi) * exp(-b*d) * 0.15
    结果最终钳制到 [0,1]
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#pragma once
#include "../common/SequenceConfig.hpp"

namespace vent::animation
{

class EasingCurve
{
public:
    static constexpr float RESISTANCE_CEILING = 0.1F;    // 阻力阶段结束时的进度
    static constexpr float BREAK_SCALE = 0.9F;           // 断裂阶段的基础进度缩放
    static constexpr float OSCILLATION_AMPLITUDE = 0.15F; // 回弹振幅

    /**
     * @brief 从序列配置中取 r / p / f / d，配置需已校验
     */
    explicit EasingCurve(const SequenceConfig& config);

    /**
     * @brief 计算插值系数
     * @param time 归一化时间，调用方负责钳制到 [0,1]
     */
    [[nodiscard]] float progress(float time) const;

    /**
     * @brief 断裂阶段的回弹项，b <= 0 时为 0
     */
    [[nodiscard]] float oscillation(float breakProgress) const;

private:
    float m_resistanceFraction;
    float m_breakSharpness;
    float m_oscillationFrequency;
    float m_dampingRate;
};

} // namespace vent::animation
