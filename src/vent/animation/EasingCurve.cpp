/**
 * ************************************************************************
 *
 * @file EasingCurve.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-05
 * @version 0.1
 * @brief 通风口破裂缓动曲线实现
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#include "EasingCurve.hpp"
#include <cmath>
#include <numbers>
#include "../common/Types.hpp"

namespace vent::animation
{

EasingCurve::EasingCurve(const SequenceConfig& config)
    : m_resistanceFraction(config.resistanceFraction), m_breakSharpness(config.breakSharpness),
      m_oscillationFrequency(config.oscillationFrequency), m_dampingRate(config.dampingRate)
{
}

float EasingCurve::progress(float time) const
{
    // 1. 阻力阶段：三次方起步，t=0 处没有突变
    if (time < m_resistanceFraction)
    {
        const float held = time / m_resistanceFraction;
        return held * held * held * RESISTANCE_CEILING;
    }

    // 2. 断裂阶段：b^p 在 b 接近 1 时急剧上升
    const float breakProgress = (time - m_resistanceFraction) / (1.0F - m_resistanceFraction);
    const float base = std::pow(breakProgress, m_breakSharpness);

    // 3. 叠加回弹，超出 [0,1] 的部分由钳制吃掉
    return clamp01(RESISTANCE_CEILING + (base * BREAK_SCALE) + oscillation(breakProgress));
}

float EasingCurve::oscillation(float breakProgress) const
{
    if (breakProgress <= 0.0F)
    {
        return 0.0F;
    }
    return std::sin(breakProgress * m_oscillationFrequency * std::numbers::pi_v<float>) *
           std::exp(-breakProgress * m_dampingRate) * OSCILLATION_AMPLITUDE;
}

} // namespace vent::animation
