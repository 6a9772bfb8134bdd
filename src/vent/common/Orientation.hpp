/**
 * ************************************************************************
 *
 * @file Orientation.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-02
 * @version 0.1
 * @brief 朝向工具函数
  - 欧拉角 <-> 四元数（Y-X-Z 顺序，单位：度）
  - 球面插值
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#pragma once

#include "Types.hpp"

namespace vent
{

/**
 * @brief 欧拉角（度）
 * R = Ry(yaw) * Rx(pitch) * Rz(roll)，pitch 范围 [-90, 90]
 */
struct EulerAngles
{
    float pitch = 0.0F; // 绕 X 轴
    float yaw = 0.0F;   // 绕 Y 轴
    float roll = 0.0F;  // 绕 Z 轴
};

[[nodiscard]] EulerAngles toEulerDegrees(const Orientation& orientation);

[[nodiscard]] Orientation fromEulerDegrees(const EulerAngles& angles);

/**
 * @brief 球面插值，t 超出 [0,1] 时按 Eigen slerp 外推
 */
[[nodiscard]] inline Orientation blend(const Orientation& from, const Orientation& to, float t)
{
    return from.slerp(t, to);
}

/**
 * @brief 以 initial 的 yaw/roll 为基础，替换 pitch 得到目标朝向
 */
[[nodiscard]] Orientation withPitch(const Orientation& initial, float pitchDegrees);

} // namespace vent
