/**
 * ************************************************************************
 *
 * @file Orientation.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-02
 * @version 0.1
 * @brief 朝向工具函数实现
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#include "Orientation.hpp"
#include <cmath>
#include <numbers>

namespace vent
{
namespace
{
constexpr float DEG_TO_RAD = std::numbers::pi_v<float> / 180.0F;
constexpr float RAD_TO_DEG = 180.0F / std::numbers::pi_v<float>;
} // namespace

EulerAngles toEulerDegrees(const Orientation& orientation)
{
    const Mat3 rot = orientation.normalized().toRotationMatrix();

    // R(1,2) = -sin(pitch)，asin 保证 pitch 落在 [-90, 90]
    const float sinPitch = std::clamp(-rot(1, 2), -1.0F, 1.0F);

    EulerAngles angles;
    angles.pitch = std::asin(sinPitch) * RAD_TO_DEG;
    angles.yaw = std::atan2(rot(0, 2), rot(2, 2)) * RAD_TO_DEG;
    angles.roll = std::atan2(rot(1, 0), rot(1, 1)) * RAD_TO_DEG;
    return angles;
}

Orientation fromEulerDegrees(const EulerAngles& angles)
{
    const Eigen::AngleAxisf yaw(angles.yaw * DEG_TO_RAD, Vec3::UnitY());
    const Eigen::AngleAxisf pitch(angles.pitch * DEG_TO_RAD, Vec3::UnitX());
    const Eigen::AngleAxisf roll(angles.roll * DEG_TO_RAD, Vec3::UnitZ());
    return Orientation(yaw * pitch * roll).normalized();
}

Orientation withPitch(const Orientation& initial, float pitchDegrees)
{
    EulerAngles angles = toEulerDegrees(initial);
    angles.pitch = pitchDegrees;
    return fromEulerDegrees(angles);
}

} // namespace vent
