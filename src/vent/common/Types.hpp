/**
 * ************************************************************************
 *
 * @file Types.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-02
 * @version 0.1
 * @brief 通风口模块核心数学类型定义
 *
 * 统一使用 Eigen 的向量与四元数类型，
 * 旋转一律以四元数保存，欧拉角只在输入输出时使用。
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#pragma once

#include <Eigen/Core>
#include <Eigen/Geometry>
#include <algorithm>

namespace vent
{

// ===================== 基础向量类型 =====================

/**
 * @brief 3D向量类型
 */
using Vec3 = Eigen::Vector3f;

/**
 * @brief 3x3矩阵类型（旋转矩阵）
 */
using Mat3 = Eigen::Matrix3f;

/**
 * @brief 朝向类型（单位四元数）
 */
using Orientation = Eigen::Quaternionf;

// ===================== 数值工具 =====================

/**
 * @brief 限制到 [0, 1]
 */
inline float clamp01(float value)
{
    return std::clamp(value, 0.0F, 1.0F);
}

} // namespace vent
