/**
 * ************************************************************************
 *
 * @file test_orientation.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-11
 * @version 0.1
 * @brief 朝向工具函数单元测试
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#include <gtest/gtest.h>
#include <numbers>
#include "src/vent/common/Orientation.hpp"
#include "src/vent/interface/TransformOrientationStore.hpp"

namespace
{
constexpr float DEG = std::numbers::pi_v<float> / 180.0F;
}

// 测试 1: 单轴旋转的欧拉角
TEST(OrientationTest, SingleAxisEuler)
{
    const vent::Orientation pitch(Eigen::AngleAxisf(-75.0F * DEG, vent::Vec3::UnitX()));
    const auto angles = vent::toEulerDegrees(pitch);
    EXPECT_NEAR(angles.pitch, -75.0F, 1e-3F);
    EXPECT_NEAR(angles.yaw, 0.0F, 1e-3F);
    EXPECT_NEAR(angles.roll, 0.0F, 1e-3F);

    const vent::Orientation yaw(Eigen::AngleAxisf(120.0F * DEG, vent::Vec3::UnitY()));
    EXPECT_NEAR(vent::toEulerDegrees(yaw).yaw, 120.0F, 1e-3F);
}

// 测试 2: Y-X-Z 组合顺序
TEST(OrientationTest, ComposesYawPitchRoll)
{
    const vent::EulerAngles angles{.pitch = 20.0F, .yaw = -40.0F, .roll = 15.0F};
    const vent::Orientation expected = Eigen::AngleAxisf(angles.yaw * DEG, vent::Vec3::UnitY()) *
                                       Eigen::AngleAxisf(angles.pitch * DEG, vent::Vec3::UnitX()) *
                                       Eigen::AngleAxisf(angles.roll * DEG, vent::Vec3::UnitZ());
    const vent::Orientation composed = vent::fromEulerDegrees(angles);
    EXPECT_TRUE(composed.isApprox(expected, 1e-5F));

    const auto decomposed = vent::toEulerDegrees(composed);
    EXPECT_NEAR(decomposed.pitch, angles.pitch, 1e-3F);
    EXPECT_NEAR(decomposed.yaw, angles.yaw, 1e-3F);
    EXPECT_NEAR(decomposed.roll, angles.roll, 1e-3F);
}

// 测试 3: 替换 pitch 保留 yaw / roll
TEST(OrientationTest, WithPitchKeepsOtherAxes)
{
    const vent::Orientation initial = vent::fromEulerDegrees({.pitch = 10.0F, .yaw = 90.0F, .roll = -30.0F});
    const auto angles = vent::toEulerDegrees(vent::withPitch(initial, -75.0F));
    EXPECT_NEAR(angles.pitch, -75.0F, 1e-3F);
    EXPECT_NEAR(angles.yaw, 90.0F, 1e-3F);
    EXPECT_NEAR(angles.roll, -30.0F, 1e-3F);
}

// 测试 4: 插值端点与中点
TEST(OrientationTest, BlendEndpoints)
{
    const vent::TransformOrientationStore store;
    const vent::Orientation from = vent::Orientation::Identity();
    const vent::Orientation to(Eigen::AngleAxisf(-80.0F * DEG, vent::Vec3::UnitX()));

    EXPECT_TRUE(store.blend(from, to, 0.0F).isApprox(from));
    EXPECT_TRUE(store.blend(from, to, 1.0F).isApprox(to));

    const auto half = vent::toEulerDegrees(store.blend(from, to, 0.5F));
    EXPECT_NEAR(half.pitch, -40.0F, 1e-3F);
}
