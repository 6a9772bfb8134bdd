/**
 * ************************************************************************
 *
 * @file ICameraRig.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-04
 * @version 0.1
 * @brief 摄像机切换抽象（主摄像机 / 结束摄像机）
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#pragma once
#include "../common/Policies.hpp"

namespace vent::interface
{
class ICameraRig
{
public:
    ICameraRig() = default;
    ICameraRig(const ICameraRig&) = default;
    ICameraRig& operator=(const ICameraRig&) = delete;
    ICameraRig(ICameraRig&&) = default;
    ICameraRig& operator=(ICameraRig&&) = default;
    virtual ~ICameraRig() = default;

    virtual void setActiveView(policies::CameraView view) = 0;
};
} // namespace vent::interface
