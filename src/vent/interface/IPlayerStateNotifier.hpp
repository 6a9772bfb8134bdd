/**
 * ************************************************************************
 *
 * @file IPlayerStateNotifier.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-04
 * @version 0.1
 * @brief 外部玩家状态控制抽象
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
class IPlayerStateNotifier
{
public:
    IPlayerStateNotifier() = default;
    IPlayerStateNotifier(const IPlayerStateNotifier&) = default;
    IPlayerStateNotifier& operator=(const IPlayerStateNotifier&) = delete;
    IPlayerStateNotifier(IPlayerStateNotifier&&) = default;
    IPlayerStateNotifier& operator=(IPlayerStateNotifier&&) = default;
    virtual ~IPlayerStateNotifier() = default;

    virtual void setPlayerState(policies::PlayerState state) = 0;
};
} // namespace vent::interface
