/**
 * ************************************************************************
 *
 * @file IAudioSink.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-04
 * @version 0.1
 * @brief 音频播放抽象，单次播放，不关心返回
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#pragma once
#include <string_view>

namespace vent::interface
{
class IAudioSink
{
public:
    IAudioSink() = default;
    IAudioSink(const IAudioSink&) = default;
    IAudioSink& operator=(const IAudioSink&) = delete;
    IAudioSink(IAudioSink&&) = default;
    IAudioSink& operator=(IAudioSink&&) = default;
    virtual ~IAudioSink() = default;

    virtual void playOnce(std::string_view clipId) = 0;
};
} // namespace vent::interface
