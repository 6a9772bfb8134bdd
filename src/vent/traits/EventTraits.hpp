#pragma once

#include "../common/Events.hpp"

#include "Contains.hpp"

namespace vent::traits
{
// ===================== 全局分发器允许的事件 =====================
using events = TypeList<events::KeyPressed, events::ContactEntered>;

// ===================== 策略检测 =====================

template <typename T>
inline constexpr bool is_events_v = contains_v<T, events>; // NOLINT

template <typename T>
concept Events = is_events_v<T>;

} // namespace vent::traits
