/**
 * ************************************************************************
 *
 * @file SequenceProcess.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-08
 * @version 0.1
 * @brief 把 BreakSequence 挂到 entt::scheduler 上的任务封装
    - delta 单位为毫秒，换算成秒后调用 step
    - 序列 Done 时 succeed，Cancelled 时 fail
    - 被调度器 abort 时取消序列
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#pragma once

#include <entt/entt.hpp>
#include "../sequence/BreakSequence.hpp"

namespace vent
{
class SequenceProcess : public entt::process
{
public:
    SequenceProcess(const allocator_type& alloc, BreakSequence& sequence);

protected:
    void update(delta_type delta, void* data) override;
    void succeeded() override;
    void failed() override;
    void aborted() override;

private:
    BreakSequence* m_sequence;
};
} // namespace vent
