/**
 * SequenceProcess implementation
 */

#include "SequenceProcess.hpp"
#include "../singleton/Logger.hpp"

namespace vent
{
SequenceProcess::SequenceProcess(const allocator_type& alloc, BreakSequence& sequence)
    : entt::process{alloc}, m_sequence(&sequence)
{
}

void SequenceProcess::update(const delta_type delta, [[maybe_unused]] void* data)
{
    constexpr float MS_PER_SECOND = 1000.0F;
    m_sequence->step(static_cast<float>(delta) / MS_PER_SECOND);

    if (m_sequence->phase() == BreakSequence::Phase::DONE)
    {
        succeed();
    }
    else if (m_sequence->phase() == BreakSequence::Phase::CANCELLED)
    {
        fail();
    }
}

void SequenceProcess::succeeded()
{
    Logger::info("[sequence task] SequenceProcess succeeded");
}
void SequenceProcess::failed()
{
    Logger::info("[sequence task] SequenceProcess failed");
}
void SequenceProcess::aborted()
{
    m_sequence->cancel();
    Logger::info("[sequence task] SequenceProcess aborted");
}

} // namespace vent
