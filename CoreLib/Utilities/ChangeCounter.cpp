#include "ChangeCounter.hpp"

#include <utility>

void ChangeCounter::change()
{
    ++m_value;

    for (const auto& weak : m_parents)
    {
        if (const ChangeCounterPtr parent = weak.lock())
            parent->change();
    }
}

void ChangeCounter::addParent(const ChangeCounterPtr& parent)
{
    if (!parent || parent.get() == this)
        return;

    for (const auto& weak : m_parents)
    {
        if (weak.lock() == parent)
            return;
    }

    m_parents.push_back(parent);
}

ChangeMonitor::ChangeMonitor(ChangeCounterPtr counter) : m_counter{std::move(counter)}
{
}

bool ChangeMonitor::changed() noexcept
{
    if (!m_counter)
        return false;

    const uint64_t now = m_counter->value();
    if (m_first || now != m_seen)
    {
        m_first = false;
        m_seen  = now;
        return true;
    }
    return false;
}
