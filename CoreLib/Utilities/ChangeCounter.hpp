#ifndef CHANGE_COUNTER_HPP_INCLUDED
#define CHANGE_COUNTER_HPP_INCLUDED

#include <cstdint>
#include <memory>
#include <vector>

class ChangeCounter;
using ChangeCounterPtr = std::shared_ptr<ChangeCounter>;

/**
 * @brief Monotonic version stamp used to detect state changes.
 *
 * Each call to `change()` bumps the stamp and forwards the bump to every
 * parent. The scene hangs its light and indicator counters under a single
 * root so hosts can redraw when anything changed.
 */
class ChangeCounter
{
public:
    ChangeCounter() = default;

    /// Bumps the stamp and propagates to parents.
    void change();

    /// Adds a parent counter (duplicates and null are ignored).
    void addParent(const ChangeCounterPtr& parent);

    [[nodiscard]] uint64_t value() const noexcept { return m_value; }

private:
    std::vector<std::weak_ptr<ChangeCounter>> m_parents;
    uint64_t                                  m_value{0};
};

/**
 * @brief Remembers the last observed stamp of a counter.
 *
 * The first query after construction reports a change so that
 * consumers always perform an initial refresh.
 */
class ChangeMonitor
{
public:
    explicit ChangeMonitor(ChangeCounterPtr counter);

    /// True if the counter moved since the previous call.
    [[nodiscard]] bool changed() noexcept;

private:
    ChangeCounterPtr m_counter;
    uint64_t         m_seen  = 0;
    bool             m_first = true;
};

#endif // CHANGE_COUNTER_HPP_INCLUDED
