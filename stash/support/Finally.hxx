/// @b License: @n Apache License v2.0
/// @copyright Robert Dunnagan
#pragma once

#include <functional>

namespace stash {

class Finally
{
  public:
    template <typename Func>
    Finally(Func&& func) : m_func{std::forward<Func>(func)} {}
    ~Finally() { if (m_func) m_func(); }

    Finally(const Finally&) = delete;
    Finally& operator = (const Finally&) = delete;

    /// Disarm, for the success path of a commit/rollback pair.
    void cancel() { m_func = nullptr; }

  private:
    std::function<void()> m_func;
};

} // namespace stash
