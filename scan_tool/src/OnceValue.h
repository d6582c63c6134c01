#pragma once

#include <atomic>
#include <mutex>
#include <optional>
#include <utility>

namespace crashscan::scan_tool {

// Computes a value at most once and shares it between threads. Callers that find
// the value ready never take the lock. A throwing computation leaves it unset.
template <typename T>
class OnceValue
{
public:
  template <typename Fn>
  const T& GetOrCompute(Fn&& compute)
  {
    if (m_ready.load(std::memory_order_acquire)) {
      return *m_value;
    }
    std::lock_guard lock(m_mutex);
    if (!m_ready.load(std::memory_order_relaxed)) {
      m_value.emplace(std::forward<Fn>(compute)());
      m_ready.store(true, std::memory_order_release);
    }
    return *m_value;
  }

  bool Ready() const { return m_ready.load(std::memory_order_acquire); }

private:
  std::mutex m_mutex;
  std::atomic<bool> m_ready{ false };
  std::optional<T> m_value;
};

}  // namespace crashscan::scan_tool
