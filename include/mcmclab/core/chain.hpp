#pragma once
#include <cstddef>
#include <deque>
#include <optional>
#include <vector>
#include <mcmclab/core/sample.hpp>
#include <mcmclab/kernel/kernel.hpp>

namespace mcmclab::core {

inline constexpr std::size_t default_history_capacity = 2000;
inline constexpr Point default_origin{0.1, 0.1};

// Position and bounded sample history of one chain. Owned by a single
// engine; the history evicts its oldest sample once full.
class ChainState {
public:
  explicit ChainState(std::size_t capacity = default_history_capacity, Point origin = default_origin);

  const Point &position() const { return position_; }
  const std::deque<Sample> &history() const { return history_; }
  const std::optional<std::vector<Point>> &last_trajectory() const { return last_trajectory_; }
  std::size_t capacity() const { return capacity_; }
  const Point &origin() const { return origin_; }

  // Moves to the proposal's point, appends it to the history and replaces
  // the trajectory. Returns the emitted sample.
  Sample record(kernel::Proposal proposal);

  // Back to the origin with empty history and no trajectory.
  void reset();

private:
  std::size_t capacity_;
  Point origin_;
  Point position_;
  std::deque<Sample> history_;
  std::optional<std::vector<Point>> last_trajectory_;
};

} // namespace mcmclab::core
