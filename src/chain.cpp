#include <stdexcept>
#include <utility>
#include <mcmclab/core/chain.hpp>
#include <mcmclab/log/logger.hpp>

namespace mcmclab::core {

ChainState::ChainState(std::size_t capacity, Point origin)
    : capacity_(capacity), origin_(origin), position_(origin) {
  if (capacity == 0) {
    MLOG_ERROR("ChainState capacity must be greater than 0");
    throw std::invalid_argument("history capacity must be greater than 0");
  }
}

Sample ChainState::record(kernel::Proposal proposal) {
  position_ = proposal.point;
  last_trajectory_ = std::move(proposal.path);

  Sample s(position_, proposal.accepted);
  if (history_.size() == capacity_)
    history_.pop_front();
  history_.push_back(s);
  return s;
}

void ChainState::reset() {
  position_ = origin_;
  history_.clear();
  last_trajectory_.reset();
}

} // namespace mcmclab::core
