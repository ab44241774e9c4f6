// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "transfer_state.hpp"

#include <algorithm>

namespace hoist {
namespace transfer {

TransferStateMachine::TransferStateMachine(TransferState initial)
    : current_(initial) {
  buildTransitionMap();
}

void TransferStateMachine::buildTransitionMap() {
  valid_transitions_[TransferState::NOT_STARTED] = {
    TransferState::IN_PROGRESS, TransferState::PAUSED, TransferState::FAILED};

  valid_transitions_[TransferState::IN_PROGRESS] = {
    TransferState::PAUSED, TransferState::COMPLETED, TransferState::FAILED};

  valid_transitions_[TransferState::PAUSED] = {TransferState::IN_PROGRESS};

  valid_transitions_[TransferState::COMPLETED] = {};
  valid_transitions_[TransferState::FAILED] = {};
}

TransferState TransferStateMachine::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return current_;
}

bool TransferStateMachine::isState(TransferState state) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return current_ == state;
}

bool TransferStateMachine::isValidTransition(TransferState from, TransferState to) const {
  auto it = valid_transitions_.find(from);
  if (it == valid_transitions_.end()) {
    return false;
  }
  const auto& targets = it->second;
  return std::find(targets.begin(), targets.end(), to) != targets.end();
}

bool TransferStateMachine::applyLocked(
  TransferState from, TransferState to, std::string& error_msg
) {
  if (!isValidTransition(from, to)) {
    error_msg = "ERR_INVALID_STATE: Cannot transition from " + transferStateToString(from) +
                " to " + transferStateToString(to);
    return false;
  }

  current_ = to;
  for (const auto& callback : callbacks_) {
    callback(from, to);
  }
  error_msg.clear();
  return true;
}

bool TransferStateMachine::transitionTo(TransferState to, std::string& error_msg) {
  std::lock_guard<std::mutex> lock(mutex_);
  return applyLocked(current_, to, error_msg);
}

bool TransferStateMachine::transition(
  TransferState from, TransferState to, std::string& error_msg
) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (current_ != from) {
    error_msg = "ERR_INVALID_STATE: Expected state " + transferStateToString(from) +
                " but current is " + transferStateToString(current_);
    return false;
  }
  return applyLocked(from, to, error_msg);
}

std::vector<TransferState> TransferStateMachine::validTransitions() const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = valid_transitions_.find(current_);
  if (it == valid_transitions_.end()) {
    return {};
  }
  return it->second;
}

void TransferStateMachine::registerTransitionCallback(TransferTransitionCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  callbacks_.push_back(std::move(callback));
}

}  // namespace transfer
}  // namespace hoist
