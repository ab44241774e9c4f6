// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef HOIST_TRANSFER_STATE_HPP
#define HOIST_TRANSFER_STATE_HPP

#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace hoist {
namespace transfer {

/**
 * Lifecycle state of one upload handle
 *
 * State transitions:
 * - NOT_STARTED -> IN_PROGRESS: upload submitted
 * - NOT_STARTED -> PAUSED / FAILED: paused or rejected before any work ran
 * - IN_PROGRESS -> PAUSED: pause()
 * - IN_PROGRESS -> COMPLETED / FAILED: transfer finished
 * - PAUSED -> IN_PROGRESS: resumed from a token (a resumed handle starts PAUSED)
 *
 * COMPLETED and FAILED are terminal.
 */
enum class TransferState { NOT_STARTED, IN_PROGRESS, PAUSED, COMPLETED, FAILED };

inline std::string transferStateToString(TransferState state) {
  switch (state) {
    case TransferState::NOT_STARTED:
      return "not_started";
    case TransferState::IN_PROGRESS:
      return "in_progress";
    case TransferState::PAUSED:
      return "paused";
    case TransferState::COMPLETED:
      return "completed";
    case TransferState::FAILED:
      return "failed";
    default:
      return "unknown";
  }
}

inline bool isTerminal(TransferState state) {
  return state == TransferState::COMPLETED || state == TransferState::FAILED;
}

/**
 * Called after a successful transition: (from_state, to_state)
 */
using TransferTransitionCallback = std::function<void(TransferState, TransferState)>;

/**
 * Thread-safe state machine enforcing the TransferState transition table
 *
 * Callbacks run with the internal lock held and must not call back into the
 * state machine.
 */
class TransferStateMachine {
public:
  explicit TransferStateMachine(TransferState initial = TransferState::NOT_STARTED);

  TransferStateMachine(const TransferStateMachine&) = delete;
  TransferStateMachine& operator=(const TransferStateMachine&) = delete;

  TransferState state() const;

  bool isState(TransferState state) const;

  /**
   * Attempt a transition from the current state
   *
   * @param to Target state
   * @param error_msg Set when the transition is not allowed
   * @return true if the transition happened
   */
  bool transitionTo(TransferState to, std::string& error_msg);

  /**
   * Attempt a transition only if the current state is @p from
   */
  bool transition(TransferState from, TransferState to, std::string& error_msg);

  bool isValidTransition(TransferState from, TransferState to) const;

  std::vector<TransferState> validTransitions() const;

  void registerTransitionCallback(TransferTransitionCallback callback);

private:
  void buildTransitionMap();
  bool applyLocked(TransferState from, TransferState to, std::string& error_msg);

  mutable std::mutex mutex_;
  TransferState current_;
  std::vector<TransferTransitionCallback> callbacks_;
  std::unordered_map<TransferState, std::vector<TransferState>> valid_transitions_;
};

}  // namespace transfer
}  // namespace hoist

#endif  // HOIST_TRANSFER_STATE_HPP
