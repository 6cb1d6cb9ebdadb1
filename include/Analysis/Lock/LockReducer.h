/**
 * @file LockReducer.h
 * @brief Reduce/expand of lock states for block-summary analyses
 *
 * Before a function body is summarized, the caller's lock state is reduced
 * to what the block can observe, so that summaries can be shared between
 * calling contexts. After the summary is applied, the result is expanded
 * back with the caller's context.
 */

#ifndef LOCK_REDUCER_H
#define LOCK_REDUCER_H

#include "Analysis/Lock/LockIdentifier.h"
#include "Analysis/Lock/LockState.h"

namespace tumbler {

struct LockReducerOptions {
  /// Drop the locks a block does not use and copy them back afterwards.
  bool reduceUselessLocks = false;
  /// Keep the locks but forget their recursion counts outside the block.
  /// Ignored when reduceUselessLocks is set.
  bool aggressiveReduction = false;
};

class LockReducer {
public:
  explicit LockReducer(const LockReducerOptions &options = {})
      : m_options(options) {}

  /**
   * @brief State of the caller as seen from the entry of a block
   * @param expandedState Caller state at the call
   * @param blockLocks Locks the block operates on
   */
  LockStateRef getVariableReducedState(const LockStateRef &expandedState,
                                       const LockSet &blockLocks) const;

  /**
   * @brief Put the caller's context back around a block's exit state
   * @param rootState Caller state at the call
   * @param blockLocks Locks the block operates on
   * @param reducedState Exit state of the block
   */
  LockStateRef getVariableExpandedState(const LockStateRef &rootState,
                                        const LockSet &blockLocks,
                                        const LockStateRef &reducedState) const;

  /// Cache key of a reduced state.
  const LockMap &getHashCodeForState(const LockState &state) const {
    return state.getLocks();
  }

  const LockReducerOptions &getOptions() const { return m_options; }

private:
  LockReducerOptions m_options;
};

} // namespace tumbler

#endif // LOCK_REDUCER_H
