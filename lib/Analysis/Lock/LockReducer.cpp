/**
 * @file LockReducer.cpp
 * @brief Implementation of the lock state reducer
 */

#include "Analysis/Lock/LockReducer.h"

#include <llvm/Support/Debug.h>

#define DEBUG_TYPE "lock-reducer"

using namespace llvm;
using namespace tumbler;

LockStateRef
LockReducer::getVariableReducedState(const LockStateRef &expandedState,
                                     const LockSet &blockLocks) const {
  auto builder = expandedState->builder();
  builder->reduce();

  if (m_options.reduceUselessLocks) {
    LockSet uselessLocks;
    for (const auto &entry : expandedState->getLocks()) {
      if (!blockLocks.count(entry.first)) {
        uselessLocks.insert(entry.first);
      }
    }
    builder->reduceLocks(uselessLocks);
  } else if (m_options.aggressiveReduction) {
    builder->reduceLockCounters(blockLocks);
  }

  LockStateRef reduced = builder->build();
  LLVM_DEBUG(dbgs() << "[LockReducer] reduce " << *expandedState << " -> "
                    << *reduced << "\n");
  return reduced;
}

LockStateRef
LockReducer::getVariableExpandedState(const LockStateRef &rootState,
                                      const LockSet &blockLocks,
                                      const LockStateRef &reducedState) const {
  auto builder = reducedState->builder();
  builder->expand(*rootState);

  if (m_options.reduceUselessLocks) {
    builder->expandLocks(*rootState, blockLocks);
  } else if (m_options.aggressiveReduction) {
    builder->expandLockCounters(*rootState, blockLocks);
  }

  LockStateRef expanded = builder->build();
  LLVM_DEBUG(dbgs() << "[LockReducer] expand " << *reducedState
                    << " with root " << *rootState << " -> " << *expanded
                    << "\n");
  return expanded;
}
