/**
 * @file LockTrace.h
 * @brief Textual scripts of lock effects
 *
 * A trace is a sequence of steps; each step is the batch of effects one
 * builder receives before it is built. One directive per line:
 *
 *   acquire <lock>            release <lock>
 *   reset <lock>              set <lock> <n>
 *   restore <lock>            check <lock> <n> true|false
 *   restore-all               reset-all
 *   save-state                commit
 *
 * where <lock> is either "name" (global lock) or "name variable" (local
 * lock). "commit" closes the current step; a trailing non-empty step is
 * closed implicitly. '#' starts a comment.
 */

#ifndef LOCK_TRACE_H
#define LOCK_TRACE_H

#include "Analysis/Lock/LockEffect.h"
#include "Analysis/Lock/LockState.h"

#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Error.h>

#include <vector>

namespace tumbler {

struct LockTraceStep {
  LockEffectList effects;
  unsigned line = 0; ///< commit line, or last directive of an implicit step
};

using LockTrace = std::vector<LockTraceStep>;

/**
 * @brief Parse a trace
 * @param buffer Trace text
 * @param maxRecursion Recursion bound for acquisitions, 0 for none
 * @return the steps, or an error naming the offending line
 */
llvm::Expected<LockTrace> parseLockTrace(llvm::StringRef buffer,
                                         int maxRecursion = 0);

/**
 * @brief Run every step of a trace, starting from initial
 * @return the state built by each step; replay stops after the first
 *         infeasible step, whose entry is nullptr
 */
std::vector<LockStateRef> replayLockTrace(const LockStateRef &initial,
                                          const LockTrace &trace);

} // namespace tumbler

#endif // LOCK_TRACE_H
