#ifndef TUMBLER_TESTS_UTILS_LOCKTESTFIXTURE_H
#define TUMBLER_TESTS_UTILS_LOCKTESTFIXTURE_H

#include "Analysis/Lock/LockEffect.h"
#include "Analysis/Lock/LockIdentifier.h"
#include "Analysis/Lock/LockState.h"

#include <gtest/gtest.h>

#include <initializer_list>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace tumbler {

// Readable gtest failure messages
inline void PrintTo(const LockIdentifier &lock, std::ostream *os) {
  *os << lock.toString();
}

inline void PrintTo(const LockState &state, std::ostream *os) {
  *os << state.toString();
}

namespace testing {

// ============================================================================
// Base fixture for lock domain tests
// ============================================================================

class LockStateTestBase : public ::testing::Test {
protected:
  const LockIdentifier L1 = LockIdentifier::of("L1");
  const LockIdentifier L2 = LockIdentifier::of("L2");
  const LockIdentifier L3 = LockIdentifier::of("L3");
  const LockIdentifier DevLock =
      LockIdentifier::of("spin", "dev->lock", LockIdentifier::LOCAL_LOCK);

  const LockStateRef Empty = LockState::createEmpty();

  /// Run edits on a fresh builder of state and build it.
  template <typename EditFn>
  static LockStateRef edit(const LockStateRef &state, EditFn fn) {
    auto builder = state->builder();
    fn(*builder);
    return builder->build();
  }

  /// State without restore link holding the given counts.
  LockStateRef
  makeState(std::initializer_list<std::pair<LockIdentifier, int>> counts) const {
    return edit(Empty, [&](LockStateBuilder &builder) {
      for (const auto &count : counts) {
        builder.set(count.first, count.second);
      }
    });
  }

  static LockStateRef replay(const LockStateRef &state,
                             const LockEffectList &effects) {
    return edit(state, [&](LockStateBuilder &builder) {
      applyEffects(builder, effects);
    });
  }

  static std::vector<std::string> describe(const LockEffectList &effects) {
    std::vector<std::string> result;
    for (const LockEffectRef &effect : effects) {
      result.push_back(effect->toString());
    }
    return result;
  }
};

} // namespace testing
} // namespace tumbler

#endif // TUMBLER_TESTS_UTILS_LOCKTESTFIXTURE_H
