/**
 * @file BlockSummaryIntegrationTest.cpp
 * @brief Lock states flowing through call summaries, traces and replay
 */

#include "Analysis/Lock/LockEffect.h"
#include "Analysis/Lock/LockReducer.h"
#include "Analysis/Lock/LockState.h"
#include "Analysis/Lock/LockTrace.h"

#include "../utils/LockTestFixture.h"

#include <gtest/gtest.h>
#include <llvm/Support/Error.h>

#include <map>

using namespace llvm;
using namespace tumbler;
using namespace tumbler::testing;

// ============================================================================
// Summary cache keyed by reduced lock states
// ============================================================================

class BlockSummaryIntegrationTest : public LockStateTestBase {
protected:
  const LockIdentifier Mutex = LockIdentifier::of("mutex");

  /// Body of a function that ends up holding the mutex once more.
  LockEffectList calleeBody() const {
    return {AcquireLockEffect::createEffectForId(Mutex),
            ReleaseLockEffect::createEffectForId(Mutex),
            AcquireLockEffect::createEffectForId(Mutex)};
  }

  /// Analyze a call of the callee from root, reusing cached summaries.
  LockStateRef call(const LockReducer &reducer, const LockStateRef &root) {
    LockSet blockLocks = {Mutex};
    LockStateRef reduced = reducer.getVariableReducedState(root, blockLocks);

    const LockMap &key = reducer.getHashCodeForState(*reduced);
    auto it = Summaries.find(key);
    if (it == Summaries.end()) {
      ++Misses;
      it = Summaries.emplace(key, replay(reduced, calleeBody())).first;
    }
    return reducer.getVariableExpandedState(root, blockLocks, it->second);
  }

  std::map<LockMap, LockStateRef> Summaries;
  int Misses = 0;
};

TEST_F(BlockSummaryIntegrationTest, AggressiveSummaryIsReusedAcrossCounts) {
  LockReducerOptions options;
  options.aggressiveReduction = true;
  LockReducer reducer(options);

  LockStateRef first = makeState({{Mutex, 1}, {DevLock, 1}});
  LockStateRef second = makeState({{Mutex, 1}, {DevLock, 3}});

  LockStateRef afterFirst = call(reducer, first);
  LockStateRef afterSecond = call(reducer, second);

  EXPECT_EQ(Misses, 1);
  EXPECT_EQ(*afterFirst, *makeState({{Mutex, 2}, {DevLock, 1}}));
  EXPECT_EQ(*afterSecond, *makeState({{Mutex, 2}, {DevLock, 3}}));

  std::vector<std::string> expected = {"Acquire(mutex)"};
  EXPECT_EQ(describe(second->getDifference(*afterSecond)), expected);
}

TEST_F(BlockSummaryIntegrationTest, UselessLocksSummaryIsReusedAcrossLocks) {
  LockReducerOptions options;
  options.reduceUselessLocks = true;
  LockReducer reducer(options);

  LockStateRef first = makeState({{Mutex, 1}, {L1, 1}});
  LockStateRef second = makeState({{Mutex, 1}, {L2, 2}, {DevLock, 1}});

  LockStateRef afterFirst = call(reducer, first);
  LockStateRef afterSecond = call(reducer, second);

  EXPECT_EQ(Misses, 1);
  EXPECT_EQ(*afterFirst, *makeState({{Mutex, 2}, {L1, 1}}));
  EXPECT_EQ(*afterSecond, *makeState({{Mutex, 2}, {L2, 2}, {DevLock, 1}}));
}

TEST_F(BlockSummaryIntegrationTest, PreciseSummariesDistinguishContexts) {
  LockReducer reducer;
  call(reducer, makeState({{Mutex, 1}, {DevLock, 1}}));
  call(reducer, makeState({{Mutex, 1}, {DevLock, 3}}));
  EXPECT_EQ(Misses, 2);
}

// ============================================================================
// Annotated functions restoring locks on return
// ============================================================================

TEST_F(BlockSummaryIntegrationTest, TraceWithNestedRestores) {
  Expected<LockTrace> trace = parseLockTrace(
      "# main takes the mutex\n"
      "acquire mutex\n"
      "commit\n"
      "# enter f: remember the caller\n"
      "save-state\n"
      "acquire mutex\n"
      "acquire spin dev->lock\n"
      "commit\n"
      "# enter g from f\n"
      "save-state\n"
      "reset-all\n"
      "commit\n"
      "# return from g: mutex comes back as f held it\n"
      "restore mutex\n"
      "commit\n"
      "# return from f\n"
      "restore mutex\n"
      "release spin dev->lock\n"
      "commit\n");
  ASSERT_TRUE(static_cast<bool>(trace)) << toString(trace.takeError());

  std::vector<LockStateRef> states = replayLockTrace(Empty, *trace);
  ASSERT_EQ(states.size(), 5u);
  for (const LockStateRef &state : states) {
    ASSERT_NE(state, nullptr);
  }

  const LockStateRef &inMain = states[0];
  const LockStateRef &inF = states[1];
  const LockStateRef &inG = states[2];
  const LockStateRef &backInF = states[3];
  const LockStateRef &backInMain = states[4];

  EXPECT_EQ(inF->getRestoreState(), inMain);
  EXPECT_EQ(inG->getRestoreState(), inF);
  EXPECT_TRUE(inG->isEmpty());

  EXPECT_EQ(backInF->toString(), "mutex[2]");
  EXPECT_EQ(backInF->getRestoreState(), inMain);

  EXPECT_EQ(backInMain->toString(), "mutex[1]");
  EXPECT_EQ(backInMain->getRestoreState(), nullptr);
  EXPECT_EQ(*backInMain, *inMain);
}

TEST_F(BlockSummaryIntegrationTest, DifferencesReplayAlongTrace) {
  Expected<LockTrace> trace = parseLockTrace("acquire L1\n"
                                             "acquire L2\n"
                                             "commit\n"
                                             "set L1 3\n"
                                             "commit\n"
                                             "reset L2\n"
                                             "acquire L3\n"
                                             "commit\n"
                                             "reset-all\n");
  ASSERT_TRUE(static_cast<bool>(trace)) << toString(trace.takeError());

  std::vector<LockStateRef> states = replayLockTrace(Empty, *trace);
  ASSERT_EQ(states.size(), 4u);

  LockStateRef previous = Empty;
  for (const LockStateRef &state : states) {
    ASSERT_NE(state, nullptr);
    LockStateRef replayed = replay(previous, previous->getDifference(*state));
    EXPECT_EQ(*replayed, *state);
    previous = state;
  }
  EXPECT_EQ(*states.back(), *Empty);
}

TEST_F(BlockSummaryIntegrationTest, RestoringEveryLockReturnsToCaller) {
  Expected<LockTrace> trace = parseLockTrace("acquire mutex\n"
                                             "acquire spin dev->lock\n"
                                             "commit\n"
                                             "save-state\n"
                                             "acquire mutex\n"
                                             "commit\n"
                                             "reset-all\n"
                                             "acquire mutex\n"
                                             "commit\n"
                                             "restore mutex\n"
                                             "restore spin dev->lock\n"
                                             "commit\n"
                                             "release spin dev->lock\n"
                                             "check mutex 1 true\n");
  ASSERT_TRUE(static_cast<bool>(trace)) << toString(trace.takeError());

  std::vector<LockStateRef> states = replayLockTrace(Empty, *trace);
  ASSERT_EQ(states.size(), 5u);
  for (const LockStateRef &state : states) {
    ASSERT_NE(state, nullptr);
  }

  // Both locks come back and the restore chain unwinds once
  EXPECT_EQ(*states[3], *states[0]);
  EXPECT_EQ(states[3]->getRestoreState(), nullptr);

  // Releasing the device lock in main is a real change
  EXPECT_NE(states[4], states[3]);
  EXPECT_EQ(states[4]->toString(), "mutex[1]");
  EXPECT_EQ((*trace)[4].line, 14u);
}
