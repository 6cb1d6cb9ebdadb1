/**
 * @file LockState.cpp
 * @brief Implementation of the lock state and its builder
 */

#include "Analysis/Lock/LockState.h"
#include "Analysis/Lock/LockEffect.h"

#include <llvm/ADT/Statistic.h>
#include <llvm/Support/Debug.h>

#include <cassert>

#define DEBUG_TYPE "lock-state"

STATISTIC(NumStatesCreated, "Number of lock states created");
STATISTIC(NumStatesShared, "Number of builds returning the origin state");
STATISTIC(NumInfeasibleBuilds, "Number of builds marked infeasible");

using namespace llvm;
using namespace tumbler;

// ============================================================================
// LockState
// ============================================================================

LockStateRef LockState::createEmpty() { return LockStateRef(new LockState()); }

int LockState::getCounter(const LockIdentifier &lock) const {
  auto it = m_locks.find(lock);
  if (it != m_locks.end()) {
    return it->second;
  }
  return 0;
}

int LockState::getTotalLockCount() const {
  int total = 0;
  for (const auto &entry : m_locks) {
    total += entry.second;
  }
  return total;
}

LockSet LockState::getLockSet() const {
  LockSet result;
  for (const auto &entry : m_locks) {
    result.insert(result.end(), entry.first);
  }
  return result;
}

int LockState::compareTo(const LockState &other) const {
  // Decreasing queue: bigger states go first
  int result = static_cast<int>(other.getSize()) - static_cast<int>(getSize());
  if (result != 0) {
    return result;
  }

  auto it1 = m_locks.begin();
  auto it2 = other.m_locks.begin();
  for (; it1 != m_locks.end(); ++it1, ++it2) {
    result = it1->first.compareTo(it2->first);
    if (result != 0) {
      return result;
    }
    result = it1->second - it2->second;
    if (result != 0) {
      return result;
    }
  }
  return 0;
}

LockEffectList LockState::getDifference(const LockState &other) const {
  LockEffectList result;

  for (const auto &entry : m_locks) {
    const LockIdentifier &lock = entry.first;
    int thisCounter = entry.second;
    int otherCounter = other.getCounter(lock);
    for (int i = otherCounter; i < thisCounter; ++i) {
      result.push_back(ReleaseLockEffect::createEffectForId(lock));
    }
    for (int i = thisCounter; i < otherCounter; ++i) {
      result.push_back(AcquireLockEffect::createEffectForId(lock));
    }
  }

  for (const auto &entry : other.m_locks) {
    if (contains(entry.first)) {
      continue;
    }
    for (int i = 0; i < entry.second; ++i) {
      result.push_back(AcquireLockEffect::createEffectForId(entry.first));
    }
  }
  return result;
}

std::unique_ptr<LockStateBuilder> LockState::builder() const {
  return std::make_unique<LockStateBuilder>(shared_from_this());
}

bool LockState::operator==(const LockState &other) const {
  if (this == &other) {
    return true;
  }
  return m_locks == other.m_locks &&
         isSameRestoreState(m_toRestore, other.m_toRestore);
}

void LockState::print(raw_ostream &os) const {
  if (m_locks.empty()) {
    os << "Without locks";
    return;
  }
  bool first = true;
  for (const auto &entry : m_locks) {
    if (!first) {
      os << ", ";
    }
    first = false;
    os << entry.first << "[" << entry.second << "]";
  }
}

std::string LockState::toString() const {
  std::string str;
  raw_string_ostream os(str);
  print(os);
  return os.str();
}

bool tumbler::isSameRestoreState(const LockStateRef &a, const LockStateRef &b) {
  if (a == b) {
    return true;
  }
  if (!a || !b) {
    return false;
  }
  return *a == *b;
}

hash_code tumbler::hash_value(const LockState &state) {
  hash_code result = hash_combine(state.getSize());
  for (const auto &entry : state.getLocks()) {
    result = hash_combine(result, entry.first, entry.second);
  }
  return result;
}

// ============================================================================
// LockStateBuilder
// ============================================================================

LockStateBuilder::LockStateBuilder(LockStateRef origin)
    : m_mutableLocks(origin->getLocks()), m_origin(std::move(origin)) {
  m_mutableToRestore = m_origin->getRestoreState();
}

void LockStateBuilder::checkNotBuilt() const {
  assert(m_status != Status::Built && "lock state builder used after build()");
}

int LockStateBuilder::getCounter(const LockIdentifier &lock) const {
  auto it = m_mutableLocks.find(lock);
  if (it != m_mutableLocks.end()) {
    return it->second;
  }
  return 0;
}

void LockStateBuilder::add(const LockIdentifier &lock) {
  checkNotBuilt();
  ++m_mutableLocks[lock];
}

void LockStateBuilder::free(const LockIdentifier &lock) {
  checkNotBuilt();
  auto it = m_mutableLocks.find(lock);
  if (it == m_mutableLocks.end()) {
    return;
  }
  if (--it->second <= 0) {
    m_mutableLocks.erase(it);
  }
}

void LockStateBuilder::reset(const LockIdentifier &lock) {
  checkNotBuilt();
  m_mutableLocks.erase(lock);
}

void LockStateBuilder::set(const LockIdentifier &lock, int num) {
  checkNotBuilt();
  assert(num >= 0 && "negative lock counter");

  // num == 0 means the lock is released completely
  int size = getCounter(lock);
  for (int i = size; i < num; ++i) {
    add(lock);
  }
  for (int i = num; i < size; ++i) {
    free(lock);
  }
}

void LockStateBuilder::restore(const LockIdentifier &lock) {
  checkNotBuilt();
  if (!m_mutableToRestore) {
    return;
  }
  m_mutableLocks.erase(lock);
  int size = m_mutableToRestore->getCounter(lock);
  if (size > 0) {
    m_mutableLocks[lock] = size;
  }
  m_restored = true;
}

void LockStateBuilder::restoreAll() {
  checkNotBuilt();
  if (!m_mutableToRestore) {
    return;
  }
  m_mutableLocks = m_mutableToRestore->getLocks();
}

void LockStateBuilder::resetAll() {
  checkNotBuilt();
  m_mutableLocks.clear();
}

void LockStateBuilder::reduce() {
  checkNotBuilt();
  m_mutableToRestore.reset();
}

void LockStateBuilder::reduceLocks(const LockSet &locks) {
  checkNotBuilt();
  for (const LockIdentifier &lock : locks) {
    m_mutableLocks.erase(lock);
  }
}

void LockStateBuilder::reduceLockCounters(const LockSet &exceptLocks) {
  checkNotBuilt();
  LockSet reducible;
  for (const auto &entry : m_mutableLocks) {
    if (!exceptLocks.count(entry.first)) {
      reducible.insert(entry.first);
    }
  }
  for (const LockIdentifier &lock : reducible) {
    reset(lock);
    add(lock);
  }
}

void LockStateBuilder::expand(const LockState &rootState) {
  checkNotBuilt();
  m_mutableToRestore = rootState.getRestoreState();
}

void LockStateBuilder::expandLocks(const LockState &rootState,
                                   const LockSet &usedLocks) {
  checkNotBuilt();
  for (const auto &entry : rootState.getLocks()) {
    if (!usedLocks.count(entry.first)) {
      m_mutableLocks[entry.first] = entry.second;
    }
  }
}

void LockStateBuilder::expandLockCounters(const LockState &rootState,
                                          const LockSet &restrictedLocks) {
  checkNotBuilt();
  for (const auto &entry : rootState.getLocks()) {
    if (restrictedLocks.count(entry.first)) {
      continue;
    }
    // A lock missing here was released inside the callee; the root count
    // still contributes, minus the single acquisition kept by the reduction
    int newSize = getCounter(entry.first) + entry.second - 1;
    if (newSize > 0) {
      m_mutableLocks[entry.first] = newSize;
    } else {
      m_mutableLocks.erase(entry.first);
    }
  }
}

void LockStateBuilder::setRestoreState() {
  checkNotBuilt();
  m_mutableToRestore = m_origin;
}

void LockStateBuilder::setAsFalseState() {
  checkNotBuilt();
  m_status = Status::Aborted;
}

LockStateRef LockStateBuilder::build() {
  checkNotBuilt();
  bool infeasible = m_status == Status::Aborted;
  m_status = Status::Built;

  if (infeasible) {
    ++NumInfeasibleBuilds;
    LLVM_DEBUG(dbgs() << "[LockState] infeasible successor of "
                      << *m_origin << "\n");
    return nullptr;
  }

  if (m_restored && m_mutableToRestore) {
    m_mutableToRestore = m_mutableToRestore->getRestoreState();
  }

  if (m_mutableLocks == m_origin->getLocks() &&
      isSameRestoreState(m_mutableToRestore, m_origin->getRestoreState())) {
    ++NumStatesShared;
    return m_origin;
  }

  ++NumStatesCreated;
  LockStateRef result(
      new LockState(std::move(m_mutableLocks), std::move(m_mutableToRestore)));
  LLVM_DEBUG(dbgs() << "[LockState] " << *m_origin << " -> " << *result
                    << "\n");
  return result;
}
