/**
 * @file LockState.h
 * @brief Abstract state of held reentrant locks
 *
 * A LockState records, for every lock held on an abstract path, how many
 * times it has been acquired without a matching release. States are
 * immutable and always handled through shared handles; all edits go
 * through a LockStateBuilder derived from a state, which finalizes into a
 * new state or, when nothing changed, into the very same instance.
 *
 * A state may carry a restore link: the state the analysis returns to once
 * a summarized function call completes. The link is shared, never copied.
 *
 * Usage:
 *   LockStateRef s = LockState::createEmpty();
 *   auto b = s->builder();
 *   b->add(LockIdentifier::of("mutex"));
 *   LockStateRef next = b->build(); // nullptr if the path is infeasible
 */

#ifndef LOCK_STATE_H
#define LOCK_STATE_H

#include "Analysis/Lock/LockIdentifier.h"

#include <llvm/ADT/Hashing.h>
#include <llvm/Support/raw_ostream.h>

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace tumbler {

class LockEffect;
class LockState;
class LockStateBuilder;

using LockStateRef = std::shared_ptr<const LockState>;
using LockEffectRef = std::shared_ptr<const LockEffect>;
using LockEffectList = std::vector<LockEffectRef>;

/// Lock -> recursion count. Counts are always positive.
using LockMap = std::map<LockIdentifier, int>;

class LockState : public std::enable_shared_from_this<LockState> {
  friend class LockStateBuilder;

public:
  /// Initial state: no locks held, no restore link.
  static LockStateRef createEmpty();

  /**
   * @brief Recursion count of a lock
   * @return 0 if the lock is not held
   */
  int getCounter(const LockIdentifier &lock) const;

  bool contains(const LockIdentifier &lock) const {
    return m_locks.count(lock) != 0;
  }

  /// Number of distinct held locks.
  size_t getSize() const { return m_locks.size(); }

  /// Sum of all recursion counts.
  int getTotalLockCount() const;

  bool isEmpty() const { return m_locks.empty(); }

  /// Read-only view of the mapping; the cache key for block summaries.
  const LockMap &getLocks() const { return m_locks; }

  LockSet getLockSet() const;

  const LockStateRef &getRestoreState() const { return m_toRestore; }

  /**
   * @brief Canonical order of states
   *
   * States holding more distinct locks come first. States of equal size
   * are compared lock by lock in identifier order, first by identifier and
   * then by recursion count.
   *
   * @return negative if this state sorts before other
   */
  int compareTo(const LockState &other) const;

  /**
   * @brief Effects transforming this state into another
   *
   * Locks of this state are visited in ascending identifier order and emit
   * Release effects (this holds more) or Acquire effects (other holds
   * more). Locks held only by other follow, again in ascending order, each
   * emitting Acquire effects. All effects for one lock are consecutive.
   */
  LockEffectList getDifference(const LockState &other) const;

  /// Fresh builder seeded with this state's locks.
  std::unique_ptr<LockStateBuilder> builder() const;

  /// Structural equality on locks and restore link.
  bool operator==(const LockState &other) const;
  bool operator!=(const LockState &other) const { return !(*this == other); }
  bool operator<(const LockState &other) const {
    return compareTo(other) < 0;
  }

  void print(llvm::raw_ostream &os) const;
  std::string toString() const;

  LockState(const LockState &) = delete;
  LockState &operator=(const LockState &) = delete;

private:
  LockState() = default;
  LockState(LockMap locks, LockStateRef toRestore)
      : m_locks(std::move(locks)), m_toRestore(std::move(toRestore)) {}

  const LockMap m_locks;
  const LockStateRef m_toRestore;
};

/// Equality of restore links, which may both be absent.
bool isSameRestoreState(const LockStateRef &a, const LockStateRef &b);

/// Hash of the lock mapping; the restore link does not participate.
llvm::hash_code hash_value(const LockState &state);

inline llvm::raw_ostream &operator<<(llvm::raw_ostream &os,
                                     const LockState &state) {
  state.print(os);
  return os;
}

/**
 * @brief Single-use scratch pad producing the successor of a LockState
 *
 * The builder copies the origin's mapping, accepts edits while open and is
 * finalized by exactly one call to build(). Marking the builder false
 * makes build() report an infeasible path. set() and
 * reduceLockCounters() only go through add()/free()/reset(), so a subclass
 * overriding add() or free() sees every count change.
 */
class LockStateBuilder {
public:
  enum class Status {
    Open,    ///< accepting edits
    Aborted, ///< marked infeasible, build() yields nullptr
    Built    ///< finalized
  };

  explicit LockStateBuilder(LockStateRef origin);
  virtual ~LockStateBuilder() = default;

  LockStateBuilder(const LockStateBuilder &) = delete;
  LockStateBuilder &operator=(const LockStateBuilder &) = delete;

  // ========================================================================
  // Per-lock edits
  // ========================================================================

  /// Acquire once more.
  virtual void add(const LockIdentifier &lock);

  /// Release once; releasing a lock that is not held is a no-op.
  virtual void free(const LockIdentifier &lock);

  /// Forget the lock regardless of its count.
  void reset(const LockIdentifier &lock);

  /**
   * @brief Bring the count to exactly num through add()/free()
   * @param num Target count, must not be negative
   */
  void set(const LockIdentifier &lock, int num);

  /// Take the count recorded in the restore link.
  void restore(const LockIdentifier &lock);

  // ========================================================================
  // Whole-state edits
  // ========================================================================

  void restoreAll();
  void resetAll();

  // ========================================================================
  // Function summaries
  // ========================================================================

  /// Drop the restore link when entering a summarized scope.
  void reduce();
  /// Remove exactly the given locks.
  void reduceLocks(const LockSet &locks);
  /// Normalize the count of every held lock outside exceptLocks to 1.
  void reduceLockCounters(const LockSet &exceptLocks);
  /// Take the restore link of the caller state.
  void expand(const LockState &rootState);
  /// Copy the caller's locks outside usedLocks back in.
  void expandLocks(const LockState &rootState, const LockSet &usedLocks);
  /// Undo reduceLockCounters() on top of the callee's own effects.
  void expandLockCounters(const LockState &rootState,
                          const LockSet &restrictedLocks);
  /// Link the successor back to the origin state.
  void setRestoreState();

  void setAsFalseState();

  // ========================================================================
  // Finalization
  // ========================================================================

  /**
   * @brief Materialize the successor state
   * @return the origin itself if nothing changed, nullptr if the builder
   *         was marked false, a new state otherwise
   */
  LockStateRef build();

  /// Working count, reflecting edits made so far.
  int getCounter(const LockIdentifier &lock) const;

  const LockStateRef &getOldState() const { return m_origin; }
  bool isFalseState() const { return m_status == Status::Aborted; }
  Status getStatus() const { return m_status; }

protected:
  void checkNotBuilt() const;

  LockMap m_mutableLocks;

private:
  LockStateRef m_origin;
  LockStateRef m_mutableToRestore;
  bool m_restored = false;
  Status m_status = Status::Open;
};

} // namespace tumbler

namespace std {
template <> struct hash<tumbler::LockState> {
  size_t operator()(const tumbler::LockState &state) const {
    return tumbler::hash_value(state);
  }
};
} // namespace std

#endif // LOCK_STATE_H
