/**
 * @file LockEffect.h
 * @brief Replayable lock events applied to a LockStateBuilder
 *
 * An effect is an immutable description of one primitive lock event
 * ("acquire mutex", "restore all locks", ...). The classifier that maps
 * program edges to lock events produces effects; the transfer relation
 * replays them against a builder. getDifference() produces effects as
 * well, so a state transition can be replayed elsewhere.
 *
 * Effects use LLVM-style RTTI: query them with llvm::isa / llvm::dyn_cast.
 */

#ifndef LOCK_EFFECT_H
#define LOCK_EFFECT_H

#include "Analysis/Lock/LockIdentifier.h"
#include "Analysis/Lock/LockState.h"

#include <llvm/ADT/ArrayRef.h>
#include <llvm/Support/Casting.h>
#include <llvm/Support/raw_ostream.h>

#include <memory>
#include <string>

namespace tumbler {

class LockEffect {
public:
  enum EffectKind {
    EK_Acquire,
    EK_Release,
    EK_Reset,
    EK_Set,
    EK_Restore,
    EK_Check,
    EK_LastLockIdEffect = EK_Check,
    EK_RestoreAll,
    EK_ResetAll,
    EK_SaveState
  };

  virtual ~LockEffect() = default;

  EffectKind getKind() const { return m_kind; }

  /// Apply the event to the builder.
  virtual void effect(LockStateBuilder &builder) const = 0;

  virtual void print(llvm::raw_ostream &os) const = 0;
  std::string toString() const;

protected:
  explicit LockEffect(EffectKind kind) : m_kind(kind) {}

private:
  const EffectKind m_kind;
};

inline llvm::raw_ostream &operator<<(llvm::raw_ostream &os,
                                     const LockEffect &effect) {
  effect.print(os);
  return os;
}

/// Replay effects in order.
void applyEffects(LockStateBuilder &builder,
                  llvm::ArrayRef<LockEffectRef> effects);

// ============================================================================
// Effects on a single lock
// ============================================================================

class LockIdEffect : public LockEffect {
public:
  const LockIdentifier &getLockId() const { return m_target; }

  static bool classof(const LockEffect *effect) {
    return effect->getKind() <= EK_LastLockIdEffect;
  }

protected:
  LockIdEffect(EffectKind kind, LockIdentifier target)
      : LockEffect(kind), m_target(std::move(target)) {}

  /// Prints "Name(lock)".
  void printWithName(llvm::raw_ostream &os, llvm::StringRef name) const;

  const LockIdentifier m_target;
};

/**
 * @brief Acquisition of a lock
 *
 * With a positive recursion bound the acquisition saturates: once the
 * working count reaches the bound, further acquisitions leave it unchanged.
 */
class AcquireLockEffect : public LockIdEffect {
public:
  AcquireLockEffect(LockIdentifier target, int maxRecursion)
      : LockIdEffect(EK_Acquire, std::move(target)),
        m_maxRecursion(maxRecursion) {}

  static LockEffectRef createEffectForId(const LockIdentifier &id);
  static LockEffectRef createEffectForId(const LockIdentifier &id,
                                         int maxRecursion);

  int getMaxRecursion() const { return m_maxRecursion; }

  void effect(LockStateBuilder &builder) const override;
  void print(llvm::raw_ostream &os) const override;

  static bool classof(const LockEffect *effect) {
    return effect->getKind() == EK_Acquire;
  }

private:
  const int m_maxRecursion; // 0 means unlimited
};

class ReleaseLockEffect : public LockIdEffect {
public:
  explicit ReleaseLockEffect(LockIdentifier target)
      : LockIdEffect(EK_Release, std::move(target)) {}

  static LockEffectRef createEffectForId(const LockIdentifier &id);

  void effect(LockStateBuilder &builder) const override;
  void print(llvm::raw_ostream &os) const override;

  static bool classof(const LockEffect *effect) {
    return effect->getKind() == EK_Release;
  }
};

class ResetLockEffect : public LockIdEffect {
public:
  explicit ResetLockEffect(LockIdentifier target)
      : LockIdEffect(EK_Reset, std::move(target)) {}

  static LockEffectRef createEffectForId(const LockIdentifier &id);

  void effect(LockStateBuilder &builder) const override;
  void print(llvm::raw_ostream &os) const override;

  static bool classof(const LockEffect *effect) {
    return effect->getKind() == EK_Reset;
  }
};

class SetLockEffect : public LockIdEffect {
public:
  SetLockEffect(LockIdentifier target, int value)
      : LockIdEffect(EK_Set, std::move(target)), m_value(value) {}

  static LockEffectRef createEffectForId(const LockIdentifier &id, int value);

  int getValue() const { return m_value; }

  void effect(LockStateBuilder &builder) const override;
  void print(llvm::raw_ostream &os) const override;

  static bool classof(const LockEffect *effect) {
    return effect->getKind() == EK_Set;
  }

private:
  const int m_value;
};

class RestoreLockEffect : public LockIdEffect {
public:
  explicit RestoreLockEffect(LockIdentifier target)
      : LockIdEffect(EK_Restore, std::move(target)) {}

  static LockEffectRef createEffectForId(const LockIdentifier &id);

  void effect(LockStateBuilder &builder) const override;
  void print(llvm::raw_ostream &os) const override;

  static bool classof(const LockEffect *effect) {
    return effect->getKind() == EK_Restore;
  }
};

/**
 * @brief Assumption on the recursion count of a lock
 *
 * Marks the builder false when "count == value" does not have the expected
 * truth value, e.g. the false branch of `if (mutex_is_locked(m))` while m
 * is held once.
 */
class CheckLockEffect : public LockIdEffect {
public:
  CheckLockEffect(LockIdentifier target, int value, bool isTruth)
      : LockIdEffect(EK_Check, std::move(target)), m_value(value),
        m_isTruth(isTruth) {}

  static LockEffectRef createEffectForId(const LockIdentifier &id, int value,
                                         bool isTruth);

  int getValue() const { return m_value; }
  bool isTruth() const { return m_isTruth; }

  void effect(LockStateBuilder &builder) const override;
  void print(llvm::raw_ostream &os) const override;

  static bool classof(const LockEffect *effect) {
    return effect->getKind() == EK_Check;
  }

private:
  const int m_value;
  const bool m_isTruth;
};

// ============================================================================
// Effects on the whole state
// ============================================================================

class RestoreAllLockEffect : public LockEffect {
public:
  static LockEffectRef getInstance();

  void effect(LockStateBuilder &builder) const override;
  void print(llvm::raw_ostream &os) const override;

  static bool classof(const LockEffect *effect) {
    return effect->getKind() == EK_RestoreAll;
  }

private:
  RestoreAllLockEffect() : LockEffect(EK_RestoreAll) {}
};

class ResetAllLockEffect : public LockEffect {
public:
  static LockEffectRef getInstance();

  void effect(LockStateBuilder &builder) const override;
  void print(llvm::raw_ostream &os) const override;

  static bool classof(const LockEffect *effect) {
    return effect->getKind() == EK_ResetAll;
  }

private:
  ResetAllLockEffect() : LockEffect(EK_ResetAll) {}
};

/// Remember the current state as the one to restore after the call.
class SaveStateLockEffect : public LockEffect {
public:
  static LockEffectRef getInstance();

  void effect(LockStateBuilder &builder) const override;
  void print(llvm::raw_ostream &os) const override;

  static bool classof(const LockEffect *effect) {
    return effect->getKind() == EK_SaveState;
  }

private:
  SaveStateLockEffect() : LockEffect(EK_SaveState) {}
};

} // namespace tumbler

#endif // LOCK_EFFECT_H
