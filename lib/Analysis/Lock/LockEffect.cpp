/**
 * @file LockEffect.cpp
 * @brief Implementation of lock effects
 */

#include "Analysis/Lock/LockEffect.h"

using namespace llvm;
using namespace tumbler;

std::string LockEffect::toString() const {
  std::string str;
  raw_string_ostream os(str);
  print(os);
  return os.str();
}

void tumbler::applyEffects(LockStateBuilder &builder,
                           ArrayRef<LockEffectRef> effects) {
  for (const LockEffectRef &effect : effects) {
    effect->effect(builder);
  }
}

void LockIdEffect::printWithName(raw_ostream &os, StringRef name) const {
  os << name << "(" << m_target << ")";
}

// ============================================================================
// Acquire / Release
// ============================================================================

LockEffectRef AcquireLockEffect::createEffectForId(const LockIdentifier &id) {
  return createEffectForId(id, 0);
}

LockEffectRef AcquireLockEffect::createEffectForId(const LockIdentifier &id,
                                                   int maxRecursion) {
  return std::make_shared<AcquireLockEffect>(id, maxRecursion);
}

void AcquireLockEffect::effect(LockStateBuilder &builder) const {
  if (m_maxRecursion > 0 && builder.getCounter(m_target) >= m_maxRecursion) {
    return;
  }
  builder.add(m_target);
}

void AcquireLockEffect::print(raw_ostream &os) const {
  printWithName(os, "Acquire");
}

LockEffectRef ReleaseLockEffect::createEffectForId(const LockIdentifier &id) {
  return std::make_shared<ReleaseLockEffect>(id);
}

void ReleaseLockEffect::effect(LockStateBuilder &builder) const {
  builder.free(m_target);
}

void ReleaseLockEffect::print(raw_ostream &os) const {
  printWithName(os, "Release");
}

// ============================================================================
// Reset / Set / Restore / Check
// ============================================================================

LockEffectRef ResetLockEffect::createEffectForId(const LockIdentifier &id) {
  return std::make_shared<ResetLockEffect>(id);
}

void ResetLockEffect::effect(LockStateBuilder &builder) const {
  builder.reset(m_target);
}

void ResetLockEffect::print(raw_ostream &os) const {
  printWithName(os, "Reset");
}

LockEffectRef SetLockEffect::createEffectForId(const LockIdentifier &id,
                                               int value) {
  return std::make_shared<SetLockEffect>(id, value);
}

void SetLockEffect::effect(LockStateBuilder &builder) const {
  builder.set(m_target, m_value);
}

void SetLockEffect::print(raw_ostream &os) const {
  os << "Set(" << m_target << ", " << m_value << ")";
}

LockEffectRef RestoreLockEffect::createEffectForId(const LockIdentifier &id) {
  return std::make_shared<RestoreLockEffect>(id);
}

void RestoreLockEffect::effect(LockStateBuilder &builder) const {
  builder.restore(m_target);
}

void RestoreLockEffect::print(raw_ostream &os) const {
  printWithName(os, "Restore");
}

LockEffectRef CheckLockEffect::createEffectForId(const LockIdentifier &id,
                                                 int value, bool isTruth) {
  return std::make_shared<CheckLockEffect>(id, value, isTruth);
}

void CheckLockEffect::effect(LockStateBuilder &builder) const {
  bool holds = builder.getCounter(m_target) == m_value;
  if (holds != m_isTruth) {
    builder.setAsFalseState();
  }
}

void CheckLockEffect::print(raw_ostream &os) const {
  os << "Check(" << m_target << (m_isTruth ? " == " : " != ") << m_value
     << ")";
}

// ============================================================================
// Whole-state effects
// ============================================================================

LockEffectRef RestoreAllLockEffect::getInstance() {
  static const LockEffectRef instance(new RestoreAllLockEffect());
  return instance;
}

void RestoreAllLockEffect::effect(LockStateBuilder &builder) const {
  builder.restoreAll();
}

void RestoreAllLockEffect::print(raw_ostream &os) const { os << "RestoreAll"; }

LockEffectRef ResetAllLockEffect::getInstance() {
  static const LockEffectRef instance(new ResetAllLockEffect());
  return instance;
}

void ResetAllLockEffect::effect(LockStateBuilder &builder) const {
  builder.resetAll();
}

void ResetAllLockEffect::print(raw_ostream &os) const { os << "ResetAll"; }

LockEffectRef SaveStateLockEffect::getInstance() {
  static const LockEffectRef instance(new SaveStateLockEffect());
  return instance;
}

void SaveStateLockEffect::effect(LockStateBuilder &builder) const {
  builder.setRestoreState();
}

void SaveStateLockEffect::print(raw_ostream &os) const { os << "SaveState"; }
