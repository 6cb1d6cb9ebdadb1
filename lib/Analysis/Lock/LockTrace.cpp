/**
 * @file LockTrace.cpp
 * @brief Parsing and replay of lock traces
 */

#include "Analysis/Lock/LockTrace.h"

#include <llvm/ADT/SmallVector.h>
#include <llvm/ADT/StringExtras.h>
#include <llvm/ADT/StringSwitch.h>
#include <llvm/ADT/Twine.h>
#include <llvm/Support/Debug.h>
#include <llvm/Support/ErrorHandling.h>

#define DEBUG_TYPE "lock-trace"

using namespace llvm;
using namespace tumbler;

namespace {

enum class Directive {
  Acquire,
  Release,
  Reset,
  Set,
  Restore,
  Check,
  RestoreAll,
  ResetAll,
  SaveState,
  Commit,
  Unknown
};

/// Number of trailing value operands after the lock.
unsigned getValueOperands(Directive directive) {
  switch (directive) {
  case Directive::Set:
    return 1;
  case Directive::Check:
    return 2;
  default:
    return 0;
  }
}

bool takesLock(Directive directive) {
  switch (directive) {
  case Directive::Acquire:
  case Directive::Release:
  case Directive::Reset:
  case Directive::Set:
  case Directive::Restore:
  case Directive::Check:
    return true;
  default:
    return false;
  }
}

Error makeLineError(unsigned line, const Twine &message) {
  return make_error<StringError>("line " + Twine(line) + ": " + message,
                                 inconvertibleErrorCode());
}

} // namespace

Expected<LockTrace> tumbler::parseLockTrace(StringRef buffer,
                                            int maxRecursion) {
  LockTrace trace;
  LockTraceStep current;
  unsigned lastLine = 0;

  SmallVector<StringRef, 32> lines;
  buffer.split(lines, '\n');

  for (unsigned i = 0; i < lines.size(); ++i) {
    unsigned lineNo = i + 1;
    StringRef line = lines[i].split('#').first.trim();
    if (line.empty()) {
      continue;
    }

    SmallVector<StringRef, 5> tokens;
    SplitString(line, tokens);

    Directive directive = StringSwitch<Directive>(tokens[0])
                              .Case("acquire", Directive::Acquire)
                              .Case("release", Directive::Release)
                              .Case("reset", Directive::Reset)
                              .Case("set", Directive::Set)
                              .Case("restore", Directive::Restore)
                              .Case("check", Directive::Check)
                              .Case("restore-all", Directive::RestoreAll)
                              .Case("reset-all", Directive::ResetAll)
                              .Case("save-state", Directive::SaveState)
                              .Case("commit", Directive::Commit)
                              .Default(Directive::Unknown);

    if (directive == Directive::Unknown) {
      return makeLineError(lineNo, "unknown directive '" + tokens[0] + "'");
    }
    lastLine = lineNo;

    if (!takesLock(directive)) {
      if (tokens.size() != 1) {
        return makeLineError(lineNo, "'" + tokens[0] + "' takes no operands");
      }
      switch (directive) {
      case Directive::RestoreAll:
        current.effects.push_back(RestoreAllLockEffect::getInstance());
        break;
      case Directive::ResetAll:
        current.effects.push_back(ResetAllLockEffect::getInstance());
        break;
      case Directive::SaveState:
        current.effects.push_back(SaveStateLockEffect::getInstance());
        break;
      default:
        current.line = lineNo;
        trace.push_back(std::move(current));
        current = LockTraceStep();
        break;
      }
      continue;
    }

    unsigned values = getValueOperands(directive);
    if (tokens.size() < 2 + values || tokens.size() > 3 + values) {
      return makeLineError(lineNo, "wrong number of operands for '" +
                                       tokens[0] + "'");
    }

    size_t lockTokens = tokens.size() - 1 - values;
    LockIdentifier lock =
        lockTokens == 1
            ? LockIdentifier::of(tokens[1])
            : LockIdentifier::of(tokens[1], tokens[2],
                                 LockIdentifier::LOCAL_LOCK);

    int value = 0;
    if (values > 0) {
      StringRef valueToken = tokens[1 + lockTokens];
      if (valueToken.getAsInteger(10, value) || value < 0) {
        return makeLineError(lineNo, "invalid lock counter '" + valueToken +
                                         "'");
      }
    }

    switch (directive) {
    case Directive::Acquire:
      current.effects.push_back(
          AcquireLockEffect::createEffectForId(lock, maxRecursion));
      break;
    case Directive::Release:
      current.effects.push_back(ReleaseLockEffect::createEffectForId(lock));
      break;
    case Directive::Reset:
      current.effects.push_back(ResetLockEffect::createEffectForId(lock));
      break;
    case Directive::Set:
      current.effects.push_back(SetLockEffect::createEffectForId(lock, value));
      break;
    case Directive::Restore:
      current.effects.push_back(RestoreLockEffect::createEffectForId(lock));
      break;
    case Directive::Check: {
      StringRef truthToken = tokens.back();
      if (truthToken != "true" && truthToken != "false") {
        return makeLineError(lineNo, "expected 'true' or 'false', got '" +
                                         truthToken + "'");
      }
      current.effects.push_back(CheckLockEffect::createEffectForId(
          lock, value, truthToken == "true"));
      break;
    }
    default:
      llvm_unreachable("directive without a lock handled above");
    }
  }

  if (!current.effects.empty()) {
    current.line = lastLine;
    trace.push_back(std::move(current));
  }
  return std::move(trace);
}

std::vector<LockStateRef> tumbler::replayLockTrace(const LockStateRef &initial,
                                                   const LockTrace &trace) {
  std::vector<LockStateRef> states;
  LockStateRef current = initial;

  for (const LockTraceStep &step : trace) {
    auto builder = current->builder();
    applyEffects(*builder, step.effects);
    LockStateRef next = builder->build();
    states.push_back(next);
    if (!next) {
      LLVM_DEBUG(dbgs() << "[LockTrace] step at line " << step.line
                        << " is infeasible\n");
      break;
    }
    current = next;
  }
  return states;
}
