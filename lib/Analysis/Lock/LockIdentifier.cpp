/**
 * @file LockIdentifier.cpp
 * @brief Implementation of lock identities
 */

#include "Analysis/Lock/LockIdentifier.h"

using namespace llvm;
using namespace tumbler;

LockIdentifier LockIdentifier::of(StringRef name) {
  return LockIdentifier(name.str(), std::string(), GLOBAL_LOCK);
}

LockIdentifier LockIdentifier::of(StringRef name, StringRef variable,
                                  LockType type) {
  return LockIdentifier(name.str(), variable.str(), type);
}

int LockIdentifier::compareTo(const LockIdentifier &other) const {
  int result = StringRef(m_name).compare(other.m_name);
  if (result != 0) {
    return result;
  }
  result = StringRef(m_variable).compare(other.m_variable);
  if (result != 0) {
    return result;
  }
  return static_cast<int>(m_type) - static_cast<int>(other.m_type);
}

void LockIdentifier::print(raw_ostream &os) const {
  os << m_name;
  if (!m_variable.empty()) {
    os << "(" << m_variable << ")";
  }
}

std::string LockIdentifier::toString() const {
  std::string str;
  raw_string_ostream os(str);
  print(os);
  return os.str();
}
