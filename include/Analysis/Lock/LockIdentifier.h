/**
 * @file LockIdentifier.h
 * @brief Identity of a lockable resource tracked by the lock domain
 *
 * A lock is named by the family of primitives that operate on it (e.g.
 * "mutex", "spin") and, for locks that are not program-wide, by the
 * expression denoting the lock instance (e.g. "dev->lock").
 */

#ifndef LOCK_IDENTIFIER_H
#define LOCK_IDENTIFIER_H

#include <llvm/ADT/Hashing.h>
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/raw_ostream.h>

#include <functional>
#include <set>
#include <string>
#include <utility>

namespace tumbler {

class LockIdentifier {
public:
  enum LockType {
    GLOBAL_LOCK, ///< one lock for the whole program
    LOCAL_LOCK   ///< a lock instance named by an expression
  };

  /// Program-wide lock with no instance expression.
  static LockIdentifier of(llvm::StringRef name);

  static LockIdentifier of(llvm::StringRef name, llvm::StringRef variable,
                           LockType type);

  llvm::StringRef getName() const { return m_name; }
  llvm::StringRef getVariable() const { return m_variable; }
  LockType getType() const { return m_type; }
  bool isGlobal() const { return m_type == GLOBAL_LOCK; }

  /**
   * @brief Total order: name, then variable, then type
   * @return negative, zero or positive like strcmp
   */
  int compareTo(const LockIdentifier &other) const;

  bool operator==(const LockIdentifier &other) const {
    return m_type == other.m_type && m_name == other.m_name &&
           m_variable == other.m_variable;
  }
  bool operator!=(const LockIdentifier &other) const {
    return !(*this == other);
  }
  bool operator<(const LockIdentifier &other) const {
    return compareTo(other) < 0;
  }

  void print(llvm::raw_ostream &os) const;
  std::string toString() const;

private:
  LockIdentifier(std::string name, std::string variable, LockType type)
      : m_name(std::move(name)), m_variable(std::move(variable)),
        m_type(type) {}

  std::string m_name;
  std::string m_variable;
  LockType m_type;
};

using LockSet = std::set<LockIdentifier>;

inline llvm::hash_code hash_value(const LockIdentifier &lock) {
  return llvm::hash_combine(lock.getName(), lock.getVariable(),
                            static_cast<unsigned>(lock.getType()));
}

inline llvm::raw_ostream &operator<<(llvm::raw_ostream &os,
                                     const LockIdentifier &lock) {
  lock.print(os);
  return os;
}

} // namespace tumbler

namespace std {
template <> struct hash<tumbler::LockIdentifier> {
  size_t operator()(const tumbler::LockIdentifier &lock) const {
    return tumbler::hash_value(lock);
  }
};
} // namespace std

#endif // LOCK_IDENTIFIER_H
