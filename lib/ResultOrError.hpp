#ifndef DIRECT_TPU_RESULT_OR_ERROR_HPP
#define DIRECT_TPU_RESULT_OR_ERROR_HPP

#include <cstdint>
#include <new>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace dt {

/**
 * Common base for component error types.
 * Components declare `struct Error : RoeErrorBase { using RoeErrorBase::RoeErrorBase; };`
 */
struct RoeErrorBase {
  int32_t code{ 0 };
  std::string message;

  RoeErrorBase() = default;
  RoeErrorBase(int32_t c, const std::string &msg) : code(c), message(msg) {}
  RoeErrorBase(int32_t c, std::string &&msg) : code(c), message(std::move(msg)) {}
  explicit RoeErrorBase(const std::string &msg) : code(-1), message(msg) {}
  explicit RoeErrorBase(std::string &&msg) : code(-1), message(std::move(msg)) {}
};

template <typename T, typename E = RoeErrorBase> class ResultOrError {
public:
  // Success
  ResultOrError(const T &value) : hasValue_(true) { new (&storage_) T(value); }

  ResultOrError(T &&value) : hasValue_(true) {
    new (&storage_) T(std::move(value));
  }

  // Failure
  ResultOrError(const E &err) : hasValue_(false) { new (&storage_) E(err); }

  ResultOrError(E &&err) : hasValue_(false) {
    new (&storage_) E(std::move(err));
  }

  static ResultOrError error(const E &err) { return ResultOrError(err); }

  ResultOrError(const ResultOrError &other) : hasValue_(other.hasValue_) {
    if (hasValue_) {
      new (&storage_) T(other.asValue());
    } else {
      new (&storage_) E(other.asError());
    }
  }

  ResultOrError(ResultOrError &&other) noexcept : hasValue_(other.hasValue_) {
    if (hasValue_) {
      new (&storage_) T(std::move(other.asValue()));
    } else {
      new (&storage_) E(std::move(other.asError()));
    }
  }

  ~ResultOrError() { destroy(); }

  ResultOrError &operator=(const ResultOrError &other) {
    if (this != &other) {
      destroy();
      hasValue_ = other.hasValue_;
      if (hasValue_) {
        new (&storage_) T(other.asValue());
      } else {
        new (&storage_) E(other.asError());
      }
    }
    return *this;
  }

  ResultOrError &operator=(ResultOrError &&other) noexcept {
    if (this != &other) {
      destroy();
      hasValue_ = other.hasValue_;
      if (hasValue_) {
        new (&storage_) T(std::move(other.asValue()));
      } else {
        new (&storage_) E(std::move(other.asError()));
      }
    }
    return *this;
  }

  bool isOk() const { return hasValue_; }
  bool isError() const { return !hasValue_; }
  explicit operator bool() const { return hasValue_; }

  const T &value() const {
    if (!hasValue_) {
      throw std::runtime_error("Attempting to access value of error result");
    }
    return asValue();
  }

  T &value() {
    if (!hasValue_) {
      throw std::runtime_error("Attempting to access value of error result");
    }
    return asValue();
  }

  T valueOr(const T &defaultValue) const {
    return hasValue_ ? asValue() : defaultValue;
  }

  const E &error() const {
    if (hasValue_) {
      throw std::runtime_error("Attempting to access error of success result");
    }
    return asError();
  }

  E &error() {
    if (hasValue_) {
      throw std::runtime_error("Attempting to access error of success result");
    }
    return asError();
  }

  const T &operator*() const { return value(); }
  T &operator*() { return value(); }
  const T *operator->() const { return &value(); }
  T *operator->() { return &value(); }

private:
  T &asValue() { return *std::launder(reinterpret_cast<T *>(&storage_)); }
  const T &asValue() const {
    return *std::launder(reinterpret_cast<const T *>(&storage_));
  }
  E &asError() { return *std::launder(reinterpret_cast<E *>(&storage_)); }
  const E &asError() const {
    return *std::launder(reinterpret_cast<const E *>(&storage_));
  }

  void destroy() {
    if (hasValue_) {
      asValue().~T();
    } else {
      asError().~E();
    }
  }

  bool hasValue_;
  alignas(T) alignas(E) unsigned char storage_[sizeof(T) > sizeof(E) ? sizeof(T) : sizeof(E)];
};

// Specialization for operations that only report success or failure
template <typename E> class ResultOrError<void, E> {
public:
  ResultOrError() : hasValue_(true) {}

  ResultOrError(const E &err) : hasValue_(false), error_(err) {}
  ResultOrError(E &&err) : hasValue_(false), error_(std::move(err)) {}

  static ResultOrError error(const E &err) { return ResultOrError(err); }

  bool isOk() const { return hasValue_; }
  bool isError() const { return !hasValue_; }
  explicit operator bool() const { return hasValue_; }

  const E &error() const {
    if (hasValue_) {
      throw std::runtime_error("Attempting to access error of success result");
    }
    return error_;
  }

  E &error() {
    if (hasValue_) {
      throw std::runtime_error("Attempting to access error of success result");
    }
    return error_;
  }

private:
  bool hasValue_;
  E error_;
};

} // namespace dt

#endif // DIRECT_TPU_RESULT_OR_ERROR_HPP
