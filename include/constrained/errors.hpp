#ifndef CONSTRAINED_ERRORS_HPP
#define CONSTRAINED_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <utility>

#include <constrained/pretty.hpp>
#include <constrained/type_set.hpp>

namespace constrained {

enum class ViolationKind { ElementType, BatchType, ArgumentShape, Construction };

inline const char* kind_name(ViolationKind k) {
    switch (k) {
    case ViolationKind::ElementType:
        return "element type";
    case ViolationKind::BatchType:
        return "batch element type";
    case ViolationKind::ArgumentShape:
        return "argument shape";
    case ViolationKind::Construction:
        return "construction";
    }
    return "<unknown>";
}

namespace detail {

// --- Structured error messages ---

inline std::string format_violation(ViolationKind kind,
                                    const std::string& expected,
                                    const std::string& actual,
                                    const std::string& context) {
    std::string msg = "constraint violation: ";
    msg += kind_name(kind);
    msg += "\n  expected: ";
    msg += expected;
    msg += "\n  actual:   ";
    msg += actual;
    msg += "\n  at:       ";
    msg += context;
    return msg;
}

inline std::string at_position(const std::string& operation,
                               std::size_t position) {
    return operation + " [element " + std::to_string(position) + "]";
}

} // namespace detail

// Base of every error raised when an element or argument is rejected.
// Nothing in the library catches these; a rejected call leaves the
// container exactly as it was.
class ConstraintViolation : public std::invalid_argument {
  public:
    ViolationKind kind() const { return kind_; }
    const std::string& operation() const { return operation_; }
    std::type_index actual() const { return actual_; }

  protected:
    ConstraintViolation(ViolationKind kind, std::string operation,
                        std::type_index actual, const std::string& message)
        : std::invalid_argument(message), kind_(kind),
          operation_(std::move(operation)), actual_(actual) {}

  private:
    ViolationKind kind_;
    std::string operation_;
    std::type_index actual_;
};

// A single element's type is not in the allowed set
class ElementTypeViolation : public ConstraintViolation {
  public:
    ElementTypeViolation(std::string operation, std::type_index actual,
                         TypeSet allowed)
        : ConstraintViolation(
              ViolationKind::ElementType, operation, actual,
              detail::format_violation(ViolationKind::ElementType,
                                       "one of " + to_string(allowed),
                                       type_name(actual), operation)),
          allowed_(std::move(allowed)) {}

    const TypeSet& allowed() const { return allowed_; }

  private:
    TypeSet allowed_;
};

// An element inside a multi-element argument is not in the allowed set.
// position() is the index inside the rejected batch.
class BatchTypeViolation : public ConstraintViolation {
  public:
    BatchTypeViolation(std::string operation, std::size_t position,
                       std::type_index actual, TypeSet allowed)
        : ConstraintViolation(
              ViolationKind::BatchType, operation, actual,
              detail::format_violation(
                  ViolationKind::BatchType, "one of " + to_string(allowed),
                  type_name(actual),
                  detail::at_position(operation, position))),
          position_(position), allowed_(std::move(allowed)) {}

    std::size_t position() const { return position_; }
    const TypeSet& allowed() const { return allowed_; }

  private:
    std::size_t position_;
    TypeSet allowed_;
};

// Argument has neither the element nor the batch shape the operation needs,
// e.g. a scalar passed to extend() or a non-integer repetition count.
class ArgumentShapeViolation : public ConstraintViolation {
  public:
    ArgumentShapeViolation(std::string operation, std::string expected,
                           std::type_index actual)
        : ConstraintViolation(
              ViolationKind::ArgumentShape, operation, actual,
              detail::format_violation(ViolationKind::ArgumentShape, expected,
                                       type_name(actual), operation)),
          expected_(std::move(expected)) {}

    const std::string& expected() const { return expected_; }

  private:
    std::string expected_;
};

// The initial batch does not satisfy the resolved set; no container exists
class ConstructionViolation : public ConstraintViolation {
  public:
    ConstructionViolation(std::size_t position, std::type_index actual,
                          TypeSet allowed)
        : ConstraintViolation(
              ViolationKind::Construction, "construct", actual,
              detail::format_violation(
                  ViolationKind::Construction,
                  "one of " + to_string(allowed), type_name(actual),
                  detail::at_position("construct", position))),
          position_(position), allowed_(std::move(allowed)) {}

    std::size_t position() const { return position_; }
    const TypeSet& allowed() const { return allowed_; }

  private:
    std::size_t position_;
    TypeSet allowed_;
};

// Typed access to an element that holds a different type
class ElementCastError : public std::bad_cast {
  public:
    ElementCastError(std::type_index requested, std::type_index held)
        : message_("element cast: requested " + type_name(requested) +
                   ", element holds " + type_name(held)) {}

    const char* what() const noexcept override { return message_.c_str(); }

  private:
    std::string message_;
};

} // namespace constrained

#endif // CONSTRAINED_ERRORS_HPP
