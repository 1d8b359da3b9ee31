// formlets/basic/errors.hpp - Contract violation exceptions
//
// Validation failures never appear here: they are ErrorValues carried through
// the value tree. The exceptions below signal a defect in how a form was put
// together and are thrown immediately.
//
#pragma once

#include <stdexcept>
#include <string>

namespace formlets
{

/// Base of every usage error raised by the algebra, builders and forms.
class ContractViolation : public std::logic_error
{
public:
  explicit ContractViolation(const std::string & what) : std::logic_error(what) {}
};

/// get() on an error value.
class GetOnErrorError : public ContractViolation
{
public:
  explicit GetOnErrorError(const std::string & reason)
  : ContractViolation("can't get value from error value: " + reason)
  {
  }
};

/// apply() on a plain value, or with a null argument.
class NotApplicableError : public ContractViolation
{
public:
  explicit NotApplicableError(const std::string & what) : ContractViolation(what) {}
};

/// get() or result() on a function that still needs arguments.
class NotAValueError : public ContractViolation
{
public:
  explicit NotAValueError(const std::string & what) : ContractViolation(what) {}
};

/// error() on something that is not an error.
class NotAnErrorError : public ContractViolation
{
public:
  explicit NotAnErrorError(const std::string & what) : ContractViolation(what) {}
};

/// Payload held by a value does not have the requested type.
class PayloadTypeError : public ContractViolation
{
public:
  explicit PayloadTypeError(const std::string & what) : ContractViolation(what) {}
};

/// An attributes or content producer of a tag builder did not settle after
/// being applied to the render dict.
class BuilderContractViolation : public ContractViolation
{
public:
  explicit BuilderContractViolation(const std::string & what) : ContractViolation(what) {}
};

/// A delegate returned something that is not a renderable fragment.
class InvalidFragmentError : public ContractViolation
{
public:
  explicit InvalidFragmentError(const std::string & what) : ContractViolation(what) {}
};

/// Form used out of order (result of an unsubmitted form, bad id, ...).
class FormStateError : public ContractViolation
{
public:
  explicit FormStateError(const std::string & what) : ContractViolation(what) {}
};

/// The submitted input lacks a field the collector needs. Not a contract
/// violation: it means the form was not submitted.
class MissingInputError : public std::runtime_error
{
public:
  explicit MissingInputError(const std::string & name)
  : std::runtime_error("missing input for field '" + name + "'"), name_(name)
  {
  }

  [[nodiscard]] const std::string & name() const noexcept { return name_; }

private:
  std::string name_;
};

}  // namespace formlets
