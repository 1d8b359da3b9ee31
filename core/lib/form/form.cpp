// formlets/form/form.cpp - Form implementation
//
#include "formlets/form/form.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cctype>

#include "formlets/basic/errors.hpp"

namespace formlets
{

bool is_valid_form_id(const std::string & id)
{
  if (id.size() < 2 || std::isalpha(static_cast<unsigned char>(id.front())) == 0) {
    return false;
  }
  return std::all_of(id.begin() + 1, id.end(), [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
  });
}

Form::Form(
  std::string id, std::string action, html::Attributes attributes, BuilderPtr builder,
  CollectorPtr collector)
: id_(std::move(id)),
  attributes_(std::move(attributes)),
  builder_(std::move(builder)),
  collector_(std::move(collector))
{
  if (!is_valid_form_id(id_)) {
    throw FormStateError(
      fmt::format("'{}' can not be used as form id, only use letters, digits and '_'", id_));
  }
  if (!builder_ || !collector_) {
    throw FormStateError(fmt::format("form '{}' needs a builder and a collector", id_));
  }

  attributes_.erase(
    std::remove_if(
      attributes_.begin(), attributes_.end(),
      [](const html::Attribute & a) { return a.key == "method" || a.key == "action"; }),
    attributes_.end());
  attributes_.push_back({"method", "post"});
  attributes_.push_back({"action", std::move(action)});
}

void Form::init(InputMap input)
{
  input_ = std::move(input);
  result_.reset();
}

bool Form::was_submitted()
{
  if (!input_) {
    return false;
  }
  if (result_) {
    return true;
  }

  try {
    result_ = collector_->collect(*input_);
  } catch (const MissingInputError &) {
    return false;
  }
  return true;
}

bool Form::was_successful() { return was_submitted() && !result_->is_error(); }

RenderDict Form::render_dict()
{
  if (!was_submitted()) {
    return RenderDict::empty();
  }
  return RenderDict(*input_, *result_);
}

std::string Form::html()
{
  if (!was_submitted()) {
    return wrap(builder_->build()).render();
  }
  return wrap(builder_->build_with(render_dict())).render();
}

const std::any & Form::result()
{
  if (!was_successful()) {
    throw FormStateError(fmt::format("form '{}' was not submitted successfully", id_));
  }
  if (result_->is_applicable()) {
    throw FormStateError(fmt::format("result of form '{}' is no value but a function", id_));
  }
  return result_->get();
}

const ValuePtr & Form::result_value()
{
  (void)was_submitted();
  return result_;
}

const std::string & Form::error()
{
  if (!was_submitted()) {
    throw FormStateError(fmt::format("form '{}' was not submitted", id_));
  }
  if (!result_->is_error()) {
    throw FormStateError(fmt::format("form '{}' was submitted successfully", id_));
  }
  return result_->error();
}

html::Fragment Form::wrap(html::Fragment content) const
{
  return html::Fragment::tag("form", attributes_, std::move(content));
}

}  // namespace formlets
