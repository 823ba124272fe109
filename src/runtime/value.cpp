// Numify Expression Compiler - Numeric Values
// Copyright (c) 2025 Chris M. Perez
// Licensed under the MIT License

#include "runtime/value.hpp"

#include "error/errors.hpp"

#include <sstream>

namespace numify {

NumericValue::NumericValue()
    : data_(std::make_shared<const std::vector<double>>(1, 0.0))
    , scalar_(true) {}

NumericValue::NumericValue(double scalar)
    : data_(std::make_shared<const std::vector<double>>(1, scalar))
    , scalar_(true) {}

NumericValue::NumericValue(std::vector<double> values)
    : data_(std::make_shared<const std::vector<double>>(std::move(values)))
    , scalar_(false) {}

NumericValue NumericValue::array(std::initializer_list<double> values) {
  return NumericValue(std::vector<double>(values));
}

double NumericValue::scalar() const {
  if (data_->size() != 1) {
    throw NumifyError(ErrorKind::ShapeMismatch, "Expected a scalar value")
        .setExplanation("got an array of length " + std::to_string(data_->size()));
  }
  return data_->front();
}

std::string NumericValue::toString() const {
  std::ostringstream oss;
  if (scalar_) {
    oss << data_->front();
    return oss.str();
  }
  oss << "[";
  for (size_t i = 0; i < data_->size(); ++i) {
    if (i > 0)
      oss << ", ";
    oss << (*data_)[i];
  }
  oss << "]";
  return oss.str();
}

namespace array {

NumericValue asarray(const NumericValue& value) {
  if (value.isArray()) {
    return value;
  }
  return NumericValue(std::vector<double>{value.scalar()});
}

Shape broadcastShape(const std::vector<const NumericValue*>& values) {
  Shape shape;
  bool sawStretchable = false;  // a length-1 array was seen

  for (const NumericValue* value : values) {
    if (value->isScalar()) {
      continue;
    }
    if (value->size() == 1) {
      if (shape.scalar) {
        shape.length = 1;
      }
      shape.scalar = false;
      sawStretchable = true;
      continue;
    }
    if (shape.scalar || (sawStretchable && shape.length == 1)) {
      shape.scalar = false;
      shape.length = value->size();
      continue;
    }
    if (value->size() != shape.length) {
      throw NumifyError(ErrorKind::ShapeMismatch, "Operands could not be broadcast together")
          .setExplanation("array lengths " + std::to_string(shape.length) + " and " +
                          std::to_string(value->size()) + " differ");
    }
  }

  return shape;
}

NumericValue zerosLike(const Shape& shape) {
  if (shape.scalar) {
    return NumericValue(0.0);
  }
  return NumericValue(std::vector<double>(shape.length, 0.0));
}

}  // namespace array

}  // namespace numify
