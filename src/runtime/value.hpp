// Numify Expression Compiler - Numeric Values Header
// Copyright (c) 2025 Chris M. Perez
// Licensed under the MIT License

#pragma once

#include <cstddef>
#include <initializer_list>
#include <memory>
#include <string>
#include <vector>

namespace numify {

// Immutable scalar or 1-D array of doubles.
// Copies share storage; array identity is the storage address.
class NumericValue {
public:
  NumericValue();
  NumericValue(double scalar);
  explicit NumericValue(std::vector<double> values);

  static NumericValue array(std::initializer_list<double> values);

  bool isScalar() const { return scalar_; }
  bool isArray() const { return !scalar_; }
  size_t size() const { return data_->size(); }

  // Scalar value; for arrays, requires exactly one element
  double scalar() const;

  const std::vector<double>& values() const { return *data_; }
  const double* data() const { return data_->data(); }
  double operator[](size_t index) const { return (*data_)[index]; }

  // Storage address, used as the identity marker of array values
  const void* identity() const { return data_.get(); }

  std::string toString() const;

private:
  std::shared_ptr<const std::vector<double>> data_;
  bool scalar_;
};

// Broadcast result of a set of inputs
struct Shape {
  bool scalar = true;
  size_t length = 1;
};

// Array primitives used by compiled kernels at call time
namespace array {

// Coerce a value to an array view (scalars become one-element arrays)
NumericValue asarray(const NumericValue& value);

// 1-D broadcasting: scalars and length-1 arrays stretch, other lengths must agree
Shape broadcastShape(const std::vector<const NumericValue*>& values);

// Zero-filled value of the given shape
NumericValue zerosLike(const Shape& shape);

}  // namespace array

}  // namespace numify
