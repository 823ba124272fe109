// Numify Expression Compiler - Compiled Artifact
// Copyright (c) 2025 Chris M. Perez
// Licensed under the MIT License

#include "compile/artifact.hpp"

#include "error/errors.hpp"

#include <exception>
#include <limits>

namespace numify {

namespace {

// Per-call state handed to the kernel as its opaque host pointer
struct HostFrame {
  const std::vector<NumericFnPtr>* functions;
  std::exception_ptr error;
};

// Exceptions must not unwind through JIT frames: the first one is parked in
// the frame and rethrown once the kernel returns
double callHost(void* host, int64_t index, const double* argv, int64_t argc) {
  auto* frame = static_cast<HostFrame*>(host);
  if (frame->error) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  try {
    const NumericFn& fn = *(*frame->functions)[static_cast<size_t>(index)];
    return fn(std::vector<double>(argv, argv + argc));
  } catch (...) {
    frame->error = std::current_exception();
    return std::numeric_limits<double>::quiet_NaN();
  }
}

}  // namespace

CompiledArtifact::CompiledArtifact(Expr expression,
                                   CallSignature signature,
                                   BindingSet bindings,
                                   Kernel kernel,
                                   std::string source,
                                   std::string ir,
                                   bool vectorized)
    : expression_(std::move(expression))
    , signature_(std::move(signature))
    , bindings_(std::move(bindings))
    , kernel_(std::move(kernel))
    , source_(std::move(source))
    , ir_(std::move(ir))
    , vectorized_(vectorized) {
  if (!kernel_.jit) {
    throw NumifyError(ErrorKind::CompilationFailed, "Artifact requires a compiled kernel");
  }
  for (const auto& name : kernel_.functions) {
    auto it = bindings_.functions.find(name);
    if (it == bindings_.functions.end()) {
      throw NumifyError(ErrorKind::UnboundFunction, "Kernel calls an unbound function")
          .addName(name);
    }
    functionTable_.push_back(it->second.impl);
  }
}

CompiledArtifact::CompiledArtifact(HostFn fn, CallSignature signature, std::string description)
    : signature_(std::move(signature))
    , host_(std::move(fn))
    , source_(std::move(description))
    , vectorized_(true) {}

std::shared_ptr<const CompiledArtifact> CompiledArtifact::fromCallable(HostFn fn,
                                                                       CallSignature signature,
                                                                       std::string description) {
  if (!fn) {
    throw NumifyError(ErrorKind::InvalidBinding, "Wrapped callable is empty");
  }
  return std::shared_ptr<const CompiledArtifact>(
      new CompiledArtifact(std::move(fn), std::move(signature), std::move(description)));
}

NumericValue CompiledArtifact::invoke(const std::vector<NumericValue>& args) const {
  if (args.size() != signature_.size()) {
    throw NumifyError(ErrorKind::CallArityMismatch, "Wrong number of kernel arguments")
        .setExplanation("expected " + std::to_string(signature_.size()) + ", got " +
                        std::to_string(args.size()));
  }
  if (host_) {
    return host_(args);
  }
  return runKernel(args);
}

NumericValue CompiledArtifact::runKernel(const std::vector<NumericValue>& args) const {
  std::vector<NumericValue> inputs;
  inputs.reserve(args.size() + kernel_.constants.size());
  for (const auto& arg : args) {
    inputs.push_back(vectorized_ ? array::asarray(arg) : arg);
  }
  for (const auto& symbol : kernel_.constants) {
    inputs.push_back(bindings_.constants.at(symbol));
  }

  // asarray keeps scalar-ness visible through the original arguments
  std::vector<const NumericValue*> shapeInputs;
  for (const auto& arg : args) {
    if (!vectorized_ && arg.isArray()) {
      throw NumifyError(ErrorKind::ShapeMismatch, "Array argument passed to a scalar function")
          .setExplanation("compile with vectorization enabled to evaluate arrays");
    }
    shapeInputs.push_back(&arg);
  }
  for (size_t i = args.size(); i < inputs.size(); ++i) {
    shapeInputs.push_back(&inputs[i]);
  }
  Shape shape = array::broadcastShape(shapeInputs);

  std::vector<const double*> pointers;
  std::vector<int64_t> strides;
  pointers.reserve(inputs.size());
  strides.reserve(inputs.size());
  for (const auto& input : inputs) {
    pointers.push_back(input.data());
    strides.push_back(input.size() == 1 ? 0 : 1);
  }

  NumericValue zeros = array::zerosLike(shape);
  std::vector<double> out(zeros.values());

  HostFrame frame{&functionTable_, nullptr};
  kernel_.jit->entry()(static_cast<int64_t>(out.size()),
                       pointers.data(),
                       strides.data(),
                       out.data(),
                       &frame,
                       &callHost);
  if (frame.error) {
    std::rethrow_exception(frame.error);
  }

  if (shape.scalar) {
    return NumericValue(out.front());
  }
  return NumericValue(std::move(out));
}

}  // namespace numify
