// Numify Expression Compiler - Diagnostics
// Copyright (c) 2025 Chris M. Perez
// Licensed under the MIT License

#pragma once

#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace numify {

// Diagnostic severity levels
enum class DiagnosticLevel {
  Debug,
  Note,
  Warning,
  Error,
  Fatal
};

// Single diagnostic message
struct Diagnostic {
  DiagnosticLevel level;
  std::string message;

  Diagnostic(DiagnosticLevel lvl, const std::string& msg)
      : level(lvl)
      , message(msg) {}
};

// Diagnostic engine shared by the compiler pipeline.
// Messages below the reporting level are dropped; Debug messages are never retained.
class DiagnosticEngine {
private:
  std::vector<Diagnostic> diagnostics_;
  int errorCount_ = 0;
  int warningCount_ = 0;
  DiagnosticLevel reportLevel_ = DiagnosticLevel::Warning;
  std::ostream* out_ = nullptr;  // null: stdout/stderr by severity
  mutable std::mutex mutex_;

public:
  DiagnosticEngine() = default;

  DiagnosticEngine(const DiagnosticEngine&) = delete;
  DiagnosticEngine& operator=(const DiagnosticEngine&) = delete;

  void emitDebug(const std::string& msg) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (enabled(DiagnosticLevel::Debug)) {
      report(Diagnostic(DiagnosticLevel::Debug, msg));
    }
  }

  void emitNote(const std::string& msg) { emit(DiagnosticLevel::Note, msg); }

  void emitWarning(const std::string& msg) {
    std::lock_guard<std::mutex> lock(mutex_);
    warningCount_++;
    record(DiagnosticLevel::Warning, msg);
  }

  void emitError(const std::string& msg) {
    std::lock_guard<std::mutex> lock(mutex_);
    errorCount_++;
    record(DiagnosticLevel::Error, msg);
  }

  void emitFatal(const std::string& msg) {
    std::lock_guard<std::mutex> lock(mutex_);
    errorCount_++;
    record(DiagnosticLevel::Fatal, msg);
  }

  // Query state
  bool isEnabled(DiagnosticLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return enabled(level);
  }
  bool hasErrors() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return errorCount_ > 0;
  }
  bool hasWarnings() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return warningCount_ > 0;
  }
  int getErrorCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return errorCount_;
  }
  int getWarningCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return warningCount_;
  }

  // Configuration
  void setReportLevel(DiagnosticLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    reportLevel_ = level;
  }
  void setStream(std::ostream* out) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ = out;
  }

  // Retained diagnostics (Note and above)
  std::vector<Diagnostic> getDiagnostics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return diagnostics_;
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    diagnostics_.clear();
    errorCount_ = 0;
    warningCount_ = 0;
  }

private:
  bool enabled(DiagnosticLevel level) const { return level >= reportLevel_; }

  void emit(DiagnosticLevel level, const std::string& msg) {
    std::lock_guard<std::mutex> lock(mutex_);
    record(level, msg);
  }

  void record(DiagnosticLevel level, const std::string& msg) {
    diagnostics_.emplace_back(level, msg);
    if (enabled(level)) {
      report(diagnostics_.back());
    }
  }

  void report(const Diagnostic& diag) {
    std::ostream& out = out_ ? *out_
                             : ((diag.level == DiagnosticLevel::Error ||
                                 diag.level == DiagnosticLevel::Fatal)
                                    ? std::cerr
                                    : std::cout);

    switch (diag.level) {
    case DiagnosticLevel::Debug:
      out << "debug: ";
      break;
    case DiagnosticLevel::Note:
      out << "note: ";
      break;
    case DiagnosticLevel::Warning:
      out << "warning: ";
      break;
    case DiagnosticLevel::Error:
      out << "error: ";
      break;
    case DiagnosticLevel::Fatal:
      out << "fatal error: ";
      break;
    }

    out << diag.message << std::endl;
  }
};

}  // namespace numify
