#pragma once

#include <stdexcept>
#include <string>

namespace oryx {

/// Base of every failure raised by the DSL and its compilers.
class Error : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

/// The query is structurally invalid (not a subset, wrong operand kind, collision).
class GrammarError : public Error {
   public:
    using Error::Error;
};

/// A native value could not be converted to the requested kind.
class CastError : public Error {
   public:
    using Error::Error;
};

/// No backend symbol is mapped for a source or feature.
class UnprovisionedError : public Error {
   public:
    using Error::Error;
};

/// The backend recognizes the node but cannot encode it.
class UnsupportedError : public Error {
   public:
    using Error::Error;
};

/// Parser or evaluator state inconsistency (leaked symbols, misaligned series).
class StateError : public Error {
   public:
    using Error::Error;
};

/// Error value returned by the std::expected based compile entry points.
struct CompileError {
    std::string message;
};

}  // namespace oryx
