// uast_bridge/bridge/errors.hpp - Exceptions raised by boundary calls
#pragma once

#include <stdexcept>
#include <string>

namespace uast_bridge
{

/// Base of all bridge failures.
class BridgeError : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

/// The engine rejected a query or failed while evaluating it.
class QueryError : public BridgeError
{
public:
  using BridgeError::BridgeError;
};

/// The engine could not construct a traversal cursor.
class IteratorError : public BridgeError
{
public:
  using BridgeError::BridgeError;
};

/// Operation on an iterator that already reported end-of-traversal or was disposed.
class StateError : public BridgeError
{
public:
  using BridgeError::BridgeError;
};

}  // namespace uast_bridge
