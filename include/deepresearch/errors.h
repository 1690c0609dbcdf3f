#ifndef DEEPRESEARCH_ERRORS_H
#define DEEPRESEARCH_ERRORS_H

#include <stdexcept>
#include <string>

#include "deepresearch/types.h"

namespace deepresearch {

/**
 * Base class for request-level validation failures.
 *
 * Every failure is local, synchronous and non-retryable. The server loop
 * turns it into a JSON-RPC error response carrying code() and what(); it
 * never terminates the session.
 */
class ResearchError : public std::runtime_error {
 public:
  ResearchError(int code, const std::string& message)
      : std::runtime_error(message), code_(code) {}

  int code() const { return code_; }

  Error toError() const { return Error(code_, what()); }

 private:
  int code_;
};

// Resource URI not in the registry
class UnknownResourceError : public ResearchError {
 public:
  explicit UnknownResourceError(const std::string& uri)
      : ResearchError(jsonrpc::INVALID_PARAMS, "Unknown resource: " + uri),
        uri_(uri) {}

  const std::string& uri() const { return uri_; }

 private:
  std::string uri_;
};

// Prompt id not in the registry
class UnknownPromptError : public ResearchError {
 public:
  explicit UnknownPromptError(const std::string& id)
      : ResearchError(jsonrpc::INVALID_PARAMS, "Unknown prompt: " + id),
        id_(id) {}

  const std::string& promptId() const { return id_; }

 private:
  std::string id_;
};

// A required prompt argument was not supplied
class MissingArgumentError : public ResearchError {
 public:
  explicit MissingArgumentError(const std::string& argument)
      : ResearchError(jsonrpc::INVALID_PARAMS,
                      "Missing required argument: " + argument),
        argument_(argument) {}

  const std::string& argument() const { return argument_; }

 private:
  std::string argument_;
};

// Name outside the fixed research field set
class InvalidFieldError : public ResearchError {
 public:
  explicit InvalidFieldError(const std::string& field)
      : ResearchError(jsonrpc::INTERNAL_ERROR,
                      "Invalid research field: " + field),
        field_(field) {}

  const std::string& field() const { return field_; }

 private:
  std::string field_;
};

// Request params missing or of the wrong shape
class InvalidParamsError : public ResearchError {
 public:
  explicit InvalidParamsError(const std::string& detail)
      : ResearchError(jsonrpc::INVALID_PARAMS, detail) {}
};

}  // namespace deepresearch

#endif  // DEEPRESEARCH_ERRORS_H
