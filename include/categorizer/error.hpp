#pragma once

#include <map>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace categorizer {

class CategorizerError : public std::runtime_error {
public:
  explicit CategorizerError(const std::string& message)
      : std::runtime_error(message) {}
};

/// Raised for any non-2xx response or transport failure.
class ServiceError : public CategorizerError {
public:
  explicit ServiceError(const std::string& message)
      : CategorizerError(message) {}
};

class APIError : public ServiceError {
public:
  APIError(std::string message,
           long status_code,
           nlohmann::json error_body,
           std::map<std::string, std::string> headers)
      : ServiceError(std::move(message)),
        status_code_(status_code),
        error_body_(std::move(error_body)),
        headers_(std::move(headers)) {}

  long status_code() const { return status_code_; }
  const nlohmann::json& error_body() const { return error_body_; }
  const std::map<std::string, std::string>& headers() const { return headers_; }

private:
  long status_code_;
  nlohmann::json error_body_;
  std::map<std::string, std::string> headers_;
};

class NotFoundError : public APIError {
public:
  using APIError::APIError;
};

class APIConnectionError : public ServiceError {
public:
  explicit APIConnectionError(const std::string& message)
      : ServiceError(message) {}
};

/// Malformed or unexpectedly shaped response payloads.
class UnexpectedError : public CategorizerError {
public:
  explicit UnexpectedError(const std::string& message)
      : CategorizerError(message) {}
};

class InvalidArgumentError : public CategorizerError {
public:
  explicit InvalidArgumentError(const std::string& message)
      : CategorizerError(message) {}
};

}  // namespace categorizer
