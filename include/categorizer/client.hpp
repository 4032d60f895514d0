#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "categorizer/error.hpp"
#include "categorizer/http_client.hpp"
#include "categorizer/logging.hpp"
#include "categorizer/models.hpp"

namespace categorizer {

inline constexpr const char* kDefaultBaseUrl = "http://localhost:8080";

struct RequestOptions {
  std::map<std::string, std::string> headers;
  std::map<std::string, std::string> query_params;
  std::optional<std::chrono::milliseconds> timeout;
};

struct ClientOptions {
  /// Trailing '/' characters are stripped when the client is constructed.
  std::string base_url = kDefaultBaseUrl;
  std::chrono::milliseconds timeout{30000};
  std::map<std::string, std::string> default_headers;
  LogLevel log_level = LogLevel::Off;
  LoggerCallback logger;
};

class CategorizerClient;

/**
 * Operations on the `/models` tree of the categorizer service. Every call
 * issues exactly one HTTP request and throws ServiceError (or a subclass)
 * on transport failure or any non-2xx status, and UnexpectedError when the
 * body cannot be decoded. Provider and model names are inserted into the
 * path verbatim.
 */
class ModelsResource {
public:
  explicit ModelsResource(CategorizerClient& client) : client_(client) {}

  /// GET /models
  std::vector<std::string> list_providers(const RequestOptions& options = {}) const;

  /// GET /models/{provider}; NotFoundError when the service does not know the provider.
  Value get_provider_models(const std::string& provider, const RequestOptions& options = {}) const;

  /// GET /models/categorized, adding `experimental=true` only when requested.
  CategorizedCatalog get_categorized_models(bool include_experimental = false,
                                            const RequestOptions& options = {}) const;

  /// GET /models/{provider}/{model}/capabilities
  ModelCapabilities get_model_capabilities(const std::string& provider,
                                           const std::string& model,
                                           const RequestOptions& options = {}) const;

  /// POST /models/register
  RegistrationResult register_model(const std::string& provider,
                                    const std::string& model,
                                    const Value& metadata,
                                    const RequestOptions& options = {}) const;

  RegistrationResult register_model(const RegistrationRequest& request,
                                    const RequestOptions& options = {}) const;

  /// GET /models/structured
  Value get_structured_models(const RequestOptions& options = {}) const;

  /// POST /models/reload
  ReloadResult reload(const RequestOptions& options = {}) const;

private:
  CategorizerClient& client_;
};

class CategorizerClient {
public:
  explicit CategorizerClient(ClientOptions options = {},
                             std::unique_ptr<HttpClient> http_client = nullptr);

  CategorizerClient(const CategorizerClient&) = delete;
  CategorizerClient& operator=(const CategorizerClient&) = delete;

  const ClientOptions& options() const { return options_; }

  ModelsResource& models() { return models_; }
  const ModelsResource& models() const { return models_; }

  /// GET /health
  HealthStatus health(const RequestOptions& options = {}) const;

private:
  friend class ModelsResource;

  HttpResponse perform_request(const std::string& method,
                               const std::string& path,
                               const std::string& body,
                               const RequestOptions& options) const;

  void log(LogLevel level, const std::string& message, const nlohmann::json& details = {}) const;

  ClientOptions options_;
  std::unique_ptr<HttpClient> http_client_;
  ModelsResource models_;
};

}  // namespace categorizer
