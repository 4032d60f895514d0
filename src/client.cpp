#include "categorizer/client.hpp"

#include "categorizer/error.hpp"
#include "categorizer/http_client.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <set>
#include <utility>

#include "categorizer/logging.hpp"
#include "categorizer/utils/env.hpp"
#include "categorizer/utils/qs.hpp"
#include "categorizer/utils/values.hpp"

namespace categorizer {
namespace {

using json = nlohmann::json;

bool is_success_status(long status) {
  return status >= 200 && status < 300;
}

std::string build_url(const std::string& base_url, const std::string& path) {
  if (path.empty()) {
    return base_url;
  }
  if (utils::is_absolute_url(path)) {
    return path;
  }
  std::string url = base_url;
  if (path.front() != '/') {
    url.push_back('/');
  }
  url += path;
  return url;
}

std::string append_query_string(const std::string& url, const std::string& query_string) {
  if (query_string.empty()) {
    return url;
  }
  return url + (url.find('?') == std::string::npos ? "?" : "&") + query_string;
}

std::string trim_copy(const std::string& value) {
  auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
  auto begin = std::find_if_not(value.begin(), value.end(), is_space);
  auto end = std::find_if_not(value.rbegin(), value.rend(), is_space).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

// The service answers errors either with a JSON object or with a plain-text
// body (Go's http.Error), so both are accepted.
std::string extract_error_message(const std::optional<Value>& payload, const std::string& raw_body) {
  if (payload && payload->is_object()) {
    for (const char* key : {"error", "message"}) {
      auto it = payload->find(key);
      if (it == payload->end()) {
        continue;
      }
      if (it->is_string()) {
        return it->get<std::string>();
      }
      if (it->is_object() && it->contains("message") && it->at("message").is_string()) {
        return it->at("message").get<std::string>();
      }
    }
    return {};
  }
  return trim_copy(raw_body);
}

json extract_error_payload(const std::optional<Value>& payload, const std::string& raw_body) {
  if (payload) {
    return json::parse(payload->dump());
  }
  json body = json::object();
  if (!raw_body.empty()) {
    body["message"] = trim_copy(raw_body);
  }
  return body;
}

std::map<std::string, std::string> sanitize_headers(const std::map<std::string, std::string>& headers) {
  static const std::set<std::string> kSensitive = {"authorization", "cookie", "set-cookie"};
  std::map<std::string, std::string> sanitized;
  for (const auto& [key, value] : headers) {
    std::string lowered; lowered.reserve(key.size());
    std::transform(key.begin(), key.end(), std::back_inserter(lowered), [](unsigned char c) {
      return static_cast<char>(std::tolower(c));
    });
    if (kSensitive.count(lowered)) {
      sanitized[key] = "***";
    } else {
      sanitized[key] = value;
    }
  }
  return sanitized;
}

json build_request_log_details(const HttpRequest& request) {
  json details;
  details["method"] = request.method;
  details["url"] = request.url;
  details["headers"] = sanitize_headers(request.headers);
  return details;
}

json build_response_log_details(const HttpRequest& request,
                                const HttpResponse& response,
                                std::chrono::steady_clock::duration duration) {
  json details = build_request_log_details(request);
  details["status"] = response.status_code;
  details["duration_ms"] = std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
  details["response_headers"] = sanitize_headers(response.headers);
  return details;
}

[[noreturn]] void throw_api_error(long status,
                                  const std::string& fallback_message,
                                  const json& error_payload,
                                  const std::map<std::string, std::string>& headers) {
  const std::string message = fallback_message.empty() ? ("HTTP " + std::to_string(status) + " error") : fallback_message;

  if (status == 404) {
    throw NotFoundError(message, status, error_payload, headers);
  }
  throw APIError(message, status, error_payload, headers);
}

Value parse_body(const HttpResponse& response, const std::string& what) {
  try {
    return Value::parse(response.body);
  } catch (const json::exception& ex) {
    throw UnexpectedError("Failed to parse " + what + ": " + ex.what());
  }
}

// Runs a typed decoder over `payload`, reporting nlohmann type errors as UnexpectedError.
template <typename Decoder>
auto decode(const Value& payload, const std::string& what, Decoder decoder) -> decltype(decoder(payload)) {
  try {
    return decoder(payload);
  } catch (const json::exception& ex) {
    throw UnexpectedError("Failed to parse " + what + ": " + ex.what());
  }
}

std::string models_path(const std::string& provider) {
  return std::string("/models/") + provider;
}

}  // namespace

CategorizerClient::CategorizerClient(ClientOptions options,
                                     std::unique_ptr<HttpClient> http_client)
    : options_(std::move(options)),
      http_client_(http_client ? std::move(http_client) : make_default_http_client()),
      models_(*this) {
  if (options_.base_url == kDefaultBaseUrl) {
    if (auto env_base = utils::read_env("CATEGORIZER_BASE_URL")) {
      if (!env_base->empty()) {
        options_.base_url = *env_base;
      }
    }
  }

  if (options_.log_level == LogLevel::Off) {
    if (auto env_log = utils::read_env("CATEGORIZER_LOG")) {
      if (!env_log->empty()) {
        options_.log_level = parse_log_level(*env_log, options_.log_level);
      }
    }
  }

  options_.base_url = utils::strip_trailing_slashes(std::move(options_.base_url));
  if (options_.base_url.empty()) {
    throw InvalidArgumentError("ClientOptions.base_url must be a non-empty string");
  }
  if (options_.timeout.count() < 0) {
    throw InvalidArgumentError("ClientOptions.timeout must be a positive integer");
  }
}

void CategorizerClient::log(LogLevel level, const std::string& message, const nlohmann::json& details) const {
  if (!options_.logger) {
    return;
  }
  if (static_cast<int>(level) > static_cast<int>(options_.log_level)) {
    return;
  }
  options_.logger(level, message, details);
}

HttpResponse CategorizerClient::perform_request(const std::string& method,
                                                const std::string& path,
                                                const std::string& body,
                                                const RequestOptions& options) const {
  if (options.timeout && options.timeout->count() < 0) {
    throw InvalidArgumentError("RequestOptions.timeout must be a positive integer");
  }

  HttpRequest http_request;
  http_request.method = method;
  http_request.url = append_query_string(build_url(options_.base_url, path),
                                         utils::qs::stringify(options.query_params));
  http_request.body = body;
  http_request.timeout = options.timeout.value_or(options_.timeout);

  std::map<std::string, std::string> headers;
  headers["Accept"] = "application/json";
  for (const auto& [key, value] : options_.default_headers) {
    headers[key] = value;
  }
  if (!body.empty()) {
    headers["Content-Type"] = "application/json";
  }
  for (const auto& [key, value] : options.headers) {
    headers[key] = value;
  }
  http_request.headers = std::move(headers);

  log(LogLevel::Debug, "sending request", build_request_log_details(http_request));
  auto start_time = std::chrono::steady_clock::now();

  HttpResponse response;
  try {
    response = http_client_->request(http_request);
  } catch (const std::exception& error) {
    auto details = build_request_log_details(http_request);
    details["error"] = error.what();
    log(LogLevel::Error, "request failed", details);
    throw APIConnectionError(error.what());
  }

  auto duration = std::chrono::steady_clock::now() - start_time;
  if (is_success_status(response.status_code)) {
    log(LogLevel::Info, "request succeeded", build_response_log_details(http_request, response, duration));
    return response;
  }

  auto payload = utils::safe_json(response.body);
  log(LogLevel::Error, "request failed", build_response_log_details(http_request, response, duration));
  throw_api_error(response.status_code,
                  extract_error_message(payload, response.body),
                  extract_error_payload(payload, response.body),
                  response.headers);
}

HealthStatus CategorizerClient::health(const RequestOptions& options) const {
  auto response = perform_request("GET", "/health", "", options);
  return decode(parse_body(response, "health status"), "health status", parse_health_status);
}

std::vector<std::string> ModelsResource::list_providers(const RequestOptions& options) const {
  auto response = client_.perform_request("GET", "/models", "", options);
  return decode(parse_body(response, "provider list"), "provider list", parse_provider_list);
}

Value ModelsResource::get_provider_models(const std::string& provider, const RequestOptions& options) const {
  utils::require_non_empty("provider", provider);
  auto response = client_.perform_request("GET", models_path(provider), "", options);
  return parse_body(response, "provider models");
}

CategorizedCatalog ModelsResource::get_categorized_models(bool include_experimental,
                                                          const RequestOptions& options) const {
  RequestOptions request_options = options;
  if (include_experimental) {
    request_options.query_params["experimental"] = "true";
  } else {
    request_options.query_params.erase("experimental");
  }
  auto response = client_.perform_request("GET", "/models/categorized", "", request_options);
  return decode(parse_body(response, "categorized models"), "categorized models", parse_categorized_catalog);
}

ModelCapabilities ModelsResource::get_model_capabilities(const std::string& provider,
                                                         const std::string& model,
                                                         const RequestOptions& options) const {
  utils::require_non_empty("provider", provider);
  utils::require_non_empty("model", model);
  auto path = models_path(provider) + "/" + model + "/capabilities";
  auto response = client_.perform_request("GET", path, "", options);
  return parse_body(response, "model capabilities");
}

RegistrationResult ModelsResource::register_model(const std::string& provider,
                                                  const std::string& model,
                                                  const Value& metadata,
                                                  const RequestOptions& options) const {
  RegistrationRequest request;
  request.provider = provider;
  request.model = model;
  request.metadata = metadata;
  return register_model(request, options);
}

RegistrationResult ModelsResource::register_model(const RegistrationRequest& request,
                                                  const RequestOptions& options) const {
  utils::require_non_empty("provider", request.provider);
  utils::require_non_empty("model", request.model);
  auto body = registration_request_to_json(request).dump();
  auto response = client_.perform_request("POST", "/models/register", body, options);
  return decode(parse_body(response, "registration response"), "registration response", parse_registration_result);
}

Value ModelsResource::get_structured_models(const RequestOptions& options) const {
  auto response = client_.perform_request("GET", "/models/structured", "", options);
  return parse_body(response, "structured models");
}

ReloadResult ModelsResource::reload(const RequestOptions& options) const {
  auto response = client_.perform_request("POST", "/models/reload", "", options);
  return decode(parse_body(response, "reload response"), "reload response", parse_reload_result);
}

}  // namespace categorizer
