#include <gtest/gtest.h>

#include "categorizer/client.hpp"
#include "categorizer/error.hpp"
#include "categorizer/logging.hpp"

#include "support/env_guard.hpp"
#include "support/mock_http_client.hpp"

#include <tuple>
#include <vector>

using categorizer::APIConnectionError;
using categorizer::APIError;
using categorizer::CategorizerClient;
using categorizer::ClientOptions;
using categorizer::HttpResponse;
using categorizer::InvalidArgumentError;
using categorizer::LogLevel;
using categorizer::NotFoundError;
using categorizer::RequestOptions;
using categorizer::ServiceError;
namespace mock = categorizer::testing;

TEST(CategorizerClientTest, StripsTrailingSlashesFromBaseUrl) {
  mock::ClientEnvGuard env;
  auto http_mock = std::make_unique<mock::MockHttpClient>();
  auto* mock_ptr = http_mock.get();
  mock_ptr->enqueue_json(200, R"(["OpenAI"])");

  ClientOptions options;
  options.base_url = "http://catalog.internal:9000///";
  CategorizerClient client(std::move(options), std::move(http_mock));

  EXPECT_EQ(client.options().base_url, "http://catalog.internal:9000");
  client.models().list_providers();

  ASSERT_TRUE(mock_ptr->last_request().has_value());
  EXPECT_EQ(mock_ptr->last_request()->url, "http://catalog.internal:9000/models");
}

TEST(CategorizerClientTest, DefaultsToLocalhost) {
  mock::ClientEnvGuard env;
  CategorizerClient client(ClientOptions{}, std::make_unique<mock::MockHttpClient>());
  EXPECT_EQ(client.options().base_url, "http://localhost:8080");
}

TEST(CategorizerClientTest, EnvironmentOverridesDefaultBaseUrl) {
  mock::ClientEnvGuard env;
  mock::EnvVarGuard base_url("CATEGORIZER_BASE_URL", std::string(" http://from-env:7000/ "));

  CategorizerClient client(ClientOptions{}, std::make_unique<mock::MockHttpClient>());
  EXPECT_EQ(client.options().base_url, "http://from-env:7000");
}

TEST(CategorizerClientTest, ExplicitBaseUrlWinsOverEnvironment) {
  mock::ClientEnvGuard env;
  mock::EnvVarGuard base_url("CATEGORIZER_BASE_URL", std::string("http://from-env:7000"));

  ClientOptions options;
  options.base_url = "http://explicit:8000";
  CategorizerClient client(std::move(options), std::make_unique<mock::MockHttpClient>());
  EXPECT_EQ(client.options().base_url, "http://explicit:8000");
}

TEST(CategorizerClientTest, EnvironmentSetsLogLevel) {
  mock::ClientEnvGuard env;
  mock::EnvVarGuard log("CATEGORIZER_LOG", std::string("debug"));

  CategorizerClient client(ClientOptions{}, std::make_unique<mock::MockHttpClient>());
  EXPECT_EQ(client.options().log_level, LogLevel::Debug);
}

TEST(CategorizerClientTest, RejectsEmptyBaseUrl) {
  mock::ClientEnvGuard env;
  ClientOptions options;
  options.base_url = "/";
  EXPECT_THROW(CategorizerClient(std::move(options), std::make_unique<mock::MockHttpClient>()),
               InvalidArgumentError);
}

TEST(CategorizerClientTest, SendsDefaultAndPerRequestHeaders) {
  mock::ClientEnvGuard env;
  auto http_mock = std::make_unique<mock::MockHttpClient>();
  auto* mock_ptr = http_mock.get();
  mock_ptr->enqueue_json(200, "[]");

  ClientOptions options;
  options.default_headers["X-Team"] = "ml-platform";
  options.timeout = std::chrono::milliseconds(1500);
  CategorizerClient client(std::move(options), std::move(http_mock));

  RequestOptions request_options;
  request_options.headers["X-Trace"] = "abc";
  client.models().list_providers(request_options);

  const auto& captured = mock_ptr->last_request();
  ASSERT_TRUE(captured.has_value());
  EXPECT_EQ(captured->method, "GET");
  EXPECT_EQ(captured->headers.at("Accept"), "application/json");
  EXPECT_EQ(captured->headers.at("X-Team"), "ml-platform");
  EXPECT_EQ(captured->headers.at("X-Trace"), "abc");
  EXPECT_EQ(captured->headers.count("Content-Type"), 0u);
  EXPECT_EQ(captured->timeout, std::chrono::milliseconds(1500));
  EXPECT_TRUE(captured->body.empty());
}

TEST(CategorizerClientTest, RequestTimeoutOverridesClientTimeout) {
  mock::ClientEnvGuard env;
  auto http_mock = std::make_unique<mock::MockHttpClient>();
  auto* mock_ptr = http_mock.get();
  mock_ptr->enqueue_json(200, "[]");

  CategorizerClient client(ClientOptions{}, std::move(http_mock));

  RequestOptions request_options;
  request_options.timeout = std::chrono::milliseconds(250);
  client.models().list_providers(request_options);

  ASSERT_TRUE(mock_ptr->last_request().has_value());
  EXPECT_EQ(mock_ptr->last_request()->timeout, std::chrono::milliseconds(250));
}

TEST(CategorizerClientErrorTest, TransportFailureRaisesConnectionError) {
  mock::ClientEnvGuard env;
  auto http_mock = std::make_unique<mock::MockHttpClient>();
  auto* mock_ptr = http_mock.get();
  mock_ptr->enqueue_error("libcurl error: Couldn't connect to server");

  CategorizerClient client(ClientOptions{}, std::move(http_mock));

  try {
    client.models().list_providers();
    FAIL() << "expected APIConnectionError";
  } catch (const APIConnectionError& error) {
    EXPECT_NE(std::string(error.what()).find("Couldn't connect"), std::string::npos);
  }
  EXPECT_EQ(mock_ptr->call_count(), 1u);
}

TEST(CategorizerClientErrorTest, NotFoundCarriesPlainTextMessage) {
  mock::ClientEnvGuard env;
  auto http_mock = std::make_unique<mock::MockHttpClient>();
  auto* mock_ptr = http_mock.get();
  mock_ptr->enqueue_response(HttpResponse{404, {}, "Provider 'Nope' not found\n"});

  CategorizerClient client(ClientOptions{}, std::move(http_mock));

  try {
    client.models().get_provider_models("Nope");
    FAIL() << "expected NotFoundError";
  } catch (const NotFoundError& error) {
    EXPECT_EQ(error.status_code(), 404);
    EXPECT_EQ(std::string(error.what()), "Provider 'Nope' not found");
    EXPECT_EQ(error.error_body().at("message"), "Provider 'Nope' not found");
  }
}

TEST(CategorizerClientErrorTest, JsonErrorBodyIsExposed) {
  mock::ClientEnvGuard env;
  auto http_mock = std::make_unique<mock::MockHttpClient>();
  auto* mock_ptr = http_mock.get();
  mock_ptr->enqueue_json(500, R"({"error":"registry unavailable"})");

  CategorizerClient client(ClientOptions{}, std::move(http_mock));

  try {
    client.models().list_providers();
    FAIL() << "expected APIError";
  } catch (const APIError& error) {
    EXPECT_EQ(error.status_code(), 500);
    EXPECT_EQ(std::string(error.what()), "registry unavailable");
    EXPECT_EQ(error.error_body().at("error"), "registry unavailable");
  }
}

TEST(CategorizerClientErrorTest, EmptyErrorBodyFallsBackToStatusMessage) {
  mock::ClientEnvGuard env;
  auto http_mock = std::make_unique<mock::MockHttpClient>();
  auto* mock_ptr = http_mock.get();
  mock_ptr->enqueue_response(HttpResponse{503, {}, ""});

  CategorizerClient client(ClientOptions{}, std::move(http_mock));

  try {
    client.models().list_providers();
    FAIL() << "expected ServiceError";
  } catch (const ServiceError& error) {
    EXPECT_EQ(std::string(error.what()), "HTTP 503 error");
  }
}

TEST(CategorizerClientErrorTest, NonSuccessStatusesRaiseServiceErrorOnly) {
  mock::ClientEnvGuard env;
  for (long status : {301L, 400L, 404L, 409L, 500L, 503L}) {
    auto http_mock = std::make_unique<mock::MockHttpClient>();
    auto* mock_ptr = http_mock.get();
    mock_ptr->enqueue_response(HttpResponse{status, {}, "nope"});
    CategorizerClient client(ClientOptions{}, std::move(http_mock));

    EXPECT_THROW(client.models().get_categorized_models(), ServiceError) << "status " << status;
    EXPECT_EQ(mock_ptr->call_count(), 1u) << "status " << status;
  }
}

TEST(CategorizerClientLoggingTest, EmitsLogsWithSanitizedHeaders) {
  mock::ClientEnvGuard env;
  auto http_mock = std::make_unique<mock::MockHttpClient>();
  auto* mock_ptr = http_mock.get();

  HttpResponse response;
  response.status_code = 200;
  response.body = R"(["OpenAI"])";
  response.headers["Set-Cookie"] = "secret";
  mock_ptr->enqueue_response(response);

  std::vector<std::tuple<LogLevel, std::string, nlohmann::json>> logs;

  ClientOptions options;
  options.default_headers["Authorization"] = "Bearer token";
  options.logger = [&](LogLevel level, const std::string& message, const nlohmann::json& details) {
    logs.emplace_back(level, message, details);
  };
  options.log_level = LogLevel::Debug;

  CategorizerClient client(std::move(options), std::move(http_mock));
  client.models().list_providers();

  bool found_request_log = false;
  bool found_response_log = false;
  for (const auto& [level, message, details] : logs) {
    if (message == "sending request") {
      found_request_log = true;
      EXPECT_EQ(level, LogLevel::Debug);
      EXPECT_EQ(details.at("headers").at("Authorization"), "***");
      EXPECT_EQ(details.at("url"), "http://localhost:8080/models");
    }
    if (message == "request succeeded") {
      found_response_log = true;
      EXPECT_EQ(level, LogLevel::Info);
      EXPECT_EQ(details.at("status"), 200);
      EXPECT_EQ(details.at("response_headers").at("Set-Cookie"), "***");
    }
  }
  EXPECT_TRUE(found_request_log);
  EXPECT_TRUE(found_response_log);
}

TEST(CategorizerClientLoggingTest, RespectsConfiguredLevel) {
  mock::ClientEnvGuard env;
  auto http_mock = std::make_unique<mock::MockHttpClient>();
  auto* mock_ptr = http_mock.get();
  mock_ptr->enqueue_response(HttpResponse{500, {}, "boom"});

  std::vector<std::string> messages;
  ClientOptions options;
  options.logger = [&](LogLevel, const std::string& message, const nlohmann::json&) {
    messages.push_back(message);
  };
  options.log_level = LogLevel::Error;

  CategorizerClient client(std::move(options), std::move(http_mock));
  EXPECT_THROW(client.models().list_providers(), APIError);

  ASSERT_EQ(messages.size(), 1u);
  EXPECT_EQ(messages.front(), "request failed");
}

TEST(CategorizerClientHealthTest, DecodesHealthPayload) {
  mock::ClientEnvGuard env;
  auto http_mock = std::make_unique<mock::MockHttpClient>();
  auto* mock_ptr = http_mock.get();
  mock_ptr->enqueue_json(200, R"({
    "status": "healthy",
    "time": "2024-05-01T10:00:00Z",
    "models": {"OpenAI": 12, "Anthropic": 4}
  })");

  CategorizerClient client(ClientOptions{}, std::move(http_mock));
  auto health = client.health();

  EXPECT_EQ(health.status, "healthy");
  EXPECT_EQ(health.time, "2024-05-01T10:00:00Z");
  EXPECT_EQ(health.models.at("OpenAI"), 12);
  EXPECT_EQ(health.models.at("Anthropic"), 4);
  ASSERT_TRUE(mock_ptr->last_request().has_value());
  EXPECT_EQ(mock_ptr->last_request()->url, "http://localhost:8080/health");
}
