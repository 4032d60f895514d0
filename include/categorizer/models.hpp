#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace categorizer {

/// Opaque service payload; object keys keep wire order.
using Value = nlohmann::ordered_json;

/// String-keyed map that iterates in insertion (wire) order.
template <typename T>
using OrderedMap = nlohmann::ordered_map<std::string, T>;

struct ModelTypeEntry {
  std::optional<std::string> latest;
  std::optional<std::vector<std::string>> other_versions;
};

using ModelTypeMap = OrderedMap<ModelTypeEntry>;
using ModelFamilyMap = OrderedMap<ModelTypeMap>;

/// provider -> family -> type -> entry
using CategorizedCatalog = OrderedMap<ModelFamilyMap>;

using ModelCapabilities = Value;

struct RegistrationRequest {
  std::string provider;
  std::string model;
  Value metadata = Value::object();
};

struct RegistrationResult {
  std::string status;
  std::string message;
  Value raw;
};

struct HealthStatus {
  std::string status;
  std::string time;
  std::map<std::string, std::int64_t> models;
};

struct ReloadResult {
  std::string status;
  std::string message;
  std::map<std::string, std::int64_t> models;
};

/**
 * Decodes a `/models/categorized` payload. Every level must be a JSON object;
 * `latest` must be a string and `other_versions` an array of strings when
 * present. A null `latest` or `other_versions` is treated as absent.
 * Throws UnexpectedError naming the offending path otherwise.
 */
CategorizedCatalog parse_categorized_catalog(const Value& payload);

/// Inverse of parse_categorized_catalog; absent optionals are omitted.
Value catalog_to_json(const CategorizedCatalog& catalog);

Value registration_request_to_json(const RegistrationRequest& request);

std::vector<std::string> parse_provider_list(const Value& payload);
RegistrationResult parse_registration_result(const Value& payload);
HealthStatus parse_health_status(const Value& payload);
ReloadResult parse_reload_result(const Value& payload);

}  // namespace categorizer
