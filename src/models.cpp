#include "categorizer/models.hpp"

#include "categorizer/error.hpp"

#include <utility>

namespace categorizer {
namespace {

const Value& expect_object(const Value& value, const std::string& path) {
  if (!value.is_object()) {
    throw UnexpectedError("Expected JSON object at " + (path.empty() ? std::string("<root>") : path) +
                          ", got " + value.type_name());
  }
  return value;
}

std::string join_path(const std::string& parent, const std::string& key) {
  return parent.empty() ? key : parent + "." + key;
}

std::optional<std::string> parse_latest(const Value& entry, const std::string& path) {
  auto it = entry.find("latest");
  if (it == entry.end() || it->is_null()) {
    return std::nullopt;
  }
  if (!it->is_string()) {
    throw UnexpectedError("Expected string at " + join_path(path, "latest"));
  }
  return it->get<std::string>();
}

std::optional<std::vector<std::string>> parse_other_versions(const Value& entry, const std::string& path) {
  auto it = entry.find("other_versions");
  if (it == entry.end() || it->is_null()) {
    return std::nullopt;
  }
  const std::string field_path = join_path(path, "other_versions");
  if (!it->is_array()) {
    throw UnexpectedError("Expected array at " + field_path);
  }
  std::vector<std::string> versions;
  versions.reserve(it->size());
  for (const auto& item : *it) {
    if (!item.is_string()) {
      throw UnexpectedError("Expected array of strings at " + field_path);
    }
    versions.push_back(item.get<std::string>());
  }
  return versions;
}

ModelTypeEntry parse_type_entry(const Value& entry, const std::string& path) {
  expect_object(entry, path);
  ModelTypeEntry result;
  result.latest = parse_latest(entry, path);
  result.other_versions = parse_other_versions(entry, path);
  return result;
}

std::map<std::string, std::int64_t> parse_model_counts(const Value& payload) {
  std::map<std::string, std::int64_t> counts;
  auto it = payload.find("models");
  if (it == payload.end() || !it->is_object()) {
    return counts;
  }
  for (const auto& item : it->items()) {
    if (item.value().is_number_integer()) {
      counts[item.key()] = item.value().get<std::int64_t>();
    }
  }
  return counts;
}

}  // namespace

CategorizedCatalog parse_categorized_catalog(const Value& payload) {
  expect_object(payload, "");

  CategorizedCatalog catalog;
  for (const auto& provider : payload.items()) {
    const std::string provider_path = provider.key();
    expect_object(provider.value(), provider_path);

    ModelFamilyMap families;
    for (const auto& family : provider.value().items()) {
      const std::string family_path = join_path(provider_path, family.key());
      expect_object(family.value(), family_path);

      ModelTypeMap types;
      for (const auto& type : family.value().items()) {
        types.emplace(type.key(), parse_type_entry(type.value(), join_path(family_path, type.key())));
      }
      families.emplace(family.key(), std::move(types));
    }
    catalog.emplace(provider.key(), std::move(families));
  }
  return catalog;
}

Value catalog_to_json(const CategorizedCatalog& catalog) {
  Value result = Value::object();
  for (const auto& [provider, families] : catalog) {
    Value provider_json = Value::object();
    for (const auto& [family, types] : families) {
      Value family_json = Value::object();
      for (const auto& [type, entry] : types) {
        Value entry_json = Value::object();
        if (entry.latest) {
          entry_json["latest"] = *entry.latest;
        }
        if (entry.other_versions) {
          entry_json["other_versions"] = *entry.other_versions;
        }
        family_json[type] = std::move(entry_json);
      }
      provider_json[family] = std::move(family_json);
    }
    result[provider] = std::move(provider_json);
  }
  return result;
}

Value registration_request_to_json(const RegistrationRequest& request) {
  Value body = Value::object();
  body["provider"] = request.provider;
  body["model"] = request.model;
  body["metadata"] = request.metadata;
  return body;
}

std::vector<std::string> parse_provider_list(const Value& payload) {
  if (!payload.is_array()) {
    throw UnexpectedError(std::string("Expected JSON array of providers, got ") + payload.type_name());
  }
  std::vector<std::string> providers;
  providers.reserve(payload.size());
  for (const auto& item : payload) {
    if (!item.is_string()) {
      throw UnexpectedError("Expected provider names to be strings");
    }
    providers.push_back(item.get<std::string>());
  }
  return providers;
}

RegistrationResult parse_registration_result(const Value& payload) {
  expect_object(payload, "");
  RegistrationResult result;
  result.status = payload.value("status", "");
  result.message = payload.value("message", "");
  result.raw = payload;
  return result;
}

HealthStatus parse_health_status(const Value& payload) {
  expect_object(payload, "");
  HealthStatus health;
  health.status = payload.value("status", "");
  health.time = payload.value("time", "");
  health.models = parse_model_counts(payload);
  return health;
}

ReloadResult parse_reload_result(const Value& payload) {
  expect_object(payload, "");
  ReloadResult result;
  result.status = payload.value("status", "");
  result.message = payload.value("message", "");
  result.models = parse_model_counts(payload);
  return result;
}

}  // namespace categorizer
