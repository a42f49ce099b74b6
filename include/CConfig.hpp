/*-------------------------------------------------------------------------
 *
 * CConfig.hpp
 *      Flat key/value configuration loaded from JSON or YAML.
 *      Part of the DocLink document database client.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "CLogger.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <system_error>
#include <variant>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace DocLink
{

using ConfigValue =
    std::variant<std::string, int64_t, double, bool, std::vector<std::string>>;

/**
 * Nested objects are flattened into dotted keys, so
 * {"socket": {"keepAlive": true}} is stored as "socket.keepAlive".
 */
class CConfig
{
  public:
    CConfig();
    ~CConfig();

    std::error_code loadFromFile(const std::string& filename);
    std::error_code loadFromJson(const std::string& jsonContent);
    std::error_code loadFromYaml(const std::string& yamlContent);

    void set(const std::string& key, const ConfigValue& value);
    std::optional<ConfigValue> get(const std::string& key) const;
    bool has(const std::string& key) const;
    std::vector<std::string> keys() const;

    /* Typed lookups; a missing key or an incompatible value yields nullopt */
    std::optional<std::string> getString(const std::string& key) const;
    std::optional<int64_t> getInt(const std::string& key) const;
    std::optional<bool> getBool(const std::string& key) const;

    std::string toJson() const;
    std::string toYaml() const;

    void setLogger(std::shared_ptr<CLogger> logger);
    std::shared_ptr<CLogger> getLogger() const;

  private:
    void processJsonNode(const std::string& prefix, const nlohmann::json& node);
    void processYamlNode(const std::string& prefix, const YAML::Node& node);
    static ConfigValue parseScalar(const std::string& text);

    std::shared_ptr<CLogger> logger_;
    std::map<std::string, ConfigValue> values_;
};

} /* namespace DocLink */
