/*-------------------------------------------------------------------------
 *
 * CConfig.cpp
 *      Flat key/value configuration loaded from JSON or YAML.
 *      Part of the DocLink document database client.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "CConfig.hpp"

#include "CLogMacros.hpp"

#include <charconv>
#include <fstream>
#include <iterator>
#include <type_traits>

namespace DocLink
{

CConfig::CConfig() : logger_(nullptr), values_()
{
}

CConfig::~CConfig() = default;

/*
 * loadFromFile
 *		Pick the parser from the file extension
 */
std::error_code CConfig::loadFromFile(const std::string& filename)
{
    std::string extension;
    size_t dot = filename.find_last_of('.');

    if (dot != std::string::npos)
        extension = filename.substr(dot + 1);

    std::ifstream file(filename);
    if (!file.is_open())
    {
        error_log("cannot open configuration file '" + filename + "'");
        return std::make_error_code(std::errc::no_such_file_or_directory);
    }

    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());

    if (extension == "json")
        return loadFromJson(content);
    if (extension == "yaml" || extension == "yml")
        return loadFromYaml(content);

    error_log("unsupported configuration format '" + extension + "'");
    return std::make_error_code(std::errc::invalid_argument);
}

std::error_code CConfig::loadFromJson(const std::string& jsonContent)
{
    if (jsonContent.empty())
        return std::make_error_code(std::errc::invalid_argument);

    try
    {
        nlohmann::json root = nlohmann::json::parse(jsonContent);
        if (!root.is_object())
        {
            error_log("JSON configuration must be an object");
            return std::make_error_code(std::errc::invalid_argument);
        }
        processJsonNode("", root);
        return std::error_code{};
    }
    catch (const nlohmann::json::exception& e)
    {
        error_log(std::string("JSON parsing error: '") + e.what() + "'.");
        return std::make_error_code(std::errc::invalid_argument);
    }
}

void CConfig::processJsonNode(const std::string& prefix,
                              const nlohmann::json& node)
{
    if (node.is_object())
    {
        for (auto it = node.begin(); it != node.end(); ++it)
        {
            std::string fullKey =
                prefix.empty() ? it.key() : prefix + "." + it.key();
            processJsonNode(fullKey, it.value());
        }
    }
    else if (node.is_string())
    {
        set(prefix, node.get<std::string>());
    }
    else if (node.is_boolean())
    {
        set(prefix, node.get<bool>());
    }
    else if (node.is_number_integer())
    {
        set(prefix, node.get<int64_t>());
    }
    else if (node.is_number_float())
    {
        set(prefix, node.get<double>());
    }
    else if (node.is_array())
    {
        std::vector<std::string> items;
        for (const auto& item : node)
            items.push_back(item.is_string() ? item.get<std::string>()
                                             : item.dump());
        set(prefix, items);
    }
    else if (node.is_null())
    {
        set(prefix, std::string());
    }
}

std::error_code CConfig::loadFromYaml(const std::string& yamlContent)
{
    if (yamlContent.empty())
        return std::make_error_code(std::errc::invalid_argument);

    try
    {
        YAML::Node root = YAML::Load(yamlContent);
        if (!root.IsMap())
        {
            error_log("YAML configuration must be a mapping");
            return std::make_error_code(std::errc::invalid_argument);
        }
        processYamlNode("", root);
        return std::error_code{};
    }
    catch (const YAML::Exception& e)
    {
        error_log(std::string("YAML parsing error: '") + e.what() + "'.");
        return std::make_error_code(std::errc::invalid_argument);
    }
}

void CConfig::processYamlNode(const std::string& prefix, const YAML::Node& node)
{
    if (node.IsMap())
    {
        for (const auto& pair : node)
        {
            std::string key = pair.first.as<std::string>();
            std::string fullKey = prefix.empty() ? key : prefix + "." + key;
            processYamlNode(fullKey, pair.second);
        }
    }
    else if (node.IsNull())
    {
        set(prefix, std::string());
    }
    else if (node.IsScalar())
    {
        /* quoted scalars stay strings */
        if (node.Tag() == "!")
            set(prefix, node.as<std::string>());
        else
            set(prefix, parseScalar(node.as<std::string>()));
    }
    else if (node.IsSequence())
    {
        std::vector<std::string> items;
        for (const auto& item : node)
        {
            if (item.IsScalar())
            {
                items.push_back(item.as<std::string>());
            }
            else
            {
                YAML::Emitter out;
                out << YAML::Flow << item;
                items.push_back(out.c_str());
            }
        }
        set(prefix, items);
    }
}

/*
 * parseScalar
 *		Plain YAML scalar to bool, integer, floating point or string
 */
ConfigValue CConfig::parseScalar(const std::string& text)
{
    if (text == "true")
        return true;
    if (text == "false")
        return false;

    const char* first = text.data();
    const char* last = text.data() + text.size();

    int64_t integer = 0;
    auto intResult = std::from_chars(first, last, integer);
    if (!text.empty() && intResult.ec == std::errc() && intResult.ptr == last)
        return integer;

    double number = 0.0;
    auto doubleResult = std::from_chars(first, last, number);
    if (!text.empty() && doubleResult.ec == std::errc() &&
        doubleResult.ptr == last)
        return number;

    return text;
}

void CConfig::set(const std::string& key, const ConfigValue& value)
{
    values_[key] = value;
    debug_log("configuration value set: '" + key + "'.");
}

std::optional<ConfigValue> CConfig::get(const std::string& key) const
{
    auto it = values_.find(key);
    if (it == values_.end())
        return std::nullopt;
    return it->second;
}

bool CConfig::has(const std::string& key) const
{
    return values_.find(key) != values_.end();
}

std::vector<std::string> CConfig::keys() const
{
    std::vector<std::string> result;
    result.reserve(values_.size());
    for (const auto& [key, _] : values_)
        result.push_back(key);
    return result;
}

std::optional<std::string> CConfig::getString(const std::string& key) const
{
    auto it = values_.find(key);
    if (it == values_.end())
        return std::nullopt;

    return std::visit(
        [](const auto& v) -> std::optional<std::string>
        {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::string>)
                return v;
            else if constexpr (std::is_same_v<T, bool>)
                return std::string(v ? "true" : "false");
            else if constexpr (std::is_same_v<T, int64_t> ||
                               std::is_same_v<T, double>)
                return std::to_string(v);
            else
                return std::nullopt;
        },
        it->second);
}

std::optional<int64_t> CConfig::getInt(const std::string& key) const
{
    auto it = values_.find(key);
    if (it == values_.end())
        return std::nullopt;

    if (const int64_t* integer = std::get_if<int64_t>(&it->second))
        return *integer;
    if (const std::string* text = std::get_if<std::string>(&it->second))
    {
        int64_t parsed = 0;
        const char* last = text->data() + text->size();
        auto result = std::from_chars(text->data(), last, parsed);
        if (!text->empty() && result.ec == std::errc() && result.ptr == last)
            return parsed;
    }
    return std::nullopt;
}

std::optional<bool> CConfig::getBool(const std::string& key) const
{
    auto it = values_.find(key);
    if (it == values_.end())
        return std::nullopt;

    if (const bool* flag = std::get_if<bool>(&it->second))
        return *flag;
    if (const std::string* text = std::get_if<std::string>(&it->second))
    {
        if (*text == "true" || *text == "on" || *text == "yes")
            return true;
        if (*text == "false" || *text == "off" || *text == "no")
            return false;
    }
    return std::nullopt;
}

std::string CConfig::toJson() const
{
    nlohmann::json root = nlohmann::json::object();

    for (const auto& [key, value] : values_)
        std::visit([&root, &key](const auto& v) { root[key] = v; }, value);
    return root.dump(2);
}

std::string CConfig::toYaml() const
{
    YAML::Emitter out;

    out << YAML::BeginMap;
    for (const auto& [key, value] : values_)
    {
        out << YAML::Key << key << YAML::Value;
        std::visit(
            [&out](const auto& v)
            {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, std::vector<std::string>>)
                {
                    out << YAML::BeginSeq;
                    for (const auto& item : v)
                        out << item;
                    out << YAML::EndSeq;
                }
                else
                {
                    out << v;
                }
            },
            value);
    }
    out << YAML::EndMap;
    return out.c_str();
}

void CConfig::setLogger(std::shared_ptr<CLogger> logger)
{
    logger_ = std::move(logger);
}

std::shared_ptr<CLogger> CConfig::getLogger() const
{
    return logger_;
}

} /* namespace DocLink */
