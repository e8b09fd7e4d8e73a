/*-------------------------------------------------------------------------
 *
 * CConfig.cpp
 *		  Configuration management implementation for StrataDB
 *
 * Handles loading and processing of configuration files in JSON and
 * YAML formats.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 * IDENTIFICATION
 *		  src/CConfig.cpp
 *
 *-------------------------------------------------------------------------
 */

#include <fstream>
#include <iterator>
#include <sstream>

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include "CConfig.hpp"
#include "CLogMacros.hpp"

namespace StrataDB
{

/*
 * CConfig constructor
 *		Initialize configuration manager
 */
CConfig::CConfig()
	: logger_(nullptr),
	  config_values_(std::make_unique<std::unordered_map<std::string, ConfigValue>>())
{
}

CConfig::~CConfig() = default;

/*
 * loadFromFile
 *		Load configuration from file based on extension
 */
std::error_code
CConfig::loadFromFile(const std::string& filename)
{
	std::string		extension;
	std::ifstream	file;
	std::string		content;
	size_t			dot = filename.find_last_of('.');

	if (dot == std::string::npos)
		return std::make_error_code(std::errc::invalid_argument);
	extension = filename.substr(dot + 1);

	file.open(filename);
	if (!file.is_open())
		return std::make_error_code(std::errc::no_such_file_or_directory);

	content = std::string((std::istreambuf_iterator<char>(file)),
						  std::istreambuf_iterator<char>());
	file.close();

	if (extension == "json")
		return loadFromJson(content);
	else if (extension == "yaml" || extension == "yml")
		return loadFromYaml(content);

	return std::make_error_code(std::errc::invalid_argument);
}

/*
 * loadFromJson
 *		Parse JSON configuration content
 */
std::error_code
CConfig::loadFromJson(const std::string& jsonContent)
{
	if (jsonContent.empty())
		return std::make_error_code(std::errc::invalid_argument);

	try
	{
		nlohmann::json j = nlohmann::json::parse(jsonContent);
		processJsonNode("", j);
		return std::error_code{};
	}
	catch (const nlohmann::json::exception& e)
	{
		error_log(std::string("JSON parsing error: '") + e.what() + "'.");
		return std::make_error_code(std::errc::invalid_argument);
	}
}

/*
 * processJsonNode
 *		Recursively process JSON nodes to flatten nested structure
 */
void
CConfig::processJsonNode(const std::string& prefix, const nlohmann::json& node)
{
	if (node.is_object())
	{
		for (auto it = node.begin(); it != node.end(); ++it)
		{
			std::string key = it.key();
			std::string fullKey = prefix.empty() ? key : prefix + "." + key;
			processJsonNode(fullKey, it.value());
		}
	}
	else if (node.is_string())
	{
		set(prefix, node.get<std::string>());
	}
	else if (node.is_number_unsigned())
	{
		set(prefix, node.get<uint64_t>());
	}
	else if (node.is_number_integer())
	{
		set(prefix, node.get<int64_t>());
	}
	else if (node.is_number_float())
	{
		set(prefix, node.get<double>());
	}
	else if (node.is_boolean())
	{
		set(prefix, node.get<bool>());
	}
	else if (node.is_array())
	{
		std::vector<std::string> arrayValues;
		for (const auto& item : node)
		{
			if (item.is_string())
				arrayValues.push_back(item.get<std::string>());
			else
				arrayValues.push_back(item.dump());
		}
		set(prefix, arrayValues);
	}
	else
	{
		set(prefix, node.dump());
	}
}

/*
 * loadFromYaml
 *		Parse YAML configuration content
 */
std::error_code
CConfig::loadFromYaml(const std::string& yamlContent)
{
	if (yamlContent.empty())
		return std::make_error_code(std::errc::invalid_argument);

	try
	{
		YAML::Node config = YAML::Load(yamlContent);
		processYamlNode("", config);
		return std::error_code{};
	}
	catch (const YAML::Exception& e)
	{
		error_log(std::string("YAML parsing error: '") + e.what() + "'.");
		return std::make_error_code(std::errc::invalid_argument);
	}
}

/*
 * processYamlNode
 *		Recursively process YAML nodes
 */
void
CConfig::processYamlNode(const std::string& prefix, const YAML::Node& node)
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
		set(prefix, std::string(""));
	}
	else if (node.IsScalar())
	{
		std::string strValue = node.as<std::string>();
		int64_t		intValue = 0;
		double		doubleValue = 0.0;

		/* Check if it's a boolean */
		if (strValue == "true" || strValue == "false")
			set(prefix, strValue == "true");
		else if (YAML::convert<int64_t>::decode(node, intValue))
			set(prefix, intValue);
		else if (YAML::convert<double>::decode(node, doubleValue))
			set(prefix, doubleValue);
		else
			set(prefix, strValue);
	}
	else if (node.IsSequence())
	{
		std::vector<std::string> arrayValues;
		for (const auto& item : node)
		{
			if (item.IsScalar())
			{
				arrayValues.push_back(item.as<std::string>());
			}
			else
			{
				std::stringstream ss;
				ss << item;
				arrayValues.push_back(ss.str());
			}
		}
		set(prefix, arrayValues);
	}
}

std::string
CConfig::toJson() const
{
	nlohmann::json j;

	for (const auto& [key, value] : *config_values_)
		std::visit([&j, &key](const auto& v) { j[key] = v; }, value);

	return j.dump(2);
}

void
CConfig::set(const std::string& key, const ConfigValue& value)
{
	(*config_values_)[key] = value;
	debug_log("Configuration value set: '" + key + "'.");
}

std::optional<ConfigValue>
CConfig::get(const std::string& key) const
{
	auto it = config_values_->find(key);
	if (it != config_values_->end())
		return it->second;
	return std::nullopt;
}

bool
CConfig::has(const std::string& key) const
{
	return config_values_->find(key) != config_values_->end();
}

std::vector<std::string>
CConfig::keys() const
{
	std::vector<std::string> result;
	result.reserve(config_values_->size());
	for (const auto& [key, _] : *config_values_)
		result.push_back(key);
	return result;
}

std::string
CConfig::getString(const std::string& key, const std::string& fallback) const
{
	auto value = get(key);

	if (value && std::holds_alternative<std::string>(*value))
		return std::get<std::string>(*value);
	return fallback;
}

int64_t
CConfig::getInt64(const std::string& key, int64_t fallback) const
{
	auto value = get(key);

	if (!value)
		return fallback;
	if (std::holds_alternative<int>(*value))
		return std::get<int>(*value);
	if (std::holds_alternative<int64_t>(*value))
		return std::get<int64_t>(*value);
	if (std::holds_alternative<uint64_t>(*value))
		return static_cast<int64_t>(std::get<uint64_t>(*value));
	return fallback;
}

bool
CConfig::getBool(const std::string& key, bool fallback) const
{
	auto value = get(key);

	if (value && std::holds_alternative<bool>(*value))
		return std::get<bool>(*value);
	return fallback;
}

void
CConfig::setLogger(std::shared_ptr<ILogger> logger)
{
	logger_ = std::move(logger);
}

std::shared_ptr<ILogger>
CConfig::getLogger() const
{
	return logger_;
}

} // namespace StrataDB
