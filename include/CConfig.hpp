/*-------------------------------------------------------------------------
 *
 * CConfig.hpp
 *      Flattened key/value configuration store for StrataDB.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <system_error>
#include <unordered_map>
#include <variant>
#include <vector>
#include <yaml-cpp/yaml.h>
#include "IInterfaces.hpp"

namespace StrataDB
{

using ConfigValue = std::variant<std::string, int, int64_t, uint64_t, double,
								 bool, std::vector<std::string>>;

/*
 * CConfig
 *		Nested JSON/YAML keys are flattened with '.', so
 *		{ logging: { level: DEBUG } } is stored as "logging.level".
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

	/* Typed lookups; fall back when the key is absent or of another kind */
	std::string getString(const std::string& key,
						  const std::string& fallback) const;
	int64_t getInt64(const std::string& key, int64_t fallback) const;
	bool getBool(const std::string& key, bool fallback) const;

	std::string toJson() const;

	void setLogger(std::shared_ptr<ILogger> logger);
	std::shared_ptr<ILogger> getLogger() const;

private:
	std::shared_ptr<ILogger> logger_;
	std::unique_ptr<std::unordered_map<std::string, ConfigValue>> config_values_;

	void processJsonNode(const std::string& prefix, const nlohmann::json& node);
	void processYamlNode(const std::string& prefix, const YAML::Node& node);
};

} // namespace StrataDB
