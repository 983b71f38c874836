#pragma once

#include <filesystem>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"
#include "utils/logging.hpp"

namespace agentbench::config {

// ~/.agentbench/config.json
std::filesystem::path DefaultConfigPath();

// Defaults, then the file at `path` when it exists, then AGENTBENCH_*
// environment variables. A malformed file is logged and skipped.
BenchConfig LoadConfig(const std::filesystem::path& path, agentbench::utils::Logger& logger);
BenchConfig LoadConfig(agentbench::utils::Logger& logger);

void ApplyConfigFromJson(BenchConfig& config, const nlohmann::json& data);
// Returns false when the file is missing or malformed (the latter is logged).
bool ApplyConfigFile(BenchConfig& config, const std::filesystem::path& path, agentbench::utils::Logger& logger);
void ApplyEnvironment(BenchConfig& config);

nlohmann::json ConfigToJson(const BenchConfig& config);
// Throws BenchError when the file cannot be written.
void SaveConfig(const BenchConfig& config, const std::filesystem::path& path);

}  // namespace agentbench::config
