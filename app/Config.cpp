#include "Config.h"
#include "../lib/Utilities.h"

namespace quub {

namespace {

struct Transfer {
  std::string from;
  std::string to;
  int64_t amount{ 0 };
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Transfer, from, to, amount)

Config::Error invalidField(const std::string &message) {
  return Config::Error(Config::E_INVALID_FIELD, message);
}

} // namespace

Config::Config() : batches(defaultBatches()) {}

std::vector<Config::Batch> Config::defaultBatches() {
  return {
      {Transfer{"Alice", "Bob", 50}, Transfer{"Bob", "Charlie", 25}},
      {Transfer{"Charlie", "Alice", 10}},
  };
}

Config::Roe<void> Config::loadFile(const std::string &path) {
  auto jsonResult = utl::loadJsonFile(path);
  if (jsonResult.isError()) {
    return Error(E_LOAD, jsonResult.error().message);
  }
  return apply(jsonResult.value());
}

Config::Roe<void> Config::apply(const nlohmann::json &json) {
  if (!json.is_object()) {
    return Error(E_NOT_OBJECT, "Configuration must be a JSON object");
  }

  // Validate everything before touching any field
  uint32_t newDifficulty = difficulty;
  if (json.contains("difficulty")) {
    const auto &value = json["difficulty"];
    if (!value.is_number_integer() || value.get<int64_t>() < 0 ||
        value.get<int64_t>() > MAX_DIFFICULTY) {
      return invalidField("Configuration field 'difficulty' must be an integer in [0, " +
                          std::to_string(MAX_DIFFICULTY) + "]");
    }
    newDifficulty = value.get<uint32_t>();
  }

  logging::Level newLevel = logLevel;
  if (json.contains("logLevel")) {
    const auto &value = json["logLevel"];
    if (!value.is_string() || !logging::parseLevel(value.get<std::string>(), newLevel)) {
      return invalidField("Configuration field 'logLevel' is not a known level");
    }
  }

  std::string newLogFile = logFile;
  if (json.contains("logFile")) {
    if (!json["logFile"].is_string()) {
      return invalidField("Configuration field 'logFile' must be a string");
    }
    newLogFile = json["logFile"].get<std::string>();
  }

  std::vector<Batch> newBatches;
  bool hasBatches = json.contains("transactions");
  if (hasBatches) {
    const auto &value = json["transactions"];
    if (!value.is_array()) {
      return invalidField("Configuration field 'transactions' must be an array of batches");
    }
    for (const auto &batch : value) {
      if (!batch.is_array()) {
        return invalidField("Each transaction batch must be an array of records");
      }
      newBatches.emplace_back(batch.begin(), batch.end());
    }
  }

  difficulty = newDifficulty;
  logLevel = newLevel;
  logFile = newLogFile;
  if (hasBatches) {
    batches = std::move(newBatches);
  }
  return {};
}

} // namespace quub
