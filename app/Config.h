#pragma once

#include "../ledger/Block.h"
#include "../ledger/Chain.h"
#include "../lib/Logger.h"
#include "../lib/ResultOrError.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace quub {

/**
 * Settings for the quub demo. Every field has a default; a JSON config file
 * overrides only the fields it names:
 *
 *   {
 *     "difficulty": 2,            // 0..MAX_DIFFICULTY
 *     "logLevel": "info",         // debug, info, warning, error, critical
 *     "logFile": "quub.log",      // optional, DEBUG file handler
 *     "transactions": [[{...}, {...}], [{...}]]  // one block per batch
 *   }
 */
struct Config {
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  static constexpr int32_t E_LOAD = 1;
  static constexpr int32_t E_NOT_OBJECT = 2;
  static constexpr int32_t E_INVALID_FIELD = 3;

  static constexpr uint32_t MAX_DIFFICULTY = 8;

  using Batch = std::vector<Block::Record>;

  Config();

  // The built-in transfers: Alice->Bob 50 and Bob->Charlie 25, then Charlie->Alice 10
  static std::vector<Batch> defaultBatches();

  Roe<void> loadFile(const std::string &path);
  Roe<void> apply(const nlohmann::json &json);

  uint32_t difficulty{ Chain::DEFAULT_DIFFICULTY };
  logging::Level logLevel{ logging::Level::INFO };
  std::string logFile;
  std::vector<Batch> batches;
};

} // namespace quub
