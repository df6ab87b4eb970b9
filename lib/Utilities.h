#ifndef QUUB_CHAIN_UTILITIES_H
#define QUUB_CHAIN_UTILITIES_H

#include "ResultOrError.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace quub {

// Error type for utility functions
struct Error : public RoeErrorBase {
  Error() : RoeErrorBase() {}
  Error(int32_t c, const std::string &msg) : RoeErrorBase(c, msg) {}
  Error(int32_t c, std::string &&msg) : RoeErrorBase(c, std::move(msg)) {}
  explicit Error(const std::string &msg) : RoeErrorBase(msg) {}
  explicit Error(std::string &&msg) : RoeErrorBase(std::move(msg)) {}
};

template <typename T> using Roe = ResultOrError<T, Error>;

namespace utl {

// Error codes reported by the file helpers
constexpr int32_t E_FILE_NOT_FOUND = 1;
constexpr int32_t E_FILE_OPEN = 2;
constexpr int32_t E_JSON_PARSE = 3;
constexpr int32_t E_FILE_EXISTS = 4;
constexpr int32_t E_MKDIR = 5;
constexpr int32_t E_FILE_WRITE = 6;

/**
 * Get the wall-clock time in seconds since the epoch
 * @return Current time, with sub-second precision
 */
double getCurrentTime();

/**
 * Compute SHA-256 using the OpenSSL EVP API
 * @param input Input bytes to hash
 * @return Lowercase hexadecimal digest (64 characters)
 * @throws std::runtime_error if the digest context cannot be used
 */
std::string sha256(const std::string &input);

/**
 * Encode binary data as hex string
 * @param data Raw bytes
 * @return Lowercase hex string (two chars per byte)
 */
std::string hexEncode(const std::string &data);

/**
 * Load and parse a JSON file
 * @param path Path to the JSON file
 * @return Parsed JSON, or E_FILE_NOT_FOUND, E_FILE_OPEN or E_JSON_PARSE
 */
Roe<nlohmann::json> loadJsonFile(const std::string &path);

/**
 * Write a string to a non-existent file
 * Creates parent directories if needed. Fails if the file already exists.
 * @param filePath Path to the file to write
 * @param content String content to write to the file
 * @return Roe<void>; E_FILE_EXISTS, E_MKDIR or E_FILE_WRITE on failure
 */
Roe<void> writeToNewFile(const std::string &filePath, const std::string &content);

} // namespace utl
} // namespace quub

#endif // QUUB_CHAIN_UTILITIES_H
