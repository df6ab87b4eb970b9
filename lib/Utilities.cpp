#include "Utilities.h"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <openssl/evp.h>
#include <stdexcept>

namespace quub {
namespace utl {

double getCurrentTime() {
  auto now = std::chrono::system_clock::now().time_since_epoch();
  return std::chrono::duration_cast<std::chrono::duration<double>>(now).count();
}

std::string sha256(const std::string &input) {
  EVP_MD_CTX *mdctx = EVP_MD_CTX_new();
  if (!mdctx) {
    throw std::runtime_error("Failed to create EVP_MD_CTX");
  }

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digestLen = 0;

  if (EVP_DigestInit_ex(mdctx, EVP_sha256(), nullptr) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw std::runtime_error("EVP_DigestInit_ex failed");
  }

  if (EVP_DigestUpdate(mdctx, input.data(), input.size()) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw std::runtime_error("EVP_DigestUpdate failed");
  }

  if (EVP_DigestFinal_ex(mdctx, digest, &digestLen) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }

  EVP_MD_CTX_free(mdctx);

  return hexEncode(std::string(reinterpret_cast<const char *>(digest), digestLen));
}

std::string hexEncode(const std::string &data) {
  static const char HEX_DIGITS[] = "0123456789abcdef";
  std::string out;
  out.reserve(data.size() * 2);
  for (unsigned char c : data) {
    out.push_back(HEX_DIGITS[c >> 4]);
    out.push_back(HEX_DIGITS[c & 0x0f]);
  }
  return out;
}

Roe<nlohmann::json> loadJsonFile(const std::string &path) {
  if (!std::filesystem::exists(path)) {
    return Error(E_FILE_NOT_FOUND, "File not found: " + path);
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    return Error(E_FILE_OPEN, "Failed to open file: " + path);
  }

  std::string content((std::istreambuf_iterator<char>(file)),
                      std::istreambuf_iterator<char>());
  file.close();

  nlohmann::json json;
  try {
    json = nlohmann::json::parse(content);
  } catch (const nlohmann::json::parse_error &e) {
    return Error(E_JSON_PARSE, "Failed to parse JSON in " + path + ": " + std::string(e.what()));
  }

  return json;
}

Roe<void> writeToNewFile(const std::string &filePath, const std::string &content) {
  if (std::filesystem::exists(filePath)) {
    return Error(E_FILE_EXISTS, "File already exists: " + filePath);
  }

  std::filesystem::path path(filePath);
  std::filesystem::path parentDir = path.parent_path();
  if (!parentDir.empty() && !std::filesystem::exists(parentDir)) {
    std::error_code ec;
    std::filesystem::create_directories(parentDir, ec);
    if (ec) {
      return Error(E_MKDIR, "Failed to create parent directories for " + filePath + ": " + ec.message());
    }
  }

  std::ofstream file(filePath);
  if (!file.is_open()) {
    return Error(E_FILE_WRITE, "Failed to open file for writing: " + filePath);
  }

  file << content;
  file.close();

  if (!file.good()) {
    return Error(E_FILE_WRITE, "Failed to write content to file: " + filePath);
  }

  return {};
}

} // namespace utl
} // namespace quub
