#include "Block.h"
#include "../lib/Utilities.h"

#include <utility>

namespace quub {

namespace {

const char* const KEY_INDEX = "index";
const char* const KEY_TIMESTAMP = "timestamp";
const char* const KEY_DATA = "data";
const char* const KEY_PREVIOUS_HASH = "previous_hash";
const char* const KEY_NONCE = "nonce";
const char* const KEY_HASH = "hash";

Block::Roe<const nlohmann::json*> requireField(const nlohmann::json& json,
                                                const char* key) {
  auto it = json.find(key);
  if (it == json.end()) {
    return Block::Error(Block::E_MISSING_FIELD,
                        std::string("Missing block field: ") + key);
  }
  return &*it;
}

Block::Error invalidField(const char* key, const char* expected) {
  return Block::Error(Block::E_INVALID_FIELD, std::string("Block field '") +
                                                  key + "' must be " + expected);
}

// Accepts any JSON integer that is not negative
bool readUnsigned(const nlohmann::json& value, uint64_t& out) {
  if (value.is_number_unsigned()) {
    out = value.get<uint64_t>();
    return true;
  }
  if (value.is_number_integer() && value.get<int64_t>() >= 0) {
    out = static_cast<uint64_t>(value.get<int64_t>());
    return true;
  }
  return false;
}

} // namespace

Block::Block(uint64_t index, double timestamp, std::vector<Record> data,
             std::string previousHash, uint64_t nonce)
    : index_(index), timestamp_(timestamp), data_(std::move(data)),
      previousHash_(std::move(previousHash)), nonce_(nonce) {
  hash_ = calculateHash();
}

std::string Block::calculateHash(uint64_t index, double timestamp,
                                 const std::vector<Record>& data,
                                 const std::string& previousHash,
                                 uint64_t nonce) {
  // nlohmann::json objects keep their keys sorted
  nlohmann::json canonical = nlohmann::json::object();
  canonical[KEY_INDEX] = index;
  canonical[KEY_TIMESTAMP] = timestamp;
  canonical[KEY_DATA] = data;
  canonical[KEY_PREVIOUS_HASH] = previousHash;
  canonical[KEY_NONCE] = nonce;

  // CBOR keeps string bytes verbatim, valid UTF-8 or not
  std::vector<uint8_t> encoded = nlohmann::json::to_cbor(canonical);
  return utl::sha256(std::string(encoded.begin(), encoded.end()));
}

std::string Block::calculateHash() const {
  return calculateHash(index_, timestamp_, data_, previousHash_, nonce_);
}

bool Block::hasLeadingZeros(const std::string& hash, uint32_t count) {
  if (hash.size() < count) {
    return false;
  }
  return hash.compare(0, count, std::string(count, '0')) == 0;
}

bool Block::meetsDifficulty(uint32_t difficulty) const {
  return hasLeadingZeros(hash_, difficulty);
}

void Block::mineBlock(uint32_t difficulty) {
  while (!hasLeadingZeros(hash_, difficulty)) {
    ++nonce_;
    hash_ = calculateHash();
  }
}

nlohmann::json Block::toJson() const {
  nlohmann::json json;
  json[KEY_INDEX] = index_;
  json[KEY_TIMESTAMP] = timestamp_;
  json[KEY_DATA] = data_;
  json[KEY_PREVIOUS_HASH] = previousHash_;
  json[KEY_NONCE] = nonce_;
  json[KEY_HASH] = hash_;
  return json;
}

Block::Roe<Block> Block::fromJson(const nlohmann::json& json) {
  if (!json.is_object()) {
    return Error(E_INVALID_FIELD, "Block must be a JSON object");
  }

  auto index = requireField(json, KEY_INDEX);
  if (!index) {
    return index.error();
  }
  uint64_t indexValue = 0;
  if (!readUnsigned(**index, indexValue)) {
    return invalidField(KEY_INDEX, "a non-negative integer");
  }

  auto timestamp = requireField(json, KEY_TIMESTAMP);
  if (!timestamp) {
    return timestamp.error();
  }
  if (!(*timestamp)->is_number()) {
    return invalidField(KEY_TIMESTAMP, "a number");
  }

  auto data = requireField(json, KEY_DATA);
  if (!data) {
    return data.error();
  }
  if (!(*data)->is_array()) {
    return invalidField(KEY_DATA, "an array");
  }

  auto previousHash = requireField(json, KEY_PREVIOUS_HASH);
  if (!previousHash) {
    return previousHash.error();
  }
  if (!(*previousHash)->is_string()) {
    return invalidField(KEY_PREVIOUS_HASH, "a string");
  }

  auto nonce = requireField(json, KEY_NONCE);
  if (!nonce) {
    return nonce.error();
  }
  uint64_t nonceValue = 0;
  if (!readUnsigned(**nonce, nonceValue)) {
    return invalidField(KEY_NONCE, "a non-negative integer");
  }

  auto hash = requireField(json, KEY_HASH);
  if (!hash) {
    return hash.error();
  }
  if (!(*hash)->is_string()) {
    return invalidField(KEY_HASH, "a string");
  }

  std::vector<Record> records((*data)->begin(), (*data)->end());
  Block block(indexValue, (*timestamp)->get<double>(), std::move(records),
              (*previousHash)->get<std::string>(), nonceValue);
  block.hash_ = (*hash)->get<std::string>();
  return block;
}

void Block::overwriteDataUnchecked(std::vector<Record> data) {
  data_ = std::move(data);
}

void Block::overwritePreviousHashUnchecked(const std::string& previousHash) {
  previousHash_ = previousHash;
}

void Block::overwriteHashUnchecked(const std::string& hash) { hash_ = hash; }

bool operator==(const Block& lhs, const Block& rhs) {
  return lhs.getIndex() == rhs.getIndex() &&
         lhs.getTimestamp() == rhs.getTimestamp() &&
         lhs.getData() == rhs.getData() &&
         lhs.getPreviousHash() == rhs.getPreviousHash() &&
         lhs.getNonce() == rhs.getNonce() && lhs.getHash() == rhs.getHash();
}

bool operator!=(const Block& lhs, const Block& rhs) { return !(lhs == rhs); }

} // namespace quub
