#pragma once

#include "../lib/ResultOrError.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace quub {

/**
 * A block of opaque payload records bound to its predecessor by hash.
 *
 * The hash is derived from (index, timestamp, data, previousHash, nonce) and
 * is recomputed by every regular operation that changes those fields. After
 * mining, a block is treated as immutable: the only way to change a field
 * without recomputing the hash is the overwrite*Unchecked() family, which
 * exists so integrity checks can be exercised against tampered blocks.
 *
 * Payload records are JSON values. Any type with nlohmann to_json/from_json
 * hooks converts into a Record implicitly and back through getDataAs<T>().
 */
class Block {
public:
    using Record = nlohmann::json;

    struct Error : RoeErrorBase {
        using RoeErrorBase::RoeErrorBase;
    };

    template <typename T> using Roe = ResultOrError<T, Error>;

    static constexpr int32_t E_MISSING_FIELD = 1;
    static constexpr int32_t E_INVALID_FIELD = 2;
    static constexpr int32_t E_RECORD_TYPE = 3;

    Block(uint64_t index, double timestamp, std::vector<Record> data,
          std::string previousHash, uint64_t nonce = 0);

    /**
     * Digest of the five hashed fields.
     *
     * Canonical encoding: the CBOR form of a JSON object with the keys data,
     * index, nonce, previous_hash and timestamp. Object keys are sorted at
     * every level (payload records included) and string bytes are kept
     * as-is, so equal content always gives equal bytes and different bytes
     * never collapse. The bytes are hashed with SHA-256 and rendered as
     * lowercase hex.
     */
    static std::string calculateHash(uint64_t index, double timestamp,
                                     const std::vector<Record>& data,
                                     const std::string& previousHash,
                                     uint64_t nonce);

    // Digest over the block's current field values
    std::string calculateHash() const;

    static bool hasLeadingZeros(const std::string& hash, uint32_t count);
    bool meetsDifficulty(uint32_t difficulty) const;

    /**
     * Proof of work: increment the nonce from its current value until the
     * hash has `difficulty` leading '0' hex characters.
     *
     * The search has no attempt cap and no timeout; expected work is about
     * 16^difficulty hashes, and a difficulty above 64 never terminates.
     */
    void mineBlock(uint32_t difficulty);

    uint64_t getIndex() const { return index_; }
    double getTimestamp() const { return timestamp_; }
    const std::vector<Record>& getData() const { return data_; }
    const std::string& getPreviousHash() const { return previousHash_; }
    uint64_t getNonce() const { return nonce_; }
    const std::string& getHash() const { return hash_; }

    /**
     * Convert every payload record through T's from_json.
     * @return Converted records, or E_RECORD_TYPE naming the first record
     * that does not fit
     */
    template <typename T> Roe<std::vector<T>> getDataAs() const {
        std::vector<T> records;
        records.reserve(data_.size());
        for (size_t i = 0; i < data_.size(); ++i) {
            try {
                records.push_back(data_[i].get<T>());
            } catch (const nlohmann::json::exception& e) {
                return Error(E_RECORD_TYPE, "Record " + std::to_string(i) +
                                                " of block " + std::to_string(index_) +
                                                ": " + e.what());
            }
        }
        return records;
    }

    /**
     * Structural form: {index, timestamp, data, previous_hash, nonce, hash}
     */
    nlohmann::json toJson() const;

    /**
     * Rebuild a block from its structural form.
     *
     * The stored hash is taken verbatim and not checked against the other
     * fields; a forged hash is only caught by chain validation. Fails only
     * when a field is missing or has the wrong JSON type.
     */
    static Roe<Block> fromJson(const nlohmann::json& json);

    // Field overwrites that leave the stored hash untouched (tamper tests)
    void overwriteDataUnchecked(std::vector<Record> data);
    void overwritePreviousHashUnchecked(const std::string& previousHash);
    void overwriteHashUnchecked(const std::string& hash);

private:
    uint64_t index_;
    double timestamp_;
    std::vector<Record> data_;
    std::string previousHash_;
    uint64_t nonce_;
    std::string hash_;
};

bool operator==(const Block& lhs, const Block& rhs);
bool operator!=(const Block& lhs, const Block& rhs);

} // namespace quub
