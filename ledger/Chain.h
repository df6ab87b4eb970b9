#pragma once

#include "Block.h"
#include "../lib/Module.h"
#include "../lib/ResultOrError.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace quub {

/**
 * Append-only sequence of mined blocks with a buffer of pending records.
 *
 * The genesis block is mined in the constructor, so a Chain is never empty.
 * minePending() is the only operation that appends; isValid() re-checks
 * every block on each call and never caches its result.
 *
 * Single writer. Mining blocks the calling thread until the proof of work is
 * found.
 */
class Chain : public Module {
public:
    struct Error : RoeErrorBase {
        using RoeErrorBase::RoeErrorBase;
    };

    template <typename T> using Roe = ResultOrError<T, Error>;

    static constexpr int32_t E_EMPTY_INPUT = 1;

    static constexpr uint32_t DEFAULT_DIFFICULTY = 2;
    static constexpr const char* GENESIS_PREVIOUS_HASH = "0";
    static constexpr const char* GENESIS_MESSAGE = "Genesis Block";

    explicit Chain(uint32_t difficulty = DEFAULT_DIFFICULTY);
    ~Chain() override = default;

    // Queue a record for the next block; records are not inspected
    void addPending(Block::Record record);

    /**
     * Mine all pending records into a new block and append it.
     *
     * The block gets index getSize(), the current time, a copy of the pending
     * records and the latest block's hash as its previous hash. Pending is
     * cleared once the block is appended.
     *
     * @return Copy of the appended block, or E_EMPTY_INPUT when nothing is
     * pending (chain and pending are left unchanged)
     */
    Roe<Block> minePending();

    /**
     * Check every block after genesis against its predecessor: the stored
     * hash must match a recomputation, previous_hash must equal the
     * predecessor's hash, and the hash must meet the difficulty.
     * Stops at the first failure, which is logged as a warning.
     */
    bool isValid() const;

    const Block& getLatestBlock() const;
    size_t getSize() const;

    // nullptr when index is outside [0, getSize())
    const Block* getBlock(int64_t index) const;

    const std::vector<Block>& getBlocks() const { return blocks_; }
    const std::vector<Block::Record>& getPending() const { return pending_; }
    uint32_t getDifficulty() const { return difficulty_; }

    /**
     * Structural form: {chain: [...blocks], difficulty, chain_length}
     */
    nlohmann::json toJson() const;

    /**
     * Mutable access to a stored block, bypassing the append-only contract.
     * For tamper scenarios in tests only.
     * @throws std::out_of_range on a bad index
     */
    Block& getBlockUnchecked(size_t index);

private:
    void createGenesisBlock();

    std::vector<Block> blocks_;
    std::vector<Block::Record> pending_;
    uint32_t difficulty_;
};

} // namespace quub
