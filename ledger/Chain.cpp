#include "Chain.h"
#include "../lib/Utilities.h"

#include <stdexcept>
#include <utility>

namespace quub {

Chain::Chain(uint32_t difficulty)
    : Module("chain"),
      difficulty_(difficulty) {
    createGenesisBlock();
}

void Chain::createGenesisBlock() {
    Block::Record message = {{"message", GENESIS_MESSAGE}};
    Block genesis(0, utl::getCurrentTime(), std::vector<Block::Record>{message},
                  GENESIS_PREVIOUS_HASH);
    genesis.mineBlock(difficulty_);
    blocks_.push_back(std::move(genesis));

    log().debug << "Genesis block mined with difficulty " << difficulty_
                << ", nonce " << blocks_.back().getNonce()
                << ", hash " << blocks_.back().getHash();
}

void Chain::addPending(Block::Record record) {
    pending_.push_back(std::move(record));
}

Chain::Roe<Block> Chain::minePending() {
    if (pending_.empty()) {
        return Error(E_EMPTY_INPUT, "No transactions to mine");
    }

    const Block& latest = getLatestBlock();
    Block block(blocks_.size(), utl::getCurrentTime(), pending_, latest.getHash());

    log().debug << "Mining block " << block.getIndex() << " with "
                << pending_.size() << " records at difficulty " << difficulty_;
    block.mineBlock(difficulty_);

    blocks_.push_back(block);
    pending_.clear();

    log().info << "Mined block " << block.getIndex() << " (nonce "
               << block.getNonce() << "): " << block.getHash();
    return block;
}

bool Chain::isValid() const {
    // Start from index 1 (genesis has no predecessor)
    for (size_t i = 1; i < blocks_.size(); i++) {
        const Block& currentBlock = blocks_[i];
        const Block& previousBlock = blocks_[i - 1];

        if (currentBlock.getHash() != currentBlock.calculateHash()) {
            log().warning << "Block " << i << " hash does not match its content";
            return false;
        }

        if (currentBlock.getPreviousHash() != previousBlock.getHash()) {
            log().warning << "Block " << i << " is not linked to block " << (i - 1);
            return false;
        }

        if (!currentBlock.meetsDifficulty(difficulty_)) {
            log().warning << "Block " << i << " does not meet difficulty " << difficulty_;
            return false;
        }
    }

    return true;
}

const Block& Chain::getLatestBlock() const {
    if (blocks_.empty()) {
        throw std::runtime_error("Chain is empty");
    }
    return blocks_.back();
}

size_t Chain::getSize() const {
    return blocks_.size();
}

const Block* Chain::getBlock(int64_t index) const {
    if (index < 0 || static_cast<uint64_t>(index) >= blocks_.size()) {
        return nullptr;
    }
    return &blocks_[static_cast<size_t>(index)];
}

nlohmann::json Chain::toJson() const {
    nlohmann::json blocks = nlohmann::json::array();
    for (const auto& block : blocks_) {
        blocks.push_back(block.toJson());
    }

    nlohmann::json json;
    json["chain"] = std::move(blocks);
    json["difficulty"] = difficulty_;
    json["chain_length"] = blocks_.size();
    return json;
}

Block& Chain::getBlockUnchecked(size_t index) {
    if (index >= blocks_.size()) {
        throw std::out_of_range("Block index out of range: " + std::to_string(index));
    }
    return blocks_[index];
}

} // namespace quub
