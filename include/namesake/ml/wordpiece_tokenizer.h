#pragma once

#include <namesake/core/types.h>

#include <cstdint>
#include <filesystem>
#include <string>
#include <unordered_map>
#include <vector>

namespace namesake::ml {

/**
 * BERT-style WordPiece tokenizer (uncased, ASCII punctuation split, greedy longest-match
 * sub-word lookup) used to feed sentence-transformer models.
 */
class WordPieceTokenizer {
public:
    Result<void> loadVocab(const std::filesystem::path& vocabPath);
    void loadVocab(const std::vector<std::string>& tokens);

    // Token ids wrapped in [CLS] ... [SEP], truncated to maxLength
    std::vector<int64_t> encode(const std::string& text, size_t maxLength) const;

    int64_t padId() const { return idOr(0, "[PAD]"); }
    int64_t unkId() const { return idOr(100, "[UNK]"); }
    int64_t clsId() const { return idOr(101, "[CLS]"); }
    int64_t sepId() const { return idOr(102, "[SEP]"); }

    size_t vocabSize() const { return idToToken_.size(); }

private:
    std::vector<std::string> basicTokenize(const std::string& text) const;
    std::vector<std::string> wordpiece(const std::string& token) const;
    int64_t idOr(int64_t fallback, const std::string& token) const;

    std::vector<std::string> idToToken_;
    std::unordered_map<std::string, int64_t> tokenToId_;
};

} // namespace namesake::ml
