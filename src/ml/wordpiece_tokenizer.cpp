#include <namesake/ml/wordpiece_tokenizer.h>

#include <spdlog/spdlog.h>

#include <cctype>
#include <fstream>

namespace namesake::ml {

namespace {

bool isWhitespace(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

bool isPunctuation(unsigned char c) {
    return (c >= 33 && c <= 47) || (c >= 58 && c <= 64) || (c >= 91 && c <= 96) ||
           (c >= 123 && c <= 126);
}

} // namespace

Result<void> WordPieceTokenizer::loadVocab(const std::filesystem::path& vocabPath) {
    std::ifstream in(vocabPath);
    if (!in) {
        return Error{ErrorCode::FileNotFound, "Cannot open vocabulary: " + vocabPath.string()};
    }

    std::vector<std::string> tokens;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        tokens.push_back(std::move(line));
    }
    if (tokens.empty()) {
        return Error{ErrorCode::InvalidData, "Vocabulary is empty: " + vocabPath.string()};
    }
    loadVocab(tokens);
    spdlog::debug("[WordPiece] Loaded {} tokens from {}", idToToken_.size(), vocabPath.string());
    return Result<void>();
}

void WordPieceTokenizer::loadVocab(const std::vector<std::string>& tokens) {
    idToToken_ = tokens;
    tokenToId_.clear();
    for (size_t i = 0; i < idToToken_.size(); ++i) {
        tokenToId_.emplace(idToToken_[i], static_cast<int64_t>(i));
    }
}

int64_t WordPieceTokenizer::idOr(int64_t fallback, const std::string& token) const {
    auto it = tokenToId_.find(token);
    return it == tokenToId_.end() ? fallback : it->second;
}

std::vector<std::string> WordPieceTokenizer::basicTokenize(const std::string& text) const {
    std::vector<std::string> out;
    std::string current;
    auto flush = [&]() {
        if (!current.empty()) {
            out.push_back(std::move(current));
            current.clear();
        }
    };

    for (unsigned char c : text) {
        if (isWhitespace(c)) {
            flush();
        } else if (isPunctuation(c)) {
            flush();
            out.emplace_back(1, static_cast<char>(c));
        } else {
            current.push_back(static_cast<char>(std::tolower(c)));
        }
    }
    flush();
    return out;
}

std::vector<std::string> WordPieceTokenizer::wordpiece(const std::string& token) const {
    std::vector<std::string> pieces;
    size_t start = 0;
    while (start < token.size()) {
        size_t end = token.size();
        std::string best;
        while (end > start) {
            std::string sub = token.substr(start, end - start);
            if (start > 0) {
                sub = "##" + sub;
            }
            if (tokenToId_.count(sub) != 0) {
                best = std::move(sub);
                break;
            }
            --end;
        }
        if (best.empty()) {
            return {"[UNK]"};
        }
        pieces.push_back(std::move(best));
        start = end;
    }
    return pieces;
}

std::vector<int64_t> WordPieceTokenizer::encode(const std::string& text, size_t maxLength) const {
    const int64_t unk = unkId();
    std::vector<int64_t> ids;
    ids.reserve(maxLength);
    ids.push_back(clsId());

    for (const auto& word : basicTokenize(text)) {
        for (const auto& piece : wordpiece(word)) {
            if (ids.size() + 1 >= maxLength) {
                break;
            }
            ids.push_back(idOr(unk, piece));
        }
        if (ids.size() + 1 >= maxLength) {
            break;
        }
    }

    ids.push_back(sepId());
    return ids;
}

} // namespace namesake::ml
