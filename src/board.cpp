#include "board.hpp"
#include <algorithm>
#include <cctype>
#include <vector>

namespace fenrom {

std::string expandBoard(std::string_view compact)
{
    std::string expanded;
    expanded.reserve(BOARD_SQUARES);

    for (char c : compact) {
        if (c >= '1' && c <= '8') {
            expanded.append(static_cast<size_t>(c - '0'), EMPTY_SQUARE);
        } else if (c == RANK_SEPARATOR) {
            continue;
        } else {
            expanded.push_back(c);
        }
    }

    if (expanded.size() > BOARD_SQUARES)
        expanded.resize(BOARD_SQUARES);
    return expanded;
}

std::string compressBoard(std::string_view expanded)
{
    std::string compressed;
    compressed.reserve(expanded.size() + BOARD_FILES);
    size_t run = 0;

    auto flushRun = [&]() {
        if (run > 0) {
            compressed += std::to_string(run);
            run = 0;
        }
    };

    for (size_t i = 0; i < expanded.size(); ++i) {
        // Separators go in before the run collapse, so a run never spans them
        if (i != 0 && i % BOARD_FILES == 0) {
            flushRun();
            compressed.push_back(RANK_SEPARATOR);
        }

        if (expanded[i] == EMPTY_SQUARE) {
            ++run;
        } else {
            flushRun();
            compressed.push_back(expanded[i]);
        }
    }
    flushRun();

    return compressed;
}

std::string mirrorBoard(std::string_view compact)
{
    std::vector<std::string> ranks;
    size_t start = 0;
    while (true) {
        size_t end = compact.find(RANK_SEPARATOR, start);
        std::string_view rank = compact.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start);
        ranks.emplace_back(rank.rbegin(), rank.rend());
        if (end == std::string_view::npos) break;
        start = end + 1;
    }
    std::reverse(ranks.begin(), ranks.end());

    std::string mirrored;
    mirrored.reserve(compact.size());
    for (size_t i = 0; i < ranks.size(); ++i) {
        if (i > 0) mirrored.push_back(RANK_SEPARATOR);
        mirrored += ranks[i];
    }
    return mirrored;
}

std::string boardField(std::string_view fen)
{
    size_t begin = 0;
    while (begin < fen.size() && std::isspace(static_cast<unsigned char>(fen[begin]))) ++begin;
    size_t end = begin;
    while (end < fen.size() && !std::isspace(static_cast<unsigned char>(fen[end]))) ++end;
    return std::string(fen.substr(begin, end - begin));
}

} // namespace fenrom
