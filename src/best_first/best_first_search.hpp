// src/best_first/best_first_search.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "term/term.hpp"
#include "weighted_trie/weighted_trie.hpp"

namespace wac
{

    struct SearchStats
    {
        size_t expanded = 0; // nodes popped from the frontier
        size_t pushed = 0;   // nodes pushed onto the frontier
        bool pruned = false; // stopped before the frontier ran dry
    };

    class BestFirstSearch
    {
    public:
        // Up to k terms below prefix, weight descending. Equal weights keep the
        // order the search reached them in. Empty when k == 0 or prefix is absent.
        static std::vector<Term> topMatches(const WeightedTrie &trie,
                                            std::string_view prefix,
                                            size_t k,
                                            SearchStats *stats = nullptr);

        // Best word below prefix, or "" when there is none. Always the word
        // topMatches(trie, prefix, 1) returns.
        static std::string topMatch(const WeightedTrie &trie, std::string_view prefix);

    private:
        static int32_t descendToBest(const WeightedTrie &trie, int32_t start);
    };

} // namespace wac
