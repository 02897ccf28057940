// src/autocomplete/trie_autocomplete.hpp
#pragma once

#include <string>
#include <vector>

#include "autocomplete/autocompletor.hpp"
#include "weighted_trie/weighted_trie.hpp"

namespace wac
{

    // Trie backend: prefix descent plus best-first search with subtree bounds.
    class TrieAutocomplete : public Autocompletor
    {
    public:
        explicit TrieAutocomplete(const std::vector<Term> &terms);
        TrieAutocomplete(const std::vector<std::string> &words, const std::vector<double> &weights);
        TrieAutocomplete(const char *const *words, const double *weights, size_t n);

        const WeightedTrie &trie() const { return trie_; }

    protected:
        std::vector<Term> doTopTerms(std::string_view prefix, size_t k) const override;
        std::string doTopMatch(std::string_view prefix) const override;
        double doWeightOf(std::string_view word) const override;
        size_t doSize() const override { return trie_.size(); }

    private:
        WeightedTrie trie_;
    };

} // namespace wac
