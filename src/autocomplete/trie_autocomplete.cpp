// src/autocomplete/trie_autocomplete.cpp
#include "autocomplete/trie_autocomplete.hpp"

#include "best_first/best_first_search.hpp"

namespace wac
{

    TrieAutocomplete::TrieAutocomplete(const std::vector<Term> &terms)
    {
        validateTerms(terms);
        for (const auto &t : terms)
            trie_.insert(t.getWord(), t.getWeight());
    }

    TrieAutocomplete::TrieAutocomplete(const std::vector<std::string> &words,
                                       const std::vector<double> &weights)
        : TrieAutocomplete(termsFrom(words, weights))
    {
    }

    TrieAutocomplete::TrieAutocomplete(const char *const *words, const double *weights, size_t n)
        : TrieAutocomplete(termsFrom(words, weights, n))
    {
    }

    std::vector<Term> TrieAutocomplete::doTopTerms(std::string_view prefix, size_t k) const
    {
        return BestFirstSearch::topMatches(trie_, prefix, k);
    }

    std::string TrieAutocomplete::doTopMatch(std::string_view prefix) const
    {
        return BestFirstSearch::topMatch(trie_, prefix);
    }

    double TrieAutocomplete::doWeightOf(std::string_view word) const
    {
        return trie_.weightOf(word);
    }

} // namespace wac
