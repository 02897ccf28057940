// src/autocomplete/brute_autocomplete.cpp
#include "autocomplete/brute_autocomplete.hpp"

#include <algorithm>
#include <cstddef>

namespace wac
{

    static bool starts_with(const std::string &word, std::string_view prefix)
    {
        return word.size() >= prefix.size() && word.compare(0, prefix.size(), prefix) == 0;
    }

    BruteAutocomplete::BruteAutocomplete(const std::vector<Term> &terms)
        : terms_(terms)
    {
        validateTerms(terms_);
    }

    BruteAutocomplete::BruteAutocomplete(const std::vector<std::string> &words,
                                         const std::vector<double> &weights)
        : BruteAutocomplete(termsFrom(words, weights))
    {
    }

    BruteAutocomplete::BruteAutocomplete(const char *const *words, const double *weights, size_t n)
        : BruteAutocomplete(termsFrom(words, weights, n))
    {
    }

    std::vector<Term> BruteAutocomplete::doTopTerms(std::string_view prefix, size_t k) const
    {
        std::vector<Term> matches;
        for (const auto &t : terms_)
        {
            if (starts_with(t.getWord(), prefix))
                matches.push_back(t);
        }

        const size_t n = std::min(k, matches.size());
        std::partial_sort(matches.begin(), matches.begin() + static_cast<std::ptrdiff_t>(n),
                          matches.end(), Term::RankOrder{});
        matches.resize(n);
        return matches;
    }

    std::string BruteAutocomplete::doTopMatch(std::string_view prefix) const
    {
        const Term::RankOrder better;
        const Term *best = nullptr;
        for (const auto &t : terms_)
        {
            if (starts_with(t.getWord(), prefix) && (best == nullptr || better(t, *best)))
                best = &t;
        }
        return best ? best->getWord() : std::string();
    }

    double BruteAutocomplete::doWeightOf(std::string_view word) const
    {
        for (const auto &t : terms_)
        {
            if (t.getWord() == word)
                return t.getWeight();
        }
        return 0.0;
    }

} // namespace wac
