// src/autocomplete/binary_search_autocomplete.cpp
#include "autocomplete/binary_search_autocomplete.hpp"

#include <algorithm>
#include <queue>

namespace wac
{

    BinarySearchAutocomplete::BinarySearchAutocomplete(const std::vector<Term> &terms)
        : terms_(terms)
    {
        validateTerms(terms_);
        std::sort(terms_.begin(), terms_.end());
    }

    BinarySearchAutocomplete::BinarySearchAutocomplete(const std::vector<std::string> &words,
                                                       const std::vector<double> &weights)
        : BinarySearchAutocomplete(termsFrom(words, weights))
    {
    }

    BinarySearchAutocomplete::BinarySearchAutocomplete(const char *const *words,
                                                       const double *weights,
                                                       size_t n)
        : BinarySearchAutocomplete(termsFrom(words, weights, n))
    {
    }

    std::ptrdiff_t BinarySearchAutocomplete::firstIndexOf(const std::vector<Term> &a,
                                                          const Term &key,
                                                          const Term::PrefixOrder &cmp)
    {
        // a[low] < key <= a[high], with virtual sentinels at -1 and n
        std::ptrdiff_t low = -1;
        std::ptrdiff_t high = static_cast<std::ptrdiff_t>(a.size());
        while (high - low > 1)
        {
            const std::ptrdiff_t mid = low + (high - low) / 2;
            if (cmp.compare(a[static_cast<size_t>(mid)], key) < 0)
                low = mid;
            else
                high = mid;
        }
        if (high >= static_cast<std::ptrdiff_t>(a.size()) || cmp.compare(a[static_cast<size_t>(high)], key) != 0)
            return -1;
        return high;
    }

    std::ptrdiff_t BinarySearchAutocomplete::lastIndexOf(const std::vector<Term> &a,
                                                         const Term &key,
                                                         const Term::PrefixOrder &cmp)
    {
        // a[low] <= key < a[high]
        std::ptrdiff_t low = -1;
        std::ptrdiff_t high = static_cast<std::ptrdiff_t>(a.size());
        while (high - low > 1)
        {
            const std::ptrdiff_t mid = low + (high - low) / 2;
            if (cmp.compare(a[static_cast<size_t>(mid)], key) <= 0)
                low = mid;
            else
                high = mid;
        }
        if (low < 0 || cmp.compare(a[static_cast<size_t>(low)], key) != 0)
            return -1;
        return low;
    }

    std::pair<std::ptrdiff_t, std::ptrdiff_t> BinarySearchAutocomplete::prefixRange(std::string_view prefix) const
    {
        const Term key(std::string(prefix), 0.0);
        const Term::PrefixOrder cmp(prefix.size());

        const std::ptrdiff_t first = firstIndexOf(terms_, key, cmp);
        if (first < 0)
            return {-1, -1};
        return {first, lastIndexOf(terms_, key, cmp)};
    }

    std::vector<Term> BinarySearchAutocomplete::doTopTerms(std::string_view prefix, size_t k) const
    {
        const auto [first, last] = prefixRange(prefix);
        if (first < 0)
            return {};

        // worst of the current top-k on top
        std::priority_queue<Term, std::vector<Term>, Term::RankOrder> pq;
        for (std::ptrdiff_t i = first; i <= last; ++i)
        {
            pq.push(terms_[static_cast<size_t>(i)]);
            if (pq.size() > k)
                pq.pop();
        }

        std::vector<Term> out;
        out.reserve(pq.size());
        while (!pq.empty())
        {
            out.push_back(pq.top());
            pq.pop();
        }
        std::reverse(out.begin(), out.end());
        return out;
    }

    std::string BinarySearchAutocomplete::doTopMatch(std::string_view prefix) const
    {
        const auto [first, last] = prefixRange(prefix);
        if (first < 0)
            return "";

        const Term::RankOrder better;
        size_t best = static_cast<size_t>(first);
        for (std::ptrdiff_t i = first + 1; i <= last; ++i)
        {
            if (better(terms_[static_cast<size_t>(i)], terms_[best]))
                best = static_cast<size_t>(i);
        }
        return terms_[best].getWord();
    }

    double BinarySearchAutocomplete::doWeightOf(std::string_view word) const
    {
        // exact match only; a prefix run would also hold longer words
        auto it = std::lower_bound(terms_.begin(), terms_.end(), word,
                                   [](const Term &t, std::string_view w)
                                   { return std::string_view(t.getWord()) < w; });
        if (it == terms_.end() || it->getWord() != word)
            return 0.0;
        return it->getWeight();
    }

} // namespace wac
