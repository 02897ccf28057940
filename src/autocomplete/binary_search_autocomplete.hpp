// src/autocomplete/binary_search_autocomplete.hpp
#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "autocomplete/autocompletor.hpp"

namespace wac
{

    // Sorted-array backend. Terms are kept in natural (word) order; the
    // words matching a prefix form one contiguous run located by two
    // boundary searches under Term::PrefixOrder.
    class BinarySearchAutocomplete : public Autocompletor
    {
    public:
        explicit BinarySearchAutocomplete(const std::vector<Term> &terms);
        BinarySearchAutocomplete(const std::vector<std::string> &words, const std::vector<double> &weights);
        BinarySearchAutocomplete(const char *const *words, const double *weights, size_t n);

        // First / last index i with cmp.compare(a[i], key) == 0, or -1.
        // Each uses at most 1 + ceil(log2(n + 1)) comparisons.
        static std::ptrdiff_t firstIndexOf(const std::vector<Term> &a, const Term &key, const Term::PrefixOrder &cmp);
        static std::ptrdiff_t lastIndexOf(const std::vector<Term> &a, const Term &key, const Term::PrefixOrder &cmp);

        const std::vector<Term> &terms() const { return terms_; }

    protected:
        std::vector<Term> doTopTerms(std::string_view prefix, size_t k) const override;
        std::string doTopMatch(std::string_view prefix) const override;
        double doWeightOf(std::string_view word) const override;
        size_t doSize() const override { return terms_.size(); }

    private:
        // [first, last] of the run matching prefix; first == -1 when empty
        std::pair<std::ptrdiff_t, std::ptrdiff_t> prefixRange(std::string_view prefix) const;

        std::vector<Term> terms_;
    };

} // namespace wac
