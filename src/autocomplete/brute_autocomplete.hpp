// src/autocomplete/brute_autocomplete.hpp
#pragma once

#include <string>
#include <vector>

#include "autocomplete/autocompletor.hpp"

namespace wac
{

    // Reference backend: every query scans all terms.
    class BruteAutocomplete : public Autocompletor
    {
    public:
        explicit BruteAutocomplete(const std::vector<Term> &terms);
        BruteAutocomplete(const std::vector<std::string> &words, const std::vector<double> &weights);
        BruteAutocomplete(const char *const *words, const double *weights, size_t n);

    protected:
        std::vector<Term> doTopTerms(std::string_view prefix, size_t k) const override;
        std::string doTopMatch(std::string_view prefix) const override;
        double doWeightOf(std::string_view word) const override;
        size_t doSize() const override { return terms_.size(); }

    private:
        std::vector<Term> terms_;
    };

} // namespace wac
