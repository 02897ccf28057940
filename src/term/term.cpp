// src/term/term.cpp
#include "term/term.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

#include "common/errors.hpp"

namespace wac
{

    Term::Term(std::string word, double weight)
        : word_(std::move(word)), weight_(weight)
    {
    }

    Term Term::validated(std::string word, double weight)
    {
        if (std::isnan(weight))
            throw InvalidArgumentError("NaN weight for \"" + word + "\"");
        if (weight < 0)
            throw NegativeWeightError("Negative weight " + std::to_string(weight) + " for \"" + word + "\"");
        return Term(std::move(word), weight);
    }

    int Term::PrefixOrder::compare(const Term &a, const Term &b) const
    {
        const std::string &x = a.getWord();
        const std::string &y = b.getWord();

        const size_t n = std::min(prefixLength_, std::min(x.size(), y.size()));
        for (size_t i = 0; i < n; ++i)
        {
            const unsigned char cx = static_cast<unsigned char>(x[i]);
            const unsigned char cy = static_cast<unsigned char>(y[i]);
            if (cx != cy)
                return cx < cy ? -1 : 1;
        }

        // both reach prefixLength_: equivalent
        const size_t lx = std::min(x.size(), prefixLength_);
        const size_t ly = std::min(y.size(), prefixLength_);
        if (lx == ly)
            return 0;
        return lx < ly ? -1 : 1;
    }

} // namespace wac
