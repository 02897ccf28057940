// src/weighted_trie/weighted_trie.cpp
#include "weighted_trie/weighted_trie.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

#include "common/errors.hpp"

namespace wac
{

    WeightedTrie::WeightedTrie() : nodes_(1), words_(0) {}

    int32_t WeightedTrie::addChild(int32_t parent, char ch, double weight)
    {
        const int32_t id = static_cast<int32_t>(nodes_.size());

        TrieNode node;
        node.c = ch;
        node.parent = parent;
        node.subtreeMaxWeight = weight;
        nodes_.push_back(std::move(node));

        // push_back may have moved the parent; index again
        nodes_[static_cast<size_t>(parent)].children.emplace(ch, id);
        return id;
    }

    void WeightedTrie::insert(std::string_view word, double weight)
    {
        if (word.empty())
            throw InvalidArgumentError("empty word cannot be inserted");
        if (std::isnan(weight))
            throw InvalidArgumentError("NaN weight for \"" + std::string(word) + "\"");
        if (weight < 0)
            throw NegativeWeightError("Negative weight " + std::to_string(weight));

        int32_t cur = kRoot;
        for (char ch : word)
        {
            TrieNode &n = nodes_[static_cast<size_t>(cur)];
            n.subtreeMaxWeight = std::max(n.subtreeMaxWeight, weight);

            const int32_t nxt = n.getChild(ch);
            cur = (nxt != kNoNode) ? nxt : addChild(cur, ch, weight);
        }

        TrieNode &last = nodes_[static_cast<size_t>(cur)];
        last.subtreeMaxWeight = std::max(last.subtreeMaxWeight, weight);
        if (!last.isWord)
        {
            last.isWord = true;
            last.word = std::string(word);
            ++words_;
        }
        last.weight = weight;
    }

    int32_t WeightedTrie::descend(std::string_view prefix) const
    {
        int32_t cur = kRoot;
        for (char ch : prefix)
        {
            cur = nodes_[static_cast<size_t>(cur)].getChild(ch);
            if (cur == kNoNode)
                return kNoNode;
        }
        return cur;
    }

    int32_t WeightedTrie::find(std::string_view word) const
    {
        const int32_t id = descend(word);
        if (id == kNoNode || !nodes_[static_cast<size_t>(id)].isWord)
            return kNoNode;
        return id;
    }

    double WeightedTrie::weightOf(std::string_view word) const
    {
        const int32_t id = find(word);
        return (id == kNoNode) ? 0.0 : nodes_[static_cast<size_t>(id)].weight;
    }

    const TrieNode &WeightedTrie::node(int32_t id) const
    {
        if (id < 0 || static_cast<size_t>(id) >= nodes_.size())
            throw std::out_of_range("WeightedTrie: bad node id " + std::to_string(id));
        return nodes_[static_cast<size_t>(id)];
    }

    std::string WeightedTrie::pathOf(int32_t id) const
    {
        std::string out;
        for (int32_t cur = id; cur > kRoot; cur = node(cur).parent)
            out.push_back(nodes_[static_cast<size_t>(cur)].c);
        std::reverse(out.begin(), out.end());
        return out;
    }

    void WeightedTrie::clear()
    {
        nodes_.clear();
        nodes_.emplace_back();
        words_ = 0;
    }

} // namespace wac
