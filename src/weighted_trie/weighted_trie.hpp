// src/weighted_trie/weighted_trie.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace wac
{

    // Orders edge labels as unsigned bytes, matching std::string comparison.
    struct ByteLess
    {
        bool operator()(char a, char b) const
        {
            return static_cast<unsigned char>(a) < static_cast<unsigned char>(b);
        }
    };

    // One arena slot. Children and parent are node ids into the owning
    // WeightedTrie; the parent link is never used for ownership.
    struct TrieNode
    {
        char c{'\0'};
        int32_t parent{-1};
        bool isWord{false};
        double weight{0.0};           // meaningful iff isWord
        double subtreeMaxWeight{0.0}; // max weight of any word at or below this node
        std::string word;             // set iff isWord

        std::map<char, int32_t, ByteLess> children;

        int32_t getChild(char ch) const
        {
            auto it = children.find(ch);
            return (it == children.end()) ? -1 : it->second;
        }
    };

    // Prefix tree whose nodes cache the best word weight in their subtree.
    //
    // Nodes are stored in a single vector; node 0 is the synthetic root and is
    // never a word. Ids stay valid until clear().
    //
    // Re-inserting a word with a lower weight leaves the old (higher) bound
    // cached on its ancestors. Bounds remain upper bounds, so searches stay
    // correct but prune less.
    class WeightedTrie
    {
    public:
        static constexpr int32_t kNoNode = -1;
        static constexpr int32_t kRoot = 0;

        WeightedTrie();

        // Throws InvalidArgumentError on an empty word, NegativeWeightError on
        // weight < 0 (NaN is rejected too).
        void insert(std::string_view word, double weight);

        // Node reached by walking prefix from the root, or kNoNode.
        int32_t descend(std::string_view prefix) const;

        // Terminal node for exactly this word, or kNoNode.
        int32_t find(std::string_view word) const;

        // 0.0 when the word is absent.
        double weightOf(std::string_view word) const;

        const TrieNode &node(int32_t id) const;
        const TrieNode &getRoot() const { return nodes_[kRoot]; }

        // Characters on the path root -> id, rebuilt from parent links.
        std::string pathOf(int32_t id) const;

        size_t size() const { return words_; }
        size_t nodeCount() const { return nodes_.size(); }
        bool empty() const { return words_ == 0; }
        void clear();

    private:
        int32_t addChild(int32_t parent, char ch, double weight);

        std::vector<TrieNode> nodes_;
        size_t words_;
    };

} // namespace wac
