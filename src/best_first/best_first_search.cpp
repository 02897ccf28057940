// src/best_first/best_first_search.cpp
#include "best_first/best_first_search.hpp"

#include <algorithm>
#include <queue>
#include <string>

namespace wac
{

    namespace
    {
        struct FrontierEntry
        {
            double bound; // subtreeMaxWeight of node
            uint32_t depth;
            unsigned char c;
            int32_t node;
        };

        // priority: larger bound, then deeper, then smaller byte, then smaller id.
        // Equal bounds are thus explored depth first in byte order, which is the
        // path topMatch descends.
        struct FrontierLess
        {
            bool operator()(const FrontierEntry &a, const FrontierEntry &b) const
            {
                if (a.bound != b.bound)
                    return a.bound < b.bound;
                if (a.depth != b.depth)
                    return a.depth < b.depth;
                if (a.c != b.c)
                    return a.c > b.c;
                return a.node > b.node;
            }
        };

        using Frontier = std::priority_queue<FrontierEntry, std::vector<FrontierEntry>, FrontierLess>;

        struct Candidate
        {
            Term term;
            size_t seq; // discovery order
        };

        // worst on top: lower weight, or on a tie the later discovery
        struct CandidateLess
        {
            bool operator()(const Candidate &a, const Candidate &b) const
            {
                if (a.term.getWeight() != b.term.getWeight())
                    return a.term.getWeight() > b.term.getWeight();
                return a.seq < b.seq;
            }
        };

        using Candidates = std::priority_queue<Candidate, std::vector<Candidate>, CandidateLess>;
    } // namespace

    std::vector<Term> BestFirstSearch::topMatches(const WeightedTrie &trie,
                                                  std::string_view prefix,
                                                  size_t k,
                                                  SearchStats *stats)
    {
        SearchStats local;
        SearchStats &st = stats ? *stats : local;
        st = SearchStats{};

        if (k == 0)
            return {};

        const int32_t start = trie.descend(prefix);
        if (start == WeightedTrie::kNoNode)
            return {};

        Frontier frontier;
        frontier.push(FrontierEntry{trie.node(start).subtreeMaxWeight, 0, 0, start});
        ++st.pushed;

        Candidates candidates;
        size_t seq = 0;

        while (!frontier.empty())
        {
            // Stop once no frontier bound can beat the k-th candidate.
            if (candidates.size() == k && frontier.top().bound <= candidates.top().term.getWeight())
            {
                st.pruned = true;
                break;
            }

            const FrontierEntry top = frontier.top();
            frontier.pop();
            const int32_t id = top.node;
            ++st.expanded;

            const TrieNode &n = trie.node(id);
            if (n.isWord)
            {
                // a tie with a full heap never displaces an earlier find
                if (candidates.size() < k || n.weight > candidates.top().term.getWeight())
                {
                    candidates.push(Candidate{Term(n.word, n.weight), seq++});
                    if (candidates.size() > k)
                        candidates.pop();
                }
            }

            for (const auto &kv : n.children)
            {
                frontier.push(FrontierEntry{trie.node(kv.second).subtreeMaxWeight, top.depth + 1,
                                            static_cast<unsigned char>(kv.first), kv.second});
                ++st.pushed;
            }
        }

        std::vector<Term> out;
        out.reserve(candidates.size());
        while (!candidates.empty())
        {
            out.push_back(candidates.top().term);
            candidates.pop();
        }
        std::reverse(out.begin(), out.end());
        return out;
    }

    // Follows the first child carrying the node's bound until a word of that
    // weight is reached. Returns kNoNode if a stale bound leads nowhere.
    int32_t BestFirstSearch::descendToBest(const WeightedTrie &trie, int32_t start)
    {
        int32_t cur = start;
        while (true)
        {
            const TrieNode &n = trie.node(cur);
            const double bound = n.subtreeMaxWeight;
            if (n.isWord && n.weight == bound)
                return cur;

            int32_t next = WeightedTrie::kNoNode;
            for (const auto &kv : n.children)
            {
                if (trie.node(kv.second).subtreeMaxWeight == bound)
                {
                    next = kv.second;
                    break;
                }
            }
            if (next == WeightedTrie::kNoNode)
                return WeightedTrie::kNoNode;
            cur = next;
        }
    }

    std::string BestFirstSearch::topMatch(const WeightedTrie &trie, std::string_view prefix)
    {
        const int32_t start = trie.descend(prefix);
        if (start == WeightedTrie::kNoNode)
            return "";

        const int32_t best = descendToBest(trie, start);
        if (best != WeightedTrie::kNoNode)
            return trie.node(best).word;

        // stale bound (a weight was lowered) or no word below start
        const auto one = topMatches(trie, prefix, 1);
        return one.empty() ? std::string() : one.front().getWord();
    }

} // namespace wac
