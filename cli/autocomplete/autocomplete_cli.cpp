// cli/autocomplete/autocomplete_cli.cpp
//
// Top-k prefix completion over a weighted dictionary file.
//
// Examples:
//   ./autocomplete_cli --dict data/words.txt --q bel --k 5
//   ./autocomplete_cli --dict data/words.txt --q "" --k 10 --weights
//   printf 'b\n\nca\n' | ./autocomplete_cli --dict data/words.txt --stdin --backend sorted
//   ./autocomplete_cli --dict data/words.txt --stdin --check brute
//

#include <cstddef>
#include <iostream>
#include <stdexcept>
#include <string>

#include "autocomplete/query_engine.hpp"
#include "dictionary/dictionary_reader.hpp"

static void usage(const char *argv0)
{
    std::cout
        << "Usage:\n"
        << "  " << argv0 << " --dict <file> --q <prefix> [--k N] [--backend trie|sorted|brute] [--weights] [--check <backend>]\n"
        << "  " << argv0 << " --dict <file> --stdin [--k N] [--backend trie|sorted|brute] [--weights] [--check <backend>]\n"
        << "\n"
        << "With --stdin each input line is one prefix; a blank line queries the empty prefix.\n";
}

static void run_one(const wac::QueryEngine &engine, const std::string &prefix, size_t k, bool show_weights)
{
    const auto terms = engine.topMatchesWithWeights(prefix, k);
    std::cout << "query=\"" << prefix << "\" hits=" << terms.size()
              << " best=\"" << engine.topMatch(prefix) << "\"\n";

    for (const auto &t : terms)
    {
        std::cout << "  - " << t.getWord();
        if (show_weights)
            std::cout << "\tweight=" << t.getWeight();
        std::cout << "\n";
    }

    if (engine.hasReference() && !engine.crossCheck(prefix, k))
        std::cerr << "[WARN] backends disagree for prefix \"" << prefix << "\"\n";
}

int main(int argc, char **argv)
{
    try
    {
        std::string dict_path;
        std::string q;
        bool have_q = false;
        bool stdin_mode = false;
        bool show_weights = false;
        size_t k = 10;
        wac::Backend backend = wac::Backend::Trie;
        std::string check;

        for (int i = 1; i < argc; ++i)
        {
            const std::string a = argv[i];
            if (a == "--help" || a == "-h")
            {
                usage(argv[0]);
                return 0;
            }
            if (a == "--dict" && i + 1 < argc)
            {
                dict_path = argv[++i];
                continue;
            }
            if (a == "--q" && i + 1 < argc)
            {
                q = argv[++i];
                have_q = true;
                continue;
            }
            if (a == "--k" && i + 1 < argc)
            {
                const int v = std::stoi(argv[++i]);
                if (v < 0)
                    throw std::runtime_error("--k must be >= 0");
                k = static_cast<size_t>(v);
                continue;
            }
            if (a == "--backend" && i + 1 < argc)
            {
                backend = wac::backendFromName(argv[++i]);
                continue;
            }
            if (a == "--check" && i + 1 < argc)
            {
                check = argv[++i];
                continue;
            }
            if (a == "--stdin")
            {
                stdin_mode = true;
                continue;
            }
            if (a == "--weights")
            {
                show_weights = true;
                continue;
            }
            throw std::runtime_error("Unknown/incomplete arg: " + a);
        }

        if (dict_path.empty() || (!stdin_mode && !have_q))
        {
            usage(argv[0]);
            return 2;
        }

        const auto terms = wac::DictionaryReader::readFile(dict_path);
        const wac::QueryEngine engine = check.empty()
                                            ? wac::QueryEngine(terms, backend)
                                            : wac::QueryEngine(terms, backend, wac::backendFromName(check));

        std::cout << "Loaded " << engine.size() << " terms from " << dict_path
                  << " (backend=" << wac::backendName(backend) << ")\n";

        if (!stdin_mode)
        {
            run_one(engine, q, k, show_weights);
            return 0;
        }

        std::string line;
        while (std::getline(std::cin, line))
        {
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            run_one(engine, line, k, show_weights);
        }
        return 0;
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
