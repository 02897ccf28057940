// cli/dictionary/dictionary_fetch.cpp
//
// Downloads a weighted word list (see dictionary/dictionary_reader.hpp for
// the format), validates it by loading it into a trie engine, and prints
// entry count, file size, weight range and the heaviest entries.
//
// Run:
//   ./dictionary_fetch --url https://example.org/words.txt --out data/words.txt
//   ./dictionary_fetch --url <url> --out data/words.txt --force --samples 20
//   ./dictionary_fetch --url file:///tmp/words.txt --out data/words.txt
//

#include <curl/curl.h>

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>

#include "autocomplete/query_engine.hpp"
#include "dictionary/dictionary_reader.hpp"

// Transfer state shared with the libcurl write callback.
struct Sink
{
    std::ofstream out;
    std::uintmax_t received = 0;
};

struct FetchResult
{
    bool downloaded = false;
    std::uintmax_t bytes = 0;
};

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

// Fetches url into out_path unless a non-empty copy is already there and
// force is off. The body lands in "<out>.part" and is renamed into place
// only after a successful transfer.
static FetchResult fetch_dictionary(const std::string &url, const std::filesystem::path &out_path, bool force)
{
    namespace fs = std::filesystem;

    std::error_code ec;
    const auto existing = fs::file_size(out_path, ec);
    if (!force && !ec && existing > 0)
        return FetchResult{false, existing};

    if (out_path.has_parent_path())
        fs::create_directories(out_path.parent_path());

    fs::path part = out_path;
    part += ".part";

    Sink sink;
    sink.out.open(part, std::ios::binary | std::ios::trunc);
    if (!sink.out)
        throw std::runtime_error("Failed to open output file: " + part.string());

    CurlHandle curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl)
        throw std::runtime_error("curl_easy_init failed");

    curl_write_callback on_data = [](char *ptr, size_t size, size_t nmemb, void *user) -> size_t
    {
        auto *s = static_cast<Sink *>(user);
        const size_t n = size * nmemb;
        s->out.write(ptr, static_cast<std::streamsize>(n));
        if (!s->out)
            return 0; // aborts the transfer with CURLE_WRITE_ERROR
        s->received += n;
        return n;
    };

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, on_data);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &sink);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, 15L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, 300L);

    const CURLcode res = curl_easy_perform(curl.get());
    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
    sink.out.close();

    std::string failure;
    if (res != CURLE_OK)
        failure = std::string("Download failed: ") + curl_easy_strerror(res);
    else if (status != 0 && (status < 200 || status >= 300)) // 0 for file:// and other non-HTTP schemes
        failure = "HTTP error: " + std::to_string(status);
    else if (sink.received == 0)
        failure = "Download failed: empty response";

    if (!failure.empty())
    {
        fs::remove(part, ec);
        throw std::runtime_error(failure);
    }

    fs::rename(part, out_path);
    return FetchResult{true, sink.received};
}

static std::string human_bytes(std::uintmax_t bytes)
{
    static const char *const units[] = {"bytes", "KiB", "MiB", "GiB"};
    double v = static_cast<double>(bytes);
    size_t u = 0;
    while (v >= 1024.0 && u + 1 < sizeof(units) / sizeof(units[0]))
    {
        v /= 1024.0;
        ++u;
    }
    if (u == 0)
        return std::to_string(bytes) + " bytes";

    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.2f %s (%ju bytes)", v, units[u], bytes);
    return buf;
}

static void usage(const char *argv0)
{
    std::cout
        << "Usage:\n"
        << "  " << argv0 << " --url <url> --out <file> [--force] [--samples N]\n";
}

// Owns curl_global_init / curl_global_cleanup for the process.
struct CurlGlobal
{
    CurlGlobal()
    {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
            throw std::runtime_error("curl_global_init failed");
    }
    ~CurlGlobal() { curl_global_cleanup(); }
};

int main(int argc, char **argv)
{
    try
    {
        std::string url;
        std::filesystem::path out_path;
        bool force = false;
        size_t samples = 10;

        for (int i = 1; i < argc; ++i)
        {
            const std::string a = argv[i];
            if (a == "--help" || a == "-h")
            {
                usage(argv[0]);
                return 0;
            }
            if (a == "--url" && i + 1 < argc)
            {
                url = argv[++i];
                continue;
            }
            if (a == "--out" && i + 1 < argc)
            {
                out_path = argv[++i];
                continue;
            }
            if (a == "--force")
            {
                force = true;
                continue;
            }
            if (a == "--samples" && i + 1 < argc)
            {
                const int v = std::stoi(argv[++i]);
                if (v < 0)
                    throw std::runtime_error("--samples must be >= 0");
                samples = static_cast<size_t>(v);
                continue;
            }
            throw std::runtime_error("Unknown/incomplete arg: " + a);
        }

        if (url.empty() || out_path.empty())
        {
            usage(argv[0]);
            return 2;
        }

        FetchResult fetched;
        {
            CurlGlobal curl_global;
            std::cout << "Fetching " << url << "...\n";
            fetched = fetch_dictionary(url, out_path, force);
        }
        if (!fetched.downloaded)
            std::cout << "Skip download (exists): " << out_path.string() << "\n";

        std::cout << "Parsing " << out_path.string() << "...\n";
        const auto terms = wac::DictionaryReader::readFile(out_path.string());

        // rejects duplicate words the reader lets through
        const wac::QueryEngine engine(terms);

        std::cout << "\n=== TOTAL ===\n";
        std::cout << "Entries: " << engine.size() << "\n";
        std::cout << "Text size: " << human_bytes(fetched.bytes) << "\n";

        if (!terms.empty())
        {
            const auto [lo, hi] = std::minmax_element(terms.begin(), terms.end(), wac::Term::WeightOrder{});
            std::cout << "Weight range: " << lo->getWeight() << " .. " << hi->getWeight() << "\n";
        }

        const auto top = engine.topMatchesWithWeights("", samples);
        std::cout << "\n=== TOP " << top.size() << " ===\n";
        for (const auto &t : top)
            std::cout << "  " << t.getWord() << "\t" << t.getWeight() << "\n";

        return 0;
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
