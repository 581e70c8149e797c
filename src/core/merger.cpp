#include "merger.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <vector>

namespace merge {

namespace {

bool is_sentence_punct(char c) {
    return c == '.' || c == '!' || c == '?';
}

std::vector<std::string> split_words(const std::string& text) {
    std::vector<std::string> words;
    std::istringstream in(text);
    std::string w;
    while (in >> w) words.push_back(std::move(w));
    return words;
}

bool iequals(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

} // namespace

std::string clean_text(const std::string& text) {
    std::string out;
    out.reserve(text.size());

    bool pending_space = false;
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pending_space = !out.empty();
            continue;
        }
        if (is_sentence_punct(c) && !pending_space && !out.empty() && out.back() == c) {
            continue;
        }
        if (pending_space) {
            out.push_back(' ');
            pending_space = false;
        }
        out.push_back(c);
    }
    return out;
}

size_t overlap_words(const std::string& merged, const std::string& next,
                     size_t min_words, size_t max_words) {
    auto tail = split_words(merged);
    auto head = split_words(next);

    size_t limit = std::min({tail.size(), head.size(), max_words});
    for (size_t n = limit; n >= min_words && n > 0; --n) {
        bool match = true;
        for (size_t i = 0; i < n; ++i) {
            if (!iequals(tail[tail.size() - n + i], head[i])) {
                match = false;
                break;
            }
        }
        if (match) return n;
    }
    return 0;
}

MergedTranscript merge_results(std::span<const ChunkResult> results, const Options& opts) {
    std::vector<const ChunkResult*> ordered;
    ordered.reserve(results.size());
    for (auto& r : results) {
        if (r.ok()) ordered.push_back(&r);
    }
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const ChunkResult* a, const ChunkResult* b) { return a->index < b->index; });

    MergedTranscript merged;
    double confidence_sum = 0.0;

    for (auto* r : ordered) {
        ++merged.ok_chunks;
        confidence_sum += r->confidence;

        auto text = clean_text(r->text);
        if (text.empty()) continue;

        if (opts.dedupe_overlap && !merged.text.empty()) {
            size_t n = overlap_words(merged.text, text, opts.min_overlap_words,
                                     opts.max_overlap_words);
            if (n > 0) {
                auto words = split_words(text);
                text.clear();
                for (size_t i = n; i < words.size(); ++i) {
                    if (!text.empty()) text.push_back(' ');
                    text += words[i];
                }
                if (text.empty()) continue;
            }
        }

        if (!merged.text.empty()) merged.text.push_back(' ');
        merged.text += text;
    }

    if (merged.ok_chunks > 0) {
        merged.confidence = confidence_sum / merged.ok_chunks;
    }
    return merged;
}

} // namespace merge
