// =================================================================
// src/Cortex/TextSimilarity.cpp
// =================================================================

#include "Cortex/TextSimilarity.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace Cortex {

std::string toLowerCopy(const std::string& text) {
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

std::unordered_set<std::string> wordSet(const std::string& text) {
    std::unordered_set<std::string> words;
    std::istringstream stream(toLowerCopy(text));
    std::string word;

    while (stream >> word) {
        words.insert(word);
    }

    return words;
}

double jaccardSimilarity(const std::unordered_set<std::string>& a,
                         const std::unordered_set<std::string>& b) {
    size_t intersection_size = 0;
    for (const auto& word : a) {
        if (b.count(word)) {
            intersection_size++;
        }
    }

    size_t union_size = a.size() + b.size() - intersection_size;

    return union_size > 0 ? static_cast<double>(intersection_size) / union_size : 0.0;
}

double jaccardSimilarity(const std::string& a, const std::string& b) {
    return jaccardSimilarity(wordSet(a), wordSet(b));
}

} // namespace Cortex
