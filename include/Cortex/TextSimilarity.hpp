// =================================================================
// include/Cortex/TextSimilarity.hpp
// =================================================================
// Word-set helpers shared by the merger and the lexical index.

#pragma once

#include <string>
#include <unordered_set>

namespace Cortex {

/**
 * @brief ASCII lower-casing
 */
std::string toLowerCopy(const std::string& text);

/**
 * @brief Split on whitespace, lower-case, and collect distinct words
 */
std::unordered_set<std::string> wordSet(const std::string& text);

/**
 * @brief Jaccard similarity |A ∩ B| / |A ∪ B| of two word sets
 * @return Similarity in [0,1]; 0 when both sets are empty
 */
double jaccardSimilarity(const std::unordered_set<std::string>& a,
                         const std::unordered_set<std::string>& b);

/**
 * @brief Jaccard similarity of the word sets of two texts
 */
double jaccardSimilarity(const std::string& a, const std::string& b);

} // namespace Cortex
