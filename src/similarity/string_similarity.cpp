/**
 * @file string_similarity.cpp
 * @brief String, phonetic and token similarity implementation
 */

#include "biz/dedup/similarity/string_similarity.h"

#include <algorithm>
#include <cctype>
#include <iterator>

namespace biz::dedup::similarity {

namespace {

/**
 * @brief Soundex digit for an uppercase letter ('0' for vowels and Y)
 */
char soundex_digit(char c) {
    switch (c) {
        case 'B':
        case 'F':
        case 'P':
        case 'V':
            return '1';
        case 'C':
        case 'G':
        case 'J':
        case 'K':
        case 'Q':
        case 'S':
        case 'X':
        case 'Z':
            return '2';
        case 'D':
        case 'T':
            return '3';
        case 'L':
            return '4';
        case 'M':
        case 'N':
            return '5';
        case 'R':
            return '6';
        default:
            return '0';
    }
}

/**
 * @brief Multiset Jaccard over two already sorted lists
 */
double sorted_multiset_jaccard(const std::vector<std::string>& a,
                               const std::vector<std::string>& b) {
    size_t i = 0;
    size_t j = 0;
    size_t intersection = 0;
    size_t union_size = 0;

    while (i < a.size() && j < b.size()) {
        if (a[i] == b[j]) {
            ++intersection;
            ++union_size;
            ++i;
            ++j;
        } else if (a[i] < b[j]) {
            ++union_size;
            ++i;
        } else {
            ++union_size;
            ++j;
        }
    }
    union_size += (a.size() - i) + (b.size() - j);

    if (union_size == 0) return 0.0;
    return static_cast<double>(intersection) / static_cast<double>(union_size);
}

std::vector<std::string> sorted_copy(std::vector<std::string> values) {
    std::sort(values.begin(), values.end());
    return values;
}

bool has_digit(const std::string& token) {
    return std::any_of(token.begin(), token.end(), [](unsigned char c) {
        return std::isdigit(c) != 0;
    });
}

}  // namespace

// =============================================================================
// Edit Distance
// =============================================================================

size_t levenshtein_distance(std::string_view a, std::string_view b) {
    if (a.size() < b.size()) {
        std::swap(a, b);
    }
    if (b.empty()) return a.size();

    std::vector<size_t> previous(b.size() + 1);
    std::vector<size_t> current(b.size() + 1);
    for (size_t j = 0; j <= b.size(); ++j) {
        previous[j] = j;
    }

    for (size_t i = 1; i <= a.size(); ++i) {
        current[0] = i;
        for (size_t j = 1; j <= b.size(); ++j) {
            size_t cost = (a[i - 1] == b[j - 1]) ? 0 : 1;
            current[j] = std::min({previous[j] + 1, current[j - 1] + 1,
                                   previous[j - 1] + cost});
        }
        std::swap(previous, current);
    }

    return previous[b.size()];
}

double edit_similarity(std::string_view a, std::string_view b) {
    if (a.empty() || b.empty()) return 0.0;
    if (a == b) return 1.0;

    auto distance = levenshtein_distance(a, b);
    auto longest = std::max(a.size(), b.size());
    return 1.0 - static_cast<double>(distance) / static_cast<double>(longest);
}

// =============================================================================
// Phonetic Encoding
// =============================================================================

std::string soundex(std::string_view word) {
    std::string letters;
    for (char c : word) {
        if (std::isalpha(static_cast<unsigned char>(c))) {
            letters += static_cast<char>(
                std::toupper(static_cast<unsigned char>(c)));
        }
    }
    if (letters.empty()) {
        return std::string(word);
    }

    std::string code(1, letters.front());
    char last = soundex_digit(letters.front());

    for (size_t i = 1; i < letters.size() && code.size() < 4; ++i) {
        char c = letters[i];
        if (c == 'H' || c == 'W') {
            continue;
        }
        char digit = soundex_digit(c);
        if (digit != '0' && digit != last) {
            code += digit;
        }
        last = digit;
    }

    code.resize(4, '0');
    return code;
}

std::vector<std::string> phonetic_codes(const std::vector<std::string>& tokens) {
    std::vector<std::string> codes;
    codes.reserve(tokens.size());
    for (const auto& token : tokens) {
        codes.push_back(soundex(token));
    }
    return codes;
}

std::string phonetic_key(const std::vector<std::string>& tokens) {
    auto codes = sorted_copy(phonetic_codes(tokens));
    std::string key;
    for (const auto& code : codes) {
        if (!key.empty()) key += ' ';
        key += code;
    }
    return key;
}

double phonetic_similarity(const std::vector<std::string>& a,
                           const std::vector<std::string>& b) {
    if (a.empty() || b.empty()) return 0.0;

    auto codes_a = sorted_copy(phonetic_codes(a));
    auto codes_b = sorted_copy(phonetic_codes(b));
    if (codes_a == codes_b) return 1.0;

    return 0.8 * sorted_multiset_jaccard(codes_a, codes_b);
}

// =============================================================================
// Token Similarity
// =============================================================================

double token_set_similarity(const std::vector<std::string>& a,
                            const std::vector<std::string>& b) {
    if (a.empty() || b.empty()) return 0.0;
    return sorted_multiset_jaccard(sorted_copy(a), sorted_copy(b));
}

bool same_numeric_tokens(const std::vector<std::string>& a,
                         const std::vector<std::string>& b) {
    std::vector<std::string> numbers_a;
    std::vector<std::string> numbers_b;
    std::copy_if(a.begin(), a.end(), std::back_inserter(numbers_a), has_digit);
    std::copy_if(b.begin(), b.end(), std::back_inserter(numbers_b), has_digit);
    return sorted_copy(std::move(numbers_a)) == sorted_copy(std::move(numbers_b));
}

// =============================================================================
// Abbreviations
// =============================================================================

std::string initials(const std::vector<std::string>& tokens) {
    std::string result;
    for (const auto& token : tokens) {
        if (!token.empty()) {
            result += token.front();
        }
    }
    return result;
}

bool is_abbreviation(const std::vector<std::string>& a,
                     const std::vector<std::string>& b) {
    auto check = [](const std::vector<std::string>& shorter,
                    const std::vector<std::string>& longer) {
        return shorter.size() == 1 && shorter.front().size() >= 2 &&
               longer.size() >= 2 && shorter.front() == initials(longer);
    };
    return check(a, b) || check(b, a);
}

}  // namespace biz::dedup::similarity
