/**
 * @file field_normalizer.cpp
 * @brief Field normalization implementation
 */

#include "biz/dedup/normalize/field_normalizer.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <format>

namespace biz::dedup::normalize {

namespace {

// =============================================================================
// Diacritic Folding Tables
// =============================================================================

/** U+00C0 to U+00FF */
constexpr std::array<const char*, 64> latin1_fold = {
    "A", "A", "A", "A", "A", "A", "AE", "C",   // C0-C7
    "E", "E", "E", "E", "I", "I", "I",  "I",   // C8-CF
    "D", "N", "O", "O", "O", "O", "O",  "x",   // D0-D7
    "O", "U", "U", "U", "U", "Y", "TH", "ss",  // D8-DF
    "a", "a", "a", "a", "a", "a", "ae", "c",   // E0-E7
    "e", "e", "e", "e", "i", "i", "i",  "i",   // E8-EF
    "d", "n", "o", "o", "o", "o", "o",  "/",   // F0-F7
    "o", "u", "u", "u", "u", "y", "th", "y"};  // F8-FF

/** U+0100 to U+017F; '#' marks the two-letter ligatures handled below */
constexpr char latin_ext_a_fold[] =
    "AaAaAaCcCcCcCcDdDdEeEeEeEeEeGgGgGgGgHhHhIiIiIiIiIi"
    "##"
    "Jj"
    "Kkk"
    "LlLlLlLlLl"
    "NnNnNnnNn"
    "OoOoOo"
    "##"
    "RrRrRr"
    "SsSsSsSs"
    "TtTtTt"
    "UuUuUuUuUuUu"
    "Ww"
    "YyY"
    "ZzZzZz"
    "s";

static_assert(sizeof(latin_ext_a_fold) - 1 == 0x80,
              "Latin Extended-A table must cover U+0100..U+017F");

void append_folded(std::string& out, char32_t cp) {
    if (cp >= 0xC0 && cp <= 0xFF) {
        out += latin1_fold[cp - 0xC0];
        return;
    }
    if (cp >= 0x100 && cp <= 0x17F) {
        switch (cp) {
            case 0x132:
                out += "IJ";
                return;
            case 0x133:
                out += "ij";
                return;
            case 0x152:
                out += "OE";
                return;
            case 0x153:
                out += "oe";
                return;
            default:
                out += latin_ext_a_fold[cp - 0x100];
                return;
        }
    }
    switch (cp) {
        case 0x2018:  // left single quotation mark
        case 0x2019:  // right single quotation mark
        case 0x02BC:  // modifier letter apostrophe
            out += '\'';
            return;
        case 0x2010:
        case 0x2011:
        case 0x2013:
        case 0x2014:
            out += '-';
            return;
        case 0x00A0:  // no-break space
            out += ' ';
            return;
        default:
            break;
    }
}

[[nodiscard]] bool is_foldable(char32_t cp) {
    return (cp >= 0xC0 && cp <= 0x17F) || cp == 0x2018 || cp == 0x2019 ||
           cp == 0x02BC || cp == 0x2010 || cp == 0x2011 || cp == 0x2013 ||
           cp == 0x2014 || cp == 0x00A0;
}

// =============================================================================
// Helper Functions
// =============================================================================

[[nodiscard]] std::string trim(std::string_view str) {
    auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) return "";
    auto end = str.find_last_not_of(" \t\r\n");
    return std::string(str.substr(start, end - start + 1));
}

[[nodiscard]] bool is_ascii_alnum(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

[[nodiscard]] char lower(char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

[[nodiscard]] std::vector<std::string> split_words(std::string_view text) {
    std::vector<std::string> words;
    std::string current;
    for (char c : text) {
        if (c == ' ') {
            if (!current.empty()) {
                words.push_back(std::move(current));
                current.clear();
            }
        } else {
            current += c;
        }
    }
    if (!current.empty()) {
        words.push_back(std::move(current));
    }
    return words;
}

[[nodiscard]] std::string join(const std::vector<std::string>& words) {
    std::string result;
    for (const auto& word : words) {
        if (!result.empty()) result += ' ';
        result += word;
    }
    return result;
}

/**
 * @brief Fold and lowercase, dropping apostrophes and periods and turning
 *        other ASCII punctuation into word breaks
 */
[[nodiscard]] std::string to_word_text(std::string_view raw) {
    auto folded = fold_diacritics(raw);
    std::string text;
    text.reserve(folded.size());

    for (char c : folded) {
        if (is_ascii_alnum(c)) {
            text += lower(c);
        } else if (c == '\'' || c == '.') {
            // "L'Entreprise" -> "lentreprise", "Inc." -> "inc"
        } else if (c == '&') {
            text += " & ";
        } else if (static_cast<unsigned char>(c) >= 0x80) {
            // Unfolded non-Latin characters are kept as word characters
            text += c;
        } else {
            text += ' ';
        }
    }
    return text;
}

}  // namespace

// =============================================================================
// Text Helpers
// =============================================================================

std::string fold_diacritics(std::string_view text) {
    std::string result;
    result.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        auto b0 = static_cast<unsigned char>(text[i]);
        if (b0 < 0x80) {
            result += static_cast<char>(b0);
            ++i;
            continue;
        }

        size_t length = 1;
        char32_t cp = 0;
        if ((b0 & 0xE0) == 0xC0) {
            length = 2;
            cp = b0 & 0x1F;
        } else if ((b0 & 0xF0) == 0xE0) {
            length = 3;
            cp = b0 & 0x0F;
        } else if ((b0 & 0xF8) == 0xF0) {
            length = 4;
            cp = b0 & 0x07;
        } else {
            // Stray continuation byte
            result += static_cast<char>(b0);
            ++i;
            continue;
        }

        if (i + length > text.size()) {
            result.append(text.substr(i));
            break;
        }

        bool valid = true;
        for (size_t k = 1; k < length; ++k) {
            auto bk = static_cast<unsigned char>(text[i + k]);
            if ((bk & 0xC0) != 0x80) {
                valid = false;
                break;
            }
            cp = (cp << 6) | (bk & 0x3F);
        }

        if (valid && is_foldable(cp)) {
            append_folded(result, cp);
        } else {
            result.append(text.substr(i, length));
        }
        i += length;
    }

    return result;
}

std::string fold_and_lower(std::string_view text) {
    auto folded = fold_diacritics(text);
    std::string result;
    result.reserve(folded.size());
    bool pending_space = false;
    for (char c : folded) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pending_space = !result.empty();
            continue;
        }
        if (pending_space) {
            result += ' ';
            pending_space = false;
        }
        result += lower(c);
    }
    return result;
}

// =============================================================================
// field_normalizer
// =============================================================================

field_normalizer::field_normalizer(normalization_rules rules)
    : rules_(std::move(rules)) {}

normalized_name field_normalizer::normalize_name(std::string_view raw) const {
    normalized_name result;
    result.display = trim(raw);
    result.full_tokens = split_words(to_word_text(raw));

    for (const auto& token : result.full_tokens) {
        if (!rules_.is_connector(token)) {
            result.tokens.push_back(token);
        }
    }

    // Strip trailing legal suffixes, always leaving one token
    while (result.tokens.size() > 1 &&
           rules_.is_legal_suffix(result.tokens.back())) {
        result.tokens.pop_back();
    }

    if (result.tokens.empty()) {
        result.tokens = result.full_tokens;
    }

    result.canonical = join(result.tokens);
    return result;
}

std::optional<std::string> field_normalizer::normalize_business_number(
    std::string_view raw) const {
    std::string result;
    for (char c : raw) {
        if (is_ascii_alnum(c)) {
            result += static_cast<char>(
                std::toupper(static_cast<unsigned char>(c)));
        }
    }
    if (result.empty()) return std::nullopt;
    return result;
}

std::optional<normalized_phone> field_normalizer::normalize_phone(
    std::string_view raw) const {
    auto trimmed = trim(raw);
    normalized_phone result;
    result.has_country_code = !trimmed.empty() && trimmed.front() == '+';

    for (char c : trimmed) {
        if (std::isdigit(static_cast<unsigned char>(c))) {
            result.digits += c;
        } else if (std::isalpha(static_cast<unsigned char>(c)) &&
                   !result.digits.empty()) {
            // "ext", "x" and similar end the number
            break;
        }
    }

    if (!result.has_country_code && result.digits.size() > 2 &&
        result.digits.starts_with("00")) {
        result.digits.erase(0, 2);
        result.has_country_code = true;
    }

    if (result.digits.size() < 7) return std::nullopt;
    return result;
}

std::optional<normalized_email> field_normalizer::normalize_email(
    std::string_view raw) const {
    auto address = fold_and_lower(trim(raw));
    if (address.starts_with("mailto:")) {
        address.erase(0, 7);
    }

    if (address.find(' ') != std::string::npos) return std::nullopt;

    auto at = address.find('@');
    if (at == std::string::npos || at == 0 ||
        address.find('@', at + 1) != std::string::npos) {
        return std::nullopt;
    }

    std::string domain = address.substr(at + 1);
    auto dot = domain.find('.');
    if (domain.empty() || dot == std::string::npos || dot == 0 ||
        domain.back() == '.') {
        return std::nullopt;
    }

    normalized_email result;
    result.local = address.substr(0, at);
    result.domain = std::move(domain);
    result.address = std::move(address);
    return result;
}

std::optional<std::string> field_normalizer::normalize_website(
    std::string_view raw) const {
    auto host = fold_and_lower(trim(raw));

    if (auto scheme = host.find("://"); scheme != std::string::npos) {
        host.erase(0, scheme + 3);
    }
    if (auto end = host.find_first_of("/?#"); end != std::string::npos) {
        host.erase(end);
    }
    if (auto at = host.rfind('@'); at != std::string::npos) {
        host.erase(0, at + 1);
    }
    if (auto colon = host.find(':'); colon != std::string::npos) {
        host.erase(colon);
    }
    if (host.starts_with("www.")) {
        host.erase(0, 4);
    }
    while (!host.empty() && host.back() == '.') {
        host.pop_back();
    }

    if (host.empty() || host.find('.') == std::string::npos ||
        host.find(' ') != std::string::npos) {
        return std::nullopt;
    }
    return host;
}

normalized_address field_normalizer::normalize_address(
    const record::business_address& raw) const {
    normalized_address result;

    if (raw.street) {
        for (auto& token : split_words(to_word_text(*raw.street))) {
            auto it = rules_.street_abbreviations.find(token);
            result.street_tokens.push_back(
                it != rules_.street_abbreviations.end() ? it->second
                                                        : std::move(token));
        }
        if (!result.street_tokens.empty()) {
            result.street = join(result.street_tokens);
        }
    }

    if (raw.city) {
        auto city = join(split_words(to_word_text(*raw.city)));
        if (!city.empty()) result.city = std::move(city);
    }

    if (raw.province) {
        auto province = join(split_words(to_word_text(*raw.province)));
        if (auto it = rules_.region_aliases.find(province);
            it != rules_.region_aliases.end()) {
            province = it->second;
        }
        if (!province.empty()) result.province = std::move(province);
    }

    if (raw.postal_code) {
        std::string postal;
        for (char c : *raw.postal_code) {
            if (is_ascii_alnum(c)) {
                postal += static_cast<char>(
                    std::toupper(static_cast<unsigned char>(c)));
            }
        }
        if (!postal.empty()) result.postal_code = std::move(postal);
    }

    return result;
}

std::vector<std::string> field_normalizer::normalize_industry(
    const std::vector<std::string>& raw) const {
    std::vector<std::string> result;
    for (const auto& tag : raw) {
        auto normalized = fold_and_lower(trim(tag));
        if (normalized.empty()) continue;
        if (std::find(result.begin(), result.end(), normalized) ==
            result.end()) {
            result.push_back(std::move(normalized));
        }
    }
    return result;
}

normalized_record field_normalizer::normalize(
    const record::business_record& raw,
    std::vector<record::record_issue>* issues) const {
    using record::business_field;

    normalized_record result;
    result.id = raw.id;

    auto report = [&](business_field field, std::string message) {
        if (issues == nullptr) return;
        issues->push_back(record::record_issue{
            .kind = record::issue_kind::invalid_value,
            .record_id = raw.id,
            .input_index = std::nullopt,
            .field = field,
            .message = std::move(message)});
    };

    if (raw.has_field(business_field::name)) {
        result.name = normalize_name(raw.name);
        if (result.name.empty()) {
            report(business_field::name,
                   std::format("name '{}' has no comparable characters",
                               raw.name));
        }
    }

    if (raw.has_field(business_field::business_number)) {
        result.business_number = normalize_business_number(*raw.business_number);
        if (!result.business_number) {
            report(business_field::business_number,
                   std::format("unusable business number '{}'",
                               *raw.business_number));
        }
    }

    if (raw.has_field(business_field::phone)) {
        result.phone = normalize_phone(*raw.phone);
        if (!result.phone) {
            report(business_field::phone,
                   std::format("unusable phone number '{}'", *raw.phone));
        }
    }

    if (raw.has_field(business_field::email)) {
        result.email = normalize_email(*raw.email);
        if (!result.email) {
            report(business_field::email,
                   std::format("malformed e-mail address '{}'", *raw.email));
        }
    }

    if (raw.has_field(business_field::website)) {
        result.website = normalize_website(*raw.website);
        if (!result.website) {
            report(business_field::website,
                   std::format("no host in website '{}'", *raw.website));
        }
    }

    if (raw.has_field(business_field::address)) {
        auto address = normalize_address(*raw.address);
        if (!address.empty()) {
            result.address = std::move(address);
        }
    }

    if (raw.has_field(business_field::description)) {
        result.description = fold_and_lower(*raw.description);
    }

    result.industry = normalize_industry(raw.industry);
    return result;
}

prepared_record field_normalizer::prepare(
    const record::business_record& raw,
    std::vector<record::record_issue>* issues) const {
    return prepared_record{.source = raw,
                           .normalized = normalize(raw, issues)};
}

// =============================================================================
// Validity Checks
// =============================================================================

bool is_valid_value(const field_normalizer& normalizer,
                    const record::business_record& record,
                    record::business_field field) {
    using record::business_field;

    if (!record.has_field(field)) return false;

    switch (field) {
        case business_field::name:
            return !normalizer.normalize_name(record.name).empty();
        case business_field::business_number:
            return normalizer.normalize_business_number(*record.business_number)
                .has_value();
        case business_field::phone:
            return normalizer.normalize_phone(*record.phone).has_value();
        case business_field::email:
            return normalizer.normalize_email(*record.email).has_value();
        case business_field::website:
            return normalizer.normalize_website(*record.website).has_value();
        case business_field::address:
            return !normalizer.normalize_address(*record.address).empty();
        case business_field::industry:
            return !normalizer.normalize_industry(record.industry).empty();
        default:
            return true;
    }
}

}  // namespace biz::dedup::normalize
