#ifndef BIZ_DEDUP_NORMALIZE_NORMALIZATION_RULES_H
#define BIZ_DEDUP_NORMALIZE_NORMALIZATION_RULES_H

/**
 * @file normalization_rules.h
 * @brief Rule tables used by field normalization
 *
 * The suffix, connector and abbreviation tables are configuration, not
 * code. The defaults target English and French Canadian business naming
 * and can be replaced through engine_config for other conventions.
 *
 * Default street abbreviation table:
 * | Abbrev. | Expansion  | Abbrev. | Expansion |
 * |---------|------------|---------|-----------|
 * | st      | street     | ct      | court     |
 * | ave, av | avenue     | cres    | crescent  |
 * | rd      | road       | pl      | place     |
 * | blvd    | boulevard  | sq      | square    |
 * | dr      | drive      | pkwy    | parkway   |
 * | ln      | lane       | hwy     | highway   |
 * | cir     | circle     | terr    | terrace   |
 * | ste     | suite      | apt     | apartment |
 * | n, s    | north, south | e, w  | east, west |
 */

#include <map>
#include <string>
#include <vector>

namespace biz::dedup::normalize {

/**
 * @brief Rule tables for field normalization
 */
struct normalization_rules {
    /** Legal-form suffixes stripped from the end of names */
    std::vector<std::string> legal_suffixes;

    /** Connector words dropped anywhere in names ("and", "&") */
    std::vector<std::string> connector_words;

    /** Street token expansions (lowercase abbreviation -> expansion) */
    std::map<std::string, std::string> street_abbreviations;

    /** Province/state aliases (lowercase name -> canonical code) */
    std::map<std::string, std::string> region_aliases;

    /**
     * @brief Mailbox-provider domains shared by unrelated businesses
     *
     * A shared domain is never used as a blocking key and gives no partial
     * e-mail credit.
     */
    std::vector<std::string> shared_email_domains;

    /**
     * @brief Check whether a lowercase token is a legal suffix
     */
    [[nodiscard]] bool is_legal_suffix(const std::string& token) const;

    /**
     * @brief Check whether a lowercase token is a connector word
     */
    [[nodiscard]] bool is_connector(const std::string& token) const;

    /**
     * @brief Check whether a lowercase domain is a shared provider domain
     */
    [[nodiscard]] bool is_shared_domain(const std::string& domain) const;

    /**
     * @brief Default rule tables
     */
    [[nodiscard]] static normalization_rules defaults();
};

}  // namespace biz::dedup::normalize

#endif  // BIZ_DEDUP_NORMALIZE_NORMALIZATION_RULES_H
