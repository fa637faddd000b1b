/**
 * @file normalization_rules.cpp
 * @brief Default normalization rule tables
 */

#include "biz/dedup/normalize/normalization_rules.h"

#include <algorithm>

namespace biz::dedup::normalize {

namespace {

bool contains(const std::vector<std::string>& list, const std::string& value) {
    return std::find(list.begin(), list.end(), value) != list.end();
}

}  // namespace

bool normalization_rules::is_legal_suffix(const std::string& token) const {
    return contains(legal_suffixes, token);
}

bool normalization_rules::is_connector(const std::string& token) const {
    return contains(connector_words, token);
}

bool normalization_rules::is_shared_domain(const std::string& domain) const {
    return contains(shared_email_domains, domain);
}

normalization_rules normalization_rules::defaults() {
    normalization_rules rules;

    rules.legal_suffixes = {"inc",  "incorporated", "ltd",   "limited",
                            "corp", "corporation",  "llc",   "llp",
                            "ltee", "limitee",      "incorporee"};

    rules.connector_words = {"and", "&", "et"};

    rules.street_abbreviations = {
        {"st", "street"},     {"str", "street"},    {"ave", "avenue"},
        {"av", "avenue"},     {"rd", "road"},       {"blvd", "boulevard"},
        {"dr", "drive"},      {"ln", "lane"},       {"ct", "court"},
        {"cres", "crescent"}, {"pl", "place"},      {"sq", "square"},
        {"pkwy", "parkway"},  {"hwy", "highway"},   {"cir", "circle"},
        {"terr", "terrace"},  {"ste", "suite"},     {"apt", "apartment"},
        {"n", "north"},       {"s", "south"},       {"e", "east"},
        {"w", "west"}};

    rules.region_aliases = {{"alberta", "ab"},
                            {"british columbia", "bc"},
                            {"manitoba", "mb"},
                            {"new brunswick", "nb"},
                            {"newfoundland and labrador", "nl"},
                            {"nova scotia", "ns"},
                            {"northwest territories", "nt"},
                            {"nunavut", "nu"},
                            {"ontario", "on"},
                            {"prince edward island", "pe"},
                            {"quebec", "qc"},
                            {"saskatchewan", "sk"},
                            {"yukon", "yt"}};

    rules.shared_email_domains = {"gmail.com",   "yahoo.com",  "yahoo.ca",
                                  "hotmail.com", "outlook.com", "live.com",
                                  "icloud.com",  "aol.com",    "shaw.ca",
                                  "rogers.com",  "sympatico.ca", "telus.net"};

    return rules;
}

}  // namespace biz::dedup::normalize
