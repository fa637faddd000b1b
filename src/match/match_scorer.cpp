/**
 * @file match_scorer.cpp
 * @brief Pairwise record comparison implementation
 */

#include "biz/dedup/match/match_scorer.h"

#include "biz/dedup/integration/logger_adapter.h"
#include "biz/dedup/similarity/field_similarity.h"

#include <algorithm>
#include <cmath>
#include <exception>
#include <format>
#include <optional>
#include <set>
#include <utility>

namespace biz::dedup::match {

using record::business_field;
using record::match_algorithm;
using record::match_confidence;

// =============================================================================
// Scoring Configuration
// =============================================================================

std::map<business_field, double> scoring_config::default_weights() {
    return {
        {business_field::name, 0.25},
        {business_field::business_number, 0.30},
        {business_field::phone, 0.15},
        {business_field::email, 0.10},
        {business_field::website, 0.10},
        {business_field::address, 0.05},
        {business_field::industry, 0.05},
        {business_field::description, 0.05},
    };
}

double scoring_config::weight_of(business_field field) const {
    auto it = weights.find(field);
    return it == weights.end() ? 0.0 : it->second;
}

std::vector<validation_error_info> scoring_config::validate() const {
    std::vector<validation_error_info> errors;

    double total = 0.0;
    for (const auto& [field, weight] : weights) {
        if (!std::isfinite(weight) || weight < 0.0) {
            errors.push_back({std::format("weights.{}", record::to_string(field)),
                              "weight must be a non-negative number",
                              std::format("{}", weight), ">= 0"});
            continue;
        }
        total += weight;
    }
    if (total <= 0.0) {
        errors.push_back({"weights", "weights must not all be zero",
                          std::format("{}", total), "> 0"});
    }

    auto check_unit = [&](const char* path, double value) {
        if (!std::isfinite(value) || value < 0.0 || value > 1.0) {
            errors.push_back({path, "value out of range",
                              std::format("{}", value), "[0, 1]"});
        }
    };
    check_unit("high_confidence", high_confidence);
    check_unit("medium_confidence", medium_confidence);
    check_unit("model_weight", model_weight);
    check_unit("auto_merge_threshold", auto_merge_threshold);

    if (medium_confidence > high_confidence) {
        errors.push_back({"medium_confidence",
                          "medium cut-off exceeds high cut-off",
                          std::format("{}", medium_confidence),
                          std::format("<= {}", high_confidence)});
    }

    return errors;
}

// =============================================================================
// Comparison
// =============================================================================

namespace {

/**
 * @brief Accumulates field scores into the weighted average
 */
struct score_sheet {
    const scoring_config& config;
    const dedup_options& options;
    record::match_details details;
    double weighted_sum = 0.0;
    double weight_total = 0.0;

    void add(business_field field, double score) {
        details.set(field, score);

        double weight = config.weight_of(field);
        if (weight <= 0.0) return;

        weight_total += weight;
        auto threshold = options.field_thresholds.find(field);
        if (threshold != options.field_thresholds.end() &&
            score < threshold->second) {
            return;
        }
        weighted_sum += weight * score;
    }

    // Reported in the details without counting toward the overall score
    void note(business_field field, double score) { details.set(field, score); }

    [[nodiscard]] double overall() const {
        if (weight_total <= 0.0) return 0.0;
        return std::clamp(weighted_sum / weight_total, 0.0, 1.0);
    }
};

bool valid_score(double value) {
    return std::isfinite(value) && value >= 0.0 && value <= 1.0;
}

}  // namespace

match_scorer::match_scorer(scoring_config config,
                           normalize::normalization_rules rules)
    : config_(std::move(config)), rules_(std::move(rules)) {}

match_confidence match_scorer::confidence_for(double score) const {
    if (score >= config_.high_confidence) return match_confidence::high;
    if (score >= config_.medium_confidence) return match_confidence::medium;
    return match_confidence::low;
}

record::match_result match_scorer::compare(
    const normalize::prepared_record& a, const normalize::prepared_record& b,
    const dedup_options& options, similarity::bounded_scorer* model,
    std::vector<record::record_issue>* issues) const {
    record::match_result result;
    result.candidate_id = b.source.id;

    const auto& na = a.normalized;
    const auto& nb = b.normalized;

    const bool only_model = model_only(options);
    auto algorithms =
        only_model ? default_algorithms() : effective_algorithms(options);
    algorithms.erase(match_algorithm::ml);
    auto enabled = [&](match_algorithm algorithm) {
        return algorithms.contains(algorithm);
    };

    // Comparators and the model see the pair in id order
    const auto& first = a.source.id <= b.source.id ? a.source : b.source;
    const auto& second = a.source.id <= b.source.id ? b.source : a.source;

    auto report = [&](record::issue_kind kind,
                      std::optional<business_field> field,
                      std::string message) {
        integration::get_logger().warning(
            std::format("compare {} / {}: {}", a.source.id, b.source.id,
                        message));
        if (issues) {
            record::record_issue issue;
            issue.kind = kind;
            issue.record_id = a.source.id;
            issue.field = field;
            issue.message = std::move(message);
            issues->push_back(std::move(issue));
        }
    };

    // Runs a custom comparator if one is configured for the field.
    // Returns the score, or std::nullopt when there is none or it failed.
    auto custom = [&](business_field field, bool& handled) -> std::optional<double> {
        auto it = options.custom_comparators.find(field);
        handled = it != options.custom_comparators.end() && it->second;
        if (!handled) return std::nullopt;

        try {
            double value = it->second(first, second);
            if (!valid_score(value)) {
                report(record::issue_kind::scorer_failed, field,
                       std::format("comparator for {} returned {}",
                                   record::to_string(field), value));
                return std::nullopt;
            }
            return value;
        } catch (const std::exception& e) {
            report(record::issue_kind::scorer_failed, field,
                   std::format("comparator for {} threw: {}",
                               record::to_string(field), e.what()));
            return std::nullopt;
        }
    };

    score_sheet sheet{config_, options, {}, 0.0, 0.0};
    bool decisive = false;
    double exact_max = 0.0;
    similarity::name_scores names;
    bool names_scored = false;
    std::optional<double> address_score;

    // -------------------------------------------------------------------------
    // Name
    // -------------------------------------------------------------------------
    if (is_checked(options, business_field::name) && !na.name.empty() &&
        !nb.name.empty()) {
        bool handled = false;
        auto value = custom(business_field::name, handled);
        if (handled) {
            if (value) sheet.add(business_field::name, *value);
        } else if (enabled(match_algorithm::string) ||
                   enabled(match_algorithm::phonetic) ||
                   enabled(match_algorithm::token)) {
            names = similarity::compare_names(na.name, nb.name);
            names_scored = true;

            double best = 0.0;
            if (enabled(match_algorithm::string)) best = std::max(best, names.string);
            if (enabled(match_algorithm::token)) best = std::max(best, names.token);
            if (enabled(match_algorithm::phonetic)) {
                best = std::max(best, names.phonetic);
            }
            sheet.add(business_field::name, best);
        } else {
            auto unweighted = similarity::compare_names(na.name, nb.name);
            sheet.note(business_field::name,
                       std::max({unweighted.string, unweighted.token,
                                 unweighted.phonetic}));
        }
    }

    // -------------------------------------------------------------------------
    // Strong identifiers
    // -------------------------------------------------------------------------
    auto exact_field = [&](business_field field, bool present,
                           auto&& builtin) {
        if (!present || !is_checked(options, field)) return;

        bool handled = false;
        auto value = custom(field, handled);
        if (handled) {
            if (value) sheet.add(field, *value);
            return;
        }
        double score = builtin();
        if (!enabled(match_algorithm::field_exact)) {
            sheet.note(field, score);
            return;
        }

        sheet.add(field, score);
        exact_max = std::max(exact_max, score);
        if (score >= 1.0) {
            decisive = true;
        }
    };

    exact_field(business_field::business_number,
                na.business_number && nb.business_number, [&] {
                    return similarity::exact_similarity(*na.business_number,
                                                        *nb.business_number);
                });
    exact_field(business_field::phone, na.phone && nb.phone, [&] {
        return similarity::phone_similarity(*na.phone, *nb.phone);
    });
    exact_field(business_field::email, na.email && nb.email, [&] {
        return similarity::email_similarity(*na.email, *nb.email, rules_);
    });
    exact_field(business_field::website, na.website && nb.website, [&] {
        return similarity::exact_similarity(*na.website, *nb.website);
    });

    if (is_checked(options, business_field::business_number) &&
        na.business_number && nb.business_number &&
        *na.business_number != *nb.business_number) {
        result.conflicting_identifier = true;
    }

    // -------------------------------------------------------------------------
    // Address, industry, description
    // -------------------------------------------------------------------------
    if (is_checked(options, business_field::address) && na.address &&
        nb.address) {
        bool handled = false;
        auto value = custom(business_field::address, handled);
        if (handled) {
            if (value) sheet.add(business_field::address, *value);
        } else if (enabled(match_algorithm::address)) {
            address_score = similarity::address_similarity(*na.address,
                                                           *nb.address);
            if (address_score) {
                sheet.add(business_field::address, *address_score);
            }
        } else if (auto unweighted = similarity::address_similarity(
                       *na.address, *nb.address)) {
            sheet.note(business_field::address, *unweighted);
        }
    }

    if (is_checked(options, business_field::industry) && !na.industry.empty() &&
        !nb.industry.empty()) {
        bool handled = false;
        auto value = custom(business_field::industry, handled);
        if (handled) {
            if (value) sheet.add(business_field::industry, *value);
        } else {
            double value =
                similarity::industry_similarity(na.industry, nb.industry);
            if (enabled(match_algorithm::token)) {
                sheet.add(business_field::industry, value);
            } else {
                sheet.note(business_field::industry, value);
            }
        }
    }

    if (is_checked(options, business_field::description) && na.description &&
        nb.description) {
        bool handled = false;
        auto value = custom(business_field::description, handled);
        if (handled && value) {
            sheet.add(business_field::description, *value);
        }
    }

    // -------------------------------------------------------------------------
    // Overall score
    // -------------------------------------------------------------------------
    const bool decisive_match = decisive && !result.conflicting_identifier;
    double algorithmic = decisive_match ? 1.0 : sheet.overall();
    double score = algorithmic;

    if (uses_model(options)) {
        if (model == nullptr || !model->available()) {
            result.scorer_fallback = true;
        } else {
            auto outcome = model->evaluate(first, second);
            if (outcome.status == similarity::scorer_status::ok) {
                result.model_score = outcome.score;
                if (!decisive_match) {
                    score = only_model
                                ? *outcome.score
                                : (1.0 - config_.model_weight) * algorithmic +
                                      config_.model_weight * *outcome.score;
                }
            } else {
                result.scorer_fallback = true;
                report(outcome.status == similarity::scorer_status::timed_out
                           ? record::issue_kind::scorer_timeout
                           : record::issue_kind::scorer_failed,
                       std::nullopt, outcome.message);
            }
        }
    }

    result.score = std::clamp(score, 0.0, 1.0);
    result.details = std::move(sheet.details);

    // -------------------------------------------------------------------------
    // Confidence and action
    // -------------------------------------------------------------------------
    if (decisive_match) {
        result.confidence = match_confidence::high;
    } else {
        result.confidence = confidence_for(result.score);
        if (result.conflicting_identifier &&
            result.confidence == match_confidence::high) {
            result.confidence = match_confidence::medium;
        }
    }

    if (result.conflicting_identifier) {
        result.action = record::suggested_action::manual_review;
    } else if (result.score >= config_.auto_merge_threshold) {
        result.action = record::suggested_action::merge;
    } else if (result.score >= options.threshold) {
        result.action = record::suggested_action::mark_duplicate;
    } else {
        result.action = record::suggested_action::keep_both;
    }

    // -------------------------------------------------------------------------
    // Decisive algorithm
    // -------------------------------------------------------------------------
    if (decisive_match) {
        result.algorithm = match_algorithm::field_exact;
    } else if (result.model_score &&
               (only_model || *result.model_score >= algorithmic)) {
        result.algorithm = match_algorithm::ml;
    } else {
        std::optional<match_algorithm> label;
        if (names_scored) {
            const std::pair<match_algorithm, double> ordered[] = {
                {match_algorithm::string, names.string},
                {match_algorithm::token, names.token},
                {match_algorithm::phonetic, names.phonetic},
            };
            for (const auto& [algorithm, value] : ordered) {
                if (enabled(algorithm) && value >= options.threshold) {
                    label = algorithm;
                    break;
                }
            }
        }

        if (!label) {
            double best = 0.0;
            auto consider = [&](match_algorithm algorithm, double value) {
                if (enabled(algorithm) && value > best) {
                    best = value;
                    label = algorithm;
                }
            };
            if (names_scored) {
                consider(match_algorithm::string, names.string);
                consider(match_algorithm::token, names.token);
                consider(match_algorithm::phonetic, names.phonetic);
            }
            consider(match_algorithm::address, address_score.value_or(0.0));
            consider(match_algorithm::field_exact, exact_max);
        }

        result.algorithm = label.value_or(match_algorithm::string);
    }

    return result;
}

}  // namespace biz::dedup::match
