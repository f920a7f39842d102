#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "thresholds/ithreshold_store.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace equipstat {

/**
 * @brief Process-wide threshold fallback, as raw configuration text
 *
 * Each value is parsed and range-checked independently by the resolver;
 * an absent, unparsable or out-of-range value falls back to the hardcoded
 * default for that field only.
 */
struct ThresholdFallbackConfig {
    std::optional<std::string> warning_percentile;
    std::optional<std::string> outlier_iqr_multiplier;
};

/**
 * @brief Resolves classification thresholds through three tiers
 *
 *   1. user override row in the threshold store
 *   2. process-wide fallback configuration (per field)
 *   3. hardcoded defaults (0.75, 1.5)
 *
 * resolve() does not fail on store errors (any std::runtime_error from the
 * store falls through to tier 2). Also validates and persists user-submitted
 * overrides.
 */
class ThresholdResolver {
public:
    struct FieldError {
        std::string field;
        std::string message;
    };

    struct SaveResult {
        bool success = false;
        std::vector<FieldError> errors;     // one per offending field
        std::string error_message;          // storage failure
        ThresholdSettings settings;
    };

    struct Resolved {
        ThresholdPair values;
        bool is_custom = false;             // tier 1 supplied the values
    };

    ThresholdResolver(std::shared_ptr<IThresholdStore> store,
                      const ThresholdFallbackConfig& fallback);

    [[nodiscard]] ThresholdPair resolve(const std::string& user) const;

    [[nodiscard]] Resolved describe(const std::string& user) const;

    /// Tier 2/3 result, computed once at construction
    [[nodiscard]] const ThresholdPair& fallback() const { return fallback_; }

    /**
     * @brief Validate and persist a (partial) override
     *
     * Every out-of-range or non-finite field is reported; nothing is written
     * if any field is rejected.
     */
    [[nodiscard]] SaveResult save(const std::string& user, const ThresholdUpdate& update);

    /**
     * @brief Remove the user's override, reverting to fallback behaviour
     * @return true if an override existed
     */
    [[nodiscard]] Result<bool> reset(const std::string& user);

    [[nodiscard]] static std::vector<FieldError> validate(const ThresholdUpdate& update);

    [[nodiscard]] static bool valid_warning_percentile(double v);
    [[nodiscard]] static bool valid_iqr_multiplier(double v);

    /// Tier 2 parsing: text -> in-range value, or nullopt
    [[nodiscard]] static std::optional<double> parse_warning_percentile(
        const std::optional<std::string>& raw);
    [[nodiscard]] static std::optional<double> parse_iqr_multiplier(
        const std::optional<std::string>& raw);

private:
    [[nodiscard]] std::optional<ThresholdPair> user_override(const std::string& user) const;

    std::shared_ptr<IThresholdStore> store_;
    ThresholdPair fallback_;
};

} // namespace equipstat
