#include "thresholds/threshold_resolver.hpp"
#include "core/utils.hpp"

#include <cmath>
#include <format>
#include <stdexcept>

namespace equipstat {

namespace {

template<typename Validator>
std::optional<double> parse_in_range(const std::optional<std::string>& raw,
                                     const char* name, Validator valid) {
    if (!raw || utils::trim(*raw).empty()) return std::nullopt;
    const auto parsed = utils::try_parse_double(*raw);
    if (!parsed || !valid(*parsed)) {
        utils::log::warn(std::format(
            "Ignoring fallback {} '{}': not a number in range", name, *raw));
        return std::nullopt;
    }
    return parsed;
}

} // anonymous namespace

ThresholdResolver::ThresholdResolver(std::shared_ptr<IThresholdStore> store,
                                     const ThresholdFallbackConfig& fallback)
    : store_(std::move(store)) {
    fallback_.warning_percentile = parse_warning_percentile(fallback.warning_percentile)
        .value_or(ThresholdLimits::kDefaultWarning);
    fallback_.outlier_iqr_multiplier = parse_iqr_multiplier(fallback.outlier_iqr_multiplier)
        .value_or(ThresholdLimits::kDefaultIqr);
}

bool ThresholdResolver::valid_warning_percentile(double v) {
    return std::isfinite(v) &&
           v >= ThresholdLimits::kWarningMin && v <= ThresholdLimits::kWarningMax;
}

bool ThresholdResolver::valid_iqr_multiplier(double v) {
    return std::isfinite(v) &&
           v >= ThresholdLimits::kIqrMin && v <= ThresholdLimits::kIqrMax;
}

std::optional<double> ThresholdResolver::parse_warning_percentile(
    const std::optional<std::string>& raw) {
    return parse_in_range(raw, "warning_percentile", valid_warning_percentile);
}

std::optional<double> ThresholdResolver::parse_iqr_multiplier(
    const std::optional<std::string>& raw) {
    return parse_in_range(raw, "outlier_iqr_multiplier", valid_iqr_multiplier);
}

std::optional<ThresholdPair> ThresholdResolver::user_override(const std::string& user) const {
    if (!store_) return std::nullopt;

    std::optional<ThresholdSettings> row;
    try {
        row = store_->get(user);
    } catch (const std::runtime_error& e) {
        utils::log::warn(std::format(
            "Threshold lookup for '{}' failed, using fallback: {}", user, e.what()));
        return std::nullopt;
    }
    if (!row) return std::nullopt;

    if (!valid_warning_percentile(row->warning_percentile) ||
        !valid_iqr_multiplier(row->outlier_iqr_multiplier)) {
        utils::log::warn(std::format(
            "Stored thresholds for '{}' out of range ({}, {}), using fallback",
            user, row->warning_percentile, row->outlier_iqr_multiplier));
        return std::nullopt;
    }
    return ThresholdPair{row->warning_percentile, row->outlier_iqr_multiplier};
}

ThresholdPair ThresholdResolver::resolve(const std::string& user) const {
    return describe(user).values;
}

ThresholdResolver::Resolved ThresholdResolver::describe(const std::string& user) const {
    if (const auto custom = user_override(user)) {
        return {*custom, true};
    }
    return {fallback_, false};
}

std::vector<ThresholdResolver::FieldError> ThresholdResolver::validate(
    const ThresholdUpdate& update) {
    std::vector<FieldError> errors;
    if (!update.warning_percentile && !update.outlier_iqr_multiplier) {
        errors.push_back({"thresholds",
            "at least one of warning_percentile, outlier_iqr_multiplier is required"});
        return errors;
    }
    if (update.warning_percentile && !valid_warning_percentile(*update.warning_percentile)) {
        errors.push_back({"warning_percentile",
            std::format("must be between {:.2f} and {:.2f}",
                        ThresholdLimits::kWarningMin, ThresholdLimits::kWarningMax)});
    }
    if (update.outlier_iqr_multiplier && !valid_iqr_multiplier(*update.outlier_iqr_multiplier)) {
        errors.push_back({"outlier_iqr_multiplier",
            std::format("must be between {:.1f} and {:.1f}",
                        ThresholdLimits::kIqrMin, ThresholdLimits::kIqrMax)});
    }
    return errors;
}

ThresholdResolver::SaveResult ThresholdResolver::save(const std::string& user,
                                                      const ThresholdUpdate& update) {
    SaveResult result;
    result.errors = validate(update);
    if (!result.errors.empty()) {
        return result;
    }
    if (!store_) {
        result.error_message = "No threshold store configured";
        return result;
    }

    try {
        result.settings = store_->merge(user, update, fallback_);
        result.success = true;
        utils::log::info(std::format(
            "Thresholds for '{}' saved: warning_percentile={} outlier_iqr_multiplier={}",
            user, result.settings.warning_percentile, result.settings.outlier_iqr_multiplier));
    } catch (const std::exception& e) {
        result.error_message = std::format("Failed to save thresholds: {}", e.what());
        utils::log::error(result.error_message);
    }
    return result;
}

Result<bool> ThresholdResolver::reset(const std::string& user) {
    if (!store_) {
        return Result<bool>::ok(false);
    }
    try {
        const bool existed = store_->remove(user);
        if (existed) {
            utils::log::info(std::format("Thresholds for '{}' reset to fallback", user));
        }
        return Result<bool>::ok(existed);
    } catch (const std::exception& e) {
        return Result<bool>::error(ErrorCategory::STORAGE_ERROR,
            std::format("Failed to reset thresholds: {}", e.what()));
    }
}

} // namespace equipstat
