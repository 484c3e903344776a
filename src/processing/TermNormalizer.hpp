#pragma once

#include "ITermNormalizer.hpp"

namespace processing
{

struct NormalizationOptions
{
    bool ignore_case = false;
    bool normalize_diacritics = false;
    bool treat_hyphen_dash_equal = false;
};

/**
 * @brief utf8proc-backed term normalizer.
 *
 * Applies, in order: dash unification, diacritic stripping, Unicode case folding.
 * Every option defaults to off so that comparisons stay exact unless a data
 * owner opts in.
 */
class TermNormalizer : public ITermNormalizer
{
public:
    explicit TermNormalizer(NormalizationOptions options = {});

    [[nodiscard]] std::string normalize(const std::string& term) const override;
    [[nodiscard]] bool isActive() const override;

    const NormalizationOptions& options() const { return options_; }

private:
    NormalizationOptions options_;
};

} // namespace processing
