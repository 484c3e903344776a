#include "TermNormalizer.hpp"
#include "TextUtils.hpp"

namespace processing
{

TermNormalizer::TermNormalizer(NormalizationOptions options)
    : options_(options)
{
}

std::string TermNormalizer::normalize(const std::string& term) const
{
    if (!isActive() || term.empty())
        return term;

    std::string out = term;
    if (options_.treat_hyphen_dash_equal)
        out = unifyDashes(out);
    if (options_.normalize_diacritics)
        out = stripDiacritics(out);
    if (options_.ignore_case)
        out = caseFold(out);
    return out;
}

bool TermNormalizer::isActive() const
{
    return options_.ignore_case || options_.normalize_diacritics || options_.treat_hyphen_dash_equal;
}

} // namespace processing
