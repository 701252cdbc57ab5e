#pragma once

#include "models.hpp"

#include <optional>
#include <string>
#include <vector>

namespace product_sync {

/// Discount prefix used when the catalog does not configure one.
/// "{}" is replaced by the discount percentage.
inline const std::string kDefaultDiscountPrefix = "💲{}% OFF💲";

/// Built-in name filters: the default discount prefix, bracketed text,
/// and anything outside [A-Za-z0-9!?,.-] and whitespace.
const std::vector<NameFilter>& defaultNameFilters();

/// Compile a user filter.  Throws std::runtime_error on an invalid pattern.
NameFilter makeNameFilter(const std::string& pattern);

/// Replace every filter match with a space, collapse whitespace runs, trim.
/// An empty @p filters list means defaultNameFilters().
std::string canonicalName(const std::string& name,
                          const std::vector<NameFilter>& filters);

/// Lowercase, drop everything but alphanumerics and whitespace, trim,
/// and join whitespace runs with '-'.
std::string slugify(const std::string& name);

/// True when the text is made only of '#' placeholders and whitespace.
bool isCensored(const std::string& text);

/// Substitute @p discount for every "{}" in @p templ.
std::string formatDiscountPrefix(const std::string& templ, int discount);

/// Prepend the formatted discount prefix to product.name when it has an
/// active discount.  Falls back to kDefaultDiscountPrefix.
void applyDiscountPrefix(Product& product,
                         const std::optional<std::string>& templ);

} // namespace product_sync
