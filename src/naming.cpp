#include "naming.hpp"
#include "util.hpp"

#include <cctype>
#include <stdexcept>

namespace product_sync {

const std::vector<NameFilter>& defaultNameFilters() {
    static const std::vector<NameFilter> filters = {
        makeNameFilter("💲.*?% OFF💲"),
        makeNameFilter(R"(\[.*?\])"),
        makeNameFilter(R"([^a-zA-Z0-9!?,.\s-])"),
    };
    return filters;
}

NameFilter makeNameFilter(const std::string& pattern) {
    try {
        return NameFilter{pattern, std::regex(pattern, std::regex::ECMAScript)};
    } catch (const std::regex_error& e) {
        throw std::runtime_error("Invalid name filter `" + pattern + "`: " + e.what());
    }
}

std::string canonicalName(const std::string& name,
                          const std::vector<NameFilter>& filters) {
    static const std::regex kWhitespace(R"(\s+)");

    const auto& active = filters.empty() ? defaultNameFilters() : filters;

    std::string out = name;
    for (const auto& filter : active) {
        out = std::regex_replace(out, filter.regex, " ");
    }

    out = std::regex_replace(out, kWhitespace, " ");
    return trim(out);
}

std::string slugify(const std::string& name) {
    std::string kept;
    kept.reserve(name.size());

    for (unsigned char c : toLower(name)) {
        if (c < 0x80 && (std::isalnum(c) || std::isspace(c))) {
            kept.push_back(static_cast<char>(c));
        }
    }

    std::string slug;
    bool pendingDash = false;
    for (unsigned char c : trim(kept)) {
        if (std::isspace(c)) {
            pendingDash = true;
            continue;
        }
        if (pendingDash) {
            slug.push_back('-');
            pendingDash = false;
        }
        slug.push_back(static_cast<char>(c));
    }
    return slug;
}

bool isCensored(const std::string& text) {
    for (unsigned char c : text) {
        if (c != '#' && !std::isspace(c)) return false;
    }
    return true;
}

std::string formatDiscountPrefix(const std::string& templ, int discount) {
    const std::string pct = std::to_string(discount);

    std::string out;
    std::size_t pos = 0;
    while (true) {
        auto slot = templ.find("{}", pos);
        if (slot == std::string::npos) {
            out.append(templ, pos, std::string::npos);
            break;
        }
        out.append(templ, pos, slot - pos);
        out += pct;
        pos = slot + 2;
    }
    return out;
}

void applyDiscountPrefix(Product& product,
                         const std::optional<std::string>& templ) {
    if (!product.hasDiscount()) return;

    const std::string prefix =
        formatDiscountPrefix(templ.value_or(kDefaultDiscountPrefix), *product.discount);
    product.name = prefix + " " + product.name;
}

} // namespace product_sync
