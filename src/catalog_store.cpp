#include "catalog_store.hpp"
#include "catalog_document.hpp"
#include "naming.hpp"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace product_sync {

namespace {

using Json = nlohmann::ordered_json;

const char* kMetadata   = "metadata";
const char* kGamepasses = "gamepasses";
const char* kProducts   = "products";

const char* sectionName(ProductKind kind) {
    return kind == ProductKind::GamePass ? kGamepasses : kProducts;
}

[[noreturn]] void formatError(const std::string& where, const std::string& what) {
    throw std::runtime_error("Malformed catalog at '" + where + "': " + what);
}

std::optional<std::string> optString(const Json& obj, const char* key,
                                     const std::string& where) {
    if (!obj.contains(key) || obj[key].is_null()) return std::nullopt;
    if (!obj[key].is_string()) formatError(where + "." + key, "expected a string");
    return obj[key].get<std::string>();
}

std::optional<int64_t> optInt(const Json& obj, const char* key,
                              const std::string& where) {
    if (!obj.contains(key) || obj[key].is_null()) return std::nullopt;
    if (!obj[key].is_number_integer()) formatError(where + "." + key, "expected an integer");
    return obj[key].get<int64_t>();
}

/// Ids span the full unsigned 64-bit range.
std::optional<uint64_t> optId(const Json& obj, const char* key,
                              const std::string& where) {
    if (!obj.contains(key) || obj[key].is_null()) return std::nullopt;
    const Json& value = obj[key];
    if (!value.is_number_integer()) formatError(where + "." + key, "expected an integer");
    if (!value.is_number_unsigned() && value.get<int64_t>() < 0) {
        formatError(where + "." + key, "must not be negative");
    }
    return value.get<uint64_t>();
}

std::optional<bool> optBool(const Json& obj, const char* key,
                            const std::string& where) {
    if (!obj.contains(key) || obj[key].is_null()) return std::nullopt;
    if (!obj[key].is_boolean()) formatError(where + "." + key, "expected true or false");
    return obj[key].get<bool>();
}

template <typename T>
T required(const std::optional<T>& value, const std::string& where, const char* key) {
    if (!value) formatError(where + "." + key, "missing required key");
    return *value;
}

Product productFromJson(const Json& node, const std::string& where) {
    if (!node.is_object()) formatError(where, "expected an object");

    Product p;
    p.id              = optId(node, "id", where);
    p.name            = required(optString(node, "name", where), where, "name");
    p.prefix          = optString(node, "prefix", where);
    p.description     = optString(node, "description", where);
    p.active          = required(optBool(node, "active", where), where, "active");
    p.price           = required(optInt(node, "price", where), where, "price");
    p.regionalPricing = optBool(node, "regional-pricing", where);

    if (p.price < 0) formatError(where + ".price", "must not be negative");

    if (auto discount = optInt(node, "discount", where)) {
        if (*discount < 0 || *discount > 100) {
            formatError(where + ".discount", "must be between 0 and 100");
        }
        p.discount = static_cast<int>(*discount);
    }
    return p;
}

template <typename T>
void setOrErase(Json& obj, const char* key, const std::optional<T>& value) {
    if (value) {
        obj[key] = *value;
    } else {
        obj.erase(std::string(key));
    }
}

void writeProduct(Json& entry, const Product& p) {
    if (!entry.is_object()) entry = Json::object();

    setOrErase(entry, "id", p.id);
    setOrErase(entry, "prefix", p.prefix);
    entry["name"] = p.name;
    setOrErase(entry, "description", p.description);
    entry["active"] = p.active;
    setOrErase(entry, "discount", p.discount);
    entry["price"] = p.price;
    setOrErase(entry, "regional-pricing", p.regionalPricing);
}

std::string luauString(const std::string& s) {
    std::string out = "\"";
    for (unsigned char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (c < 0x20 || c == 0x7F) {
                    char buf[5];
                    std::snprintf(buf, sizeof(buf), "\\x%02X", c);
                    out += buf;
                } else {
                    out.push_back(static_cast<char>(c));
                }
        }
    }
    out += "\"";
    return out;
}

void renderTable(std::ostringstream& out, const std::map<std::string, Product>& items) {
    std::vector<const Product*> values;
    values.reserve(items.size());
    for (const auto& [key, product] : items) {
        values.push_back(&product);
    }
    std::stable_sort(values.begin(), values.end(), [](const Product* a, const Product* b) {
        return a->id.value_or(0) < b->id.value_or(0);
    });

    for (std::size_t i = 0; i < values.size(); ++i) {
        const Product& p = *values[i];
        out << "\t\t[" << luauString(p.effectiveTitle()) << "] = { id = "
            << p.id.value_or(0) << ", price = " << p.effectivePrice() << " }";
        out << (i + 1 < values.size() ? ",\n" : "\n");
    }
}

void writeFile(const fs::path& path, const std::string& contents) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("Cannot open '" + path.string() + "' for writing");
    }
    out << contents;
    out.flush();
    if (!out) {
        throw std::runtime_error("Failed writing '" + path.string() + "'");
    }
}

} // namespace

CatalogStore::CatalogStore(std::string path)
    : mPath(std::move(path)) {}

bool CatalogStore::exists() const {
    std::error_code ec;
    return fs::exists(mPath, ec);
}

// ---------------------------------------------------------------------------
// Reading
// ---------------------------------------------------------------------------

std::string CatalogStore::readText() const {
    std::ifstream in(mPath, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Cannot open catalog '" + mPath + "'");
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

Json CatalogStore::parseDocument(const std::string& text) const {
    try {
        return Json::parse(text, nullptr, /*allow_exceptions=*/true,
                           /*ignore_comments=*/true);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Failed to parse catalog '" + mPath + "': " + e.what());
    }
}

Catalog CatalogStore::fromJson(const Json& doc) {
    if (!doc.is_object()) formatError("<root>", "expected an object");
    if (!doc.contains(kMetadata) || !doc[kMetadata].is_object()) {
        formatError(kMetadata, "missing metadata table");
    }

    Catalog catalog;
    const Json& meta = doc[kMetadata];

    catalog.metadata.universeId     = required(optId(meta, "universe-id", kMetadata),
                                               kMetadata, "universe-id");
    catalog.metadata.discountPrefix = optString(meta, "discount-prefix", kMetadata);
    catalog.metadata.luauFile       = optString(meta, "luau-file", kMetadata);

    if (meta.contains("name-filters") && !meta["name-filters"].is_null()) {
        const Json& filters = meta["name-filters"];
        if (!filters.is_array()) formatError("metadata.name-filters", "expected an array");
        for (const auto& f : filters) {
            if (!f.is_string()) formatError("metadata.name-filters", "expected strings");
            catalog.metadata.nameFilters.push_back(makeNameFilter(f.get<std::string>()));
        }
    }

    for (ProductKind kind : {ProductKind::GamePass, ProductKind::DevProduct}) {
        const char* section = sectionName(kind);
        if (!doc.contains(section) || doc[section].is_null()) continue;
        if (!doc[section].is_object()) formatError(section, "expected a table");

        auto& target = catalog.collection(kind);
        for (const auto& [key, node] : doc[section].items()) {
            target.emplace(key, productFromJson(node, std::string(section) + "." + key));
        }
    }

    return catalog;
}

Catalog CatalogStore::load() const {
    return fromJson(parseDocument(readText()));
}

// ---------------------------------------------------------------------------
// Writing
// ---------------------------------------------------------------------------

void CatalogStore::mergeInto(Json& doc, const Catalog& catalog) {
    if (!doc.is_object()) doc = Json::object();

    Json& meta = doc[kMetadata];
    if (!meta.is_object()) meta = Json::object();

    meta["universe-id"] = catalog.metadata.universeId;
    setOrErase(meta, "discount-prefix", catalog.metadata.discountPrefix);
    setOrErase(meta, "luau-file", catalog.metadata.luauFile);

    Json filters = Json::array();
    for (const auto& f : catalog.metadata.nameFilters) {
        filters.push_back(f.pattern);
    }
    meta["name-filters"] = std::move(filters);

    for (ProductKind kind : {ProductKind::GamePass, ProductKind::DevProduct}) {
        Json& section = doc[sectionName(kind)];
        if (!section.is_object()) section = Json::object();

        for (const auto& [key, product] : catalog.collection(kind)) {
            writeProduct(section[key], product);
        }
    }
}

void CatalogStore::save(const Catalog& catalog) const {
    if (!exists()) {
        Json doc = Json::object();
        mergeInto(doc, catalog);
        writeFile(mPath, doc.dump(4) + "\n");
        return;
    }

    // Edit the existing text in place so comments and layout survive.
    const std::string original = readText();
    Json doc = parseDocument(original);
    mergeInto(doc, catalog);
    writeFile(mPath, patchJsonText(original, doc));
}

void CatalogStore::init(uint64_t universeId) const {
    if (exists()) {
        throw std::runtime_error("'" + mPath + "' already exists; refusing to overwrite");
    }

    Catalog catalog;
    catalog.metadata.universeId     = universeId;
    catalog.metadata.discountPrefix = kDefaultDiscountPrefix;
    catalog.metadata.luauFile       = "products.luau";
    save(catalog);
}

// ---------------------------------------------------------------------------
// Luau export
// ---------------------------------------------------------------------------

std::string CatalogStore::renderLuau(const Catalog& catalog) {
    std::ostringstream out;
    out << "-- This file is automatically generated by product_sync. "
           "Do not edit this file directly.\n";
    out << "export type Product = { id: number, price: number }\n\n";
    out << "return {\n\tGamepasses = {\n";
    renderTable(out, catalog.gamepasses);
    out << "\t} :: {[string]: Product},\n\n\tProducts = {\n";
    renderTable(out, catalog.products);
    out << "\t} :: {[string]: Product}\n}\n";
    return out.str();
}

void CatalogStore::exportLuau(const Catalog& catalog) const {
    if (!catalog.metadata.luauFile) return;

    fs::path target(*catalog.metadata.luauFile);
    if (target.is_relative()) {
        target = fs::path(mPath).parent_path() / target;
    }
    writeFile(target, renderLuau(catalog));
}

} // namespace product_sync
