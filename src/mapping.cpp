#include "mapping.hpp"

#include <algorithm>
#include <stdexcept>

namespace product_sync {

namespace {

const char* kRegionalPricingFeature = "RegionalPricing";

std::optional<std::string> optionalString(const nlohmann::json& node, const char* key) {
    if (!node.contains(key) || node[key].is_null()) {
        return std::nullopt;
    }
    return node[key].get<std::string>();
}

uint64_t requiredId(const nlohmann::json& node, const char* key) {
    if (!node.contains(key) || !node[key].is_number_integer() ||
        (!node[key].is_number_unsigned() && node[key].get<int64_t>() < 0)) {
        throw std::runtime_error(std::string("Remote record missing numeric '") +
                                 key + "' field");
    }
    return node[key].get<uint64_t>();
}

std::optional<PriceInformation> parsePriceInformation(const nlohmann::json& node) {
    if (!node.contains("priceInformation") || node["priceInformation"].is_null()) {
        return std::nullopt;
    }
    const auto& pi = node["priceInformation"];

    PriceInformation info;
    if (pi.contains("defaultPriceInRobux") && !pi["defaultPriceInRobux"].is_null()) {
        info.defaultPriceInRobux = pi["defaultPriceInRobux"].get<uint64_t>();
    }
    if (pi.contains("enabledFeatures") && pi["enabledFeatures"].is_array()) {
        info.enabledFeatures = pi["enabledFeatures"].get<std::vector<std::string>>();
    }
    return info;
}

void applyPriceInformation(Product& p, const std::optional<PriceInformation>& info) {
    if (!info) return;

    p.price = static_cast<int64_t>(info->defaultPriceInRobux);
    if (info->enabledFeatures) {
        const auto& features = *info->enabledFeatures;
        p.regionalPricing = std::find(features.begin(), features.end(),
                                      kRegionalPricingFeature) != features.end();
    }
}

} // namespace

// ---------------------------------------------------------------------------
// Nodes
// ---------------------------------------------------------------------------

GamePass parseGamePassNode(const nlohmann::json& node) {
    try {
        GamePass gp;
        gp.gamePassId       = requiredId(node, "gamePassId");
        gp.name             = node.value("name", "");
        gp.description      = optionalString(node, "description");
        gp.isForSale        = node.value("isForSale", false);
        gp.iconAssetId      = node.value("iconAssetId", uint64_t{0});
        gp.createdTimestamp = node.value("createdTimestamp", "");
        gp.updatedTimestamp = node.value("updatedTimestamp", "");
        gp.priceInformation = parsePriceInformation(node);
        return gp;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("Malformed game pass record: ") + e.what());
    }
}

DevProduct parseDevProductNode(const nlohmann::json& node) {
    try {
        DevProduct dp;
        dp.productId        = requiredId(node, "productId");
        dp.name             = node.value("name", "");
        dp.description      = optionalString(node, "description");
        dp.universeId       = node.value("universeId", uint64_t{0});
        dp.isForSale        = node.value("isForSale", false);
        dp.storePageEnabled = node.value("storePageEnabled", false);
        dp.isImmutable      = node.value("isImmutable", false);
        dp.createdTimestamp = node.value("createdTimestamp", "");
        dp.updatedTimestamp = node.value("updatedTimestamp", "");
        dp.priceInformation = parsePriceInformation(node);
        return dp;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("Malformed developer product record: ") +
                                 e.what());
    }
}

PageResult parsePage(const nlohmann::json& responseBody, const std::string& itemsKey) {
    PageResult result;

    if (!responseBody.is_object()) {
        throw std::runtime_error("List response is not a JSON object");
    }
    if (!responseBody.contains(itemsKey) || !responseBody[itemsKey].is_array()) {
        throw std::runtime_error("List response missing '" + itemsKey + "' array");
    }

    for (const auto& item : responseBody[itemsKey]) {
        result.items.push_back(item);
    }

    if (responseBody.contains("nextPageToken") &&
        responseBody["nextPageToken"].is_string()) {
        auto token = responseBody["nextPageToken"].get<std::string>();
        if (!token.empty()) {
            result.nextCursor = std::move(token);
        }
    }

    return result;
}

// ---------------------------------------------------------------------------
// Record <-> Product
// ---------------------------------------------------------------------------

Product toProduct(const GamePass& pass) {
    Product p;
    p.id          = pass.gamePassId;
    p.name        = pass.name;
    p.description = pass.description;
    p.active      = pass.isForSale;
    applyPriceInformation(p, pass.priceInformation);
    return p;
}

Product toProduct(const DevProduct& product) {
    Product p;
    p.id          = product.productId;
    p.name        = product.name;
    p.description = product.description;
    p.active      = product.isForSale;
    applyPriceInformation(p, product.priceInformation);
    return p;
}

ProductUpdateRequest toUpdateRequest(const Product& product) {
    ProductUpdateRequest req;
    req.name                     = product.effectiveTitle();
    req.description              = product.description;
    req.isForSale                = product.active;
    req.price                    = product.effectivePrice();
    req.isRegionalPricingEnabled = product.regionalPricing;
    return req;
}

FormFields toFormFields(const ProductUpdateRequest& request) {
    FormFields fields;
    fields.emplace_back("name", request.name);

    if (request.description) {
        fields.emplace_back("description", *request.description);
    }
    if (request.isForSale) {
        fields.emplace_back("isForSale", *request.isForSale ? "true" : "false");
    }
    if (request.price && *request.price > 0) {
        fields.emplace_back("price", std::to_string(*request.price));
    }
    if (request.isRegionalPricingEnabled) {
        fields.emplace_back("isRegionalPricingEnabled",
                            *request.isRegionalPricingEnabled ? "true" : "false");
    }
    return fields;
}

std::vector<std::string> extractApiErrors(const nlohmann::json& responseBody) {
    std::vector<std::string> errors;

    if (!responseBody.is_object()) return errors;

    if (responseBody.contains("errors") && responseBody["errors"].is_array()) {
        for (const auto& err : responseBody["errors"]) {
            if (err.is_object()) {
                errors.push_back(err.value("message", "Unknown API error"));
            }
        }
    } else if (responseBody.contains("message") && responseBody["message"].is_string()) {
        errors.push_back(responseBody["message"].get<std::string>());
    }
    return errors;
}

void ensureSuccess(const HttpResponse& response, const HttpRequest& request) {
    if (response.ok()) return;

    std::string detail;
    const auto body = nlohmann::json::parse(response.body, nullptr, /*allow_exceptions=*/false);
    const auto errors = extractApiErrors(body);
    if (!errors.empty()) {
        for (const auto& err : errors) {
            if (!detail.empty()) detail += "; ";
            detail += err;
        }
    } else {
        detail = response.body.size() <= 200 ? response.body
                                             : response.body.substr(0, 200) + "...";
    }

    throw std::runtime_error("HTTP " + std::to_string(response.httpStatus) + " from " +
                             request.method + " " + request.url + ": " + detail);
}

nlohmann::json parseJsonBody(const HttpResponse& response, const HttpRequest& request) {
    try {
        return nlohmann::json::parse(response.body);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Failed to parse JSON response from " + request.method +
                                 " " + request.url + ": " + e.what());
    }
}

} // namespace product_sync
