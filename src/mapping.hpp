#pragma once

#include "http_client.hpp"
#include "models.hpp"
#include "util.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace product_sync {

/// Result of parsing one page of a list endpoint.
struct PageResult {
    std::vector<nlohmann::json> items;
    std::optional<std::string>  nextCursor;
};

/// Parse a list response body: items under @p itemsKey, cursor under
/// "nextPageToken" (absent, null or "" means last page).
/// Throws std::runtime_error if the expected shape is missing.
PageResult parsePage(const nlohmann::json& responseBody, const std::string& itemsKey);

/// Map single JSON nodes into remote records.
/// Throws std::runtime_error when the id is missing or a field has the wrong type.
GamePass   parseGamePassNode(const nlohmann::json& node);
DevProduct parseDevProductNode(const nlohmann::json& node);

/// Convert remote records into catalog products.  Discount and prefix are
/// never populated; regional pricing is inferred from enabledFeatures.
Product toProduct(const GamePass& pass);
Product toProduct(const DevProduct& product);

/// Build the create/update body for a product using its effective values.
ProductUpdateRequest toUpdateRequest(const Product& product);

/// Multipart text fields for a create/update call.  "price" is omitted when
/// zero or absent; optional fields are omitted when absent.
FormFields toFormFields(const ProductUpdateRequest& request);

/// Return human-readable error messages from an API error body (may be empty).
std::vector<std::string> extractApiErrors(const nlohmann::json& responseBody);

/// Throw std::runtime_error describing a non-2xx response to @p request.
void ensureSuccess(const HttpResponse& response, const HttpRequest& request);

/// Parse a response body as JSON.  Throws std::runtime_error on parse errors.
nlohmann::json parseJsonBody(const HttpResponse& response, const HttpRequest& request);

} // namespace product_sync
