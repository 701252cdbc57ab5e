#pragma once

#include <string>
#include <utility>
#include <vector>

namespace product_sync {

/// Decomposed URL components.
struct UrlParts {
    std::string scheme;   // "http" or "https"
    std::string host;
    std::string port;     // "80", "443", "4000", etc.
    std::string target;   // path + query (e.g. "/v1/items?pageSize=10")
};

/// Parse an HTTP(S) URL into its components.
/// Throws std::invalid_argument on malformed input.
UrlParts parseUrl(const std::string& url);

/// Percent-encode a query-string component (RFC 3986 unreserved set kept).
std::string urlEncode(const std::string& value);

/// Ordered list of text fields sent as multipart/form-data.
using FormFields = std::vector<std::pair<std::string, std::string>>;

/// Render @p fields as a multipart/form-data body delimited by @p boundary.
std::string buildMultipartBody(const FormFields& fields,
                               const std::string& boundary);

/// Strip leading/trailing whitespace.
std::string trim(const std::string& s);

std::string toLower(std::string s);

/// Load KEY=VALUE lines from @p path into the process environment.
/// Variables already set are left alone.  Returns the number of variables set;
/// a missing file is not an error.
int loadDotEnv(const std::string& path);

} // namespace product_sync
