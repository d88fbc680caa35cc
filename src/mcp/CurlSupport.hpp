#pragma once

#include "Errors.hpp"
#include <memory>
#include <string>
#include <curl/curl.h>

namespace mcphub {

struct CurlSlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

using CurlSlistPtr = std::unique_ptr<curl_slist, CurlSlistDeleter>;

/**
 * @brief Run curl_global_init exactly once per process
 */
void ensure_curl_global_init();

/**
 * @brief Append a header line to a list, taking ownership of the result
 */
void append_header(CurlSlistPtr& list, const std::string& line);

/**
 * @brief Build a ConnectionError for a failed transfer
 * @param code libcurl result
 * @param errbuf CURLOPT_ERRORBUFFER contents (may be empty)
 */
ConnectionError connection_error_from(CURLcode code, const char* errbuf);

} // namespace mcphub
