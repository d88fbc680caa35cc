#include "CurlSupport.hpp"
#include <spdlog/spdlog.h>
#include <cstring>
#include <mutex>

namespace mcphub {

void ensure_curl_global_init() {
    static std::once_flag once;
    std::call_once(once, [] {
        CURLcode code = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (code != CURLE_OK) {
            spdlog::error("curl_global_init failed: {}", curl_easy_strerror(code));
        }
    });
}

void append_header(CurlSlistPtr& list, const std::string& line) {
    curl_slist* appended = curl_slist_append(list.get(), line.c_str());
    if (!appended) {
        throw std::bad_alloc();
    }
    list.release();
    list.reset(appended);
}

ConnectionError connection_error_from(CURLcode code, const char* errbuf) {
    std::string detail = (errbuf && std::strlen(errbuf) > 0) ? errbuf : curl_easy_strerror(code);

    switch (code) {
        case CURLE_UNSUPPORTED_PROTOCOL:
        case CURLE_URL_MALFORMAT:
        case CURLE_NOT_BUILT_IN:
        case CURLE_WEIRD_SERVER_REPLY:
        case CURLE_HTTP2:
        case CURLE_GOT_NOTHING:
            return ConnectionError(ConnectionError::Reason::ProtocolMismatch, detail);
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
            return ConnectionError(ConnectionError::Reason::Closed, detail);
        default:
            return ConnectionError(ConnectionError::Reason::Unreachable, detail);
    }
}

} // namespace mcphub
