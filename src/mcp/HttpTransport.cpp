#include "HttpTransport.hpp"
#include "CurlSupport.hpp"
#include "Errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <sstream>
#include <vector>

namespace mcphub {

namespace {

struct ReplyCapture {
    std::string body;
    std::string content_type;
    std::string session_id;
};

size_t body_callback(char* data, size_t size, size_t nmemb, void* userdata) {
    auto* capture = static_cast<ReplyCapture*>(userdata);
    size_t len = size * nmemb;
    capture->body.append(data, len);
    return len;
}

std::string trim(const std::string& value) {
    auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

size_t header_callback(char* data, size_t size, size_t nmemb, void* userdata) {
    auto* capture = static_cast<ReplyCapture*>(userdata);
    size_t len = size * nmemb;
    std::string line(data, len);

    auto colon = line.find(':');
    if (colon != std::string::npos) {
        std::string name = to_lower(trim(line.substr(0, colon)));
        std::string value = trim(line.substr(colon + 1));
        if (name == "content-type") {
            capture->content_type = to_lower(value);
        } else if (name == "mcp-session-id") {
            capture->session_id = value;
        }
    }
    return len;
}

} // namespace

HttpTransport::HttpTransport(const ServiceConfig& config)
    : endpoint_(config.endpoint),
      headers_(config.headers.value_or(std::map<std::string, std::string>{})),
      auth_(config.auth.value_or(json())),
      timeout_seconds_(config.timeout_seconds > 0 ? config.timeout_seconds : 30) {
    spdlog::debug("HttpTransport initialized for {}", endpoint_);
}

HttpTransport::~HttpTransport() {
    disconnect();
}

void HttpTransport::connect() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (curl_) {
        return;
    }

    std::string scheme = to_lower(endpoint_.substr(0, endpoint_.find("://")));
    if (endpoint_.find("://") == std::string::npos || (scheme != "http" && scheme != "https")) {
        throw ConnectionError(ConnectionError::Reason::ProtocolMismatch,
                              "Not an HTTP endpoint: " + endpoint_);
    }

    ensure_curl_global_init();
    curl_ = curl_easy_init();
    if (!curl_) {
        throw ConnectionError(ConnectionError::Reason::Unreachable,
                              "Failed to initialize HTTP handle");
    }

    session_id_.clear();
    connected_ = true;
    spdlog::debug("HttpTransport ready for {}", endpoint_);
}

void HttpTransport::disconnect() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (curl_) {
        curl_easy_cleanup(curl_);
        curl_ = nullptr;
    }
    session_id_.clear();
    connected_ = false;
}

std::optional<Message> HttpTransport::send(const Message& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!curl_) {
        throw ConnectionError(ConnectionError::Reason::NotConnected, "HTTP transport not connected");
    }

    std::string payload = message.to_json().dump();

    CurlSlistPtr headers;
    append_header(headers, "Content-Type: application/json");
    append_header(headers, "Accept: application/json, text/event-stream");
    for (const auto& [name, value] : headers_) {
        append_header(headers, name + ": " + value);
    }
    if (!session_id_.empty()) {
        append_header(headers, "Mcp-Session-Id: " + session_id_);
    }

    curl_easy_reset(curl_);

    if (auth_.is_object()) {
        if (auth_.contains("token") && auth_["token"].is_string()) {
            append_header(headers, "Authorization: Bearer " + auth_["token"].get<std::string>());
        } else if (auth_.contains("username") && auth_["username"].is_string()) {
            std::string userpwd = auth_["username"].get<std::string>() + ":" +
                                  auth_.value("password", "");
            curl_easy_setopt(curl_, CURLOPT_HTTPAUTH, CURLAUTH_BASIC);
            curl_easy_setopt(curl_, CURLOPT_USERPWD, userpwd.c_str());
        }
    }

    ReplyCapture capture;
    std::vector<char> errbuf(CURL_ERROR_SIZE, '\0');

    curl_easy_setopt(curl_, CURLOPT_URL, endpoint_.c_str());
    curl_easy_setopt(curl_, CURLOPT_POST, 1L);
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT, timeout_seconds_);
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl_, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl_, CURLOPT_ERRORBUFFER, errbuf.data());
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, body_callback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &capture);
    curl_easy_setopt(curl_, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl_, CURLOPT_HEADERDATA, &capture);

    spdlog::debug("POST {}: {}", endpoint_, payload);

    CURLcode code = curl_easy_perform(curl_);
    if (code == CURLE_OPERATION_TIMEDOUT) {
        throw TimeoutError(message.method());
    }
    if (code != CURLE_OK) {
        throw connection_error_from(code, errbuf.data());
    }

    long status = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &status);

    if (!capture.session_id.empty()) {
        session_id_ = capture.session_id;
    }

    std::string body = capture.body;
    if (capture.content_type.find("text/event-stream") != std::string::npos) {
        auto data = extract_event_data(body);
        body = data ? *data : std::string();
    }

    spdlog::debug("HTTP {} reply: {}", status, body);

    if (status >= 400) {
        // Some servers report JSON-RPC errors with an error status
        try {
            Message reply = Message::decode(body);
            if (reply.is_response()) {
                return reply;
            }
        } catch (const ProtocolViolation& e) {
            spdlog::debug("HTTP {} body is not an envelope: {}", status, e.what());
        }
        throw ConnectionError(ConnectionError::Reason::ProtocolMismatch,
                              "HTTP " + std::to_string(status) + " from " + endpoint_);
    }

    if (status == 202 || trim(body).empty()) {
        return std::nullopt;
    }

    return Message::decode(body);
}

Message HttpTransport::receive() {
    throw UnsupportedOperation("HTTP transport doesn't support receiving messages");
}

bool HttpTransport::is_connected() const {
    return connected_;
}

std::string HttpTransport::session_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_id_;
}

std::optional<std::string> HttpTransport::extract_event_data(const std::string& body) {
    std::istringstream stream(body);
    std::string line;
    std::string event_type;
    std::string data;
    bool has_data = false;

    auto dispatch = [&]() -> bool {
        bool deliver = has_data && (event_type.empty() || event_type == "message");
        if (!deliver) {
            event_type.clear();
            data.clear();
            has_data = false;
        }
        return deliver;
    };

    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        if (line.empty()) {
            if (dispatch()) {
                return data;
            }
            continue;
        }
        if (line[0] == ':') {
            continue;  // comment
        }

        auto sep = line.find(':');
        std::string field = line.substr(0, sep);
        std::string value = sep == std::string::npos ? std::string() : line.substr(sep + 1);
        if (!value.empty() && value[0] == ' ') {
            value.erase(0, 1);
        }

        if (field == "event") {
            event_type = value;
        } else if (field == "data") {
            if (has_data) {
                data += '\n';
            }
            data += value;
            has_data = true;
        }
    }

    if (dispatch()) {
        return data;
    }
    return std::nullopt;
}

} // namespace mcphub
