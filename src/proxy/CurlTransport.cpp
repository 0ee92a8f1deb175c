// SPDX-License-Identifier: AGPL-3.0-or-later
/*
 * Ferry a resilient forwarding and transfer-scheduling service.
 * Copyright (C) 2025 Ahmed Refaat Gadalla Mohamed
 *
 * This program is free software: you can redistribute it and/or modify it under the terms of the GNU Affero General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License along with this program. If not, see <https://www.gnu.org/licenses/>.
 */

#include "proxy/CurlTransport.hpp"
#include "common/Error.hpp"
#include "common/Redaction.hpp"
#include "common/Util.hpp"
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <charconv>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

namespace ferry {

namespace {

struct CurlDefaults {
    static constexpr long FOLLOW_LOCATION = 1L;
    static constexpr long MAX_REDIRECTS = 5L;
    static constexpr long CONNECT_TIMEOUT_MS = 5'000L;
    static constexpr long NO_SIGNAL = 1L;
    static constexpr long HTTP_GET = 1L;
    static constexpr const char* ACCEPT_ENCODING = "";
    static constexpr const char* PROTOCOLS = "http,https";
    static constexpr const char* REDIRECT_PROTOCOLS = "https";
};

struct HeaderKeys {
    static constexpr std::string_view CONTENT_LENGTH = "content-length:";
    static constexpr std::string_view CONTENT_TYPE = "content-type:";
};

struct EasyDeleter {
    void operator()(CURL* h) const noexcept { curl_easy_cleanup(h); }
};

struct SlistDeleter {
    void operator()(curl_slist* l) const noexcept { curl_slist_free_all(l); }
};

// Per-call scratch shared with the libcurl callbacks.
struct Transfer {
    const HttpRequest& request;
    HttpResponse response {0, {}, {}, std::nullopt, {}};
    bool tooLarge {false};
    bool aborted {false};
};

template<typename T>
void setopt(CURL* h, CURLoption option, T value) {
    if (const auto rc = curl_easy_setopt(h, option, value); rc != CURLE_OK) {
        throw std::runtime_error(std::string {"curl_easy_setopt failed: "} + curl_easy_strerror(rc));
    }
}

size_t writeCallback(char* data, size_t size, size_t nmemb, void* userdata) {
    auto* t = static_cast<Transfer*>(userdata);
    const size_t bytes = size * nmemb;
    if (t->response.body.size() + bytes > t->request.maxBytes) {
        t->tooLarge = true;
        return 0;
    }
    t->response.body.append(data, bytes);
    return bytes;
}

size_t headerCallback(char* buffer, size_t size, size_t nItems, void* userdata) {
    auto* t = static_cast<Transfer*>(userdata);
    const size_t bytes = size * nItems;
    const std::string_view line {buffer, bytes};
    // Each redirect hop starts a new header block.
    if (line.starts_with("HTTP/")) {
        t->response.contentType.clear();
        t->response.contentLength.reset();
        return bytes;
    }
    const auto lower = ferry_to_lower(line);
    if (lower.starts_with(HeaderKeys::CONTENT_TYPE)) {
        t->response.contentType = ferry_trim(line.substr(HeaderKeys::CONTENT_TYPE.size()));
    } else if (lower.starts_with(HeaderKeys::CONTENT_LENGTH)) {
        const auto value = ferry_trim(line.substr(HeaderKeys::CONTENT_LENGTH.size()));
        uint64_t length = 0;
        const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), length);
        if (ec == std::errc {} && ptr == value.data() + value.size()) {
            t->response.contentLength = length;
            if (length > t->request.maxBytes) {
                t->tooLarge = true;
                return 0;
            }
        }
    }
    return bytes;
}

int progressCallback(void* clientp, curl_off_t dltotal, curl_off_t dlnow, curl_off_t, curl_off_t) {
    auto* t = static_cast<Transfer*>(clientp);
    if (!t->request.onProgress(static_cast<uint64_t>(dlnow), static_cast<uint64_t>(dltotal))) {
        t->aborted = true;
        return 1;
    }
    return 0;
}

} // namespace

Error curlError(CURLcode code, const char* detail) {
    std::string what = curl_easy_strerror(code);
    if (detail != nullptr && detail[0] != '\0') {
        what += ": ";
        what += detail;
    }
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            return Error {ErrorCode::Timeout, what};
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_CACERT_BADFILE:
        case CURLE_SSL_ENGINE_NOTFOUND:
        case CURLE_SSL_ENGINE_SETFAILED:
        case CURLE_SSL_ISSUER_ERROR:
        case CURLE_SSL_PINNEDPUBKEYNOTMATCH:
        case CURLE_SSL_INVALIDCERTSTATUS:
        case CURLE_SSL_CRL_BADFILE:
        case CURLE_USE_SSL_FAILED:
            return Error {ErrorCode::Ssl, what};
        case CURLE_FILESIZE_EXCEEDED:
            return Error {ErrorCode::ResponseTooLarge, what};
        case CURLE_ABORTED_BY_CALLBACK:
            return Error {ErrorCode::Cancelled, what};
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
        case CURLE_HTTP2:
        case CURLE_HTTP2_STREAM:
            return Error {ErrorCode::Network, what};
        default:
            return Error {ErrorCode::Unknown, what};
    }
}

std::expected<HttpResponse, Error> CurlTransport::get(const HttpRequest& request) {
    std::unique_ptr<CURL, EasyDeleter> handle {curl_easy_init()};
    if (!handle) {
        return std::unexpected {Error {ErrorCode::Unknown, "failed to create CURL easy handle"}};
    }
    curl_slist* list = nullptr;
    for (const auto& [name, value] : request.headers) {
        const auto line = name + ": " + value;
        auto* appended = curl_slist_append(list, line.c_str());
        if (appended == nullptr) {
            curl_slist_free_all(list);
            return std::unexpected {Error {ErrorCode::Unknown, "failed to build request headers"}};
        }
        list = appended;
    }
    std::unique_ptr<curl_slist, SlistDeleter> headers {list};

    Transfer t {request};
    std::array<char, CURL_ERROR_SIZE> errorBuffer {};
    auto* h = handle.get();
    try {
        setopt(h, CURLOPT_URL, request.url.c_str());
        setopt(h, CURLOPT_ERRORBUFFER, errorBuffer.data());
        setopt(h, CURLOPT_HTTPGET, CurlDefaults::HTTP_GET);
        setopt(h, CURLOPT_FOLLOWLOCATION, CurlDefaults::FOLLOW_LOCATION);
        setopt(h, CURLOPT_MAXREDIRS, CurlDefaults::MAX_REDIRECTS);
        setopt(h, CURLOPT_PROTOCOLS_STR, CurlDefaults::PROTOCOLS);
        setopt(h, CURLOPT_REDIR_PROTOCOLS_STR, CurlDefaults::REDIRECT_PROTOCOLS);
        setopt(h, CURLOPT_CONNECTTIMEOUT_MS, std::min(CurlDefaults::CONNECT_TIMEOUT_MS, static_cast<long>(request.timeout.count())));
        setopt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
        setopt(h, CURLOPT_NOSIGNAL, CurlDefaults::NO_SIGNAL);
        setopt(h, CURLOPT_ACCEPT_ENCODING, CurlDefaults::ACCEPT_ENCODING);
        setopt(h, CURLOPT_MAXFILESIZE_LARGE, static_cast<curl_off_t>(request.maxBytes));
        setopt(h, CURLOPT_WRITEFUNCTION, &writeCallback);
        setopt(h, CURLOPT_WRITEDATA, &t);
        setopt(h, CURLOPT_HEADERFUNCTION, &headerCallback);
        setopt(h, CURLOPT_HEADERDATA, &t);
        if (headers) {
            setopt(h, CURLOPT_HTTPHEADER, headers.get());
        }
        if (request.onProgress) {
            setopt(h, CURLOPT_NOPROGRESS, 0L);
            setopt(h, CURLOPT_XFERINFOFUNCTION, &progressCallback);
            setopt(h, CURLOPT_XFERINFODATA, &t);
        }
    } catch (const std::runtime_error& e) {
        return std::unexpected {Error {ErrorCode::Unknown, e.what()}};
    }

    const auto rc = curl_easy_perform(h);
    if (t.tooLarge) {
        return std::unexpected {Error {ErrorCode::ResponseTooLarge,
            "response exceeds " + std::to_string(request.maxBytes) + " bytes"}};
    }
    if (rc != CURLE_OK) {
        auto error = curlError(rc, errorBuffer.data());
        spdlog::debug("CurlTransport: GET {} failed: {}", redact(request.url), error.what);
        return std::unexpected {error};
    }

    long status = 0;
    if (const auto info = curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &status); info != CURLE_OK) {
        return std::unexpected {curlError(info, nullptr)};
    }
    t.response.status = status;
    char* effective = nullptr;
    if (curl_easy_getinfo(h, CURLINFO_EFFECTIVE_URL, &effective) == CURLE_OK && effective != nullptr) {
        t.response.effectiveUrl = effective;
    } else {
        t.response.effectiveUrl = request.url;
    }
    return std::move(t.response);
}

} // namespace ferry
