#include "curl_http_client.hpp"

#include <curl/curl.h>

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

CurlHttpClient::CurlHttpClient(long timeout_s)
    : timeout_s_(timeout_s) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

CurlHttpClient::~CurlHttpClient() {
    curl_global_cleanup();
}

std::expected<HttpResponse, TranscriptionError>
CurlHttpClient::perform(const HttpRequest& req) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return fail(ErrorKind::Transport, "curl_easy_init failed");
    }

    curl_slist* headers = nullptr;
    for (auto& h : req.headers) {
        headers = curl_slist_append(headers, h.c_str());
    }

    HttpResponse response;
    std::string userpwd;

    curl_easy_setopt(curl, CURLOPT_URL, req.url.c_str());
    if (req.method == "POST" || req.method == "PUT") {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, req.body.data());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                         static_cast<curl_off_t>(req.body.size()));
    }
    if (req.method != "GET" && req.method != "POST") {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, req.method.c_str());
    }
    if (headers) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    }
    if (!req.aws_sigv4.empty()) {
        userpwd = req.access_key_id + ":" + req.secret_access_key;
        curl_easy_setopt(curl, CURLOPT_AWS_SIGV4, req.aws_sigv4.c_str());
        curl_easy_setopt(curl, CURLOPT_USERPWD, userpwd.c_str());
    }

    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_s_);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);
    // Attempts run on several threads at once
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);

    CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    }

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        return fail(ErrorKind::Transport,
                    req.method + " " + req.url + ": " + curl_easy_strerror(res));
    }
    return response;
}
