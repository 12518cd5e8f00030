#pragma once

#include <string>
#include <vector>
#include <cstddef>
#include <iostream>
#include <nlohmann/json.hpp>
#include <curl/curl.h>
#include <cctype>
#include <cstdio>

#include "config.h"

using namespace std;
using json = nlohmann::json;

struct CurlBuffer {
    std::string data;
    size_t maxBytes = MAX_DOWNLOAD_BYTES;
};

struct HttpResponse {
    long status = 0;     // 0 when the transfer itself failed
    string body;
    string finalUrl;     // after redirects
    string error;

    bool ok() const { return status >= 200 && status < 300; }
};

// Every network call in the pipeline goes through this interface.
class HttpClient {
public:
    virtual ~HttpClient() = default;
    virtual HttpResponse get(const string& url) = 0;
    // Redirects are followed; finalUrl reports where they ended.
    virtual HttpResponse head(const string& url) = 0;
    virtual HttpResponse postJson(const string& url, const json& payload, const vector<string>& extraHeaders) = 0;
};

inline size_t curlWriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t realsize = size * nmemb;
    if (!userp) return 0;
    CurlBuffer* buf = static_cast<CurlBuffer*>(userp);
    if (buf->data.size() + realsize > buf->maxBytes) {
        return 0; // will cause cURL write error
    }
    buf->data.append(static_cast<char*>(contents), realsize);
    return realsize;
}

inline string urlEncode(const string& str) {
    string encoded;
    char hex[8];
    for (unsigned char c : str) {
        if (isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded.push_back((char)c);
        }
        else if (c == ' ') {
            encoded.push_back('+');
        }
        else {
            snprintf(hex, sizeof(hex), "%%%02X", c);
            encoded += hex;
        }
    }
    return encoded;
}

class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(const ScraperConfig& cfg) : cfg_(cfg) {}

    HttpResponse get(const string& url) override {
        return perform(url, false, cfg_.totalTimeout, nullptr, nullptr);
    }

    HttpResponse head(const string& url) override {
        return perform(url, true, cfg_.probeTimeout, nullptr, nullptr);
    }

    HttpResponse postJson(const string& url, const json& payload, const vector<string>& extraHeaders) override {
        string payloadStr = payload.dump();
        struct curl_slist* headers = nullptr;
        headers = curl_slist_append(headers, "Content-Type: application/json");
        for (const auto& h : extraHeaders) headers = curl_slist_append(headers, h.c_str());
        HttpResponse resp = perform(url, false, cfg_.totalTimeout, &payloadStr, headers);
        curl_slist_free_all(headers);
        return resp;
    }

private:
    HttpResponse perform(const string& url, bool headOnly, long totalTimeout,
                         const string* postBody, struct curl_slist* headers) {
        HttpResponse resp;
        CURL* curl = curl_easy_init();
        if (!curl) {
            cerr << "[http] curl_easy_init failed\n";
            resp.error = "curl_easy_init failed";
            return resp;
        }
        CurlBuffer buf;
        buf.maxBytes = cfg_.maxDownloadBytes;

        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, curlWriteCallback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &buf);
        curl_easy_setopt(curl, CURLOPT_USERAGENT, cfg_.userAgent.c_str());
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, cfg_.connectTimeout);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, totalTimeout);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        if (headOnly) curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
        if (postBody) {
            curl_easy_setopt(curl, CURLOPT_POST, 1L);
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, postBody->c_str());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, (long)postBody->size());
        }
        if (headers) curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);

        CURLcode res = curl_easy_perform(curl);
        if (res != CURLE_OK) {
            if (res == CURLE_WRITE_ERROR) {
                resp.error = "download exceeded " + to_string(cfg_.maxDownloadBytes) + " bytes";
            }
            else {
                resp.error = curl_easy_strerror(res);
            }
            cerr << "[http] " << url << " : " << resp.error << "\n";
            curl_easy_cleanup(curl);
            return resp;
        }

        long code = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
        char* effective = nullptr;
        curl_easy_getinfo(curl, CURLINFO_EFFECTIVE_URL, &effective);
        resp.status = code;
        resp.finalUrl = effective ? string(effective) : url;
        resp.body = std::move(buf.data);
        curl_easy_cleanup(curl);
        return resp;
    }

    ScraperConfig cfg_;
};
