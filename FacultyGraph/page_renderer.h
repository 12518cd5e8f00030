#pragma once

#include <string>
#include <mutex>

#include "http_utils.h"
#include "log_utils.h"

using namespace std;

struct RenderedPage {
    long status = 0;
    string html;
    string finalUrl;
    string error;

    bool ok() const { return status >= 200 && status < 300 && !html.empty(); }
};

// Produces the DOM source of a page. A browser-backed renderer can replace the HTTP one.
class PageRenderer {
public:
    virtual ~PageRenderer() = default;
    virtual RenderedPage render(const string& url) = 0;
};

// Static HTML over HTTP, redirects followed. One render in flight per instance.
class HttpPageRenderer : public PageRenderer {
public:
    explicit HttpPageRenderer(HttpClient& http) : http_(http) {}

    RenderedPage render(const string& url) override {
        lock_guard<mutex> lock(mu_);
        HttpResponse resp = http_.get(url);
        RenderedPage page;
        page.status = resp.status;
        page.finalUrl = resp.finalUrl.empty() ? url : resp.finalUrl;
        page.error = resp.error;
        if (resp.ok()) page.html = std::move(resp.body);
        else if (page.error.empty()) page.error = "HTTP " + to_string(resp.status);
        if (resp.ok() && page.html.empty()) page.error = "empty page";
        if (!page.ok()) logWarn("render", url + " : " + page.error);
        return page;
    }

private:
    HttpClient& http_;
    mutex mu_;
};
