#include "Http/CurlTransport.hpp"
#include "BridgeConfig.hpp"
#include <curl/curl.h>
#include <plog/Log.h>
#include <algorithm>
#include <memory>

namespace CapBridge {

bool CurlTransport::curlInitialized_ = false;

static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp){
    size_t realsize = size * nmemb;
    Bytes* mem = reinterpret_cast<Bytes*>(userp);
    const uint8_t* p = reinterpret_cast<const uint8_t*>(contents);
    if(mem) mem->insert(mem->end(), p, p + realsize);
    return realsize;
}

static void trimInPlace(std::string& s){
    size_t b = s.find_first_not_of(" \t\r\n");
    size_t e = s.find_last_not_of(" \t\r\n");
    if(b == std::string::npos){ s.clear(); return; }
    s = s.substr(b, e - b + 1);
}

// Called once per header line. A status line starts a new response (after a
// redirect or a 100-continue), so only the last response's headers survive.
static size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userp){
    size_t realsize = size * nitems;
    HeaderList* headers = reinterpret_cast<HeaderList*>(userp);
    std::string line(buffer, realsize);
    if(line.rfind("HTTP/", 0) == 0){ headers->clear(); return realsize; }
    size_t colon = line.find(':');
    if(colon == std::string::npos) return realsize;
    std::string name = line.substr(0, colon);
    std::string value = line.substr(colon + 1);
    trimInPlace(name);
    trimInPlace(value);
    if(!name.empty()) headers->emplace_back(name, value);
    return realsize;
}

struct CurlEasyDeleter { void operator()(CURL* c) const { if(c) curl_easy_cleanup(c); } };
struct CurlSlistDeleter { void operator()(curl_slist* l) const { if(l) curl_slist_free_all(l); } };
struct CurlUrlDeleter { void operator()(CURLU* u) const { if(u) curl_url_cleanup(u); } };

// application/x-www-form-urlencoded body for a form option
static std::string encodeForm(CURL* curl, const HeaderList& form){
    std::string out;
    for(const auto& kv : form){
        char* k = curl_easy_escape(curl, kv.first.c_str(), (int)kv.first.size());
        char* v = curl_easy_escape(curl, kv.second.c_str(), (int)kv.second.size());
        if(!out.empty()) out += "&";
        out += (k ? k : ""); out += "="; out += (v ? v : "");
        curl_free(k);
        curl_free(v);
    }
    return out;
}

static bool buildUrl(const HttpRequest& request, std::string& outUrl, std::string* outError){
    std::unique_ptr<CURLU, CurlUrlDeleter> u(curl_url());
    if(!u){ if(outError) *outError = "curl_url failed"; return false; }
    CURLUcode rc = curl_url_set(u.get(), CURLUPART_URL, request.url.c_str(), 0);
    if(rc != CURLUE_OK){ if(outError) *outError = "invalid url '" + request.url + "'"; return false; }
    for(const auto& kv : request.options.query){
        std::string pair = kv.first + "=" + kv.second;
        rc = curl_url_set(u.get(), CURLUPART_QUERY, pair.c_str(), CURLU_APPENDQUERY | CURLU_URLENCODE);
        if(rc != CURLUE_OK){ if(outError) *outError = "cannot append query parameter '" + kv.first + "'"; return false; }
    }
    char* full = nullptr;
    rc = curl_url_get(u.get(), CURLUPART_URL, &full, 0);
    if(rc != CURLUE_OK || !full){ if(outError) *outError = "cannot assemble url"; return false; }
    outUrl = full;
    curl_free(full);
    return true;
}

CurlTransport::CurlTransport(){
    if(!curlInitialized_){
        curl_global_init(CURL_GLOBAL_DEFAULT);
        curlInitialized_ = true;
    }
}

CurlTransport::~CurlTransport(){
    // curl_global_cleanup is left to process exit; other transports may still be alive
}

bool CurlTransport::perform(HttpSession& session, const HttpRequest& request, HttpResponse& out, std::string* outError){
    std::unique_ptr<CURL, CurlEasyDeleter> curl(curl_easy_init());
    if(!curl){ if(outError) *outError = "curl_easy_init failed"; return false; }
    CURL* c = curl.get();

    std::string url;
    if(!buildUrl(request, url, outError)) return false;

    const RequestOptions& opt = request.options;
    const SessionOptions& so = session.options;

    HttpResponse resp;
    curl_easy_setopt(c, CURLOPT_URL, url.c_str());
    curl_easy_setopt(c, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    if(request.method == "HEAD") curl_easy_setopt(c, CURLOPT_NOBODY, 1L);
    curl_easy_setopt(c, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(c, CURLOPT_WRITEDATA, &resp.body);
    curl_easy_setopt(c, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(c, CURLOPT_HEADERDATA, &resp.headers);
    curl_easy_setopt(c, CURLOPT_NOSIGNAL, 1L);

    double timeout = opt.timeoutSeconds ? *opt.timeoutSeconds : (double)so.timeoutSeconds;
    timeout = std::min(std::max(timeout, 0.001), (double)kMaxTimeoutSeconds);
    CURLcode optRes = curl_easy_setopt(c, CURLOPT_TIMEOUT_MS, (long)(timeout * 1000.0));
    if(optRes != CURLE_OK){
        if(outError) *outError = std::string("cannot set timeout: ") + curl_easy_strerror(optRes);
        return false;
    }

    bool verify = opt.verifyTls ? *opt.verifyTls : so.verifyTls;
    curl_easy_setopt(c, CURLOPT_SSL_VERIFYPEER, verify ? 1L : 0L);
    curl_easy_setopt(c, CURLOPT_SSL_VERIFYHOST, verify ? 2L : 0L);

    bool follow = opt.followRedirects ? *opt.followRedirects : so.followRedirects;
    curl_easy_setopt(c, CURLOPT_FOLLOWLOCATION, follow ? 1L : 0L);
    curl_easy_setopt(c, CURLOPT_MAXREDIRS, so.maxRedirects);

    std::string proxy = opt.proxy ? *opt.proxy : so.proxy;
    if(!proxy.empty()) curl_easy_setopt(c, CURLOPT_PROXY, proxy.c_str());

    std::string userAgent = opt.userAgent ? *opt.userAgent : so.userAgent;
    if(!userAgent.empty()) curl_easy_setopt(c, CURLOPT_USERAGENT, userAgent.c_str());

    if(opt.basicAuth){
        curl_easy_setopt(c, CURLOPT_HTTPAUTH, (long)CURLAUTH_BASIC);
        curl_easy_setopt(c, CURLOPT_USERNAME, opt.basicAuth->first.c_str());
        curl_easy_setopt(c, CURLOPT_PASSWORD, opt.basicAuth->second.c_str());
    }

    // Build headers (content type first, caller headers may override it)
    curl_slist* rawHeaders = nullptr;
    std::string formBody;
    const char* bodyPtr = opt.body.empty() ? "" : reinterpret_cast<const char*>(opt.body.data());
    switch(opt.bodyKind){
    case RequestOptions::BodyKind::None:
        break;
    case RequestOptions::BodyKind::Raw:
        curl_easy_setopt(c, CURLOPT_POSTFIELDS, bodyPtr);
        curl_easy_setopt(c, CURLOPT_POSTFIELDSIZE, (long)opt.body.size());
        break;
    case RequestOptions::BodyKind::Json:
        rawHeaders = curl_slist_append(rawHeaders, "Content-Type: application/json");
        curl_easy_setopt(c, CURLOPT_POSTFIELDS, bodyPtr);
        curl_easy_setopt(c, CURLOPT_POSTFIELDSIZE, (long)opt.body.size());
        break;
    case RequestOptions::BodyKind::Form:
        formBody = encodeForm(c, opt.form);
        rawHeaders = curl_slist_append(rawHeaders, "Content-Type: application/x-www-form-urlencoded");
        curl_easy_setopt(c, CURLOPT_POSTFIELDS, formBody.c_str());
        curl_easy_setopt(c, CURLOPT_POSTFIELDSIZE, (long)formBody.size());
        break;
    }
    for(const auto& h : opt.headers){
        std::string line = h.first + ": " + h.second;
        rawHeaders = curl_slist_append(rawHeaders, line.c_str());
    }
    std::unique_ptr<curl_slist, CurlSlistDeleter> headers(rawHeaders);
    if(headers) curl_easy_setopt(c, CURLOPT_HTTPHEADER, headers.get());

    // enable the cookie engine and replay the session's jar
    curl_easy_setopt(c, CURLOPT_COOKIEFILE, "");
    for(const auto& cookie : session.cookies)
        curl_easy_setopt(c, CURLOPT_COOKIELIST, cookie.c_str());

    CURLcode res = curl_easy_perform(c);
    if(res != CURLE_OK){
        if(outError) *outError = curl_easy_strerror(res);
        PLOGW << "http " << request.method << " " << url << " failed: " << curl_easy_strerror(res);
        return false;
    }
    curl_easy_getinfo(c, CURLINFO_RESPONSE_CODE, &resp.status);

    curl_slist* jar = nullptr;
    if(curl_easy_getinfo(c, CURLINFO_COOKIELIST, &jar) == CURLE_OK){
        session.cookies.clear();
        for(curl_slist* it = jar; it; it = it->next) session.cookies.emplace_back(it->data);
        curl_slist_free_all(jar);
    }

    out = std::move(resp);
    return true;
}

} // namespace CapBridge
