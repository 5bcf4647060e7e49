#include <gtest/gtest.h>

#include "Fakes.hpp"
#include "Http/HttpStore.hpp"

using namespace CapBridge;
using fakes::FakeHttpTransport;

namespace {

class HttpStoreTest : public ::testing::Test {
   protected:
    HttpStoreTest() : store(transport, SessionOptions::fromSettings(HttpSettings())) {}

    std::string build(const std::string& session, const std::string& method = "GET",
                      const std::string& url = "http://example") {
        std::string id;
        BridgeError err;
        EXPECT_TRUE(store.buildRequest(session, method, url, DynamicValue::table(), id, &err)) << err.message();
        return id;
    }

    FakeHttpTransport transport;
    HttpStore store;
};

}  // namespace

TEST_F(HttpStoreTest, SessionAndRequestTokensAreDistinct) {
    std::string s = store.openSession();
    std::string r = build(s);
    EXPECT_FALSE(s.empty());
    EXPECT_NE(s, r);
    EXPECT_EQ(s.size(), 36u);
    EXPECT_TRUE(store.hasSession(s));
    EXPECT_TRUE(store.hasPending(r));
    EXPECT_NE(store.openSession(), s);
}

TEST_F(HttpStoreTest, SessionCopiesDefaults) {
    std::string s = store.openSession();
    const HttpSession* sess = store.session(s);
    ASSERT_NE(sess, nullptr);
    EXPECT_EQ(sess->options.userAgent, "capbridge/1.0");
    EXPECT_EQ(sess->options.timeoutSeconds, 30);
}

TEST_F(HttpStoreTest, UnknownSessionFails) {
    std::string id;
    BridgeError err;
    EXPECT_FALSE(store.buildRequest("nope", "GET", "http://example", DynamicValue(), id, &err));
    EXPECT_EQ(err.kind, BridgeError::Kind::UnknownSession);
    EXPECT_EQ(store.pendingCount(), 0u);
}

TEST_F(HttpStoreTest, InvalidMethodOrUrlFails) {
    std::string s = store.openSession();
    std::string id;
    BridgeError err;
    EXPECT_FALSE(store.buildRequest(s, "get", "http://example", DynamicValue(), id, &err));
    EXPECT_EQ(err.kind, BridgeError::Kind::InvalidOptions);
    EXPECT_FALSE(store.buildRequest(s, "", "http://example", DynamicValue(), id, &err));
    EXPECT_FALSE(store.buildRequest(s, "GET", "", DynamicValue(), id, &err));
    EXPECT_EQ(err.kind, BridgeError::Kind::InvalidOptions);
}

TEST_F(HttpStoreTest, InvalidOptionsFail) {
    std::string s = store.openSession();
    DynamicValue opts = DynamicValue::table();
    opts.set("bogus", DynamicValue::boolean(true));
    std::string id;
    BridgeError err;
    EXPECT_FALSE(store.buildRequest(s, "GET", "http://example", opts, id, &err));
    EXPECT_EQ(err.kind, BridgeError::Kind::InvalidOptions);
    EXPECT_EQ(err.message(), "InvalidOptions: unknown option 'bogus'");
}

TEST_F(HttpStoreTest, RequestIsConsumedBySend) {
    transport.response.status = 204;
    std::string s = store.openSession();
    std::string r = build(s, "POST", "http://example/login");

    HttpResponse resp;
    BridgeError err;
    ASSERT_TRUE(store.sendRequest(r, resp, &err));
    EXPECT_EQ(resp.status, 204);
    ASSERT_EQ(transport.calls.size(), 1u);
    EXPECT_EQ(transport.calls[0].sessionId, s);
    EXPECT_EQ(transport.calls[0].request.method, "POST");
    EXPECT_EQ(transport.calls[0].request.url, "http://example/login");

    EXPECT_FALSE(store.sendRequest(r, resp, &err));
    EXPECT_EQ(err.kind, BridgeError::Kind::UnknownRequest);
    EXPECT_EQ(transport.calls.size(), 1u);
}

TEST_F(HttpStoreTest, FabricatedRequestTokenFails) {
    std::string s = store.openSession();
    HttpResponse resp;
    BridgeError err;
    EXPECT_FALSE(store.sendRequest("00000000-0000-4000-8000-000000000000", resp, &err));
    EXPECT_EQ(err.kind, BridgeError::Kind::UnknownRequest);
    // a session token is not a request token
    EXPECT_FALSE(store.sendRequest(s, resp, &err));
    EXPECT_EQ(err.kind, BridgeError::Kind::UnknownRequest);
}

TEST_F(HttpStoreTest, TransportFailureStillConsumesRequest) {
    transport.fail = true;
    std::string s = store.openSession();
    std::string r = build(s);
    HttpResponse resp;
    BridgeError err;
    EXPECT_FALSE(store.sendRequest(r, resp, &err));
    EXPECT_EQ(err.kind, BridgeError::Kind::TransportError);
    EXPECT_EQ(err.detail, "connection refused");
    EXPECT_FALSE(store.hasPending(r));
}

TEST_F(HttpStoreTest, CookiesStayWithTheirSession) {
    transport.setCookie = "example\tFALSE\t/\tFALSE\t0\tsid\tabc";
    std::string a = store.openSession();
    std::string b = store.openSession();
    HttpResponse resp;

    ASSERT_TRUE(store.sendRequest(build(a), resp, nullptr));
    ASSERT_TRUE(store.sendRequest(build(a), resp, nullptr));
    ASSERT_TRUE(store.sendRequest(build(b), resp, nullptr));

    ASSERT_EQ(transport.cookiesSeen.size(), 3u);
    EXPECT_TRUE(transport.cookiesSeen[0].empty());
    EXPECT_EQ(transport.cookiesSeen[1].size(), 1u);
    EXPECT_TRUE(transport.cookiesSeen[2].empty());
}

TEST(HttpResponseTest, ToValueKeepsHeaderOrderAndDuplicates) {
    HttpResponse r;
    r.status = 200;
    r.headers = {{"Set-Cookie", "a=1"}, {"Content-Type", "text/plain"}, {"Set-Cookie", "b=2"}};
    r.body = Bytes{'o', 'k'};
    DynamicValue v = r.toValue();

    EXPECT_EQ(*v.get("status"), DynamicValue::number(200));
    const DynamicValue* headers = v.get("headers");
    ASSERT_NE(headers, nullptr);
    ASSERT_EQ(headers->asTable().size(), 3u);
    EXPECT_EQ(headers->asTable()[2].second.get("value")->asText(), "b=2");
    EXPECT_TRUE(v.get("body")->isBytes());
    EXPECT_EQ(v.get("text")->asText(), "ok");
    ASSERT_NE(r.header("content-type"), nullptr);
    EXPECT_EQ(*r.header("content-type"), "text/plain");
    EXPECT_EQ(r.header("WWW-Authenticate"), nullptr);
}
