#include <gtest/gtest.h>

#include "Fakes.hpp"
#include "LuaBindingDocs.hpp"
#include "LuaBindingDocsUtil.hpp"
#include "LuaEngine.hpp"

using namespace CapBridge;

namespace {

class LuaEngineTest : public ::testing::Test {
   protected:
    void SetUp() override {
        config.echoPrint = false;
        engine = std::make_unique<LuaEngine>(config, fakes.services());
    }

    // Load `code`, failing the test on a lua error
    void load(const std::string& code) { ASSERT_TRUE(engine->loadScript(code)) << engine->lastError(); }

    DynamicValue eval(const std::string& expr) {
        EXPECT_TRUE(engine->loadScript("__r = " + expr)) << engine->lastError();
        return engine->global("__r");
    }

    BridgeConfig config;
    fakes::FakeServices fakes;
    std::unique_ptr<LuaEngine> engine;
};

const std::vector<std::string> kCatalog = {
    "base64_decode", "base64_encode", "execve", "hex", "html_select", "html_select_list",
    "http_basic_auth", "http_mksession", "http_request", "http_send", "json_decode", "json_encode",
    "last_err", "ldap_bind", "ldap_escape", "ldap_search_bind", "md5", "mysql_connect", "print",
    "rand", "sha1", "sha2_256", "sha2_512", "sha3_256", "sha3_512", "sleep"};

}  // namespace

// ============================================================================
// CATALOG AND DOCUMENTATION
// ============================================================================

TEST_F(LuaEngineTest, RegistersWholeCatalog) {
    auto names = engine->registry().names();
    EXPECT_EQ(names, kCatalog);
}

TEST_F(LuaEngineTest, EveryGlobalIsDocumented) {
    EXPECT_TRUE(LuaBindingDocsUtil::listMissingDocs(engine->L(), kCatalog).empty());
    EXPECT_TRUE(LuaBindingDocsUtil::verifyGlobalsHaveDocs(engine->L(), kCatalog));
    EXPECT_FALSE(LuaBindingDocsUtil::verifyGlobalsHaveDocs(engine->L(), {"not_a_capability"}));
    EXPECT_THROW(LuaBindingDocsUtil::enforceGlobalsHaveDocs(engine->L(), {"not_a_capability"}), std::runtime_error);
    auto doc = LuaBindingDocs::get().getDoc("http_request");
    ASSERT_TRUE(doc.has_value());
    EXPECT_NE(doc->signature.find("http_request("), std::string::npos);
    EXPECT_NE(LuaBindingDocs::get().renderReference().find("sha3_512"), std::string::npos);
}

TEST_F(LuaEngineTest, SandboxRemovesDangerousGlobals) {
    EXPECT_TRUE(eval("io == nil and os == nil and load == nil and dofile == nil and loadfile == nil").asBoolean());
}

TEST(LuaEngineSandboxTest, SandboxCanBeDisabled) {
    BridgeConfig config;
    config.sandbox = false;
    fakes::FakeServices fakes;
    LuaEngine engine(config, fakes.services());
    ASSERT_TRUE(engine.loadScript("__r = os ~= nil"));
    EXPECT_TRUE(engine.global("__r").asBoolean());
}

// ============================================================================
// DIGESTS AND ENCODINGS
// ============================================================================

TEST_F(LuaEngineTest, HexOfByteTable) {
    EXPECT_EQ(eval("hex({0, 255, 16})"), DynamicValue::text("00ff10"));
}

TEST_F(LuaEngineTest, DigestOfString) {
    EXPECT_EQ(eval("hex(md5('abc'))"), DynamicValue::text("900150983cd24fb0d6963f7d28e17f72"));
    EXPECT_EQ(eval("#sha2_512('')"), DynamicValue::number(64));
}

TEST_F(LuaEngineTest, Base64RoundTrip) {
    EXPECT_EQ(eval("base64_encode('hi')"), DynamicValue::text("aGk="));
    EXPECT_EQ(eval("base64_decode('aGk=')"), DynamicValue::text("hi"));
}

TEST_F(LuaEngineTest, MalformedBase64IsSoftFailure) {
    EXPECT_TRUE(eval("base64_decode('====')").isNil());
    auto err = engine->errors().last();
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->rfind("InvalidEncoding: ", 0), 0u);
    EXPECT_EQ(eval("last_err()"), DynamicValue::text(*err));
}

TEST_F(LuaEngineTest, BadByteArgumentRaises) {
    EXPECT_FALSE(engine->loadScript("hex({1, 2, 256})"));
    EXPECT_NE(engine->lastError().find("number is out of range: 256"), std::string::npos);
    EXPECT_FALSE(engine->errors().hasError());
    EXPECT_FALSE(engine->loadScript("sha1(true)"));
    EXPECT_NE(engine->lastError().find("invalid type: true"), std::string::npos);
}

// ============================================================================
// ERROR CHANNEL
// ============================================================================

TEST_F(LuaEngineTest, LastErrIsNilBeforeAnyFailure) {
    EXPECT_TRUE(eval("last_err()").isNil());
}

TEST_F(LuaEngineTest, SuccessDoesNotClearLastError) {
    load("bad = base64_decode('!!!!')");
    auto first = engine->errors().last();
    ASSERT_TRUE(first.has_value());
    load("good = base64_decode('aGk=')");
    EXPECT_EQ(eval("last_err()"), DynamicValue::text(*first));
}

// ============================================================================
// HTTP
// ============================================================================

TEST_F(LuaEngineTest, HttpSessionRequestAndSend) {
    fakes.http->response.status = 200;
    fakes.http->response.headers = {{"Content-Type", "application/json"}};
    fakes.http->response.body = Bytes{'{', '}'};

    load(R"(
        s = http_mksession()
        r = http_request(s, "POST", "http://example/login", {json = {user = "alice"}, headers = {["X-A"] = "1"}})
        resp = http_send(r)
        again = http_send(r)
    )");
    DynamicValue s = engine->global("s");
    DynamicValue r = engine->global("r");
    ASSERT_TRUE(s.isText());
    ASSERT_TRUE(r.isText());
    EXPECT_NE(s.asText(), r.asText());

    DynamicValue resp = engine->global("resp");
    EXPECT_EQ(*resp.get("status"), DynamicValue::number(200));
    EXPECT_EQ(resp.get("text")->asText(), "{}");
    EXPECT_EQ(resp.get("headers")->asTable()[0].second.get("name")->asText(), "Content-Type");

    ASSERT_EQ(fakes.http->calls.size(), 1u);
    const HttpRequest& sent = fakes.http->calls[0].request;
    EXPECT_EQ(sent.options.bodyKind, RequestOptions::BodyKind::Json);
    EXPECT_EQ(std::string(sent.options.body.begin(), sent.options.body.end()), "{\"user\":\"alice\"}");

    EXPECT_TRUE(engine->global("again").isNil());
    EXPECT_EQ(engine->errors().last()->rfind("UnknownRequest: ", 0), 0u);
}

TEST_F(LuaEngineTest, FabricatedRequestToken) {
    load("s = http_mksession(); r = http_request(s, 'GET', 'http://example', {}); x = http_send('forged')");
    EXPECT_TRUE(engine->global("x").isNil());
    EXPECT_EQ(engine->errors().last()->rfind("UnknownRequest", 0), 0u);
    EXPECT_EQ(engine->store().pendingCount(), 1u);
}

TEST_F(LuaEngineTest, UnknownOptionIsSoftFailure) {
    load("s = http_mksession(); r = http_request(s, 'GET', 'http://example', {retries = 3})");
    EXPECT_TRUE(engine->global("r").isNil());
    EXPECT_EQ(*engine->errors().last(), "InvalidOptions: unknown option 'retries'");
}

TEST_F(LuaEngineTest, TransportFailureIsSoftFailure) {
    fakes.http->fail = true;
    load("s = http_mksession(); resp = http_send(http_request(s, 'GET', 'http://example', nil))");
    EXPECT_TRUE(engine->global("resp").isNil());
    EXPECT_EQ(*engine->errors().last(), "TransportError: connection refused");
}

TEST_F(LuaEngineTest, BasicAuth) {
    fakes.http->response.status = 200;
    EXPECT_EQ(eval("http_basic_auth('http://example/private', 'alice', 'pw')"), DynamicValue::boolean(true));
    ASSERT_EQ(fakes.http->calls.size(), 1u);
    const HttpRequest& sent = fakes.http->calls[0].request;
    EXPECT_EQ(sent.method, "GET");
    ASSERT_TRUE(sent.options.basicAuth.has_value());
    EXPECT_EQ(sent.options.basicAuth->first, "alice");
    EXPECT_EQ(sent.options.basicAuth->second, "pw");
    // throwaway session is not visible to the script
    EXPECT_EQ(engine->store().sessionCount(), 0u);

    fakes.http->response.status = 401;
    EXPECT_EQ(eval("http_basic_auth('http://example/private', 'alice', 'bad')"), DynamicValue::boolean(false));

    fakes.http->response.status = 200;
    fakes.http->response.headers = {{"WWW-Authenticate", "Basic realm=\"x\""}};
    EXPECT_EQ(eval("http_basic_auth('http://example/private', 'alice', 'bad')"), DynamicValue::boolean(false));
}

// ============================================================================
// LDAP AND MYSQL
// ============================================================================

TEST_F(LuaEngineTest, LdapSearchBindWithoutEntries) {
    fakes.ldap->accounts["cn=search,dc=example,dc=com"] = "spw";
    EXPECT_EQ(eval("ldap_search_bind('ldap://h', 'cn=search,dc=example,dc=com', 'spw', 'dc=example,dc=com', 'ghost', 'pw')"),
              DynamicValue::boolean(false));
    EXPECT_EQ(fakes.ldap->bindAttempts.size(), 1u);
}

TEST_F(LuaEngineTest, LdapFaultIsSoftFailure) {
    fakes.ldap->refuseConnect = true;
    EXPECT_TRUE(eval("ldap_bind('ldap://h', 'cn=x', 'pw')").isNil());
    EXPECT_EQ(engine->errors().last()->rfind("Protocol: ldap connection failed", 0), 0u);
}

TEST_F(LuaEngineTest, LdapEscape) {
    EXPECT_EQ(eval("ldap_escape('a,b')"), DynamicValue::text("a\\,b"));
}

TEST_F(LuaEngineTest, MysqlConnectOutcomes) {
    EXPECT_EQ(eval("mysql_connect('db', 33060, 'u', 'p')"), DynamicValue::boolean(true));
    ASSERT_EQ(fakes.mysqlProbes.size(), 1u);
    EXPECT_EQ(fakes.mysqlProbes[0].mysql_host, "db");
    EXPECT_EQ(fakes.mysqlProbes[0].mysql_port, 33060);
    EXPECT_EQ(fakes.mysqlProbes[0].mysql_user, "u");
    EXPECT_EQ(fakes.mysqlProbes[0].mysql_password, "p");
    EXPECT_EQ(fakes.mysqlProbes[0].connect_timeout_seconds, config.mysql.timeoutSeconds);

    fakes.mysqlResult = MySQLProbeResult::Rejected;
    EXPECT_EQ(eval("mysql_connect('db', 33060, 'u', 'bad')"), DynamicValue::boolean(false));
    EXPECT_FALSE(engine->errors().hasError());

    fakes.mysqlResult = MySQLProbeResult::Unreachable;
    EXPECT_TRUE(eval("mysql_connect('db', 33060, 'u', 'p')").isNil());
    EXPECT_TRUE(engine->errors().hasError());

    EXPECT_FALSE(engine->loadScript("mysql_connect('db', 70000, 'u', 'p')"));
}

// ============================================================================
// DATA, PROCESS, MISC
// ============================================================================

TEST_F(LuaEngineTest, JsonInScripts) {
    EXPECT_EQ(eval("json_encode({})"), DynamicValue::text("[]"));
    EXPECT_EQ(eval("json_decode('{\"a\":[1,2]}').a[2]"), DynamicValue::number(2));
    EXPECT_TRUE(eval("json_decode('{')").isNil());
    EXPECT_EQ(engine->errors().last()->rfind("Json: ", 0), 0u);
}

TEST_F(LuaEngineTest, DeeplyNestedJsonIsSoftFailure) {
    load("deep = json_decode(string.rep('[', 100000) .. string.rep(']', 100000))");
    EXPECT_TRUE(engine->global("deep").isNil());
    EXPECT_EQ(eval("last_err()"), DynamicValue::text("Json: nesting exceeds 32 levels"));
}

TEST_F(LuaEngineTest, LargeJsonArrayReachesScript) {
    load("local parts = {} for i = 1, 50000 do parts[i] = tostring(i) end "
         "big = json_decode('[' .. table.concat(parts, ',') .. ']')");
    EXPECT_EQ(eval("#big"), DynamicValue::number(50000));
    EXPECT_EQ(eval("big[50000]"), DynamicValue::number(50000));
}

TEST_F(LuaEngineTest, HtmlInScripts) {
    load(R"(
        page = '<form><input name="csrf" value="t1"><input name="user"></form>'
        token = html_select(page, 'input[name="csrf"]').attrs.value
        count = #html_select_list(page, 'input')
        missing = html_select(page, 'table')
    )");
    EXPECT_EQ(engine->global("token"), DynamicValue::text("t1"));
    EXPECT_EQ(engine->global("count"), DynamicValue::number(2));
    EXPECT_TRUE(engine->global("missing").isNil());
    EXPECT_EQ(*engine->errors().last(), "Html: css selector didn't match anything");
}

TEST_F(LuaEngineTest, ExecveReturnsExitCode) {
    EXPECT_EQ(eval("execve('sh', {'-c', 'exit 3'})"), DynamicValue::number(3));
    EXPECT_TRUE(eval("execve('capbridge-no-such-program', {})").isNil());
    EXPECT_EQ(engine->errors().last()->rfind("Process: ", 0), 0u);
}

TEST_F(LuaEngineTest, ExecveRejectsNonTextArguments) {
    EXPECT_FALSE(engine->loadScript("execve('true', {'a', 5})"));
    EXPECT_NE(engine->lastError().find("must be a string"), std::string::npos);
}

TEST_F(LuaEngineTest, RandRange) {
    for (int i = 0; i < 20; ++i) {
        double v = eval("rand(10, 12)").asNumber();
        EXPECT_GE(v, 10);
        EXPECT_LT(v, 12);
    }
    EXPECT_TRUE(eval("math.type(rand(0, 5)) == 'integer'").asBoolean());
    EXPECT_FALSE(engine->loadScript("rand(5, 5)"));
    EXPECT_FALSE(engine->loadScript("rand(-1, 5)"));
}

TEST_F(LuaEngineTest, SleepZeroReturnsNothing) {
    EXPECT_EQ(eval("select('#', sleep(0))"), DynamicValue::number(0));
    EXPECT_FALSE(engine->loadScript("sleep(-1)"));
}

TEST_F(LuaEngineTest, PrintIsCaptured) {
    load("print({ok = true}); print('x')");
    EXPECT_EQ(engine->takeStdout(), "{\"ok\": true}\n\"x\"\n");
    EXPECT_EQ(engine->takeStdout(), "");
}

// ============================================================================
// SCRIPT LIFECYCLE
// ============================================================================

TEST_F(LuaEngineTest, DescrAndVerify) {
    load(R"(
        descr = "demo"
        function verify(user, password)
            return user == "alice" and password == "pw"
        end
    )");
    EXPECT_EQ(engine->descr(), "demo");
    EXPECT_EQ(engine->verify("alice", "pw"), std::optional<bool>(true));
    EXPECT_EQ(engine->verify("alice", "no"), std::optional<bool>(false));
}

TEST_F(LuaEngineTest, VerifyNilIsFalseAndErrorsAreReported) {
    load("function verify(u, p) if u == 'boom' then error('exploded') end if u == 'n' then return 5 end return nil end");
    EXPECT_EQ(engine->verify("x", "y"), std::optional<bool>(false));
    EXPECT_FALSE(engine->verify("boom", "y").has_value());
    EXPECT_NE(engine->lastError().find("exploded"), std::string::npos);
    EXPECT_FALSE(engine->verify("n", "y").has_value());
    EXPECT_EQ(engine->descr(), "");
}

TEST_F(LuaEngineTest, MissingVerifyIsAnError) {
    load("x = 1");
    EXPECT_FALSE(engine->verify("a", "b").has_value());
}

TEST_F(LuaEngineTest, SyntaxErrorIsReported) {
    EXPECT_FALSE(engine->loadScript("function ("));
    EXPECT_FALSE(engine->lastError().empty());
}

TEST(LuaEngineIsolationTest, ContextsShareNoState) {
    BridgeConfig config;
    config.echoPrint = false;
    fakes::FakeServices fakes;
    LuaEngine a(config, fakes.services());
    LuaEngine b(config, fakes.services());

    ASSERT_TRUE(a.loadScript("s = http_mksession(); base64_decode('x')"));
    EXPECT_EQ(a.store().sessionCount(), 1u);
    EXPECT_EQ(b.store().sessionCount(), 0u);
    EXPECT_TRUE(a.errors().hasError());
    EXPECT_FALSE(b.errors().hasError());
}

TEST(LuaEngineServicesTest, MissingServiceThrows) {
    BridgeConfig config;
    HostServices none;
    EXPECT_THROW({ LuaEngine engine(config, none); }, std::invalid_argument);
}
