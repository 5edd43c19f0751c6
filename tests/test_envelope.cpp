/// @file test_envelope.cpp
/// Unit tests for envelope.hpp — header merging, JSON flag and body handling.

#include "envelope.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace resilient_http;
using json = nlohmann::json;

static RequestDescriptor makeDescriptor() {
    RequestDescriptor d;
    d.method = "GET";
    d.uri    = "https://api.example.com/longships/42";
    return d;
}

// ============================================================================
// defaultHeaders
// ============================================================================

TEST(DefaultHeaders, IdentifyClient) {
    auto headers = defaultHeaders();
    ASSERT_EQ(headers.count("User-Agent"), 1u);
    EXPECT_EQ(headers["User-Agent"].rfind("resilient_http/", 0), 0u);
    EXPECT_EQ(headers.count("X-Client-Platform"), 1u);
    EXPECT_EQ(headers.count("X-Client-Runtime"), 1u);
}

// ============================================================================
// buildEnvelope — method / uri / options
// ============================================================================

TEST(BuildEnvelope, CopiesMethodAndUri) {
    auto env = buildEnvelope(makeDescriptor(), ClientOptions{});
    EXPECT_EQ(env.method, "GET");
    EXPECT_EQ(env.uri, "https://api.example.com/longships/42");
}

TEST(BuildEnvelope, JsonEnabledByDefault) {
    auto env = buildEnvelope(makeDescriptor(), ClientOptions{});
    EXPECT_TRUE(env.json);
    EXPECT_EQ(env.headers["Accept"], "application/json");
}

TEST(BuildEnvelope, DisableAutomaticJsonClearsFlag) {
    ClientOptions opts;
    opts.disableAutomaticJson = true;
    auto env = buildEnvelope(makeDescriptor(), opts);
    EXPECT_FALSE(env.json);
    EXPECT_EQ(env.headers.count("Accept"), 0u);
}

TEST(BuildEnvelope, CarriesTimeoutAndBody) {
    ClientOptions opts;
    opts.timeout = std::chrono::milliseconds(1234);
    auto d = makeDescriptor();
    d.body = json{{"name", "Naglfar"}};

    auto env = buildEnvelope(d, opts);
    EXPECT_EQ(env.timeout.count(), 1234);
    ASSERT_TRUE(env.body.has_value());
    EXPECT_EQ((*env.body)["name"], "Naglfar");
}

// ============================================================================
// buildEnvelope — headers
// ============================================================================

TEST(BuildEnvelope, IncludesDefaultHeaders) {
    auto env = buildEnvelope(makeDescriptor(), ClientOptions{});
    EXPECT_EQ(env.headers.count("User-Agent"), 1u);
    EXPECT_EQ(env.headers.count("X-Client-Platform"), 1u);
    EXPECT_EQ(env.headers.count("X-Client-Runtime"), 1u);
}

TEST(BuildEnvelope, CallerHeadersMergedOverDefaults) {
    auto d = makeDescriptor();
    d.headers = {{"z", "123"}, {"User-Agent", "custom/2.0"}};

    auto env = buildEnvelope(d, ClientOptions{});
    EXPECT_EQ(env.headers["z"], "123");
    EXPECT_EQ(env.headers["User-Agent"], "custom/2.0");
    EXPECT_EQ(env.headers.count("X-Client-Platform"), 1u);
}

TEST(BuildEnvelope, CallerOverrideIsCaseInsensitive) {
    auto d = makeDescriptor();
    d.headers = {{"user-agent", "custom/2.0"}, {"accept", "text/xml"}};

    auto env = buildEnvelope(d, ClientOptions{});
    EXPECT_EQ(env.headers.count("User-Agent"), 0u);
    EXPECT_EQ(env.headers["user-agent"], "custom/2.0");
    EXPECT_EQ(env.headers.count("Accept"), 0u);
    EXPECT_EQ(env.headers["accept"], "text/xml");
}

TEST(BuildEnvelope, DisableCustomHeadersSendsOnlyCallerHeaders) {
    ClientOptions opts;
    opts.disableCustomHeaders = true;
    auto d = makeDescriptor();
    d.headers = {{"z", "f00d"}};

    auto env = buildEnvelope(d, opts);
    EXPECT_EQ(env.headers, d.headers);
    EXPECT_EQ(env.headers.count("User-Agent"), 0u);
    EXPECT_TRUE(env.json);
}

// ============================================================================
// parseBody / serializeBody
// ============================================================================

TEST(ParseBody, JsonModeParsesDocument) {
    auto body = parseBody(R"({"x":"abc","n":[1,2]})", true);
    EXPECT_EQ(body["x"], "abc");
    EXPECT_EQ(body["n"].size(), 2u);
}

TEST(ParseBody, JsonModeKeepsUnparsableText) {
    auto body = parseBody("<x>not json</x>", true);
    ASSERT_TRUE(body.is_string());
    EXPECT_EQ(body.get<std::string>(), "<x>not json</x>");
}

TEST(ParseBody, JsonModeEmptyIsNull) {
    EXPECT_TRUE(parseBody("", true).is_null());
}

TEST(ParseBody, TextModeNeverParses) {
    auto body = parseBody(R"({"x":1})", false);
    ASSERT_TRUE(body.is_string());
    EXPECT_EQ(body.get<std::string>(), R"({"x":1})");
}

TEST(SerializeBody, StringsSentVerbatim) {
    EXPECT_EQ(serializeBody(json("<x>raw</x>")), "<x>raw</x>");
}

TEST(SerializeBody, DocumentsDumped) {
    EXPECT_EQ(serializeBody(json{{"a", 1}}), R"({"a":1})");
}
