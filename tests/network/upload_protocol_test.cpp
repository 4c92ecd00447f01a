#include <gtest/gtest.h>
#include "upo/network/upload_protocol.hpp"

using namespace upo::network;
using upo::upload::SourceFile;
using upo::upload::StatusCategory;
using upo::upload::UploadMetadata;

namespace {

SourceFile photo() {
    SourceFile file;
    file.name = "kitchen.jpg";
    file.mime_type = "image/jpeg";
    file.bytes = {0xff, 0xd8, 0xff, 0xe0};
    return file;
}

UploadMetadata metadata() {
    UploadMetadata meta;
    meta.entity_type = "property";
    meta.entity_id = "prop-42";
    return meta;
}

HttpResponse response(int status, const std::string& body, HeaderMap headers = {}) {
    HttpResponse r;
    r.status_code = status;
    r.headers = std::move(headers);
    r.body.assign(body.begin(), body.end());
    return r;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

TEST(UploadProtocolTest, BuildsMultipartRequest) {
    UploadEndpoint endpoint;
    endpoint.host = "api.example.com";
    endpoint.port = 8080;
    endpoint.path = "/api/v2/uploads";

    auto meta = metadata();
    meta.category = "photos";
    meta.file_type = "image";

    const auto request = build_upload_request(photo(), meta, endpoint, "BOUNDARY");
    EXPECT_EQ(request.method, HttpMethod::POST);
    EXPECT_EQ(request.url, "/api/v2/uploads");
    EXPECT_EQ(request.get_header("Host"), "api.example.com:8080");
    EXPECT_EQ(request.get_header("Content-Type"), "multipart/form-data; boundary=BOUNDARY");
    EXPECT_EQ(request.get_header("Authorization"), "");

    const std::string body(request.body.begin(), request.body.end());
    EXPECT_TRUE(contains(body, "name=\"file\"; filename=\"kitchen.jpg\"\r\nContent-Type: image/jpeg\r\n\r\n"));
    EXPECT_TRUE(contains(body, "name=\"entityType\"\r\n\r\nproperty\r\n"));
    EXPECT_TRUE(contains(body, "name=\"entityId\"\r\n\r\nprop-42\r\n"));
    EXPECT_TRUE(contains(body, "name=\"category\"\r\n\r\nphotos\r\n"));
    EXPECT_TRUE(contains(body, "name=\"fileType\"\r\n\r\nimage\r\n"));
    EXPECT_TRUE(contains(body, "--BOUNDARY--\r\n"));
}

TEST(UploadProtocolTest, OmitsOptionalFieldsAndAddsBearerToken) {
    UploadEndpoint endpoint;
    endpoint.host = "localhost";
    endpoint.auth_token = "secret";

    const auto request = build_upload_request(photo(), metadata(), endpoint, "B");
    EXPECT_EQ(request.get_header("Host"), "localhost");
    EXPECT_EQ(request.get_header("Authorization"), "Bearer secret");

    const std::string body(request.body.begin(), request.body.end());
    EXPECT_FALSE(contains(body, "name=\"category\""));
    EXPECT_FALSE(contains(body, "name=\"fileType\""));

    const std::string head = request.serialize_head();
    EXPECT_TRUE(contains(head, "POST /api/v2/uploads HTTP/1.1\r\n"));
    EXPECT_TRUE(contains(head, "Content-Length: " + std::to_string(request.body.size()) + "\r\n"));
}

TEST(UploadProtocolTest, BoundariesDiffer) {
    const auto a = make_boundary();
    const auto b = make_boundary();
    EXPECT_NE(a, b);
    EXPECT_TRUE(contains(a, "upo-boundary"));
}

TEST(UploadProtocolTest, ParseRetryAfter) {
    EXPECT_EQ(parse_retry_after("10").value(), std::chrono::seconds(10));
    EXPECT_EQ(parse_retry_after("  7 ").value(), std::chrono::seconds(7));
    EXPECT_FALSE(parse_retry_after("").has_value());
    EXPECT_FALSE(parse_retry_after("0").has_value());
    EXPECT_FALSE(parse_retry_after("-3").has_value());
    EXPECT_FALSE(parse_retry_after("Wed, 21 Oct 2015 07:28:00 GMT").has_value());
}

TEST(UploadProtocolTest, SuccessYieldsReceipt) {
    auto result = classify_response(
        response(201, R"({"file":{"url":"https://cdn/kitchen.jpg","key":"uploads/kitchen.jpg"}})"),
        std::chrono::seconds(30));

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().url, "https://cdn/kitchen.jpg");
    EXPECT_EQ(result.value().key, "uploads/kitchen.jpg");
}

TEST(UploadProtocolTest, SuccessWithoutUrlIsServerError) {
    for (const std::string body : {"", "not json", R"({"file":{}})", R"({"file":{"url":""}})"}) {
        auto result = classify_response(response(200, body), std::chrono::seconds(30));
        ASSERT_TRUE(result.is_error()) << body;
        EXPECT_EQ(result.error().category, StatusCategory::ServerError);
        EXPECT_EQ(result.error().message, "No URL returned from server");
    }
}

TEST(UploadProtocolTest, RateLimitPrefersHeader) {
    auto result = classify_response(
        response(429, R"({"retryAfterSeconds": 90, "message": "Slow down"})", {{"Retry-After", "10"}}),
        std::chrono::seconds(30));

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().category, StatusCategory::RateLimited);
    EXPECT_EQ(result.error().http_status, 429);
    EXPECT_EQ(result.error().message, "Slow down");
    EXPECT_EQ(result.error().retry_after.value(), std::chrono::milliseconds(10000));
}

TEST(UploadProtocolTest, RateLimitFallsBackToBodyThenDefault) {
    auto from_body = classify_response(response(429, R"({"retryAfterSeconds": 45})"), std::chrono::seconds(30));
    ASSERT_TRUE(from_body.is_error());
    EXPECT_EQ(from_body.error().retry_after.value(), std::chrono::milliseconds(45000));

    auto from_default = classify_response(response(429, "", {{"Retry-After", "soon"}}), std::chrono::seconds(30));
    ASSERT_TRUE(from_default.is_error());
    EXPECT_EQ(from_default.error().retry_after.value(), std::chrono::milliseconds(30000));
    EXPECT_EQ(from_default.error().message, "Upload failed (HTTP 429)");
}

TEST(UploadProtocolTest, ClientAndServerErrors) {
    auto client = classify_response(response(413, R"({"message":"File too large"})"), std::chrono::seconds(30));
    ASSERT_TRUE(client.is_error());
    EXPECT_EQ(client.error().category, StatusCategory::ClientError);
    EXPECT_EQ(client.error().message, "File too large");
    EXPECT_FALSE(client.error().retry_after.has_value());

    auto server = classify_response(response(502, "<html>bad gateway</html>"), std::chrono::seconds(30));
    ASSERT_TRUE(server.is_error());
    EXPECT_EQ(server.error().category, StatusCategory::ServerError);
    EXPECT_EQ(server.error().http_status, 502);
    EXPECT_EQ(server.error().message, "Upload failed (HTTP 502)");
}
