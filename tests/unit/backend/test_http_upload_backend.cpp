/**
 * @file test_http_upload_backend.cpp
 * @brief Unit tests for the REST upload backend
 */

#include <gtest/gtest.h>

#include <kcenon/chunked_upload/backend/http_upload_backend.h>
#include <kcenon/chunked_upload/core/checksum.h>
#include <kcenon/chunked_upload/core/upload_id.h>

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::chunked_upload::test {

/**
 * @brief Records requests and replies with canned responses
 */
class mock_http_client : public http_client_interface {
public:
    struct mock_response {
        int status_code = 200;
        std::string body;
    };

    struct request {
        std::string method;
        std::string url;
        std::string body;
        std::map<std::string, std::string> headers;
    };

    mock_response session_response{201, R"({"success":true})"};
    mock_response chunk_response{200, R"({"success":true})"};
    mock_response finalize_response{200, R"({"id":"doc-123","name":"video.mp4"})"};
    mock_response query_response{200, R"({"received_chunks":4})"};
    std::optional<error> transport_error;
    std::function<void()> on_chunk_post;

    std::vector<request> requests;

    auto get(const std::string& url,
             const std::map<std::string, std::string>& /*query*/,
             const std::map<std::string, std::string>& headers)
        -> result<http_response> override {
        requests.push_back({"GET", url, {}, headers});
        return reply(query_response);
    }

    auto post(const std::string& url,
              const std::string& body,
              const std::map<std::string, std::string>& headers)
        -> result<http_response> override {
        requests.push_back({"POST", url, body, headers});
        if (url.find("finalize") != std::string::npos) {
            return reply(finalize_response);
        }
        return reply(session_response);
    }

    auto post(const std::string& url,
              const std::vector<uint8_t>& body,
              const std::map<std::string, std::string>& headers)
        -> result<http_response> override {
        requests.push_back({"POST", url, std::string(body.begin(), body.end()), headers});
        if (on_chunk_post) {
            on_chunk_post();
        }
        return reply(chunk_response);
    }

private:
    auto reply(const mock_response& canned) -> result<http_response> {
        if (transport_error) {
            return unexpected(*transport_error);
        }
        http_response response;
        response.status_code = canned.status_code;
        response.body.assign(canned.body.begin(), canned.body.end());
        return response;
    }
};

class HttpUploadBackendTest : public ::testing::Test {
protected:
    void SetUp() override {
        client_ = std::make_shared<mock_http_client>();

        http_backend_config config;
        config.base_url = "https://uploads.example.com/";
        config.headers = {{"Authorization", "Bearer token"}};

        auto created = http_upload_backend::create(config, client_);
        ASSERT_TRUE(created.has_value());
        backend_ = std::move(created).value();

        session_.id = "1700000000000-video.mp4-10-abcdefghi";
        session_.file_name = "video.mp4";
        session_.file_size = 10;
        session_.chunk_size = 4;
        session_.total_chunks = 3;
        session_.destination_id = "collection-1";
    }

    auto make_chunk(uint64_t index, const std::string& payload) -> chunk {
        chunk c;
        c.index = index;
        c.total_chunks = 3;
        c.offset = index * 4;
        for (char ch : payload) {
            c.data.push_back(static_cast<std::byte>(ch));
        }
        c.checksum = checksum::crc32(c.data);
        return c;
    }

    std::shared_ptr<mock_http_client> client_;
    std::unique_ptr<http_upload_backend> backend_;
    upload_session session_;
    cancellation_source control_;
};

// =============================================================================
// Configuration
// =============================================================================

TEST(HttpBackendConfigTest, RequiresHttpBaseUrl) {
    http_backend_config config;
    EXPECT_FALSE(config.validate().has_value());

    config.base_url = "ftp://example.com";
    EXPECT_FALSE(config.validate().has_value());

    config.base_url = "http://localhost:8080";
    EXPECT_TRUE(config.validate().has_value());

    config.timeout = std::chrono::milliseconds(0);
    auto invalid = config.validate();
    ASSERT_FALSE(invalid.has_value());
    EXPECT_EQ(invalid.error().code, error_code::invalid_configuration);
}

TEST(HttpBackendConfigTest, CreateRejectsInvalidConfig) {
    auto created = http_upload_backend::create(http_backend_config{});
    ASSERT_FALSE(created.has_value());
    EXPECT_EQ(created.error().code, error_code::invalid_configuration);
}

// =============================================================================
// Protocol
// =============================================================================

TEST_F(HttpUploadBackendTest, InitializeSessionPostsSessionRecord) {
    ASSERT_TRUE(backend_->initialize_session(session_).has_value());

    ASSERT_EQ(client_->requests.size(), 1u);
    const auto& req = client_->requests[0];
    EXPECT_EQ(req.method, "POST");
    EXPECT_EQ(req.url, "https://uploads.example.com/api/upload-sessions");
    EXPECT_NE(req.body.find("\"id\": \"" + session_.id + "\""), std::string::npos);
    EXPECT_NE(req.body.find("\"total_chunks\": 3"), std::string::npos);
    EXPECT_EQ(req.headers.at("Content-Type"), "application/json");
    EXPECT_EQ(req.headers.at("Authorization"), "Bearer token");
}

TEST_F(HttpUploadBackendTest, InitializeSessionRejectedByServer) {
    client_->session_response = {500, R"({"error":"disk full"})"};

    auto initialized = backend_->initialize_session(session_);

    ASSERT_FALSE(initialized.has_value());
    EXPECT_EQ(initialized.error().code, error_code::http_error);
    EXPECT_NE(initialized.error().message.find("HTTP 500"), std::string::npos);
    EXPECT_NE(initialized.error().message.find("disk full"), std::string::npos);
}

TEST_F(HttpUploadBackendTest, UploadChunkSendsIndexAndChecksum) {
    auto c = make_chunk(1, "4567");

    ASSERT_TRUE(backend_->upload_chunk(session_.id, c, control_.token()).has_value());

    ASSERT_EQ(client_->requests.size(), 1u);
    const auto& req = client_->requests[0];
    EXPECT_EQ(req.url, "https://uploads.example.com/api/upload-chunk");
    EXPECT_EQ(req.body, "4567");
    EXPECT_EQ(req.headers.at("X-Upload-Session"), session_.id);
    EXPECT_EQ(req.headers.at("X-Chunk-Index"), "1");
    EXPECT_EQ(req.headers.at("X-Chunk-Checksum"), checksum::to_hex(c.checksum));
    EXPECT_EQ(req.headers.at("Content-Type"), "application/octet-stream");
}

TEST_F(HttpUploadBackendTest, UploadChunkReportsBodyFailure) {
    client_->chunk_response = {200, R"({"success":false,"error":"checksum mismatch"})"};

    auto uploaded = backend_->upload_chunk(session_.id, make_chunk(0, "0123"), control_.token());

    ASSERT_FALSE(uploaded.has_value());
    EXPECT_EQ(uploaded.error().code, error_code::chunk_upload_failed);
    EXPECT_EQ(uploaded.error().message, "checksum mismatch");
}

TEST_F(HttpUploadBackendTest, UploadChunkSkipsRequestWhenCancelled) {
    control_.cancel();

    auto uploaded = backend_->upload_chunk(session_.id, make_chunk(0, "0123"), control_.token());

    ASSERT_FALSE(uploaded.has_value());
    EXPECT_EQ(uploaded.error().code, error_code::operation_cancelled);
    EXPECT_TRUE(client_->requests.empty());
}

TEST_F(HttpUploadBackendTest, CancelDuringRequestLetsChunkComplete) {
    client_->on_chunk_post = [this]() { control_.cancel(); };

    auto uploaded = backend_->upload_chunk(session_.id, make_chunk(0, "0123"), control_.token());

    EXPECT_TRUE(uploaded.has_value());
    EXPECT_EQ(client_->requests.size(), 1u);
    EXPECT_TRUE(control_.token().is_cancelled());
}

TEST_F(HttpUploadBackendTest, TransportErrorIsPropagated) {
    client_->transport_error = error{error_code::connection_failed, "connection refused"};

    auto uploaded = backend_->upload_chunk(session_.id, make_chunk(0, "0123"), control_.token());

    ASSERT_FALSE(uploaded.has_value());
    EXPECT_EQ(uploaded.error().code, error_code::connection_failed);
}

TEST_F(HttpUploadBackendTest, FinalizeReturnsServerId) {
    auto finalized = backend_->finalize_session(session_.id, "collection-1");

    ASSERT_TRUE(finalized.has_value());
    EXPECT_EQ(finalized.value().id, "doc-123");
    EXPECT_NE(finalized.value().body.find("video.mp4"), std::string::npos);

    const auto& req = client_->requests.back();
    EXPECT_EQ(req.url, "https://uploads.example.com/api/finalize-upload");
    EXPECT_NE(req.body.find("\"sessionId\":\"" + session_.id + "\""), std::string::npos);
    EXPECT_NE(req.body.find("\"destinationId\":\"collection-1\""), std::string::npos);
}

TEST_F(HttpUploadBackendTest, FinalizeWithoutIdIsInvalidResponse) {
    client_->finalize_response = {200, R"({"ok":true})"};

    auto finalized = backend_->finalize_session(session_.id, "collection-1");

    ASSERT_FALSE(finalized.has_value());
    EXPECT_EQ(finalized.error().code, error_code::invalid_response);
}

TEST_F(HttpUploadBackendTest, QueryReceivedChunks) {
    auto received = backend_->query_received_chunks(session_.id);

    ASSERT_TRUE(received.has_value());
    EXPECT_EQ(received.value(), 4u);
    EXPECT_EQ(client_->requests.back().method, "GET");
    EXPECT_EQ(client_->requests.back().url,
              "https://uploads.example.com/api/upload-sessions/" + session_.id);
}

TEST_F(HttpUploadBackendTest, QueryRejectedByServer) {
    client_->query_response = {404, ""};

    auto received = backend_->query_received_chunks(session_.id);

    ASSERT_FALSE(received.has_value());
    EXPECT_EQ(received.error().code, error_code::http_error);
}

}  // namespace kcenon::chunked_upload::test
