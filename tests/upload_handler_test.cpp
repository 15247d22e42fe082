#include "server/UploadHandler.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <string>

#include "core/FileChunkStore.hpp"
#include "http/QueryString.hpp"
#include "test_support.hpp"

namespace fs = std::filesystem;

using chunkdrop::core::BodyReader;
using chunkdrop::core::ChunkCoordinator;
using chunkdrop::core::ErrorKind;
using chunkdrop::core::FileChunkStore;
using chunkdrop::core::StringSource;
using chunkdrop::HttpRequest;
using chunkdrop::http::Request;
using chunkdrop::http::Response;
using chunkdrop::server::ServerConfig;
using chunkdrop::server::UploadHandler;
using chunkdrop::server::UploadOutcome;
using chunkdrop::testing::multipartBody;
using chunkdrop::testing::readFile;

namespace {

const std::string kBoundary = "XyZzY0123";

Request makeRequest(HttpRequest method, const std::string& target)
{
    Request request;
    request.method = method;
    request.target = target;
    std::string query;
    chunkdrop::http::splitTarget(target, request.path, query);
    request.query = chunkdrop::http::parseQuery(query);
    return request;
}

}

class UploadHandlerTest : public ::testing::Test {
protected:
    UploadHandlerTest()
        : config_(makeConfig(root_.path())),
          store_(config_.chunkDirectory(), 256),
          chunks_(store_, config_.root, config_.maxChunks),
          handler_(config_, chunks_) {}

    static ServerConfig makeConfig(const fs::path& root)
    {
        ServerConfig config;
        config.root = root;
        config.readQuantum = 64;
        config.flushThreshold = 256;
        config.maxChunks = 50;
        return config;
    }

    UploadOutcome postForm(const std::string& path, const std::string& filename, const std::string& payload)
    {
        const std::string body = multipartBody(kBoundary, filename, payload);
        Request request = makeRequest(HttpRequest::POST, path);
        request.headers["content-type"] = "multipart/form-data; boundary=" + kBoundary;
        request.contentLength = body.size();
        request.hasContentLength = true;

        StringSource source(body, 100);
        BodyReader reader(source, body.size());
        return handler_.handleMultipart(request, reader);
    }

    UploadOutcome postChunk(const std::string& target, const std::string& data)
    {
        Request request = makeRequest(HttpRequest::POST, target);
        request.contentLength = data.size();
        request.hasContentLength = true;

        StringSource source(data);
        BodyReader reader(source, data.size());
        return handler_.handleChunk(request, reader);
    }

    chunkdrop::testing::TempDir root_;
    ServerConfig config_;
    FileChunkStore store_;
    ChunkCoordinator chunks_;
    UploadHandler handler_;
};

TEST_F(UploadHandlerTest, MultipartUploadLandsInRequestDirectory)
{
    fs::create_directories(root_.path() / "docs");
    const std::string payload = chunkdrop::testing::patternBytes(2000);

    UploadOutcome outcome = postForm("/docs/", "C:\\Users\\me\\report.bin", payload);
    ASSERT_TRUE(outcome.ok) << outcome.detail;
    EXPECT_EQ(200, outcome.httpStatus());
    EXPECT_EQ(payload, readFile(root_.path() / "docs" / "report.bin"));
    EXPECT_EQ("docs/report.bin", outcome.payload["files"][0]["path"].get<std::string>());
    EXPECT_EQ(2000u, outcome.payload["files"][0]["bytes"].get<std::uint64_t>());
}

TEST_F(UploadHandlerTest, MultipartTraversalStaysInsideRoot)
{
    UploadOutcome outcome = postForm("/%2e%2e/%2e%2e/", "../../escape.txt", "nope");
    ASSERT_TRUE(outcome.ok) << outcome.detail;
    EXPECT_TRUE(fs::exists(root_.path() / "escape.txt"));
    EXPECT_FALSE(fs::exists(root_.path().parent_path() / "escape.txt"));
}

TEST_F(UploadHandlerTest, MultipartIntoChunkDirectoryIsRejected)
{
    fs::create_directories(config_.chunkDirectory());
    UploadOutcome outcome = postForm("/.chunks/", "x.chunk_0000", "forged");
    EXPECT_FALSE(outcome.ok);
    EXPECT_EQ(400, outcome.httpStatus());
    EXPECT_TRUE(fs::is_empty(config_.chunkDirectory()));
}

TEST_F(UploadHandlerTest, MultipartWithoutBoundaryIsProtocolError)
{
    Request request = makeRequest(HttpRequest::POST, "/");
    request.headers["content-type"] = "multipart/form-data";
    StringSource source("");
    BodyReader reader(source, 0);

    UploadOutcome outcome = handler_.handleMultipart(request, reader);
    EXPECT_FALSE(outcome.ok);
    EXPECT_EQ(ErrorKind::Protocol, outcome.kind);
    EXPECT_EQ("Content-Type header doesn't contain boundary", outcome.detail);
}

TEST_F(UploadHandlerTest, BodyNotOpeningWithBoundaryCreatesNothing)
{
    const std::string body = "not a delimiter\r\n" + multipartBody(kBoundary, "a.txt", "data");
    Request request = makeRequest(HttpRequest::POST, "/");
    request.headers["content-type"] = "multipart/form-data; boundary=" + kBoundary;
    request.contentLength = body.size();
    request.hasContentLength = true;

    StringSource source(body, 100);
    BodyReader reader(source, body.size());
    UploadOutcome outcome = handler_.handleMultipart(request, reader);

    EXPECT_FALSE(outcome.ok);
    EXPECT_EQ(ErrorKind::Protocol, outcome.kind);
    EXPECT_EQ(400, outcome.httpStatus());
    EXPECT_TRUE(fs::is_empty(root_.path()));
}

TEST_F(UploadHandlerTest, MultipartIntoMissingDirectoryIsStorageError)
{
    UploadOutcome outcome = postForm("/no/such/dir/", "a.txt", "data");
    EXPECT_FALSE(outcome.ok);
    EXPECT_EQ(ErrorKind::Storage, outcome.kind);
    EXPECT_EQ(500, outcome.httpStatus());
}

TEST_F(UploadHandlerTest, ChunkedUploadEndToEnd)
{
    ASSERT_TRUE(postChunk("/upload_chunk?chunk=1&total=2&filename=big%20file.bin", "world").ok);
    UploadOutcome first = postChunk("/upload_chunk?chunk=0&total=2&filename=big%20file.bin", "hello ");
    ASSERT_TRUE(first.ok) << first.detail;
    EXPECT_EQ("Chunk 1/2 uploaded successfully", first.detail);

    UploadOutcome done = handler_.handleFinalize(
        makeRequest(HttpRequest::POST, "/finalize_upload?filename=big%20file.bin&total=2"));
    ASSERT_TRUE(done.ok) << done.detail;
    EXPECT_EQ("hello world", readFile(root_.path() / "big file.bin"));

    Response response = UploadHandler::toApiResponse(done);
    EXPECT_EQ(200, response.status);
    auto body = nlohmann::json::parse(response.body);
    EXPECT_EQ("success", body["status"]);
    EXPECT_EQ(11, body["bytes"].get<int>());
}

TEST_F(UploadHandlerTest, FinalizeWithMissingChunksIsConflict)
{
    ASSERT_TRUE(postChunk("/upload_chunk?chunk=0&total=3&filename=f.bin", "a").ok);

    UploadOutcome outcome = handler_.handleFinalize(
        makeRequest(HttpRequest::POST, "/finalize_upload?filename=f.bin&total=3"));
    EXPECT_FALSE(outcome.ok);
    EXPECT_EQ(409, outcome.httpStatus());
    EXPECT_EQ("Missing chunks: [1, 2]", outcome.detail);

    Response response = UploadHandler::toApiResponse(outcome);
    EXPECT_EQ(409, response.status);
    EXPECT_EQ("Missing chunks: [1, 2]", response.body);
    EXPECT_FALSE(fs::exists(root_.path() / "f.bin"));
}

TEST_F(UploadHandlerTest, MissingParametersAreNamed)
{
    UploadOutcome outcome = postChunk("/upload_chunk?chunk=0", "x");
    EXPECT_FALSE(outcome.ok);
    EXPECT_EQ(400, outcome.httpStatus());
    EXPECT_EQ("Missing required parameters: total, filename", outcome.detail);
}

TEST_F(UploadHandlerTest, MalformedNumbersAreValidationErrors)
{
    EXPECT_EQ(ErrorKind::Validation, postChunk("/upload_chunk?chunk=-1&total=2&filename=a", "x").kind);
    EXPECT_EQ(ErrorKind::Validation, postChunk("/upload_chunk?chunk=1x&total=2&filename=a", "x").kind);
    EXPECT_EQ(ErrorKind::Validation, postChunk("/upload_chunk?chunk=0&total=51&filename=a", "x").kind);
    EXPECT_EQ(ErrorKind::Validation, postChunk("/upload_chunk?chunk=0&total=1&filename=a&crc32=xyz", "x").kind);
}

TEST_F(UploadHandlerTest, ChunkFilenameTraversalRejected)
{
    UploadOutcome outcome = postChunk("/upload_chunk?chunk=0&total=1&filename=..%2Fetc%2Fpasswd", "x");
    EXPECT_FALSE(outcome.ok);
    EXPECT_EQ(ErrorKind::Validation, outcome.kind);
}

TEST_F(UploadHandlerTest, CrcMismatchIsUnprocessable)
{
    UploadOutcome outcome = postChunk("/upload_chunk?chunk=0&total=1&filename=c.bin&crc32=deadbeef", "payload");
    EXPECT_FALSE(outcome.ok);
    EXPECT_EQ(422, outcome.httpStatus());

    // CRC-32 of "payload"
    UploadOutcome good = postChunk("/upload_chunk?chunk=0&total=1&filename=c.bin&crc32=422c6a15", "payload");
    EXPECT_TRUE(good.ok) << good.detail;
    EXPECT_EQ("422c6a15", good.payload["crc32"].get<std::string>());
}

TEST_F(UploadHandlerTest, TruncatedChunkIsBadRequest)
{
    Request request = makeRequest(HttpRequest::POST, "/upload_chunk?chunk=0&total=1&filename=t.bin");
    StringSource source("short");
    BodyReader reader(source, 1000);

    UploadOutcome outcome = handler_.handleChunk(request, reader);
    EXPECT_EQ(ErrorKind::Truncation, outcome.kind);
    EXPECT_EQ(400, outcome.httpStatus());
    EXPECT_TRUE(chunks_.progress("t.bin", 1).present.empty());
}

TEST_F(UploadHandlerTest, StatusAndAbort)
{
    ASSERT_TRUE(postChunk("/upload_chunk?chunk=2&total=4&filename=s.bin", "c").ok);

    UploadOutcome status = handler_.handleStatus(
        makeRequest(HttpRequest::GET, "/upload_status?filename=s.bin&total=4"));
    ASSERT_TRUE(status.ok) << status.detail;
    EXPECT_EQ(nlohmann::json::array({2}), status.payload["present"]);
    EXPECT_EQ(nlohmann::json::array({0, 1, 3}), status.payload["missing"]);
    EXPECT_FALSE(status.payload["complete"].get<bool>());

    UploadOutcome aborted = handler_.handleAbort(makeRequest(HttpRequest::POST, "/abort_upload?filename=s.bin"));
    ASSERT_TRUE(aborted.ok);
    EXPECT_EQ(1u, aborted.payload["removed"].get<std::size_t>());
}

TEST_F(UploadHandlerTest, ResultPageCarriesStatusAndEscapedDetail)
{
    Response ok = UploadHandler::toResultPage(UploadOutcome::success("'a.txt' (4 Bytes)"), "/docs/");
    EXPECT_EQ(200, ok.status);
    EXPECT_NE(std::string::npos, ok.body.find("Success!"));
    EXPECT_NE(std::string::npos, ok.body.find("&#x27;a.txt&#x27;"));
    EXPECT_NE(std::string::npos, ok.body.find("href=\"/docs/\""));

    Response failed = UploadHandler::toResultPage(
        UploadOutcome::failure(ErrorKind::Protocol, "<b>bad</b>"), "");
    EXPECT_EQ(400, failed.status);
    EXPECT_NE(std::string::npos, failed.body.find("Failed!"));
    EXPECT_NE(std::string::npos, failed.body.find("&lt;b&gt;bad&lt;/b&gt;"));
}
