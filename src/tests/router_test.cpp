#include <gtest/gtest.h>
#include <filesystem>
#include <sstream>
#include <nlohmann/json.hpp>
#include "network/router.hpp"
#include "test_utils.hpp"

using namespace xfer;
using namespace xfer::network;

class RouterTest : public ::testing::Test {
protected:
  const std::string SECRET = "router-secret";
  const std::string BOUNDARY = "routerBoundary";

  std::filesystem::path test_dir;
  std::unique_ptr<auth::CredentialGuard> guard;
  std::unique_ptr<registry::FileRegistry> registry;
  std::unique_ptr<store::BlobStore> blob_store;
  std::unique_ptr<transfer::TransferHandler> handler;
  std::unique_ptr<Router> router;

  void SetUp() override {
    test_dir = make_temp_dir("router_test");
    guard = std::make_unique<auth::CredentialGuard>(SECRET);
    registry = std::make_unique<registry::FileRegistry>();
    blob_store = std::make_unique<store::BlobStore>(test_dir);
    handler = std::make_unique<transfer::TransferHandler>(*guard, *registry, *blob_store, 64 * 1024);
    router = std::make_unique<Router>(*handler);
  }

  void TearDown() override {
    router.reset();
    handler.reset();
    blob_store.reset();
    std::error_code ec;
    std::filesystem::remove_all(test_dir, ec);
  }

  RequestHead make_request(http::verb method, const std::string& target, const std::string& token = "") {
    RequestHead req{method, target, 11};
    if (!token.empty()) {
      req.set(http::field::authorization, "Bearer " + token);
    }
    return req;
  }

  Reply send(const RequestHead& req, const std::string& body = "") {
    std::istringstream input(body);
    transfer::StreamBodyReader reader(input);
    std::optional<std::uintmax_t> length;
    if (!body.empty()) {
      length = body.size();
    }
    return router->route(req, reader, length);
  }

  // Expects a buffered reply and returns it
  http::response<http::string_body> buffered(Reply reply) {
    auto* res = std::get_if<http::response<http::string_body>>(&reply);
    EXPECT_NE(res, nullptr) << "Expected a buffered response";
    if (!res) {
      return {};
    }
    return std::move(*res);
  }

  nlohmann::json json_body(const http::response<http::string_body>& res) {
    EXPECT_EQ(res[http::field::content_type], "application/json");
    return nlohmann::json::parse(res.body());
  }

  std::string upload(const std::string& filename, const std::string& content) {
    auto req = make_request(http::verb::post, "/api/upload", SECRET);
    req.set(http::field::content_type, multipart_content_type(BOUNDARY));
    auto res = buffered(send(req, make_multipart(BOUNDARY, "file", filename, content)));
    EXPECT_EQ(res.result(), http::status::ok);
    return json_body(res)["file_id"].get<std::string>();
  }

  std::string drain(StreamReply& reply) {
    std::stringstream output;
    output << reply.body->rdbuf();
    return output.str();
  }
};

TEST_F(RouterTest, UploadAnswersRecordAsJson) {
  auto req = make_request(http::verb::post, "/api/upload", SECRET);
  req.set(http::field::content_type, multipart_content_type(BOUNDARY));
  auto res = buffered(send(req, make_multipart(BOUNDARY, "file", "a.txt", "hello")));

  ASSERT_EQ(res.result(), http::status::ok);
  auto body = json_body(res);
  EXPECT_EQ(body["message"], "File uploaded successfully");
  EXPECT_EQ(body["filename"], "a.txt");
  EXPECT_EQ(body["size"], 5);
  EXPECT_EQ(body["id"], body["file_id"]);
}

TEST_F(RouterTest, ListReturnsFilesInOrder) {
  std::string first = upload("one.txt", "1");
  std::string second = upload("two.txt", "22");

  auto res = buffered(send(make_request(http::verb::get, "/api/files", SECRET)));
  ASSERT_EQ(res.result(), http::status::ok);
  auto files = json_body(res)["files"];
  ASSERT_EQ(files.size(), 2u);
  EXPECT_EQ(files[0]["id"], first);
  EXPECT_EQ(files[0]["filename"], "one.txt");
  EXPECT_EQ(files[1]["id"], second);
  EXPECT_EQ(files[1]["size"], 2);
  EXPECT_TRUE(files[1]["timestamp"].is_string());
}

TEST_F(RouterTest, DownloadStreamsWithAttachmentHeaders) {
  const std::string payload = make_payload(10000);
  std::string id = upload("data.bin", payload);

  Reply reply = send(make_request(http::verb::get, "/api/download/" + id, SECRET));
  auto* stream = std::get_if<StreamReply>(&reply);
  ASSERT_NE(stream, nullptr);
  EXPECT_EQ(stream->header.result(), http::status::ok);
  EXPECT_EQ(stream->header[http::field::content_type], "application/octet-stream");
  EXPECT_EQ(stream->header[http::field::content_disposition], "attachment; filename=data.bin");
  EXPECT_EQ(stream->header[http::field::content_length], std::to_string(payload.size()));
  EXPECT_EQ(stream->length, payload.size());
  EXPECT_EQ(drain(*stream), payload);
}

TEST_F(RouterTest, DeleteRemovesFile) {
  std::string id = upload("gone.txt", "bye");

  auto res = buffered(send(make_request(http::verb::delete_, "/api/files/" + id, SECRET)));
  EXPECT_EQ(res.result(), http::status::ok);
  EXPECT_EQ(json_body(res)["message"], "File deleted successfully");

  auto again = buffered(send(make_request(http::verb::delete_, "/api/files/" + id, SECRET)));
  EXPECT_EQ(again.result(), http::status::not_found);
  EXPECT_EQ(json_body(again)["error"], "File not found");
}

TEST_F(RouterTest, MissingOrWrongTokenIsForbidden) {
  std::string id = upload("secret.txt", "classified");

  for (const std::string& token : {std::string(), std::string("wrong")}) {
    auto list = buffered(send(make_request(http::verb::get, "/api/files", token)));
    EXPECT_EQ(list.result(), http::status::forbidden);
    EXPECT_TRUE(json_body(list).contains("error"));

    auto del = buffered(send(make_request(http::verb::delete_, "/api/files/" + id, token)));
    EXPECT_EQ(del.result(), http::status::forbidden);

    auto down = buffered(send(make_request(http::verb::get, "/api/download/" + id, token)));
    EXPECT_EQ(down.result(), http::status::forbidden);
  }
  EXPECT_EQ(registry->size(), 1u);
}

TEST_F(RouterTest, TokenWithoutBearerSchemeIsForbidden) {
  RequestHead req{http::verb::get, "/api/files", 11};
  req.set(http::field::authorization, SECRET);
  EXPECT_EQ(buffered(send(req)).result(), http::status::forbidden);
}

TEST_F(RouterTest, UploadErrorsMapToStatus) {
  auto no_type = make_request(http::verb::post, "/api/upload", SECRET);
  EXPECT_EQ(buffered(send(no_type, "plain body")).result(), http::status::bad_request);

  auto too_big = make_request(http::verb::post, "/api/upload", SECRET);
  too_big.set(http::field::content_type, multipart_content_type(BOUNDARY));
  auto res = buffered(send(too_big, make_multipart(BOUNDARY, "file", "big.bin", make_payload(65 * 1024))));
  EXPECT_EQ(res.result(), http::status::payload_too_large);
  EXPECT_EQ(registry->size(), 0u);
}

TEST_F(RouterTest, UnknownIdIsNotFound) {
  auto res = buffered(send(make_request(http::verb::get, "/api/download/unknown", SECRET)));
  EXPECT_EQ(res.result(), http::status::not_found);
  EXPECT_EQ(json_body(res)["error"], "File not found");
}

TEST_F(RouterTest, UnknownPathAndWrongMethod) {
  EXPECT_EQ(buffered(send(make_request(http::verb::get, "/nowhere", SECRET))).result(), http::status::not_found);
  EXPECT_EQ(buffered(send(make_request(http::verb::get, "/api/files/a/b", SECRET))).result(),
            http::status::not_found);

  auto res = buffered(send(make_request(http::verb::get, "/api/upload", SECRET)));
  EXPECT_EQ(res.result(), http::status::method_not_allowed);
  EXPECT_EQ(res[http::field::allow], "POST");

  auto put = buffered(send(make_request(http::verb::put, "/api/files", SECRET)));
  EXPECT_EQ(put.result(), http::status::method_not_allowed);
}

TEST_F(RouterTest, LinkRoutesTakeQueryKey) {
  std::string id = upload("link.txt", "via link");

  Reply reply = send(make_request(http::verb::get, "/download/" + id + "?api_key=" + SECRET));
  auto* stream = std::get_if<StreamReply>(&reply);
  ASSERT_NE(stream, nullptr);
  EXPECT_EQ(drain(*stream), "via link");

  auto denied = buffered(send(make_request(http::verb::get, "/delete/" + id + "?api_key=nope")));
  EXPECT_EQ(denied.result(), http::status::forbidden);
  EXPECT_EQ(denied[http::field::content_type], "text/plain");

  auto deleted = buffered(send(make_request(http::verb::get, "/delete/" + id + "?api_key=" + SECRET)));
  EXPECT_EQ(deleted.result(), http::status::ok);
  EXPECT_EQ(deleted.body(), "File deleted successfully");
  EXPECT_EQ(registry->size(), 0u);

  auto missing = buffered(send(make_request(http::verb::get, "/download/" + id + "?api_key=" + SECRET)));
  EXPECT_EQ(missing.result(), http::status::not_found);
  EXPECT_EQ(missing.body(), "File not found");
}

TEST_F(RouterTest, FormUploadTakesKeyField) {
  auto req = make_request(http::verb::post, "/upload-web");
  req.set(http::field::content_type, multipart_content_type(BOUNDARY));
  std::string body = make_form_field(BOUNDARY, "api_key", SECRET) +
                     make_multipart(BOUNDARY, "file", "form.txt", "from a form");

  auto res = buffered(send(req, body));
  ASSERT_EQ(res.result(), http::status::ok);
  EXPECT_EQ(res[http::field::content_type], "text/plain");
  EXPECT_EQ(res.body().rfind("File uploaded successfully", 0), 0u);

  auto records = handler->list(SECRET);
  ASSERT_EQ(records.size(), 1u);
  EXPECT_EQ(records[0].display_name, "form.txt");
  EXPECT_NE(res.body().find(records[0].id), std::string::npos);
}

TEST_F(RouterTest, FormUploadTakesQueryKey) {
  auto req = make_request(http::verb::post, "/upload-web?api_key=" + SECRET);
  req.set(http::field::content_type, multipart_content_type(BOUNDARY));

  auto res = buffered(send(req, make_multipart(BOUNDARY, "file", "q.txt", "query key")));
  EXPECT_EQ(res.result(), http::status::ok);
  EXPECT_EQ(registry->size(), 1u);
}

TEST_F(RouterTest, FormUploadWithoutValidKeyWritesNothing) {
  auto req = make_request(http::verb::post, "/upload-web");
  req.set(http::field::content_type, multipart_content_type(BOUNDARY));

  auto wrong = buffered(send(req, make_form_field(BOUNDARY, "api_key", "nope") +
                                  make_multipart(BOUNDARY, "file", "x.txt", "data")));
  EXPECT_EQ(wrong.result(), http::status::forbidden);
  EXPECT_EQ(wrong.body(), "Unauthorized");

  // A key after the file part is never consulted
  std::string late = "--" + BOUNDARY + "\r\n"
                     "Content-Disposition: form-data; name=\"file\"; filename=\"x.txt\"\r\n"
                     "\r\ndata\r\n" +
                     make_form_field(BOUNDARY, "api_key", SECRET) + "--" + BOUNDARY + "--\r\n";
  auto key_last = buffered(send(req, late));
  EXPECT_EQ(key_last.result(), http::status::forbidden);

  auto missing = buffered(send(req, make_multipart(BOUNDARY, "file", "x.txt", "data")));
  EXPECT_EQ(missing.result(), http::status::forbidden);

  EXPECT_EQ(registry->size(), 0u);
  EXPECT_EQ(blob_store->count(), 0u);
  EXPECT_TRUE(std::filesystem::is_empty(test_dir));
}

TEST_F(RouterTest, FormUploadErrorsAreText) {
  auto req = make_request(http::verb::post, "/upload-web");
  req.set(http::field::content_type, multipart_content_type(BOUNDARY));

  auto no_file = buffered(send(req, make_form_field(BOUNDARY, "api_key", SECRET) + "--" + BOUNDARY + "--\r\n"));
  EXPECT_EQ(no_file.result(), http::status::bad_request);
  EXPECT_EQ(no_file.body(), "No file part in the request");

  auto unnamed = buffered(send(req, make_form_field(BOUNDARY, "api_key", SECRET) +
                                    make_multipart(BOUNDARY, "file", "", "data")));
  EXPECT_EQ(unnamed.result(), http::status::bad_request);
  EXPECT_EQ(unnamed.body(), "No file selected");

  auto get = buffered(send(make_request(http::verb::get, "/upload-web")));
  EXPECT_EQ(get.result(), http::status::method_not_allowed);
}

TEST_F(RouterTest, ResponsesFollowKeepAlive) {
  auto req = make_request(http::verb::get, "/api/files", SECRET);
  req.keep_alive(false);
  EXPECT_FALSE(buffered(send(req)).keep_alive());

  req.keep_alive(true);
  EXPECT_TRUE(buffered(send(req)).keep_alive());
}

TEST(RouterParsingTest, UrlDecode) {
  EXPECT_EQ(Router::url_decode("a%20b", false), "a b");
  EXPECT_EQ(Router::url_decode("a+b", false), "a+b");
  EXPECT_EQ(Router::url_decode("a+b", true), "a b");
  EXPECT_EQ(Router::url_decode("%2Fpath%2f", false), "/path/");
  EXPECT_EQ(Router::url_decode("bad%zzescape%4", false), "bad%zzescape%4");
}

TEST(RouterParsingTest, ParseQuery) {
  auto params = Router::parse_query("api_key=s%26cret&flag&x=1&x=2&&empty=");
  EXPECT_EQ(params["api_key"], "s&cret");
  EXPECT_EQ(params["flag"], "");
  EXPECT_EQ(params["x"], "1");
  EXPECT_EQ(params["empty"], "");
  EXPECT_TRUE(Router::parse_query("").empty());
}

TEST(RouterParsingTest, StatusForEachKind) {
  using xfer::transfer::ErrorKind;
  EXPECT_EQ(Router::status_for(ErrorKind::Unauthorized), http::status::forbidden);
  EXPECT_EQ(Router::status_for(ErrorKind::BadRequest), http::status::bad_request);
  EXPECT_EQ(Router::status_for(ErrorKind::NotFound), http::status::not_found);
  EXPECT_EQ(Router::status_for(ErrorKind::PayloadTooLarge), http::status::payload_too_large);
  EXPECT_EQ(Router::status_for(ErrorKind::StorageFault), http::status::internal_server_error);
}
