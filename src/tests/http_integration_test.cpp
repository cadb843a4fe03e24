#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <functional>
#include <sstream>
#include <thread>
#include <vector>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include "cli/cli.hpp"
#include "client/transfer_client.hpp"
#include "server/bootstrap.hpp"
#include "test_utils.hpp"

using namespace xfer;
using xfer::client::NetworkError;
using xfer::client::TransferClient;

class HttpIntegrationTest : public ::testing::Test {
protected:
  const std::string SECRET = "integration-secret";

  std::filesystem::path server_dir;
  std::filesystem::path client_dir;
  std::unique_ptr<server::Bootstrap> server;

  void SetUp() override {
    init_logging(boost::log::trivial::warning);
    server_dir = make_temp_dir("xfer_server");
    client_dir = make_temp_dir("xfer_client");

    server::ServerOptions options;
    options.host = "127.0.0.1";
    options.port = 0;
    options.upload_dir = server_dir.string();
    options.api_key = SECRET;
    options.max_upload_mb = 1;

    server = std::make_unique<server::Bootstrap>(options);
    ASSERT_TRUE(server->start());
    ASSERT_NE(server->port(), 0);
  }

  void TearDown() override {
    server.reset();
    std::error_code ec;
    std::filesystem::remove_all(server_dir, ec);
    std::filesystem::remove_all(client_dir, ec);
  }

  std::string server_url() const {
    return "http://127.0.0.1:" + std::to_string(server->port());
  }

  TransferClient make_client(const std::string& key = "") {
    return TransferClient(client::ClientConfig{server_url(), key.empty() ? SECRET : key});
  }

  std::filesystem::path local_file(const std::string& name, const std::string& content) {
    auto path = client_dir / name;
    write_file(path, content);
    return path;
  }

  void expect_status(unsigned status, const std::function<void()>& action) {
    try {
      action();
      ADD_FAILURE() << "Expected NetworkError with status " << status;
    } catch (const NetworkError& e) {
      EXPECT_EQ(e.status(), status) << e.what();
    }
  }
};

TEST_F(HttpIntegrationTest, UploadListDownloadDelete) {
  const std::string payload = make_payload(300 * 1024);
  auto client = make_client();

  auto uploaded = client.upload(local_file("photo.jpg", payload));
  EXPECT_EQ(uploaded.filename, "photo.jpg");
  EXPECT_EQ(uploaded.size, payload.size());

  auto files = client.list();
  ASSERT_EQ(files.size(), 1u);
  EXPECT_EQ(files[0].id, uploaded.id);
  EXPECT_EQ(files[0].filename, "photo.jpg");
  EXPECT_EQ(files[0].size, payload.size());
  EXPECT_FALSE(files[0].timestamp.empty());

  std::uintmax_t last_received = 0;
  std::optional<std::uintmax_t> last_total;
  auto dest = client_dir / "copy.jpg";
  auto downloaded = client.download(uploaded.id, dest, [&](std::uintmax_t received, std::optional<std::uintmax_t> total) {
    EXPECT_GE(received, last_received);
    last_received = received;
    last_total = total;
  });
  EXPECT_EQ(downloaded.path.string(), dest.string());
  EXPECT_EQ(downloaded.bytes, payload.size());
  EXPECT_EQ(read_file(dest), payload);
  EXPECT_EQ(last_received, payload.size());
  ASSERT_TRUE(last_total.has_value());
  EXPECT_EQ(*last_total, payload.size());
  EXPECT_FALSE(std::filesystem::exists(client_dir / "copy.jpg.part"));

  client.remove(uploaded.id);
  EXPECT_TRUE(client.list().empty());
  expect_status(404, [&] { client.download(uploaded.id, client_dir / "gone.jpg"); });
  EXPECT_FALSE(std::filesystem::exists(client_dir / "gone.jpg"));
  EXPECT_FALSE(std::filesystem::exists(client_dir / "gone.jpg.part"));
}

TEST_F(HttpIntegrationTest, EmptyFileRoundTrip) {
  auto client = make_client();
  auto uploaded = client.upload(local_file("empty.txt", ""));
  EXPECT_EQ(uploaded.size, 0u);

  auto result = client.download(uploaded.id, client_dir / "empty_copy.txt");
  EXPECT_EQ(result.bytes, 0u);
  EXPECT_TRUE(std::filesystem::exists(client_dir / "empty_copy.txt"));
  EXPECT_EQ(read_file(client_dir / "empty_copy.txt"), "");
}

TEST_F(HttpIntegrationTest, DownloadIntoDirectoryUsesServerName) {
  auto client = make_client();
  auto uploaded = client.upload(local_file("my report.txt", "quarterly"));
  EXPECT_EQ(uploaded.filename, "my_report.txt");

  auto target = client_dir / "downloads";
  std::filesystem::create_directories(target);
  auto result = client.download(uploaded.id, target);
  EXPECT_EQ(result.path.string(), (target / "my_report.txt").string());
  EXPECT_EQ(read_file(result.path), "quarterly");
}

TEST_F(HttpIntegrationTest, WrongKeyIsForbidden) {
  auto uploaded = make_client().upload(local_file("keep.txt", "keep"));
  auto intruder = make_client("not-the-key");

  expect_status(403, [&] { intruder.list(); });
  expect_status(403, [&] { intruder.upload(local_file("evil.txt", "evil")); });
  expect_status(403, [&] { intruder.download(uploaded.id, client_dir / "stolen.txt"); });
  expect_status(403, [&] { intruder.remove(uploaded.id); });

  EXPECT_EQ(server->get_registry().size(), 1u);
  EXPECT_EQ(server->get_blob_store().count(), 1u);
  EXPECT_FALSE(std::filesystem::exists(client_dir / "stolen.txt"));
}

TEST_F(HttpIntegrationTest, UnknownIdIsNotFound) {
  auto client = make_client();
  expect_status(404, [&] { client.remove("does-not-exist"); });
  expect_status(404, [&] { client.download("does-not-exist", client_dir / "x"); });
}

TEST_F(HttpIntegrationTest, OversizedUploadIsRejected) {
  auto client = make_client();
  try {
    client.upload(local_file("huge.bin", make_payload(1024 * 1024 + 1)));
    FAIL() << "Upload over the limit should fail";
  } catch (const NetworkError& e) {
    EXPECT_EQ(e.status(), 413u);
    EXPECT_STREQ(e.what(), "File too large");
  }
  EXPECT_EQ(server->get_registry().size(), 0u);

  // Server is still usable afterwards
  EXPECT_NO_THROW(client.upload(local_file("small.bin", "small")));
}

TEST_F(HttpIntegrationTest, MissingLocalFileFailsBeforeConnecting) {
  auto client = make_client();
  EXPECT_THROW(client.upload(client_dir / "nope.txt"), std::invalid_argument);
}

TEST_F(HttpIntegrationTest, RejectedUploadNeverAsksForBody) {
  namespace beast = boost::beast;
  namespace http = beast::http;
  using tcp = boost::asio::ip::tcp;

  boost::asio::io_context io;
  tcp::socket socket(io);
  socket.connect(tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), server->port()));

  http::request<http::empty_body> req{http::verb::post, "/api/upload", 11};
  req.set(http::field::host, "127.0.0.1");
  req.set(http::field::authorization, "Bearer wrong");
  req.set(http::field::content_type, multipart_content_type("b"));
  req.set(http::field::expect, "100-continue");
  req.content_length(4096);
  http::request_serializer<http::empty_body> sr{req};
  http::write_header(socket, sr);

  beast::flat_buffer buffer;
  http::response<http::string_body> res;
  http::read(socket, buffer, res);
  EXPECT_EQ(res.result(), http::status::forbidden);
  EXPECT_FALSE(res.keep_alive());

  beast::error_code ec;
  socket.shutdown(tcp::socket::shutdown_both, ec);
}

TEST_F(HttpIntegrationTest, KeepAliveServesSeveralRequests) {
  namespace beast = boost::beast;
  namespace http = beast::http;
  using tcp = boost::asio::ip::tcp;

  boost::asio::io_context io;
  tcp::socket socket(io);
  socket.connect(tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), server->port()));
  beast::flat_buffer buffer;

  for (int i = 0; i < 3; ++i) {
    http::request<http::empty_body> req{http::verb::get, "/api/files", 11};
    req.set(http::field::host, "127.0.0.1");
    req.set(http::field::authorization, "Bearer " + SECRET);
    http::write(socket, req);

    http::response<http::string_body> res;
    http::read(socket, buffer, res);
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(res.body(), "{\"files\":[]}");
  }
  // One connection, one session
  EXPECT_EQ(server->get_http_server().active_sessions(), 1u);

  beast::error_code ec;
  socket.shutdown(tcp::socket::shutdown_both, ec);
  socket.close(ec);

  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (server->get_http_server().active_sessions() != 0 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  EXPECT_EQ(server->get_http_server().active_sessions(), 0u);
}

TEST_F(HttpIntegrationTest, ShutdownUnblocksIdleConnections) {
  namespace beast = boost::beast;
  namespace http = beast::http;
  using tcp = boost::asio::ip::tcp;

  boost::asio::io_context io;
  std::vector<std::unique_ptr<tcp::socket>> sockets;
  for (int i = 0; i < 4; ++i) {
    auto socket = std::make_unique<tcp::socket>(io);
    socket->connect(tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), server->port()));

    // A completed request guarantees the session is running and idle in a read
    http::request<http::empty_body> req{http::verb::get, "/api/files", 11};
    req.set(http::field::host, "127.0.0.1");
    req.set(http::field::authorization, "Bearer " + SECRET);
    http::write(*socket, req);
    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    http::read(*socket, buffer, res);
    ASSERT_EQ(res.result(), http::status::ok);
    sockets.push_back(std::move(socket));
  }
  EXPECT_EQ(server->get_http_server().active_sessions(), sockets.size());

  // Returns only once every session thread has been joined
  EXPECT_TRUE(server->shutdown());

  // The server side of every connection is gone
  for (auto& socket : sockets) {
    char byte;
    beast::error_code ec;
    socket->read_some(boost::asio::buffer(&byte, 1), ec);
    EXPECT_TRUE(ec);
  }
}

TEST_F(HttpIntegrationTest, CliSingleShotCommands) {
  client::ConfigStore store(client_dir / "config.json");
  store.save(client::ClientConfig{server_url(), SECRET});
  std::istringstream in;

  {
    std::ostringstream out;
    cli::CLI cli(store, in, out);
    EXPECT_EQ(cli.run_command({"list"}), 0);
    EXPECT_NE(out.str().find("No files found on server."), std::string::npos) << out.str();
  }

  auto file = local_file("notes.txt", std::string(2048, 'n'));
  {
    std::ostringstream out;
    cli::CLI cli(store, in, out);
    EXPECT_EQ(cli.run_command({"upload", file.string()}), 0);
    EXPECT_NE(out.str().find("✓ Success! File uploaded."), std::string::npos) << out.str();
    EXPECT_NE(out.str().find("  Size: 2.0 KB"), std::string::npos) << out.str();
  }

  auto files = make_client().list();
  ASSERT_EQ(files.size(), 1u);
  const std::string id = files[0].id;

  {
    std::ostringstream out;
    cli::CLI cli(store, in, out);
    EXPECT_EQ(cli.run_command({"list"}), 0);
    EXPECT_NE(out.str().find(id), std::string::npos) << out.str();
    EXPECT_NE(out.str().find("notes.txt"), std::string::npos) << out.str();
  }
  {
    std::ostringstream out;
    cli::CLI cli(store, in, out);
    auto dest = client_dir / "notes_copy.txt";
    EXPECT_EQ(cli.run_command({"download", id, dest.string()}), 0);
    EXPECT_NE(out.str().find("Downloading: 100.0%"), std::string::npos) << out.str();
    EXPECT_NE(out.str().find("✓ File downloaded successfully to " + dest.string()), std::string::npos) << out.str();
    EXPECT_EQ(read_file(dest), std::string(2048, 'n'));
  }
  {
    std::ostringstream out;
    cli::CLI cli(store, in, out);
    EXPECT_EQ(cli.run_command({"delete", id}), 0);
    EXPECT_NE(out.str().find("✓ File deleted successfully"), std::string::npos) << out.str();
  }
  {
    std::ostringstream out;
    cli::CLI cli(store, in, out);
    EXPECT_EQ(cli.run_command({"delete", id}), 0);
    EXPECT_NE(out.str().find("✗ Error: File not found"), std::string::npos) << out.str();
    EXPECT_NE(out.str().find("  Status code: 404"), std::string::npos) << out.str();
  }
}

TEST_F(HttpIntegrationTest, CliInteractiveSession) {
  client::ConfigStore store(client_dir / "config.json");
  store.save(client::ClientConfig{server_url(), SECRET});
  std::istringstream in("list\n\nfrobnicate\nupload\nhelp\nexit\nlist\n");
  std::ostringstream out;

  cli::CLI cli(store, in, out);
  cli.run();

  const std::string text = out.str();
  EXPECT_NE(text.find("Connected to: " + server_url()), std::string::npos) << text;
  EXPECT_NE(text.find("No files found on server."), std::string::npos) << text;
  EXPECT_NE(text.find("Invalid command. Type 'help' for available commands."), std::string::npos) << text;
  EXPECT_NE(text.find("upload <filepath>"), std::string::npos) << text;
  EXPECT_NE(text.find("Exiting..."), std::string::npos) << text;
  // Input after exit is not processed
  EXPECT_EQ(text.find("No files found on server."), text.rfind("No files found on server.")) << text;
}

TEST_F(HttpIntegrationTest, CliFirstRunPromptsForConfig) {
  client::ConfigStore store(client_dir / "fresh.json");
  std::istringstream in(server_url() + "/\n" + SECRET + "\n");
  std::ostringstream out;

  cli::CLI cli(store, in, out);
  EXPECT_EQ(cli.run_command({"list"}), 0);
  EXPECT_NE(out.str().find("First-time setup"), std::string::npos) << out.str();
  EXPECT_NE(out.str().find("No files found on server."), std::string::npos) << out.str();

  auto saved = store.load();
  ASSERT_TRUE(saved.has_value());
  EXPECT_EQ(saved->server_url, server_url());
  EXPECT_EQ(saved->api_key, SECRET);
}

TEST_F(HttpIntegrationTest, UnreachableServerReportsWithoutStatus) {
  auto port = server->port();
  server.reset();

  TransferClient client(client::ClientConfig{"http://127.0.0.1:" + std::to_string(port), SECRET});
  try {
    client.list();
    FAIL() << "List against a stopped server should fail";
  } catch (const NetworkError& e) {
    EXPECT_EQ(e.status(), 0u);
  }
}
