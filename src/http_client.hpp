#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <utility>
#include <vector>

struct Url {
  std::string scheme; // "http" or "https"
  std::string host;
  std::string port;
  std::string target; // path and query, always starting with '/'

  static Url parse(const std::string& text);
};

struct HttpRequest {
  std::string method = "GET";
  std::string url;
  std::vector<std::pair<std::string, std::string>> headers;
  std::string body;
  std::filesystem::path body_file; // streamed instead of body when set
};

struct HttpResponse {
  int status = 0;
  std::map<std::string, std::string> headers; // lower-cased names
  std::string body;                           // empty when streamed to a file

  bool ok() const { return status >= 200 && status < 300; }
  std::string header(const std::string& name) const;
};

// Blocking HTTP/1.1 client on standalone asio, one connection per request, TLS
// through asio's OpenSSL binding. Safe to use from several threads at once.
class HttpClient {
public:
  struct Options {
    bool verify_peer = true;
    std::string user_agent = "dsync/1.0";
  };

  HttpClient();
  explicit HttpClient(Options options);

  // Throws SyncError(Transport) on connection or protocol failures; HTTP error
  // statuses are returned, not thrown. With download_to set the body is written
  // there instead of being kept in memory.
  HttpResponse send(const HttpRequest& request,
                    const std::filesystem::path& download_to = std::filesystem::path()) const;

  static std::string url_encode(const std::string& value);

private:
  Options options_;
};
