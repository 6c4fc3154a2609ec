#include "http_client.hpp"

#include <asio.hpp>
#include <asio/ssl.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <functional>
#include <istream>
#include <sstream>
#include <system_error>

#include "errors.hpp"
#include "utils.hpp"

namespace {

using tcp = asio::ip::tcp;
using BodySink = std::function<void(const char*, std::size_t)>;

[[noreturn]] void transport_failure(const std::string& url, const std::string& why) {
  throw SyncError(ErrorKind::Transport, url, why);
}

std::string build_head(const HttpRequest& request, const Url& url, const std::string& user_agent,
                       uint64_t content_length) {
  std::ostringstream head;
  head << request.method << " " << url.target << " HTTP/1.1\r\n";
  head << "Host: " << url.host << "\r\n";
  head << "User-Agent: " << user_agent << "\r\n";
  head << "Accept: */*\r\n";
  head << "Connection: close\r\n";
  for(const auto& header : request.headers) {
    head << header.first << ": " << header.second << "\r\n";
  }
  if(content_length > 0 || request.method == "POST" || request.method == "PUT") {
    head << "Content-Length: " << content_length << "\r\n";
  }
  head << "\r\n";
  return head.str();
}

bool is_eof(const std::error_code& ec) {
  return ec == asio::error::eof || ec == asio::ssl::error::stream_truncated;
}

template<typename Stream>
void write_request(Stream& stream, const HttpRequest& request, const std::string& head) {
  asio::write(stream, asio::buffer(head));
  if(!request.body_file.empty()) {
    std::ifstream in(request.body_file, std::ios::binary);
    if(!in) {
      throw SyncError(ErrorKind::Io, request.body_file.string(), "unable to open file for upload");
    }
    std::array<char, 64 * 1024> chunk{};
    while(in) {
      in.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
      auto got = static_cast<std::size_t>(in.gcount());
      if(got > 0) asio::write(stream, asio::buffer(chunk.data(), got));
    }
  } else if(!request.body.empty()) {
    asio::write(stream, asio::buffer(request.body));
  }
}

// Drains whatever is buffered plus up to `length` bytes from the stream.
template<typename Stream>
void read_exact(Stream& stream, asio::streambuf& buf, uint64_t length, const BodySink& sink) {
  while(length > 0) {
    if(buf.size() == 0) {
      std::error_code ec;
      asio::read(stream, buf, asio::transfer_at_least(1), ec);
      if(ec && buf.size() == 0) {
        throw std::system_error(ec);
      }
    }
    auto take = static_cast<std::size_t>(std::min<uint64_t>(length, buf.size()));
    sink(static_cast<const char*>(buf.data().data()), take);
    buf.consume(take);
    length -= take;
  }
}

template<typename Stream>
std::string read_line(Stream& stream, asio::streambuf& buf) {
  asio::read_until(stream, buf, "\r\n");
  std::istream is(&buf);
  std::string line;
  std::getline(is, line);
  if(!line.empty() && line.back() == '\r') line.pop_back();
  return line;
}

template<typename Stream>
HttpResponse read_response(Stream& stream, const BodySink& sink, bool head_only) {
  HttpResponse response;
  asio::streambuf buf;
  asio::read_until(stream, buf, "\r\n\r\n");
  {
    std::istream is(&buf);
    std::string status_line;
    std::getline(is, status_line);
    std::istringstream status_stream(status_line);
    std::string version;
    status_stream >> version >> response.status;
    if(version.rfind("HTTP/", 0) != 0 || response.status == 0) {
      throw std::runtime_error("malformed status line '" + trim_copy(status_line) + "'");
    }
    std::string line;
    while(std::getline(is, line) && line != "\r" && !line.empty()) {
      auto colon = line.find(':');
      if(colon == std::string::npos) continue;
      response.headers[to_lower(trim_copy(line.substr(0, colon)))] = trim_copy(line.substr(colon + 1));
    }
  }

  // HEAD, 1xx, 204 and 304 responses carry no body whatever their headers say.
  if(head_only || response.status < 200 || response.status == 204 || response.status == 304) {
    return response;
  }

  const auto transfer_encoding = to_lower(response.header("transfer-encoding"));
  const auto content_length = response.header("content-length");
  if(transfer_encoding.find("chunked") != std::string::npos) {
    while(true) {
      auto size_line = read_line(stream, buf);
      uint64_t chunk_size = std::stoull(size_line, nullptr, 16);
      if(chunk_size == 0) break;
      read_exact(stream, buf, chunk_size, sink);
      read_line(stream, buf);
    }
  } else if(!content_length.empty()) {
    read_exact(stream, buf, std::stoull(content_length), sink);
  } else {
    std::error_code ec;
    while(true) {
      if(buf.size() > 0) {
        sink(static_cast<const char*>(buf.data().data()), buf.size());
        buf.consume(buf.size());
      }
      asio::read(stream, buf, asio::transfer_at_least(1), ec);
      if(ec) break;
    }
    if(ec && !is_eof(ec)) throw std::system_error(ec);
    if(buf.size() > 0) {
      sink(static_cast<const char*>(buf.data().data()), buf.size());
    }
  }
  return response;
}

} // namespace

Url Url::parse(const std::string& text) {
  Url url;
  auto scheme_end = text.find("://");
  if(scheme_end == std::string::npos) {
    throw SyncError(ErrorKind::ValidationError, text, "URL must start with http:// or https://");
  }
  url.scheme = to_lower(text.substr(0, scheme_end));
  if(url.scheme != "http" && url.scheme != "https") {
    throw SyncError(ErrorKind::ValidationError, text, "unsupported URL scheme '" + url.scheme + "'");
  }
  auto rest = text.substr(scheme_end + 3);
  auto slash = rest.find('/');
  auto authority = rest.substr(0, slash);
  url.target = slash == std::string::npos ? "/" : rest.substr(slash);
  auto colon = authority.rfind(':');
  if(colon != std::string::npos && authority.find(']') == std::string::npos) {
    url.host = authority.substr(0, colon);
    url.port = authority.substr(colon + 1);
  } else {
    url.host = authority;
    url.port = url.scheme == "https" ? "443" : "80";
  }
  if(url.host.empty()) {
    throw SyncError(ErrorKind::ValidationError, text, "URL has no host");
  }
  return url;
}

std::string HttpResponse::header(const std::string& name) const {
  auto it = headers.find(to_lower(name));
  return it == headers.end() ? std::string() : it->second;
}

HttpClient::HttpClient() : HttpClient(Options{}) {}

HttpClient::HttpClient(Options options) : options_(std::move(options)) {}

std::string HttpClient::url_encode(const std::string& value) {
  std::ostringstream out;
  static const char* kHex = "0123456789ABCDEF";
  for(unsigned char ch : value) {
    if(std::isalnum(ch) || ch == '-' || ch == '_' || ch == '.' || ch == '~') {
      out << ch;
    } else {
      out << '%' << kHex[ch >> 4] << kHex[ch & 0x0F];
    }
  }
  return out.str();
}

HttpResponse HttpClient::send(const HttpRequest& request, const std::filesystem::path& download_to) const {
  const Url url = Url::parse(request.url);

  uint64_t content_length = request.body.size();
  if(!request.body_file.empty()) {
    std::error_code ec;
    content_length = std::filesystem::file_size(request.body_file, ec);
    if(ec) {
      throw SyncError(ErrorKind::Io, request.body_file.string(), ec.message());
    }
  }
  const auto head = build_head(request, url, options_.user_agent, content_length);

  std::ofstream file_out;
  std::string memory_body;
  if(!download_to.empty()) {
    file_out.open(download_to, std::ios::binary | std::ios::trunc);
    if(!file_out) {
      throw SyncError(ErrorKind::Io, download_to.string(), "unable to open download destination");
    }
  }
  BodySink sink = [&](const char* data, std::size_t n){
    if(file_out.is_open()) {
      file_out.write(data, static_cast<std::streamsize>(n));
    } else {
      memory_body.append(data, n);
    }
  };

  HttpResponse response;
  try {
    asio::io_context io;
    tcp::resolver resolver(io);
    auto endpoints = resolver.resolve(url.host, url.port);

    if(url.scheme == "https") {
      asio::ssl::context tls(asio::ssl::context::tls_client);
      tls.set_default_verify_paths();
      tls.set_verify_mode(options_.verify_peer ? asio::ssl::verify_peer : asio::ssl::verify_none);
      asio::ssl::stream<tcp::socket> stream(io, tls);
      if(!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
        transport_failure(request.url, "unable to set TLS server name");
      }
      if(options_.verify_peer) {
        stream.set_verify_callback(asio::ssl::host_name_verification(url.host));
      }
      asio::connect(stream.next_layer(), endpoints);
      stream.handshake(asio::ssl::stream_base::client);
      write_request(stream, request, head);
      response = read_response(stream, sink, request.method == "HEAD");
      std::error_code ignored;
      stream.shutdown(ignored);
    } else {
      tcp::socket socket(io);
      asio::connect(socket, endpoints);
      write_request(socket, request, head);
      response = read_response(socket, sink, request.method == "HEAD");
    }
  } catch(const SyncError&) {
    throw;
  } catch(const std::exception& e) {
    transport_failure(request.method + " " + request.url, e.what());
  }

  if(file_out.is_open()) {
    file_out.close();
    if(!file_out) {
      throw SyncError(ErrorKind::Io, download_to.string(), "write failed");
    }
  }
  response.body = std::move(memory_body);
  return response;
}
