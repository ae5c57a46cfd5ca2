#include "tabload/http_client.h"

#include "tabload/logging.h"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <openssl/ssl.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <limits>

namespace beast = boost::beast;
namespace http = beast::http;
namespace asio = boost::asio;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

namespace tabload {

static std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

bool is_url(const std::string& identifier) {
  std::string prefix = to_lower(identifier.substr(0, 8));
  return prefix.compare(0, 7, "http://") == 0 || prefix.compare(0, 8, "https://") == 0;
}

std::optional<Url> Url::parse(const std::string& url) {
  auto sep = url.find("://");
  if (sep == std::string::npos)
    return std::nullopt;

  Url out;
  out.scheme = to_lower(url.substr(0, sep));
  if (out.scheme != "http" && out.scheme != "https")
    return std::nullopt;

  size_t auth_start = sep + 3;
  size_t auth_end = url.find_first_of("/?#", auth_start);
  std::string authority =
      url.substr(auth_start, auth_end == std::string::npos ? std::string::npos : auth_end - auth_start);
  auto at = authority.rfind('@');
  if (at != std::string::npos)
    authority = authority.substr(at + 1);
  if (authority.empty())
    return std::nullopt;

  auto bracket = authority.find(']');
  auto colon = authority.rfind(':');
  if (colon != std::string::npos && (bracket == std::string::npos || colon > bracket)) {
    out.host = authority.substr(0, colon);
    out.port = authority.substr(colon + 1);
    if (out.port.empty() ||
        !std::all_of(out.port.begin(), out.port.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; }))
      return std::nullopt;
  } else {
    out.host = authority;
  }
  if (out.host.size() > 1 && out.host.front() == '[' && out.host.back() == ']')
    out.host = out.host.substr(1, out.host.size() - 2);
  if (out.host.empty())
    return std::nullopt;
  if (out.port.empty())
    out.port = out.scheme == "https" ? "443" : "80";

  if (auth_end == std::string::npos) {
    out.target = "/";
  } else {
    out.target = url.substr(auth_end);
    auto hash = out.target.find('#');
    if (hash != std::string::npos)
      out.target.erase(hash);
    if (out.target.empty() || out.target[0] != '/')
      out.target.insert(0, "/");
  }
  return out;
}

std::string Url::to_string() const { return scheme + "://" + host + ":" + port + target; }

namespace {

bool is_redirect(unsigned status) {
  return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

Url follow_location(const Url& base, const std::string& location) {
  if (auto absolute = Url::parse(location))
    return *absolute;
  Url next = base;
  if (!location.empty() && location[0] == '/') {
    next.target = location;
  } else {
    std::string dir = base.target.substr(0, base.target.find('?'));
    dir = dir.substr(0, dir.rfind('/') + 1);
    next.target = dir + location;
  }
  return next;
}

template <class Stream>
HttpResponse exchange(Stream& stream, http::request<http::string_body>& req,
                      std::string* location) {
  http::write(stream, req);

  beast::flat_buffer buffer;
  http::response_parser<http::string_body> parser;
  parser.body_limit(std::numeric_limits<std::uint64_t>::max());
  http::read(stream, buffer, parser);

  auto& res = parser.get();
  HttpResponse out;
  out.status = res.result_int();
  out.reason = std::string(res.reason());
  out.body = std::move(res.body());
  if (location) {
    auto it = res.find(http::field::location);
    *location = it == res.end() ? std::string() : std::string(it->value());
  }
  return out;
}

} // namespace

HttpClient::HttpClient(const HttpClientOptions& options) : options_(options) {}

HttpResponse HttpClient::send(const Url& url, bool is_post, const std::string& body,
                              const std::map<std::string, std::string>& headers,
                              std::string* location) {
  http::request<http::string_body> req{is_post ? http::verb::post : http::verb::get, url.target,
                                       11};
  req.set(http::field::host, url.host);
  req.set(http::field::user_agent, options_.user_agent);
  for (const auto& [name, value] : headers)
    req.set(name, value);
  if (is_post) {
    req.body() = body;
    req.prepare_payload();
  }

  try {
    asio::io_context ioc;
    tcp::resolver resolver(ioc);
    auto const results = resolver.resolve(url.host, url.port);

    if (url.scheme == "https") {
      ssl::context ctx(ssl::context::tls_client);
      ctx.set_default_verify_paths();
      ctx.set_verify_mode(options_.verify_tls ? ssl::verify_peer : ssl::verify_none);

      beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);
      if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str()))
        throw HttpTransportError("cannot set TLS server name for " + url.host);
      if (options_.verify_tls)
        stream.set_verify_callback(ssl::host_name_verification(url.host));

      beast::get_lowest_layer(stream).connect(results);
      stream.handshake(ssl::stream_base::client);
      HttpResponse res = exchange(stream, req, location);

      // Servers commonly close without close_notify; the response is complete
      beast::error_code ec;
      stream.shutdown(ec);
      if (ec && ec != asio::error::eof && ec != ssl::error::stream_truncated)
        logger()->debug("TLS shutdown with {}: {}", url.host, ec.message());
      return res;
    }

    beast::tcp_stream stream(ioc);
    stream.connect(results);
    HttpResponse res = exchange(stream, req, location);

    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    if (ec && ec != beast::errc::not_connected)
      logger()->debug("socket shutdown with {}: {}", url.host, ec.message());
    return res;
  } catch (const boost::system::system_error& e) {
    throw HttpTransportError(url.scheme + "://" + url.host + url.target + ": " + e.what());
  }
}

HttpResponse HttpClient::get(const std::string& url) {
  auto parsed = Url::parse(url);
  if (!parsed)
    throw HttpTransportError("invalid URL '" + url + "'");

  Url current = *parsed;
  for (int hop = 0;; ++hop) {
    std::string location;
    logger()->debug("GET {}", current.to_string());
    HttpResponse res = send(current, false, {}, {}, &location);
    if (!is_redirect(res.status) || location.empty())
      return res;
    if (hop == options_.max_redirects)
      throw HttpTransportError("too many redirects fetching '" + url + "'");
    current = follow_location(current, location);
  }
}

HttpResponse HttpClient::post(const std::string& url, const std::string& body,
                              const std::map<std::string, std::string>& headers) {
  auto parsed = Url::parse(url);
  if (!parsed)
    throw HttpTransportError("invalid URL '" + url + "'");
  return send(*parsed, true, body, headers, nullptr);
}

} // namespace tabload
