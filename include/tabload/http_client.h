#pragma once

#include <map>
#include <optional>
#include <stdexcept>
#include <string>

namespace tabload {

/// Components of an http:// or https:// URL.
struct Url {
  std::string scheme; // "http" or "https"
  std::string host;
  std::string port;   // defaulted from the scheme when absent
  std::string target; // path and query, at least "/"

  static std::optional<Url> parse(const std::string& url);
  std::string to_string() const;
};

/// Case-insensitive http:// or https:// prefix.
bool is_url(const std::string& identifier);

struct HttpResponse {
  unsigned status = 0;
  std::string reason;
  std::string body;

  bool ok() const { return status >= 200 && status < 300; }
};

/// Network-level failure (DNS, connect, TLS, protocol).
class HttpTransportError : public std::runtime_error {
public:
  explicit HttpTransportError(const std::string& message) : std::runtime_error(message) {}
};

struct HttpClientOptions {
  int max_redirects = 5;
  bool verify_tls = true;
  std::string user_agent = "tabload";
};

/// Synchronous HTTP/1.1 client over Boost.Beast. Non-2xx responses are
/// returned, not thrown; transport failures throw HttpTransportError.
class HttpClient {
public:
  explicit HttpClient(const HttpClientOptions& options = HttpClientOptions());

  /// GET, following redirects.
  HttpResponse get(const std::string& url);

  /// POST without redirect handling.
  HttpResponse post(const std::string& url, const std::string& body,
                    const std::map<std::string, std::string>& headers = {});

private:
  HttpResponse send(const Url& url, bool is_post, const std::string& body,
                    const std::map<std::string, std::string>& headers,
                    std::string* location);

  HttpClientOptions options_;
};

} // namespace tabload
