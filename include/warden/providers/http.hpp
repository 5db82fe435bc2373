#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace warden::providers {

struct HttpResponse {
  std::uint16_t status = 0;
  std::string body;
  std::unordered_map<std::string, std::string> headers;
  bool timeout = false;
  bool network_error = false;
  /// The chunk callback asked to stop.
  bool aborted = false;
  std::string network_error_message;
};

/// Returning false aborts the transfer.
using StreamChunkCallback = std::function<bool(std::string_view)>;
/// Polled while a transfer is in flight; returning true aborts it.
using AbortCheck = std::function<bool()>;

class HttpClient {
public:
  virtual ~HttpClient() = default;
  [[nodiscard]] virtual HttpResponse
  post_json(const std::string &url, const std::unordered_map<std::string, std::string> &headers,
            const std::string &body, std::uint64_t timeout_ms) = 0;
  [[nodiscard]] virtual HttpResponse
  post_json_stream(const std::string &url,
                   const std::unordered_map<std::string, std::string> &headers,
                   const std::string &body, std::uint64_t timeout_ms,
                   const StreamChunkCallback &on_chunk, const AbortCheck &should_abort) = 0;
};

class CurlHttpClient final : public HttpClient {
public:
  CurlHttpClient();
  ~CurlHttpClient() override;

  [[nodiscard]] HttpResponse
  post_json(const std::string &url, const std::unordered_map<std::string, std::string> &headers,
            const std::string &body, std::uint64_t timeout_ms) override;
  [[nodiscard]] HttpResponse
  post_json_stream(const std::string &url,
                   const std::unordered_map<std::string, std::string> &headers,
                   const std::string &body, std::uint64_t timeout_ms,
                   const StreamChunkCallback &on_chunk, const AbortCheck &should_abort) override;
};

} // namespace warden::providers
