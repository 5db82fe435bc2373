#pragma once

#include "warden/providers/http.hpp"
#include "warden/providers/traits.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace warden::providers {

struct OpenAiConfig {
  std::string base_url = "https://api.openai.com/v1";
  std::string api_key;
  std::uint64_t timeout_ms = 120'000;
};

/// Incremental decoder for `chat/completions` server-sent events.
class OpenAiStreamParser {
public:
  /// Consumes raw bytes and returns the deltas completed by them.
  [[nodiscard]] std::vector<ModelDelta> feed(std::string_view chunk);
  /// Deltas still owed at end of stream. Fails if the turn never ended.
  [[nodiscard]] common::Result<std::vector<ModelDelta>> finish();

  [[nodiscard]] bool done() const { return done_; }
  /// Leading bytes of a non-SSE body, kept for error reporting.
  [[nodiscard]] const std::string &raw_prefix() const { return raw_prefix_; }

private:
  void handle_event(const std::string &data, std::vector<ModelDelta> &out);

  std::string buffer_;
  std::string raw_prefix_;
  std::optional<std::string> finish_reason_;
  bool done_ = false;
};

[[nodiscard]] std::string build_chat_request_body(const ModelRequest &request);

/// Map an HTTP failure to a status. 429, 5xx and transport failures are transient.
[[nodiscard]] common::Status classify_http_failure(const HttpResponse &response,
                                                   const std::string &body_excerpt);

class OpenAiCompatibleClient final : public IModelClient {
public:
  OpenAiCompatibleClient(OpenAiConfig config, std::shared_ptr<HttpClient> http);

  [[nodiscard]] common::Status stream(const ModelRequest &request, const DeltaCallback &on_delta,
                                      const common::CancellationToken &cancel) override;
  [[nodiscard]] std::string name() const override { return "openai-compatible"; }

private:
  OpenAiConfig config_;
  std::shared_ptr<HttpClient> http_;
};

} // namespace warden::providers
