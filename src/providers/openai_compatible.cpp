#include "warden/providers/openai_compatible.hpp"

#include "warden/common/fs.hpp"
#include "warden/common/json_util.hpp"

#include <cstdlib>
#include <sstream>

namespace warden::providers {

namespace {

constexpr std::size_t kRawPrefixLimit = 2048;

std::optional<std::string> member(const std::string &object, const std::string &key) {
  auto members = common::json_object_members(object);
  if (!members.ok()) {
    return std::nullopt;
  }
  for (auto &[name, raw] : members.value()) {
    if (name == key) {
      return raw;
    }
  }
  return std::nullopt;
}

std::optional<std::string> string_member(const std::string &object, const std::string &key) {
  const auto raw = member(object, key);
  if (!raw.has_value() || common::json_value_type(*raw) != common::JsonType::String) {
    return std::nullopt;
  }
  return common::json_unescape(raw->substr(1, raw->size() - 2));
}

std::uint64_t number_member(const std::string &object, const std::string &key) {
  const auto raw = member(object, key);
  if (!raw.has_value() || common::json_value_type(*raw) != common::JsonType::Number) {
    return 0;
  }
  return std::strtoull(raw->c_str(), nullptr, 10);
}

std::string encode_tool_call(const tools::ToolCall &call) {
  return "{\"id\":" + common::json_quote(call.id) +
         ",\"type\":\"function\",\"function\":{\"name\":" + common::json_quote(call.name) +
         ",\"arguments\":" + common::json_quote(call.arguments_json) + "}}";
}

std::string encode_message(const ChatMessage &message) {
  std::string out = "{\"role\":" + common::json_quote(role_to_string(message.role)) +
                    ",\"content\":" + common::json_quote(message.content);
  if (message.role == Role::Tool) {
    out += ",\"tool_call_id\":" + common::json_quote(message.tool_call_id);
  }
  if (!message.tool_calls.empty()) {
    out += ",\"tool_calls\":[";
    for (std::size_t i = 0; i < message.tool_calls.size(); ++i) {
      if (i > 0) {
        out += ",";
      }
      out += encode_tool_call(message.tool_calls[i]);
    }
    out += "]";
  }
  out += "}";
  return out;
}

} // namespace

std::string build_chat_request_body(const ModelRequest &request) {
  std::ostringstream out;
  out << "{\"model\":" << common::json_quote(request.options.model)
      << ",\"stream\":true,\"stream_options\":{\"include_usage\":true}";
  if (request.options.max_tokens.has_value()) {
    out << ",\"max_tokens\":" << *request.options.max_tokens;
  }
  if (!request.options.reasoning_effort.empty()) {
    out << ",\"reasoning_effort\":" << common::json_quote(request.options.reasoning_effort);
  } else {
    out << ",\"temperature\":" << request.options.temperature;
  }

  out << ",\"messages\":[";
  for (std::size_t i = 0; i < request.messages.size(); ++i) {
    if (i > 0) {
      out << ",";
    }
    out << encode_message(request.messages[i]);
  }
  out << "]";

  if (!request.tools.empty()) {
    out << ",\"tools\":[";
    for (std::size_t i = 0; i < request.tools.size(); ++i) {
      const auto &spec = request.tools[i];
      if (i > 0) {
        out << ",";
      }
      out << "{\"type\":\"function\",\"function\":{\"name\":" << common::json_quote(spec.name)
          << ",\"description\":" << common::json_quote(spec.description)
          << ",\"parameters\":" << (spec.parameters_json.empty() ? "{}" : spec.parameters_json)
          << "}}";
    }
    out << "]";
  }
  out << "}";
  return out.str();
}

std::vector<ModelDelta> OpenAiStreamParser::feed(const std::string_view chunk) {
  std::vector<ModelDelta> out;
  if (raw_prefix_.size() < kRawPrefixLimit) {
    raw_prefix_.append(chunk.substr(0, kRawPrefixLimit - raw_prefix_.size()));
  }
  buffer_.append(chunk);

  std::size_t newline = 0;
  while ((newline = buffer_.find('\n')) != std::string::npos) {
    std::string line = buffer_.substr(0, newline);
    buffer_.erase(0, newline + 1);
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (!common::starts_with(line, "data:")) {
      continue;
    }
    handle_event(common::trim(line.substr(5)), out);
  }
  return out;
}

void OpenAiStreamParser::handle_event(const std::string &data, std::vector<ModelDelta> &out) {
  if (done_ || data.empty()) {
    return;
  }
  if (data == "[DONE]") {
    done_ = true;
    out.emplace_back(EndOfTurn{.stop_reason = finish_reason_.value_or("stop")});
    return;
  }

  if (const auto usage = member(data, "usage");
      usage.has_value() && common::json_value_type(*usage) == common::JsonType::Object) {
    out.emplace_back(Usage{.input_tokens = number_member(*usage, "prompt_tokens"),
                           .output_tokens = number_member(*usage, "completion_tokens")});
  }

  const auto choices = member(data, "choices");
  if (!choices.has_value()) {
    return;
  }
  const auto choice_list = common::json_split_top_level_objects(*choices);
  if (choice_list.empty()) {
    return;
  }
  const std::string &choice = choice_list.front();

  if (const auto delta = member(choice, "delta");
      delta.has_value() && common::json_value_type(*delta) == common::JsonType::Object) {
    if (const auto content = string_member(*delta, "content"); content.has_value() && !content->empty()) {
      out.emplace_back(TextChunk{.text = *content});
    }
    if (const auto calls = member(*delta, "tool_calls"); calls.has_value()) {
      for (const auto &call : common::json_split_top_level_objects(*calls)) {
        const auto index = static_cast<std::size_t>(number_member(call, "index"));
        const auto id = string_member(call, "id");
        const auto function = member(call, "function");
        std::optional<std::string> name;
        std::optional<std::string> arguments;
        if (function.has_value()) {
          name = string_member(*function, "name");
          arguments = string_member(*function, "arguments");
        }
        if (id.has_value() || name.has_value()) {
          out.emplace_back(ToolCallStart{
              .index = index, .id = id.value_or(""), .name = name.value_or("")});
        }
        if (arguments.has_value() && !arguments->empty()) {
          out.emplace_back(ToolCallArgs{.index = index, .fragment = *arguments});
        }
      }
    }
  }

  if (const auto reason = string_member(choice, "finish_reason"); reason.has_value()) {
    finish_reason_ = *reason;
  }
}

common::Result<std::vector<ModelDelta>> OpenAiStreamParser::finish() {
  std::vector<ModelDelta> out;
  if (!buffer_.empty()) {
    const std::string rest = buffer_;
    buffer_.clear();
    for (auto &delta : feed(rest + "\n")) {
      out.push_back(std::move(delta));
    }
  }
  if (!done_) {
    if (!finish_reason_.has_value()) {
      return common::Result<std::vector<ModelDelta>>::failure(
          common::ErrorKind::TransientInfra, "model stream ended before end of turn");
    }
    done_ = true;
    out.emplace_back(EndOfTurn{.stop_reason = *finish_reason_});
  }
  return common::Result<std::vector<ModelDelta>>::success(std::move(out));
}

common::Status classify_http_failure(const HttpResponse &response, const std::string &body_excerpt) {
  if (response.timeout) {
    return common::Status::error(common::ErrorKind::TransientInfra, "model request timed out");
  }
  if (response.network_error) {
    return common::Status::error(common::ErrorKind::TransientInfra,
                                 "network error: " + response.network_error_message);
  }
  const std::string detail =
      "HTTP " + std::to_string(response.status) + (body_excerpt.empty() ? "" : ": " + body_excerpt);
  if (response.status == 429 || response.status >= 500) {
    return common::Status::error(common::ErrorKind::TransientInfra, detail);
  }
  return common::Status::error(common::ErrorKind::Internal, detail);
}

OpenAiCompatibleClient::OpenAiCompatibleClient(OpenAiConfig config, std::shared_ptr<HttpClient> http)
    : config_(std::move(config)), http_(std::move(http)) {}

common::Status OpenAiCompatibleClient::stream(const ModelRequest &request,
                                              const DeltaCallback &on_delta,
                                              const common::CancellationToken &cancel) {
  if (http_ == nullptr) {
    return common::Status::error("http client unavailable");
  }
  if (cancel.is_cancelled()) {
    return common::Status::error(common::ErrorKind::Cancelled, "model request cancelled");
  }

  std::string base = config_.base_url;
  while (!base.empty() && base.back() == '/') {
    base.pop_back();
  }
  std::unordered_map<std::string, std::string> headers = {
      {"Content-Type", "application/json"},
      {"Accept", "text/event-stream"},
  };
  if (!config_.api_key.empty()) {
    headers["Authorization"] = "Bearer " + config_.api_key;
  }

  OpenAiStreamParser parser;
  bool consumer_stopped = false;
  const auto response = http_->post_json_stream(
      base + "/chat/completions", headers, build_chat_request_body(request), config_.timeout_ms,
      [&](const std::string_view chunk) {
        for (const auto &delta : parser.feed(chunk)) {
          if (!on_delta(delta)) {
            consumer_stopped = true;
            return false;
          }
        }
        return !cancel.is_cancelled();
      },
      [&cancel]() { return cancel.is_cancelled(); });

  if (consumer_stopped || response.aborted || cancel.is_cancelled()) {
    return common::Status::error(common::ErrorKind::Cancelled, "model stream cancelled");
  }
  if (response.network_error || response.timeout || response.status >= 400 ||
      response.status == 0) {
    std::string excerpt = common::trim(parser.raw_prefix());
    if (excerpt.size() > 300) {
      excerpt = excerpt.substr(0, 300) + "...";
    }
    return classify_http_failure(response, excerpt);
  }

  auto tail = parser.finish();
  if (!tail.ok()) {
    return tail.status();
  }
  for (const auto &delta : tail.value()) {
    if (!on_delta(delta)) {
      return common::Status::error(common::ErrorKind::Cancelled, "model stream cancelled");
    }
  }
  return common::Status::success();
}

} // namespace warden::providers
