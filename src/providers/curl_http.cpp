#include "warden/common/fs.hpp"
#include "warden/providers/http.hpp"

#include <curl/curl.h>

namespace warden::providers {

namespace {

struct WriteContext {
  std::string *output = nullptr;
  const StreamChunkCallback *on_chunk = nullptr;
  const AbortCheck *should_abort = nullptr;
  bool aborted = false;
};

int progress_callback(void *userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
  auto *context = static_cast<WriteContext *>(userdata);
  if (context->should_abort != nullptr && *context->should_abort && (*context->should_abort)()) {
    context->aborted = true;
    return 1;
  }
  return 0;
}

size_t write_callback(char *ptr, size_t size, size_t nmemb, void *userdata) {
  const auto total = size * nmemb;
  auto *context = static_cast<WriteContext *>(userdata);
  if (context->on_chunk != nullptr && *context->on_chunk) {
    if (!(*context->on_chunk)(std::string_view(ptr, total))) {
      context->aborted = true;
      return 0;
    }
    return total;
  }
  context->output->append(ptr, total);
  return total;
}

size_t header_callback(char *buffer, size_t size, size_t nitems, void *userdata) {
  const auto total = size * nitems;
  std::string header(buffer, total);
  auto *headers = static_cast<std::unordered_map<std::string, std::string> *>(userdata);

  const auto separator = header.find(':');
  if (separator != std::string::npos) {
    const std::string key = common::to_lower(common::trim(header.substr(0, separator)));
    const std::string value = common::trim(header.substr(separator + 1));
    (*headers)[key] = value;
  }

  return total;
}

HttpResponse execute_request(const std::string &url,
                             const std::unordered_map<std::string, std::string> &headers,
                             const std::string &body, const std::uint64_t timeout_ms,
                             const StreamChunkCallback *on_chunk,
                             const AbortCheck *should_abort) {
  HttpResponse response;

  CURL *curl = curl_easy_init();
  if (curl == nullptr) {
    response.network_error = true;
    response.network_error_message = "curl_easy_init failed";
    return response;
  }

  WriteContext context{.output = &response.body, .on_chunk = on_chunk, .should_abort = should_abort};
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &context);
  curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
  if (should_abort != nullptr) {
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &context);
  }
  curl_easy_setopt(curl, CURLOPT_USERAGENT, "Warden/0.1");
  curl_easy_setopt(curl, CURLOPT_POST, 1L);
  curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));

  struct curl_slist *header_list = nullptr;
  for (const auto &[key, value] : headers) {
    const std::string line = key + ": " + value;
    header_list = curl_slist_append(header_list, line.c_str());
  }
  if (header_list != nullptr) {
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
  }

  const CURLcode code = curl_easy_perform(curl);
  if (context.aborted) {
    response.aborted = true;
  } else if (code != CURLE_OK) {
    response.network_error = true;
    response.network_error_message = curl_easy_strerror(code);
    response.timeout = code == CURLE_OPERATION_TIMEDOUT;
  }
  long status = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
  response.status = static_cast<std::uint16_t>(status);

  if (header_list != nullptr) {
    curl_slist_free_all(header_list);
  }
  curl_easy_cleanup(curl);
  return response;
}

} // namespace

CurlHttpClient::CurlHttpClient() { curl_global_init(CURL_GLOBAL_DEFAULT); }

CurlHttpClient::~CurlHttpClient() { curl_global_cleanup(); }

HttpResponse CurlHttpClient::post_json(const std::string &url,
                                       const std::unordered_map<std::string, std::string> &headers,
                                       const std::string &body, const std::uint64_t timeout_ms) {
  return execute_request(url, headers, body, timeout_ms, nullptr, nullptr);
}

HttpResponse CurlHttpClient::post_json_stream(
    const std::string &url, const std::unordered_map<std::string, std::string> &headers,
    const std::string &body, const std::uint64_t timeout_ms, const StreamChunkCallback &on_chunk,
    const AbortCheck &should_abort) {
  return execute_request(url, headers, body, timeout_ms, &on_chunk, &should_abort);
}

} // namespace warden::providers
