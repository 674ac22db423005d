#include "artmatch_core/llm/http_transport.hpp"

#include <curl/curl.h>

#include <memory>
#include <mutex>

#include "artmatch_core/llm/text_backend.hpp"

namespace artmatch_core {

namespace {

std::once_flag curl_init_flag;

size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *userp) {
  userp->append(static_cast<char *>(contents), size * nmemb);
  return size * nmemb;
}

struct CurlEasyDeleter {
  void operator()(CURL *handle) const {
    curl_easy_cleanup(handle);
  }
};

struct CurlSlistDeleter {
  void operator()(curl_slist *list) const {
    curl_slist_free_all(list);
  }
};

}  // namespace

CurlHttpTransport::CurlHttpTransport() {
  std::call_once(curl_init_flag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

HttpResponse CurlHttpTransport::post_json(const std::string &url,
                                          const std::map<std::string, std::string> &headers,
                                          const std::string &body,
                                          std::chrono::milliseconds timeout) {
  std::unique_ptr<CURL, CurlEasyDeleter> handle(curl_easy_init());
  if (!handle) {
    throw BackendUnavailable("Failed to initialize CURL");
  }

  curl_slist *raw_headers = curl_slist_append(nullptr, "Content-Type: application/json");
  for (const auto &header : headers) {
    raw_headers = curl_slist_append(raw_headers, (header.first + ": " + header.second).c_str());
  }
  std::unique_ptr<curl_slist, CurlSlistDeleter> header_list(raw_headers);

  std::string response_buffer;
  CURL *curl = handle.get();
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list.get());
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_buffer);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

  CURLcode res = curl_easy_perform(curl);
  if (res == CURLE_OPERATION_TIMEDOUT) {
    throw BackendTimeout("Request to " + url + " timed out after " +
                         std::to_string(timeout.count()) + "ms");
  }
  if (res != CURLE_OK) {
    throw BackendUnavailable("CURL request failed: " + std::string(curl_easy_strerror(res)));
  }

  HttpResponse response;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
  response.body = std::move(response_buffer);
  return response;
}

void throw_for_status(const std::string &backend, const HttpResponse &response) {
  if (response.status >= 200 && response.status < 300) {
    return;
  }
  const std::string message =
      backend + " returned HTTP " + std::to_string(response.status) + ": " +
      response.body.substr(0, 200);
  if (response.status == 408 || response.status == 504) {
    throw BackendTimeout(message);
  }
  if (response.status == 429 || response.status >= 500 || response.status == 0) {
    throw BackendUnavailable(message);
  }
  throw BackendRejected(message);
}

}  // namespace artmatch_core
