#pragma once

#include <chrono>
#include <map>
#include <string>

namespace artmatch_core {

struct HttpResponse {
  long status = 0;
  std::string body;
};

class HttpTransport {
 public:
  virtual ~HttpTransport() = default;

  // Throws BackendTimeout when the deadline passes, BackendUnavailable on transport errors.
  // Non-2xx statuses are returned, not thrown.
  virtual HttpResponse post_json(const std::string &url,
                                 const std::map<std::string, std::string> &headers,
                                 const std::string &body, std::chrono::milliseconds timeout) = 0;
};

// libcurl implementation. A fresh easy handle is used per call so one
// transport can be shared by concurrent enrichment tasks.
class CurlHttpTransport : public HttpTransport {
 public:
  CurlHttpTransport();

  HttpResponse post_json(const std::string &url,
                         const std::map<std::string, std::string> &headers,
                         const std::string &body, std::chrono::milliseconds timeout) override;
};

// Maps a non-2xx status to the matching BackendError and throws it. No-op for 2xx.
void throw_for_status(const std::string &backend, const HttpResponse &response);

}  // namespace artmatch_core
