#include "xmlnav/source.h"

#include <cerrno>
#include <cstring>
#include <iostream>
#include <iterator>
#include <utility>

#include <curl/curl.h>
#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

#include "util/string_util.h"
#include "xmlnav/version.h"

namespace xmlnav {

namespace {

/// Closes a file descriptor on scope exit.
struct FdGuard {
  explicit FdGuard(int fd) : fd(fd) {}
  ~FdGuard() {
    if (fd >= 0) ::close(fd);
  }
  int fd;
};

/// Appends curl response bytes into a caller-provided buffer.
/// MUST return the full byte count or curl treats it as an error.
size_t write_to_string(void* contents, size_t size, size_t nmemb, void* userp) {
  size_t total = size * nmemb;
  auto* out = static_cast<std::string*>(userp);
  out->append(static_cast<const char*>(contents), total);
  return total;
}

std::string errno_message(const std::string& what, const std::string& path) {
  return what + ": " + path + " (" + std::strerror(errno) + ")";
}

}  // namespace

SourceBuffer::~SourceBuffer() {
  release();
}

SourceBuffer::SourceBuffer(SourceBuffer&& other)
    : mapping_(std::exchange(other.mapping_, nullptr)),
      mapping_size_(std::exchange(other.mapping_size_, 0)),
      owned_(std::move(other.owned_)) {}

SourceBuffer& SourceBuffer::operator=(SourceBuffer&& other) {
  if (this != &other) {
    release();
    mapping_ = std::exchange(other.mapping_, nullptr);
    mapping_size_ = std::exchange(other.mapping_size_, 0);
    owned_ = std::move(other.owned_);
  }
  return *this;
}

void SourceBuffer::release() {
  if (mapping_ != nullptr) {
    ::munmap(mapping_, mapping_size_);
    mapping_ = nullptr;
    mapping_size_ = 0;
  }
  owned_.clear();
}

SourceBuffer SourceBuffer::map_file(const std::string& path) {
  int fd = ::open(path.c_str(), O_RDONLY);
  if (fd < 0) {
    throw SourceError(errno_message("Failed to open file", path));
  }
  FdGuard guard(fd);
  struct stat st {};
  if (::fstat(fd, &st) != 0) {
    throw SourceError(errno_message("Failed to stat file", path));
  }
  if (!S_ISREG(st.st_mode)) {
    throw SourceError("Not a regular file: " + path);
  }
  SourceBuffer buffer;
  if (st.st_size == 0) return buffer;
  void* mapping = ::mmap(nullptr, static_cast<size_t>(st.st_size), PROT_READ, MAP_PRIVATE, fd, 0);
  if (mapping == MAP_FAILED) {
    throw SourceError(errno_message("Failed to map file", path));
  }
  buffer.mapping_ = mapping;
  buffer.mapping_size_ = static_cast<size_t>(st.st_size);
  return buffer;
}

SourceBuffer SourceBuffer::from_string(std::string contents) {
  SourceBuffer buffer;
  buffer.owned_ = std::move(contents);
  return buffer;
}

std::string_view SourceBuffer::view() const {
  if (mapping_ != nullptr) {
    return std::string_view(static_cast<const char*>(mapping_), mapping_size_);
  }
  return owned_;
}

bool is_url(const std::string& input) {
  return input.rfind("http://", 0) == 0 || input.rfind("https://", 0) == 0;
}

std::string fetch_url(const std::string& url, int timeout_ms) {
  CURL* curl = curl_easy_init();
  if (!curl) {
    throw SourceError("Failed to initialize curl");
  }
  std::string buffer;
  const std::string user_agent = "xmlnav/" + get_version_info().version;
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_to_string);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &buffer);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
  curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent.c_str());
  CURLcode res = curl_easy_perform(curl);
  if (res != CURLE_OK) {
    curl_easy_cleanup(curl);
    throw SourceError(std::string("Failed to fetch URL: ") + curl_easy_strerror(res));
  }
  long status = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
  curl_easy_cleanup(curl);
  if (status < 200 || status >= 300) {
    throw SourceError("Failed to fetch URL: " + url + " (HTTP " + std::to_string(status) + ")");
  }
  return buffer;
}

SourceBuffer load_source(const std::string& input, int timeout_ms) {
  SourceBuffer buffer;
  if (input == "-") {
    std::string contents((std::istreambuf_iterator<char>(std::cin)),
                         std::istreambuf_iterator<char>());
    buffer = SourceBuffer::from_string(std::move(contents));
  } else if (is_url(input)) {
    buffer = SourceBuffer::from_string(fetch_url(input, timeout_ms));
  } else {
    buffer = SourceBuffer::map_file(input);
  }
  if (!util::is_valid_utf8(buffer.view())) {
    throw SourceError("Input is not valid UTF-8: " + input);
  }
  return buffer;
}

}  // namespace xmlnav
