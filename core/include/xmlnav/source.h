#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace xmlnav {

/// Raised when the document buffer cannot be acquired or is not valid UTF-8.
class SourceError : public std::runtime_error {
 public:
  explicit SourceError(const std::string& message) : std::runtime_error(message) {}
};

/// Owns the contiguous document buffer for the process lifetime.
/// Either a read-only private file mapping or an in-memory copy (stdin, URL body).
/// Move-only; views taken before a move or destruction MUST NOT be used afterwards.
class SourceBuffer {
 public:
  SourceBuffer() = default;
  ~SourceBuffer();
  SourceBuffer(SourceBuffer&& other);
  SourceBuffer& operator=(SourceBuffer&& other);
  SourceBuffer(const SourceBuffer&) = delete;
  SourceBuffer& operator=(const SourceBuffer&) = delete;

  /// Maps a local file read-only. Empty files yield an empty buffer without a mapping.
  /// MUST throw SourceError naming the path on open/stat/map failures.
  static SourceBuffer map_file(const std::string& path);
  /// Takes ownership of an in-memory document.
  static SourceBuffer from_string(std::string contents);

  std::string_view view() const;
  size_t size() const { return view().size(); }
  bool mapped() const { return mapping_ != nullptr; }

 private:
  void release();

  void* mapping_ = nullptr;
  size_t mapping_size_ = 0;
  std::string owned_;
};

/// Returns true for http:// and https:// inputs.
bool is_url(const std::string& input);

/// Fetches the whole body of `url` with libcurl.
/// MUST honor timeout_ms (0 = no limit) and MUST throw SourceError on transport
/// failures and non-2xx statuses.
std::string fetch_url(const std::string& url, int timeout_ms);

/// Acquires the document named by `input`: a path, "-" for stdin, or an http(s) URL.
/// MUST validate UTF-8 once and throw SourceError on invalid encoding.
SourceBuffer load_source(const std::string& input, int timeout_ms);

}  // namespace xmlnav
