#include "test_harness.h"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>
#include <unistd.h>
#include <utility>
#include <vector>

#include "xmlnav/source.h"

namespace {

/// Writes `contents` to a fresh temporary file and removes it on scope exit.
struct TempFile {
  explicit TempFile(const std::string& contents) {
    char pattern[] = "/tmp/xmlnav_source_XXXXXX";
    int fd = mkstemp(pattern);
    if (fd >= 0) {
      close(fd);
      path = pattern;
      std::ofstream out(path, std::ios::binary);
      out << contents;
    }
  }
  ~TempFile() {
    if (!path.empty()) std::remove(path.c_str());
  }
  std::string path;
};

void test_map_file_exposes_file_bytes() {
  TempFile file("<root><a>1</a></root>");
  expect_true(!file.path.empty(), "temp file created");
  xmlnav::SourceBuffer buffer = xmlnav::SourceBuffer::map_file(file.path);
  expect_true(buffer.mapped(), "file is mapped");
  expect_str_eq(buffer.view(), "<root><a>1</a></root>", "mapped contents");
  xmlnav::SourceBuffer moved = std::move(buffer);
  expect_true(moved.mapped(), "mapping moves with the buffer");
  expect_true(!buffer.mapped(), "moved-from buffer is empty");
  expect_eq(moved.size(), 21, "size preserved");
}

void test_map_file_empty_file_yields_empty_buffer() {
  TempFile file("");
  xmlnav::SourceBuffer buffer = xmlnav::SourceBuffer::map_file(file.path);
  expect_true(!buffer.mapped(), "no mapping for empty file");
  expect_eq(buffer.size(), 0, "empty view");
}

void test_map_file_missing_path_throws() {
  bool threw = false;
  try {
    xmlnav::SourceBuffer::map_file("/nonexistent/xmlnav/missing.xml");
  } catch (const xmlnav::SourceError& ex) {
    threw = std::string(ex.what()).find("missing.xml") != std::string::npos;
  }
  expect_true(threw, "missing file raises SourceError naming the path");
}

void test_map_file_rejects_directories() {
  bool threw = false;
  try {
    xmlnav::SourceBuffer::map_file("/tmp");
  } catch (const xmlnav::SourceError& ex) {
    threw = std::string(ex.what()).find("Not a regular file") != std::string::npos;
  }
  expect_true(threw, "directory rejected");
}

void test_load_source_rejects_invalid_utf8() {
  TempFile file("<a>\xC3\x28</a>");
  bool threw = false;
  try {
    xmlnav::load_source(file.path, 0);
  } catch (const xmlnav::SourceError& ex) {
    threw = std::string(ex.what()).find("not valid UTF-8") != std::string::npos;
  }
  expect_true(threw, "invalid encoding is fatal");
}

void test_load_source_accepts_valid_file() {
  TempFile file("<a t=\"\xE2\x86\x92\"/>");
  xmlnav::SourceBuffer buffer = xmlnav::load_source(file.path, 0);
  expect_eq(buffer.size(), 12, "bytes loaded");
}

void test_is_url_detects_http_schemes() {
  expect_true(xmlnav::is_url("http://example.com/a.xml"), "http");
  expect_true(xmlnav::is_url("https://example.com/a.xml"), "https");
  expect_true(!xmlnav::is_url("file.xml"), "path");
  expect_true(!xmlnav::is_url("ftp://example.com/a.xml"), "other scheme");
}

void test_from_string_owns_contents() {
  xmlnav::SourceBuffer buffer = xmlnav::SourceBuffer::from_string("<x/>");
  expect_true(!buffer.mapped(), "in-memory buffer");
  expect_str_eq(buffer.view(), "<x/>", "contents");
}

}  // namespace

void register_source_tests(std::vector<TestCase>& tests) {
  tests.push_back({"map_file_exposes_file_bytes", test_map_file_exposes_file_bytes});
  tests.push_back({"map_file_empty_file_yields_empty_buffer",
                   test_map_file_empty_file_yields_empty_buffer});
  tests.push_back({"map_file_missing_path_throws", test_map_file_missing_path_throws});
  tests.push_back({"map_file_rejects_directories", test_map_file_rejects_directories});
  tests.push_back({"load_source_rejects_invalid_utf8", test_load_source_rejects_invalid_utf8});
  tests.push_back({"load_source_accepts_valid_file", test_load_source_accepts_valid_file});
  tests.push_back({"is_url_detects_http_schemes", test_is_url_detects_http_schemes});
  tests.push_back({"from_string_owns_contents", test_from_string_owns_contents});
}
