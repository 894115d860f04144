#include "xmlnav/wellformed.h"

#include <algorithm>
#include <cstring>

#include <libxml/parser.h>
#include <libxml/xmlerror.h>

namespace xmlnav {

namespace {

constexpr size_t kChunkBytes = 1 << 20;

void quiet_message(void*, const char*, ...) {}

/// Owns a push parser context and frees it with any partial document.
struct PushParser {
  explicit PushParser(xmlSAXHandler* sax)
      : ctxt(xmlCreatePushParserCtxt(sax, nullptr, nullptr, 0, nullptr)) {}
  ~PushParser() {
    if (ctxt == nullptr) return;
    if (ctxt->myDoc != nullptr) xmlFreeDoc(ctxt->myDoc);
    xmlFreeParserCtxt(ctxt);
  }
  PushParser(const PushParser&) = delete;
  PushParser& operator=(const PushParser&) = delete;

  xmlParserCtxtPtr ctxt;
};

std::string trim_trailing_newlines(std::string s) {
  while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) s.pop_back();
  return s;
}

}  // namespace

WellFormedReport check_well_formed(std::string_view xml) {
  WellFormedReport report;
  xmlSAXHandler sax;
  std::memset(&sax, 0, sizeof(sax));
  sax.initialized = XML_SAX2_MAGIC;
  sax.warning = quiet_message;
  sax.error = quiet_message;
  sax.fatalError = quiet_message;

  PushParser parser(&sax);
  if (parser.ctxt == nullptr) {
    report.ok = false;
    report.message = "Failed to create XML parser";
    return report;
  }
  xmlCtxtUseOptions(parser.ctxt, XML_PARSE_NONET | XML_PARSE_HUGE);

  size_t pos = 0;
  while (pos < xml.size()) {
    const size_t n = std::min(kChunkBytes, xml.size() - pos);
    if (xmlParseChunk(parser.ctxt, xml.data() + pos, static_cast<int>(n), 0) != 0) break;
    pos += n;
  }
  xmlParseChunk(parser.ctxt, nullptr, 0, 1);

  if (parser.ctxt->wellFormed) return report;
  report.ok = false;
  const xmlError* err = xmlCtxtGetLastError(parser.ctxt);
  if (err != nullptr) {
    report.message = err->message != nullptr ? trim_trailing_newlines(err->message) : "";
    report.line = err->line;
    report.column = err->int2;
  }
  if (report.message.empty()) report.message = "document is not well-formed";
  return report;
}

std::string format_well_formed_report(const WellFormedReport& report) {
  if (report.ok) return "well-formed";
  return "line " + std::to_string(report.line) + ", column " + std::to_string(report.column) +
         ": " + report.message;
}

}  // namespace xmlnav
