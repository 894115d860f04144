#include "test_harness.h"

#include <string>
#include <vector>

#include "xmlnav/stats.h"

namespace {

void test_collect_stats_counts_per_depth() {
  std::string xml = "<lib><book id='1'><t>A</t></book><book><t>B</t><x/></book><mag/></lib>";
  xmlnav::DocumentStats stats = xmlnav::collect_stats(xml);
  expect_eq(stats.byte_size, xml.size(), "byte size");
  expect_eq(stats.element_count, 7, "elements");
  expect_eq(stats.tag_count, 14, "start plus end tags");
  expect_eq(stats.text_run_count, 2, "text runs");
  expect_eq(stats.max_depth, 3, "max depth");
  expect_eq(stats.levels.size(), 3, "three populated depths");
  if (stats.levels.size() != 3) return;
  expect_eq(stats.levels[0].element_count, 1, "root level");
  expect_eq(stats.levels[1].element_count, 3, "depth 1");
  expect_eq(stats.levels[1].unique_tags.size(), 2, "book and mag");
  if (stats.levels[1].unique_tags.size() == 2) {
    expect_str_eq(stats.levels[1].unique_tags[0], "book", "sorted first");
    expect_str_eq(stats.levels[1].unique_tags[1], "mag", "sorted second");
  }
  expect_eq(stats.levels[2].element_count, 3, "depth 2");
}

void test_collect_stats_tolerates_stray_end_tags() {
  xmlnav::DocumentStats stats = xmlnav::collect_stats("</x></y><a/>");
  expect_eq(stats.element_count, 1, "one element");
  expect_eq(stats.max_depth, 1, "depth never underflows");
  expect_eq(stats.levels.size(), 1, "only root level");
}

void test_collect_stats_empty_input() {
  xmlnav::DocumentStats stats = xmlnav::collect_stats("");
  expect_eq(stats.element_count, 0, "no elements");
  expect_eq(stats.levels.size(), 0, "no levels");
  std::string text = xmlnav::render_stats_text(stats, 0.0, false);
  expect_true(text.find("0.00 MB/s") != std::string::npos, "zero elapsed does not divide");
}

void test_render_stats_text_plain_report() {
  xmlnav::DocumentStats stats = xmlnav::collect_stats("<a><b/><c/></a>");
  std::string text = xmlnav::render_stats_text(stats, 1.5, false);
  expect_true(text.find("--- XML Statistics ---") != std::string::npos, "header");
  expect_true(text.find("Processed 6 tags") != std::string::npos, "tag count line");
  expect_true(text.find("Root level: 1 elements") != std::string::npos, "root line");
  expect_true(text.find("Depth 1: 2 elements") != std::string::npos, "depth line");
  expect_true(text.find("Unique tags: b, c") != std::string::npos, "unique tags line");
  expect_true(text.find('\033') == std::string::npos, "no escapes without colour");
  std::string colored = xmlnav::render_stats_text(stats, 1.5, true);
  expect_true(colored.find('\033') != std::string::npos, "escapes with colour");
}

void test_stats_to_json_fields() {
  xmlnav::DocumentStats stats = xmlnav::collect_stats("<a><b>t</b></a>");
  nlohmann::json doc = xmlnav::stats_to_json(stats, 2.0);
  expect_eq(doc["element_count"].get<size_t>(), 2, "element_count");
  expect_eq(doc["tag_count"].get<size_t>(), 4, "tag_count");
  expect_eq(doc["text_run_count"].get<size_t>(), 1, "text_run_count");
  expect_eq(doc["max_depth"].get<size_t>(), 2, "max_depth");
  expect_true(doc["levels"].is_array(), "levels array");
  expect_eq(doc["levels"].size(), 2, "two levels");
  expect_true(doc["levels"][1]["unique_tags"][0] == "b", "tag names serialized");
}

}  // namespace

void register_stats_tests(std::vector<TestCase>& tests) {
  tests.push_back({"collect_stats_counts_per_depth", test_collect_stats_counts_per_depth});
  tests.push_back({"collect_stats_tolerates_stray_end_tags",
                   test_collect_stats_tolerates_stray_end_tags});
  tests.push_back({"collect_stats_empty_input", test_collect_stats_empty_input});
  tests.push_back({"render_stats_text_plain_report", test_render_stats_text_plain_report});
  tests.push_back({"stats_to_json_fields", test_stats_to_json_fields});
}
