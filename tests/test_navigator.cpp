#include "test_harness.h"

#include <string>
#include <vector>

#include "xmlnav/explorer.h"
#include "xmlnav/navigator.h"

namespace {

std::string make_list(size_t count) {
  std::string xml = "<list>";
  for (size_t i = 0; i < count; ++i) {
    xml += "<item id=\"" + std::to_string(i) + "\">v" + std::to_string(i) + "</item>";
  }
  xml += "</list>";
  return xml;
}

void test_navigator_starts_at_synthetic_root() {
  std::string xml = "<a><b>1</b></a>";
  xmlnav::Explorer explorer(xml);
  xmlnav::Navigator nav(explorer);
  expect_eq(nav.depth(), 0, "no descents yet");
  expect_true(!nav.current_level().tag.has_value(), "root level has no tag");
  expect_eq(nav.current_level().children.size(), 1, "document element is the only child");
  const xmlnav::Node* node = nav.selected_node();
  expect_true(node != nullptr && node->tag == "a", "root element selected");
}

void test_navigator_descend_then_ascend_restores_selection() {
  std::string xml = "<r><a><x/><y/></a><b><z/></b><c/></r>";
  xmlnav::Explorer explorer(xml);
  xmlnav::Navigator nav(explorer);
  nav.descend();
  expect_eq(nav.depth(), 1, "inside r");
  nav.move_down();
  expect_eq(nav.selected(), 1, "b selected");
  nav.descend();
  expect_eq(nav.depth(), 2, "inside b");
  expect_eq(nav.selected(), 0, "selection reset on descend");
  expect_true(nav.current_level().tag && *nav.current_level().tag == "b", "level tag");
  nav.ascend();
  expect_eq(nav.depth(), 1, "back in r");
  expect_eq(nav.selected(), 1, "b selected again");
  nav.ascend();
  expect_eq(nav.selected(), 0, "root selection restored");
  nav.ascend();
  expect_eq(nav.depth(), 0, "ascend at root is a no-op");
}

void test_navigator_clamps_moves_at_edges() {
  std::string xml = make_list(3);
  xmlnav::Explorer explorer(xml);
  xmlnav::Navigator nav(explorer);
  nav.descend();
  nav.move_up();
  expect_eq(nav.selected(), 0, "move up at 0 is a no-op");
  nav.jump_last();
  expect_eq(nav.selected(), 2, "jump to last");
  nav.move_down();
  expect_eq(nav.selected(), 2, "move down at last is a no-op");
  nav.jump_first();
  expect_eq(nav.selected(), 0, "jump to first");
}

void test_navigator_pages_by_page_size() {
  std::string xml = make_list(25);
  xmlnav::Explorer explorer(xml);
  xmlnav::Navigator nav(explorer);
  nav.descend();
  expect_eq(nav.page_size(), xmlnav::Navigator::kDefaultPageSize, "default page size");
  nav.page_down();
  expect_eq(nav.selected(), 10, "one page down");
  nav.page_down();
  nav.page_down();
  expect_eq(nav.selected(), 24, "page down clamps at the end");
  nav.set_page_size(7);
  nav.page_up();
  expect_eq(nav.selected(), 17, "page up by the new size");
  nav.set_page_size(0);
  expect_eq(nav.page_size(), 1, "page size never drops below 1");
  nav.set_page_size(100);
  nav.page_up();
  expect_eq(nav.selected(), 0, "page up clamps at 0");
}

void test_navigator_detail_on_leaf_reports_nothing() {
  std::string xml = "<a><b>1</b><b>2</b><c/></a>";
  xmlnav::Explorer explorer(xml);
  xmlnav::Navigator nav(explorer);
  nav.descend();
  nav.jump_last();
  nav.toggle_detail();
  expect_true(nav.detail_visible(), "detail open");
  const auto& detail = nav.detail();
  expect_true(detail.has_value(), "detail fetched");
  if (!detail) return;
  expect_eq(detail->attributes.size(), 0, "c has no attributes");
  expect_eq(detail->child_count, 0, "c has no children");
  nav.toggle_detail();
  expect_true(!nav.detail_visible(), "detail closed");
  expect_true(!nav.detail().has_value(), "detail data dropped");
}

void test_navigator_detail_follows_selection() {
  std::string xml = "<r><p k=\"1\"><q/><q/></p><s a=\"x\" b=\"y\"/></r>";
  xmlnav::Explorer explorer(xml);
  xmlnav::Navigator nav(explorer);
  nav.descend();
  nav.toggle_detail();
  if (!nav.detail()) {
    expect_true(false, "detail fetched");
    return;
  }
  expect_eq(nav.detail()->child_count, 2, "p has two children");
  expect_eq(nav.detail()->attributes.size(), 1, "p has one attribute");
  nav.move_down();
  if (!nav.detail()) {
    expect_true(false, "detail stays open");
    return;
  }
  expect_eq(nav.detail()->attributes.size(), 2, "s attributes after move");
  expect_eq(nav.detail()->child_count, 0, "s has no children");
}

void test_navigator_empty_document_is_inert() {
  xmlnav::Explorer explorer("   ");
  xmlnav::Navigator nav(explorer);
  expect_eq(nav.current_level().children.size(), 0, "no children");
  expect_true(nav.selected_node() == nullptr, "nothing selected");
  nav.move_down();
  nav.page_down();
  nav.jump_last();
  nav.descend();
  nav.toggle_detail();
  expect_eq(nav.selected(), 0, "selection pinned at 0");
  expect_eq(nav.depth(), 0, "descend is a no-op");
  expect_true(!nav.detail_visible(), "detail cannot open");
}

void test_navigator_descend_into_leaf_shows_empty_level() {
  std::string xml = "<a><c/></a>";
  xmlnav::Explorer explorer(xml);
  xmlnav::Navigator nav(explorer);
  nav.descend();
  nav.descend();
  expect_eq(nav.depth(), 2, "descended into c");
  expect_eq(nav.current_level().children.size(), 0, "c level is empty");
  nav.move_down();
  expect_eq(nav.selected(), 0, "movement disabled on empty level");
  nav.ascend();
  expect_eq(nav.selected(), 0, "c selected again");
}

void test_navigator_apply_dispatches_and_reports_quit() {
  std::string xml = make_list(4);
  xmlnav::Explorer explorer(xml);
  xmlnav::Navigator nav(explorer);
  expect_true(nav.apply(xmlnav::NavCommand::Descend), "descend continues");
  expect_true(nav.apply(xmlnav::NavCommand::JumpLast), "jump continues");
  expect_eq(nav.selected(), 3, "jumped to last");
  expect_true(nav.apply(xmlnav::NavCommand::Ascend), "ascend continues");
  expect_eq(nav.depth(), 0, "ascended");
  expect_true(!nav.apply(xmlnav::NavCommand::Quit), "quit stops the loop");
}

void test_navigator_view_reports_window_and_previews() {
  std::string xml = make_list(30);
  xmlnav::Explorer explorer(xml);
  xmlnav::Navigator nav(explorer);
  nav.descend();
  nav.page_down();
  xmlnav::ViewModel view = nav.view(8, 5);
  expect_true(view.level_tag && *view.level_tag == "list", "level tag");
  expect_eq(view.first_row, 8, "window start");
  expect_eq(view.rows.size(), 5, "window size");
  expect_eq(view.selected, 10, "selection");
  expect_eq(view.child_count, 30, "total children");
  expect_eq(view.depth, 1, "depth");
  expect_true(!view.detail_visible, "detail hidden");
  if (view.rows.size() != 5) return;
  expect_str_eq(view.rows[0].tag, "item", "row tag");
  expect_true(view.rows[0].text && *view.rows[0].text == "v8", "row text");
  expect_true(view.rows[0].attribute_preview && *view.rows[0].attribute_preview == "id=\"8\"",
              "attribute preview");
  xmlnav::ViewModel tail = nav.view(28, 10);
  expect_eq(tail.rows.size(), 2, "window clipped at the end");
}

void test_make_attribute_preview_compacts_and_truncates() {
  auto preview = xmlnav::make_attribute_preview("  a=\"1\"\n\t  b=\"2\"  ", 40);
  expect_true(preview && *preview == "a=\"1\" b=\"2\"", "whitespace compacted");
  auto cut = xmlnav::make_attribute_preview(" title=\"abcdefghij\"", 8);
  expect_true(cut && *cut == "title=\"a...", "truncated with ellipsis");
  expect_true(!xmlnav::make_attribute_preview("   ", 40).has_value(), "blank has no preview");
  expect_true(!xmlnav::make_attribute_preview(" a=\"1\"", 0).has_value(), "disabled preview");
}

}  // namespace

void register_navigator_tests(std::vector<TestCase>& tests) {
  tests.push_back({"navigator_starts_at_synthetic_root", test_navigator_starts_at_synthetic_root});
  tests.push_back({"navigator_descend_then_ascend_restores_selection",
                   test_navigator_descend_then_ascend_restores_selection});
  tests.push_back({"navigator_clamps_moves_at_edges", test_navigator_clamps_moves_at_edges});
  tests.push_back({"navigator_pages_by_page_size", test_navigator_pages_by_page_size});
  tests.push_back({"navigator_detail_on_leaf_reports_nothing",
                   test_navigator_detail_on_leaf_reports_nothing});
  tests.push_back({"navigator_detail_follows_selection", test_navigator_detail_follows_selection});
  tests.push_back({"navigator_empty_document_is_inert", test_navigator_empty_document_is_inert});
  tests.push_back({"navigator_descend_into_leaf_shows_empty_level",
                   test_navigator_descend_into_leaf_shows_empty_level});
  tests.push_back({"navigator_apply_dispatches_and_reports_quit",
                   test_navigator_apply_dispatches_and_reports_quit});
  tests.push_back({"navigator_view_reports_window_and_previews",
                   test_navigator_view_reports_window_and_previews});
  tests.push_back({"make_attribute_preview_compacts_and_truncates",
                   test_make_attribute_preview_compacts_and_truncates});
}
