/*
 * test_ingestion_pipeline.cpp: classify, extract, resolve and store per response
 */

#include "TestMacros.hpp"
#include "engine/IngestionPipeline.hpp"
#include <optional>
#include <string>

using OptStr = std::optional<std::string>;

static const char *kAppBody = "var a = \"/api/v1/users\"; var b = \"https://cdn.test/lib.js\";";

static bool hasRow(const std::vector<SnapshotRow> &rows, const std::string &host, const std::string &path,
                   const std::string &source) {
  for (const auto &row : rows) {
    if (row.host == host && row.path == path && row.sourceFile == source)
      return true;
  }
  return false;
}

void test_end_to_end_conservative() {
  DiscoveryStore store;
  IngestionPipeline pipeline(store);
  const std::string url = "https://shop.test/app.js";
  const size_t added = pipeline.ingest(kAppBody, OptStr("text/javascript"), RequestContext::fromUrl(url), url, false);

  const auto rows = store.snapshot("");
  ASSERT_EQ(added, static_cast<size_t>(2), "two new entries");
  ASSERT_EQ(rows.size(), static_cast<size_t>(2), "two rows");
  ASSERT_TRUE(hasRow(rows, "https://shop.test", "/api/v1/users", "app.js"), "path resolved against origin");
  ASSERT_TRUE(hasRow(rows, "https://cdn.test", "/lib.js", "app.js"), "absolute URL kept under its own origin");
  ASSERT_EQ(store.origins().size(), static_cast<size_t>(2), "grouped by two origins");
}

void test_end_to_end_greedy() {
  DiscoveryStore store;
  IngestionPipeline pipeline(store);
  const std::string url = "https://shop.test/app.js";
  pipeline.ingest(kAppBody, OptStr("text/javascript"), RequestContext::fromUrl(url), url, true);

  const auto rows = store.snapshot("");
  ASSERT_EQ(rows.size(), static_cast<size_t>(1), "greedy skips literals containing a colon");
  ASSERT_TRUE(hasRow(rows, "https://shop.test", "/api/v1/users", "app.js"), "greedy keeps the path");
}

void test_non_js_is_noop() {
  DiscoveryStore store;
  IngestionPipeline pipeline(store);
  const std::string url = "https://shop.test/index.html";
  const size_t added =
      pipeline.ingest(kAppBody, OptStr("text/html"), RequestContext::fromUrl(url), url, false);
  ASSERT_EQ(added, static_cast<size_t>(0), "nothing added");
  ASSERT_EQ(store.size(), static_cast<size_t>(0), "store untouched");
}

void test_js_by_suffix_and_empty_body() {
  DiscoveryStore store;
  IngestionPipeline pipeline(store);
  const std::string url = "http://a.test/lib/util.js";
  ASSERT_EQ(pipeline.ingest("x = '/one/two';", std::nullopt, RequestContext::fromUrl(url), url, true),
            static_cast<size_t>(1), "classified by .js suffix");
  ASSERT_EQ(pipeline.ingest("", OptStr("application/javascript"), RequestContext::fromUrl(url), url, true),
            static_cast<size_t>(0), "empty body is a no-op");
}

void test_without_request_context() {
  DiscoveryStore store;
  IngestionPipeline pipeline(store);
  pipeline.ingest("a = \"/abs/path\"; b = \"rel/path\";", OptStr("application/javascript"), std::nullopt,
                  std::nullopt, true);
  const auto rows = store.snapshot("");
  ASSERT_EQ(rows.size(), static_cast<size_t>(1), "relative candidate dropped, absolute path kept");
  ASSERT_TRUE(hasRow(rows, "unknown", "/abs/path", "unknown"), "unknown origin and source");
}

void test_bad_candidate_isolated() {
  DiscoveryStore store;
  IngestionPipeline pipeline(store);
  const std::string url = "http://a.test/app.js";
  const size_t added = pipeline.ingest("a = \"/a\x01" "b/c\"; b = \"/good/one\"; c = \"http://bad host/x\";",
                                       OptStr("text/javascript"), RequestContext::fromUrl(url), url, true);
  ASSERT_EQ(added, static_cast<size_t>(1), "malformed candidate skipped, next one stored");
  ASSERT_TRUE(hasRow(store.snapshot(""), "http://a.test", "/good/one", "app.js"), "good candidate present");
}

void test_repeat_and_provenance() {
  DiscoveryStore store;
  IngestionPipeline pipeline(store);
  const std::string app = "https://a.test/js/app.js?v=3";
  const std::string vendor = "https://a.test/js/vendor.js";
  const OptStr js("application/javascript");

  ASSERT_EQ(pipeline.ingest("u = '/api/x';", js, RequestContext::fromUrl(app), app, true),
            static_cast<size_t>(1), "first discovery");
  ASSERT_EQ(pipeline.ingest("u = '/api/x';", js, RequestContext::fromUrl(app), app, true),
            static_cast<size_t>(0), "same response again adds nothing");
  ASSERT_EQ(pipeline.ingest("u = '/api/x';", js, RequestContext::fromUrl(vendor), vendor, true),
            static_cast<size_t>(1), "same URL from another file is tracked separately");
  ASSERT_TRUE(hasRow(store.snapshot(""), "https://a.test", "/api/x", "app.js"), "query stripped from label");
}

void test_source_file_label() {
  ASSERT_EQ(sourceFileLabel(OptStr("https://a.test/static/app.js?v=2")), std::string("app.js"), "query removed");
  ASSERT_EQ(sourceFileLabel(std::nullopt), std::string("unknown"), "absent url");
  ASSERT_EQ(sourceFileLabel(OptStr("https://a.test/static/")), std::string("unknown"), "empty segment");
  ASSERT_EQ(sourceFileLabel(OptStr("bundle.js")), std::string("bundle.js"), "no slash at all");
}

void test_origin_key() {
  ASSERT_TRUE(originKey("https://a.test:8443/x") == OptStr("https://a.test"), "scheme and host without port");
  ASSERT_TRUE(originKey("/x/y") == OptStr("unknown"), "path without origin");
  ASSERT_FALSE(originKey("http://bad host/x").has_value(), "unparsable absolute URL");
}

void test_oversized_literal_does_not_stop_ingest() {
  DiscoveryStore store;
  IngestionPipeline pipeline(store);
  const std::string url = "https://a.test/static/bundle.js";
  std::string blob;
  while (blob.size() < 256 * 1024) blob += "QUJD+/9x";
  const std::string body = "var img = \"" + blob + "\"; var api = \"/api/v2/orders\";\n";

  ASSERT_EQ(pipeline.ingest(body, OptStr("application/javascript"), RequestContext::fromUrl(url), url, true),
            static_cast<size_t>(1), "only the short literal is stored");
  ASSERT_TRUE(hasRow(store.snapshot(""), "https://a.test", "/api/v2/orders", "bundle.js"), "short literal resolved");
}

int main() {
  printf("=== Ingestion Pipeline Tests ===\n\n");

  test_end_to_end_conservative();
  test_end_to_end_greedy();
  test_non_js_is_noop();
  test_js_by_suffix_and_empty_body();
  test_without_request_context();
  test_bad_candidate_isolated();
  test_repeat_and_provenance();
  test_source_file_label();
  test_origin_key();
  test_oversized_literal_does_not_stop_ingest();

  return TEST_SUMMARY();
}
