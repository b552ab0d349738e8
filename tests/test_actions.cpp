/*
 * test_actions.cpp: GET request building and tool dispatch
 */

#include "TestMacros.hpp"
#include "actions/ActionDispatcher.hpp"
#include "actions/ConsoleActions.hpp"
#include "actions/RequestBuilder.hpp"
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

struct RecordingTools : ToolActions {
  std::vector<std::string> repeater;
  std::vector<std::string> labels;
  std::vector<std::string> organizer;
  bool failRepeater = false;
  bool organizerThrowsCode = false;

  void sendToRepeater(const OutboundRequest &request, const std::string &label) override {
    if (failRepeater)
      throw std::runtime_error("repeater unavailable");
    repeater.push_back(request.raw);
    labels.push_back(label);
  }

  void sendToOrganizer(const OutboundRequest &request) override {
    if (organizerThrowsCode)
      throw 42;
    organizer.push_back(request.raw);
  }
};

static SnapshotRow row(const std::string &host, const std::string &path) {
  SnapshotRow r;
  r.host = host;
  r.path = path;
  r.sourceFile = "app.js";
  r.url = host + path;
  return r;
}

void test_build_get_request() {
  const auto req = buildGetRequest("https://a.test/p?q=1");
  ASSERT_TRUE(req.has_value(), "https URL builds");
  if (!req)
    return;
  ASSERT_EQ(req->raw, std::string("GET /p?q=1 HTTP/1.1\r\nHost: a.test\r\n\r\n"), "request line and host");
  ASSERT_TRUE(req->secure, "secure flag");
  ASSERT_EQ(req->port, 443, "default https port");
}

void test_build_with_port_and_empty_path() {
  const auto req = buildGetRequest("http://a.test:8080");
  ASSERT_TRUE(req && req->raw == "GET / HTTP/1.1\r\nHost: a.test:8080\r\n\r\n", "empty path becomes / and port kept");
}

void test_build_rejects() {
  ASSERT_FALSE(buildGetRequest("unknown/only/path").has_value(), "no scheme");
  ASSERT_FALSE(buildGetRequest("ftp://a.test/x").has_value(), "non-http scheme");
  ASSERT_FALSE(buildGetRequest("http://bad host/").has_value(), "unparsable URL");
}

void test_dispatch_to_tools() {
  RecordingTools tools;
  ActionDispatcher dispatcher(tools);
  ASSERT_TRUE(dispatcher.sendToRepeater(row("https://a.test", "/p")), "repeater accepted");
  ASSERT_TRUE(dispatcher.sendToOrganizer(row("https://a.test", "/o")), "organizer accepted");
  ASSERT_EQ(tools.labels.size(), static_cast<size_t>(1), "one repeater call");
  if (!tools.labels.empty())
    ASSERT_EQ(tools.labels[0], std::string("URLSucker-https://a.test/p"), "label from URL");
  ASSERT_EQ(tools.organizer.size(), static_cast<size_t>(1), "one organizer call");
  ASSERT_EQ(rowUrl(row("https://a.test", "/x?y=1")), std::string("https://a.test/x?y=1"), "row URL is host + path");
}

void test_failures_are_contained() {
  RecordingTools tools;
  tools.failRepeater = true;
  ActionDispatcher dispatcher(tools);
  ASSERT_FALSE(dispatcher.sendToRepeater(row("https://a.test", "/p")), "throwing tool reports false");
  ASSERT_TRUE(dispatcher.sendToOrganizer(row("https://a.test", "/p")), "next action still runs");
  ASSERT_FALSE(dispatcher.sendToOrganizer(row("unknown", "/p")), "unknown host cannot be requested");
  ASSERT_EQ(tools.organizer.size(), static_cast<size_t>(1), "bad row never reaches the tool");
}

void test_non_standard_exception_contained() {
  RecordingTools tools;
  tools.organizerThrowsCode = true;
  ActionDispatcher dispatcher(tools);
  ASSERT_FALSE(dispatcher.sendToOrganizer(row("https://a.test", "/p")), "non-std throw reports false");
  ASSERT_TRUE(dispatcher.sendToRepeater(row("https://a.test", "/p")), "repeater still usable");
  tools.organizerThrowsCode = false;
  ASSERT_TRUE(dispatcher.sendToOrganizer(row("https://a.test", "/q")), "organizer usable once healthy");
}

void test_console_actions() {
  std::ostringstream out;
  ConsoleActions console(out);
  ActionDispatcher dispatcher(console);
  dispatcher.sendToRepeater(row("http://a.test", "/p"));
  ASSERT_TRUE(out.str().find("### URLSucker-http://a.test/p (http)") != std::string::npos, "label printed");
  ASSERT_TRUE(out.str().find("GET /p HTTP/1.1\r\nHost: a.test\r\n") != std::string::npos, "raw request printed");
}

int main() {
  printf("=== Tool Action Tests ===\n\n");

  test_build_get_request();
  test_build_with_port_and_empty_path();
  test_build_rejects();
  test_dispatch_to_tools();
  test_failures_are_contained();
  test_non_standard_exception_contained();
  test_console_actions();

  return TEST_SUMMARY();
}
