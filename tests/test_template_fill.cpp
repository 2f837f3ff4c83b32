#include "minitest.hpp"
#include "app/TemplateFill.hpp"
#include <string>

using namespace penenv::app;

TEST(fill_replaces_every_target) {
  ASSERT_EQ(fill_template("nmap -sV {target} && ping {target}", "10.0.0.5"),
            std::string("nmap -sV 10.0.0.5 && ping 10.0.0.5"));
}

TEST(fill_blanks_port_placeholder) {
  ASSERT_EQ(fill_template("nc {target} {port}", "host"), std::string("nc host "));
  ASSERT_EQ(fill_template("curl http://{target}:{port}/", "h"), std::string("curl http://h:/"));
}

TEST(fill_without_placeholders_is_identity) {
  ASSERT_EQ(fill_template("python3 -m http.server 8000", "x"), std::string("python3 -m http.server 8000"));
}

TEST(fill_target_text_is_not_rescanned) {
  ASSERT_EQ(fill_template("echo {target}", "{target}"), std::string("echo {target}"));
}

TEST(needs_target_detects_placeholder) {
  ASSERT_TRUE(needs_target("nmap {target}"));
  ASSERT_TRUE(!needs_target("nmap {port}"));
  ASSERT_TRUE(!needs_target("nmap {TARGET}"));
}

TEST(insertion_appends_one_space) {
  ASSERT_EQ(insertion_text("whoami"), std::string("whoami "));
  ASSERT_EQ(insertion_text(""), std::string(" "));
  ASSERT_TRUE(insertion_text("ls").find('\n') == std::string::npos);
}

TEST(replace_all_edge_cases) {
  ASSERT_EQ(replace_all("aaa", "a", "bb"), std::string("bbbbbb"));
  ASSERT_EQ(replace_all("abc", "", "x"), std::string("abc"));
  ASSERT_EQ(replace_all("", "a", "x"), std::string(""));
}
