#include "minitest.hpp"
#include "app/CommandFilter.hpp"
#include <string>
#include <vector>

using namespace penenv::app;
using penenv::model::CommandTemplate;

static std::vector<CommandTemplate> sample_templates() {
  return {
    {"Nmap Quick Scan", "nmap -T4 -F {target}", "Fast scan of common ports", "Reconnaissance"},
    {"Gobuster Dir", "gobuster dir -u http://{target} -w common.txt", "Directory brute force", "Web"},
    {"Enum4linux", "enum4linux -a {target}", "SMB enumeration", "SMB"},
    {"Nikto", "nikto -h {target}", "Web server scanner", "Web"},
    {"Python HTTP Server", "python3 -m http.server 8000", "Serve files", "Utilities"},
  };
}

TEST(filter_empty_query_matches_all) {
  auto t = sample_templates();
  auto r = filter_commands(t, "");
  ASSERT_EQ(r.matches.size(), t.size());
  ASSERT_EQ(r.categories.size(), 4u);
  ASSERT_TRUE(template_matches(t[0], ""));
}

TEST(filter_is_case_insensitive_over_all_fields) {
  auto t = sample_templates();
  ASSERT_TRUE(template_matches(t[0], "NMAP"));          // name
  ASSERT_TRUE(template_matches(t[2], "enumeration"));   // description
  ASSERT_TRUE(template_matches(t[1], "-W COMMON"));     // command
  ASSERT_TRUE(template_matches(t[4], "utilities"));     // category
  ASSERT_TRUE(!template_matches(t[4], "nmap"));
}

TEST(filter_reports_matches_in_order_with_categories) {
  auto t = sample_templates();
  auto r = filter_commands(t, "web");
  ASSERT_EQ(r.matches.size(), 2u);
  ASSERT_EQ(r.matches[0], 1u);
  ASSERT_EQ(r.matches[1], 3u);
  ASSERT_EQ(r.categories.size(), 1u);
  ASSERT_TRUE(r.categories.count("Web") == 1);
}

TEST(filter_http_hits_multiple_categories) {
  auto t = sample_templates();
  auto r = filter_commands(t, "http");
  ASSERT_EQ(r.matches.size(), 2u);
  ASSERT_TRUE(r.categories.count("Web") == 1);
  ASSERT_TRUE(r.categories.count("Utilities") == 1);
  ASSERT_TRUE(r.categories.count("SMB") == 0);
}

TEST(filter_no_match_is_empty) {
  auto t = sample_templates();
  auto r = filter_commands(t, "zzz-not-here");
  ASSERT_TRUE(r.matches.empty());
  ASSERT_TRUE(r.categories.empty());
}

TEST(filter_categories_in_first_seen_order) {
  auto c = categories_in_order(sample_templates());
  ASSERT_EQ(c.size(), 4u);
  ASSERT_EQ(c[0], std::string("Reconnaissance"));
  ASSERT_EQ(c[1], std::string("Web"));
  ASSERT_EQ(c[2], std::string("SMB"));
  ASSERT_EQ(c[3], std::string("Utilities"));
}
