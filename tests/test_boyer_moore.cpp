#include "minitest.hpp"
#include "util/BoyerMoore.hpp"
#include <string>

using penenv::util::BoyerMooreSearch;

TEST(bm_finds_first_occurrence) {
  BoyerMooreSearch bm("scan");
  ASSERT_EQ(bm.search("nmap quick scan, full scan"), 11);
  ASSERT_TRUE(bm.matches("scan"));
}

TEST(bm_case_insensitive_both_sides) {
  ASSERT_EQ(BoyerMooreSearch("SMB").search("enum smb shares"), 5);
  ASSERT_EQ(BoyerMooreSearch("smb").search("Enum SMB Shares"), 5);
}

TEST(bm_empty_pattern_matches_at_zero) {
  BoyerMooreSearch bm("");
  ASSERT_TRUE(bm.empty());
  ASSERT_EQ(bm.search(""), 0);
  ASSERT_EQ(bm.search("anything"), 0);
}

TEST(bm_no_match_and_short_text) {
  ASSERT_EQ(BoyerMooreSearch("gobuster").search("gobust"), -1);
  ASSERT_EQ(BoyerMooreSearch("xyz").search("nmap -sV {target}"), -1);
}

TEST(bm_repeated_characters) {
  ASSERT_EQ(BoyerMooreSearch("aab").search("aaaaab"), 3);
  ASSERT_EQ(BoyerMooreSearch("{target}").search("nc {target} {port}"), 3);
}

TEST(bm_match_at_end) {
  ASSERT_EQ(BoyerMooreSearch("8000").search("python3 -m http.server 8000"), 23);
}
