#include <gtest/gtest.h>

#include "string_utils.h"
#include "name_utils.h"
#include "contact_utils.h"

TEST(StringUtils, CollapseAndTrim) {
    EXPECT_EQ(collapseWhitespace("  a \n\t b   c "), "a b c");
    EXPECT_EQ(trimStr("\t x y \n"), "x y");
    EXPECT_EQ(trimPunctEdges("(hello)."), "hello");
    EXPECT_EQ(trimPunctEdges("..."), "");
}

TEST(StringUtils, StripTagsKeepsText) {
    EXPECT_EQ(collapseWhitespace(stripTags("<p>Jane <b>Smith</b></p>\n<br/>Professor")), "Jane Smith Professor");
}

TEST(StringUtils, TitleCaseWords) {
    EXPECT_EQ(titleCaseWords("computer-science"), "Computer Science");
    EXPECT_EQ(titleCaseWords("MECHANICAL_engineering"), "Mechanical Engineering");
}

TEST(StringUtils, SplitAndJoin) {
    vector<string> parts = splitOn("a/b//c", '/');
    ASSERT_EQ(parts.size(), 4u);
    EXPECT_EQ(parts[2], "");
    EXPECT_EQ(joinStrings({ "x", "y", "z" }, ", "), "x, y, z");
}

TEST(StringUtils, StableHashIsDeterministic) {
    EXPECT_EQ(stableHashHex("carnegie mellon"), stableHashHex("carnegie mellon"));
    EXPECT_NE(stableHashHex("carnegie mellon"), stableHashHex("stanford"));
    EXPECT_EQ(stableHashHex("x").size(), 16u);
}

TEST(NameUtils, NormalizeNameDropsHonorificsAndCase) {
    EXPECT_EQ(normalizeName("Dr. Jane Smith"), normalizeName("jane smith"));
    EXPECT_EQ(normalizeName("Prof. JANE   Smith, PhD"), "jane smith");
    EXPECT_EQ(nameSurname("Dr. Maria de la Cruz"), "cruz");
}

TEST(NameUtils, InstitutionNameIgnoresUniversityWord) {
    EXPECT_EQ(normalizeInstitutionName("Carnegie Mellon University"), "carnegie mellon");
    EXPECT_EQ(normalizeInstitutionName("University of Arizona"), "of arizona");
}

TEST(NameUtils, PlausiblePersonNames) {
    EXPECT_TRUE(isPlausiblePersonName("Jane Smith"));
    EXPECT_TRUE(isPlausiblePersonName("Dr. Ludwig van Beethoven"));
    EXPECT_TRUE(isPlausiblePersonName("Jane Smith, PhD"));
    EXPECT_FALSE(isPlausiblePersonName("Faculty Directory"));
    EXPECT_FALSE(isPlausiblePersonName("Smith"));
    EXPECT_FALSE(isPlausiblePersonName("jane smith"));
    EXPECT_FALSE(isPlausiblePersonName("Read More"));
    EXPECT_FALSE(isPlausiblePersonName("Robotics Lab"));
    EXPECT_FALSE(isPlausiblePersonName("Google Scholar"));
    EXPECT_FALSE(isPlausiblePersonName("Computer Science"));
    EXPECT_FALSE(isPlausiblePersonName("Personal Homepage"));
    EXPECT_FALSE(isPlausiblePersonName("Curriculum Vitae"));
    EXPECT_EQ(cleanPersonName("  Jane\n Smith, "), "Jane Smith");
}

TEST(ContactUtils, Emails) {
    EXPECT_TRUE(looksLikeEmail("jsmith@cs.cmu.edu"));
    EXPECT_FALSE(looksLikeEmail("@cmu.edu"));
    EXPECT_FALSE(looksLikeEmail("jsmith@cmu"));
    vector<string> found = findEmailsInText("Contact: jsmith@cs.cmu.edu, or jdoe@cmu.edu. jsmith@cs.cmu.edu");
    ASSERT_EQ(found.size(), 2u);
    EXPECT_EQ(found[0], "jsmith@cs.cmu.edu");
    EXPECT_EQ(emailFromMailto("mailto:jsmith@cmu.edu?subject=Hi"), "jsmith@cmu.edu");
    EXPECT_EQ(emailFromMailto("https://cmu.edu"), "");
}

TEST(ContactUtils, Phones) {
    EXPECT_EQ(phoneFromTel("tel:+1-412-268-1234"), "+1-412-268-1234");
    EXPECT_EQ(findPhoneInText("Office GHC 7001 Phone (412) 268-1234"), "(412) 268-1234");
    EXPECT_EQ(findPhoneInText("Room 12"), "");
}

TEST(ContactUtils, Titles) {
    EXPECT_TRUE(looksLikeTitle("Associate Professor of Computer Science"));
    EXPECT_FALSE(looksLikeTitle("Gates Hillman Center 7001"));
}
