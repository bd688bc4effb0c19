#include "markup/SafeString.hpp"

#include <gtest/gtest.h>

#include <list>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "markup/Escapable.hpp"
#include "markup/Escaper.hpp"
#include "markup/Formatter.hpp"
#include "markup/escape.hpp"

using namespace markup;

namespace {

class Awesome : public Escapable {
 public:
  std::string html() const { return "<em>awesome</em>"; }
};

}  // namespace

// ==================== CONSTRUCTION TESTS ====================

TEST(SafeStringTests, DefaultIsEmpty) {
  SafeString empty;
  EXPECT_TRUE(empty.empty());
  EXPECT_EQ(empty.size(), 0u);
  EXPECT_EQ(empty.str(), "");
}

TEST(SafeStringTests, TrustedConstructionKeepsPayload) {
  SafeString markup("Hello, <em>World</em>!");
  EXPECT_EQ(markup.str(), "Hello, <em>World</em>!");
}

TEST(SafeStringTests, StreamsPayload) {
  std::ostringstream oss;
  oss << SafeString("<b>") << escape("<i>");
  EXPECT_EQ(oss.str(), "<b>&lt;i&gt;");
}

TEST(SafeStringTests, Comparison) {
  EXPECT_EQ(SafeString("a"), SafeString("a"));
  EXPECT_NE(SafeString("a"), SafeString("b"));
  EXPECT_TRUE(SafeString("a") < SafeString("b"));
}

// ==================== CONCATENATION TESTS ====================

TEST(ConcatenationTests, EscapesPlainRightOperand) {
  EXPECT_EQ((SafeString("<b>") + "<i>").str(), "<b>&lt;i&gt;");
}

TEST(ConcatenationTests, EscapesPlainLeftOperand) {
  std::string unsafe = "<script type=\"x\">alert(\"foo\");</script>";
  SafeString safe("<em>username</em>");
  EXPECT_EQ((unsafe + safe).str(), escapeText(unsafe) + safe.str());
}

TEST(ConcatenationTests, TwoSafeStringsAreNotEscaped) {
  EXPECT_EQ((SafeString("<a>") + SafeString("&lt;")).str(), "<a>&lt;");
}

TEST(ConcatenationTests, PayloadIsSafePlusEscapedText) {
  const char* samples[] = {"", "plain", "<>&'\"", "Россия & co"};
  SafeString s("<p>");
  for (size_t i = 0; i < sizeof(samples) / sizeof(samples[0]); ++i) {
    EXPECT_EQ((s + samples[i]).str(), s.str() + escapeText(samples[i]));
  }
}

TEST(ConcatenationTests, EscapableOperandIsTrusted) {
  EXPECT_EQ((SafeString("x ") + Awesome()).str(), "x <em>awesome</em>");
}

TEST(ConcatenationTests, NumbersUseCanonicalText) {
  EXPECT_EQ((SafeString("n=") + 5).str(), "n=5");
}

// ==================== REPETITION TESTS ====================

TEST(RepetitionTests, RepeatsPayload) {
  EXPECT_EQ((SafeString("<br>") * 3).str(), "<br><br><br>");
  EXPECT_EQ((2 * escape("&")).str(), "&amp;&amp;");
}

TEST(RepetitionTests, NonPositiveCountIsEmpty) {
  EXPECT_TRUE((SafeString("<br>") * 0).empty());
  EXPECT_TRUE((SafeString("<br>") * -2).empty());
}

// ==================== JOIN TESTS ====================

TEST(JoinTests, EscapesPlainItemsOnly) {
  std::vector<Value> items;
  items.push_back("<a>");
  items.push_back(SafeString("<b>"));
  EXPECT_EQ(escape(", ").join(items).str(), "&lt;a&gt;, <b>");
}

TEST(JoinTests, PlainSeparatorIsEscaped) {
  std::vector<Value> items;
  items.push_back("a");
  items.push_back("b");
  EXPECT_EQ(join(" & ", items).str(), "a &amp; b");
  EXPECT_EQ(join(SafeString("<br>"), items).str(), "a<br>b");
}

TEST(JoinTests, IteratorRange) {
  std::list<std::string> words;
  words.push_back("x<y");
  words.push_back("z");
  SafeString sep("<hr>");
  EXPECT_EQ(sep.join(words.begin(), words.end()).str(), "x&lt;y<hr>z");
}

TEST(JoinTests, EmptyAndSingle) {
  std::vector<Value> items;
  EXPECT_TRUE(SafeString(",").join(items).empty());
  items.push_back(1);
  EXPECT_EQ(SafeString(",").join(items).str(), "1");
}

// ==================== FORMATTING TESTS ====================

TEST(SafeStringFormatTests, BraceStyle) {
  EXPECT_EQ(SafeString("Hi, {}!").format(FormatArgs().add("<x>")).str(),
            "Hi, &lt;x&gt;!");
  EXPECT_EQ(SafeString("<em>{awesome}</em>")
                .format(FormatArgs().add("awesome", "<awesome>"))
                .str(),
            "<em>&lt;awesome&gt;</em>");
}

TEST(SafeStringFormatTests, PercentStyle) {
  EXPECT_EQ((SafeString("<em>%s</em>") % "<bad user>").str(),
            "<em>&lt;bad user&gt;</em>");
  EXPECT_EQ((SafeString("<em>%(username)s</em>") %
             FormatArgs().add("username", "<bad user>"))
                .str(),
            "<em>&lt;bad user&gt;</em>");
  EXPECT_EQ((SafeString("<strong>%s</strong>") % Awesome()).str(),
            "<strong><em>awesome</em></strong>");
}

TEST(SafeStringFormatTests, SingleFieldWithWrongArgumentCount) {
  SafeString tmpl("Hi, {}!");
  EXPECT_THROW(tmpl.format(FormatArgs()), FormatError);
  EXPECT_THROW(tmpl.format(FormatArgs().add("a").add("b")), FormatError);
}

// ==================== CASE TESTS ====================

TEST(CaseTests, Mapping) {
  SafeString s("<B>Hello</B> wORLD");
  EXPECT_EQ(s.lower().str(), "<b>hello</b> world");
  EXPECT_EQ(s.upper().str(), "<B>HELLO</B> WORLD");
  EXPECT_EQ(s.swapcase().str(), "<b>hELLO</b> World");
  EXPECT_EQ(SafeString("hello WORLD").capitalize().str(), "Hello world");
  EXPECT_EQ(SafeString("hello wORLD").title().str(), "Hello World");
  EXPECT_EQ(s.casefold(), s.lower());
}

TEST(CaseTests, CaseChangeKeepsEscapes) {
  SafeString s = escape("A < B");
  EXPECT_EQ(s.lower().unescape(), "a < b");
}

TEST(CaseTests, EqualsIgnoreCaseDoesNotModify) {
  SafeString s("<B>Hi</B>");
  EXPECT_TRUE(s.equalsIgnoreCase(SafeString("<b>hI</b>")));
  EXPECT_TRUE(escape("Tom & Jerry").equalsIgnoreCase("TOM & JERRY"));
  EXPECT_FALSE(s.equalsIgnoreCase("<b>hi</b>"));
  EXPECT_EQ(s.str(), "<B>Hi</B>");
}

// ==================== TRIMMING TESTS ====================

TEST(TrimTests, Whitespace) {
  SafeString s(" \t<b>x</b>\n ");
  EXPECT_EQ(s.strip().str(), "<b>x</b>");
  EXPECT_EQ(s.lstrip().str(), "<b>x</b>\n ");
  EXPECT_EQ(s.rstrip().str(), " \t<b>x</b>");
  EXPECT_EQ(s.strip(Value()).str(), "<b>x</b>");
}

TEST(TrimTests, CharacterSet) {
  EXPECT_EQ(SafeString("xxhixx").strip("x").str(), "hi");
  EXPECT_EQ(SafeString("xxhixx").lstrip("x").str(), "hixx");
  EXPECT_EQ(SafeString("xxhixx").rstrip("x").str(), "xxhi");
  EXPECT_EQ(SafeString("ааhiа").strip("а").str(), "hi");
}

TEST(TrimTests, RemovePrefixMatchesEscapedArgument) {
  SafeString s = escape("<b>bold");
  EXPECT_EQ(s.removeprefix("<b>").str(), "bold");
  EXPECT_EQ(s.removeprefix("<i>"), s);
  EXPECT_EQ(SafeString("<b>bold").removeprefix(SafeString("<b>")).str(),
            "bold");
}

TEST(TrimTests, RemoveSuffixMatchesEscapedArgument) {
  SafeString s = escape("x & y");
  EXPECT_EQ(s.removesuffix(" & y").str(), "x");
  EXPECT_EQ(s.removesuffix("y & x"), s);
}

// ==================== SEARCH TESTS ====================

TEST(SearchTests, EscapesArguments) {
  SafeString s = escape("a < b");
  EXPECT_TRUE(s.startswith("a <"));
  EXPECT_TRUE(s.endswith("< b"));
  EXPECT_TRUE(s.contains("<"));
  EXPECT_FALSE(s.contains(SafeString("<")));
}

TEST(SearchTests, Replace) {
  SafeString s = escape("a < b < c");
  EXPECT_EQ(s.replace("<", ">").str(), "a &gt; b &gt; c");
  EXPECT_EQ(s.replace("<", SafeString("<br>"), 1).str(), "a <br> b &lt; c");
  EXPECT_EQ(SafeString("ab").replace("", "-").str(), "-a-b-");
  EXPECT_EQ(SafeString("ab").replace("", "-", 2).str(), "-a-b");
}

// ==================== SPLITTING TESTS ====================

TEST(SplitTests, Whitespace) {
  std::vector<SafeString> parts = SafeString("  <a>  b\tc\n").split();
  ASSERT_EQ(parts.size(), 3u);
  EXPECT_EQ(parts[0].str(), "<a>");
  EXPECT_EQ(parts[1].str(), "b");
  EXPECT_EQ(parts[2].str(), "c");
}

TEST(SplitTests, Separator) {
  std::vector<SafeString> parts = SafeString("a,b,,c").split(",");
  ASSERT_EQ(parts.size(), 4u);
  EXPECT_EQ(parts[2].str(), "");
  EXPECT_EQ(parts[3].str(), "c");

  parts = SafeString("a,b,c").split(",", 1);
  ASSERT_EQ(parts.size(), 2u);
  EXPECT_EQ(parts[1].str(), "b,c");
}

TEST(SplitTests, SeparatorIsEscaped) {
  std::vector<SafeString> parts = escape("1 < 2 < 3").split("<");
  ASSERT_EQ(parts.size(), 3u);
  EXPECT_EQ(parts[0].str(), "1 ");
  EXPECT_EQ(parts[2].str(), " 3");
}

TEST(SplitTests, RightSplit) {
  std::vector<SafeString> parts = SafeString("a.b.c").rsplit(".", 1);
  ASSERT_EQ(parts.size(), 2u);
  EXPECT_EQ(parts[0].str(), "a.b");
  EXPECT_EQ(parts[1].str(), "c");

  parts = SafeString("..a").rsplit(".");
  ASSERT_EQ(parts.size(), 3u);
  EXPECT_EQ(parts[0].str(), "");
  EXPECT_EQ(parts[1].str(), "");
  EXPECT_EQ(parts[2].str(), "a");
}

TEST(SplitTests, WhitespaceWithLimit) {
  SafeString s("  <a> b  c  ");
  std::vector<SafeString> parts = s.split(Value(), 1);
  ASSERT_EQ(parts.size(), 2u);
  EXPECT_EQ(parts[0].str(), "<a>");
  EXPECT_EQ(parts[1].str(), "b  c  ");

  parts = s.rsplit(Value(), 1);
  ASSERT_EQ(parts.size(), 2u);
  EXPECT_EQ(parts[0].str(), "  <a> b");
  EXPECT_EQ(parts[1].str(), "c");

  parts = s.split(Value(), 0);
  ASSERT_EQ(parts.size(), 1u);
  EXPECT_EQ(parts[0].str(), "<a> b  c  ");

  EXPECT_EQ(s.split(Value()).size(), 3u);
  EXPECT_EQ(s.rsplit(Value()).size(), 3u);
}

TEST(SplitTests, EmptySeparatorThrows) {
  EXPECT_THROW(SafeString("abc").split(""), std::invalid_argument);
  EXPECT_THROW(SafeString("abc").rsplit(""), std::invalid_argument);
  EXPECT_THROW(SafeString("abc").partition(""), std::invalid_argument);
}

TEST(SplitTests, Lines) {
  SafeString s("one\ntwo\r\nthree\rfour\n");
  std::vector<SafeString> lines = s.splitlines();
  ASSERT_EQ(lines.size(), 4u);
  EXPECT_EQ(lines[0].str(), "one");
  EXPECT_EQ(lines[1].str(), "two");
  EXPECT_EQ(lines[2].str(), "three");
  EXPECT_EQ(lines[3].str(), "four");

  lines = s.splitlines(true);
  ASSERT_EQ(lines.size(), 4u);
  EXPECT_EQ(lines[1].str(), "two\r\n");
  EXPECT_EQ(lines[3].str(), "four\n");

  lines = SafeString("a\xE2\x80\xA8" "b").splitlines();
  ASSERT_EQ(lines.size(), 2u);
  EXPECT_TRUE(SafeString("").splitlines().empty());
}

TEST(SplitTests, Partition) {
  Partition parts = escape("a < b < c").partition("<");
  EXPECT_EQ(parts.head.str(), "a ");
  EXPECT_EQ(parts.separator.str(), "&lt;");
  EXPECT_EQ(parts.tail.str(), " b &lt; c");

  parts = escape("a < b < c").rpartition("<");
  EXPECT_EQ(parts.head.str(), "a &lt; b ");
  EXPECT_EQ(parts.tail.str(), " c");
}

TEST(SplitTests, PartitionWithoutMatch) {
  Partition parts = SafeString("abc").partition("x");
  EXPECT_EQ(parts.head.str(), "abc");
  EXPECT_TRUE(parts.separator.empty());
  EXPECT_TRUE(parts.tail.empty());

  parts = SafeString("abc").rpartition("x");
  EXPECT_TRUE(parts.head.empty());
  EXPECT_EQ(parts.tail.str(), "abc");
}

// ==================== PADDING TESTS ====================

TEST(PaddingTests, Justify) {
  SafeString s("<b>");
  EXPECT_EQ(s.ljust(5).str(), "<b>  ");
  EXPECT_EQ(s.rjust(5, '*').str(), "**<b>");
  EXPECT_EQ(s.ljust(2).str(), "<b>");
  EXPECT_EQ(s.rjust(-1).str(), "<b>");
  EXPECT_EQ(SafeString("\xD0\xB4").ljust(3, ".").str(), "\xD0\xB4..");
}

TEST(PaddingTests, CenterSplitsPaddingUnevenly) {
  EXPECT_EQ(SafeString("abc").center(6, '*').str(), "*abc**");
  EXPECT_EQ(SafeString("ab").center(5, '*').str(), "**ab*");
  EXPECT_EQ(SafeString("ab").center(6).str(), "  ab  ");
}

TEST(PaddingTests, FillMustStayOneCharacterAfterEscaping) {
  EXPECT_THROW(SafeString("x").ljust(4, '<'), std::invalid_argument);
  EXPECT_THROW(SafeString("x").rjust(4, "&"), std::invalid_argument);
  EXPECT_THROW(SafeString("x").center(4, "ab"), std::invalid_argument);
  EXPECT_EQ(SafeString("x").center(3, SafeString("-")).str(), "-x-");
}

TEST(PaddingTests, Zfill) {
  EXPECT_EQ(SafeString("42").zfill(5).str(), "00042");
  EXPECT_EQ(SafeString("-42").zfill(5).str(), "-0042");
  EXPECT_EQ(SafeString("+7").zfill(3).str(), "+07");
  EXPECT_EQ(SafeString("123").zfill(2).str(), "123");
  EXPECT_EQ(SafeString("").zfill(2).str(), "00");
}

TEST(PaddingTests, ExpandTabs) {
  EXPECT_EQ(SafeString("a\tb").expandtabs().str(), "a       b");
  EXPECT_EQ(SafeString("ab\tc\n\td").expandtabs(4).str(), "ab  c\n    d");
  EXPECT_EQ(SafeString("a\tb").expandtabs(0).str(), "ab");
}

// ==================== TRANSLATE / SLICE TESTS ====================

TEST(TranslateTests, ReplacementsAreEscaped) {
  std::map<std::string, Value> table;
  table["a"] = "<";
  table["b"] = Value();
  table["c"] = SafeString("<i>");
  EXPECT_EQ(SafeString("abcd").translate(table).str(), "&lt;<i>d");
}

TEST(TranslateTests, WorksOnCodePoints) {
  std::map<std::string, Value> table;
  table["\xD0\xB4"] = "d";
  EXPECT_EQ(SafeString("\xD0\xB4" "a").translate(table).str(), "da");
}

TEST(SliceTests, CodePointRanges) {
  SafeString s("a\xD0\xB4" "cde");
  EXPECT_EQ(s.slice(1, 3).str(), "\xD0\xB4" "c");
  EXPECT_EQ(s.slice(-2).str(), "de");
  EXPECT_EQ(s.slice(0, -1).str(), "a\xD0\xB4" "cd");
  EXPECT_EQ(s.slice(3, 1).str(), "");
  EXPECT_EQ(s.slice(-100, 100).str(), s.str());
}

TEST(SliceTests, At) {
  SafeString s("a\xD0\xB4" "c");
  EXPECT_EQ(s.at(1).str(), "\xD0\xB4");
  EXPECT_EQ(s.at(-1).str(), "c");
  EXPECT_THROW(s.at(3), std::out_of_range);
  EXPECT_THROW(s.at(-4), std::out_of_range);
}

// ==================== UNESCAPE / STRIPTAGS TESTS ====================

TEST(UnescapeTests, ReturnsPlainText) {
  EXPECT_EQ(SafeString("&lt;test&gt;").unescape(), "<test>");
  EXPECT_EQ(SafeString("Main &raquo; <em>About</em>").unescape(),
            "Main \xC2\xBB <em>About</em>");
  EXPECT_EQ(
      SafeString("jack & tavi are cooler than mike &amp; russ").unescape(),
      "jack & tavi are cooler than mike & russ");
}

TEST(UnescapeTests, RoundTripsEscapedText) {
  const char* samples[] = {"", "<>&'\"", "a<b>c", "&amp; literal",
                           "Россия \"quoted\""};
  for (size_t i = 0; i < sizeof(samples) / sizeof(samples[0]); ++i) {
    EXPECT_EQ(escape(samples[i]).unescape(), samples[i]);
  }
}

TEST(StripTagsTests, TagsBecomeSpaces) {
  EXPECT_EQ(SafeString("<p>Hello<br>World</p>").striptags(), "Hello World");
}

TEST(StripTagsTests, UnescapesAfterStripping) {
  EXPECT_EQ(SafeString("<em>Foo &amp; Bar</em>").striptags(), "Foo & Bar");
  EXPECT_EQ(SafeString("Main &raquo;\t<em>About</em>").striptags(),
            "Main \xC2\xBB About");
  // An escaped tag is text, not a tag.
  EXPECT_EQ(escape("<b>").striptags(), "<b>");
}

TEST(StripTagsTests, Comments) {
  EXPECT_EQ(SafeString("a<!-- <b>hidden</b> -->b").striptags(), "a b");
  // An unterminated comment is left alone.
  EXPECT_EQ(SafeString("a<!-- open").striptags(), "a<!-- open");
}

TEST(StripTagsTests, UnclosedTagIsKept) {
  EXPECT_EQ(SafeString("x <b>y</b> < z").striptags(), "x y < z");
}

TEST(StripTagsTests, WithoutNormalizing) {
  EXPECT_EQ(SafeString("<p>a  b</p>").striptags(false), " a  b ");
}
