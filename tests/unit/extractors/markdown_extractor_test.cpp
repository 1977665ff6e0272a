#include <gtest/gtest.h>

#include <string>

#include "docqa_core/extractors/markdown_extractor.hpp"

namespace docqa_core {

class MarkdownExtractorTest : public ::testing::Test {
 protected:
  std::string extract(const std::string& markdown) {
    return extractor_.extract({"doc.md", markdown});
  }

  MarkdownExtractor extractor_;
};

TEST_F(MarkdownExtractorTest, Extract_StripsHeadingMarkers) {
  EXPECT_EQ(extract("# Title\n\n## Section\nBody text"), "Title\n\nSection\nBody text");
}

TEST_F(MarkdownExtractorTest, Extract_StripsEmphasisAndInlineCode) {
  EXPECT_EQ(extract("This is **bold**, *italic* and __strong__ with `code`."),
            "This is bold, italic and strong with code.");
}

TEST_F(MarkdownExtractorTest, Extract_KeepsLinkAndImageText) {
  EXPECT_EQ(extract("See [the docs](https://example.com) and ![a diagram](img.png)."),
            "See the docs and a diagram.");
}

TEST_F(MarkdownExtractorTest, Extract_DropsFenceLinesButKeepsCode) {
  EXPECT_EQ(extract("Before\n```cpp\nint x = 1;\n```\nAfter"), "Before\nint x = 1;\nAfter");
}

TEST_F(MarkdownExtractorTest, Extract_StripsBlockquoteMarkers) {
  EXPECT_EQ(extract("> quoted line\nplain"), "quoted line\nplain");
}

TEST_F(MarkdownExtractorTest, Extract_LongEmphasizedLine) {
  const std::string body(100000, 'a');
  EXPECT_EQ(extract("Intro *" + body + "* end"), "Intro " + body + " end");
  EXPECT_EQ(extract("**" + body + "**"), body);
}

TEST_F(MarkdownExtractorTest, Extract_LongLinkAndCodeSpans) {
  const std::string text(100000, 'w');
  EXPECT_EQ(extract("[" + text + "](https://example.com)"), text);
  EXPECT_EQ(extract("`" + text + "`"), text);
}

TEST_F(MarkdownExtractorTest, Extract_LeavesUnmatchedMarkupAlone) {
  const std::string brackets(50000, '[');
  EXPECT_EQ(extract(brackets + "]"), brackets + "]");
  EXPECT_EQ(extract("2 * 3 = 6 and a_b"), "2 * 3 = 6 and a_b");
  EXPECT_EQ(extract("[no url] and `open code"), "[no url] and `open code");
}

TEST_F(MarkdownExtractorTest, Extract_RejectsInvalidUtf8) {
  EXPECT_THROW(extract("bad \xff byte"), ExtractionError);
}

TEST_F(MarkdownExtractorTest, CanHandle_MarkdownExtensionsOnly) {
  EXPECT_TRUE(extractor_.can_handle({"README.md", ""}));
  EXPECT_TRUE(extractor_.can_handle({"guide.markdown", ""}));
  EXPECT_FALSE(extractor_.can_handle({"notes.txt", ""}));
  EXPECT_EQ(extractor_.get_document_type(), DocumentType::Markdown);
}

}  // namespace docqa_core
