#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cstdio>
#include <string>
#include <vector>

#include "docqa_core/extractors/pdf_extractor.hpp"

namespace docqa_core {

using ::testing::HasSubstr;

namespace {

// Writes a minimal PDF with one page per entry (an empty entry is a page with
// no text) and a valid cross-reference table. With `encrypted`, the trailer
// points at a standard security handler whose user password is not empty.
std::string build_pdf(const std::vector<std::string>& page_texts, bool encrypted = false) {
  std::vector<std::string> objects;
  const size_t page_count = page_texts.size();
  const size_t first_page_object = 4;

  std::string kids;
  for (size_t i = 0; i < page_count; ++i) {
    kids += std::to_string(first_page_object + 2 * i) + " 0 R ";
  }

  objects.push_back("<< /Type /Catalog /Pages 2 0 R >>");
  objects.push_back("<< /Type /Pages /Kids [" + kids + "] /Count " + std::to_string(page_count) +
                    " >>");
  objects.push_back("<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica >>");

  for (size_t i = 0; i < page_count; ++i) {
    const size_t content_object = first_page_object + 2 * i + 1;
    objects.push_back("<< /Type /Page /Parent 2 0 R /MediaBox [0 0 612 792] "
                      "/Resources << /Font << /F1 3 0 R >> >> /Contents " +
                      std::to_string(content_object) + " 0 R >>");

    std::string stream;
    if (!page_texts[i].empty()) {
      stream = "BT /F1 12 Tf 72 720 Td (" + page_texts[i] + ") Tj ET";
    }
    objects.push_back("<< /Length " + std::to_string(stream.size()) + " >>\nstream\n" + stream +
                      "\nendstream");
  }

  size_t encrypt_object = 0;
  if (encrypted) {
    objects.push_back("<< /Filter /Standard /V 2 /R 3 /Length 128 /P -3904 "
                      "/O <" + std::string(64, 'a') + "> /U <" + std::string(64, 'b') + "> >>");
    encrypt_object = objects.size();
  }

  std::string pdf = "%PDF-1.4\n";
  std::vector<size_t> offsets;
  for (size_t i = 0; i < objects.size(); ++i) {
    offsets.push_back(pdf.size());
    pdf += std::to_string(i + 1) + " 0 obj\n" + objects[i] + "\nendobj\n";
  }

  const size_t xref_offset = pdf.size();
  pdf += "xref\n0 " + std::to_string(objects.size() + 1) + "\n";
  pdf += "0000000000 65535 f \n";
  for (size_t offset : offsets) {
    char entry[21];
    std::snprintf(entry, sizeof(entry), "%010zu 00000 n \n", offset);
    pdf += entry;
  }

  pdf += "trailer\n<< /Size " + std::to_string(objects.size() + 1) + " /Root 1 0 R";
  if (encrypted) {
    pdf += " /Encrypt " + std::to_string(encrypt_object) + " 0 R";
    pdf += " /ID [<" + std::string(32, '1') + "> <" + std::string(32, '1') + ">]";
  }
  pdf += " >>\nstartxref\n" + std::to_string(xref_offset) + "\n%%EOF\n";
  return pdf;
}

bool is_blank(const std::string& text) {
  return text.find_first_not_of(" \t\r\n\f") == std::string::npos;
}

}  // namespace

class PdfExtractorTest : public ::testing::Test {
 protected:
  PdfExtractor extractor_;
};

TEST_F(PdfExtractorTest, CanHandle_MagicBytesOrExtension) {
  EXPECT_TRUE(extractor_.can_handle({"upload", "%PDF-1.4\n"}));
  EXPECT_TRUE(extractor_.can_handle({"paper.pdf", ""}));
  EXPECT_TRUE(extractor_.can_handle({"https://example.com/paper.pdf?dl=1", "<html>"}));
  EXPECT_FALSE(extractor_.can_handle({"notes.txt", "plain text"}));
  EXPECT_EQ(extractor_.get_document_type(), DocumentType::PDF);
}

TEST_F(PdfExtractorTest, Extract_RejectsBytesThatAreNotAPdf) {
  EXPECT_THROW(extractor_.extract({"fake.pdf", "this is not a pdf at all"}), ExtractionError);
}

TEST_F(PdfExtractorTest, Extract_SinglePage) {
  std::string text = extractor_.extract({"one.pdf", build_pdf({"The capital of France is Paris."})});
  EXPECT_THAT(text, HasSubstr("The capital of France is Paris."));
}

TEST_F(PdfExtractorTest, Extract_JoinsPagesInOrder) {
  std::string text =
      extractor_.extract({"two.pdf", build_pdf({"First page text", "Second page text"})});

  size_t first = text.find("First page text");
  size_t second = text.find("Second page text");
  ASSERT_NE(first, std::string::npos) << text;
  ASSERT_NE(second, std::string::npos) << text;
  EXPECT_LT(first, second);
  EXPECT_NE(text.find('\n', first), std::string::npos);
}

TEST_F(PdfExtractorTest, Extract_BlankPageContributesNoText) {
  std::string text;
  ASSERT_NO_THROW(text = extractor_.extract({"gap.pdf", build_pdf({"Alpha", "", "Omega"})}));

  size_t alpha = text.find("Alpha");
  size_t omega = text.find("Omega");
  ASSERT_NE(alpha, std::string::npos) << text;
  ASSERT_NE(omega, std::string::npos) << text;
  ASSERT_LT(alpha, omega);
  EXPECT_TRUE(is_blank(text.substr(alpha + 5, omega - alpha - 5)));
}

TEST_F(PdfExtractorTest, Extract_PagesWithoutTextYieldBlankText) {
  std::string text;
  ASSERT_NO_THROW(text = extractor_.extract({"scan.pdf", build_pdf({"", ""})}));
  EXPECT_TRUE(is_blank(text));
}

TEST_F(PdfExtractorTest, Extract_RejectsPasswordProtectedPdf) {
  std::string pdf = build_pdf({"Secret contents"}, true);
  ASSERT_EQ(pdf.compare(0, 5, "%PDF-"), 0);
  EXPECT_THROW(extractor_.extract({"locked.pdf", pdf}), ExtractionError);
}

}  // namespace docqa_core
