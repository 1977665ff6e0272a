#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "docqa_cli/cli_handler.hpp"

namespace docqa_cli {

namespace {

// argv-style view over a list of strings
class Args {
 public:
  Args(std::initializer_list<std::string> args) : storage_(args) {
    storage_.insert(storage_.begin(), "docqa");
    for (auto& arg : storage_) {
      pointers_.push_back(arg.data());
    }
  }

  int argc() const {
    return static_cast<int>(pointers_.size());
  }
  char** argv() {
    return pointers_.data();
  }

 private:
  std::vector<std::string> storage_;
  std::vector<char*> pointers_;
};

}  // namespace

class CliHandlerTest : public ::testing::Test {
 protected:
  CliOptions parse(std::initializer_list<std::string> list) {
    Args args(list);
    return handler_.parse_arguments(args.argc(), args.argv());
  }

  CliHandler handler_{"http://127.0.0.1:8000"};
};

TEST_F(CliHandlerTest, NoArgumentsShowsHelp) {
  CliOptions options = parse({});
  EXPECT_EQ(options.command, Command::Help);
  EXPECT_EQ(options.api_base_url, "http://127.0.0.1:8000");
}

TEST_F(CliHandlerTest, ParsesUploadWithMultipleFiles) {
  CliOptions options = parse({"upload", "a.pdf", "b.txt"});
  EXPECT_EQ(options.command, Command::Upload);
  EXPECT_EQ(options.file_paths, (std::vector<std::string>{"a.pdf", "b.txt"}));
}

TEST_F(CliHandlerTest, UploadWithoutFilesThrows) {
  EXPECT_THROW(parse({"upload"}), CliError);
}

TEST_F(CliHandlerTest, ParsesUrl) {
  CliOptions options = parse({"url", "https://example.com/doc.pdf"});
  EXPECT_EQ(options.command, Command::Url);
  EXPECT_EQ(options.url, "https://example.com/doc.pdf");
}

TEST_F(CliHandlerTest, UrlRequiresExactlyOneArgument) {
  EXPECT_THROW(parse({"url"}), CliError);
  EXPECT_THROW(parse({"url", "https://a", "https://b"}), CliError);
}

TEST_F(CliHandlerTest, AskJoinsQuestionWords) {
  CliOptions options = parse({"ask", "What", "is", "the", "capital?"});
  EXPECT_EQ(options.command, Command::Ask);
  EXPECT_EQ(options.question, "What is the capital?");
}

TEST_F(CliHandlerTest, AskWithoutQuestionThrows) {
  EXPECT_THROW(parse({"ask"}), CliError);
  EXPECT_THROW(parse({"ask", "  "}), CliError);
}

TEST_F(CliHandlerTest, ParsesStatusAndHelp) {
  EXPECT_EQ(parse({"status"}).command, Command::Status);
  EXPECT_EQ(parse({"help"}).command, Command::Help);
  EXPECT_EQ(parse({"--help"}).command, Command::Help);
  EXPECT_EQ(parse({"-h"}).command, Command::Help);
}

TEST_F(CliHandlerTest, GlobalOptionsMayAppearAnywhere) {
  CliOptions options = parse({"ask", "--api-url", "http://remote:9000", "hello", "-v"});
  EXPECT_EQ(options.command, Command::Ask);
  EXPECT_EQ(options.question, "hello");
  EXPECT_EQ(options.api_base_url, "http://remote:9000");
  EXPECT_TRUE(options.verbose);
}

TEST_F(CliHandlerTest, ApiUrlWithoutValueThrows) {
  EXPECT_THROW(parse({"status", "--api-url"}), CliError);
}

TEST_F(CliHandlerTest, UnknownCommandThrows) {
  EXPECT_THROW(parse({"search", "query"}), CliError);
}

TEST_F(CliHandlerTest, BuildUrlJoinsEndpoint) {
  EXPECT_EQ(handler_.build_url("/status"), "http://127.0.0.1:8000/status");

  handler_.set_api_base_url("http://127.0.0.1:8000/");
  EXPECT_EQ(handler_.build_url("/ask_question/"), "http://127.0.0.1:8000/ask_question/");
  EXPECT_EQ(handler_.get_api_base_url(), "http://127.0.0.1:8000/");
}

}  // namespace docqa_cli
