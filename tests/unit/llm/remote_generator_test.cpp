#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <nlohmann/json.hpp>

#include "../../common/mocks_test.hpp"
#include "docqa_core/llm/remote_generator.hpp"

namespace docqa_core {

using docqa_tests::MockHttpClient;
using ::testing::_;
using ::testing::Contains;
using ::testing::Eq;
using ::testing::Invoke;
using ::testing::Not;
using ::testing::Return;
using ::testing::Throw;

class RemoteAnswerGeneratorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    http_client_ = std::make_shared<MockHttpClient>();
    prompt_.text = "full prompt";
    prompt_.question = "What is the capital of France?";
    prompt_.context = "[1] (source: france.txt)\nThe capital of France is Paris.";
  }

  std::shared_ptr<MockHttpClient> http_client_;
  Prompt prompt_;
};

TEST_F(RemoteAnswerGeneratorTest, PostsQueryAndReturnsAnswer) {
  RemoteAnswerGenerator generator(http_client_, "https://answers.example.com", "secret", 5000);

  EXPECT_CALL(*http_client_, post_json(Eq("https://answers.example.com/query"), _,
                                       Contains("Authorization: Bearer secret"), Eq(5000)))
      .WillOnce(Invoke([](const std::string&, const std::string& body,
                          const std::vector<std::string>&, long) {
        auto request = nlohmann::json::parse(body);
        EXPECT_EQ(request["query"], "What is the capital of France?");
        EXPECT_EQ(request["documents"],
                  "[1] (source: france.txt)\nThe capital of France is Paris.");
        EXPECT_EQ(request["prompt"], "full prompt");
        return HttpResponse{200, R"({"answer": "Paris"})"};
      }));

  EXPECT_EQ(generator.generate(prompt_), "Paris");
}

TEST_F(RemoteAnswerGeneratorTest, AcceptsBaseUrlWithTrailingSlash) {
  RemoteAnswerGenerator generator(http_client_, "http://localhost:9000/", "", 5000);

  EXPECT_CALL(*http_client_, post_json(Eq("http://localhost:9000/query"), _,
                                       Not(Contains(::testing::StartsWith("Authorization"))), _))
      .WillOnce(Return(HttpResponse{200, R"({"answer": "ok"})"}));

  EXPECT_EQ(generator.generate(prompt_), "ok");
}

TEST_F(RemoteAnswerGeneratorTest, MissingAnswerFieldYieldsPlaceholder) {
  RemoteAnswerGenerator generator(http_client_, "http://svc", "t", 5000);
  EXPECT_CALL(*http_client_, post_json(_, _, _, _))
      .WillOnce(Return(HttpResponse{200, R"({"result": "Paris"})"}));

  EXPECT_EQ(generator.generate(prompt_), RemoteAnswerGenerator::NO_ANSWER);
}

TEST_F(RemoteAnswerGeneratorTest, NonSuccessStatusIsGenerationError) {
  RemoteAnswerGenerator generator(http_client_, "http://svc", "t", 5000);
  EXPECT_CALL(*http_client_, post_json(_, _, _, _))
      .WillOnce(Return(HttpResponse{503, "overloaded"}));

  EXPECT_THROW(generator.generate(prompt_), GenerationError);
}

TEST_F(RemoteAnswerGeneratorTest, TimeoutIsGenerationError) {
  RemoteAnswerGenerator generator(http_client_, "http://svc", "t", 100);
  EXPECT_CALL(*http_client_, post_json(_, _, _, _))
      .WillOnce(Throw(HttpError("Timeout was reached", true)));

  try {
    generator.generate(prompt_);
    FAIL() << "Expected GenerationError";
  } catch (const GenerationError& e) {
    EXPECT_THAT(std::string(e.what()), ::testing::HasSubstr("timed out"));
  }
}

TEST_F(RemoteAnswerGeneratorTest, TransportErrorIsGenerationError) {
  RemoteAnswerGenerator generator(http_client_, "http://svc", "t", 5000);
  EXPECT_CALL(*http_client_, post_json(_, _, _, _))
      .WillOnce(Throw(HttpError("Couldn't connect to server")));

  EXPECT_THROW(generator.generate(prompt_), GenerationError);
}

TEST_F(RemoteAnswerGeneratorTest, MalformedBodyIsGenerationError) {
  RemoteAnswerGenerator generator(http_client_, "http://svc", "t", 5000);
  EXPECT_CALL(*http_client_, post_json(_, _, _, _))
      .WillOnce(Return(HttpResponse{200, "not json"}))
      .WillOnce(Return(HttpResponse{200, "[\"Paris\"]"}));

  EXPECT_THROW(generator.generate(prompt_), GenerationError);
  EXPECT_THROW(generator.generate(prompt_), GenerationError);
}

}  // namespace docqa_core
