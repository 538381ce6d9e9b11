#include <gtest/gtest.h>

#include <atomic>
#include <thread>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "../src/async_request.hpp"
#include "../src/gemini.hpp"

namespace {
nlohmann::json Reply(const std::string &text) {
    return {{"candidates", {{{"content", {{"role", "model"}, {"parts", {{{"text", text}}}}}},
                             {"finishReason", "STOP"}}}}};
}

nlohmann::json QuizJson(int n) {
    nlohmann::json list = nlohmann::json::array();
    for (int i = 0; i < n; i++) {
        list.push_back({{"question_text", "Q" + std::to_string(i)},
                        {"options", {"a", "b", "c", "d"}},
                        {"correct_option_index", i % 4},
                        {"explanation", "because"}});
    }
    return list;
}
} // namespace

// Stands in for the generateContent endpoint on a random local port.
class GeminiTest : public ::testing::Test {
  protected:
    void SetUp() override {
        m_Server.Post(R"(/v1beta/models/([^/]+):generateContent)",
                      [this](const httplib::Request &req, httplib::Response &res) {
                          m_LastKey = req.get_header_value("x-goog-api-key");
                          m_LastBody = nlohmann::json::parse(req.body, nullptr, false);
                          m_Hits++;
                          res.status = m_Status;
                          res.set_content(m_Reply, "application/json");
                      });
        m_Port = m_Server.bind_to_any_port("127.0.0.1");
        ASSERT_GT(m_Port, 0);
        m_Thread = std::thread([this] { m_Server.listen_after_bind(); });
        m_Server.wait_until_ready();
    }

    void TearDown() override {
        m_Server.stop();
        if (m_Thread.joinable()) {
            m_Thread.join();
        }
    }

    Gemini Client(const std::string &key = "test-key") {
        Gemini g("http://127.0.0.1:" + std::to_string(m_Port), "test-model");
        if (!key.empty()) {
            g.SetApiKey(key);
        }
        return g;
    }

    httplib::Server m_Server;
    std::thread m_Thread;
    int m_Port = 0;
    int m_Status = 200;
    std::string m_Reply;
    std::string m_LastKey;
    nlohmann::json m_LastBody;
    std::atomic<int> m_Hits{0};
};

// ─────────────────────────────────────
TEST_F(GeminiTest, ExplainReturnsCandidateText) {
    m_Reply = Reply("  Mitochondria make ATP.  ").dump();
    Gemini g = Client();

    EXPECT_EQ(g.Ask("mitochondria", MODE_EXPLAIN), "Mitochondria make ATP.");
    EXPECT_EQ(m_LastKey, "test-key");
    ASSERT_FALSE(m_LastBody.is_discarded());
    const auto sent = m_LastBody["contents"][0]["parts"][0]["text"].get<std::string>();
    EXPECT_NE(sent.find("mitochondria"), std::string::npos);
}

// ─────────────────────────────────────
TEST_F(GeminiTest, MissingKeyFailsBeforeAnyRequest) {
    m_Reply = Reply("unused").dump();
    Gemini g = Client("");
    EXPECT_FALSE(g.HasApiKey());
    try {
        g.Ask("anything", MODE_SUMMARIZE);
        FAIL() << "expected MissingApiKey";
    } catch (const StudyError &e) {
        EXPECT_EQ(e.Code(), ERR_MISSING_API_KEY);
    }
    EXPECT_EQ(m_Hits.load(), 0);
}

// ─────────────────────────────────────
TEST_F(GeminiTest, EmptyPromptIsValidationError) {
    Gemini g = Client();
    try {
        g.Ask("   ", MODE_EXPLAIN);
        FAIL() << "expected Validation";
    } catch (const StudyError &e) {
        EXPECT_EQ(e.Code(), ERR_VALIDATION);
    }
    EXPECT_EQ(m_Hits.load(), 0);
}

// ─────────────────────────────────────
TEST_F(GeminiTest, InvalidUtf8PromptIsValidationError) {
    Gemini g = Client();
    try {
        g.Ask("caf\xe9", MODE_EXPLAIN);
        FAIL() << "expected Validation";
    } catch (const StudyError &e) {
        EXPECT_EQ(e.Code(), ERR_VALIDATION);
    }

    ChatMessage earlier;
    earlier.role = "user";
    earlier.content = "ok";
    try {
        g.Chat({earlier}, "na\xefve \xff");
        FAIL() << "expected Validation";
    } catch (const StudyError &e) {
        EXPECT_EQ(e.Code(), ERR_VALIDATION);
    }
    EXPECT_EQ(m_Hits.load(), 0);
}

TEST_F(GeminiTest, InvalidUtf8OnWorkerComesBackAsStudyError) {
    Gemini g = Client();
    AsyncRequest<std::string> req([g]() mutable { return g.Ask("r\xe9sum\xe9", MODE_SUMMARIZE); });
    try {
        req.Get();
        FAIL() << "expected Validation";
    } catch (const StudyError &e) {
        EXPECT_EQ(e.Code(), ERR_VALIDATION);
    }
}

// ─────────────────────────────────────
TEST_F(GeminiTest, HttpErrorCarriesServiceMessage) {
    m_Status = 400;
    m_Reply = R"({"error": {"code": 400, "message": "API key not valid"}})";
    Gemini g = Client();
    try {
        g.Ask("x", MODE_EXPLAIN);
        FAIL() << "expected AIServiceError";
    } catch (const StudyError &e) {
        EXPECT_EQ(e.Code(), ERR_AI_SERVICE);
        EXPECT_STREQ(e.what(), "API key not valid");
    }
}

// ─────────────────────────────────────
TEST_F(GeminiTest, ChatSendsHistoryThenMessage) {
    m_Reply = Reply("Sure.").dump();
    std::vector<ChatMessage> history;
    for (int i = 0; i < 30; i++) {
        ChatMessage m;
        m.role = i % 2 == 0 ? "user" : "model";
        m.content = "turn " + std::to_string(i);
        history.push_back(m);
    }

    Gemini g = Client();
    EXPECT_EQ(g.Chat(history, "next question"), "Sure.");

    const auto &contents = m_LastBody["contents"];
    ASSERT_EQ(contents.size(), static_cast<std::size_t>(Gemini::kChatContextMessages + 1));
    EXPECT_EQ(contents[0]["parts"][0]["text"], "turn 10");
    EXPECT_EQ(contents.back()["role"], "user");
    EXPECT_EQ(contents.back()["parts"][0]["text"], "next question");
    EXPECT_TRUE(m_LastBody.contains("systemInstruction"));
}

// ─────────────────────────────────────
TEST_F(GeminiTest, QuizParsedFromSchemaReply) {
    m_Reply = Reply(QuizJson(3).dump()).dump();
    Gemini g = Client();

    auto items = g.GenerateQuiz("cells", 3);
    ASSERT_EQ(items.size(), 3u);
    EXPECT_EQ(items[1].question, "Q1");
    EXPECT_EQ(items[1].correct_index, 1);
    EXPECT_EQ(items[1].choices.size(), 4u);
    EXPECT_TRUE(m_LastBody["generationConfig"].contains("responseSchema"));
}

// ─────────────────────────────────────
TEST_F(GeminiTest, QuizCountOutOfRange) {
    Gemini g = Client();
    EXPECT_THROW(g.GenerateQuiz("cells", 2), StudyError);
    EXPECT_THROW(g.GenerateQuiz("cells", 11), StudyError);
    EXPECT_EQ(m_Hits.load(), 0);
}

// ─────────────────────────────────────
TEST_F(GeminiTest, MalformedQuizReply) {
    m_Reply = Reply("here is your quiz!").dump();
    Gemini g = Client();
    try {
        g.GenerateQuiz("cells", 3);
        FAIL() << "expected MalformedQuiz";
    } catch (const StudyError &e) {
        EXPECT_EQ(e.Code(), ERR_MALFORMED_QUIZ);
    }
}

// ─────────────────────────────────────
TEST_F(GeminiTest, AsyncRequestDeliversResult) {
    m_Reply = Reply("Stay curious.").dump();
    Gemini g = Client();
    AsyncRequest<std::string> req([g]() mutable { return g.Ask("", MODE_QUOTE); });
    ASSERT_TRUE(req.WaitFor(std::chrono::seconds(10)));
    EXPECT_TRUE(req.Ready());
    EXPECT_EQ(req.Get(), "Stay curious.");
}

// ─────────────────────────────────────
TEST_F(GeminiTest, AsyncRequestRethrowsFailure) {
    Gemini g = Client("");
    AsyncRequest<std::string> req([g]() mutable { return g.Ask("hi", MODE_EXPLAIN); });
    EXPECT_THROW(req.Get(), StudyError);
}

TEST(AsyncWorkTest, DrainWaitsForAbandonedWorkers) {
    ASSERT_TRUE(AsyncWork::Drain(std::chrono::seconds(5)));
    {
        AsyncRequest<int> dropped([]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(300));
            return 1;
        });
    }
    EXPECT_GE(AsyncWork::Running(), 1);
    EXPECT_FALSE(AsyncWork::Drain(std::chrono::milliseconds(0)));
    EXPECT_TRUE(AsyncWork::Drain(std::chrono::seconds(5)));
    EXPECT_EQ(AsyncWork::Running(), 0);
}

// ─────────────────────────────────────
TEST(GeminiNetworkTest, UnreachableServiceIsNetworkError) {
    // Port 9 (discard) is closed on test machines.
    Gemini g("http://127.0.0.1:9", "test-model");
    g.SetApiKey("k");
    try {
        g.Ask("hello", MODE_EXPLAIN);
        FAIL() << "expected NetworkError";
    } catch (const StudyError &e) {
        EXPECT_EQ(e.Code(), ERR_NETWORK);
    }
}

// ─────────────────────────────────────
TEST(GeminiParseTest, ExtractText) {
    EXPECT_EQ(Gemini::ExtractText(200, Reply("a").dump()), "a");

    const std::string multi =
        R"({"candidates":[{"content":{"parts":[{"text":"one "},{"text":"two"}]}}]})";
    EXPECT_EQ(Gemini::ExtractText(200, multi), "one two");

    EXPECT_THROW(Gemini::ExtractText(200, "<html>"), StudyError);
    EXPECT_THROW(Gemini::ExtractText(200, R"({"candidates": []})"), StudyError);
    EXPECT_THROW(Gemini::ExtractText(200, R"({"promptFeedback": {"blockReason": "SAFETY"}})"),
                 StudyError);
    EXPECT_THROW(Gemini::ExtractText(503, "unavailable"), StudyError);
}

// ─────────────────────────────────────
TEST(GeminiParseTest, QuizAcceptsFencesAndWrappers) {
    const std::string fenced = "```json\n" + QuizJson(3).dump() + "\n```";
    EXPECT_EQ(Gemini::ParseQuizItems(fenced).size(), 3u);

    const nlohmann::json wrapped = {{"questions", QuizJson(4)}};
    EXPECT_EQ(Gemini::ParseQuizItems(wrapped.dump()).size(), 4u);
}

// ─────────────────────────────────────
TEST(GeminiParseTest, QuizRejectsBadItems) {
    auto expect_malformed = [](const nlohmann::json &j) {
        try {
            Gemini::ParseQuizItems(j.dump());
            ADD_FAILURE() << "accepted " << j.dump();
        } catch (const StudyError &e) {
            EXPECT_EQ(e.Code(), ERR_MALFORMED_QUIZ);
        }
    };

    nlohmann::json q = QuizJson(3);
    q[1]["options"] = {"a", "b", "c"};
    expect_malformed(q);

    q = QuizJson(3);
    q[2]["correct_option_index"] = 4;
    expect_malformed(q);

    q = QuizJson(3);
    q[0].erase("explanation");
    expect_malformed(q);

    q = QuizJson(3);
    q[0]["question_text"] = "";
    expect_malformed(q);

    expect_malformed(nlohmann::json::array());
}

// ─────────────────────────────────────
TEST(GeminiParseTest, QuizJsonKeepsAnswers) {
    auto items = Gemini::ParseQuizItems(QuizJson(3).dump());
    items[0].answer_index = 2;
    const nlohmann::json out = Gemini::QuizItemsToJson(items);
    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out[0]["user_answer_index"], 2);
    EXPECT_TRUE(out[1]["user_answer_index"].is_null());
    EXPECT_EQ(out[2]["correct_option_index"], 2);
}
