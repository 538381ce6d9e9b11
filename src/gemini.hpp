#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common.hpp"
#include "errors.hpp"

enum AIMode { MODE_EXPLAIN, MODE_SUMMARIZE, MODE_QUESTIONS, MODE_QUIZ, MODE_CHAT, MODE_QUOTE };

// Client for the generateContent endpoint. Holds only strings, so a copy can be handed to a
// worker thread.
class Gemini {
  public:
    static constexpr const char *kDefaultBaseUrl = "https://generativelanguage.googleapis.com";
    static constexpr const char *kDefaultModel = "gemini-2.0-flash";
    static constexpr int kChatContextMessages = 20;
    static constexpr int kMinQuizQuestions = 3;
    static constexpr int kMaxQuizQuestions = 10;

    explicit Gemini(const std::string &base_url = kDefaultBaseUrl,
                    const std::string &model = kDefaultModel);

    void SetApiKey(const std::string &key);
    void ClearApiKey();
    bool HasApiKey() const;

    std::string Ask(const std::string &prompt, AIMode mode);
    std::string Chat(const std::vector<ChatMessage> &history, const std::string &message);
    std::vector<QuizItem> GenerateQuiz(const std::string &topic, int count);

    // Pulls the generated text out of a generateContent reply; throws ERR_AI_SERVICE.
    static std::string ExtractText(int status, const std::string &body);
    // Strict: every item needs a question, four options, an index in [0, 3] and an explanation.
    static std::vector<QuizItem> ParseQuizItems(const std::string &text);
    static nlohmann::json QuizItemsToJson(const std::vector<QuizItem> &items);
    static std::string BuildPrompt(AIMode mode, const std::string &input, int count = 0);

  private:
    std::string Generate(const nlohmann::json &body);

    std::string m_BaseUrl;
    std::string m_Model;
    std::string m_ApiKey;
};
