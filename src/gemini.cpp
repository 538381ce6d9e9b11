#include "gemini.hpp"
#include "json.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>

namespace {
constexpr const char *kChatInstruction =
    "You are a friendly study assistant. Answer the student's questions clearly and concisely.";

std::string StripCodeFence(const std::string &text) {
    std::string t = Trim(text);
    if (t.rfind("```", 0) != 0) {
        return t;
    }
    const auto first_nl = t.find('\n');
    const auto last_fence = t.rfind("```");
    if (first_nl == std::string::npos || last_fence <= first_nl) {
        return t;
    }
    return Trim(t.substr(first_nl + 1, last_fence - first_nl - 1));
}

nlohmann::json QuizSchema() {
    nlohmann::json item = {
        {"type", "OBJECT"},
        {"properties",
         {
             {"question_text", {{"type", "STRING"}}},
             {"options", {{"type", "ARRAY"}, {"items", {{"type", "STRING"}}}}},
             {"correct_option_index", {{"type", "INTEGER"}}},
             {"explanation", {{"type", "STRING"}}},
         }},
        {"required",
         nlohmann::json::array({"question_text", "options", "correct_option_index", "explanation"})},
    };
    return {{"type", "ARRAY"}, {"items", item}};
}
} // namespace

// ─────────────────────────────────────
Gemini::Gemini(const std::string &base_url, const std::string &model)
    : m_BaseUrl(base_url), m_Model(model) {}

// ─────────────────────────────────────
void Gemini::SetApiKey(const std::string &key) {
    m_ApiKey = Trim(key);
}

// ─────────────────────────────────────
void Gemini::ClearApiKey() {
    m_ApiKey.clear();
}

// ─────────────────────────────────────
bool Gemini::HasApiKey() const {
    return !m_ApiKey.empty();
}

// ─────────────────────────────────────
std::string Gemini::BuildPrompt(AIMode mode, const std::string &input, int count) {
    switch (mode) {
    case MODE_EXPLAIN:
        return "Explain '" + input + "' clearly for a student.";
    case MODE_SUMMARIZE:
        return "Summarize the following for a student:\n\n" + input;
    case MODE_QUESTIONS:
        return "Generate 3-4 open-ended or short factual recall practice questions on '" + input +
               "' for a student. Do not include answers.";
    case MODE_QUIZ:
        return "Generate " + std::to_string(count) + " multiple choice questions on '" + input +
               "'. Each item has 'question_text', 'options' (exactly 4 strings), "
               "'correct_option_index' (integer 0-3) and a short 'explanation'.";
    case MODE_CHAT:
        return input;
    case MODE_QUOTE:
        return "A short, unique, inspiring motivational quote for a student. Concise.";
    }
    return input;
}

// ─────────────────────────────────────
std::string Gemini::Generate(const nlohmann::json &body) {
    if (m_ApiKey.empty()) {
        throw StudyError(ERR_MISSING_API_KEY, "no Gemini API key configured, add one in Settings");
    }

    httplib::Client client(m_BaseUrl);
    client.set_default_headers({
        {"x-goog-api-key", m_ApiKey},
    });
    client.set_connection_timeout(10, 0);
    client.set_read_timeout(30, 0);
    client.set_write_timeout(30, 0);

    const std::string path = "/v1beta/models/" + m_Model + ":generateContent";
    spdlog::debug("POST {}{}", m_BaseUrl, path);

    std::string payload;
    try {
        payload = body.dump();
    } catch (const nlohmann::json::exception &e) {
        spdlog::warn("Gemini request body rejected: {}", e.what());
        throw StudyError(ERR_VALIDATION, "text contains characters that are not valid UTF-8");
    }

    auto res = client.Post(path.c_str(), payload, "application/json");
    if (!res) {
        const std::string reason = httplib::to_string(res.error());
        spdlog::error("Gemini request failed: {}", reason);
        throw StudyError(ERR_NETWORK, "could not reach the AI service: " + reason);
    }

    spdlog::debug("Gemini replied HTTP {}", res->status);
    return ExtractText(res->status, res->body);
}

// ─────────────────────────────────────
std::string Gemini::ExtractText(int status, const std::string &body) {
    JsonParse parse;
    const auto payload = nlohmann::json::parse(body, nullptr, false);

    if (status < 200 || status >= 300) {
        std::string message = "HTTP " + std::to_string(status);
        if (!payload.is_discarded()) {
            auto err = parse.Find(payload, {"error", "message"});
            if (err && err->is_string()) {
                message = err->get<std::string>();
            }
        }
        spdlog::error("Gemini API error: {}", message);
        throw StudyError(ERR_AI_SERVICE, message);
    }

    if (payload.is_discarded() || !payload.is_object()) {
        spdlog::error("Gemini API returned a body that is not JSON");
        throw StudyError(ERR_AI_SERVICE, "malformed response from the AI service");
    }

    auto parts = parse.Find(payload, {"candidates", 0, "content", "parts"});
    if (parts && parts->is_array()) {
        std::string text;
        for (const auto &part : *parts) {
            text += parse.GetString(part, "text", "");
        }
        if (!Trim(text).empty()) {
            return Trim(text);
        }
    }

    auto blocked = parse.Find(payload, {"promptFeedback", "blockReason"});
    if (blocked && blocked->is_string()) {
        spdlog::warn("Gemini blocked the prompt: {}", blocked->get<std::string>());
        throw StudyError(ERR_AI_SERVICE, "request blocked: " + blocked->get<std::string>());
    }

    auto finish = parse.Find(payload, {"candidates", 0, "finishReason"});
    const std::string reason = finish && finish->is_string() ? finish->get<std::string>() : "";
    spdlog::error("Gemini response carried no text {}", reason);
    throw StudyError(ERR_AI_SERVICE, reason.empty() ? "the AI service returned no text"
                                                    : "the AI service returned no text (" +
                                                          reason + ")");
}

// ─────────────────────────────────────
std::string Gemini::Ask(const std::string &prompt, AIMode mode) {
    if (mode != MODE_QUOTE && Trim(prompt).empty()) {
        throw StudyError(ERR_VALIDATION, "please enter some text first");
    }
    if (mode == MODE_QUIZ) {
        return QuizItemsToJson(GenerateQuiz(prompt, kMinQuizQuestions + 2)).dump(2);
    }

    nlohmann::json body;
    body["contents"] = nlohmann::json::array(
        {{{"role", "user"}, {"parts", {{{"text", BuildPrompt(mode, Trim(prompt))}}}}}});
    if (mode == MODE_CHAT) {
        body["systemInstruction"] = {{"parts", {{{"text", kChatInstruction}}}}};
    }
    return Generate(body);
}

// ─────────────────────────────────────
std::string Gemini::Chat(const std::vector<ChatMessage> &history, const std::string &message) {
    if (Trim(message).empty()) {
        throw StudyError(ERR_VALIDATION, "please type a message");
    }

    nlohmann::json contents = nlohmann::json::array();
    const std::size_t first =
        history.size() > static_cast<std::size_t>(kChatContextMessages)
            ? history.size() - static_cast<std::size_t>(kChatContextMessages)
            : 0;
    for (std::size_t i = first; i < history.size(); i++) {
        const auto &m = history[i];
        contents.push_back(
            {{"role", m.role == "model" ? "model" : "user"}, {"parts", {{{"text", m.content}}}}});
    }
    contents.push_back({{"role", "user"}, {"parts", {{{"text", Trim(message)}}}}});

    nlohmann::json body;
    body["contents"] = contents;
    body["systemInstruction"] = {{"parts", {{{"text", kChatInstruction}}}}};
    return Generate(body);
}

// ─────────────────────────────────────
std::vector<QuizItem> Gemini::GenerateQuiz(const std::string &topic, int count) {
    if (Trim(topic).empty()) {
        throw StudyError(ERR_VALIDATION, "please enter a quiz topic");
    }
    if (count < kMinQuizQuestions || count > kMaxQuizQuestions) {
        throw StudyError(ERR_VALIDATION, "number of questions must be between " +
                                             std::to_string(kMinQuizQuestions) + " and " +
                                             std::to_string(kMaxQuizQuestions));
    }

    nlohmann::json body;
    body["contents"] = nlohmann::json::array(
        {{{"role", "user"}, {"parts", {{{"text", BuildPrompt(MODE_QUIZ, Trim(topic), count)}}}}}});
    body["generationConfig"] = {
        {"responseMimeType", "application/json"},
        {"responseSchema", QuizSchema()},
    };

    const std::string text = Generate(body);
    auto items = ParseQuizItems(text);
    spdlog::info("quiz on '{}' generated with {} question(s)", Trim(topic), items.size());
    return items;
}

// ─────────────────────────────────────
std::vector<QuizItem> Gemini::ParseQuizItems(const std::string &text) {
    const auto payload = nlohmann::json::parse(StripCodeFence(text), nullptr, false);
    if (payload.is_discarded()) {
        throw StudyError(ERR_MALFORMED_QUIZ, "quiz response is not valid JSON");
    }

    // Some replies wrap the list in an object.
    const nlohmann::json *list = &payload;
    if (payload.is_object()) {
        for (const char *key : {"questions", "quiz", "items"}) {
            if (payload.contains(key)) {
                list = &payload.at(key);
                break;
            }
        }
    }
    if (!list->is_array() || list->empty()) {
        throw StudyError(ERR_MALFORMED_QUIZ, "quiz response holds no questions");
    }

    std::vector<QuizItem> items;
    int n = 0;
    for (const auto &entry : *list) {
        n++;
        const std::string where = "question " + std::to_string(n);
        if (!entry.is_object()) {
            throw StudyError(ERR_MALFORMED_QUIZ, where + " is not an object");
        }

        QuizItem item;
        const auto q = entry.find("question_text");
        if (q == entry.end() || !q->is_string() || Trim(q->get<std::string>()).empty()) {
            throw StudyError(ERR_MALFORMED_QUIZ, where + " has no question text");
        }
        item.question = Trim(q->get<std::string>());

        const auto opts = entry.find("options");
        if (opts == entry.end() || !opts->is_array() || opts->size() != 4) {
            throw StudyError(ERR_MALFORMED_QUIZ, where + " must have exactly 4 options");
        }
        for (const auto &opt : *opts) {
            if (!opt.is_string()) {
                throw StudyError(ERR_MALFORMED_QUIZ, where + " has a non-text option");
            }
            item.choices.push_back(opt.get<std::string>());
        }

        const auto idx = entry.find("correct_option_index");
        if (idx == entry.end() || !idx->is_number_integer()) {
            throw StudyError(ERR_MALFORMED_QUIZ, where + " has no correct option index");
        }
        const auto correct = idx->get<int64_t>();
        if (correct < 0 || correct > 3) {
            throw StudyError(ERR_MALFORMED_QUIZ, where + " has an out of range option index");
        }
        item.correct_index = static_cast<int>(correct);

        const auto expl = entry.find("explanation");
        if (expl == entry.end() || !expl->is_string()) {
            throw StudyError(ERR_MALFORMED_QUIZ, where + " has no explanation");
        }
        item.explanation = expl->get<std::string>();

        items.push_back(item);
    }
    return items;
}

// ─────────────────────────────────────
nlohmann::json Gemini::QuizItemsToJson(const std::vector<QuizItem> &items) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto &item : items) {
        nlohmann::json j;
        j["question_text"] = item.question;
        j["options"] = item.choices;
        j["correct_option_index"] = item.correct_index;
        j["explanation"] = item.explanation;
        j["user_answer_index"] =
            item.answer_index ? nlohmann::json(*item.answer_index) : nlohmann::json(nullptr);
        out.push_back(j);
    }
    return out;
}
