#pragma once

#include <stdexcept>
#include <string>

enum ErrorCode {
    ERR_VALIDATION,
    ERR_NOT_FOUND,
    ERR_INVALID_CREDENTIALS,
    ERR_DUPLICATE_USERNAME,
    ERR_MISSING_API_KEY,
    ERR_NETWORK,
    ERR_AI_SERVICE,
    ERR_MALFORMED_QUIZ,
    ERR_STORE,
};

class StudyError : public std::runtime_error {
  public:
    StudyError(ErrorCode code, const std::string &what)
        : std::runtime_error(what), m_Code(code) {}

    ErrorCode Code() const {
        return m_Code;
    }

  private:
    ErrorCode m_Code;
};

const char *ErrorCodeName(ErrorCode code);
