#pragma once

#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <random>
#include <string>

#include "../src/auth.hpp"
#include "../src/repository.hpp"
#include "../src/sqlite.hpp"

// Fresh database in its own temp directory, with one registered user.
class StoreTest : public ::testing::Test {
  protected:
    void SetUp() override {
        std::random_device rd;
        m_Dir = std::filesystem::temp_directory_path() /
                ("studydesk_test_" + std::to_string(rd()) + "_" + std::to_string(rd()));
        std::filesystem::create_directories(m_Dir);

        m_Db = std::make_unique<SQLite>((m_Dir / "studydesk.sqlite").string());
        m_Repo = std::make_unique<Repository>(*m_Db);
        m_Auth = std::make_unique<AuthService>(*m_Db);
        m_User = m_Auth->Register("alice", "secret123");
    }

    void TearDown() override {
        m_Auth.reset();
        m_Repo.reset();
        m_Db.reset();
        std::error_code ec;
        std::filesystem::remove_all(m_Dir, ec);
    }

    int64_t Owner() const {
        return m_User.id;
    }

    std::filesystem::path m_Dir;
    std::unique_ptr<SQLite> m_Db;
    std::unique_ptr<Repository> m_Repo;
    std::unique_ptr<AuthService> m_Auth;
    User m_User;
};

#define EXPECT_STUDY_ERROR(stmt, code)                                                             \
    do {                                                                                           \
        try {                                                                                      \
            stmt;                                                                                  \
            ADD_FAILURE() << "expected " << ErrorCodeName(code);                                   \
        } catch (const StudyError &e) {                                                            \
            EXPECT_EQ(e.Code(), code) << e.what();                                                 \
        }                                                                                          \
    } while (0)
