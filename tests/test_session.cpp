#include <gtest/gtest.h>

#include "../src/errors.hpp"
#include "../src/session.hpp"

namespace {
User MakeUser() {
    User u;
    u.id = 7;
    u.username = "alice";
    u.password_hash = "$argon2id$...";
    return u;
}
} // namespace

// ─────────────────────────────────────
TEST(ControllerTest, StartsLoggedOut) {
    Controller c;
    EXPECT_EQ(c.Current(), SCREEN_LOGGED_OUT);
    EXPECT_FALSE(c.LoggedIn());
    EXPECT_THROW(c.Active(), StudyError);
    EXPECT_FALSE(c.Navigate(SCREEN_MAIN_MENU));
    EXPECT_FALSE(c.Navigate(SCREEN_SETTINGS));
    EXPECT_FALSE(c.Back());
}

// ─────────────────────────────────────
TEST(ControllerTest, LoginOpensMainMenuWithoutPasswordHash) {
    Controller c;
    c.Login(MakeUser(), "key-1");
    EXPECT_EQ(c.Current(), SCREEN_MAIN_MENU);
    EXPECT_EQ(c.Active().user.username, "alice");
    EXPECT_TRUE(c.Active().user.password_hash.empty());
    EXPECT_EQ(c.Active().api_key, "key-1");

    c.SetApiKey("key-2");
    EXPECT_EQ(c.Active().api_key, "key-2");
}

// ─────────────────────────────────────
TEST(ControllerTest, FeatureScreensOnlyReachableFromMainMenu) {
    Controller c;
    c.Login(MakeUser(), "");

    const Screen features[] = {SCREEN_TASK_MANAGER, SCREEN_STUDY_TRACKER, SCREEN_AI_HELPER,
                               SCREEN_AI_QUIZ,      SCREEN_AI_CHAT,       SCREEN_ANALYTICS,
                               SCREEN_REVIEW_HUB,   SCREEN_SETTINGS};
    for (Screen s : features) {
        ASSERT_TRUE(c.Navigate(s)) << ToString(s);
        EXPECT_EQ(c.Current(), s);
        EXPECT_FALSE(c.Navigate(SCREEN_AI_CHAT == s ? SCREEN_ANALYTICS : SCREEN_AI_CHAT));
        EXPECT_FALSE(c.Navigate(SCREEN_LOGGED_OUT));
        EXPECT_EQ(c.Current(), s);
        ASSERT_TRUE(c.Back());
        EXPECT_EQ(c.Current(), SCREEN_MAIN_MENU);
    }
    EXPECT_FALSE(c.Back());
    EXPECT_FALSE(c.Navigate(SCREEN_MAIN_MENU));
}

// ─────────────────────────────────────
TEST(ControllerTest, LogoutDropsSessionFromAnyScreen) {
    Controller c;
    c.Login(MakeUser(), "key");
    ASSERT_TRUE(c.Navigate(SCREEN_AI_CHAT));
    c.Logout();
    EXPECT_EQ(c.Current(), SCREEN_LOGGED_OUT);
    EXPECT_FALSE(c.LoggedIn());
    EXPECT_FALSE(c.Navigate(SCREEN_TASK_MANAGER));
}

// ─────────────────────────────────────
TEST(ControllerTest, TransitionTable) {
    EXPECT_TRUE(Controller::IsAllowed(SCREEN_MAIN_MENU, SCREEN_REVIEW_HUB));
    EXPECT_TRUE(Controller::IsAllowed(SCREEN_REVIEW_HUB, SCREEN_MAIN_MENU));
    EXPECT_FALSE(Controller::IsAllowed(SCREEN_LOGGED_OUT, SCREEN_MAIN_MENU));
    EXPECT_FALSE(Controller::IsAllowed(SCREEN_AI_QUIZ, SCREEN_AI_CHAT));
    EXPECT_FALSE(Controller::IsAllowed(SCREEN_MAIN_MENU, SCREEN_MAIN_MENU));
}
