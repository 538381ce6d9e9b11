#pragma once

#include <dbus/dbus.h>

#include <chrono>
#include <cstdint>
#include <string>

enum Urgency { URGENCY_LOW = 0, URGENCY_NORMAL = 1, URGENCY_CRITICAL = 2 };

// Desktop notifications through org.freedesktop.Notifications on the session bus. Without a
// bus every call is a logged no-op.
class Notification {
  public:
    Notification();
    ~Notification();

    Notification(const Notification &) = delete;
    Notification &operator=(const Notification &) = delete;

    bool SendNotification(const std::string &icon, const std::string &summary,
                          const std::string &msg, Urgency urgency = URGENCY_NORMAL,
                          int32_t timeout_ms = 5000);

  private:
    DBusMessage *BuildNotify(const std::string &icon, const std::string &summary,
                             const std::string &msg, Urgency urgency, int32_t timeout_ms) const;

    DBusConnection *m_Conn = nullptr;
    std::chrono::steady_clock::time_point m_LastSent{};
};
