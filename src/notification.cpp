#include "notification.hpp"

#include <spdlog/spdlog.h>

namespace {
constexpr auto kMinInterval = std::chrono::seconds(2);
constexpr const char *kAppName = "StudyDesk";
} // namespace

// ─────────────────────────────────────
Notification::Notification() {
    DBusError err;
    dbus_error_init(&err);
    m_Conn = dbus_bus_get(DBUS_BUS_SESSION, &err);
    if (dbus_error_is_set(&err)) {
        spdlog::warn("Notifications disabled, no session bus: {}", err.message);
        dbus_error_free(&err);
        m_Conn = nullptr;
        return;
    }
    if (!m_Conn) {
        spdlog::warn("Notifications disabled, no session bus");
        return;
    }
    dbus_connection_set_exit_on_disconnect(m_Conn, FALSE);
}

// ─────────────────────────────────────
Notification::~Notification() {
    if (m_Conn) {
        dbus_connection_unref(m_Conn);
    }
}

// ─────────────────────────────────────
DBusMessage *Notification::BuildNotify(const std::string &icon, const std::string &summary,
                                       const std::string &msg, Urgency urgency,
                                       int32_t timeout_ms) const {
    DBusMessage *m = dbus_message_new_method_call("org.freedesktop.Notifications",
                                                  "/org/freedesktop/Notifications",
                                                  "org.freedesktop.Notifications", "Notify");
    if (!m) {
        return nullptr;
    }

    // Notify(app_name, replaces_id, icon, summary, body, actions, hints, expire_timeout)
    const char *app = kAppName;
    const char *icon_c = icon.c_str();
    const char *summary_c = summary.c_str();
    const char *body_c = msg.c_str();
    const dbus_uint32_t replaces = 0;

    DBusMessageIter args;
    dbus_message_iter_init_append(m, &args);
    dbus_message_iter_append_basic(&args, DBUS_TYPE_STRING, &app);
    dbus_message_iter_append_basic(&args, DBUS_TYPE_UINT32, &replaces);
    dbus_message_iter_append_basic(&args, DBUS_TYPE_STRING, &icon_c);
    dbus_message_iter_append_basic(&args, DBUS_TYPE_STRING, &summary_c);
    dbus_message_iter_append_basic(&args, DBUS_TYPE_STRING, &body_c);

    DBusMessageIter actions;
    dbus_message_iter_open_container(&args, DBUS_TYPE_ARRAY, "s", &actions);
    dbus_message_iter_close_container(&args, &actions);

    // hints: {"urgency": byte}
    DBusMessageIter hints;
    DBusMessageIter entry;
    DBusMessageIter value;
    const char *urgency_key = "urgency";
    const unsigned char level = static_cast<unsigned char>(urgency);
    dbus_message_iter_open_container(&args, DBUS_TYPE_ARRAY, "{sv}", &hints);
    dbus_message_iter_open_container(&hints, DBUS_TYPE_DICT_ENTRY, nullptr, &entry);
    dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &urgency_key);
    dbus_message_iter_open_container(&entry, DBUS_TYPE_VARIANT, "y", &value);
    dbus_message_iter_append_basic(&value, DBUS_TYPE_BYTE, &level);
    dbus_message_iter_close_container(&entry, &value);
    dbus_message_iter_close_container(&hints, &entry);
    dbus_message_iter_close_container(&args, &hints);

    dbus_message_iter_append_basic(&args, DBUS_TYPE_INT32, &timeout_ms);
    return m;
}

// ─────────────────────────────────────
bool Notification::SendNotification(const std::string &icon, const std::string &summary,
                                    const std::string &msg, Urgency urgency,
                                    int32_t timeout_ms) {
    if (!m_Conn) {
        spdlog::debug("'{}' not shown, no session bus", summary);
        return false;
    }

    const auto now = std::chrono::steady_clock::now();
    if (urgency != URGENCY_CRITICAL && now - m_LastSent < kMinInterval) {
        spdlog::debug("'{}' dropped by the rate limit", summary);
        return false;
    }

    DBusMessage *m = BuildNotify(icon, summary, msg, urgency, timeout_ms);
    if (!m) {
        spdlog::error("Failed to create DBus message");
        return false;
    }
    const bool sent = dbus_connection_send(m_Conn, m, nullptr);
    if (sent) {
        dbus_connection_flush(m_Conn);
        m_LastSent = now;
        spdlog::debug("Notification sent: {}", summary);
    } else {
        spdlog::error("Failed to send DBus message");
    }
    dbus_message_unref(m);
    return sent;
}
