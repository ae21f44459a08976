#include "kdeploy/platform/ServiceManager.hpp"

#include <gio/gio.h>

#include <iostream>

namespace kdeploy {

namespace {

constexpr const char* SYSTEMD_BUS_NAME = "org.freedesktop.systemd1";
constexpr const char* SYSTEMD_OBJECT_PATH = "/org/freedesktop/systemd1";
constexpr const char* SYSTEMD_MANAGER_INTERFACE = "org.freedesktop.systemd1.Manager";
constexpr const char* SYSTEMD_UNIT_INTERFACE = "org.freedesktop.systemd1.Unit";

// Long enough for a daemon-reload on a slow SD card
constexpr int CALL_TIMEOUT_MS = 25000;

} // namespace

SystemdServiceManager::SystemdServiceManager() {
    GError* error = nullptr;
    GDBusConnection* conn = g_bus_get_sync(G_BUS_TYPE_SYSTEM, nullptr, &error);

    if (error) {
        last_error_ = std::string("cannot connect to the system bus: ") + error->message;
        std::cerr << "[systemd] " << last_error_ << std::endl;
        g_error_free(error);
    } else {
        connection_ = conn;
    }
}

SystemdServiceManager::~SystemdServiceManager() {
    if (connection_) {
        g_object_unref(static_cast<GDBusConnection*>(connection_));
        connection_ = nullptr;
    }
}

void* SystemdServiceManager::callManager(const char* method, void* parameters, const char* reply_type) {
    if (!connection_) {
        if (parameters) {
            g_variant_unref(g_variant_ref_sink(static_cast<GVariant*>(parameters)));
        }
        last_error_ = "not connected to the system bus";
        return nullptr;
    }

    GError* error = nullptr;
    GVariant* reply = g_dbus_connection_call_sync(
        static_cast<GDBusConnection*>(connection_),
        SYSTEMD_BUS_NAME,
        SYSTEMD_OBJECT_PATH,
        SYSTEMD_MANAGER_INTERFACE,
        method,
        static_cast<GVariant*>(parameters),
        reply_type ? G_VARIANT_TYPE(reply_type) : nullptr,
        G_DBUS_CALL_FLAGS_NONE,
        CALL_TIMEOUT_MS,
        nullptr,
        &error
    );

    if (error) {
        last_error_ = std::string(method) + ": " + error->message;
        g_error_free(error);
        return nullptr;
    }
    return reply;
}

bool SystemdServiceManager::reload() {
    GVariant* reply = static_cast<GVariant*>(callManager("Reload", nullptr, nullptr));
    if (!reply) return false;
    g_variant_unref(reply);
    return true;
}

bool SystemdServiceManager::enable(const std::string& unit) {
    const gchar* files[] = {unit.c_str(), nullptr};

    // runtime=false (persist in /etc), force=true (replace stale symlinks)
    GVariant* parameters = g_variant_new("(^asbb)", files, FALSE, TRUE);
    GVariant* reply = static_cast<GVariant*>(
        callManager("EnableUnitFiles", parameters, "(ba(sss))"));
    if (!reply) return false;
    g_variant_unref(reply);
    return true;
}

bool SystemdServiceManager::start(const std::string& unit) {
    GVariant* parameters = g_variant_new("(ss)", unit.c_str(), "replace");
    GVariant* reply = static_cast<GVariant*>(callManager("StartUnit", parameters, "(o)"));
    if (!reply) return false;
    g_variant_unref(reply);
    return true;
}

std::string SystemdServiceManager::unitPath(const std::string& unit) {
    // GetUnit only knows loaded units; LoadUnit loads it on demand
    for (const char* method : {"GetUnit", "LoadUnit"}) {
        GVariant* reply = static_cast<GVariant*>(
            callManager(method, g_variant_new("(s)", unit.c_str()), "(o)"));
        if (!reply) continue;

        const gchar* path = nullptr;
        g_variant_get(reply, "(&o)", &path);
        std::string result = path ? path : "";
        g_variant_unref(reply);
        return result;
    }
    return "";
}

std::string SystemdServiceManager::activeState(const std::string& unit) {
    std::string path = unitPath(unit);
    if (path.empty()) {
        return "";
    }

    GError* error = nullptr;
    GVariant* reply = g_dbus_connection_call_sync(
        static_cast<GDBusConnection*>(connection_),
        SYSTEMD_BUS_NAME,
        path.c_str(),
        "org.freedesktop.DBus.Properties",
        "Get",
        g_variant_new("(ss)", SYSTEMD_UNIT_INTERFACE, "ActiveState"),
        G_VARIANT_TYPE("(v)"),
        G_DBUS_CALL_FLAGS_NONE,
        CALL_TIMEOUT_MS,
        nullptr,
        &error
    );

    if (error) {
        last_error_ = std::string("ActiveState: ") + error->message;
        g_error_free(error);
        return "";
    }

    GVariant* value = nullptr;
    g_variant_get(reply, "(v)", &value);

    std::string state;
    if (value && g_variant_is_of_type(value, G_VARIANT_TYPE_STRING)) {
        state = g_variant_get_string(value, nullptr);
    }

    if (value) g_variant_unref(value);
    g_variant_unref(reply);
    return state;
}

} // namespace kdeploy
