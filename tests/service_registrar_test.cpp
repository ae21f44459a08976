#include "test_common.hpp"
#include "kdeploy/core/Errors.hpp"
#include "kdeploy/service/ServiceRegistrar.hpp"

using namespace kdeploy;
using kdeploy::test::FakeServiceManager;
using kdeploy::test::FakeSystemView;
using kdeploy::test::ScriptedPrompt;
using kdeploy::test::TempDir;

static const char* UNIT_TEMPLATE =
    "[Unit]\n"
    "Description=Pilot Kneeboard\n"
    "\n"
    "[Service]\n"
    "ExecStart=/usr/bin/python3 kneeboard_gui.py\n"
    "WorkingDirectory=/home/pi\n"
    "User=pi\n"
    "Restart=on-failure\n"
    "\n"
    "[Install]\n"
    "WantedBy=graphical.target\n";

// Application directory with entry point and template, plus an empty unit directory
struct Fixture {
    TempDir dir;
    FakeSystemView system;
    DeviceProfile profile;
    FakeServiceManager services;
    ServiceRegistrarSettings settings;

    Fixture() {
        dir.write("app/kneeboard_gui.py", "print('kneeboard')\n");
        dir.write("app/kneeboard.service", UNIT_TEMPLATE);
        std::filesystem::create_directories(dir.path() / "units");

        system.use_real_filesystem = true;
        system.privileged = true;
        system.login = "pi";
        profile.is_target_board = true;
        profile.has_display_session = true;
        profile.service_manager = ServiceManagerKind::Systemd;

        settings.install_directory = dir.path() / "app";
        settings.unit_directory = dir.path() / "units";
        settings.active_probe_ms = 0;
    }

    std::filesystem::path unitPath() const { return dir.path() / "units" / "kneeboard.service"; }
};

static bool throwsPrecondition(Fixture& f, ScriptedPrompt& answers) {
    ServiceRegistrar registrar(f.system, f.profile, f.services, answers.prompt, f.settings);
    try {
        registrar.registerService();
    } catch (const PreconditionError&) {
        return true;
    }
    return false;
}

static int test_requires_privilege() {
    Fixture f;
    f.system.privileged = false;
    ScriptedPrompt answers("y\n");

    ServiceRegistrar registrar(f.system, f.profile, f.services, answers.prompt, f.settings);
    bool threw = false;
    try {
        registrar.registerService();
    } catch (const PreconditionError& e) {
        threw = true;
        EXPECT(std::string(e.what()) == "Please run this tool with sudo.", "sudo message");
        EXPECT(e.remediation() == "sudo kneeboard-setup-service", "sudo remediation");
    }
    EXPECT(threw, "unprivileged run rejected");
    EXPECT(!std::filesystem::exists(f.unitPath()), "no unit written");
    EXPECT(f.services.calls.empty(), "service manager untouched");
    return 0;
}

static int test_requires_entry_point() {
    Fixture f;
    std::filesystem::remove(f.dir.path() / "app" / "kneeboard_gui.py");
    ScriptedPrompt answers("y\n");
    EXPECT(throwsPrecondition(f, answers), "missing entry point rejected");
    EXPECT(!std::filesystem::exists(f.unitPath()), "no unit written");
    return 0;
}

static int test_requires_template() {
    Fixture f;
    std::filesystem::remove(f.dir.path() / "app" / "kneeboard.service");
    ScriptedPrompt answers("y\n");
    EXPECT(throwsPrecondition(f, answers), "missing template rejected");
    EXPECT(f.services.calls.empty(), "service manager untouched");
    return 0;
}

static int test_user_resolution() {
    Fixture f;
    ScriptedPrompt answers("");
    ServiceRegistrar registrar(f.system, f.profile, f.services, answers.prompt, f.settings);
    EXPECT(registrar.resolveUser() == "pi", "login user preferred");

    f.system.login = std::nullopt;
    f.system.session = "root";
    EXPECT(registrar.resolveUser() == "root", "session user fallback");

    f.system.login = std::string();
    EXPECT(registrar.resolveUser() == "root", "empty login ignored");

    f.system.session = std::nullopt;
    bool threw = false;
    try {
        registrar.resolveUser();
    } catch (const PreconditionError&) {
        threw = true;
    }
    EXPECT(threw, "no user at all rejected");
    return 0;
}

static int test_register_and_start() {
    Fixture f;
    f.services.states = {"activating", "active"};
    f.settings.active_probe_ms = 1000;
    ScriptedPrompt answers("y\n");

    ServiceRegistrar registrar(f.system, f.profile, f.services, answers.prompt, f.settings);
    RegistrationResult result = registrar.registerService();

    EXPECT(result.unit_file == f.unitPath(), "unit installed in unit directory");
    std::string unit = kdeploy::test::readText(f.unitPath());
    std::string app = (f.dir.path() / "app").string();
    EXPECT(unit.find("ExecStart=/usr/bin/python3 " + app + "/kneeboard_gui.py\n") != std::string::npos,
           "ExecStart uses absolute entry point");
    EXPECT(unit.find("WorkingDirectory=" + app + "\n") != std::string::npos, "working directory");
    EXPECT(unit.find("User=pi\n") != std::string::npos, "user");
    EXPECT(unit.find("WantedBy=graphical.target\n") != std::string::npos, "install section kept");
    EXPECT(!std::filesystem::exists(f.unitPath().string() + ".tmp"), "staging file gone");

    EXPECT(result.reloaded && result.enabled, "reloaded and enabled");
    EXPECT(f.services.calls[0] == "reload", "reload first");
    EXPECT(f.services.calls[1] == "enable kneeboard.service", "then enable");
    EXPECT(f.services.calls[2] == "start kneeboard.service", "then start");
    EXPECT(result.start.requested && result.start.started, "started");
    EXPECT(result.start.active && result.start.state == "active", "probe saw active");
    return 0;
}

static int test_decline_start() {
    Fixture f;
    ScriptedPrompt answers("n\n");

    ServiceRegistrar registrar(f.system, f.profile, f.services, answers.prompt, f.settings);
    RegistrationResult result = registrar.registerService();

    EXPECT(!result.start.requested, "start not requested");
    EXPECT(f.services.calls.size() == 2, "only reload and enable");
    EXPECT(answers.out.str().find("Do you want to start the kneeboard service now? (y/n): ") != std::string::npos,
           "start offered");
    EXPECT(std::filesystem::exists(f.unitPath()), "unit still installed");
    return 0;
}

static int test_rerun_overwrites() {
    Fixture f;
    f.dir.write("units/kneeboard.service", "stale contents\n");

    ScriptedPrompt first("n\n");
    ServiceRegistrar(f.system, f.profile, f.services, first.prompt, f.settings).registerService();
    std::string once = kdeploy::test::readText(f.unitPath());
    EXPECT(once.find("stale") == std::string::npos, "previous unit replaced");

    ScriptedPrompt second("n\n");
    ServiceRegistrar(f.system, f.profile, f.services, second.prompt, f.settings).registerService();
    EXPECT(kdeploy::test::readText(f.unitPath()) == once, "second run yields the same unit");
    return 0;
}

static int test_manager_failures_not_fatal() {
    Fixture f;
    f.services.reload_ok = false;
    f.services.enable_ok = false;
    f.services.states = {"failed"};
    ScriptedPrompt answers("y\n");

    RegistrationResult result =
        ServiceRegistrar(f.system, f.profile, f.services, answers.prompt, f.settings).registerService();
    EXPECT(!result.reloaded && !result.enabled, "failures reported");
    EXPECT(result.start.started, "start still attempted");
    EXPECT(!result.start.active && result.start.state == "failed", "failed state reported");
    EXPECT(std::filesystem::exists(f.unitPath()), "unit installed");
    return 0;
}

static int test_start_rejected() {
    Fixture f;
    f.services.start_ok = false;
    ScriptedPrompt answers("y\n");

    RegistrationResult result =
        ServiceRegistrar(f.system, f.profile, f.services, answers.prompt, f.settings).registerService();
    EXPECT(result.start.requested && !result.start.started, "start failure reported");
    EXPECT(f.services.calls.back() == "start kneeboard.service", "no state probe after failed start");
    return 0;
}

static int test_requires_systemd() {
    for (auto manager : {ServiceManagerKind::None, ServiceManagerKind::DesktopAutostart}) {
        Fixture f;
        f.profile.service_manager = manager;
        ScriptedPrompt answers("y\n");

        ServiceRegistrar registrar(f.system, f.profile, f.services, answers.prompt, f.settings);
        bool threw = false;
        try {
            registrar.registerService();
        } catch (const PreconditionError& e) {
            threw = true;
            EXPECT(std::string(e.what()).find("No systemd") != std::string::npos, "names the missing manager");
            EXPECT(e.remediation().find("kneeboard-install") != std::string::npos, "points at desktop autostart");
        }
        EXPECT(threw, "device without systemd rejected");
        EXPECT(!std::filesystem::exists(f.unitPath()), "no unit written");
        EXPECT(f.services.calls.empty(), "service manager untouched");
        EXPECT(answers.out.str().empty(), "nothing asked");
    }
    return 0;
}

static int test_summary_follows_enable() {
    RegistrationResult result;
    result.enabled = true;
    std::ostringstream enabled;
    ServiceRegistrar::printSummary(result, "kneeboard.service", enabled);
    EXPECT(enabled.str().find("start automatically on boot") != std::string::npos, "boot autostart announced");

    result.enabled = false;
    std::ostringstream disabled;
    ServiceRegistrar::printSummary(result, "kneeboard.service", disabled);
    EXPECT(disabled.str().find("start automatically on boot") == std::string::npos,
           "no boot claim when enable failed");
    EXPECT(disabled.str().find("sudo systemctl enable kneeboard.service") != std::string::npos,
           "enable command given");
    return 0;
}

int main() {
    if (test_requires_privilege() != 0) return 1;
    if (test_requires_entry_point() != 0) return 1;
    if (test_requires_template() != 0) return 1;
    if (test_user_resolution() != 0) return 1;
    if (test_register_and_start() != 0) return 1;
    if (test_decline_start() != 0) return 1;
    if (test_rerun_overwrites() != 0) return 1;
    if (test_manager_failures_not_fatal() != 0) return 1;
    if (test_start_rejected() != 0) return 1;
    if (test_requires_systemd() != 0) return 1;
    if (test_summary_follows_enable() != 0) return 1;
    printf("service registrar tests passed\n");
    return 0;
}
