#include "test_common.hpp"
#include "kdeploy/launch/ProcessLauncher.hpp"

#include <csignal>

using namespace kdeploy;
using kdeploy::test::FakeDisplayManager;
using kdeploy::test::FakeProcessSpawner;

static LaunchSettings settings() {
    LaunchSettings s;
    s.app_command = {"/usr/bin/python3", "/opt/kneeboard/kneeboard_gui.py"};
    s.framebuffer_command = {"xvfb-run", "-a"};
    s.headless_variable = "HEADLESS";
    s.working_directory = "/opt/kneeboard";
    return s;
}

static DeviceProfile profileWithDisplay(bool display) {
    DeviceProfile profile;
    profile.is_target_board = true;
    profile.has_display_session = display;
    return profile;
}

static int test_headless_uses_framebuffer() {
    // Every headless profile, whatever else it says, gets the framebuffer
    for (bool board : {true, false}) {
        for (auto manager : {ServiceManagerKind::Systemd, ServiceManagerKind::None,
                             ServiceManagerKind::DesktopAutostart}) {
            DeviceProfile profile = profileWithDisplay(false);
            profile.is_target_board = board;
            profile.service_manager = manager;

            EXPECT(ProcessLauncher::selectStrategy(profile) == LaunchStrategy::VirtualFramebuffer,
                   "headless selects framebuffer");

            FakeDisplayManager display;
            FakeProcessSpawner spawner;
            DisplayController controller(display, profile, "HDMI-1");
            ProcessLauncher launcher(controller, spawner, profile, settings());
            launcher.run();

            EXPECT(spawner.commands.size() == 1, "one launch");
            const LaunchCommand& command = spawner.commands[0];
            EXPECT(command.argv.size() == 4, "wrapper plus app");
            EXPECT(command.argv[0] == "xvfb-run" && command.argv[1] == "-a", "wrapped in xvfb-run -a");
            EXPECT(command.argv[2] == "/usr/bin/python3", "runtime after wrapper");
            EXPECT(command.environment.count("HEADLESS") && command.environment.at("HEADLESS") == "1",
                   "HEADLESS=1 for the child");
            EXPECT(display.calls.empty(), "no display calls when headless");
        }
    }
    return 0;
}

static int test_direct_with_display() {
    FakeDisplayManager display;
    display.outputs["HDMI-1"] = DisplayOutcome::Applied;
    FakeProcessSpawner spawner;
    DeviceProfile profile = profileWithDisplay(true);

    DisplayController controller(display, profile, "HDMI-1");
    ProcessLauncher launcher(controller, spawner, profile, settings());

    spawner.during_run = [&]() {
        // Rotated before the child starts, not yet restored
        if (display.countCalls(Orientation::Rotated) != 1 || display.countCalls(Orientation::Normal) != 0) {
            spawner.result.code = -1;
        }
    };

    EXPECT(launcher.state() == LaunchState::Idle, "starts idle");
    ExitStatus status = launcher.run();

    EXPECT(status.code == 0, "display rotated before launch");
    EXPECT(launcher.state() == LaunchState::Exited, "ends exited");
    EXPECT(spawner.commands[0].argv.size() == 2, "direct execution");
    EXPECT(spawner.commands[0].environment.empty(), "no HEADLESS when headed");
    EXPECT(spawner.commands[0].working_directory == "/opt/kneeboard", "working directory passed");
    EXPECT(display.countCalls(Orientation::Normal) == 1, "restored once after clean exit");
    return 0;
}

static int test_restore_after_nonzero_exit() {
    FakeDisplayManager display;
    display.outputs["HDMI-1"] = DisplayOutcome::Applied;
    FakeProcessSpawner spawner;
    spawner.result.code = 3;
    DeviceProfile profile = profileWithDisplay(true);

    DisplayController controller(display, profile, "HDMI-1");
    ProcessLauncher launcher(controller, spawner, profile, settings());
    ExitStatus status = launcher.run();

    EXPECT(status.shellStatus() == 3, "exit status echoed");
    EXPECT(display.countCalls(Orientation::Normal) == 1, "restored once after failure exit");
    EXPECT(spawner.commands.size() == 1, "crashed app not restarted");
    return 0;
}

static int test_restore_after_interrupt() {
    FakeDisplayManager display;
    display.outputs["HDMI-1"] = DisplayOutcome::Applied;
    FakeProcessSpawner spawner;
    spawner.result.signal = SIGINT;
    spawner.result.interrupted = true;
    DeviceProfile profile = profileWithDisplay(true);

    DisplayController controller(display, profile, "HDMI-1");
    ProcessLauncher launcher(controller, spawner, profile, settings());
    ExitStatus status = launcher.run();

    EXPECT(status.shellStatus() == 128 + SIGINT, "interrupt status is 130");
    EXPECT(display.countCalls(Orientation::Normal) == 1, "restored once after interrupt");
    return 0;
}

static int test_restore_when_spawn_fails() {
    FakeDisplayManager display;
    display.outputs["HDMI-1"] = DisplayOutcome::Applied;
    FakeProcessSpawner spawner;
    spawner.throw_on_run = true;
    DeviceProfile profile = profileWithDisplay(true);

    DisplayController controller(display, profile, "HDMI-1");
    ProcessLauncher launcher(controller, spawner, profile, settings());

    bool threw = false;
    try {
        launcher.run();
    } catch (const std::system_error&) {
        threw = true;
    }
    EXPECT(threw, "spawn failure propagates");
    EXPECT(display.countCalls(Orientation::Normal) == 1, "restored once after spawn failure");
    EXPECT(launcher.state() == LaunchState::Exited, "exited after failure");
    return 0;
}

static int test_no_restore_headless() {
    FakeDisplayManager display;
    FakeProcessSpawner spawner;
    spawner.result.code = 1;
    DeviceProfile profile = profileWithDisplay(false);

    DisplayController controller(display, profile, "HDMI-1");
    ProcessLauncher launcher(controller, spawner, profile, settings());
    launcher.run();

    EXPECT(display.countCalls(Orientation::Normal) == 0, "no restore without a display session");
    return 0;
}

static int test_run_once() {
    FakeDisplayManager display;
    FakeProcessSpawner spawner;
    DeviceProfile profile = profileWithDisplay(false);

    DisplayController controller(display, profile, "HDMI-1");
    ProcessLauncher launcher(controller, spawner, profile, settings());
    launcher.run();

    bool threw = false;
    try {
        launcher.run();
    } catch (const std::logic_error&) {
        threw = true;
    }
    EXPECT(threw, "second run rejected");
    EXPECT(spawner.commands.size() == 1, "app launched once");
    return 0;
}

static int test_posix_spawner_exit_codes() {
    PosixProcessSpawner spawner;

    LaunchCommand ok;
    ok.argv = {"/bin/sh", "-c", "exit 0"};
    EXPECT(spawner.run(ok).shellStatus() == 0, "clean exit");

    LaunchCommand failing;
    failing.argv = {"/bin/sh", "-c", "exit 7"};
    EXPECT(spawner.run(failing).code == 7, "exit code reported");

    LaunchCommand env;
    env.argv = {"/bin/sh", "-c", "test \"$HEADLESS\" = 1"};
    env.environment["HEADLESS"] = "1";
    EXPECT(spawner.run(env).code == 0, "environment passed to child");

    LaunchCommand killed;
    killed.argv = {"/bin/sh", "-c", "kill -TERM $$"};
    ExitStatus status = spawner.run(killed);
    EXPECT(status.signal == SIGTERM, "signal reported");
    EXPECT(status.shellStatus() == 128 + SIGTERM, "shell status for signal");

    LaunchCommand missing;
    missing.argv = {"/nonexistent/kneeboard"};
    EXPECT(spawner.run(missing).code == 127, "exec failure is 127");
    return 0;
}

static void (*disposition(int signal))(int) {
    struct sigaction current {};
    sigaction(signal, nullptr, &current);
    return current.sa_handler;
}

static int test_interrupt_while_rotating() {
    FakeDisplayManager display;
    display.outputs["HDMI-1"] = DisplayOutcome::Applied;
    display.on_call = [](Orientation orientation) {
        if (orientation == Orientation::Rotated) raise(SIGINT);
    };
    FakeProcessSpawner spawner;
    DeviceProfile profile = profileWithDisplay(true);
    auto int_before = disposition(SIGINT);
    auto term_before = disposition(SIGTERM);

    DisplayController controller(display, profile, "HDMI-1");
    ProcessLauncher launcher(controller, spawner, profile, settings());
    ExitStatus status = launcher.run();

    EXPECT(spawner.commands.empty(), "app not started after Ctrl+C during rotation");
    EXPECT(display.countCalls(Orientation::Normal) == 1, "panel restored once");
    EXPECT(status.interrupted && status.shellStatus() == 128 + SIGINT, "reported as interrupted");
    EXPECT(launcher.state() == LaunchState::Exited, "exited");
    EXPECT(disposition(SIGINT) == int_before && disposition(SIGTERM) == term_before,
           "handlers put back after the launch");
    return 0;
}

static int test_interrupt_while_restoring() {
    FakeDisplayManager display;
    display.outputs["HDMI-1"] = DisplayOutcome::Applied;
    display.on_call = [](Orientation orientation) {
        if (orientation == Orientation::Normal) raise(SIGTERM);
    };
    FakeProcessSpawner spawner;
    spawner.result.code = 4;
    DeviceProfile profile = profileWithDisplay(true);
    auto term_before = disposition(SIGTERM);

    DisplayController controller(display, profile, "HDMI-1");
    ProcessLauncher launcher(controller, spawner, profile, settings());
    ExitStatus status = launcher.run();

    EXPECT(display.countCalls(Orientation::Normal) == 1, "restore ran to completion");
    EXPECT(status.code == 4, "child status still reported");
    EXPECT(disposition(SIGTERM) == term_before, "SIGTERM handler put back");
    return 0;
}

int main() {
    if (test_headless_uses_framebuffer() != 0) return 1;
    if (test_direct_with_display() != 0) return 1;
    if (test_restore_after_nonzero_exit() != 0) return 1;
    if (test_restore_after_interrupt() != 0) return 1;
    if (test_restore_when_spawn_fails() != 0) return 1;
    if (test_no_restore_headless() != 0) return 1;
    if (test_run_once() != 0) return 1;
    if (test_posix_spawner_exit_codes() != 0) return 1;
    if (test_interrupt_while_rotating() != 0) return 1;
    if (test_interrupt_while_restoring() != 0) return 1;
    printf("process launcher tests passed\n");
    return 0;
}
