#include "test_common.hpp"
#include "kdeploy/config/ConfigParser.hpp"

#include <algorithm>

using namespace kdeploy;

static int test_embedded_defaults() {
    ConfigParser parser;
    EXPECT(parser.loadFromString(ConfigParser::getEmbeddedConfig()), "embedded config parses");
    EXPECT(parser.getErrors().empty(), "embedded config has no errors");

    const DeployConfig& config = parser.getConfig();
    EXPECT(config.app.name == "pilot_kneeboard", "app name");
    EXPECT(config.app.version == "1.0.0", "app version");
    EXPECT(config.board.output == "HDMI-1", "board output");
    EXPECT(config.board.rotation == "right", "board rotation");
    EXPECT(config.package.files.size() == 9, "nine release files");
    EXPECT(config.package.files.front() == "kneeboard_gui.py", "entry point packaged first");

    const DependencySet& install = config.dependencies.install;
    EXPECT(install.size() == 6, "six install dependencies");
    EXPECT(install.front().name == "python3", "runtime installed first");
    EXPECT(install.back().name == "Kivy", "toolkit installed last");
    EXPECT(install[3].name == "FFmpeg libraries" && !install[3].required, "ffmpeg optional");

    const DependencySet& run = config.dependencies.run;
    EXPECT(run.size() == 4, "four run dependencies");
    EXPECT(run.back().condition == DependencyCondition::HeadlessOnly, "xvfb only for headless");
    EXPECT(run.front().condition == DependencyCondition::Always, "python3 always");

    EXPECT(config.dependencies.windows.size() == 3, "windows dependencies");
    EXPECT(config.cleanup.patterns.size() == 8, "cleanup patterns");
    EXPECT(config.cleanup.directories == std::vector<std::string>{"__pycache__"}, "only __pycache__ directories");
    EXPECT(std::find(config.cleanup.patterns.begin(), config.cleanup.patterns.end(), "*.bak") !=
               config.cleanup.patterns.end(),
           "backup files cleaned");
    EXPECT(config.launch.framebuffer_command.size() == 2, "xvfb-run -a");
    return 0;
}

static int test_user_overlay() {
    ConfigParser parser;
    EXPECT(parser.loadFromString(ConfigParser::getEmbeddedConfig()), "embedded config parses");

    const char* user = R"(
// Bench rig: 7" panel on DSI, rotated the other way
kdeploy: {
    app: { version: "1.1.0" }
    board: {
        output: "DSI-1"
        rotation: "left"
    }
    service: { active_probe_ms: 2500 }
}
)";
    EXPECT(parser.loadFromString(user), "overlay parses");

    const DeployConfig& config = parser.getConfig();
    EXPECT(config.app.version == "1.1.0", "version overridden");
    EXPECT(config.app.name == "pilot_kneeboard", "name kept");
    EXPECT(config.board.output == "DSI-1", "output overridden");
    EXPECT(config.board.rotation == "left", "rotation overridden");
    EXPECT(config.service.active_probe_ms == 2500, "probe deadline overridden");
    EXPECT(config.package.files.size() == 9, "manifest kept");
    return 0;
}

static int test_top_level_sections() {
    ConfigParser parser;
    const char* text = R"(
cleanup: {
    directories: ["__pycache__", ".pytest_cache",]
    patterns: ["*.pyc"]
}
)";
    EXPECT(parser.loadFromString(text), "sections without root block parse");
    EXPECT(parser.getConfig().cleanup.directories.size() == 2, "trailing comma accepted");
    return 0;
}

static int test_type_mismatch() {
    ConfigParser parser;
    EXPECT(!parser.loadFromString("kdeploy: { service: { active_probe_ms: \"soon\" } }"), "string for int rejected");
    EXPECT(!parser.getErrors().empty(), "error recorded");
    return 0;
}

static int test_dependency_without_check() {
    ConfigParser parser;
    const char* text = R"(
dependencies: {
    run: {
        broken: { install: "sudo apt install -y broken" }
    }
}
)";
    EXPECT(!parser.loadFromString(text), "dependency without check rejected");
    return 0;
}

static int test_bad_when() {
    ConfigParser parser;
    const char* text = R"(
dependencies: {
    run: {
        x: { check: "true" install: "true" when: "sometimes" }
    }
}
)";
    EXPECT(!parser.loadFromString(text), "unknown when rejected");
    return 0;
}

static int test_syntax_error() {
    ConfigParser parser;
    EXPECT(!parser.loadFromString("kdeploy: { app: { name: \"x\" }"), "unterminated block rejected");
    EXPECT(!parser.loadFromString("app: { name: \"unterminated }"), "unterminated string rejected");
    return 0;
}

static int test_explicit_path_wins() {
    auto resolved = ConfigParser::resolveConfigPath(std::filesystem::path("/nonexistent/custom.conf"));
    EXPECT(resolved.has_value(), "explicit path returned");
    EXPECT(resolved->string() == "/nonexistent/custom.conf", "explicit path unchanged");

    ConfigParser parser;
    EXPECT(!parser.load("/nonexistent/custom.conf"), "missing file fails to load");
    return 0;
}

int main() {
    if (test_embedded_defaults() != 0) return 1;
    if (test_user_overlay() != 0) return 1;
    if (test_top_level_sections() != 0) return 1;
    if (test_type_mismatch() != 0) return 1;
    if (test_dependency_without_check() != 0) return 1;
    if (test_bad_when() != 0) return 1;
    if (test_syntax_error() != 0) return 1;
    if (test_explicit_path_wins() != 0) return 1;
    printf("config parser tests passed\n");
    return 0;
}
