#include "test_common.hpp"
#include "kdeploy/platform/CrtcChange.hpp"

using namespace kdeploy;

// Records the order in which the steps run
struct ScriptedCrtc {
    bool disable_ok{true};
    bool apply_ok{true};
    bool revert_ok{true};
    std::vector<std::string> log;

    CrtcChangeSteps steps() {
        CrtcChangeSteps s;
        s.disable = [this]() { log.push_back("disable"); return disable_ok; };
        s.resize = [this]() { log.push_back("resize"); };
        s.apply = [this]() { log.push_back("apply"); return apply_ok; };
        s.revert = [this]() { log.push_back("revert"); return revert_ok; };
        return s;
    }
};

static int test_applied() {
    ScriptedCrtc crtc;
    EXPECT(runCrtcChange(crtc.steps()) == CrtcChangeOutcome::Applied, "applied");
    EXPECT((crtc.log == std::vector<std::string>{"disable", "resize", "apply"}), "no revert after success");
    return 0;
}

static int test_rejected_apply_restores_original() {
    ScriptedCrtc crtc;
    crtc.apply_ok = false;

    EXPECT(runCrtcChange(crtc.steps()) == CrtcChangeOutcome::RolledBack, "rolled back");
    EXPECT((crtc.log == std::vector<std::string>{"disable", "resize", "apply", "revert"}),
           "panel switched back on after a rejected rotation");
    return 0;
}

static int test_revert_failure_reported() {
    ScriptedCrtc crtc;
    crtc.apply_ok = false;
    crtc.revert_ok = false;

    CrtcChangeOutcome outcome = runCrtcChange(crtc.steps());
    EXPECT(outcome == CrtcChangeOutcome::RollbackFailed, "failed restore reported");
    EXPECT(std::string(toString(outcome)) == "rollback failed", "outcome name");
    return 0;
}

static int test_disable_refused_changes_nothing() {
    ScriptedCrtc crtc;
    crtc.disable_ok = false;

    EXPECT(runCrtcChange(crtc.steps()) == CrtcChangeOutcome::Rejected, "rejected");
    EXPECT(crtc.log.size() == 1, "screen never resized when the CRTC stays on");
    return 0;
}

int main() {
    if (test_applied() != 0) return 1;
    if (test_rejected_apply_restores_original() != 0) return 1;
    if (test_revert_failure_reported() != 0) return 1;
    if (test_disable_refused_changes_nothing() != 0) return 1;
    printf("crtc change tests passed\n");
    return 0;
}
