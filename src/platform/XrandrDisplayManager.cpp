#include "kdeploy/platform/DisplayManager.hpp"
#include "kdeploy/platform/CrtcChange.hpp"

#include <X11/Xlib.h>
#include <X11/extensions/Xrandr.h>

#include <algorithm>
#include <iostream>
#include <memory>

namespace kdeploy {

namespace {

bool x_error_seen = false;

int recordXError(Display*, XErrorEvent*) {
    x_error_seen = true;
    return 0;
}

struct DisplayCloser {
    void operator()(Display* display) const { XCloseDisplay(display); }
};

struct ResourcesDeleter {
    void operator()(XRRScreenResources* resources) const { XRRFreeScreenResources(resources); }
};

struct OutputInfoDeleter {
    void operator()(XRROutputInfo* info) const { XRRFreeOutputInfo(info); }
};

struct CrtcInfoDeleter {
    void operator()(XRRCrtcInfo* info) const { XRRFreeCrtcInfo(info); }
};

using DisplayPtr = std::unique_ptr<Display, DisplayCloser>;
using ResourcesPtr = std::unique_ptr<XRRScreenResources, ResourcesDeleter>;
using OutputInfoPtr = std::unique_ptr<XRROutputInfo, OutputInfoDeleter>;
using CrtcInfoPtr = std::unique_ptr<XRRCrtcInfo, CrtcInfoDeleter>;

DisplayResult result(DisplayOutcome outcome, const std::string& output_id, std::string reason) {
    DisplayResult r;
    r.outcome = outcome;
    r.output_id = output_id;
    r.reason = std::move(reason);
    return r;
}

bool swapsAxes(Rotation rotation) {
    return (rotation & (RR_Rotate_90 | RR_Rotate_270)) != 0;
}

// Opens $DISPLAY and checks for XRandR; sets reason on failure.
DisplayPtr openRandrDisplay(std::string& reason) {
    DisplayPtr display(XOpenDisplay(nullptr));
    if (!display) {
        reason = "no X display";
        return nullptr;
    }

    int event_base, error_base;
    if (!XRRQueryExtension(display.get(), &event_base, &error_base)) {
        reason = "XRandR extension not available";
        return nullptr;
    }

    int major, minor;
    if (!XRRQueryVersion(display.get(), &major, &minor) || (major == 1 && minor < 2)) {
        reason = "XRandR 1.2 or newer required";
        return nullptr;
    }

    return display;
}

} // namespace

XrandrDisplayManager::XrandrDisplayManager(std::string rotation) : rotation_(std::move(rotation)) {}

unsigned short XrandrDisplayManager::rotationFromName(const std::string& name) {
    if (name == "normal") return RR_Rotate_0;
    if (name == "left") return RR_Rotate_90;
    if (name == "inverted") return RR_Rotate_180;
    if (name == "right") return RR_Rotate_270;
    return 0;
}

DisplayResult XrandrDisplayManager::setOrientation(const std::string& output_id, Orientation orientation) {
    Rotation target = orientation == Orientation::Rotated ? rotationFromName(rotation_) : RR_Rotate_0;
    if (target == 0) {
        return result(DisplayOutcome::Failed, output_id, "unknown rotation '" + rotation_ + "'");
    }

    std::string reason;
    DisplayPtr display = openRandrDisplay(reason);
    if (!display) {
        return result(DisplayOutcome::NotApplicable, output_id, reason);
    }

    Display* dpy = display.get();
    Window root = DefaultRootWindow(dpy);

    ResourcesPtr resources(XRRGetScreenResources(dpy, root));
    if (!resources) {
        return result(DisplayOutcome::Failed, output_id, "failed to get screen resources");
    }

    // Locate the output by name
    OutputInfoPtr output_info;
    for (int i = 0; i < resources->noutput; ++i) {
        OutputInfoPtr info(XRRGetOutputInfo(dpy, resources.get(), resources->outputs[i]));
        if (info && info->name && output_id == info->name) {
            output_info = std::move(info);
            break;
        }
    }

    if (!output_info) {
        return result(DisplayOutcome::NotApplicable, output_id, "output not present");
    }
    if (output_info->connection != RR_Connected || output_info->crtc == None) {
        return result(DisplayOutcome::NotApplicable, output_id, "output not connected");
    }

    RRCrtc crtc = output_info->crtc;
    CrtcInfoPtr crtc_info(XRRGetCrtcInfo(dpy, resources.get(), crtc));
    if (!crtc_info || crtc_info->mode == None) {
        return result(DisplayOutcome::NotApplicable, output_id, "output has no active mode");
    }
    if ((crtc_info->rotations & target) == 0) {
        return result(DisplayOutcome::NotApplicable, output_id, "rotation not supported by the CRTC");
    }
    if ((crtc_info->rotation & 0xf) == target) {
        return result(DisplayOutcome::Applied, output_id, "already in requested orientation");
    }

    // Mode dimensions, then the CRTC's extent after rotation
    unsigned int mode_width = 0;
    unsigned int mode_height = 0;
    for (int i = 0; i < resources->nmode; ++i) {
        if (resources->modes[i].id == crtc_info->mode) {
            mode_width = resources->modes[i].width;
            mode_height = resources->modes[i].height;
            break;
        }
    }
    if (mode_width == 0 || mode_height == 0) {
        return result(DisplayOutcome::Failed, output_id, "current mode not found");
    }

    unsigned int new_width = swapsAxes(target) ? mode_height : mode_width;
    unsigned int new_height = swapsAxes(target) ? mode_width : mode_height;

    // The screen must still cover every other active CRTC
    int screen_width = crtc_info->x + static_cast<int>(new_width);
    int screen_height = crtc_info->y + static_cast<int>(new_height);
    for (int i = 0; i < resources->ncrtc; ++i) {
        if (resources->crtcs[i] == crtc) continue;
        CrtcInfoPtr other(XRRGetCrtcInfo(dpy, resources.get(), resources->crtcs[i]));
        if (!other || other->mode == None) continue;
        screen_width = std::max(screen_width, other->x + static_cast<int>(other->width));
        screen_height = std::max(screen_height, other->y + static_cast<int>(other->height));
    }

    int min_width, min_height, max_width, max_height;
    if (XRRGetScreenSizeRange(dpy, root, &min_width, &min_height, &max_width, &max_height)) {
        if (screen_width > max_width || screen_height > max_height) {
            return result(DisplayOutcome::NotApplicable, output_id, "rotated screen exceeds maximum size");
        }
        screen_width = std::max(screen_width, min_width);
        screen_height = std::max(screen_height, min_height);
    }

    int screen = DefaultScreen(dpy);
    int current_width = DisplayWidth(dpy, screen);
    int current_height = DisplayHeight(dpy, screen);
    int original_mm_width = DisplayWidthMM(dpy, screen);
    int original_mm_height = DisplayHeightMM(dpy, screen);
    int mm_width = current_width > 0 ? original_mm_width * screen_width / current_width : 0;
    int mm_height = current_height > 0 ? original_mm_height * screen_height / current_height : 0;

    // A round trip so asynchronous X errors from the last request are seen
    auto settled = [&](Status status) {
        XSync(dpy, False);
        return status == RRSetConfigSuccess && !x_error_seen;
    };

    CrtcChangeSteps steps;
    steps.disable = [&]() {
        return settled(XRRSetCrtcConfig(dpy, resources.get(), crtc, CurrentTime,
                                        0, 0, None, RR_Rotate_0, nullptr, 0));
    };
    steps.resize = [&]() {
        XRRSetScreenSize(dpy, root, screen_width, screen_height, mm_width, mm_height);
    };
    steps.apply = [&]() {
        return settled(XRRSetCrtcConfig(dpy, resources.get(), crtc, CurrentTime,
                                        crtc_info->x, crtc_info->y, crtc_info->mode, target,
                                        crtc_info->outputs, crtc_info->noutput));
    };
    steps.revert = [&]() {
        x_error_seen = false;
        XRRSetScreenSize(dpy, root, current_width, current_height, original_mm_width, original_mm_height);
        return settled(XRRSetCrtcConfig(dpy, resources.get(), crtc, CurrentTime,
                                        crtc_info->x, crtc_info->y, crtc_info->mode, crtc_info->rotation,
                                        crtc_info->outputs, crtc_info->noutput));
    };

    x_error_seen = false;
    XErrorHandler previous = XSetErrorHandler(recordXError);

    XGrabServer(dpy);
    CrtcChangeOutcome change = runCrtcChange(steps);
    XUngrabServer(dpy);
    XSync(dpy, False);
    XSetErrorHandler(previous);

    switch (change) {
        case CrtcChangeOutcome::Applied:
            break;
        case CrtcChangeOutcome::Rejected:
            return result(DisplayOutcome::Failed, output_id, "X server rejected disabling the CRTC");
        case CrtcChangeOutcome::RolledBack:
            std::cerr << "[XRandR] " << output_id << " rotation rejected, original mode restored" << std::endl;
            return result(DisplayOutcome::Failed, output_id, "rotation rejected; original configuration restored");
        case CrtcChangeOutcome::RollbackFailed:
            std::cerr << "[XRandR] " << output_id << " could not be restored; run: xrandr --output "
                      << output_id << " --auto" << std::endl;
            return result(DisplayOutcome::Failed, output_id, "rotation rejected and the original configuration could not be restored");
    }

    std::cout << "[XRandR] " << output_id << " now " << screen_width << "x" << screen_height
              << " (" << toString(orientation) << ")" << std::endl;

    return result(DisplayOutcome::Applied, output_id, "");
}

std::optional<std::string> XrandrDisplayManager::firstConnectedOutput() {
    std::string reason;
    DisplayPtr display = openRandrDisplay(reason);
    if (!display) {
        return std::nullopt;
    }

    ResourcesPtr resources(XRRGetScreenResources(display.get(), DefaultRootWindow(display.get())));
    if (!resources) {
        return std::nullopt;
    }

    for (int i = 0; i < resources->noutput; ++i) {
        OutputInfoPtr info(XRRGetOutputInfo(display.get(), resources.get(), resources->outputs[i]));
        if (info && info->connection == RR_Connected && info->name) {
            return std::string(info->name);
        }
    }

    return std::nullopt;
}

} // namespace kdeploy
