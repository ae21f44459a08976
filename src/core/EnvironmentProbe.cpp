#include "kdeploy/core/EnvironmentProbe.hpp"

#include <algorithm>
#include <iostream>

namespace kdeploy {

EnvironmentProbe::EnvironmentProbe(const SystemView& system, DeployConfig::BoardConfig board)
    : system_(system), board_(std::move(board)) {}

OsFamily EnvironmentProbe::classifyOs(const std::string& os_name) {
    static const char* windows_markers[] = {"Windows", "MINGW", "MSYS", "CYGWIN"};

    for (const char* marker : windows_markers) {
        if (os_name.find(marker) != std::string::npos) {
            return OsFamily::Windows;
        }
    }
    return OsFamily::Linux;
}

DeviceProfile EnvironmentProbe::probe() {
    DeviceProfile profile;

    // (a) platform
    profile.os_family = classifyOs(system_.osName());

    // (b) board identification
    profile.is_target_board = profile.os_family == OsFamily::Linux && detectTargetBoard();

    // (c) graphical session
    if (profile.os_family == OsFamily::Windows) {
        profile.has_display_session = true;
    } else {
        auto display = system_.getEnv("DISPLAY");
        profile.has_display_session = display.has_value() && !display->empty();
    }

    // (d) service manager
    if (profile.os_family == OsFamily::Windows) {
        profile.service_manager = ServiceManagerKind::None;
    } else if (system_.commandAvailable("systemctl")) {
        profile.service_manager = ServiceManagerKind::Systemd;
    } else if (profile.has_display_session) {
        profile.service_manager = ServiceManagerKind::DesktopAutostart;
    } else {
        profile.service_manager = ServiceManagerKind::None;
    }

    std::cout << "[EnvironmentProbe] os=" << toString(profile.os_family)
              << " target_board=" << (profile.is_target_board ? "yes" : "no")
              << " display_session=" << (profile.has_display_session ? "yes" : "no")
              << " service_manager=" << toString(profile.service_manager) << std::endl;

    return profile;
}

bool EnvironmentProbe::detectTargetBoard() {
    board_model_.clear();

    auto model = system_.readFile(board_.model_file);
    if (!model.has_value()) {
        board_metadata_readable_ = false;
        std::cerr << "[EnvironmentProbe] Warning: board identification unreadable ("
                  << board_.model_file << "), assuming this is not the target board" << std::endl;
        return false;
    }

    board_metadata_readable_ = true;

    // The device-tree model string is NUL terminated
    board_model_ = *model;
    board_model_.erase(std::remove(board_model_.begin(), board_model_.end(), '\0'), board_model_.end());
    while (!board_model_.empty() && (board_model_.back() == '\n' || board_model_.back() == ' ')) {
        board_model_.pop_back();
    }

    if (!system_.fileExists(board_.os_release_file)) {
        return false;
    }

    return board_model_.find(board_.model_match) != std::string::npos;
}

bool EnvironmentProbe::confirmDevice(const DeviceProfile& profile, Prompt& prompt,
                                     const std::string& purpose) const {
    if (profile.is_target_board) {
        return true;
    }

    std::cerr << "Warning: This doesn't appear to be a " << board_.model_match << "." << std::endl;
    if (!board_metadata_readable_) {
        std::cerr << "Board identification (" << board_.model_file << ") could not be read." << std::endl;
    } else if (!board_model_.empty()) {
        std::cerr << "Detected board: " << board_model_ << std::endl;
    }
    std::cerr << "This application is optimized for " << board_.model_match << " with touchscreen." << std::endl;

    if (!prompt.confirm("Continue anyway?")) {
        std::cout << purpose << " cancelled." << std::endl;
        return false;
    }
    return true;
}

} // namespace kdeploy
