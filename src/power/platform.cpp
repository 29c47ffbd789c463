// src/power/platform.cpp
#include "power/platform.hpp"
#include "utils/logging.hpp"

#include <sys/stat.h>

namespace power {

namespace {

bool dir_exists(const std::string& path) {
    struct stat st{};
    return ::stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

} // namespace

const char* to_string(Model model) {
    switch (model) {
        case Model::PinePhone:    return "pinephone";
        case Model::PinePhonePro: return "pinephone-pro";
    }
    return "?";
}

bool parse_model(const std::string& name, Model& out) {
    if (name == "pinephone") {
        out = Model::PinePhone;
        return true;
    }
    if (name == "pinephone-pro" || name == "pinephonepro" || name == "ppp") {
        out = Model::PinePhonePro;
        return true;
    }
    return false;
}

PlatformProfile profile_for(Model model) {
    PlatformProfile p;
    p.model = model;
    p.sysfs.keyboard_charger = "class/power_supply/ip5xxx-charger";

    switch (model) {
        case Model::PinePhonePro:
            // rk818 reports signed current
            p.steps = LimitSteps({450, 850, 1000, 1250, 1500, 2000});
            p.current_sign_unreliable = false;
            p.sysfs.phone_battery = "class/power_supply/battery";
            p.sysfs.phone_input = "class/power_supply/rk818-usb";
            break;
        case Model::PinePhone:
            p.steps = LimitSteps({500, 900, 1500, 2000});
            p.current_sign_unreliable = true;
            p.sysfs.phone_battery = "class/power_supply/axp20x-battery";
            p.sysfs.phone_input = "class/power_supply/axp20x-usb";
            break;
    }

    p.default_limit_mA = p.steps.min();
    return p;
}

std::optional<Model> detect_model(const std::string& sysfs_root) {
    const std::string base = sysfs_root + "/class/power_supply/";

    if (dir_exists(base + "rk818-usb")) {
        LOG_DEBUG("[Platform] Found rk818-usb, PinePhone Pro");
        return Model::PinePhonePro;
    }
    if (dir_exists(base + "axp20x-usb")) {
        LOG_DEBUG("[Platform] Found axp20x-usb, PinePhone");
        return Model::PinePhone;
    }

    LOG_ERROR("[Platform] No known USB power supply under %s", base.c_str());
    return std::nullopt;
}

} // namespace power
