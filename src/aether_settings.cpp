#include "aether_settings.h"

#include <aether_logging.h>

namespace Aether {

namespace Code {

WarningLevel Settings::warningLevel(SettingId setting) const noexcept {
    assert(setting < NUM_CODE_SETTINGS);
    return static_cast<WarningLevel>(flags[setting]);
}

void Settings::reset() noexcept {
    flags = DEFAULT_CODE_SETTINGS;
    updates.clear();
}

void Settings::set(SettingId setting, SettingValue value) alloc_except {
    assert(setting < NUM_CODE_SETTINGS);
    assert(value < NUM_WARNING_LEVELS);
    updates.push_back( Update(setting, flags[setting]) );
    flags[setting] = value;
}

void Settings::undo() noexcept {
    if(updates.empty()) return;

    const Update& update = updates.back();
    flags[update.setting_id] = update.prev_value;
    updates.pop_back();
}

const std::vector<Settings::Update>& Settings::history() const noexcept {
    return updates;
}

//Accepts "name=level", e.g. "naming-convention=error"
bool Settings::parseOption(std::string_view option) alloc_except {
    const size_t split = option.find('=');
    if(split == std::string_view::npos) return false;

    const std::string_view name = option.substr(0, split);
    const std::string_view level = option.substr(split+1);

    for(size_t i = 0; i < NUM_CODE_SETTINGS; i++){
        if(SETTING_NAMES[i] != name) continue;

        for(size_t j = 0; j < NUM_WARNING_LEVELS; j++){
            if(WARNING_LEVEL_NAMES[j] == level){
                set(static_cast<SettingId>(i), static_cast<SettingValue>(j));
                logger->info("Settings::parseOption({:s})", cStr(option));
                return true;
            }
        }

        return false;
    }

    return false;
}

}

}
