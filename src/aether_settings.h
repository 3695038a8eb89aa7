#ifndef AETHER_SETTINGS_H
#define AETHER_SETTINGS_H

#include <aether_common.h>
#include <array>
#include <cassert>
#include <cinttypes>
#include <string_view>
#include <vector>

namespace Aether {

namespace Code {

enum WarningLevel : uint8_t {
    NO_WARNING,
    WARN,
    ERROR,
    NUM_WARNING_LEVELS
};

enum SettingId {
    WARN_NAMING_CONVENTION,
    NUM_CODE_SETTINGS
};

typedef uint8_t SettingValue;

inline constexpr std::array<SettingValue, NUM_CODE_SETTINGS> DEFAULT_CODE_SETTINGS = {
    WARN, //WARN_NAMING_CONVENTION
};

inline constexpr std::array<std::string_view, NUM_CODE_SETTINGS> SETTING_NAMES = {
    "naming-convention",
};

inline constexpr std::array<std::string_view, NUM_WARNING_LEVELS> WARNING_LEVEL_NAMES = {
    "off",
    "warn",
    "error",
};

class Settings {
public:
    struct Update {
        SettingId setting_id;
        SettingValue prev_value;

        Update() noexcept = default;
        Update(SettingId setting_id, SettingValue prev_value) noexcept
            : setting_id(setting_id), prev_value(prev_value) {}

        bool operator==(const Update& other) const noexcept {
            return setting_id == other.setting_id && prev_value == other.prev_value;
        }
    };

private:
    std::array<SettingValue, NUM_CODE_SETTINGS> flags = DEFAULT_CODE_SETTINGS;
    std::vector<Update> updates;

public:
    template<SettingId setting> WarningLevel warningLevel() const noexcept {
        static_assert(setting < NUM_CODE_SETTINGS);
        return static_cast<WarningLevel>(flags[setting]);
    }

    template<SettingId setting> void setWarningLevel(WarningLevel warning_level) alloc_except {
        static_assert(setting < NUM_CODE_SETTINGS);
        assert(warning_level < NUM_WARNING_LEVELS);
        updates.push_back( Update(setting, flags[setting]) );
        flags[setting] = warning_level;
    }

    WarningLevel warningLevel(SettingId setting) const noexcept;
    void reset() noexcept;
    void set(SettingId setting, SettingValue value) alloc_except;
    void undo() noexcept;
    const std::vector<Update>& history() const noexcept;
    bool parseOption(std::string_view option) alloc_except;
};

}

}

#endif // AETHER_SETTINGS_H
