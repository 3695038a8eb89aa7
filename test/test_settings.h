#ifndef TEST_SETTINGS_H
#define TEST_SETTINGS_H

#include "report.h"
#include <aether_settings.h>

using namespace Aether;
using namespace Code;

inline bool testSettings(){
    bool passing = true;

    Settings settings;
    passing &= settings.warningLevel<WARN_NAMING_CONVENTION>() == WARN;
    passing &= settings.history().empty();

    settings.setWarningLevel<WARN_NAMING_CONVENTION>(ERROR);
    passing &= settings.warningLevel(WARN_NAMING_CONVENTION) == ERROR;
    settings.set(WARN_NAMING_CONVENTION, NO_WARNING);
    passing &= settings.warningLevel<WARN_NAMING_CONVENTION>() == NO_WARNING;
    passing &= settings.history().size() == 2;

    settings.undo();
    passing &= settings.warningLevel<WARN_NAMING_CONVENTION>() == ERROR;
    settings.undo();
    passing &= settings.warningLevel<WARN_NAMING_CONVENTION>() == WARN;
    passing &= settings.history().empty();

    if(!passing) printf("Line %d, setting updates do not undo cleanly\n", __LINE__);

    passing &= settings.parseOption("naming-convention=error");
    passing &= settings.warningLevel<WARN_NAMING_CONVENTION>() == ERROR;
    passing &= settings.parseOption("naming-convention=off");
    passing &= settings.warningLevel<WARN_NAMING_CONVENTION>() == NO_WARNING;
    passing &= !settings.parseOption("naming-convention");
    passing &= !settings.parseOption("naming-convention=loud");
    passing &= !settings.parseOption("unknown=warn");
    passing &= settings.warningLevel<WARN_NAMING_CONVENTION>() == NO_WARNING;

    settings.reset();
    passing &= settings.warningLevel<WARN_NAMING_CONVENTION>() == WARN;
    passing &= settings.history().empty();

    report("Settings", passing);
    return passing;
}

#endif // TEST_SETTINGS_H
