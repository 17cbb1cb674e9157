#pragma once

#include <vector>

struct KeyStroke {
    unsigned short vk;
    bool keyUp;
};

namespace SwitchPlan {
    const unsigned short LEFT_WIN_KEY    = 0x5B;
    const unsigned short CONTROL_KEY     = 0x11;
    const unsigned short LEFT_ARROW_KEY  = 0x25;
    const unsigned short RIGHT_ARROW_KEY = 0x27;

    const unsigned int CHORD_LENGTH = 6;
    const int STEP_PAUSE_MS = 100;

    int StepsBetween(int from, int to);
    std::vector<KeyStroke> ChordForStep(bool forward);
    std::vector<KeyStroke> PlanSwitch(int from, int to);
}
