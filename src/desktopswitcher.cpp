#include "common.hpp"
#include "switchplan.hpp"
#include "desktopswitcher.hpp"

static bool IsExtendedKey(unsigned short vk) {
    return vk == VK_LWIN || vk == VK_LEFT || vk == VK_RIGHT;
}

bool SwitchDesktop(int from, int to) {
    std::vector<KeyStroke> plan = SwitchPlan::PlanSwitch(from, to);
    if (plan.empty()) return true;

    std::vector<INPUT> inputs(plan.size());
    for (size_t i = 0; i < plan.size(); ++i) {
        inputs[i].type       = INPUT_KEYBOARD;
        inputs[i].ki.wVk     = plan[i].vk;
        inputs[i].ki.dwFlags = (plan[i].keyUp ? KEYEVENTF_KEYUP : 0) |
                               (IsExtendedKey(plan[i].vk) ? KEYEVENTF_EXTENDEDKEY : 0);
    }

    // one chord per step, the shell drops chords that arrive mid-animation
    for (size_t offset = 0; offset < inputs.size(); offset += SwitchPlan::CHORD_LENGTH) {
        if (offset > 0) Sleep(SwitchPlan::STEP_PAUSE_MS);

        UINT sent = SendInput(SwitchPlan::CHORD_LENGTH, &inputs[offset], sizeof(INPUT));
        if (sent != SwitchPlan::CHORD_LENGTH) {
            std::cerr << "failed to send desktop switch input (error " << GetLastError() << ")" << std::endl;
            return false;
        }
    }
    return true;
}
