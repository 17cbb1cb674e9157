/*---------------------------------------------------------*/
/*   switchplan_test.cpp - ctest for desktop key chords    */
/*---------------------------------------------------------*/

#include "switchplan.hpp"

#include <iostream>

static int failures = 0;

static void check(const char* name, bool cond) {
    if (cond) {
        std::cout << "  PASS: " << name << "\n";
    } else {
        std::cerr << "  FAIL: " << name << "\n";
        failures++;
    }
}

static bool isStroke(const KeyStroke& k, unsigned short vk, bool keyUp) {
    return k.vk == vk && k.keyUp == keyUp;
}

int main() {
    std::cout << "=== SwitchPlan Tests ===\n\n";

    std::cout << "[StepsBetween]\n";
    {
        check("forward", SwitchPlan::StepsBetween(0, 3) == 3);
        check("backward", SwitchPlan::StepsBetween(3, 1) == -2);
        check("same desktop", SwitchPlan::StepsBetween(2, 2) == 0);
    }

    std::cout << "\n[ChordForStep]\n";
    {
        std::vector<KeyStroke> right = SwitchPlan::ChordForStep(true);
        check("chord length", right.size() == SwitchPlan::CHORD_LENGTH);
        check("win down first", isStroke(right[0], SwitchPlan::LEFT_WIN_KEY, false));
        check("ctrl down second", isStroke(right[1], SwitchPlan::CONTROL_KEY, false));
        check("right arrow down", isStroke(right[2], SwitchPlan::RIGHT_ARROW_KEY, false));
        check("right arrow up", isStroke(right[3], SwitchPlan::RIGHT_ARROW_KEY, true));
        check("ctrl up", isStroke(right[4], SwitchPlan::CONTROL_KEY, true));
        check("win up last", isStroke(right[5], SwitchPlan::LEFT_WIN_KEY, true));

        std::vector<KeyStroke> left = SwitchPlan::ChordForStep(false);
        check("left arrow down", isStroke(left[2], SwitchPlan::LEFT_ARROW_KEY, false));
        check("left arrow up", isStroke(left[3], SwitchPlan::LEFT_ARROW_KEY, true));
    }

    std::cout << "\n[PlanSwitch]\n";
    {
        check("no keys when already there", SwitchPlan::PlanSwitch(1, 1).empty());

        std::vector<KeyStroke> forward = SwitchPlan::PlanSwitch(0, 3);
        check("three chords forward", forward.size() == 3*SwitchPlan::CHORD_LENGTH);
        bool allRight = true;
        for (const auto& k : forward) {
            if (k.vk == SwitchPlan::LEFT_ARROW_KEY) allRight = false;
        }
        check("forward uses right arrow only", allRight);

        std::vector<KeyStroke> backward = SwitchPlan::PlanSwitch(4, 2);
        check("two chords backward", backward.size() == 2*SwitchPlan::CHORD_LENGTH);
        check("backward second chord starts with win",
              isStroke(backward[SwitchPlan::CHORD_LENGTH], SwitchPlan::LEFT_WIN_KEY, false));
        check("backward uses left arrow", isStroke(backward[2], SwitchPlan::LEFT_ARROW_KEY, false));

        int down = 0;
        int up = 0;
        for (const auto& k : backward) {
            if (k.keyUp) up++; else down++;
        }
        check("every press is released", down == up);
    }

    std::cout << "\n=== " << (failures == 0 ? "ALL PASSED" : "FAILURES") << " ===\n";
    return failures == 0 ? 0 : 1;
}
