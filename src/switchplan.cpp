#include "switchplan.hpp"

#include <cstdlib>

namespace SwitchPlan {
    int StepsBetween(int from, int to) {
        return to - from;
    }

    std::vector<KeyStroke> ChordForStep(bool forward) {
        unsigned short arrow = forward ? RIGHT_ARROW_KEY : LEFT_ARROW_KEY;
        // press in order, release in reverse
        return {
            { LEFT_WIN_KEY, false },
            { CONTROL_KEY,  false },
            { arrow,        false },
            { arrow,        true  },
            { CONTROL_KEY,  true  },
            { LEFT_WIN_KEY, true  }
        };
    }

    std::vector<KeyStroke> PlanSwitch(int from, int to) {
        std::vector<KeyStroke> plan;
        int steps = StepsBetween(from, to);
        if (steps == 0) return plan;

        std::vector<KeyStroke> chord = ChordForStep(steps > 0);
        for (int i = 0; i < std::abs(steps); ++i) {
            plan.insert(plan.end(), chord.begin(), chord.end());
        }
        return plan;
    }
}
