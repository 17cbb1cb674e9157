#pragma once

bool SwitchDesktop(int from, int to);
