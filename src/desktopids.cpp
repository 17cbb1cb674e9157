#include "desktopids.hpp"

#include <algorithm>

namespace DesktopIds {
    int CountDesktops(const std::vector<uint8_t>& ids) {
        int count = (int)(ids.size() / GUID_SIZE);
        // explorer omits VirtualDesktopIDs until a second desktop is created
        return count > 0 ? count : 1;
    }

    int FindDesktopIndex(const std::vector<uint8_t>& ids, const std::vector<uint8_t>& current) {
        if (current.size() != GUID_SIZE) return -1;

        size_t records = ids.size() / GUID_SIZE;
        for (size_t i = 0; i < records; ++i) {
            auto first = ids.begin() + i*GUID_SIZE;
            if (std::equal(first, first + GUID_SIZE, current.begin())) {
                return (int)i;
            }
        }
        return -1;
    }

    int ResolveDesktopIndex(bool keyOpened, const std::vector<uint8_t>* current,
                            const std::vector<uint8_t>* ids, int fallback) {
        if (!keyOpened) return fallback;
        if (!current) return 0;
        if (!ids) return fallback;

        int index = FindDesktopIndex(*ids, *current);
        return index >= 0 ? index : 0;
    }
}
