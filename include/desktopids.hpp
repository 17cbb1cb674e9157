#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace DesktopIds {
    const size_t GUID_SIZE = 16;

    int CountDesktops(const std::vector<uint8_t>& ids);
    int FindDesktopIndex(const std::vector<uint8_t>& ids, const std::vector<uint8_t>& current);

    // null blobs mean the registry value could not be read
    int ResolveDesktopIndex(bool keyOpened, const std::vector<uint8_t>* current,
                            const std::vector<uint8_t>* ids, int fallback);
}
