/*---------------------------------------------------------*/
/*   desktopids_test.cpp - ctest for registry blob parsing */
/*---------------------------------------------------------*/

#include "desktopids.hpp"

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

static std::vector<uint8_t> makeGuid(uint8_t seed) {
    std::vector<uint8_t> guid(DesktopIds::GUID_SIZE);
    for (size_t i = 0; i < guid.size(); ++i) guid[i] = (uint8_t)(seed + i);
    return guid;
}

static std::vector<uint8_t> concat(const std::vector<std::vector<uint8_t>>& guids) {
    std::vector<uint8_t> ids;
    for (const auto& g : guids) ids.insert(ids.end(), g.begin(), g.end());
    return ids;
}

int main() {
    std::cout << "=== DesktopIds Tests ===\n\n";

    std::cout << "[CountDesktops]\n";
    {
        check("empty blob counts as one desktop", DesktopIds::CountDesktops({}) == 1);
        check("one guid", DesktopIds::CountDesktops(makeGuid(1)) == 1);
        check("three guids", DesktopIds::CountDesktops(concat({ makeGuid(1), makeGuid(40), makeGuid(80) })) == 3);

        std::vector<uint8_t> partial = concat({ makeGuid(1), makeGuid(40) });
        partial.push_back(0xAB);
        check("trailing partial guid ignored", DesktopIds::CountDesktops(partial) == 2);

        std::vector<uint8_t> shortBlob(7, 0);
        check("blob shorter than a guid counts as one", DesktopIds::CountDesktops(shortBlob) == 1);
    }

    std::cout << "\n[FindDesktopIndex]\n";
    {
        std::vector<uint8_t> a = makeGuid(1);
        std::vector<uint8_t> b = makeGuid(40);
        std::vector<uint8_t> c = makeGuid(80);
        std::vector<uint8_t> ids = concat({ a, b, c });

        check("first desktop", DesktopIds::FindDesktopIndex(ids, a) == 0);
        check("middle desktop", DesktopIds::FindDesktopIndex(ids, b) == 1);
        check("last desktop", DesktopIds::FindDesktopIndex(ids, c) == 2);
        check("unknown guid", DesktopIds::FindDesktopIndex(ids, makeGuid(120)) == -1);
        check("empty current", DesktopIds::FindDesktopIndex(ids, {}) == -1);

        std::vector<uint8_t> truncated(b.begin(), b.begin() + 8);
        check("truncated current", DesktopIds::FindDesktopIndex(ids, truncated) == -1);

        // a guid straddling two records must not match
        std::vector<uint8_t> straddle(ids.begin() + 8, ids.begin() + 24);
        check("match only on record boundaries", DesktopIds::FindDesktopIndex(ids, straddle) == -1);
    }

    std::cout << "\n[ResolveDesktopIndex]\n";
    {
        std::vector<uint8_t> a = makeGuid(1);
        std::vector<uint8_t> b = makeGuid(40);
        std::vector<uint8_t> ids = concat({ a, b });
        std::vector<uint8_t> stranger = makeGuid(120);

        check("unopenable key keeps previous index", DesktopIds::ResolveDesktopIndex(false, &b, &ids, 3) == 3);
        check("missing current desktop gives first", DesktopIds::ResolveDesktopIndex(true, NULL, &ids, 3) == 0);
        check("missing desktop list keeps previous index", DesktopIds::ResolveDesktopIndex(true, &b, NULL, 3) == 3);
        check("unknown current desktop gives first", DesktopIds::ResolveDesktopIndex(true, &stranger, &ids, 3) == 0);
        check("known current desktop resolved", DesktopIds::ResolveDesktopIndex(true, &b, &ids, 0) == 1);
    }

    std::cout << "\n=== " << (failures == 0 ? "ALL PASSED" : "FAILURES") << " ===\n";
    return failures == 0 ? 0 : 1;
}
