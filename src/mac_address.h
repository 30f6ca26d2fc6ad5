#pragma once
#include <cstdint>
#include <string>

namespace beacontrack {

bool parseMac6(const std::string &in, uint8_t out[6]);
std::string macFmt6(const uint8_t *m);

// Accepts "AABBCCDDEEFF", "aa:bb:cc:dd:ee:ff" or "AA-BB-..." and returns
// the upper-case colon form. Returns false for anything else.
bool normalizeMac(const std::string &in, std::string &out);
std::string compactMac(const std::string &mac);

}  // namespace beacontrack
