#include "mac_address.h"
#include <cctype>
#include <cstdio>
#include <cstdlib>

namespace beacontrack {

std::string macFmt6(const uint8_t *m) {
    char b[18];
    snprintf(b, sizeof(b), "%02X:%02X:%02X:%02X:%02X:%02X",
             m[0], m[1], m[2], m[3], m[4], m[5]);
    return std::string(b);
}

bool parseMac6(const std::string &in, uint8_t out[6]) {
    std::string t;
    for (size_t i = 0; i < in.length(); ++i) {
        char c = in[i];
        if (isxdigit((unsigned char)c)) {
            t += (char)toupper((unsigned char)c);
        } else if (c != ':' && c != '-') {
            return false;
        }
    }
    if (t.length() != 12) return false;
    for (int i = 0; i < 6; i++) {
        out[i] = (uint8_t)strtoul(t.substr(i * 2, 2).c_str(), nullptr, 16);
    }
    return true;
}

bool normalizeMac(const std::string &in, std::string &out) {
    uint8_t mac[6];
    if (!parseMac6(in, mac)) return false;
    out = macFmt6(mac);
    return true;
}

std::string compactMac(const std::string &mac) {
    std::string t;
    for (char c : mac) {
        if (c != ':' && c != '-') t += c;
    }
    return t;
}

}  // namespace beacontrack
