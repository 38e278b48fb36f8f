#pragma once

namespace playnite {

inline const char* appVersion() {
#ifdef PLAYNITE_APP_VERSION
    return PLAYNITE_APP_VERSION;
#else
    return "0.0.0";
#endif
}

inline const char* appName() { return "playnite-mqtt-bridge"; }

} // namespace playnite
