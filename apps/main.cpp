#include "fsremote/core/CommandExecutor.hpp"
#include "fsremote/core/RemoteSettings.hpp"
#include "fsremote/fsapi/FsapiTransport.hpp"
#include "fsremote/log/Log.hpp"

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

using namespace fsremote;

int main() {
    // FSREMOTE_URL / FSREMOTE_PIN / FSREMOTE_TIMEOUT / FSREMOTE_LAST_MODE
    // override the built-in defaults.
    if (std::getenv("FSREMOTE_DEBUG") != nullptr) {
        setLogLevel(LogLevel::Debug);
    }

    const auto settings = core::RemoteSettings::fromEnvironment();

    core::CommandExecutor remote(std::make_shared<fsapi::FsapiTransport>());

    std::cout << "Candidates for '" << settings.url << "':\n";
    for (const auto& url : core::CommandExecutor::resolveCandidates(settings.url)) {
        std::cout << "  " << url << "\n";
    }

    auto connected = remote.connect(settings.connectionConfig());
    if (!connected) {
        std::cerr << "Connection failed: " << connected.error().describe() << "\n";
        return 1;
    }

    std::cout << "Connected to '" << connected->friendlyName << "' [" << connected->activeUrl << "]\n";

    if (auto power = remote.getPower()) {
        std::cout << "Power:  " << (*power ? "on" : "off") << "\n";
    } else {
        std::cerr << power.error().describe() << "\n";
    }

    if (auto volume = remote.getVolume()) {
        std::cout << "Volume: " << *volume << "\n";
    } else {
        std::cerr << volume.error().describe() << "\n";
    }

    if (auto modes = remote.listModes()) {
        const auto restored = core::pickRestoredMode(*modes, settings.lastMode);
        std::cout << "Modes:\n";
        for (const auto& mode : *modes) {
            const bool current = restored && restored->key == mode.key;
            std::cout << (current ? "  * " : "    ") << mode.label
                      << " (" << mode.id << ")" << (mode.selectable ? "" : " [not selectable]") << "\n";
        }
    } else {
        std::cerr << modes.error().describe() << "\n";
    }

    if (auto presets = remote.listPresets()) {
        std::cout << "Presets:\n";
        int index = 1;
        for (const auto& preset : *presets) {
            std::cout << "  " << index << ". "
                      << (preset.label.empty() ? "Preset " + std::to_string(index) : preset.label)
                      << "\n";
            ++index;
        }
    } else {
        std::cerr << presets.error().describe() << "\n";
    }

    remote.disconnect();
    return 0;
}
