#include <iostream>
#include <chrono>
#include <cstring>
#include <memory>
#include <string>

#include <SDL.h>

#include "AvatarConfig.hpp"
#include "AvatarViewerApp.hpp"

using namespace AVATAR;

int main(int argc, char** argv) {
    // Defaults for convenience; can be overridden via command line.
    const std::string kDefaultRigPath = "assets/rigs/assistant.json";
    const std::string kDefaultScriptPath = "assets/sessions/hello.json";
    const std::string kDefaultConfigPath = "assets/avatar_config.json";

    bool use_microphone = false;
    std::string args[3] = { kDefaultRigPath, kDefaultScriptPath, kDefaultConfigPath };
    int positional = 0;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--mic") == 0) {
            use_microphone = true;
        }
        else if (positional < 3) {
            args[positional++] = argv[i];
        }
    }

    if (argc < 2) {
        std::cout << "Usage: " << argv[0] << " [RIG_PATH] [SESSION_PATH] [CONFIG_PATH] [--mic]\n"
                  << "  Defaults:\n"
                  << "    " << kDefaultRigPath << "\n"
                  << "    " << kDefaultScriptPath << "\n"
                  << "    " << kDefaultConfigPath << "\n"
                  << "  --mic lip-syncs to the default capture device (needs allow_local_audio)\n"
                  << std::endl;
    }

    AvatarConfig config;
    LoadAvatarConfigFile(args[2], config);

    std::unique_ptr<AvatarViewerApp> app = std::make_unique<AvatarViewerApp>(
        "Avatar Viewer", config, args[0], args[1], use_microphone);

    if (!app->SetupScene()) {
        return 1;
    }

    using Clock = std::chrono::high_resolution_clock;
    using TimePoint =
        std::chrono::time_point<Clock, std::chrono::duration<double>>;
    TimePoint last_tick_time = Clock::now();
    TimePoint start_tick_time = last_tick_time;

    while (!app->IsFinished()) {
        TimePoint current_tick_time = Clock::now();
        double delta_time = (current_tick_time - last_tick_time).count();
        double total_elapsed_time =
            (current_tick_time - start_tick_time).count();
        app->Tick(delta_time, total_elapsed_time);
        last_tick_time = current_tick_time;
        SDL_Delay(5);
    }

    return 0;
}
