#pragma once
// =====================================================
// Application Class
// =====================================================
// Wires the strip, the selected animation and the command
// console together for the host executable.
//
// Usage:
//   Application app;
//   if (!app.init(argc, argv)) return 1;
//   return app.run();
// =====================================================

#include <stdint.h>
#include <stddef.h>
#include <memory>
#include "animation_registry.h"
#include "led_animation.h"

class Application {
public:
    // Exit codes returned by run()
    static constexpr int EXIT_OK = 0;
    static constexpr int EXIT_USAGE = 1;
    static constexpr int EXIT_DEVICE_ERROR = 2;

    struct Options {
        const char* animationName = nullptr;
        AnimationParams params;
        uint32_t timeoutMs = LedAnimation::NO_TIMEOUT;
        bool oneShot = false;
        bool explicitMode = false;  // --timeout or --one-shot given
        bool verbose = false;
        size_t ledCount = 0;
    };

    Application();

    // Parse arguments and construct the animation
    // Returns: false on bad arguments (usage is printed)
    bool init(int argc, char** argv);

    // Run the animation on the calling thread with the console
    // on a second thread; returns the process exit code
    int run();

    // Parse command line arguments (argv[0] is skipped)
    // Returns: false on an unknown option or malformed value
    static bool parseArgs(int argc, char** argv, Options& out);

    // Start with the requested timeout/one-shot, or with the
    // animation's natural mode when neither was given
    static bool startAnimation(LedAnimation& animation, const Options& options);

    // =====================================================
    // Component Access (for testing/debugging)
    // =====================================================

    const Options& options() const { return _options; }
    LedAnimation* animation() { return _animation.get(); }

private:
    static void printUsage();

    Options _options;
    ILedStrip* _strip;
    std::unique_ptr<LedAnimation> _animation;
};
