#include "application.h"

int main(int argc, char** argv) {
    Application app;
    if (!app.init(argc, argv)) {
        return Application::EXIT_USAGE;
    }
    return app.run();
}
