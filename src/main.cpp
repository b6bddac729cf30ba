#include "app/Application.hpp"

#include <spdlog/spdlog.h>

int main(int argc, char* argv[]) {
    try {
        signfleet::app::Application app(argc, argv);
        return app.run();
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
