#include <csignal>
#include <filesystem>
#include <string>

#include "app/ScoreShelfApp.hpp"
#include "infrastructure/PathUtils.hpp"

namespace {
scoreshelf::app::ScoreShelfApp* g_app = nullptr;

void HandleSignal(int) {
    if (g_app) {
        g_app->RequestStop();
    }
}
}

int main(int argc, char** argv) {
    std::string configPath = "settings.json";
    if (argc > 1) {
        configPath = argv[1];
    } else if (!std::filesystem::exists(configPath)) {
        configPath = (scoreshelf::infrastructure::PathUtils::GetConfigHome() / "settings.json").string();
    }

    scoreshelf::app::ScoreShelfApp app(configPath);
    g_app = &app;
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    int code = app.Run();
    g_app = nullptr;
    return code;
}
