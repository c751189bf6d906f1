#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>

#include "app/ScoreShelfApp.hpp"

namespace fs = std::filesystem;

namespace {

fs::path writeSettings(const std::string& name, const std::string& content) {
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path dir = fs::temp_directory_path() / ("scoreshelf_app_" + name + "_" + std::to_string(stamp));
    fs::create_directories(dir);
    std::ofstream out(dir / "settings.json");
    out << content;
    return dir;
}

void testStopBeforeRunSkipsListen() {
    fs::path dir = writeSettings("early", R"({"host": "127.0.0.1", "port": 18731, "storage": "memory"})");
    scoreshelf::app::ScoreShelfApp app((dir / "settings.json").string());
    app.RequestStop();

    auto start = std::chrono::steady_clock::now();
    int code = app.Run();
    assert(code == 0);
    assert(std::chrono::steady_clock::now() - start < std::chrono::seconds(5));

    fs::remove_all(dir);
    std::cout << "[PASS] stop requested before Run() is honored" << std::endl;
}

void testStopWhileServing() {
    fs::path dir = writeSettings("serving", R"({"host": "127.0.0.1", "port": 18732, "storage": "memory"})");
    scoreshelf::app::ScoreShelfApp app((dir / "settings.json").string());

    std::atomic<bool> returned{false};
    std::thread runner([&] {
        app.Run();
        returned = true;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    app.RequestStop();

    for (int i = 0; i < 100 && !returned; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    assert(returned);
    runner.join();

    fs::remove_all(dir);
    std::cout << "[PASS] stop while serving returns from Run()" << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting ScoreShelfApp tests..." << std::endl;
    testStopBeforeRunSkipsListen();
    testStopWhileServing();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
