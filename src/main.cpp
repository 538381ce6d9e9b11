#include "studydesk.hpp"

#include <cstdlib>
#include <iostream>

int main() {
    int code = 1;
    try {
        StudyDesk app(StudyDesk::LogLevelFromEnv());
        code = app.Run();
    } catch (const std::exception &e) {
        spdlog::critical("fatal: {}", e.what());
        spdlog::default_logger()->flush();
        std::cerr << "studydesk: " << e.what() << "\n";
    }

    // Abandoned AI requests still log; static teardown must wait for them.
    if (!AsyncWork::Drain(std::chrono::seconds(3))) {
        spdlog::warn("{} background request(s) still running at exit", AsyncWork::Running());
        spdlog::default_logger()->flush();
        std::quick_exit(code);
    }
    return code;
}
