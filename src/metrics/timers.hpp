#pragma once
#include <chrono>
#include <cstdint>
#include <string>

namespace betarank {

struct WallTimer {
    using clock = std::chrono::steady_clock;
    clock::time_point t0, t1;
    void start() { t0 = clock::now(); }
    void stop()  { t1 = clock::now(); }
    double ms() const { return std::chrono::duration<double, std::milli>(t1 - t0).count(); }
};

struct RunStage {
    std::string   name;
    std::uint64_t calls = 0;
    double        wall_ms = 0.0;
};

// Accumulates wall time over repeated start/stop pairs of one stage.
struct StageTimer {
    std::string   name;
    std::uint64_t calls = 0;
    double        total_ms = 0.0;
    WallTimer     wt{};

    explicit StageTimer(const char* n) : name(n ? n : "(stage)") {}
    void start() { wt.start(); }
    void stop()  { wt.stop(); total_ms += wt.ms(); ++calls; }

    RunStage as_stage() const { return RunStage{ name, calls, total_ms }; }
};

}
