#include "AgentSuite.h"
#include "BaselineStore.h"
#include "Config.h"
#include "Logger.h"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <random>
#include <string>
#include <vector>

/**
 * @brief BehaviorSentinel scenario demo
 *
 * Trains the three agents on a simulated legitimate user, then replays:
 * - legitimate behaviour
 * - suspicious behaviour (erratic touch, heavy corrections, unfamiliar apps)
 * - bot behaviour (ruler-straight swipes, pasted input, task switching bursts)
 *
 * Usage: behavior_demo [config-file]
 */

using namespace BehaviorSentinel;

namespace {

constexpr double PI = 3.14159265358979323846;

/// Simulated wall clock shared by every component
struct ManualClock {
    int64_t now = 1700000000000;

    Clock clock() {
        return [this]() { return now; };
    }
    void advance(int64_t ms) { now += ms; }
};

struct SwipeShape {
    float x0, y0, x1, y1;
    int64_t durationMs;
    int steps;
    double wobble;        // peak sideways offset in px
    float pressure;
};

void swipe(AgentSuite& suite, ManualClock& clock, int pointer, const SwipeShape& s) {
    TouchAgent& touch = suite.touch();
    touch.onTouchDown(pointer, s.x0, s.y0, s.pressure, 0.1f);
    double dx = s.x1 - s.x0;
    double dy = s.y1 - s.y0;
    double length = std::sqrt(dx * dx + dy * dy);
    double nx = length > 0 ? -dy / length : 0.0;
    double ny = length > 0 ? dx / length : 0.0;

    for (int i = 1; i < s.steps; ++i) {
        clock.advance(s.durationMs / s.steps);
        double t = static_cast<double>(i) / s.steps;
        double offset = s.wobble * std::sin(PI * t);
        touch.onTouchMove(pointer,
                          static_cast<float>(s.x0 + dx * t + nx * offset),
                          static_cast<float>(s.y0 + dy * t + ny * offset),
                          s.pressure, 0.1f);
    }
    clock.advance(s.durationMs - (s.durationMs / s.steps) * (s.steps - 1));
    touch.onTouchUp(pointer, s.x1, s.y1, s.pressure, 0.1f);
}

void tap(AgentSuite& suite, ManualClock& clock, float x, float y, int64_t holdMs, float pressure) {
    suite.touch().onTouchDown(0, x, y, pressure, 0.1f);
    clock.advance(holdMs);
    suite.touch().onTouchUp(0, x + 1.0f, y + 1.0f, pressure, 0.1f);
}

void typeKeys(AgentSuite& suite, ManualClock& clock, std::mt19937& rng, int keys,
              int64_t dwellMs, int64_t flightMs, int64_t spreadMs, int backspaceEvery) {
    std::uniform_int_distribution<int64_t> jitter(-spreadMs, spreadMs);
    std::uniform_int_distribution<int> letter(29, 54);
    for (int i = 0; i < keys; ++i) {
        int code = (backspaceEvery > 0 && i % backspaceEvery == backspaceEvery - 1)
            ? TypingAgent::KEYCODE_BACKSPACE
            : letter(rng);
        int64_t dwell = std::max<int64_t>(1, dwellMs + jitter(rng));
        int64_t flight = std::max<int64_t>(dwell + 1, flightMs + jitter(rng));
        suite.typing().onKeyEvent(true, code, 0.5f);
        clock.advance(dwell);
        suite.typing().onKeyEvent(false, code, 0.5f);
        clock.advance(flight - dwell);
    }
}

void useApp(AgentSuite& suite, ManualClock& clock, const std::string& app, int64_t sessionMs) {
    suite.usage().onAppOpened(app);
    clock.advance(sessionMs);
    suite.usage().onAppClosed(app);
}

void trainLegitimateUser(AgentSuite& suite, ManualClock& clock, std::mt19937& rng) {
    std::uniform_real_distribution<double> wobble(6.0, 18.0);
    std::uniform_int_distribution<int64_t> swipeMs(260, 420);
    std::uniform_int_distribution<int64_t> holdMs(70, 140);
    std::uniform_int_distribution<int64_t> sessionMs(40000, 90000);
    const std::vector<std::string> apps = {"com.mail", "com.browser", "com.chat", "com.maps"};

    for (int i = 0; i < 40; ++i) {
        swipe(suite, clock, 0, {100.0f, 800.0f, 140.0f, 300.0f, swipeMs(rng), 12, wobble(rng), 0.55f});
        clock.advance(600);
        tap(suite, clock, 200.0f, 400.0f, holdMs(rng), 0.5f);
        clock.advance(900);
    }
    typeKeys(suite, clock, rng, 220, 95, 210, 35, 20);
    for (int i = 0; i < 30; ++i) {
        useApp(suite, clock, apps[i % apps.size()], sessionMs(rng));
        clock.advance(15000);
    }
}

void replayLegitimate(AgentSuite& suite, ManualClock& clock, std::mt19937& rng) {
    std::uniform_real_distribution<double> wobble(6.0, 18.0);
    std::uniform_int_distribution<int64_t> swipeMs(260, 420);
    for (int i = 0; i < 10; ++i) {
        swipe(suite, clock, 0, {100.0f, 800.0f, 140.0f, 300.0f, swipeMs(rng), 12, wobble(rng), 0.55f});
        clock.advance(700);
        tap(suite, clock, 200.0f, 400.0f, 100, 0.5f);
        clock.advance(800);
    }
    typeKeys(suite, clock, rng, 40, 95, 210, 35, 20);
    useApp(suite, clock, "com.mail", 60000);
    clock.advance(15000);
    useApp(suite, clock, "com.browser", 70000);
}

void replaySuspicious(AgentSuite& suite, ManualClock& clock, std::mt19937& rng) {
    std::uniform_real_distribution<double> wobble(40.0, 90.0);
    std::uniform_int_distribution<int64_t> swipeMs(90, 160);
    for (int i = 0; i < 10; ++i) {
        swipe(suite, clock, 0, {50.0f, 900.0f, 400.0f, 100.0f, swipeMs(rng), 6, wobble(rng), 0.9f});
        clock.advance(300);
        tap(suite, clock, 220.0f, 420.0f, 350, 0.95f);
        clock.advance(300);
    }
    typeKeys(suite, clock, rng, 40, 180, 420, 120, 3);
    useApp(suite, clock, "com.bank", 4000);
    suite.usage().onAppSwitch("com.bank", "com.settings");
    clock.advance(2000);
    suite.usage().onAppSwitch("com.settings", "com.files");
    clock.advance(1500);
    suite.usage().onAppClosed("com.files");
}

void replayBot(AgentSuite& suite, ManualClock& clock, std::mt19937& rng) {
    for (int i = 0; i < 12; ++i) {
        swipe(suite, clock, 0, {100.0f, 900.0f, 100.0f, 100.0f, 100, 5, 0.0, 1.0f});
        clock.advance(200);
    }
    typeKeys(suite, clock, rng, 30, 3, 5, 0, 0);
    std::string previous = "com.bank";
    suite.usage().onAppOpened(previous);
    for (int i = 0; i < 15; ++i) {
        clock.advance(500);
        std::string next = "com.unknown" + std::to_string(i);
        suite.usage().onAppSwitch(previous, next);
        previous = next;
    }
    clock.advance(500);
    suite.usage().onAppClosed(previous);
}

void printAgent(const std::string& name, const AgentResult& result) {
    std::cout << "  " << name << ": " << result.score() << std::endl;
    for (const auto& explanation : result.explanations()) {
        std::cout << "    - " << explanation << std::endl;
    }
}

void printVerdict(const std::string& title, const SuiteVerdict& verdict) {
    std::cout << std::endl;
    std::cout << "----------------------------------" << std::endl;
    std::cout << title << std::endl;
    std::cout << "----------------------------------" << std::endl;
    printAgent(TouchAgent::AGENT_NAME, verdict.touch);
    printAgent(TypingAgent::AGENT_NAME, verdict.typing);
    printAgent(UsageAgent::AGENT_NAME, verdict.usage);
    std::cout << "  Fused score: " << verdict.fusion.finalScore
              << " (" << riskLevelToString(verdict.fusion.riskLevel) << ")" << std::endl;
    std::cout << FusionEngine::toJson(verdict.fusion) << std::endl;
    std::cout << "  Action: " << verdict.alert.action
              << (verdict.alert.shouldAlert ? " [alert raised]" : "") << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    std::cout << "==================================" << std::endl;
    std::cout << "BehaviorSentinel - Scenario Demo" << std::endl;
    std::cout << "==================================" << std::endl;

    Config config;
    if (argc > 1) {
        auto loaded = config.loadFromFile(argv[1]);
        if (!loaded) {
            std::cerr << "Error: " << loaded.error().message << std::endl;
            return 1;
        }
    }
    auto valid = validateConfig(config);
    if (!valid) {
        std::cerr << "Error: " << valid.error().message << std::endl;
        return 1;
    }

    auto& logger = Logger::instance();
    logger.setLevel(parseLogLevel(config.get("log.level", "WARN"), LogLevel::WARN));
    logger.setMaxFileSize(config.getSize("log.max_size_mb", 100));
    std::string logFile = config.get("log.file");
    if (!logFile.empty()) {
        logger.setLogFile(logFile);
    }
    logger.setComponent("Demo");

    ManualClock clock;
    std::mt19937 rng(42);
    AgentSuite suite(AgentSuite::Settings::fromConfig(config), clock.clock());

    BaselineStore store;
    std::string storePath = config.get("store.path", ":memory:");
    auto opened = store.initialize(storePath);
    if (opened) {
        suite.attachStore(&store);
        size_t restored = suite.loadState(store);
        std::cout << "Store: " << storePath << " (" << restored << " agent baseline(s) restored)" << std::endl;
    } else {
        std::cerr << "Warning: running without store: " << opened.error().message << std::endl;
    }

    suite.startAll();

    std::cout << "Training on legitimate behaviour..." << std::endl;
    trainLegitimateUser(suite, clock, rng);

    suite.stopAll();
    suite.startAll();
    replayLegitimate(suite, clock, rng);
    printVerdict("Scenario 1: legitimate user", suite.evaluate("legitimate replay"));

    clock.advance(120000);
    suite.stopAll();
    suite.startAll();
    replaySuspicious(suite, clock, rng);
    printVerdict("Scenario 2: suspicious behaviour", suite.evaluate("suspicious replay"));

    clock.advance(120000);
    suite.stopAll();
    suite.startAll();
    replayBot(suite, clock, rng);
    printVerdict("Scenario 3: bot / automated attack", suite.evaluate("bot replay"));

    suite.stopAll();
    if (store.isOpen()) {
        auto saved = suite.saveState(store);
        if (!saved) {
            std::cerr << "Warning: " << saved.error().message << std::endl;
        }
        store.shutdown();
    }

    std::cout << std::endl << "Demo complete." << std::endl;
    return 0;
}
