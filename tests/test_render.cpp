/*
 * Bar graph tests: exact output, pacing and cancellation
 */

#include <chrono>
#include <cstdio>
#include <sstream>
#include <streambuf>
#include <string>
#include <thread>
#include <vector>

#include "BarGraphRenderer.hpp"
#include "CancellationToken.hpp"
#include "PhaseContext.hpp"
#include "PhaseScheduler.hpp"
#include "test_harness.hpp"

using Clock = std::chrono::steady_clock;

// Unbuffered streambuf that remembers when every character arrived
class TimestampBuf : public std::streambuf {
public:
    struct Entry {
        char c;
        Clock::time_point at;
    };
    std::vector<Entry> entries;

protected:
    int overflow(int c) override {
        if (c != traits_type::eof()) {
            entries.push_back({static_cast<char>(c), Clock::now()});
        }
        return c;
    }
};

static PhaseContext makeContext(const char* caption, std::chrono::microseconds perColumn) {
    PhaseContext ctx;
    ctx.caption = caption;
    ctx.delay.perColumn = perColumn;
    return ctx;
}

// Test: outline, carriage return, fill, newline, in that order
bool test_exact_output() {
    std::ostringstream out;
    BarGraphRenderer renderer(out, 5);
    CancellationToken token;

    bool done = renderer.render(makeContext("IN ", std::chrono::microseconds(100)), token);

    TEST_ASSERT(done, "render should complete");
    TEST_ASSERT(out.str() == "IN  [     ]\rIN  [#####\n", "unexpected bar text");
    TEST_ASSERT(renderer.getFilled() == 5, "all columns filled");
    return true;
}

// Test: width stays fixed: outline is caption + " [" + columns + "]"
bool test_outline_width() {
    std::ostringstream out;
    BarGraphRenderer renderer(out, 40);

    std::string line = renderer.outline("OUT");
    TEST_ASSERT(line.size() == 3 + 2 + 40 + 1, "outline width");
    TEST_ASSERT(line.front() == 'O' && line.back() == ']', "outline framing");
    TEST_ASSERT(line.find('#') == std::string::npos, "outline has no fill");
    return true;
}

bool test_custom_fill() {
    std::ostringstream out;
    BarGraphRenderer renderer(out, 3, '=');
    CancellationToken token;

    renderer.render(makeContext("OUT", std::chrono::microseconds(10)), token);
    TEST_ASSERT(out.str() == "OUT [   ]\rOUT [===\n", "fill character should be '='");
    return true;
}

// Test: renderer reuse starts each bar from zero
bool test_consecutive_bars() {
    std::ostringstream out;
    BarGraphRenderer renderer(out, 2);
    CancellationToken token;

    renderer.render(makeContext("IN ", std::chrono::microseconds(10)), token);
    renderer.render(makeContext("OUT", std::chrono::microseconds(10)), token);

    TEST_ASSERT(out.str() == "IN  [  ]\rIN  [##\nOUT [  ]\rOUT [##\n", "two bars, one per line");
    return true;
}

// Test: 40 columns, each '#' at least one delay after the previous one,
// and the whole bar close to the phase duration
bool test_pacing_40_columns() {
    TimestampBuf buf;
    std::ostream out(&buf);
    BarGraphRenderer renderer(out, 40);
    CancellationToken token;

    PhaseDelay delay = PhaseScheduler::perColumnDelay(1, 40);   // 25 ms
    PhaseContext ctx = makeContext("IN ", delay.perColumn);

    auto start = Clock::now();
    bool done = renderer.render(ctx, token);
    auto elapsed = Clock::now() - start;

    TEST_ASSERT(done, "render should complete");

    std::vector<Clock::time_point> fills;
    for (const auto& e : buf.entries) {
        if (e.c == '#') fills.push_back(e.at);
    }
    TEST_ASSERT(fills.size() == 40, "exactly 40 fill steps");

    for (std::size_t i = 1; i < fills.size(); ++i) {
        TEST_ASSERT(fills[i] - fills[i - 1] >= delay.perColumn, "fill came early");
    }

    TEST_ASSERT(elapsed >= std::chrono::seconds(1), "phase finished before its duration");
    TEST_ASSERT(elapsed < std::chrono::milliseconds(1500), "phase overran by more than 500 ms");
    TEST_ASSERT(buf.entries.back().c == '\n', "bar ends with a newline");
    return true;
}

// Test: cancelling mid-bar stops promptly and leaves the line open
bool test_cancel_mid_bar() {
    std::ostringstream out;
    BarGraphRenderer renderer(out, 40);
    CancellationToken token;

    std::thread canceller([&token]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(120));
        token.cancel();
    });

    auto start = Clock::now();
    bool done = renderer.render(makeContext("OUT", std::chrono::milliseconds(50)), token);
    auto elapsed = Clock::now() - start;
    canceller.join();

    TEST_ASSERT(!done, "render should report cancellation");
    TEST_ASSERT(renderer.getFilled() > 0 && renderer.getFilled() < 40, "bar left part filled");
    TEST_ASSERT(out.str().find('\n') == std::string::npos, "no newline after cancellation");
    TEST_ASSERT(elapsed < std::chrono::milliseconds(1000), "cancellation should end the wait early");
    return true;
}

// Test: already-cancelled token draws nothing at all
bool test_cancelled_before_start() {
    std::ostringstream out;
    BarGraphRenderer renderer(out, 10);
    CancellationToken token;
    token.cancel();

    bool done = renderer.render(makeContext("IN ", std::chrono::milliseconds(10)), token);
    TEST_ASSERT(!done, "render should not run");
    TEST_ASSERT(out.str().empty(), "nothing written");
    return true;
}

bool test_token_wait() {
    CancellationToken token;
    TEST_ASSERT(token.waitFor(std::chrono::milliseconds(5)), "uncancelled wait runs out");
    token.cancel();
    TEST_ASSERT(token.isCancelled(), "cancel sticks");

    auto start = Clock::now();
    TEST_ASSERT(!token.waitFor(std::chrono::seconds(10)), "cancelled wait returns false");
    TEST_ASSERT(Clock::now() - start < std::chrono::seconds(1), "cancelled wait returns at once");
    return true;
}

int main() {
    printf("BreathPacer Render Test Suite\n");
    printf("===================================\n\n");

    int total = 0, passed = 0, failed = 0;

    RUN_TEST(test_exact_output);
    RUN_TEST(test_outline_width);
    RUN_TEST(test_custom_fill);
    RUN_TEST(test_consecutive_bars);
    RUN_TEST(test_pacing_40_columns);
    RUN_TEST(test_cancel_mid_bar);
    RUN_TEST(test_cancelled_before_start);
    RUN_TEST(test_token_wait);

    PRINT_RESULTS();

    return (failed == 0) ? 0 : 1;
}
