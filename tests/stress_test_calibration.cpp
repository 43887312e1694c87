#include "../src/control/pipeline.hpp"
#include "stress_test_framework.hpp"
#include <cassert>
#include <iostream>
#include <algorithm>
#include <random>

/**
 * @brief Randomised stress testing for calibration extraction
 *
 * Tests include:
 * 1. Extraction agrees with a brute-force reference on random lines
 * 2. Digit-free random lines are always rejected
 * 3. Document sums do not depend on line order
 * 4. Throughput on long documents
 */

int main() {
    std::cout << "🔥 STRESS TESTING: Calibration extraction" << std::endl;
    std::cout << "=========================================" << std::endl;

    // Test 1: Reference agreement
    {
        std::cout << "\n🚀 Test 1: Agreement with reference extractor" << std::endl;

        StressTest::LineGenerator gen(1);
        const int iterations = 200000;
        int checked = 0;

        for (int i = 0; i < iterations; i++) {
            std::string line = gen.next(12);
            auto expected = StressTest::reference_calibration(line);
            if (!expected) continue;

            unsigned value = extract_calibration_value(line);
            if (value != *expected) {
                std::cout << "  Mismatch on \"" << line << "\": got " << value
                          << ", expected " << *expected << std::endl;
            }
            assert(value == *expected);
            assert(value <= 99);
            checked++;
        }

        std::cout << "  Checked " << checked << " lines" << std::endl;
        assert(checked > iterations / 2);
        std::cout << "✅ Reference agreement PASSED" << std::endl;
    }

    // Test 2: Digit-free lines
    {
        std::cout << "\n🚀 Test 2: Digit-free lines" << std::endl;

        StressTest::LineGenerator gen(2);
        for (int i = 0; i < 20000; i++) {
            std::string line = gen.next(30, true);
            assert(!StressTest::reference_calibration(line));

            bool threw = false;
            try {
                extract_calibration_value(line);
            } catch (const CalibrationError&) {
                threw = true;
            }
            assert(threw);
        }

        std::cout << "✅ Digit-free rejection PASSED" << std::endl;
    }

    // Test 3: Order independence of document sums
    {
        std::cout << "\n🚀 Test 3: Shuffled documents" << std::endl;

        StressTest::LineGenerator gen(3);
        std::vector<std::string> lines;
        while (lines.size() < 1000) {
            std::string line = gen.next(10);
            if (StressTest::reference_calibration(line)) {
                lines.push_back(line);
            }
        }

        CalibrationPipeline baseline;
        std::uint64_t expected = baseline.run(lines);

        for (int round = 0; round < 20; round++) {
            std::shuffle(lines.begin(), lines.end(), gen.engine());
            CalibrationPipeline pipeline;
            assert(pipeline.run(lines) == expected);
        }

        std::cout << "  Document sum: " << expected << std::endl;
        std::cout << "✅ Shuffled documents PASSED" << std::endl;
    }

    // Test 4: Throughput
    {
        std::cout << "\n🚀 Test 4: Throughput" << std::endl;

        StressTest::LineGenerator gen(4);
        StressTest::ExtractionTimer timer;
        CalibrationPipeline pipeline;

        const int iterations = 100000;
        uint64_t expected_sum = 0;
        for (int i = 0; i < iterations; i++) {
            std::string line = gen.next(20) + "7";
            expected_sum += timer.measure([&] { return pipeline.process_line(line); });
        }

        timer.report("Calibration pipeline");
        auto summary = timer.summarize();

        assert(timer.calls() == static_cast<uint64_t>(iterations));
        assert(summary.calls == static_cast<uint64_t>(iterations));
        assert(pipeline.lines_processed() == static_cast<uint64_t>(iterations));
        assert(pipeline.sum() == expected_sum);
        assert(summary.median_us <= summary.p99_us && summary.p99_us <= summary.worst_us);
        assert(summary.lines_per_sec > 1000);

        std::cout << "✅ Throughput PASSED" << std::endl;
    }

    std::cout << "\n🏁 All calibration stress tests passed!" << std::endl;
    return 0;
}
