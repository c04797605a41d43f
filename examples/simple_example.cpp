#include <iostream>
#include <vector>
#include "kadane/kadane.h"

int main() {
    try {
        std::cout << "KADANE Simple Example\n";
        std::cout << "=====================\n\n";

        std::vector<int32_t> values = {-2, 1, -3, 4, -1, 2, 1, -5, 4};

        // Plain scan without instrumentation
        const kadane::SubarrayResult result = kadane::scan(values);
        std::cout << "Input:    ";
        for (int32_t v : values) std::cout << v << " ";
        std::cout << "\nResult:   " << result << "\n";

        const auto slice = result.subarray(values);
        std::cout << "Subarray: ";
        for (int32_t v : *slice) std::cout << v << " ";
        std::cout << "\n\n";

        // Instrumented scan, recorded into a shared history
        kadane::RunHistory history;
        kadane::RunRecorder recorder(history, kadane::ALGORITHM_BASELINE);
        kadane::MetricsCounter metrics;
        kadane::ArrayGenerator generator;

        for (size_t size : {1000u, 10000u}) {
            const auto data = generator.generate(size, kadane::Distribution::RANDOM);
            const auto wide = kadane::scan<int64_t>(data, metrics);
            std::cout << metrics.toString("size " + std::to_string(size)) << "\n";
            std::cout << "  max sum " << wide.maxSum << " over " << wide.length() << " elements\n";
            recorder.record(metrics, data.size(), "random");
        }

        std::cout << "\nRecorded " << history.size() << " runs:\n";
        const auto records = history.snapshot();
        kadane::writeRunsCsv(std::cout, records);

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
