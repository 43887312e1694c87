#include <iostream>
#include <cstdint>
#include <exception>

#include "control/settings.hpp"
#include "control/pipeline.hpp"
#include "io/document_reader.hpp"

int main() {
    RunSettings settings;

    try {
        if (settings.log_progress) {
            std::cerr << "Reading calibration document " << settings.input_path << "..." << std::endl;
        }
        auto lines = read_lines(settings.input_path);

        if (settings.log_progress) {
            std::cerr << "Extracting calibration values from " << lines.size() << " lines..." << std::endl;
        }
        CalibrationPipeline pipeline;
        std::uint64_t sum = pipeline.run(lines);

        if (settings.log_summary) {
            std::cerr << "Calibration stats: " << pipeline.stats().to_json().dump() << std::endl;
        }

        std::cout << "Sum is " << sum << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
