#include "../src/core/sample.hpp"
#include "test_support.hpp"
#include <cassert>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

/**
 * @brief Test Sample record formatting
 *
 * This test suite verifies:
 * 1. Canonical number rendering (fixed vs scientific, integral values)
 * 2. Non-finite sentinels
 * 3. Exact record line for a known sample
 * 4. Repeatable formatting
 * 5. Fields parse back to the supplied values
 */
int main() {
    std::cout << "Testing sample record formatting..." << std::endl;

    // Test 1: Fixed notation
    {
        std::cout << "Test 1: Fixed notation" << std::endl;

        assert(format_number(1700000000.0) == "1700000000.0");
        assert(format_number(1013.25) == "1013.25");
        assert(format_number(21.4) == "21.4");
        assert(format_number(45.0) == "45.0");
        assert(format_number(100.0) == "100.0");
        assert(format_number(0.1) == "0.1");
        assert(format_number(0.0001) == "0.0001");
        assert(format_number(0.00012) == "0.00012");
        assert(format_number(-1013.25) == "-1013.25");
        assert(format_number(1.0 / 3.0) == "0.3333333333333333");
        assert(format_number(1700000000.123456) == "1700000000.123456");
        assert(format_number(9999999999999998.0) == "9999999999999998.0");

        std::cout << "  Fixed notation test passed" << std::endl;
    }

    // Test 2: Zero and signed zero
    {
        std::cout << "Test 2: Zero" << std::endl;

        assert(format_number(0.0) == "0.0");
        assert(format_number(-0.0) == "-0.0");

        std::cout << "  Zero test passed" << std::endl;
    }

    // Test 3: Scientific notation outside [1e-4, 1e16)
    {
        std::cout << "Test 3: Scientific notation" << std::endl;

        assert(format_number(1e16) == "1e+16");
        assert(format_number(1.5e16) == "1.5e+16");
        assert(format_number(1e-5) == "1e-05");
        assert(format_number(1.5e-5) == "1.5e-05");
        assert(format_number(-2.5e-7) == "-2.5e-07");
        assert(format_number(1e100) == "1e+100");
        assert(format_number(5e-324) == "5e-324");

        std::cout << "  Scientific notation test passed" << std::endl;
    }

    // Test 4: Non-finite sentinels
    {
        std::cout << "Test 4: Non-finite sentinels" << std::endl;

        assert(format_number(std::numeric_limits<double>::quiet_NaN()) == "nan");
        assert(format_number(-std::numeric_limits<double>::quiet_NaN()) == "nan");
        assert(format_number(std::numeric_limits<double>::infinity()) == "inf");
        assert(format_number(-std::numeric_limits<double>::infinity()) == "-inf");

        std::cout << "  Non-finite test passed" << std::endl;
    }

    // Test 5: Exact record line
    {
        std::cout << "Test 5: Exact record line" << std::endl;

        Sample s(1700000000.0, 1013.25, 21.4, 45.0, 21.6);
        std::string line = to_record_line(s);
        assert(line == "1700000000.0\t1013.25\t21.4\t45.0\t21.6\n");

        Sample degraded(1700000060.0, std::numeric_limits<double>::quiet_NaN(), 21.4, 45.0, 21.6);
        assert(to_record_line(degraded) == "1700000060.0\tnan\t21.4\t45.0\t21.6\n");
        assert(!degraded.all_finite());
        assert(s.all_finite());

        std::cout << "  Record line: " << line;
        std::cout << "  Exact record line test passed" << std::endl;
    }

    // Test 6: Repeatable formatting
    {
        std::cout << "Test 6: Repeatable formatting" << std::endl;

        Sample s(1712345678.912345, 998.7654321, -3.25, 99.99, 0.001);
        std::string a = to_record_line(s);
        std::string b = to_record_line(s);
        assert(a == b);

        std::cout << "  Repeatable formatting test passed" << std::endl;
    }

    // Test 7: Fields parse back to the supplied values
    {
        std::cout << "Test 7: Field round trip" << std::endl;

        std::vector<Sample> samples = {
            Sample(1700000000.0, 1013.25, 21.4, 45.0, 21.6),
            Sample(1712345678.912345, 998.7654321, -3.25, 99.99, 0.001),
            Sample(0.1 + 0.2, 1e-7, 1e20, 33.333333333333336, -40.0),
            Sample(1700000000.0, std::numeric_limits<double>::quiet_NaN(),
                   std::numeric_limits<double>::infinity(), 45.0,
                   -std::numeric_limits<double>::infinity()),
        };

        for (const auto& s : samples) {
            std::string line = to_record_line(s);
            assert(!line.empty() && line.back() == '\n');
            assert(line.find('\n') == line.size() - 1);

            auto fields = TestSupport::split(line.substr(0, line.size() - 1), '\t');
            assert(fields.size() == 5);

            const double expected[5] = {s.captured_at, s.pressure, s.temperature_from_pressure,
                                        s.humidity, s.temperature_from_humidity};
            for (int i = 0; i < 5; i++) {
                char* end = nullptr;
                double parsed = std::strtod(fields[i].c_str(), &end);
                assert(end != nullptr && *end == '\0');
                if (std::isnan(expected[i])) {
                    assert(std::isnan(parsed));
                } else {
                    assert(parsed == expected[i]);
                }
            }
        }

        std::cout << "  Field round trip test passed" << std::endl;
    }

    // Test 8: Diagnostic string
    {
        std::cout << "Test 8: Diagnostic string" << std::endl;

        Sample s(1700000000.0, 1013.25, 21.4, 45.0, 21.6);
        std::string str = s.to_string();
        assert(str.find("pressure=1013.25hPa") != std::string::npos);
        assert(str.find("humidity=45.00%") != std::string::npos);

        Sample zero;
        assert(zero.captured_at == 0.0 && zero.pressure == 0.0 && zero.humidity == 0.0);

        std::cout << "  Diagnostic string test passed" << std::endl;
    }

    std::cout << "✅ All sample formatting tests passed!" << std::endl;
    return 0;
}
