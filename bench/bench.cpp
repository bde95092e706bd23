/**
 * @file bench.cpp
 * @brief Performance benchmarks for bitcodec.
 *
 * Measures bit-level read/write throughput for regression testing during
 * development. Use the results for relative comparisons only.
 *
 * Usage:
 *   ./build/bitcodec_bench              # Run with default 100 iterations
 *   ./build/bitcodec_bench 1000         # Run with custom iteration count
 */

#include <bitcodec/bitcodec.hpp>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

using namespace bitcodec;

static constexpr int DEFAULT_ITERATIONS = 100;
static constexpr std::size_t BUFFER_BYTES = 64U * 1024U;

static void report(const char* name, double total_us, int iterations, std::size_t bits_per_iter) {
    double per_iter_us = total_us / static_cast<double>(iterations);
    double throughput_mbps = static_cast<double>(bits_per_iter) / per_iter_us;

    std::printf("%-28s %10.2f µs/iter  %10.1f Mbit/s\n", name, per_iter_us, throughput_mbps);
}

/**
 * @brief Fill the buffer with fields of a fixed width, then read them back.
 */
static void bench_fields(const char* name, std::size_t width, bool big_endian, int iterations) {
    std::vector<std::uint8_t> buffer(BUFFER_BYTES, 0);
    BitStream stream(buffer);
    stream.set_big_endian(big_endian);

    std::size_t fields = (BUFFER_BYTES * 8) / width;
    std::uint32_t mask = (width >= 32) ? 0xFFFFFFFFU : ((1U << width) - 1U);
    std::uint32_t checksum = 0;

    auto start = std::chrono::high_resolution_clock::now();

    for (int iter = 0; iter < iterations; ++iter) {
        throw_if_error(stream.set_index(0), "rewind");
        for (std::size_t i = 0; i < fields; ++i) {
            throw_if_error(stream.write_bits(static_cast<std::uint32_t>(i) & mask, width),
                           "write_bits");
        }

        throw_if_error(stream.set_index(0), "rewind");
        for (std::size_t i = 0; i < fields; ++i) {
            std::uint32_t value = 0;
            throw_if_error(stream.read_bits(width, value), "read_bits");
            checksum += value;
        }
    }

    auto end = std::chrono::high_resolution_clock::now();
    double total_us = std::chrono::duration<double, std::micro>(end - start).count();

    report(name, total_us, iterations, fields * width * 2);
    if (checksum == 0xFFFFFFFFU) {
        std::printf("  (checksum %u)\n", checksum);
    }
}

static void bench_float64(int iterations) {
    std::vector<std::uint8_t> buffer(BUFFER_BYTES + 1, 0);
    BitStream stream(buffer);

    // Offset by 3 bits so every value straddles byte boundaries
    std::size_t count = (BUFFER_BYTES * 8) / 64;
    double sum = 0.0;

    auto start = std::chrono::high_resolution_clock::now();

    for (int iter = 0; iter < iterations; ++iter) {
        throw_if_error(stream.set_index(3), "rewind");
        for (std::size_t i = 0; i < count; ++i) {
            throw_if_error(stream.write_float64(static_cast<double>(i) * 0.5), "write_float64");
        }

        throw_if_error(stream.set_index(3), "rewind");
        for (std::size_t i = 0; i < count; ++i) {
            double value = 0.0;
            throw_if_error(stream.read_float64(value), "read_float64");
            sum += value;
        }
    }

    auto end = std::chrono::high_resolution_clock::now();
    double total_us = std::chrono::duration<double, std::micro>(end - start).count();

    report("float64 (3-bit offset)", total_us, iterations, count * 64 * 2);
    if (sum < 0.0) {
        std::printf("  (sum %f)\n", sum);
    }
}

static void bench_strings(int iterations) {
    std::vector<std::uint8_t> buffer(BUFFER_BYTES, 0);
    BitStream stream(buffer);
    const std::u32string text = U"Grüße aus €-Land \U0001F600";

    std::vector<std::uint8_t> encoded;
    throw_if_error(encode_utf8(text, encoded), "encode_utf8");
    std::size_t record_bytes = encoded.size() + 1;
    std::size_t records = BUFFER_BYTES / record_bytes;

    auto start = std::chrono::high_resolution_clock::now();

    for (int iter = 0; iter < iterations; ++iter) {
        throw_if_error(stream.set_index(0), "rewind");
        for (std::size_t i = 0; i < records; ++i) {
            throw_if_error(stream.write_utf8_string(text), "write_utf8_string");
        }

        throw_if_error(stream.set_index(0), "rewind");
        for (std::size_t i = 0; i < records; ++i) {
            std::u32string decoded;
            throw_if_error(stream.read_utf8_string(decoded), "read_utf8_string");
        }
    }

    auto end = std::chrono::high_resolution_clock::now();
    double total_us = std::chrono::duration<double, std::micro>(end - start).count();

    report("utf8 terminated strings", total_us, iterations, records * record_bytes * 8 * 2);
}

int main(int argc, char* argv[]) {
    int iterations = DEFAULT_ITERATIONS;

    if (argc >= 2) {
        iterations = std::atoi(argv[1]);
        if (iterations <= 0) {
            iterations = DEFAULT_ITERATIONS;
        }
    }

    std::printf("bitcodec Benchmarks (v%s)\n", version());
    std::printf("=========================\n");
    std::printf("Iterations: %d\n", iterations);
    std::printf("Buffer size: %zu bytes\n\n", BUFFER_BYTES);

    try {
        std::printf("Bit fields:\n");
        bench_fields("8-bit aligned (LE)", 8, false, iterations);
        bench_fields("8-bit aligned (BE)", 8, true, iterations);
        bench_fields("5-bit unaligned (LE)", 5, false, iterations);
        bench_fields("13-bit unaligned (BE)", 13, true, iterations);
        bench_fields("32-bit aligned (LE)", 32, false, iterations);

        std::printf("\nFloats and strings:\n");
        bench_float64(iterations);
        bench_strings(iterations);
    } catch (const BitcodecException& e) {
        std::fprintf(stderr, "Error: %s\n", e.what());
        return 1;
    }

    return 0;
}
