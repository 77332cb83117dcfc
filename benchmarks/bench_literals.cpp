// benchmarks/bench_literals.cpp
// ember::json decode + dump microbenchmark on constructor-heavy documents.
// Only depends on ember_json; the input is generated, so no data files are
// needed.
//
// Usage (from the build directory):
//   ./bench_literals              # 2000 records, 300 iter
//   ./bench_literals --iter 500   # custom iteration count
//   ./bench_literals --arena      # decode into a reused Arena

#include <ember_json/ember_json.hpp>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

static std::string make_document(int records) {
    std::string json = "[";
    for (int i = 0; i < records; ++i) {
        if (i)
            json += ',';
        json += "{\"id\":NumberInt(" + std::to_string(i) + "),";
        json += "\"ts\":NumberLong(\"" + std::to_string(1700000000000LL + i) +
                "\"),";
        json += "\"price\":NumberDecimal(\"" + std::to_string(i % 100) +
                ".25\"),";
        json += "\"tags\":[\"a\",\"b\"],\"ok\":true}";
    }
    json += "]";
    return json;
}

static double measure_decode(const std::string &content, int N,
                             ember::json::Arena *arena) {
    ember::json::Allocator alloc =
        arena ? ember::json::Allocator(arena) : ember::json::Allocator();
    for (int i = 0; i < 20; ++i) {
        {
            ember::json::Value v = ember::json::parse(content, alloc);
        }
        if (arena)
            arena->reset();
    }
    auto t0 = std::chrono::high_resolution_clock::now();
    for (int i = 0; i < N; ++i) {
        {
            ember::json::Value v = ember::json::parse(content, alloc);
        }
        if (arena)
            arena->reset();
    }
    auto t1 = std::chrono::high_resolution_clock::now();
    return std::chrono::duration<double, std::micro>(t1 - t0).count() / N;
}

static double measure_dump(const std::string &content, int N) {
    ember::json::Value root = ember::json::parse(content);
    for (int i = 0; i < 20; ++i)
        ember::json::dump(root);
    auto t0 = std::chrono::high_resolution_clock::now();
    size_t total = 0;
    for (int i = 0; i < N; ++i)
        total += ember::json::dump(root).size();
    auto t1 = std::chrono::high_resolution_clock::now();
    if (total == 0)
        std::printf("empty output\n");
    return std::chrono::duration<double, std::micro>(t1 - t0).count() / N;
}

int main(int argc, char **argv) {
    int N = 300;
    int records = 2000;
    bool use_arena = false;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--iter") == 0 && i + 1 < argc)
            N = std::atoi(argv[++i]);
        if (std::strcmp(argv[i], "--records") == 0 && i + 1 < argc)
            records = std::atoi(argv[++i]);
        if (std::strcmp(argv[i], "--arena") == 0)
            use_arena = true;
    }
    if (N <= 0 || records <= 0) {
        std::fprintf(stderr, "--iter and --records must be positive\n");
        return 1;
    }

    const std::string content = make_document(records);
    ember::json::Arena arena(4 * content.size());

    std::printf("Iterations: %d, records: %d, bytes: %zu\n", N, records,
                content.size());
    std::printf("%-30s %10s %10s\n", "input", "decode(us)", "dump(us)");
    std::printf("%-30s %10s %10s\n", "-----", "----------", "--------");

    double p = measure_decode(content, N, use_arena ? &arena : nullptr);
    double d = measure_dump(content, N);
    std::printf("%-30s %10.1f %10.1f\n", "constructor records", p, d);
    return 0;
}
