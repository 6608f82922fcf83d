/**
 * @file bench.cpp
 * @brief Performance benchmarks for the backtracking solver.
 *
 * Measures solve time for the reference puzzles for regression testing
 * during development. Absolute numbers depend on the machine - use for
 * relative comparisons only.
 *
 * Usage:
 *   ./build/sudoku_bench              # Run with default 100 iterations
 *   ./build/sudoku_bench 1000         # Run with custom iteration count
 */

#include <sudoku/sudoku.hpp>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <string>

using namespace sudoku;

static constexpr int DEFAULT_ITERATIONS = 100;

static bool load_file(const std::string& path, std::string& text) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return false;
    }
    text.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    return !file.bad();
}

static void bench_solve(const char* name, const std::string& path, int iterations) {
    std::string text;
    if (!load_file(path, text)) {
        std::printf("%-20s SKIP (file not found)\n", name);
        return;
    }

    Board board;
    Error result = parse(text, board);
    if (result != Error::Ok) {
        std::printf("%-20s SKIP (%s)\n", name, error_string(result));
        return;
    }

    // Warmup run, also collects node counts
    SolveStats stats;
    auto solved = solve(board, &stats);

    auto start = std::chrono::high_resolution_clock::now();

    std::size_t found = 0;
    for (int i = 0; i < iterations; i++) {
        if (solve(board).has_value()) {
            ++found;
        }
    }

    auto end = std::chrono::high_resolution_clock::now();

    double total_us = std::chrono::duration<double, std::micro>(end - start).count();
    double per_solve_us = total_us / static_cast<double>(iterations);
    double per_node_ns = (per_solve_us * 1000.0) / static_cast<double>(stats.nodes);

    std::printf("%-20s %10.2f µs/solve  %8.2f ns/node  %8zu nodes  %s\n", name, per_solve_us,
                per_node_ns, stats.nodes,
                solved.has_value() && found == static_cast<std::size_t>(iterations)
                    ? "solved"
                    : "no solution");
}

int main(int argc, char* argv[]) {
    int iterations = DEFAULT_ITERATIONS;

    if (argc >= 2) {
        iterations = std::atoi(argv[1]);
        if (iterations <= 0) {
            iterations = DEFAULT_ITERATIONS;
        }
    }

    std::printf("Sudoku Solver Benchmarks\n");
    std::printf("========================\n");
    std::printf("Iterations: %d\n\n", iterations);

    std::printf("%-20s %16s  %14s  %14s  %s\n", "Puzzle", "Time", "Per-Node", "Nodes",
                "Result");
    std::printf("%-20s %16s  %14s  %14s  %s\n", "------", "----", "--------", "-----",
                "------");

    const char* base_paths[] = {"test-vectors/", "../test-vectors/", "../../test-vectors/"};
    const char* base_path = nullptr;

    for (const auto& p : base_paths) {
        std::ifstream test(std::string(p) + "classic.txt");
        if (test.good()) {
            base_path = p;
            break;
        }
    }

    if (base_path == nullptr) {
        std::printf("Could not find test vectors directory\n");
        return 1;
    }

    bench_solve("classic", std::string(base_path) + "classic.txt", iterations);
    bench_solve("diagonal", std::string(base_path) + "diagonal.txt", iterations);
    bench_solve("dead-end", std::string(base_path) + "dead-end.txt", iterations);

    return 0;
}
