/**
 * @file cli.cpp
 * @brief Sudoku command line interface.
 *
 * Reads a grid in text format from a file or stdin, then either classifies
 * it or solves it and prints the solution.
 */

#include <sudoku/sudoku.hpp>

#include <cstdio>
#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>

using namespace sudoku;

static constexpr int EXIT_NO_SOLUTION = 2;

static void print_version() {
    std::printf("sudoku %s\n", version());
}

static void print_help(const char* prog_name) {
    std::printf("9x9 Sudoku validator and backtracking solver (v%s)\n", version());
    std::printf("===================================================\n\n");
    std::printf("Usage:\n");
    std::printf("  %s [options] [input]\n\n", prog_name);
    std::printf("Options:\n");
    std::printf("  -c, --check    Classify the grid only (Valid, Incomplete, Invalid)\n");
    std::printf("  -s, --stats    Print search statistics after solving\n");
    std::printf("  -h, --help     Show this help message\n");
    std::printf("  -v, --version  Show version information\n\n");
    std::printf("Arguments:\n");
    std::printf("  input          Grid file, '-' or omitted for stdin\n\n");
    std::printf("Grid format:\n");
    std::printf("  9 lines of 9 characters, digits 1-9 or a space for an unknown cell\n\n");
    std::printf("Exit status:\n");
    std::printf("  0  solved, or grid is Valid/Incomplete with --check\n");
    std::printf("  1  usage, I/O or parse error\n");
    std::printf("  2  no solution, or grid is Invalid with --check\n\n");
    std::printf("Examples:\n");
    std::printf("  %s puzzle.txt          # solve\n", prog_name);
    std::printf("  %s -c < puzzle.txt     # classify\n\n", prog_name);
}

static bool read_input(const char* path, std::string& text) {
    if (path == nullptr || std::strcmp(path, "-") == 0) {
        std::ostringstream buffer;
        buffer << std::cin.rdbuf();
        text = buffer.str();
        return !std::cin.bad();
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return false;
    }
    text.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    return !file.bad();
}

static int do_check(const Board& board) {
    Solution solution = board.validate();
    std::printf("%s\n", solution_string(solution));
    return solution == Solution::Invalid ? EXIT_NO_SOLUTION : 0;
}

static int do_solve(const Board& board, bool print_stats) {
    SolveStats stats;
    auto solved = solve(board, &stats);

    if (print_stats) {
        std::fprintf(stderr, "Givens:      %zu\n", board.count_final());
        std::fprintf(stderr, "Nodes:       %zu\n", stats.nodes);
        std::fprintf(stderr, "Max depth:   %zu\n", stats.max_depth);
    }

    if (!solved.has_value()) {
        std::fprintf(stderr, "Error: Puzzle has no solution\n");
        return EXIT_NO_SOLUTION;
    }

    std::printf("%s", format(*solved).c_str());
    return 0;
}

int main(int argc, char** argv) {
    bool check_mode = false;
    bool print_stats = false;
    const char* input_path = nullptr;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
            print_help(argv[0]);
            return 0;
        }
        if (std::strcmp(arg, "-v") == 0 || std::strcmp(arg, "--version") == 0) {
            print_version();
            return 0;
        }
        if (std::strcmp(arg, "-c") == 0 || std::strcmp(arg, "--check") == 0) {
            check_mode = true;
        } else if (std::strcmp(arg, "-s") == 0 || std::strcmp(arg, "--stats") == 0) {
            print_stats = true;
        } else if (arg[0] == '-' && arg[1] != '\0') {
            std::fprintf(stderr, "Error: Unknown option: %s\n", arg);
            std::fprintf(stderr, "Usage: %s [-c] [-s] [input]\n", argv[0]);
            return 1;
        } else if (input_path == nullptr) {
            input_path = arg;
        } else {
            std::fprintf(stderr, "Error: Only one input may be given\n");
            return 1;
        }
    }

    std::string text;
    if (!read_input(input_path, text)) {
        std::fprintf(stderr, "Error: Cannot read input: %s\n",
                     input_path != nullptr ? input_path : "<stdin>");
        return 1;
    }

    Board board;
    Error result = parse(text, board);
    if (result != Error::Ok) {
        std::fprintf(stderr, "Error: %s\n", error_string(result));
        return 1;
    }

    return check_mode ? do_check(board) : do_solve(board, print_stats);
}
