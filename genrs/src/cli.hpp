#pragma once
#include "genrs.hpp"
#include <ostream>
#include <string>
#include <optional>
#include <exception>

// ── Exit codes ────────────────────────────────────────────────────────────────
static const int EXIT_OK      = 0;
static const int EXIT_USAGE   = 1;
static const int EXIT_CRYPTO  = 2;
static const int EXIT_IO      = 3;

struct Args {
    std::string                mode = "key";
    std::optional<std::string> preset;
    std::string                format = "hex";
    std::optional<std::string> length;          // default 32 when absent
    std::string                uuid_version = "v4";
    std::optional<std::string> ns;
    std::optional<std::string> name;
    bool                       yaml    = false;
    bool                       help    = false;
    bool                       version = false;
};

// Fills args from argv. Returns false (after writing a message to err) on an
// unknown option or a missing option value.
bool parse_args(int argc, char** argv, Args& args, std::ostream& err);

// Exit code for a GenError of the given kind.
int exit_code_for(ErrorKind kind);

// Writes "Error: ..." for e and returns its exit code. Anything that is not a
// GenError is an internal error (EXIT_CRYPTO).
int report_error(const std::exception& e, std::ostream& err);

// Whole program: parse, dispatch, print. Returns the process exit code.
int run(int argc, char** argv, std::ostream& out, std::ostream& err);
