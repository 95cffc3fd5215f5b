#include "safeterm/cli/app.hpp"

auto main(int argc, char** argv) -> int {
    safeterm::cli::App app;
    return app.run(argc, argv);
}
