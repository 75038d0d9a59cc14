#include "scriptbox/cli/app.hpp"

auto main(int argc, char** argv) -> int {
    scriptbox::cli::App app;
    return app.run(argc, argv);
}
