#include "deepseek/cli/app.hpp"

int main(int argc, char** argv) {
    deepseek::cli::App app;
    return app.run(argc, argv);
}
