#include "wdserver/cli/app.hpp"

int main(int argc, char** argv) {
    wdserver::cli::App app;
    return app.run(argc, argv);
}
