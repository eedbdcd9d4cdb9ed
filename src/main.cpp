#include "gitmark/app.hpp"

int main(int argc, char** argv) {
    gitmark::App app;
    return app.run(argc, argv);
}
