#include "anchordrop/cli.hpp"

int main(int argc, char** argv) {
    return anchordrop::cli::main_entry(argc, argv);
}
