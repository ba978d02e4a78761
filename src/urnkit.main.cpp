#include <urnkit/cli/dispatch_main.hpp>

#include <string>
#include <vector>

int main(int argc, char** argv) {
    return urnkit::cli::main_fn(argv[0], std::vector<std::string>(argv + 1, argv + argc));
}
