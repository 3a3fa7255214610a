#include "shell.hpp"
#include <iostream>
#include <string>

int main(int argc, char ** argv) {
    using namespace tramp;
    Shell shell(std::cout, argc <= 1);
    if (argc > 1) {
        // Evaluate arguments as a single expression
        std::string line;
        for (int i = 1; i < argc; ++i) {
            if (i > 1) line.push_back(' ');
            line.append(argv[i]);
        }
        return shell.eval_line(line) ? 0 : 1;
    }

    std::string line;
    while (!shell.closed) {
        std::cout << ">>> " << std::flush;
        std::getline(std::cin, line);
        if (!std::cin) break;
        shell.eval_line(line);
    }
    return 0;
}
