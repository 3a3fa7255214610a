#include "shell.hpp"

#include "version.hpp"

#include <cstdint>
#include "calculator.hpp"
#include "recursion.hpp"
#include "util.hpp"

namespace tramp {

Shell::Shell(std::ostream& os, bool banner) : os(os) {
    if (banner) {
        os << "Tramp " TRAMP_VERSION " " TRAMP_COPYRIGHT << std::endl;
    }
}

bool Shell::eval_line(std::string line) {
    util::trim(line);
    if (line == "exit") {
        // Exit shell, if applicable
        closed = true;
        return true;
    }
    if (line.empty()) return true;

    std::string cmd;
    if (line[0] == '%') {
        cmd = util::get_word(line);
    }
    util::trim(line);
    if (cmd == "%stack") {
        // Toggle (or set) stack display
        if (line == "on") show_stack = true;
        else if (line == "off") show_stack = false;
        else if (line.empty()) show_stack = !show_stack;
        else {
            os << "Usage: %stack [on|off]\n";
            return false;
        }
        os << "stack display " << (show_stack ? "on" : "off") << std::endl;
    } else if (cmd == "%fact") {
        // Factorial through the trampoline
        Int n;
        if (!util::parse_int(line, n) || n < 0) {
            os << "'" << line << "': expected a nonnegative integer\n";
            return false;
        }
        os << factorial(static_cast<uint64_t>(n)).value() << std::endl;
    } else if (cmd.size()) {
        os << "Unknown command " << cmd << "\n";
        return false;
    } else {
        EvalResult result = evaluate_input(line);
        if (!result) {
            os << result.error << "\n";
            return false;
        }
        os << result.value << std::endl;
        if (show_stack) {
            os << "stack:";
            for (Int val : result.stack) os << " " << val;
            os << std::endl;
        }
    }
    return true;
}
}  // namespace tramp
