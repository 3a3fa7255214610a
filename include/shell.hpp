#pragma once
#ifndef _SHELL_H_60723EDD_B6F8_44A7_B8CF_398180C03CD6
#define _SHELL_H_60723EDD_B6F8_44A7_B8CF_398180C03CD6
#include <string>
#include <ostream>

namespace tramp {

// Line-oriented front end for the postfix calculator
class Shell {
public:
    explicit Shell(std::ostream& os, bool banner = true);
    // Evaluate a line; returns true iff no error
    bool eval_line(std::string line); // string copy intentional
    // Whether shell is 'closed' (must be handled by frontend)
    bool closed = false;
    // Print the final operand stack after each expression
    bool show_stack = false;
private:
    std::ostream& os;
};

}  // namespace tramp
#endif // ifndef _SHELL_H_60723EDD_B6F8_44A7_B8CF_398180C03CD6
