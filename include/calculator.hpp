#pragma once
#ifndef _CALCULATOR_H_6C814F1B_7798_4CCB_A025_84AAAEB32130
#define _CALCULATOR_H_6C814F1B_7798_4CCB_A025_84AAAEB32130

#include <cstdint>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "state.hpp"

namespace tramp {

typedef int64_t Int;
// Operand stack; top of stack is back()
typedef std::vector<Int> Stack;
// One calculator step: result is the value pushed
typedef StateProgram<Stack, Int> CalcState;

// Calculator failure description
struct EvalError {
    enum Kind {
        NONE,             // no failure
        PARSE,            // token is neither operator nor integer
        STACK_UNDERFLOW,  // operator with fewer than two operands
        ARITHMETIC        // division by zero, overflow
    };
    Kind kind = NONE;
    // Offending token (PARSE) or operator
    std::string token;
    // Operands available (STACK_UNDERFLOW)
    size_t depth = 0;
    // Cause (ARITHMETIC, PARSE)
    std::string reason;

    // Human readable message
    std::string message() const;
};

// Thrown by calculator steps while a program runs;
// converted into a failed EvalResult by evaluate_postfix
class CalcError : public std::runtime_error {
public:
    explicit CalcError(const EvalError& error);
    const EvalError& error() const { return error_; }
private:
    EvalError error_;
};

// Outcome of evaluating an expression.
// On failure, value is 0 and stack is empty (no partial state)
struct EvalResult {
    bool ok = false;
    Int value = 0;
    Stack stack;
    // Kind NONE when ok
    EvalError error;

    explicit operator bool() const { return ok; }
};

// Push num; result is num
CalcState operand(Int num);

// Pop a (top) and b, push b op a; result is the pushed value.
// op must be one of + - * /
CalcState binary_operator(char op);

// Program for one token (operator, integer, or anything else which fails
// with PARSE when run)
CalcState eval_one(const std::string& token);

// Program for a token sequence, sequenced left to right.
// Result is that of the last token (0 for no tokens)
CalcState eval_all(const std::vector<std::string>& tokens);

// Run eval_all(tokens) from initial
EvalResult evaluate_postfix(const std::vector<std::string>& tokens,
                            const Stack& initial = Stack());

// Tokenize line on whitespace and evaluate
EvalResult evaluate_input(const std::string& line);

// Split line into tokens on whitespace
std::vector<std::string> tokenize(const std::string& line);

std::ostream& operator<<(std::ostream& os, const EvalError& error);

}  // namespace tramp
#endif // ifndef _CALCULATOR_H_6C814F1B_7798_4CCB_A025_84AAAEB32130
