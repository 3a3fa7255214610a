#include "calculator.hpp"

#include <limits>
#include <sstream>
#include <utility>

#include "util.hpp"

namespace tramp {

namespace {
const Int INT_MAX_VAL = std::numeric_limits<Int>::max();
const Int INT_MIN_VAL = std::numeric_limits<Int>::min();

// Compute b op a into out; on failure set reason and return false
bool apply_op(char op, Int a, Int b, Int& out, std::string& reason) {
    switch (op) {
        case '+':
            if ((a > 0 && b > INT_MAX_VAL - a) ||
                (a < 0 && b < INT_MIN_VAL - a)) {
                reason = "integer overflow";
                return false;
            }
            out = b + a;
            return true;
        case '-':
            if ((a < 0 && b > INT_MAX_VAL + a) ||
                (a > 0 && b < INT_MIN_VAL + a)) {
                reason = "integer overflow";
                return false;
            }
            out = b - a;
            return true;
        case '*':
            {
                bool overflow;
                if (a > 0) {
                    overflow = b > 0 ? a > INT_MAX_VAL / b
                                     : b < INT_MIN_VAL / a;
                } else if (a < 0) {
                    overflow = b > 0 ? a < INT_MIN_VAL / b
                                     : (b != 0 && a < INT_MAX_VAL / b);
                } else {
                    overflow = false;
                }
                if (overflow) {
                    reason = "integer overflow";
                    return false;
                }
                out = b * a;
                return true;
            }
        case '/':
            if (a == 0) {
                reason = "division by zero";
                return false;
            }
            if (a == -1 && b == INT_MIN_VAL) {
                reason = "integer overflow";
                return false;
            }
            out = b / a;
            return true;
    }
    reason = "unknown operator";
    return false;
}

EvalError parse_error(const std::string& token) {
    EvalError err;
    err.kind = EvalError::PARSE;
    err.token = token;
    err.reason = "not an integer";
    return err;
}
}  // namespace

std::string EvalError::message() const {
    std::stringstream ss;
    switch (kind) {
        case NONE:
            ss << "No error";
            break;
        case PARSE:
            ss << "Parse error: \"" << token << "\" is not an operator or "
               "integer";
            break;
        case STACK_UNDERFLOW:
            ss << "Stack underflow: '" << token << "' needs 2 operands, "
               << depth << " available";
            break;
        case ARITHMETIC:
            ss << "Arithmetic error: '" << token << "': " << reason;
            break;
    }
    return ss.str();
}

CalcError::CalcError(const EvalError& error)
    : std::runtime_error(error.message()), error_(error) { }

CalcState operand(Int num) {
    return CalcState::apply([num](Stack stk) {
        stk.push_back(num);
        return std::pair<Stack, Int>(std::move(stk), num);
    });
}

CalcState binary_operator(char op) {
    return CalcState::apply([op](Stack stk) {
        if (stk.size() < 2) {
            EvalError err;
            err.kind = EvalError::STACK_UNDERFLOW;
            err.token = std::string(1, op);
            err.depth = stk.size();
            throw CalcError(err);
        }
        Int a = stk[stk.size() - 1], b = stk[stk.size() - 2];
        Int result;
        EvalError err;
        if (!apply_op(op, a, b, result, err.reason)) {
            err.kind = EvalError::ARITHMETIC;
            err.token = std::string(1, op);
            throw CalcError(err);
        }
        stk.pop_back();
        stk.back() = result;
        return std::pair<Stack, Int>(std::move(stk), result);
    });
}

CalcState eval_one(const std::string& token) {
    if (util::is_operator_token(token)) return binary_operator(token[0]);
    Int num;
    if (util::parse_int(token, num)) return operand(num);
    // Fails when run, not when built
    return CalcState::apply([token](Stack) -> std::pair<Stack, Int> {
        throw CalcError(parse_error(token));
    });
}

CalcState eval_all(const std::vector<std::string>& tokens) {
    CalcState program = CalcState::pure(0);
    for (const std::string& token : tokens) {
        program = program.and_then([token](Int) {
            return eval_one(token);
        });
    }
    return program;
}

EvalResult evaluate_postfix(const std::vector<std::string>& tokens,
                            const Stack& initial) {
    EvalResult result;
    try {
        std::pair<Stack, Int> out = eval_all(tokens).run(initial);
        result.ok = true;
        result.stack = std::move(out.first);
        result.value = out.second;
    } catch (const CalcError& e) {
        result.error = e.error();
    }
    return result;
}

EvalResult evaluate_input(const std::string& line) {
    return evaluate_postfix(tokenize(line));
}

std::vector<std::string> tokenize(const std::string& line) {
    return util::split_words(line);
}

std::ostream& operator<<(std::ostream& os, const EvalError& error) {
    return os << error.message();
}

}  // namespace tramp
