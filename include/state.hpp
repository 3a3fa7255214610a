#pragma once
#ifndef _STATE_H_1A6FB077_D8DF_4019_8ECE_F602EA882C0B
#define _STATE_H_1A6FB077_D8DF_4019_8ECE_F602EA882C0B

#include <any>
#include <functional>
#include <memory>
#include <type_traits>
#include <utility>

#include "thunk.hpp"

namespace tramp {

template<class S, class A> class StateProgram;

namespace detail {

// Transition output with the result type erased
template<class S>
using StateStep = std::pair<S, std::any>;

template<class S> struct StateNode;
template<class S>
using StateNodePtr = std::shared_ptr<const StateNode<S> >;

// STEP: a single transition s -> (s', a)
// BIND: run source, then the program cont returns for its result
template<class S>
struct StateNode {
    enum Kind {
        STEP,
        BIND
    };
    explicit StateNode(Kind kind) : kind(kind) { }
    StateNode(const StateNode&) =delete;
    StateNode& operator=(const StateNode&) =delete;

    Kind kind;
    std::function<StateStep<S>(S)> step;
    std::function<StateNodePtr<S>(std::any)> cont;
    StateNodePtr<S> source;
};

// Suspend running node on state. Every sequencing step becomes a
// Defer/Bind pair in the thunk graph, so the trampoline runs chains
// of any length in constant stack.
// The state is moved along, so the returned thunk may be forced once
// only; StateProgram::suspend wraps it to allow re-forcing.
template<class S>
Thunk<StateStep<S> > run_node(StateNodePtr<S> node, S state) {
    return Thunk<StateStep<S> >::defer(
        [node, state = std::move(state)]() mutable -> Thunk<StateStep<S> > {
            if (node->kind == StateNode<S>::STEP) {
                return Thunk<StateStep<S> >::now(node->step(std::move(state)));
            }
            return run_node<S>(node->source, std::move(state)).flat_map(
                [node](StateStep<S> res) {
                    return run_node<S>(node->cont(std::move(res.second)),
                                       std::move(res.first));
                });
        });
}

}  // namespace detail

// Pure state transition S -> (S, A), composable by sequencing.
// Programs are immutable values; running one never touches a state
// other than the copy it was handed.
template<class S, class A>
class StateProgram {
public:
    typedef S state_type;
    typedef A result_type;

    // Program from a transition function: func(S) -> std::pair<S, A>.
    // func receives the run's own copy of the state and may modify it
    template<class Func>
    static StateProgram apply(Func func) {
        auto node = detail::make_node<detail::StateNode<S> >(
                detail::StateNode<S>::STEP);
        node->step = [func](S state) -> detail::StateStep<S> {
            std::pair<S, A> res = func(std::move(state));
            return detail::StateStep<S>(std::move(res.first),
                                        std::any(std::move(res.second)));
        };
        return StateProgram(std::move(node));
    }

    // Result val, state unchanged
    static StateProgram pure(A val) {
        return apply([val](S state) {
            return std::pair<S, A>(std::move(state), val);
        });
    }

    // Sequencing: run this, then the program func returns for the result
    template<class Func>
    std::decay_t<std::invoke_result_t<Func, A> > and_then(Func func) const {
        typedef std::decay_t<std::invoke_result_t<Func, A> > Next;
        static_assert(std::is_same<typename Next::state_type, S>::value,
                "and_then: function must return a program on the same state");
        auto node = detail::make_node<detail::StateNode<S> >(
                detail::StateNode<S>::BIND);
        node->source = node_;
        node->cont = [func](std::any val) -> detail::StateNodePtr<S> {
            return func(std::any_cast<A>(std::move(val))).node_;
        };
        return Next(std::move(node));
    }

    // Apply func to the result, state unchanged
    template<class Func>
    StateProgram<S, std::decay_t<std::invoke_result_t<Func, A> > >
    map(Func func) const {
        typedef std::decay_t<std::invoke_result_t<Func, A> > B;
        return and_then([func](A val) {
            return StateProgram<S, B>::pure(func(std::move(val)));
        });
    }

    // Run this, discard its result, then run next
    template<class B>
    StateProgram<S, B> then(const StateProgram<S, B>& next) const {
        return and_then([next](const A&) { return next; });
    }

    // Deferred run, for composing with other thunks.
    // Each force starts over from a copy of initial
    Thunk<std::pair<S, A> > suspend(S initial) const {
        return Thunk<detail::StateStep<S> >::defer(
            [node = node_, initial = std::move(initial)]() {
                return detail::run_node<S>(node, initial);
            }).map(
            [](detail::StateStep<S> res) {
                return std::pair<S, A>(std::move(res.first),
                        std::any_cast<A>(std::move(res.second)));
            });
    }

    // Run from initial; returns (final state, result)
    std::pair<S, A> run(S initial) const {
        return force(suspend(std::move(initial)));
    }
    // Final state only
    S exec(S initial) const {
        return run(std::move(initial)).first;
    }
    // Result only
    A eval(S initial) const {
        return run(std::move(initial)).second;
    }

private:
    template<class, class> friend class StateProgram;
    explicit StateProgram(detail::StateNodePtr<S> node) : node_(std::move(node)) { }

    detail::StateNodePtr<S> node_;
};

template<class S, class A>
std::pair<S, A> run_state(const StateProgram<S, A>& program, S initial) {
    return program.run(std::move(initial));
}

// Primitive programs
namespace state {

template<class S, class A>
StateProgram<S, A> pure(A val) {
    return StateProgram<S, A>::pure(std::move(val));
}

// Result is the current state
template<class S>
StateProgram<S, S> get() {
    return StateProgram<S, S>::apply([](const S& state) {
        return std::pair<S, S>(state, state);
    });
}

// Replace the state
template<class S>
StateProgram<S, Unit> set(S new_state) {
    return StateProgram<S, Unit>::apply([new_state](const S&) {
        return std::pair<S, Unit>(new_state, Unit());
    });
}

// Replace the state with func(state)
template<class S, class Func>
StateProgram<S, Unit> modify(Func func) {
    return StateProgram<S, Unit>::apply([func](const S& state) {
        return std::pair<S, Unit>(func(state), Unit());
    });
}

// Result is func(state), state unchanged
template<class S, class Func>
StateProgram<S, std::decay_t<std::invoke_result_t<Func, const S&> > >
inspect(Func func) {
    typedef std::decay_t<std::invoke_result_t<Func, const S&> > A;
    return StateProgram<S, A>::apply([func](S state) {
        A res = func(state);
        return std::pair<S, A>(std::move(state), std::move(res));
    });
}

}  // namespace state
}  // namespace tramp
#endif // ifndef _STATE_H_1A6FB077_D8DF_4019_8ECE_F602EA882C0B
