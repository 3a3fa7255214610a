#include "state.hpp"
#include "test_common.hpp"

#include <stdexcept>
#include <string>
#include <tuple>

using namespace tramp;
using namespace tramp::test;

namespace {
typedef StateProgram<int, int> IntProg;

// Adds one to the state n times, right-nested through and_then
IntProg count_up(int n) {
    if (n == 0) return state::get<int>();
    return state::modify<int>([](int s) { return s + 1; })
        .and_then([n](Unit) { return count_up(n - 1); });
}
}  // namespace

int main() {
    BEGIN_TEST(test_state);

    {
        auto desc = StateProgram<int, std::string>::apply([](const int& s) {
            return std::make_pair(s, "The state is " + std::to_string(s));
        });
        auto res = desc.run(10);
        ASSERT_EQ(res.first, 10);
        ASSERT_EQ(res.second, std::string("The state is 10"));
        ASSERT_EQ(run_state(desc, 3).second, std::string("The state is 3"));
    }

    {
        // Threading: second program sees the first's state
        auto a = IntProg::apply([](const int& s) {
            return std::make_pair(s + 1, s * 2);
        });
        auto b = IntProg::apply([](const int& s) {
            return std::make_pair(s * 2, s + 1);
        });
        auto both = a.and_then([b](int x) {
            return b.map([x](int y) { return std::make_pair(x, y); });
        });
        auto res = both.run(20);
        ASSERT_EQ(res.first, 42);
        ASSERT_EQ(res.second.first, 40);
        ASSERT_EQ(res.second.second, 22);
        ASSERT_EQ(both.exec(20), 42);
        ASSERT_EQ(both.eval(1).first, 2);
    }

    {
        // get / set / modify / inspect
        ASSERT_EQ(state::get<int>().run(10), std::make_pair(10, 10));
        ASSERT_EQ(state::set<int>(30).exec(10), 30);
        ASSERT_EQ(state::modify<int>([](int s) { return s + 8; }).exec(10), 18);
        ASSERT_EQ(state::inspect<int>([](int s) {
                    return std::to_string(s) + "!";
                  }).run(10), std::make_pair(10, std::string("10!")));

        auto program = state::get<int>().and_then([](int a) {
            return state::set<int>(a + 1).then(state::get<int>())
                .and_then([a](int b) {
                    return state::modify<int>([](int s) { return s + 1; })
                        .then(state::inspect<int>([](int s) { return s * 1000; }))
                        .map([a, b](int c) { return std::make_tuple(a, b, c); });
                });
        });
        auto res = program.run(1);
        ASSERT_EQ(res.first, 3);
        ASSERT_EQ(std::get<0>(res.second), 1);
        ASSERT_EQ(std::get<1>(res.second), 2);
        ASSERT_EQ(std::get<2>(res.second), 3000);
    }

    {
        // map leaves the state alone
        auto p = IntProg::apply([](const int& s) {
            return std::make_pair(s - 1, s);
        }).map([](int x) { return x * 7; });
        ASSERT_EQ(p.run(5), std::make_pair(4, 35));
        ASSERT_EQ(state::pure<int>(9).run(4), std::make_pair(4, 9));
    }

    {
        // Monad laws on generated programs
        std::uniform_int_distribution<int> unif(-50, 50);
        for (int iter = 0; iter < 50; ++iter) {
            int k = unif(reng), m = unif(reng), a = unif(reng),
                s0 = unif(reng);
            auto p = IntProg::apply([k](const int& s) {
                return std::make_pair(s * 3 + k, s - k);
            });
            auto f = [m](int x) {
                return IntProg::apply([x, m](const int& s) {
                    return std::make_pair(s + x, x * m);
                });
            };
            auto g = [k](int x) {
                return state::modify<int>([x](int s) { return s - x; })
                    .then(state::inspect<int>([k](int s) { return s + k; }));
            };
            auto pure = [](int x) { return IntProg::pure(x); };

            // Left identity
            ASSERT_EQ(IntProg::pure(a).and_then(f).run(s0), f(a).run(s0));
            // Right identity
            ASSERT_EQ(p.and_then(pure).run(s0), p.run(s0));
            // Associativity
            ASSERT_EQ(p.and_then(f).and_then(g).run(s0),
                      p.and_then([f, g](int x) {
                          return f(x).and_then(g);
                      }).run(s0));
        }
    }

    {
        // Long left-nested chain
        const int N = 100000;
        IntProg p = IntProg::pure(0);
        for (int i = 0; i < N; ++i) {
            p = p.and_then([](int x) {
                return IntProg::apply([x](const int& s) {
                    return std::make_pair(s + 1, x + 2);
                });
            });
        }
        ASSERT_EQ(p.run(0), std::make_pair(N, 2 * N));
        // Long right-nested chain built while running
        ASSERT_EQ(count_up(N).run(5), std::make_pair(N + 5, N + 5));
    }

    {
        // Right-nested chain built up front, linked through closures
        const int N = 100000;
        IntProg p = state::get<int>();
        for (int i = 0; i < N; ++i) {
            p = state::modify<int>([](int s) { return s + 1; })
                    .and_then([p](Unit) { return p; });
        }
        ASSERT_EQ(p.run(0), std::make_pair(N, N));
        p = IntProg::pure(0);
        ASSERT_EQ(p.eval(3), 0);
    }

    {
        // Same program, same initial state, same outcome
        auto p = count_up(100).and_then([](int x) {
            return state::inspect<int>([x](int s) { return s * x; });
        });
        auto first = p.run(2);
        ASSERT_EQ(p.run(2), first);
        ASSERT_EQ(first, std::make_pair(102, 102 * 102));
    }

    {
        // The caller's state value is never touched
        std::vector<int> init = {1, 2, 3};
        auto push = state::modify<std::vector<int> >([](std::vector<int> v) {
            v.push_back(4);
            return v;
        });
        auto res = push.exec(init);
        ASSERT_EQ(init.size(), size_t(3));
        ASSERT_EQ(res, std::vector<int>({1, 2, 3, 4}));
    }

    {
        // Errors from transitions propagate unchanged
        auto bad = IntProg::pure(1).and_then([](int) {
            return IntProg::apply([](const int& s) -> std::pair<int, int> {
                if (s > 0) throw std::invalid_argument("positive");
                return std::make_pair(s, s);
            });
        });
        ASSERT_THROWS(bad.run(1), std::invalid_argument);
        ASSERT_EQ(bad.run(-1), std::make_pair(-1, -1));
    }

    {
        // suspend composes with other thunks
        auto t = count_up(10).suspend(0).map([](std::pair<int, int> res) {
            return res.first + res.second;
        });
        ASSERT_EQ(t.value(), 20);
        // Forcing again starts over from the same initial state
        auto raw = state::modify<std::vector<int> >([](std::vector<int> v) {
            v.push_back(int(v.size()));
            return v;
        }).suspend(std::vector<int>({5}));
        ASSERT_EQ(raw.value().first, std::vector<int>({5, 1}));
        ASSERT_EQ(raw.value().first, std::vector<int>({5, 1}));
        ASSERT_EQ(t.value(), 20);
    }

    END_TEST;
}
