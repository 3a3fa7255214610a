#pragma once
#ifndef _RECURSION_H_7EA17074_D073_4B1B_AD85_16EA398F02F0
#define _RECURSION_H_7EA17074_D073_4B1B_AD85_16EA398F02F0

#include <cstdint>
#include <memory>
#include <vector>
#include <boost/multiprecision/cpp_int.hpp>

#include "thunk.hpp"

namespace tramp {

typedef boost::multiprecision::cpp_int BigInt;

// n! built as a chain of Defer/Mapped nodes, one per factor;
// forcing it uses constant native stack for any n
Thunk<BigInt> factorial(uint64_t n);

namespace detail {
template<class A, class B, class Func>
Thunk<B> fold_right_from(std::shared_ptr<const std::vector<A> > items,
                         size_t idx, Thunk<B> acc, Func fn) {
    if (idx >= items->size()) return acc;
    return Thunk<B>::defer([items, idx, acc, fn]() -> Thunk<B> {
        return fn((*items)[idx], fold_right_from(items, idx + 1, acc, fn));
    });
}
}  // namespace detail

// Right fold; fn(item, Thunk<B> rest) -> Thunk<B>.
// The rest of the fold is only built when fn's result needs it.
template<class A, class B, class Func>
Thunk<B> fold_right(std::vector<A> items, Thunk<B> acc, Func fn) {
    auto shared = std::make_shared<const std::vector<A> >(std::move(items));
    return detail::fold_right_from(shared, 0, std::move(acc), std::move(fn));
}

// Eager right fold, fn(item, B rest) -> B, without native recursion
template<class A, class B, class Func>
B fold_right_value(std::vector<A> items, B acc, Func fn) {
    return fold_right(std::move(items), Thunk<B>::now(std::move(acc)),
        [fn](const A& item, Thunk<B> rest) {
            return rest.map([fn, item](B val) -> B {
                return fn(item, std::move(val));
            });
        }).value();
}

}  // namespace tramp
#endif // ifndef _RECURSION_H_7EA17074_D073_4B1B_AD85_16EA398F02F0
