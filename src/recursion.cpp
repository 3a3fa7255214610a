#include "recursion.hpp"

namespace tramp {

Thunk<BigInt> factorial(uint64_t n) {
    if (n <= 1) return Thunk<BigInt>::now(BigInt(1));
    return Thunk<BigInt>::defer([n]() {
        return factorial(n - 1).map([n](BigInt val) -> BigInt {
            return val * n;
        });
    });
}

}  // namespace tramp
