#pragma once
#ifndef _THUNK_H_A13A9397_2977_4C1C_8071_AD06D789F19C
#define _THUNK_H_A13A9397_2977_4C1C_8071_AD06D789F19C

#include <any>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <type_traits>
#include <utility>
#include <vector>

namespace tramp {

// No-value marker (result of state::set, state::modify)
struct Unit {
    bool operator==(const Unit&) const { return true; }
    bool operator!=(const Unit&) const { return false; }
};

template<class T> class Thunk;

namespace detail {

template<class T> struct is_thunk : std::false_type {};
template<class T> struct is_thunk<Thunk<T> > : std::true_type {};

// Delete ptr with del. A deletion requested while another one is running
// on this thread is queued and carried out by the outermost call, so
// dropping a graph of any depth uses constant native stack
void release_node(void* ptr, void (*del)(void*));

template<class Node>
void delete_node(void* ptr) {
    delete static_cast<Node*>(ptr);
}

template<class Node>
struct NodeDeleter {
    void operator()(Node* node) const {
        release_node(node, &delete_node<Node>);
    }
};

// Allocate a graph node owned through NodeDeleter
template<class Node, class... Args>
std::shared_ptr<Node> make_node(Args&&... args) {
    return std::shared_ptr<Node>(new Node(std::forward<Args>(args)...),
                                 NodeDeleter<Node>());
}

// Value cache shared by all copies of a memoized thunk
struct MemoCell {
    std::mutex mtx;
    bool ready = false;
    std::any value;
};

struct ThunkNode;
typedef std::shared_ptr<const ThunkNode> ThunkNodePtr;

// Type-erased thunk node. Which members are used depends on kind:
// DONE:   value
// DEFER:  producer (yields the next node)
// MAPPED: source, transform (applied to the value of source)
// BIND:   source, cont (applied to the value of source, yields the next node)
// MEMO:   source, cell (value of source, computed once)
// Nodes are never modified after construction, except that force moves
// 'value' out of a DONE node nothing else refers to.
struct ThunkNode {
    enum Kind {
        DONE,
        DEFER,
        MAPPED,
        BIND,
        MEMO
    };
    explicit ThunkNode(Kind kind);
    ThunkNode(const ThunkNode&) =delete;
    ThunkNode& operator=(const ThunkNode&) =delete;

    Kind kind;
    mutable std::any value;
    std::function<ThunkNodePtr()> producer;
    std::function<std::any(std::any)> transform;
    std::function<ThunkNodePtr(std::any)> cont;
    std::shared_ptr<MemoCell> cell;
    ThunkNodePtr source;
};

// Trampoline: drive node to a value with an explicit work list.
// Native stack use is constant in the length of the chain.
// If steps is not null, stores the number of loop iterations taken.
// Exceptions thrown by producers/transforms pass through unchanged.
std::any force_node(const ThunkNodePtr& root, size_t* steps = nullptr);

}  // namespace detail

// Suspended computation producing a T.
// Copies share the same (immutable) node graph.
template<class T>
class Thunk {
public:
    typedef T value_type;

    // Already computed value
    static Thunk now(T val) {
        auto node = detail::make_node<detail::ThunkNode>(detail::ThunkNode::DONE);
        node->value = std::move(val);
        return Thunk(std::move(node));
    }

    // func() is called on every force, never cached
    template<class Func>
    static Thunk always(Func func) {
        return defer([func]() { return now(func()); });
    }

    // func() is called on the first force only
    template<class Func>
    static Thunk later(Func func) {
        return always(std::move(func)).memoize();
    }

    // func() returns the Thunk<T> to continue with
    template<class Func>
    static Thunk defer(Func func) {
        static_assert(std::is_same<std::decay_t<std::invoke_result_t<Func> >,
                      Thunk>::value, "defer: function must return Thunk<T>");
        auto node = detail::make_node<detail::ThunkNode>(detail::ThunkNode::DEFER);
        node->producer = [func]() mutable -> detail::ThunkNodePtr {
            return func().node();
        };
        return Thunk(std::move(node));
    }

    // Lazily apply func to the value
    template<class Func>
    Thunk<std::decay_t<std::invoke_result_t<Func, T> > > map(Func func) const {
        typedef std::decay_t<std::invoke_result_t<Func, T> > U;
        auto node = detail::make_node<detail::ThunkNode>(detail::ThunkNode::MAPPED);
        node->source = node_;
        node->transform = [func](std::any val) -> std::any {
            return std::any(U(func(std::any_cast<T>(std::move(val)))));
        };
        return Thunk<U>(std::move(node));
    }

    // Lazily continue with the thunk func returns for the value
    template<class Func>
    std::decay_t<std::invoke_result_t<Func, T> > flat_map(Func func) const {
        typedef std::decay_t<std::invoke_result_t<Func, T> > Next;
        static_assert(detail::is_thunk<Next>::value,
                "flat_map: function must return a Thunk");
        auto node = detail::make_node<detail::ThunkNode>(detail::ThunkNode::BIND);
        node->source = node_;
        node->cont = [func](std::any val) -> detail::ThunkNodePtr {
            return func(std::any_cast<T>(std::move(val))).node();
        };
        return Next(std::move(node));
    }

    // Cache the value of the chain so far
    Thunk memoize() const {
        if (node_->kind == detail::ThunkNode::DONE ||
            node_->kind == detail::ThunkNode::MEMO) return *this;
        auto node = detail::make_node<detail::ThunkNode>(detail::ThunkNode::MEMO);
        node->source = node_;
        node->cell = std::make_shared<detail::MemoCell>();
        return Thunk(std::move(node));
    }

    // Evaluate (see force)
    T value() const {
        return std::any_cast<T>(detail::force_node(node_));
    }

    const detail::ThunkNodePtr& node() const { return node_; }

private:
    template<class> friend class Thunk;
    explicit Thunk(detail::ThunkNodePtr node) : node_(std::move(node)) { }

    detail::ThunkNodePtr node_;
};

// Evaluate thunk with the trampoline.
// Total for any finite chain; an infinite Defer chain never returns.
template<class T>
T force(const Thunk<T>& thunk, size_t* steps = nullptr) {
    return std::any_cast<T>(detail::force_node(thunk.node(), steps));
}

}  // namespace tramp
#endif // ifndef _THUNK_H_A13A9397_2977_4C1C_8071_AD06D789F19C
