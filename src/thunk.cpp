#include "thunk.hpp"

namespace tramp {
namespace detail {

ThunkNode::ThunkNode(Kind kind) : kind(kind) { }

void release_node(void* ptr, void (*del)(void*)) {
    // Nodes waiting to be deleted on this thread
    thread_local std::vector<std::pair<void*, void (*)(void*)> > pending;
    thread_local bool releasing = false;

    pending.emplace_back(ptr, del);
    if (releasing) return;
    releasing = true;
    while (pending.size()) {
        std::pair<void*, void (*)(void*)> top = pending.back();
        pending.pop_back();
        top.second(top.first);
    }
    releasing = false;
}

std::any force_node(const ThunkNodePtr& root, size_t* steps) {
    // Mapped/Bind/Memo nodes waiting for the value of their source;
    // innermost is at the back
    std::vector<ThunkNodePtr> pending;
    ThunkNodePtr cur = root;
    std::any val;
    size_t n_steps = 0;

    while (true) {
        bool have_val = false;
        ++n_steps;
        switch (cur->kind) {
            case ThunkNode::DONE:
                // Sole owner: nobody can observe the node again
                if (cur.use_count() == 1) val = std::move(cur->value);
                else val = cur->value;
                have_val = true;
                break;
            case ThunkNode::DEFER:
                cur = cur->producer();
                break;
            case ThunkNode::MAPPED:
            case ThunkNode::BIND:
                pending.push_back(cur);
                cur = cur->source;
                break;
            case ThunkNode::MEMO:
                {
                    std::lock_guard<std::mutex> lock(cur->cell->mtx);
                    if (cur->cell->ready) {
                        val = cur->cell->value;
                        have_val = true;
                    }
                }
                if (!have_val) {
                    pending.push_back(cur);
                    cur = cur->source;
                }
                break;
        }
        if (!have_val) continue;

        // Unwind pending nodes until one yields another node to run
        while (pending.size()) {
            ThunkNodePtr top = std::move(pending.back());
            pending.pop_back();
            ++n_steps;
            if (top->kind == ThunkNode::MAPPED) {
                val = top->transform(std::move(val));
            } else if (top->kind == ThunkNode::MEMO) {
                std::lock_guard<std::mutex> lock(top->cell->mtx);
                if (!top->cell->ready) {
                    top->cell->value = val;
                    top->cell->ready = true;
                }
            } else {
                cur = top->cont(std::move(val));
                have_val = false;
                break;
            }
        }
        if (have_val) {
            if (steps) *steps = n_steps;
            return val;
        }
    }
}

}  // namespace detail
}  // namespace tramp
