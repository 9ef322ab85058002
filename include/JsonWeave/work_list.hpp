#pragma once

#include <cstddef>
#include <deque>
#include <limits>
#include <utility>
#include <vector>

#include "path.hpp"

#ifndef JSONWEAVE_WORKLIST_RESERVE
#define JSONWEAVE_WORKLIST_RESERVE 32
#endif

namespace JsonWeave {

namespace work_list {

inline constexpr std::size_t NoParent = std::numeric_limits<std::size_t>::max();

// Bookkeeping shared by the items of both engines
struct ItemBase {
    std::size_t parent = NoParent;
    std::size_t slot = 0;          // field, element or entry index inside the parent
    path::PathElement where;       // how the parent names this item
    std::size_t pending = 0;       // children spawned but not attached yet
    bool normalized = false;
    bool finalized = false;
};

/*
 * Iterative depth-first traversal shared by Marshal and Unmarshal.
 *
 * Items live in an arena and are addressed by index. The work-list is a LIFO of
 * indices; the side-buffer ("dump") receives freshly spawned children and is
 * flushed back onto the work-list so that the first child spawned is the next
 * one popped. A finalized item is attached straight into its parent through the
 * recorded parent index.
 *
 * Engine hooks:
 *   bool process(std::size_t id)              expand a raw item, spawning children
 *   void attach(std::size_t parent, std::size_t child)
 *   bool finalize(std::size_t id)             all children attached, build the value
 * A hook returning false aborts the traversal; the engine keeps its own error state.
 */
template<class Item, class Engine>
class WorkList {
    Engine& m_engine;
    std::deque<Item> m_arena;
    std::vector<std::size_t> m_stack;
    std::vector<std::size_t> m_aside;
    std::size_t m_pops = 0;

public:
    explicit WorkList(Engine& engine)
        : m_engine(engine)
    {
        m_stack.reserve(JSONWEAVE_WORKLIST_RESERVE);
        m_aside.reserve(JSONWEAVE_WORKLIST_RESERVE);
    }

    Item& operator[](std::size_t id) {
        return m_arena[id];
    }
    const Item& operator[](std::size_t id) const {
        return m_arena[id];
    }

    // Registers a child of `parent`; it reaches the work-list with the next flush
    std::size_t spawn(std::size_t parent, std::size_t slot, path::PathElement where, Item item) {
        item.parent = parent;
        item.slot = slot;
        item.where = std::move(where);
        m_arena.push_back(std::move(item));
        const std::size_t id = m_arena.size() - 1;
        m_arena[parent].pending ++;
        m_aside.push_back(id);
        return id;
    }

    // Items taken off the work-list during the last run
    std::size_t pops() const {
        return m_pops;
    }

    path::Path pathTo(std::size_t id) const {
        std::vector<const path::PathElement*> chain;
        for(std::size_t cur = id; m_arena[cur].parent != NoParent; cur = m_arena[cur].parent) {
            chain.push_back(&m_arena[cur].where);
        }
        path::Path p;
        for(auto it = chain.rbegin(); it != chain.rend(); ++it) {
            p.push_child(**it);
        }
        return p;
    }

    // Runs to completion; on success the root is item 0 and is finalized
    bool run(Item root) {
        m_arena.clear();
        m_stack.clear();
        m_aside.clear();
        m_pops = 0;
        m_arena.push_back(std::move(root));
        m_stack.push_back(0);

        while(!m_stack.empty()) {
            const std::size_t id = m_stack.back();
            m_stack.pop_back();
            m_pops ++;
            if(m_stack.empty() && m_arena[id].finalized) {
                return true;
            }
            if(!m_arena[id].normalized) {
                if(!m_engine.process(id)) return false;
                m_arena[id].normalized = true;
                if(!settle(id)) return false;
            }
            m_stack.push_back(id);

            if(!m_aside.empty()) {
                flush();
                continue;
            }
            if(!promote()) return false;
        }
        return false;
    }

private:
    bool settle(std::size_t id) {
        Item& item = m_arena[id];
        if(item.finalized || !item.normalized || item.pending != 0) return true;
        if(!m_engine.finalize(id)) return false;
        item.finalized = true;
        return true;
    }

    void flush() {
        while(!m_aside.empty()) {
            m_stack.push_back(m_aside.back());
            m_aside.pop_back();
        }
    }

    // Attaches finalized items into their parents, top of the work-list first.
    // A parent stays below its children until the last one is attached, so the
    // scan stops at the first item that still needs processing.
    bool promote() {
        while(m_stack.size() >= 2) {
            const std::size_t child = m_stack.back();
            if(!m_arena[child].finalized) break;
            m_stack.pop_back();
            m_pops ++;

            const std::size_t parent = m_arena[child].parent;
            m_engine.attach(parent, child);
            m_arena[parent].pending --;
            if(!settle(parent)) return false;
        }
        return true;
    }
};

} // namespace work_list

} // namespace JsonWeave
