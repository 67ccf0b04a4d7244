#pragma once

#include <gsn_model/types.hpp>
#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace gsn_model {

// Integer-indexed adjacency over an element list. Relations whose endpoints are not
// both present are skipped; self-loops are kept (they are cycles).
struct GraphIndex {
    std::unordered_map<std::string, std::size_t> index_of;
    // Per element, outgoing targets in relation order.
    std::vector<std::vector<std::size_t>> supported_by;
    std::vector<std::vector<std::size_t>> in_context_of;
    std::vector<std::size_t> incoming_supported_by;
    // Number of valid relations touching the element (either end).
    std::vector<std::size_t> degree;

    const std::size_t* find(const std::string& id) const {
        auto it = index_of.find(id);
        return it == index_of.end() ? nullptr : &it->second;
    }
};

inline GraphIndex build_graph_index(const std::vector<Element>& elements,
    const std::vector<Relation>& relations)
{
    GraphIndex g;
    const std::size_t n = elements.size();
    g.index_of.reserve(n);
    for (std::size_t i = 0; i < n; ++i)
        g.index_of.emplace(elements[i].id, i); // first occurrence wins on duplicate ids
    g.supported_by.resize(n);
    g.in_context_of.resize(n);
    g.incoming_supported_by.assign(n, 0);
    g.degree.assign(n, 0);

    for (const auto& r : relations) {
        const std::size_t* src = g.find(r.source_id);
        const std::size_t* dst = g.find(r.target_id);
        if (!src || !dst) continue;
        if (r.kind == RelationKind::SupportedBy) {
            g.supported_by[*src].push_back(*dst);
            ++g.incoming_supported_by[*dst];
        } else {
            g.in_context_of[*src].push_back(*dst);
        }
        ++g.degree[*src];
        if (*dst != *src) ++g.degree[*dst];
    }
    return g;
}

} // namespace gsn_model
