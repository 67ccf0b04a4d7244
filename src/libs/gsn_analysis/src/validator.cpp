#include <gsn_analysis/validator.hpp>
#include <gsn_model/graph_index.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace gsn_analysis {

namespace {

using gsn_model::Element;
using gsn_model::ElementKind;
using gsn_model::GraphIndex;

std::shared_ptr<spdlog::logger> analysis_logger() {
    auto logger = spdlog::get("gsn");
    return logger ? logger : spdlog::default_logger();
}

Diagnostic make_error(DiagnosticCode code, std::string message, std::vector<std::string> ids = {}) {
    return Diagnostic{ Severity::Error, code, std::move(message), std::move(ids) };
}

Diagnostic make_warning(DiagnosticCode code, std::string message, std::vector<std::string> ids = {}) {
    return Diagnostic{ Severity::Warning, code, std::move(message), std::move(ids) };
}

std::vector<std::string> ids_of(const std::vector<Element>& elements, const std::vector<std::size_t>& indices) {
    std::vector<std::string> ids;
    ids.reserve(indices.size());
    for (std::size_t i : indices)
        ids.push_back(elements[i].id);
    return ids;
}

// supported-by children that can continue an argument (satellite kinds excluded).
std::vector<std::vector<std::size_t>> support_children(const std::vector<Element>& elements,
    const GraphIndex& graph)
{
    std::vector<std::vector<std::size_t>> out(elements.size());
    for (std::size_t i = 0; i < elements.size(); ++i) {
        for (std::size_t child : graph.supported_by[i]) {
            if (!gsn_model::is_satellite_kind(elements[child].kind))
                out[i].push_back(child);
        }
    }
    return out;
}

void check_root_goals(const std::vector<Element>& elements, const GraphIndex& graph,
    ValidationResult& result)
{
    bool any_goal = false;
    std::vector<std::size_t> roots;
    for (std::size_t i = 0; i < elements.size(); ++i) {
        if (elements[i].kind != ElementKind::Goal) continue;
        any_goal = true;
        if (graph.incoming_supported_by[i] == 0) roots.push_back(i);
    }

    if (!any_goal) {
        result.errors.push_back(make_error(DiagnosticCode::NoRootGoal,
            "The diagram has no goal to act as its root"));
        return;
    }
    if (roots.empty()) {
        result.errors.push_back(make_error(DiagnosticCode::NoRootGoal,
            "No root goal: every goal is supported-by target of another element"));
        return;
    }
    if (roots.size() > 1) {
        result.warnings.push_back(make_warning(DiagnosticCode::MultipleRootGoals,
            "The diagram has " + std::to_string(roots.size())
                + " root goals; a single top-level claim is recommended",
            ids_of(elements, roots)));
    }
}

// Iterative DFS with an explicit recursion stack. Returns the nodes of the first cycle found.
std::optional<std::vector<std::size_t>> find_cycle(const GraphIndex& graph, std::size_t count) {
    enum class Mark : unsigned char { Unvisited, OnStack, Done };
    struct Frame {
        std::size_t node;
        std::size_t next_child;
    };

    std::vector<Mark> mark(count, Mark::Unvisited);
    std::vector<Frame> stack;

    for (std::size_t start = 0; start < count; ++start) {
        if (mark[start] != Mark::Unvisited) continue;
        mark[start] = Mark::OnStack;
        stack.push_back({ start, 0 });

        while (!stack.empty()) {
            Frame& top = stack.back();
            const auto& children = graph.supported_by[top.node];
            if (top.next_child == children.size()) {
                mark[top.node] = Mark::Done;
                stack.pop_back();
                continue;
            }
            const std::size_t child = children[top.next_child++];
            if (mark[child] == Mark::OnStack) {
                auto it = std::find_if(stack.begin(), stack.end(),
                    [child](const Frame& f) { return f.node == child; });
                std::vector<std::size_t> cycle;
                for (; it != stack.end(); ++it)
                    cycle.push_back(it->node);
                return cycle;
            }
            if (mark[child] == Mark::Unvisited) {
                mark[child] = Mark::OnStack;
                stack.push_back({ child, 0 });
            }
        }
    }
    return std::nullopt;
}

void check_cycles(const std::vector<Element>& elements, const GraphIndex& graph,
    ValidationResult& result)
{
    auto cycle = find_cycle(graph, elements.size());
    if (!cycle) return;
    result.errors.push_back(make_error(DiagnosticCode::CyclicReference,
        "Cyclic supported-by reference detected; a GSN argument must form a tree",
        ids_of(elements, *cycle)));
}

void check_orphans(const std::vector<Element>& elements, const GraphIndex& graph,
    ValidationResult& result)
{
    if (elements.size() <= 1) return;
    std::vector<std::size_t> orphans;
    for (std::size_t i = 0; i < elements.size(); ++i) {
        if (graph.degree[i] == 0) orphans.push_back(i);
    }
    if (orphans.empty()) return;
    result.warnings.push_back(make_warning(DiagnosticCode::OrphanNodes,
        std::to_string(orphans.size()) + " element(s) are not connected to anything",
        ids_of(elements, orphans)));
}

void check_undeveloped(const std::vector<Element>& elements, const GraphIndex& graph,
    const std::vector<std::vector<std::size_t>>& children, ValidationResult& result)
{
    auto is_undeveloped_marker = [&](std::size_t i) {
        return elements[i].kind == ElementKind::Undeveloped;
    };

    std::vector<std::size_t> undeveloped;
    for (std::size_t i = 0; i < elements.size(); ++i) {
        const ElementKind kind = elements[i].kind;
        if (kind != ElementKind::Goal && kind != ElementKind::Strategy) continue;
        if (!children[i].empty()) continue;
        const bool marked = std::any_of(graph.supported_by[i].begin(), graph.supported_by[i].end(), is_undeveloped_marker)
            || std::any_of(graph.in_context_of[i].begin(), graph.in_context_of[i].end(), is_undeveloped_marker);
        if (!marked) undeveloped.push_back(i);
    }
    if (undeveloped.empty()) return;
    result.warnings.push_back(make_warning(DiagnosticCode::UndevelopedGoals,
        std::to_string(undeveloped.size())
            + " goal(s)/strategy(ies) have no supporting elements; add children or an Undeveloped marker",
        ids_of(elements, undeveloped)));
}

// True when every supported-by branch below `goal` ends in Evidence, Undeveloped or Module.
// The path set plays the role of a per-branch visited set; results are not memoized.
bool reaches_terminal(std::size_t goal, const std::vector<Element>& elements,
    const std::vector<std::vector<std::size_t>>& children)
{
    enum class Step { Satisfied, Failed, Descend };
    struct Frame {
        std::size_t node;
        std::size_t next_child;
    };

    std::vector<char> on_path(elements.size(), 0);
    std::vector<Frame> stack;

    auto enter = [&](std::size_t v) {
        if (on_path[v]) return Step::Failed;
        const ElementKind kind = elements[v].kind;
        if (gsn_model::is_terminal_kind(kind) || gsn_model::is_satellite_kind(kind))
            return Step::Satisfied;
        if (children[v].empty()) return Step::Failed;
        on_path[v] = 1;
        stack.push_back({ v, 0 });
        return Step::Descend;
    };

    if (enter(goal) == Step::Failed) return false;
    while (!stack.empty()) {
        Frame& top = stack.back();
        const auto& kids = children[top.node];
        if (top.next_child == kids.size()) {
            on_path[top.node] = 0;
            stack.pop_back();
            continue;
        }
        const std::size_t child = kids[top.next_child++];
        if (enter(child) == Step::Failed) return false;
    }
    return true;
}

void check_evidence_reachability(const std::vector<Element>& elements,
    const std::vector<std::vector<std::size_t>>& children, ValidationResult& result)
{
    std::vector<std::size_t> unreachable;
    for (std::size_t i = 0; i < elements.size(); ++i) {
        if (elements[i].kind != ElementKind::Goal) continue;
        if (!reaches_terminal(i, elements, children)) unreachable.push_back(i);
    }
    if (unreachable.empty()) return;
    result.warnings.push_back(make_warning(DiagnosticCode::NoEvidencePath,
        std::to_string(unreachable.size()) + " goal(s) cannot reach any evidence",
        ids_of(elements, unreachable)));
}

void check_strategy_fan_out(const std::vector<Element>& elements,
    const std::vector<std::vector<std::size_t>>& children, ValidationResult& result)
{
    std::vector<std::size_t> single;
    for (std::size_t i = 0; i < elements.size(); ++i) {
        if (elements[i].kind == ElementKind::Strategy && children[i].size() == 1)
            single.push_back(i);
    }
    if (single.empty()) return;
    result.warnings.push_back(make_warning(DiagnosticCode::SingleChildStrategy,
        std::to_string(single.size())
            + " strategy(ies) have a single child; a strategy normally decomposes a claim into several sub-goals",
        ids_of(elements, single)));
}

} // namespace

std::string_view code_name(DiagnosticCode code) {
    switch (code) {
    case DiagnosticCode::NoRootGoal: return "NO_ROOT_GOAL";
    case DiagnosticCode::MultipleRootGoals: return "MULTIPLE_ROOT_GOALS";
    case DiagnosticCode::CyclicReference: return "CYCLIC_REFERENCE";
    case DiagnosticCode::OrphanNodes: return "ORPHAN_NODES";
    case DiagnosticCode::UndevelopedGoals: return "UNDEVELOPED_GOALS";
    case DiagnosticCode::NoEvidencePath: return "NO_EVIDENCE_PATH";
    case DiagnosticCode::SingleChildStrategy: return "SINGLE_CHILD_STRATEGY";
    }
    return "UNKNOWN";
}

std::string_view severity_name(Severity severity) {
    return severity == Severity::Error ? "error" : "warning";
}

ValidationResult validate(const std::vector<gsn_model::Element>& elements,
    const std::vector<gsn_model::Relation>& relations)
{
    ValidationResult result;
    const GraphIndex graph = gsn_model::build_graph_index(elements, relations);
    const auto children = support_children(elements, graph);

    check_root_goals(elements, graph, result);
    check_cycles(elements, graph, result);
    check_orphans(elements, graph, result);
    check_undeveloped(elements, graph, children, result);
    check_evidence_reachability(elements, children, result);
    check_strategy_fan_out(elements, children, result);

    result.is_valid = result.errors.empty();
    analysis_logger()->debug("validate elements={} relations={} errors={} warnings={}",
        elements.size(), relations.size(), result.errors.size(), result.warnings.size());
    return result;
}

ValidationResult validate(const gsn_model::Diagram& diagram) {
    return validate(diagram.elements, diagram.relations);
}

} // namespace gsn_analysis
