#include <gsn_loaders/sample_diagram.hpp>
#include <string>

namespace gsn_loaders {

namespace {

using gsn_model::ElementKind;
using gsn_model::RelationKind;

struct DiagramBuilder {
    gsn_model::Diagram& out;

    void node(const char* id, ElementKind kind, const char* label, const char* content,
        const char* module_ref = "")
    {
        gsn_model::Element e;
        e.id = id;
        e.kind = kind;
        e.label = label;
        e.content = content;
        e.module_ref = module_ref;
        out.elements.push_back(std::move(e));
    }

    void support(const char* source, const char* target) { link(source, target, RelationKind::SupportedBy); }
    void context(const char* source, const char* target) { link(source, target, RelationKind::InContextOf); }

    void link(const char* source, const char* target, RelationKind kind) {
        gsn_model::Relation r;
        r.id = std::string("link-") + source + "-" + target;
        r.source_id = source;
        r.target_id = target;
        r.kind = kind;
        out.relations.push_back(std::move(r));
    }
};

gsn_model::Diagram software_module() {
    gsn_model::Diagram d;
    d.title = "Brake controller software";
    DiagramBuilder b{ d };

    b.node("sw-G1", ElementKind::Goal, "G1",
        "<p>Brake controller <b>software</b> is free of hazardous faults</p>");
    b.node("sw-C1", ElementKind::Context, "C1", "ISO 26262 ASIL D");
    b.node("sw-S1", ElementKind::Strategy, "S1", "Argument over verification activities");
    b.node("sw-G2", ElementKind::Goal, "G2", "Requirements are fully covered by tests");
    b.node("sw-G3", ElementKind::Goal, "G3", "Static analysis reports no defects");
    b.node("sw-Sn1", ElementKind::Evidence, "Sn1", "MC/DC coverage report");
    b.node("sw-Sn2", ElementKind::Evidence, "Sn2", "Static analysis report");

    b.context("sw-G1", "sw-C1");
    b.support("sw-G1", "sw-S1");
    b.support("sw-S1", "sw-G2");
    b.support("sw-S1", "sw-G3");
    b.support("sw-G2", "sw-Sn1");
    b.support("sw-G3", "sw-Sn2");
    return d;
}

} // namespace

DiagramSnapshot generate_sample_diagram() {
    DiagramSnapshot snapshot;
    gsn_model::Diagram& d = snapshot.diagram;
    d.title = "Braking system safety case (sample)";
    DiagramBuilder b{ d };

    b.node("G1", ElementKind::Goal, "G1", "The braking system is acceptably safe to operate");
    b.node("C1", ElementKind::Context, "C1", "運用環境: 一般道路および高速道路");
    b.node("A1", ElementKind::Assumption, "A1", "Drivers hold a valid licence");
    b.node("S1", ElementKind::Strategy, "S1", "Argument over each identified hazard");
    b.node("J1", ElementKind::Justification, "J1",
        "Hazard list produced by HAZOP<br>and reviewed by the safety board");
    b.node("G2", ElementKind::Goal, "G2", "Loss of braking is sufficiently unlikely");
    b.node("G3", ElementKind::Goal, "G3", "Brake controller software behaves as specified");
    b.node("G4", ElementKind::Goal, "G4", "Unintended braking is mitigated");
    b.node("Sn1", ElementKind::Evidence, "Sn1", "Fault tree analysis");
    b.node("Sn2", ElementKind::Evidence, "Sn2", "Hydraulic circuit test results");
    b.node("M1", ElementKind::Module, "M1", "Software argument", "module-software");
    b.node("U1", ElementKind::Undeveloped, "", "");

    b.context("G1", "C1");
    b.context("G1", "A1");
    b.support("G1", "S1");
    b.context("S1", "J1");
    b.support("S1", "G2");
    b.support("S1", "G3");
    b.support("S1", "G4");
    b.support("G2", "Sn1");
    b.support("G2", "Sn2");
    b.support("G3", "M1");
    b.support("G4", "U1");

    snapshot.modules.emplace("module-software", software_module());
    return snapshot;
}

} // namespace gsn_loaders
