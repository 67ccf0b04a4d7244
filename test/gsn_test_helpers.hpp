#pragma once

#include <gsn_model/types.hpp>
#include <string>

namespace gsn_test {

inline gsn_model::Element element(const std::string& id, gsn_model::ElementKind kind,
    const std::string& content = "")
{
    gsn_model::Element e;
    e.id = id;
    e.kind = kind;
    e.content = content;
    return e;
}

inline gsn_model::Relation supported_by(const std::string& source, const std::string& target) {
    return gsn_model::Relation{ source + "->" + target, source, target, gsn_model::RelationKind::SupportedBy };
}

inline gsn_model::Relation in_context_of(const std::string& source, const std::string& target) {
    return gsn_model::Relation{ source + "~>" + target, source, target, gsn_model::RelationKind::InContextOf };
}

} // namespace gsn_test
