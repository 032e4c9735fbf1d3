#pragma once

#include "data/Record.hpp"
#include <initializer_list>
#include <utility>
#include <vector>

inline Record makeRecord(std::initializer_list<std::pair<Attribute, const char*>> attrs,
                         std::initializer_list<std::pair<TargetField, const char*>> targets) {
    Record r;
    for (const auto& a : attrs) r.attribute(a.first) = a.second;
    for (const auto& t : targets) r.target(t.first) = t.second;
    return r;
}

/** clinical_panel ∈ {A, A, B, B}，clinician ∈ {X, X, Y, Y} */
inline std::vector<Record> panelExample() {
    return {
        makeRecord({{Attribute::ClinicalPanel, "A"}}, {{TargetField::Clinician, "X"}}),
        makeRecord({{Attribute::ClinicalPanel, "A"}}, {{TargetField::Clinician, "X"}}),
        makeRecord({{Attribute::ClinicalPanel, "B"}}, {{TargetField::Clinician, "Y"}}),
        makeRecord({{Attribute::ClinicalPanel, "B"}}, {{TargetField::Clinician, "Y"}})
    };
}
