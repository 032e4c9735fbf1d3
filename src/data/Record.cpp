#include "data/Record.hpp"

const std::optional<std::string>& Record::attribute(Attribute a) const {
    switch (a) {
        case Attribute::ClinicalPanel:   return clinicalPanel;
        case Attribute::County:          return county;
        case Attribute::HealthLevel:     return healthLevel;
        case Attribute::YearsExperience: return yearsExperience;
    }
    return clinicalPanel;
}

const std::optional<std::string>& Record::target(TargetField t) const {
    switch (t) {
        case TargetField::Clinician: return clinician;
        case TargetField::Gpt4_0:    return gpt4_0;
        case TargetField::Llama:     return llama;
        case TargetField::Gemini:    return gemini;
        case TargetField::DdxSnomed: return ddxSnomed;
    }
    return clinician;
}

std::optional<std::string>& Record::attribute(Attribute a) {
    return const_cast<std::optional<std::string>&>(
        static_cast<const Record&>(*this).attribute(a));
}

std::optional<std::string>& Record::target(TargetField t) {
    return const_cast<std::optional<std::string>&>(
        static_cast<const Record&>(*this).target(t));
}

const std::array<Attribute, kNumAttributes>& allAttributes() {
    static const std::array<Attribute, kNumAttributes> attrs = {
        Attribute::ClinicalPanel,
        Attribute::County,
        Attribute::HealthLevel,
        Attribute::YearsExperience
    };
    return attrs;
}

const std::array<TargetField, kNumTargets>& allTargets() {
    static const std::array<TargetField, kNumTargets> targets = {
        TargetField::Clinician,
        TargetField::Gpt4_0,
        TargetField::Llama,
        TargetField::Gemini,
        TargetField::DdxSnomed
    };
    return targets;
}

const char* attributeName(Attribute a) {
    switch (a) {
        case Attribute::ClinicalPanel:   return "clinical_panel";
        case Attribute::County:          return "county";
        case Attribute::HealthLevel:     return "health_level";
        case Attribute::YearsExperience: return "years_experience";
    }
    return "unknown";
}

const char* targetName(TargetField t) {
    switch (t) {
        case TargetField::Clinician: return "clinician";
        case TargetField::Gpt4_0:    return "gpt4_0";
        case TargetField::Llama:     return "llama";
        case TargetField::Gemini:    return "gemini";
        case TargetField::DdxSnomed: return "ddx_snomed";
    }
    return "unknown";
}

const char* attributeColumn(Attribute a) {
    switch (a) {
        case Attribute::ClinicalPanel:   return "Clinical Panel";
        case Attribute::County:          return "County";
        case Attribute::HealthLevel:     return "Health level";
        case Attribute::YearsExperience: return "Years of Experience";
    }
    return "";
}

const char* targetColumn(TargetField t) {
    switch (t) {
        case TargetField::Clinician: return "Clinician";
        case TargetField::Gpt4_0:    return "GPT4.0";
        case TargetField::Llama:     return "LLAMA";
        case TargetField::Gemini:    return "GEMINI";
        case TargetField::DdxSnomed: return "DDX SNOMED";
    }
    return "";
}
