// src/data/Prediction.cpp
#include "data/Prediction.hpp"

const std::optional<std::string>& Prediction::get(TargetField t) const {
    switch (t) {
        case TargetField::Clinician: return clinician;
        case TargetField::Gpt4_0:    return gpt4_0;
        case TargetField::Llama:     return llama;
        case TargetField::Gemini:    return gemini;
        case TargetField::DdxSnomed: return ddxSnomed;
    }
    return clinician;
}

std::optional<std::string>& Prediction::get(TargetField t) {
    return const_cast<std::optional<std::string>&>(
        static_cast<const Prediction&>(*this).get(t));
}
