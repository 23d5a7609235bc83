#include <namesake/pipeline/pipeline_types.h>

namespace namesake::pipeline {

std::string_view stateToString(PipelineState state) {
    switch (state) {
        case PipelineState::Received:
            return "Received";
        case PipelineState::NameExtracted:
            return "NameExtracted";
        case PipelineState::NoNameSkip:
            return "NoNameSkip";
        case PipelineState::Embedded:
            return "Embedded";
        case PipelineState::EmbedFailed:
            return "EmbedFailed";
        case PipelineState::Indexed:
            return "Indexed";
        case PipelineState::IndexFailed:
            return "IndexFailed";
        case PipelineState::StoreFailed:
            return "StoreFailed";
        case PipelineState::Merged:
            return "Merged";
        case PipelineState::QueryFailed:
            return "QueryFailed";
    }
    return "Unknown";
}

bool isTerminal(PipelineState state) {
    switch (state) {
        case PipelineState::NoNameSkip:
        case PipelineState::EmbedFailed:
        case PipelineState::Indexed:
        case PipelineState::IndexFailed:
        case PipelineState::StoreFailed:
        case PipelineState::Merged:
        case PipelineState::QueryFailed:
            return true;
        default:
            return false;
    }
}

} // namespace namesake::pipeline
