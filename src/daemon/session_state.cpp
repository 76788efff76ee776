#include "session_state.hpp"

namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};

} // namespace

std::string_view state_name(const SessionState& s) {
    return std::visit(overloaded{
        [](const state::Idle&) -> std::string_view { return "idle"; },
        [](const state::Recording&) -> std::string_view { return "recording"; },
        [](const state::Transcribing&) -> std::string_view { return "transcribing"; },
        [](const state::Inserting&) -> std::string_view { return "inserting"; },
        [](const state::Completed&) -> std::string_view { return "completed"; },
        [](const state::Cancelled&) -> std::string_view { return "cancelled"; },
        [](const state::Failed&) -> std::string_view { return "failed"; },
    }, s);
}

std::string_view delivery_name(DeliveryMode mode) {
    switch (mode) {
        case DeliveryMode::InsertedDirectly: return "direct";
        case DeliveryMode::CopiedToClipboardFallback: return "clipboard";
    }
    return "unknown";
}

std::string_view failure_name(FailureKind kind) {
    switch (kind) {
        case FailureKind::Capture: return "capture";
        case FailureKind::Conversion: return "conversion";
        case FailureKind::Transcription: return "transcription";
        case FailureKind::Timeout: return "timeout";
        case FailureKind::Insertion: return "insertion";
    }
    return "unknown";
}

bool is_terminal(const SessionState& s) {
    return holds<state::Completed>(s) || holds<state::Cancelled>(s) || holds<state::Failed>(s);
}

bool is_active(const SessionState& s) {
    return holds<state::Recording>(s) || holds<state::Transcribing>(s) ||
           holds<state::Inserting>(s);
}
