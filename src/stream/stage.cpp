// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "stream/stage.h"

#include <exception>
#include <stdexcept>

namespace stream {

std::string_view stage_state_string(StageState state) noexcept {
    switch (state) {
        case StageState::NOT_STARTED: return "NOT_STARTED";
        case StageState::RUNNING:     return "RUNNING";
        case StageState::COMPLETED:   return "COMPLETED";
        case StageState::FAULTED:     return "FAULTED";
        case StageState::CLOSED:      return "CLOSED";
    }
    return "UNKNOWN";
}

std::string describe_current_exception() {
    try {
        throw;
    } catch (const std::exception& e) {
        return e.what();
    } catch (const std::string& s) {
        return s;
    } catch (const char* s) {
        return s ? std::string(s) : std::string("(null)");
    } catch (...) {
        return "unknown exception";
    }
}

} // namespace stream
