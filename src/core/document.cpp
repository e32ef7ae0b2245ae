/** \file document.cpp
 *  \brief DocumentType string conversion.
 */

#include "promptvec/document.hpp"

namespace promptvec {

auto to_string(DocumentType type) noexcept -> std::string_view {
    switch (type) {
        case DocumentType::Prompt: return "prompt";
        case DocumentType::Template: return "template";
        case DocumentType::Example: return "example";
        case DocumentType::Feedback: return "feedback";
    }
    return "prompt";
}

} // namespace promptvec
