#include "elemcore/combat/element_types.hpp"

#include <string>

namespace elemcore::combat {

foundation::EngineResult<ElementType> parseElement(std::string_view name) {
    for (auto element : kAllElements) {
        if (elementName(element) == name) {
            return foundation::EngineResult<ElementType>::ok(element);
        }
    }
    return foundation::EngineResult<ElementType>::err(
        foundation::EngineError(foundation::ErrorCode::InvalidElement,
                                "unknown element name: " + std::string(name),
                                std::string(name)));
}

}  // namespace elemcore::combat
