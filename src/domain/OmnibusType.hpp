/**
 * @file OmnibusType.hpp
 * @brief Verdict of metadata-based omnibus detection.
 */

#pragma once
#include <string>

namespace omnisplit::domain {

enum class OmnibusType {
    DelphiClassics,
    GenericOmnibus,
    None
};

inline std::string OmnibusTypeToString(OmnibusType type) {
    switch (type) {
        case OmnibusType::DelphiClassics: return "DELPHI_CLASSICS";
        case OmnibusType::GenericOmnibus: return "GENERIC_OMNIBUS";
        case OmnibusType::None: return "NONE";
    }
    return "NONE";
}

} // namespace omnisplit::domain
