#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace debsnap {

// One paragraph of a deb822 control file (a .deb's control member, a
// Packages stanza, a .sources entry). Field names compare case-insensitively.
struct ControlStanza {
    std::vector<std::pair<std::string, std::string>> fields;

    // Empty string when the field is absent.
    std::string Get(std::string_view name) const;
    bool Has(std::string_view name) const;
};

std::expected<ControlStanza, std::string> ParseControlStanza(std::string_view text);
std::expected<std::vector<ControlStanza>, std::string> ParseControlStanzas(std::string_view text);

} // namespace debsnap
