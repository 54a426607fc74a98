#include "debsnap/debian/control_fields.hpp"

#include <cctype>

namespace debsnap {

namespace {

bool EqualsIgnoreCase(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

std::string_view Trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

} // namespace

std::string ControlStanza::Get(std::string_view name) const {
    for (const auto& [key, value] : fields) {
        if (EqualsIgnoreCase(key, name)) return value;
    }
    return {};
}

bool ControlStanza::Has(std::string_view name) const {
    for (const auto& field : fields) {
        if (EqualsIgnoreCase(field.first, name)) return true;
    }
    return false;
}

std::expected<std::vector<ControlStanza>, std::string> ParseControlStanzas(std::string_view text) {
    std::vector<ControlStanza> out;
    ControlStanza current;
    size_t line_no = 0;

    auto flush = [&]() {
        if (!current.fields.empty()) {
            out.push_back(std::move(current));
            current = ControlStanza{};
        }
    };

    size_t pos = 0;
    while (pos <= text.size()) {
        size_t end = text.find('\n', pos);
        if (end == std::string_view::npos) end = text.size();
        std::string_view line = text.substr(pos, end - pos);
        pos = end + 1;
        ++line_no;

        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);

        if (Trim(line).empty()) {
            flush();
            if (end == text.size()) break;
            continue;
        }
        if (line.front() == '#') continue;

        if (line.front() == ' ' || line.front() == '\t') {
            if (current.fields.empty()) {
                return std::unexpected("continuation line without field at line " +
                                       std::to_string(line_no));
            }
            auto& value = current.fields.back().second;
            value.push_back('\n');
            value.append(Trim(line));
            continue;
        }

        const size_t colon = line.find(':');
        if (colon == std::string_view::npos || colon == 0) {
            return std::unexpected("malformed field at line " + std::to_string(line_no) + ": " +
                                   std::string(line));
        }
        current.fields.emplace_back(std::string(Trim(line.substr(0, colon))),
                                    std::string(Trim(line.substr(colon + 1))));
        if (end == text.size()) break;
    }
    flush();
    return out;
}

std::expected<ControlStanza, std::string> ParseControlStanza(std::string_view text) {
    auto all = ParseControlStanzas(text);
    if (!all) return std::unexpected(all.error());
    if (all->empty()) return std::unexpected("empty control data");
    return std::move(all->front());
}

} // namespace debsnap
