#include "index.hpp"

#include <array>

Index::NameFields Index::ParseName(const std::string_view stem) {
    std::array<std::string, 3> parts;
    size_t start = 0;
    for (auto &part : parts) {
        const auto pos = stem.find('_', start);
        part = std::string(stem.substr(start, pos == std::string_view::npos ? std::string_view::npos : pos - start));
        if (pos == std::string_view::npos) {
            break;
        }
        start = pos + 1;
    }
    return {parts[0], parts[1], parts[2]};
}
