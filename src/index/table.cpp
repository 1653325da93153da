#include "index.hpp"
#include "lib.hpp"

#include <fstream>

namespace {
constexpr std::string_view HEADER[] = {"file_stem", "station", "location", "angle", "rel_path", "url"};
constexpr std::string_view EOL = "\r\n";

template <typename Range>
void WriteRecord(std::ofstream &out, const Range &fields) {
    bool first = true;
    for (const auto &field : fields) {
        if (!first) {
            out << ',';
        }
        out << Index::EscapeField(field);
        first = false;
    }
    out << EOL;
}
} // namespace

std::string Index::JoinUrl(const std::string_view baseUrl, const std::string_view relPath) {
    auto base = baseUrl;
    while (!base.empty() && base.back() == '/') {
        base.remove_suffix(1);
    }
    return fmt::format("{}/{}", base, relPath);
}

Index::IndexRow Index::MakeRow(const fs::path &outputRoot, const fs::path &dstPath, const std::string_view baseUrl) {
    IndexRow row;
    row.Stem = dstPath.stem().string();
    auto [station, location, angle] = ParseName(row.Stem);
    row.Station = std::move(station);
    row.Location = std::move(location);
    row.Angle = std::move(angle);
    row.RelPath = dstPath.lexically_relative(outputRoot).generic_string();
    row.Url = JoinUrl(baseUrl, row.RelPath);
    return row;
}

std::string Index::EscapeField(const std::string_view field) {
    if (field.find_first_of(",\"\r\n") == std::string_view::npos) {
        return std::string(field);
    }
    std::string result;
    result.reserve(field.size() + 4);
    result.push_back('"');
    for (const char c : field) {
        if (c == '"') {
            result.push_back('"');
        }
        result.push_back(c);
    }
    result.push_back('"');
    return result;
}

void Index::WriteTable(const fs::path &path, const std::vector<IndexRow> &rows) {
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path());
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw lib::FileError(path, "Failed to create index table");
    }

    WriteRecord(out, HEADER);
    for (const auto &row : rows) {
        const std::string_view fields[] = {row.Stem, row.Station, row.Location, row.Angle, row.RelPath, row.Url};
        WriteRecord(out, fields);
    }

    out.flush();
    if (!out) {
        throw lib::FileError(path, "Failed to write index table");
    }
}
