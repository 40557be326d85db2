#include <oryx/core/error.hpp>
#include <oryx/runtime/csv.hpp>

#include <fmt/format.h>
#include <rapidcsv.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <vector>

namespace oryx::runtime {

namespace {

auto trim(std::string_view text) -> std::string_view {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

auto try_parse_int(const std::string& text, std::int64_t& out) -> bool {
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto result = std::from_chars(begin, end, out);
    return result.ec == std::errc() && result.ptr == end;
}

auto try_parse_double(const std::string& text, double& out) -> bool {
    char* end = nullptr;
    out = std::strtod(text.c_str(), &end);
    return end != text.c_str() && *end == '\0';
}

auto open(std::string_view path) -> rapidcsv::Document {
    return rapidcsv::Document(std::string(path),
                              rapidcsv::LabelParams(0, -1),  // header row, no row labels
                              rapidcsv::SeparatorParams(','));
}

auto null_mask(const std::vector<std::string>& values, const CsvOptions& options)
    -> std::vector<bool> {
    std::vector<bool> validity(values.size(), true);
    for (std::size_t i = 0; i < values.size(); ++i) {
        validity[i] = !((options.null_if_empty && values[i].empty()) ||
                        options.null_tokens.contains(values[i]));
    }
    return validity;
}

/// Narrowest of int, double and string holding every valid cell.
auto infer(const std::vector<std::string>& values, const std::vector<bool>& validity)
    -> const dsl::KindPtr& {
    bool all_int = true;
    bool all_double = true;
    bool any_valid = false;
    for (std::size_t i = 0; i < values.size() && all_double; ++i) {
        if (!validity[i]) {
            continue;
        }
        any_valid = true;
        std::int64_t int_value = 0;
        double double_value = 0.0;
        if (all_int && try_parse_int(values[i], int_value)) {
            continue;
        }
        all_int = false;
        all_double = try_parse_double(values[i], double_value);
    }
    if (!any_valid) {
        return dsl::Kind::string();
    }
    if (all_int) {
        return dsl::Kind::integer();
    }
    return all_double ? dsl::Kind::floating() : dsl::Kind::string();
}

auto load(const std::vector<std::string>& values, const std::vector<bool>& validity,
          const dsl::Kind& kind) -> Series {
    std::vector<Datum> cells;
    cells.reserve(values.size());
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (!validity[i]) {
            cells.emplace_back(std::nullopt);
            continue;
        }
        if (kind.id() == dsl::KindId::String) {
            cells.emplace_back(ScalarValue{values[i]});
            continue;
        }
        cells.push_back(to_datum(kind.cast(Value(values[i]))));
    }
    return Series::of(kind, cells);
}

}  // namespace

auto parse_null_spec(std::string_view spec) -> CsvOptions {
    CsvOptions options;
    std::size_t pos = 0;
    while (pos <= spec.size()) {
        std::size_t comma = spec.find(',', pos);
        if (comma == std::string_view::npos) {
            comma = spec.size();
        }
        auto token = trim(spec.substr(pos, comma - pos));
        if (token == "<empty>") {
            options.null_if_empty = true;
        } else if (!token.empty()) {
            options.null_tokens.emplace(token);
        }
        pos = comma + 1;
    }
    return options;
}

auto read_csv(std::string_view path, const CsvOptions& options)
    -> std::expected<Table, std::string> {
    try {
        auto doc = open(path);
        Table table;
        for (const auto& name : doc.GetColumnNames()) {
            auto values = doc.GetColumn<std::string>(name);
            auto validity = null_mask(values, options);
            const auto& kind = infer(values, validity);
            table.add_column(std::string{}, name, load(values, validity, *kind));
        }
        spdlog::debug("Read {} rows of {} columns from {}", table.rows(), table.columns.size(),
                      path);
        return table;
    } catch (const Error& e) {
        return std::unexpected(fmt::format("{}: {}", path, e.what()));
    } catch (const std::exception& e) {
        return std::unexpected(fmt::format("failed to read csv {}: {}", path, e.what()));
    }
}

auto read_csv(std::string_view path, const dsl::Schema& schema, const CsvOptions& options)
    -> std::expected<Table, std::string> {
    try {
        auto doc = open(path);
        auto available = doc.GetColumnNames();
        Table table;
        for (const auto& entry : schema.entries()) {
            auto name = entry.field.name().value_or(entry.key);
            if (std::ranges::find(available, name) == available.end()) {
                return std::unexpected(fmt::format("{}: missing column {}", path, name));
            }
            auto values = doc.GetColumn<std::string>(name);
            auto validity = null_mask(values, options);
            table.add_column(std::string{}, name, load(values, validity, *entry.field.kind()));
        }
        spdlog::debug("Read {} rows of {} as {}", table.rows(), path, schema.name());
        return table;
    } catch (const Error& e) {
        return std::unexpected(fmt::format("{}: {}", path, e.what()));
    } catch (const std::exception& e) {
        return std::unexpected(fmt::format("failed to read csv {}: {}", path, e.what()));
    }
}

}  // namespace oryx::runtime
