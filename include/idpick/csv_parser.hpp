#ifndef IDPICK_CSV_PARSER_HPP_INCLUDED
#define IDPICK_CSV_PARSER_HPP_INCLUDED

#include <algorithm>
#include <cstdlib>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <string_view>

namespace idpick {
    struct unit {
    };

    // Cursor over one line of comma separated quoted strings and numbers
    template<typename It>
    struct csv_parser {
        It current;
        It end;
        csv_parser(It begin, It end) : current(begin), end(end) {
        }
        auto try_parse_regex(const std::regex& regex) -> std::optional<std::match_results<It>> {
            if (std::match_results<It> match; std::regex_search(current, end, match, regex, std::regex_constants::match_continuous)) {
                current = match[0].second;
                return std::optional{match};
            } else {
                return std::nullopt;
            }
        }
        auto try_parse_literal(const std::string_view literal) -> std::optional<std::string_view> {
            if (static_cast<std::size_t>(std::distance(current, end)) >= literal.size()
                && std::equal(literal.begin(), literal.end(), current)) {
                const auto lit_begin = current;
                current += literal.size();
                return std::optional{std::string_view{std::to_address(lit_begin), literal.size()}};
            } else {
                return std::nullopt;
            }
        }
        auto skip_whitespace() -> unit {
            static const std::regex whitespace("\\s*");
            try_parse_regex(whitespace);
            return {};
        }
        auto next_field() -> bool {
            skip_whitespace();
            const bool separated = try_parse_literal(",").has_value();
            skip_whitespace();
            return separated;
        }
        auto at_end() -> bool {
            skip_whitespace();
            return current == end;
        }
        auto try_parse_quoted() -> std::optional<std::string> {
            static const std::regex match_quoted_str{"\"([a-zA-Z_ ]*)\""};
            skip_whitespace();
            auto result = try_parse_regex(match_quoted_str);
            if (result) {
                return (*result)[1].str();
            } else {
                return std::nullopt;
            }
        }
        auto try_parse_double() -> std::optional<double> {
            // strtod needs a terminated buffer; fields are short so copy the rest of the line
            const std::string rest {current, end};
            char* double_end;
            const double parsed = std::strtod(rest.c_str(), &double_end);
            const auto consumed = double_end - rest.c_str();
            if (consumed > 0) {
                current += consumed;
                return std::optional{parsed};
            } else {
                return std::nullopt;
            }
        }
    };
}

#endif
